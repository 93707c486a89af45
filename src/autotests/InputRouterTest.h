/*
    SPDX-FileCopyrightText: 2025 Splitmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef INPUTROUTERTEST_H
#define INPUTROUTERTEST_H

#include <QObject>

namespace Splitmux
{
class InputRouterTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testKeyGoesToFocusedPane();
    void testBroadcastUsesTreeOrder();
    void testBroadcastSkipsExcludedPanes();
    void testKeyWithStaleFocus();
    void testPointerPressRequestsFocus();
    void testPointerOutsidePanes();
};
}

#endif // INPUTROUTERTEST_H
