/*
    SPDX-FileCopyrightText: 2025 Splitmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef PANEMANAGERTEST_H
#define PANEMANAGERTEST_H

#include <QObject>

namespace Splitmux
{
class PaneManagerTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testLocalSplitCreatesTerminal();
    void testRemoteTabForwardsStructuralOps();
    void testCloseLastPaneClosesTab();
    void testProtectedLastPane();
    void testNavigateMovesFocus();
    void testResizeFocused();
    void testBroadcastFollowsSplits();
    void testApplyRemoteTreeReleasesTerminals();
    void testDetachedTabSplitsLocally();
    void testPointerFocus();
};
}

#endif // PANEMANAGERTEST_H
