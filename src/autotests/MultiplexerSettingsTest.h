/*
    SPDX-FileCopyrightText: 2025 Splitmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef MULTIPLEXERSETTINGSTEST_H
#define MULTIPLEXERSETTINGSTEST_H

#include <QObject>

namespace Splitmux
{
class MultiplexerSettingsTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testDefaultsForEmptyFile();
    void testSaveThenLoad();
    void testOutOfRangeValuesAreReplaced();
    void testUnknownPolicyFallsBack();
    void testSanitizeSwapsRatios();
};
}

#endif // MULTIPLEXERSETTINGSTEST_H
