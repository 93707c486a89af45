/*
    SPDX-FileCopyrightText: 2025 Splitmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TMUXPREFIXKEYTEST_H
#define TMUXPREFIXKEYTEST_H

#include <QObject>

namespace Splitmux
{
class TmuxPrefixKeyTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testDefaultIsCtrlB();
    void testParse_data();
    void testParse();
    void testParseRejects_data();
    void testParseRejects();
    void testMatchesIgnoresKeypad();
    void testPrefixBytes();
    void testCommandKeys_data();
    void testCommandKeys();
    void testUnboundKey();
};
}

#endif // TMUXPREFIXKEYTEST_H
