/*
    SPDX-FileCopyrightText: 2025 Splitmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TMUXSYNCENGINETEST_H
#define TMUXSYNCENGINETEST_H

#include <QObject>

namespace Splitmux
{
class TmuxSyncEngineTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testInitialWindowsBecomeTabs();
    void testSessionEndingBeforeListOpensNothing();
    void testNewPaneKeepsExistingTerminals();
    void testRemovedPaneReleasesTerminal();
    void testOutputReachesMappedTerminal();
    void testTerminalsTakePaneSizes();
    void testUnparseableLayoutKeepsSnapshot();
    void testDuplicatePaneRejected();
    void testPaneLimitRejectsLayout();
    void testWindowAddListsOnlyThatWindow();
    void testWindowCloseClosesTab();
    void testRemoteFocusFollowsTmux();
    void testSessionNotifications();
    void testStructuralRequestsBecomeCommands();
    void testPrefixBindingsGoToTmux();
    void testTypingSendsKeys();
    void testEofKeepsPanesAsLocalTabs();
    void testRecoveryRequestedOnAttach();
    void testListSessions();
    void testParseSessionList();
};
}

#endif // TMUXSYNCENGINETEST_H
