/*
    SPDX-FileCopyrightText: 2025 Splitmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TMUXINTEGRATIONTEST_H
#define TMUXINTEGRATIONTEST_H

#include <QObject>
#include <QTemporaryDir>

namespace Splitmux
{
class TmuxIntegrationTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();
    void cleanupTestCase();

    void testAttachMirrorsWindows();
    void testSplitGoesThroughTmux();
    void testPanesFollowExternalCommands();
    void testTypingReachesRemotePane();
    void testContentRecoveredOnAttach();
    void testServerExitKeepsTabs();
    void testCreatesMissingSession();
    void testListsSessions();
    void testAttachOnlyDoesNotCreateSession();
    void testMissingBinaryFails();

private:
    bool tmux(const QStringList &arguments, QByteArray *output = nullptr) const;

    QTemporaryDir m_tmuxTmpDir;
    QString m_tmuxPath;
};
}

#endif // TMUXINTEGRATIONTEST_H
