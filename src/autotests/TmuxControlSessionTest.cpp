/*
    SPDX-FileCopyrightText: 2025 Splitmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TmuxControlSessionTest.h"

#include <QSignalSpy>
#include <QTest>

#include "../tmux/TmuxControlSession.h"

using namespace Splitmux;

static void makeReady(TmuxControlSession &session)
{
    session.processLine("%begin 1700000000 1 0");
    session.processLine("%end 1700000000 1 0");
}

// Answers the command in flight with a client-originated block.
static void reply(TmuxControlSession &session, int number, const QList<QByteArray> &body = {}, bool error = false)
{
    const QByteArray tail = " 1700000000 " + QByteArray::number(number) + " 1";
    session.processLine("%begin" + tail);
    for (const QByteArray &line : body) {
        session.processLine(line);
    }
    session.processLine((error ? "%error" : "%end") + tail);
}

static QList<QByteArray> drainOutput(TmuxControlSession &session)
{
    QList<QByteArray> data;
    while (auto notification = session.takeNotification()) {
        if (auto *output = std::get_if<TmuxOutputNotification>(&notification.value())) {
            data.append(output->data);
        }
    }
    return data;
}

void TmuxControlSessionTest::testFirstBlockMakesReady()
{
    TmuxControlSession session(nullptr, MultiplexerSettings());
    QSignalSpy readySpy(&session, &TmuxControlSession::ready);
    QSignalSpy writtenSpy(&session, &TmuxControlSession::commandWritten);

    // Commands wait until tmux has shown it is alive.
    session.sendCommand(TmuxCommand(QStringLiteral("list-windows")));
    QCOMPARE(session.state(), TmuxControlSession::State::Connecting);
    QCOMPARE(writtenSpy.count(), 0);

    makeReady(session);
    QCOMPARE(readySpy.count(), 1);
    QCOMPARE(writtenSpy.count(), 1);
    QCOMPARE(writtenSpy.at(0).at(0).toString(), QStringLiteral("list-windows"));
    QCOMPARE(session.state(), TmuxControlSession::State::AwaitingReply);
}

void TmuxControlSessionTest::testDcsWrappedStream()
{
    TmuxControlSession session(nullptr, MultiplexerSettings());
    QSignalSpy readySpy(&session, &TmuxControlSession::ready);

    session.processData("\033P1000p%begin 1700000000 1 0\r\n%end 1700000000 1 0\r\n%window-add @1\r\n");
    QCOMPARE(readySpy.count(), 1);
    auto notification = session.takeNotification();
    QVERIFY(notification.has_value());
    QVERIFY(std::holds_alternative<TmuxWindowAddedNotification>(notification.value()));
    QCOMPARE(std::get<TmuxWindowAddedNotification>(notification.value()).windowId, 1);

    session.processData("\033\\");
    QVERIFY(!session.isTerminated());
}

void TmuxControlSessionTest::testLinesSplitAcrossChunks()
{
    TmuxControlSession session(nullptr, MultiplexerSettings());
    makeReady(session);

    session.processData("%output %2 hel");
    QVERIFY(!session.hasPendingNotifications());
    session.processData("lo\n%output %2 wor");
    session.processData("ld\n");

    const QList<QByteArray> expected{"hello", "world"};
    QCOMPARE(drainOutput(session), expected);
}

void TmuxControlSessionTest::testRepliesMatchCommandsInOrder()
{
    TmuxControlSession session(nullptr, MultiplexerSettings());
    QSignalSpy writtenSpy(&session, &TmuxControlSession::commandWritten);
    makeReady(session);

    QList<TmuxReply> replies;
    auto collect = [&replies](const TmuxReply &r) {
        replies.append(r);
    };
    session.sendCommand(TmuxCommand(QStringLiteral("list-windows")), collect);
    session.sendCommand(TmuxCommand(QStringLiteral("kill-pane")).paneTarget(9), collect);
    session.sendCommand(TmuxCommand(QStringLiteral("display-message")).flag(QStringLiteral("-p")), collect);

    // One command in flight at a time.
    QCOMPARE(writtenSpy.count(), 1);
    QVERIFY(session.hasCommandInFlight());
    QCOMPARE(session.queuedCommandCount(), 2);

    reply(session, 10, {"@1 one 80x24", "@2 two 80x24"});
    QCOMPARE(replies.size(), 1);
    QCOMPARE(replies[0].status, TmuxReply::Ok);
    QCOMPARE(replies[0].response, QStringLiteral("@1 one 80x24\n@2 two 80x24"));
    QCOMPARE(writtenSpy.count(), 2);
    QCOMPARE(writtenSpy.at(1).at(0).toString(), QStringLiteral("kill-pane -t %9"));

    reply(session, 11, {"can't find pane: %9"}, true);
    QCOMPARE(replies.size(), 2);
    QCOMPARE(replies[1].status, TmuxReply::Error);
    QCOMPARE(replies[1].response, QStringLiteral("can't find pane: %9"));

    reply(session, 12);
    QCOMPARE(replies.size(), 3);
    QVERIFY(replies[2].ok());
    QVERIFY(replies[2].response.isEmpty());
    QCOMPARE(session.state(), TmuxControlSession::State::Ready);
}

void TmuxControlSessionTest::testNotificationsKeepWireOrder()
{
    TmuxControlSession session(nullptr, MultiplexerSettings());
    makeReady(session);

    session.sendCommand(TmuxCommand(QStringLiteral("list-windows")));
    session.processLine("%output %1 first");
    session.processLine("%window-renamed @1 build logs");
    reply(session, 4, {"@1 build 80x24"});
    session.processLine("%output %1 second");

    auto n = session.takeNotification();
    QVERIFY(n && std::holds_alternative<TmuxOutputNotification>(*n));
    QCOMPARE(std::get<TmuxOutputNotification>(*n).data, QByteArray("first"));
    n = session.takeNotification();
    QVERIFY(n && std::holds_alternative<TmuxWindowRenamedNotification>(*n));
    QCOMPARE(std::get<TmuxWindowRenamedNotification>(*n).name, QStringLiteral("build logs"));
    n = session.takeNotification();
    QVERIFY(n && std::holds_alternative<TmuxOutputNotification>(*n));
    QCOMPARE(std::get<TmuxOutputNotification>(*n).data, QByteArray("second"));
    QVERIFY(!session.takeNotification().has_value());
}

void TmuxControlSessionTest::testPauseHoldsNotifications()
{
    TmuxControlSession session(nullptr, MultiplexerSettings());
    QSignalSpy writtenSpy(&session, &TmuxControlSession::commandWritten);
    QSignalSpy pausedSpy(&session, &TmuxControlSession::pausedChanged);
    makeReady(session);

    session.processLine("%output %1 before");
    session.processLine("%pause %1");
    QVERIFY(session.isPaused());
    QCOMPARE(pausedSpy.count(), 1);
    QCOMPARE(writtenSpy.count(), 1);
    QCOMPARE(writtenSpy.at(0).at(0).toString(), QStringLiteral("refresh-client -A '%1:continue'"));

    for (int i = 1; i <= 5; ++i) {
        session.processLine("%output %1 line" + QByteArray::number(i));
    }
    QVERIFY(!session.hasPendingNotifications());
    QVERIFY(!session.takeNotification().has_value());

    QSignalSpy availableSpy(&session, &TmuxControlSession::notificationsAvailable);
    session.processLine("%continue %1");
    QVERIFY(!session.isPaused());
    QCOMPARE(availableSpy.count(), 1);

    const QList<QByteArray> expected{"before", "line1", "line2", "line3", "line4", "line5"};
    QCOMPARE(drainOutput(session), expected);
}

void TmuxControlSessionTest::testTimeoutDiscardsLateReply()
{
    MultiplexerSettings settings;
    settings.commandTimeoutMs = 200;
    TmuxControlSession session(nullptr, settings);
    QSignalSpy writtenSpy(&session, &TmuxControlSession::commandWritten);
    makeReady(session);

    QList<TmuxReply> first;
    QList<TmuxReply> second;
    session.sendCommand(TmuxCommand(QStringLiteral("list-windows")), [&first](const TmuxReply &r) {
        first.append(r);
    });
    session.sendCommand(TmuxCommand(QStringLiteral("list-panes")), [&second](const TmuxReply &r) {
        second.append(r);
    });

    QTRY_COMPARE(first.size(), 1);
    QCOMPARE(first[0].status, TmuxReply::Timeout);
    QCOMPARE(writtenSpy.count(), 2);

    // The late answer to list-windows must not complete list-panes.
    reply(session, 20, {"@1 late 80x24"});
    QVERIFY(second.isEmpty());

    reply(session, 21, {"%1"});
    QCOMPARE(second.size(), 1);
    QVERIFY(second[0].ok());
    QCOMPARE(second[0].response, QStringLiteral("%1"));
    QVERIFY(!session.isTerminated());
}

void TmuxControlSessionTest::testUnterminatedReplyTimesOut()
{
    MultiplexerSettings settings;
    settings.commandTimeoutMs = 200;
    TmuxControlSession session(nullptr, settings);
    QSignalSpy writtenSpy(&session, &TmuxControlSession::commandWritten);
    makeReady(session);

    QList<TmuxReply> first;
    QList<TmuxReply> second;
    session.sendCommand(TmuxCommand(QStringLiteral("list-windows")), [&first](const TmuxReply &r) {
        first.append(r);
    });
    session.sendCommand(TmuxCommand(QStringLiteral("list-panes")), [&second](const TmuxReply &r) {
        second.append(r);
    });

    // tmux starts answering and then goes quiet.
    session.processLine("%begin 1700000000 5 1");
    session.processLine("@1 half");
    QTRY_COMPARE(first.size(), 1);
    QCOMPARE(first[0].status, TmuxReply::Timeout);
    QCOMPARE(writtenSpy.count(), 2);
    QCOMPARE(writtenSpy.last().at(0).toString(), QStringLiteral("list-panes"));

    // The rest of the abandoned block belongs to nobody.
    session.processLine("@2 rest");
    session.processLine("%end 1700000000 5 1");
    QVERIFY(second.isEmpty());

    reply(session, 6, {"%1"});
    QCOMPARE(second.size(), 1);
    QVERIFY(second[0].ok());
    QCOMPARE(second[0].response, QStringLiteral("%1"));
    QVERIFY(!session.isTerminated());
}

void TmuxControlSessionTest::testConsecutiveTimeoutsTearDown()
{
    MultiplexerSettings settings;
    settings.commandTimeoutMs = 30;
    settings.maxConsecutiveTimeouts = 2;
    TmuxControlSession session(nullptr, settings);
    QSignalSpy detachedSpy(&session, &TmuxControlSession::detached);
    makeReady(session);

    QList<TmuxReply::Status> statuses;
    auto collect = [&statuses](const TmuxReply &r) {
        statuses.append(r.status);
    };
    session.sendCommand(TmuxCommand(QStringLiteral("one")), collect);
    session.sendCommand(TmuxCommand(QStringLiteral("two")), collect);
    session.sendCommand(TmuxCommand(QStringLiteral("three")), collect);

    QTRY_COMPARE(session.state(), TmuxControlSession::State::Errored);
    QCOMPARE(detachedSpy.count(), 1);
    const QList<TmuxReply::Status> expected{TmuxReply::Timeout, TmuxReply::Cancelled, TmuxReply::Timeout};
    QCOMPARE(statuses, expected);
}

void TmuxControlSessionTest::testStrayTerminatorIsProtocolError()
{
    TmuxControlSession session(nullptr, MultiplexerSettings());
    makeReady(session);

    QList<TmuxReply> replies;
    auto collect = [&replies](const TmuxReply &r) {
        replies.append(r);
    };
    session.sendCommand(TmuxCommand(QStringLiteral("list-windows")), collect);
    session.processLine("%end 1700000000 7 1");
    QCOMPARE(replies.size(), 1);
    QCOMPARE(replies[0].status, TmuxReply::ProtocolError);

    session.sendCommand(TmuxCommand(QStringLiteral("list-panes")), collect);
    reply(session, 7);
    QCOMPARE(replies.size(), 1);
    reply(session, 8, {"%3"});
    QCOMPARE(replies.size(), 2);
    QCOMPARE(replies[1].response, QStringLiteral("%3"));
}

void TmuxControlSessionTest::testEofCancelsCommands()
{
    TmuxControlSession session(nullptr, MultiplexerSettings());
    QSignalSpy detachedSpy(&session, &TmuxControlSession::detached);
    makeReady(session);

    QList<TmuxReply::Status> statuses;
    auto collect = [&statuses](const TmuxReply &r) {
        statuses.append(r.status);
    };
    session.sendCommand(TmuxCommand(QStringLiteral("one")), collect);
    session.sendCommand(TmuxCommand(QStringLiteral("two")), collect);
    session.processLine("%output %1 unread");

    session.transportClosed();
    QCOMPARE(session.state(), TmuxControlSession::State::Errored);
    QCOMPARE(statuses, (QList<TmuxReply::Status>{TmuxReply::Cancelled, TmuxReply::Cancelled}));
    QCOMPARE(detachedSpy.count(), 1);
    QVERIFY(!session.takeNotification().has_value());

    session.sendCommand(TmuxCommand(QStringLiteral("three")), collect);
    QCOMPARE(statuses.last(), TmuxReply::Disconnected);

    // Nothing after the end of the stream counts.
    session.processLine("%window-add @4");
    QVERIFY(!session.hasPendingNotifications());
    QCOMPARE(detachedSpy.count(), 1);
}

void TmuxControlSessionTest::testRequestedDetach()
{
    TmuxControlSession session(nullptr, MultiplexerSettings());
    QSignalSpy writtenSpy(&session, &TmuxControlSession::commandWritten);
    makeReady(session);

    session.detach();
    QCOMPARE(writtenSpy.count(), 1);
    QCOMPARE(writtenSpy.at(0).at(0).toString(), QStringLiteral("detach-client"));

    session.transportClosed();
    QCOMPARE(session.state(), TmuxControlSession::State::Detached);
}

void TmuxControlSessionTest::testExitNotification()
{
    TmuxControlSession session(nullptr, MultiplexerSettings());
    QSignalSpy detachedSpy(&session, &TmuxControlSession::detached);
    makeReady(session);

    session.processLine("%exit server exited");
    QCOMPARE(session.state(), TmuxControlSession::State::Exited);
    QCOMPARE(detachedSpy.count(), 1);
    QCOMPARE(detachedSpy.at(0).at(0).toString(), QStringLiteral("server exited"));
}

void TmuxControlSessionTest::testSuppressedOutputIsDropped()
{
    TmuxControlSession session(nullptr, MultiplexerSettings());
    makeReady(session);

    session.suppressOutput(5);
    session.processLine("%output %5 gone");
    session.processLine("%output %6 kept");
    QCOMPARE(drainOutput(session), QList<QByteArray>{"kept"});

    session.resumeOutput(5);
    session.processLine("%output %5 back");
    QCOMPARE(drainOutput(session), QList<QByteArray>{"back"});
}

void TmuxControlSessionTest::testUnknownNotification()
{
    TmuxControlSession session(nullptr, MultiplexerSettings());
    QSignalSpy parseErrorSpy(&session, &TmuxControlSession::parseErrorOccurred);
    makeReady(session);

    session.processLine("%message hello");
    session.processLine("%paste-buffer-changed buffer0");
    QCOMPARE(parseErrorSpy.count(), 0);

    session.processLine("%frobnicate @1");
    QCOMPARE(parseErrorSpy.count(), 1);
    QCOMPARE(parseErrorSpy.at(0).at(0).toByteArray(), QByteArray("%frobnicate @1"));
    QVERIFY(!session.isTerminated());
}

void TmuxControlSessionTest::testSendKeys()
{
    TmuxControlSession session(nullptr, MultiplexerSettings());
    QSignalSpy writtenSpy(&session, &TmuxControlSession::commandWritten);
    makeReady(session);

    session.sendKeys(3, QByteArray("ls -l\r"));
    for (int i = 0; i < 4; ++i) {
        reply(session, 30 + i);
    }

    QCOMPARE(writtenSpy.count(), 4);
    QCOMPARE(writtenSpy.at(0).at(0).toString(), QStringLiteral("send-keys -l -t %3 ls"));
    QCOMPARE(writtenSpy.at(1).at(0).toString(), QStringLiteral("send-keys -t %3 0x20 0x2d"));
    QCOMPARE(writtenSpy.at(2).at(0).toString(), QStringLiteral("send-keys -l -t %3 l"));
    QCOMPARE(writtenSpy.at(3).at(0).toString(), QStringLiteral("send-keys -t %3 0xd"));
}

void TmuxControlSessionTest::testDecodeOctalEscapes_data()
{
    QTest::addColumn<QByteArray>("encoded");
    QTest::addColumn<QByteArray>("decoded");

    QTest::newRow("plain") << QByteArray("hello") << QByteArray("hello");
    QTest::newRow("crlf") << QByteArray("a\\015\\012b") << QByteArray("a\r\nb");
    QTest::newRow("escape") << QByteArray("\\033[1m") << QByteArray("\033[1m");
    QTest::newRow("backslash") << QByteArray("\\134") << QByteArray("\\");
    QTest::newRow("short escape") << QByteArray("\\01x") << QByteArray("\\01x");
    QTest::newRow("raw cr") << QByteArray("x\ry") << QByteArray("xy");
    QTest::newRow("utf8") << QByteArray("\\303\\251") << QByteArray("\xc3\xa9");
}

void TmuxControlSessionTest::testDecodeOctalEscapes()
{
    QFETCH(QByteArray, encoded);
    QFETCH(QByteArray, decoded);
    QCOMPARE(TmuxControlSession::decodeOctalEscapes(encoded), decoded);
}

void TmuxControlSessionTest::testParseNotifications()
{
    auto n = TmuxControlSession::parseNotification("%layout-change @3 b25d,80x24,0,0,0 b25d,80x24,0,0,0 *Z");
    QVERIFY(n && std::holds_alternative<TmuxLayoutChangedNotification>(*n));
    const auto layout = std::get<TmuxLayoutChangedNotification>(*n);
    QCOMPARE(layout.windowId, 3);
    QCOMPARE(layout.layout, QStringLiteral("b25d,80x24,0,0,0"));
    QVERIFY(layout.zoomed);

    n = TmuxControlSession::parseNotification("%unlinked-window-add @7");
    QVERIFY(n && std::holds_alternative<TmuxWindowAddedNotification>(*n));
    QVERIFY(std::get<TmuxWindowAddedNotification>(*n).unlinked);

    n = TmuxControlSession::parseNotification("%window-close @7");
    QVERIFY(n && std::holds_alternative<TmuxWindowClosedNotification>(*n));
    QCOMPARE(std::get<TmuxWindowClosedNotification>(*n).windowId, 7);

    n = TmuxControlSession::parseNotification("%session-changed $2 work stuff");
    QVERIFY(n && std::holds_alternative<TmuxSessionChangedNotification>(*n));
    QCOMPARE(std::get<TmuxSessionChangedNotification>(*n).sessionId, 2);
    QCOMPARE(std::get<TmuxSessionChangedNotification>(*n).name, QStringLiteral("work stuff"));

    n = TmuxControlSession::parseNotification("%session-renamed $2 renamed");
    QVERIFY(n && std::holds_alternative<TmuxSessionRenamedNotification>(*n));
    QCOMPARE(std::get<TmuxSessionRenamedNotification>(*n).name, QStringLiteral("renamed"));

    n = TmuxControlSession::parseNotification("%window-pane-changed @1 %4");
    QVERIFY(n && std::holds_alternative<TmuxWindowPaneChangedNotification>(*n));
    QCOMPARE(std::get<TmuxWindowPaneChangedNotification>(*n).paneId, 4);

    n = TmuxControlSession::parseNotification("%extended-output %2 15 : \\033[0m");
    QVERIFY(n && std::holds_alternative<TmuxOutputNotification>(*n));
    QCOMPARE(std::get<TmuxOutputNotification>(*n).paneId, 2);
    QCOMPARE(std::get<TmuxOutputNotification>(*n).data, QByteArray("\033[0m"));

    QVERIFY(!TmuxControlSession::parseNotification("%output 2 missing-sigil").has_value());
    QVERIFY(!TmuxControlSession::parseNotification("%layout-change @1").has_value());
}

QTEST_GUILESS_MAIN(TmuxControlSessionTest)

#include "moc_TmuxControlSessionTest.cpp"
