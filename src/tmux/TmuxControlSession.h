/*
    SPDX-FileCopyrightText: 2025 Splitmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TMUXCONTROLSESSION_H
#define TMUXCONTROLSESSION_H

#include <QByteArray>
#include <QObject>
#include <QPointer>
#include <QQueue>
#include <QSet>

#include <functional>
#include <optional>

#include "TmuxCommand.h"
#include "TmuxNotification.h"
#include "settings/MultiplexerSettings.h"
#include "splitmuxprivate_export.h"

class QIODevice;
class QTimer;

namespace Splitmux
{

struct TmuxReply {
    enum Status { Ok, Error, Timeout, Cancelled, ProtocolError, Disconnected };

    Status status = Ok;
    QString response;

    bool ok() const
    {
        return status == Ok;
    }
};

/**
 * One tmux control-mode connection (tmux -CC).
 *
 * Frames the byte stream into lines, matches %begin/%end/%error blocks to
 * the single command in flight and queues notifications in wire order.
 * The queue is consumed with takeNotification(); it yields nothing while
 * the connection is paused.
 */
class SPLITMUXPRIVATE_EXPORT TmuxControlSession : public QObject
{
    Q_OBJECT
public:
    enum class State { Connecting, Ready, AwaitingReply, Detached, Errored, Exited };
    Q_ENUM(State)

    using CommandCallback = std::function<void(const TmuxReply &reply)>;

    // transport may be null; commands are then only reported through commandWritten().
    TmuxControlSession(QIODevice *transport, const MultiplexerSettings &settings, QObject *parent = nullptr);
    ~TmuxControlSession() override;

    State state() const;
    bool isTerminated() const;

    void processData(const QByteArray &data);
    void processLine(const QByteArray &line);
    // Stream EOF or child exit.
    void transportClosed();

    void sendCommand(const TmuxCommand &command, CommandCallback callback = nullptr);
    void sendKeys(int paneId, const QByteArray &data);
    void detach();

    // Later %output for the pane is dropped; it has no destination any more.
    void suppressOutput(int paneId);
    // The pane showed up again, e.g. moved to another window.
    void resumeOutput(int paneId);

    bool hasPendingNotifications() const;
    std::optional<TmuxNotification> takeNotification();
    bool isPaused() const;

    bool hasCommandInFlight() const;
    int queuedCommandCount() const;

    static std::optional<TmuxNotification> parseNotification(const QByteArray &line);
    static QByteArray decodeOctalEscapes(const QByteArray &encoded);

Q_SIGNALS:
    void ready();
    void stateChanged(Splitmux::TmuxControlSession::State state);
    void notificationsAvailable();
    void pausedChanged(bool paused);
    void commandWritten(const QString &command);
    void parseErrorOccurred(const QByteArray &line);
    void detached(const QString &reason);

private:
    struct PendingCommand {
        QString command;
        CommandCallback callback;
        QString response;
        int commandId = -1;
        bool matched = false;
    };

    enum class BlockKind { None, Reply, Silent };

    static int parsePaneId(const QByteArray &token);
    static int parseWindowId(const QByteArray &token);
    static int parseSessionId(const QByteArray &token);

    void onReadyRead();
    void handleBegin(const QByteArray &line);
    void handleBlockEnd(const QByteArray &line, bool success);
    void handleNotification(const QByteArray &line);
    void enqueueNotification(TmuxNotification &&notification);
    void setPaused(int paneId, bool paused);
    void finishInFlight(TmuxReply::Status status);
    void onCommandTimeout();
    void pump();
    void setState(State state);
    void teardown(State finalState, const QString &reason);
    void write(const QString &command);

    QPointer<QIODevice> _transport;
    MultiplexerSettings _settings;
    State _state = State::Connecting;

    QByteArray _lineBuffer;

    QQueue<PendingCommand> _queued;
    std::optional<PendingCommand> _inFlight;
    QTimer *_replyTimer;
    int _staleReplies = 0;
    int _consecutiveTimeouts = 0;

    BlockKind _block = BlockKind::None;
    int _blockId = -1;

    QQueue<TmuxNotification> _notifications;
    QSet<int> _pausedPanes;
    QSet<int> _suppressedPanes;

    bool _detachRequested = false;
};

} // namespace Splitmux

#endif // TMUXCONTROLSESSION_H
