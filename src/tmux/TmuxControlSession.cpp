/*
    SPDX-FileCopyrightText: 2025 Splitmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TmuxControlSession.h"

#include <QIODevice>
#include <QLoggingCategory>
#include <QTimer>

#include <type_traits>

Q_LOGGING_CATEGORY(lcTmuxSession, "splitmux.tmux.session")

namespace Splitmux
{

// Emitted by tmux -CC around the whole control stream.
static const QByteArray DcsStart("\033P1000p");
static const QByteArray DcsEnd("\033\\");

TmuxControlSession::TmuxControlSession(QIODevice *transport, const MultiplexerSettings &settings, QObject *parent)
    : QObject(parent)
    , _transport(transport)
    , _settings(settings)
    , _replyTimer(new QTimer(this))
{
    _replyTimer->setSingleShot(true);
    connect(_replyTimer, &QTimer::timeout, this, &TmuxControlSession::onCommandTimeout);

    if (_transport) {
        connect(_transport, &QIODevice::readyRead, this, &TmuxControlSession::onReadyRead);
        connect(_transport, &QIODevice::readChannelFinished, this, &TmuxControlSession::transportClosed);
    }
}

TmuxControlSession::~TmuxControlSession() = default;

TmuxControlSession::State TmuxControlSession::state() const
{
    return _state;
}

bool TmuxControlSession::isTerminated() const
{
    return _state == State::Detached || _state == State::Errored || _state == State::Exited;
}

void TmuxControlSession::setState(State state)
{
    if (_state == state) {
        return;
    }
    _state = state;
    Q_EMIT stateChanged(state);
}

void TmuxControlSession::onReadyRead()
{
    if (_transport) {
        processData(_transport->readAll());
    }
}

void TmuxControlSession::processData(const QByteArray &data)
{
    if (isTerminated()) {
        return;
    }
    _lineBuffer.append(data);
    int newline;
    while ((newline = _lineBuffer.indexOf('\n')) >= 0) {
        const QByteArray line = _lineBuffer.left(newline);
        _lineBuffer.remove(0, newline + 1);
        processLine(line);
    }
}

void TmuxControlSession::processLine(const QByteArray &rawLine)
{
    if (isTerminated()) {
        return;
    }

    QByteArray line = rawLine;
    if (line.endsWith('\r')) {
        line.chop(1);
    }
    if (line.startsWith(DcsStart)) {
        line.remove(0, DcsStart.size());
    }
    if (line.startsWith(DcsEnd)) {
        return;
    }

    if (_block != BlockKind::None) {
        if (line.startsWith("%end ") || line.startsWith("%error ")) {
            handleBlockEnd(line, line.startsWith("%end "));
            return;
        }
        if (_block == BlockKind::Reply && _inFlight) {
            if (!_inFlight->response.isEmpty()) {
                _inFlight->response += QLatin1Char('\n');
            }
            _inFlight->response += QString::fromUtf8(line);
        }
        return;
    }

    if (line.startsWith("%begin ")) {
        handleBegin(line);
    } else if (line.startsWith("%end ") || line.startsWith("%error ")) {
        qCWarning(lcTmuxSession) << "block terminator without %begin:" << line;
        if (_inFlight) {
            // Its real reply may still be on the way; do not hand it to the next command.
            ++_staleReplies;
            finishInFlight(TmuxReply::ProtocolError);
        }
    } else if (line.startsWith('%')) {
        handleNotification(line);
    } else if (!line.isEmpty()) {
        qCDebug(lcTmuxSession) << "ignoring stray line:" << line.left(80);
    }
}

void TmuxControlSession::handleBegin(const QByteArray &line)
{
    // %begin <time> <number> <flags>
    const QList<QByteArray> parts = line.mid(7).split(' ');
    int blockId = -1;
    bool clientOriginated = true;
    if (!parts.isEmpty()) {
        bool ok = false;
        blockId = parts.value(parts.size() >= 2 ? 1 : 0).toInt(&ok);
        if (!ok) {
            blockId = -1;
        }
    }
    if (parts.size() >= 3) {
        bool ok = false;
        const int flags = parts[2].toInt(&ok);
        if (ok) {
            clientOriginated = (flags & 0x01) != 0;
        }
    }

    _blockId = blockId;
    if (!clientOriginated) {
        _block = BlockKind::Silent;
    } else if (_staleReplies > 0) {
        --_staleReplies;
        qCDebug(lcTmuxSession) << "discarding late reply" << blockId;
        _block = BlockKind::Silent;
    } else if (_inFlight && !_inFlight->matched) {
        // The reply timer keeps running until the block is terminated.
        _inFlight->matched = true;
        _inFlight->commandId = blockId;
        _block = BlockKind::Reply;
    } else {
        _block = BlockKind::Silent;
    }

    // The first block proves the server is alive.
    if (_state == State::Connecting) {
        setState(State::Ready);
        Q_EMIT ready();
        pump();
    }
}

void TmuxControlSession::handleBlockEnd(const QByteArray &line, bool success)
{
    const QList<QByteArray> parts = line.mid(success ? 5 : 7).split(' ');
    bool ok = false;
    const int endId = parts.value(parts.size() >= 2 ? 1 : 0).toInt(&ok);
    if (!ok || endId != _blockId) {
        qCDebug(lcTmuxSession) << "ignoring terminator for another block:" << line;
        return;
    }

    const BlockKind kind = _block;
    _block = BlockKind::None;
    _blockId = -1;
    if (kind == BlockKind::Reply) {
        _consecutiveTimeouts = 0;
        finishInFlight(success ? TmuxReply::Ok : TmuxReply::Error);
    }
}

void TmuxControlSession::finishInFlight(TmuxReply::Status status)
{
    if (!_inFlight) {
        return;
    }
    _replyTimer->stop();
    PendingCommand command = std::move(*_inFlight);
    _inFlight.reset();
    if (!isTerminated()) {
        setState(State::Ready);
    }

    qCDebug(lcTmuxSession) << "finished:" << command.command << "status" << status << "response" << command.response.left(200);
    if (command.callback) {
        TmuxReply reply;
        reply.status = status;
        reply.response = command.response;
        command.callback(reply);
    }
    pump();
}

void TmuxControlSession::onCommandTimeout()
{
    if (!_inFlight) {
        return;
    }
    if (_inFlight->matched && _block == BlockKind::Reply) {
        // The reply started but never ended; whatever is left of it is dropped.
        _block = BlockKind::Silent;
    } else {
        ++_staleReplies;
    }
    ++_consecutiveTimeouts;
    qCWarning(lcTmuxSession) << "no reply to" << _inFlight->command << "after" << _settings.commandTimeoutMs << "ms"
                             << "(" << _consecutiveTimeouts << "in a row)";

    if (_consecutiveTimeouts >= _settings.maxConsecutiveTimeouts) {
        PendingCommand command = std::move(*_inFlight);
        _inFlight.reset();
        teardown(State::Errored, QStringLiteral("tmux stopped responding"));
        if (command.callback) {
            TmuxReply reply;
            reply.status = TmuxReply::Timeout;
            command.callback(reply);
        }
        return;
    }

    finishInFlight(TmuxReply::Timeout);
}

void TmuxControlSession::pump()
{
    if (_inFlight || _queued.isEmpty() || _state != State::Ready) {
        return;
    }
    _inFlight = _queued.dequeue();
    setState(State::AwaitingReply);
    write(_inFlight->command);
    _replyTimer->start(_settings.commandTimeoutMs);
}

void TmuxControlSession::write(const QString &command)
{
    qCDebug(lcTmuxSession) << "sending:" << command << "(queued:" << _queued.size() << ")";
    Q_EMIT commandWritten(command);
    if (_transport && _transport->isWritable()) {
        if (_transport->write(command.toUtf8() + '\n') < 0) {
            qCWarning(lcTmuxSession) << "write to tmux failed:" << _transport->errorString();
        }
    }
}

void TmuxControlSession::sendCommand(const TmuxCommand &command, CommandCallback callback)
{
    const QString commandStr = command.build();

    if (isTerminated()) {
        qCDebug(lcTmuxSession) << "dropping command on closed session:" << commandStr;
        if (callback) {
            TmuxReply reply;
            reply.status = TmuxReply::Disconnected;
            callback(reply);
        }
        return;
    }

    PendingCommand pending;
    pending.command = commandStr;
    pending.callback = std::move(callback);
    _queued.enqueue(pending);
    pump();
}

void TmuxControlSession::sendKeys(int paneId, const QByteArray &data)
{
    // Letters, digits and a few punctuation characters can go through
    // send-keys -l; anything else is sent as hex key codes.
    auto isLiteral = [](char c) -> bool {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '+' || c == '/' || c == ')' || c == ':' || c == ','
            || c == '_';
    };

    int i = 0;
    while (i < data.size()) {
        if (isLiteral(data[i])) {
            QByteArray literal;
            while (i < data.size() && isLiteral(data[i]) && literal.size() < 1000) {
                literal.append(data[i]);
                i++;
            }
            sendCommand(TmuxCommand(QStringLiteral("send-keys")).flag(QStringLiteral("-l")).paneTarget(paneId).arg(QString::fromLatin1(literal)));
        } else {
            QStringList keys;
            while (i < data.size() && !isLiteral(data[i]) && keys.size() < 125) {
                const unsigned char byte = static_cast<unsigned char>(data[i]);
                if (byte == 0) {
                    keys.append(QStringLiteral("C-Space"));
                } else {
                    keys.append(QStringLiteral("0x%1").arg(byte, 0, 16));
                }
                i++;
            }
            sendCommand(TmuxCommand(QStringLiteral("send-keys")).paneTarget(paneId).arg(keys.join(QLatin1Char(' '))));
        }
    }
}

void TmuxControlSession::detach()
{
    if (isTerminated()) {
        return;
    }
    _detachRequested = true;
    sendCommand(TmuxCommand(QStringLiteral("detach-client")));
}

void TmuxControlSession::transportClosed()
{
    if (isTerminated()) {
        return;
    }
    if (_detachRequested) {
        teardown(State::Detached, QStringLiteral("detached"));
    } else {
        teardown(State::Errored, QStringLiteral("connection to tmux lost"));
    }
}

void TmuxControlSession::teardown(State finalState, const QString &reason)
{
    if (isTerminated()) {
        return;
    }
    _replyTimer->stop();

    QList<PendingCommand> cancelled;
    if (_inFlight) {
        cancelled.append(std::move(*_inFlight));
        _inFlight.reset();
    }
    while (!_queued.isEmpty()) {
        cancelled.append(_queued.dequeue());
    }

    _notifications.clear();
    _pausedPanes.clear();
    _block = BlockKind::None;
    _lineBuffer.clear();
    if (_transport) {
        disconnect(_transport, nullptr, this, nullptr);
    }

    qCInfo(lcTmuxSession) << "session closed:" << reason << "-" << cancelled.size() << "command(s) cancelled";
    setState(finalState);

    for (const PendingCommand &command : cancelled) {
        if (command.callback) {
            TmuxReply reply;
            reply.status = TmuxReply::Cancelled;
            command.callback(reply);
        }
    }

    Q_EMIT detached(reason);
}

void TmuxControlSession::suppressOutput(int paneId)
{
    _suppressedPanes.insert(paneId);
}

void TmuxControlSession::resumeOutput(int paneId)
{
    _suppressedPanes.remove(paneId);
}

bool TmuxControlSession::isPaused() const
{
    return !_pausedPanes.isEmpty();
}

bool TmuxControlSession::hasPendingNotifications() const
{
    return !isPaused() && !_notifications.isEmpty();
}

std::optional<TmuxNotification> TmuxControlSession::takeNotification()
{
    if (!hasPendingNotifications()) {
        return std::nullopt;
    }
    return _notifications.dequeue();
}

bool TmuxControlSession::hasCommandInFlight() const
{
    return _inFlight.has_value();
}

int TmuxControlSession::queuedCommandCount() const
{
    return _queued.size();
}

void TmuxControlSession::enqueueNotification(TmuxNotification &&notification)
{
    _notifications.enqueue(std::move(notification));
    if (!isPaused()) {
        Q_EMIT notificationsAvailable();
    }
}

void TmuxControlSession::setPaused(int paneId, bool paused)
{
    const bool wasPaused = isPaused();
    if (paused) {
        _pausedPanes.insert(paneId);
    } else if (paneId < 0) {
        _pausedPanes.clear();
    } else {
        _pausedPanes.remove(paneId);
    }

    if (wasPaused == isPaused()) {
        return;
    }
    Q_EMIT pausedChanged(isPaused());
    if (!isPaused() && !_notifications.isEmpty()) {
        Q_EMIT notificationsAvailable();
    }
}

void TmuxControlSession::handleNotification(const QByteArray &line)
{
    static const char *const ignored[] = {
        "%pane-mode-changed",
        "%paste-buffer-changed",
        "%paste-buffer-deleted",
        "%subscription-changed",
        "%message",
        "%config-error",
    };
    for (const char *token : ignored) {
        const int length = int(qstrlen(token));
        if (line.startsWith(token) && (line.size() == length || line.at(length) == ' ')) {
            qCDebug(lcTmuxSession) << "ignored:" << line.left(80);
            return;
        }
    }

    auto notification = parseNotification(line);
    if (!notification.has_value()) {
        qCWarning(lcTmuxSession) << "unparseable notification:" << line.left(200);
        Q_EMIT parseErrorOccurred(line);
        return;
    }
    if (!line.startsWith("%output ") && !line.startsWith("%extended-output ")) {
        qCDebug(lcTmuxSession) << "notification:" << line;
    }

    std::visit(
        [this](auto &&n) {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, TmuxOutputNotification>) {
                if (!_suppressedPanes.contains(n.paneId)) {
                    enqueueNotification(std::move(n));
                }
            } else if constexpr (std::is_same_v<T, TmuxPausedNotification>) {
                setPaused(n.paneId, true);
                if (_settings.autoResumePausedPanes && n.paneId >= 0) {
                    sendCommand(TmuxCommand(QStringLiteral("refresh-client"))
                                    .flag(QStringLiteral("-A"))
                                    .arg(TmuxCommand::quoted(QLatin1Char('%') + QString::number(n.paneId) + QLatin1String(":continue"))));
                }
            } else if constexpr (std::is_same_v<T, TmuxContinuedNotification>) {
                setPaused(n.paneId, false);
            } else if constexpr (std::is_same_v<T, TmuxExitNotification>) {
                teardown(_detachRequested ? State::Detached : State::Exited, n.reason.isEmpty() ? QStringLiteral("exited") : n.reason);
            } else {
                enqueueNotification(std::move(n));
            }
        },
        std::move(notification.value()));
}

std::optional<TmuxNotification> TmuxControlSession::parseNotification(const QByteArray &line)
{
    if (line.startsWith("%output ")) {
        const int space = line.indexOf(' ', 8);
        if (space < 0) {
            return std::nullopt;
        }
        const int paneId = parsePaneId(line.mid(8, space - 8));
        if (paneId < 0) {
            return std::nullopt;
        }
        return TmuxOutputNotification{paneId, decodeOctalEscapes(line.mid(space + 1))};

    } else if (line.startsWith("%extended-output ")) {
        // %extended-output %N <age> ... : <data>
        const int space = line.indexOf(' ', 17);
        const int separator = line.indexOf(" : ", 17);
        if (space < 0 || separator < 0) {
            return std::nullopt;
        }
        const int paneId = parsePaneId(line.mid(17, space - 17));
        if (paneId < 0) {
            return std::nullopt;
        }
        return TmuxOutputNotification{paneId, decodeOctalEscapes(line.mid(separator + 3))};

    } else if (line.startsWith("%layout-change ")) {
        const QList<QByteArray> parts = line.mid(15).split(' ');
        if (parts.size() < 2) {
            return std::nullopt;
        }
        const int windowId = parseWindowId(parts[0]);
        if (windowId < 0) {
            return std::nullopt;
        }
        const QString visibleLayout = parts.size() >= 3 ? QString::fromUtf8(parts[2]) : QString();
        const bool zoomed = parts.size() >= 4 && parts[3].contains('Z');
        return TmuxLayoutChangedNotification{windowId, QString::fromUtf8(parts[1]), visibleLayout, zoomed};

    } else if (line.startsWith("%window-add ") || line.startsWith("%unlinked-window-add ")) {
        const bool unlinked = line.startsWith("%unlinked-");
        const int windowId = parseWindowId(line.mid(unlinked ? 21 : 12));
        if (windowId < 0) {
            return std::nullopt;
        }
        return TmuxWindowAddedNotification{windowId, unlinked};

    } else if (line.startsWith("%window-close ") || line.startsWith("%unlinked-window-close ")) {
        const bool unlinked = line.startsWith("%unlinked-");
        const QByteArray rest = line.mid(unlinked ? 23 : 14);
        const int windowId = parseWindowId(rest.split(' ').first());
        if (windowId < 0) {
            return std::nullopt;
        }
        return TmuxWindowClosedNotification{windowId, unlinked};

    } else if (line.startsWith("%window-renamed ")) {
        const QByteArray rest = line.mid(16);
        const int space = rest.indexOf(' ');
        if (space < 0) {
            return std::nullopt;
        }
        return TmuxWindowRenamedNotification{parseWindowId(rest.left(space)), QString::fromUtf8(rest.mid(space + 1))};

    } else if (line.startsWith("%window-pane-changed ")) {
        const QList<QByteArray> parts = line.mid(21).split(' ');
        if (parts.size() < 2) {
            return std::nullopt;
        }
        return TmuxWindowPaneChangedNotification{parseWindowId(parts[0]), parsePaneId(parts[1])};

    } else if (line.startsWith("%session-changed ")) {
        const QByteArray rest = line.mid(17);
        const int space = rest.indexOf(' ');
        if (space < 0) {
            return std::nullopt;
        }
        return TmuxSessionChangedNotification{parseSessionId(rest.left(space)), QString::fromUtf8(rest.mid(space + 1))};

    } else if (line.startsWith("%session-renamed ")) {
        // Newer tmux prefixes the session id.
        QByteArray rest = line.mid(17);
        if (rest.startsWith('$')) {
            const int space = rest.indexOf(' ');
            rest = space < 0 ? QByteArray() : rest.mid(space + 1);
        }
        return TmuxSessionRenamedNotification{QString::fromUtf8(rest)};

    } else if (line == "%sessions-changed") {
        return TmuxSessionsChangedNotification{};

    } else if (line.startsWith("%session-window-changed ")) {
        const QList<QByteArray> parts = line.mid(24).split(' ');
        if (parts.size() < 2) {
            return std::nullopt;
        }
        return TmuxSessionWindowChangedNotification{parseSessionId(parts[0]), parseWindowId(parts[1])};

    } else if (line == "%pause" || line.startsWith("%pause ")) {
        return TmuxPausedNotification{line.size() > 7 ? parsePaneId(line.mid(7)) : -1};

    } else if (line == "%continue" || line.startsWith("%continue ")) {
        return TmuxContinuedNotification{line.size() > 10 ? parsePaneId(line.mid(10)) : -1};

    } else if (line.startsWith("%client-session-changed ")) {
        // %client-session-changed <client> $<id> <name>
        const QList<QByteArray> parts = line.mid(24).split(' ');
        if (parts.size() < 3) {
            return std::nullopt;
        }
        return TmuxClientSessionChangedNotification{QString::fromUtf8(parts[0]), parseSessionId(parts[1]), QString::fromUtf8(parts[2])};

    } else if (line.startsWith("%client-detached ")) {
        return TmuxClientDetachedNotification{QString::fromUtf8(line.mid(17))};

    } else if (line == "%exit" || line.startsWith("%exit ")) {
        return TmuxExitNotification{line.size() > 6 ? QString::fromUtf8(line.mid(6)) : QString()};
    }

    return std::nullopt;
}

QByteArray TmuxControlSession::decodeOctalEscapes(const QByteArray &encoded)
{
    QByteArray result;
    result.reserve(encoded.size());

    int i = 0;
    while (i < encoded.size()) {
        const char c = encoded[i];
        if (c == '\\') {
            int value = 0;
            int digits = 0;
            int j = i + 1;
            while (digits < 3 && j < encoded.size()) {
                const char d = encoded[j];
                if (d < '0' || d > '7') {
                    break;
                }
                value = value * 8 + (d - '0');
                digits++;
                j++;
            }
            if (digits == 3) {
                result.append(static_cast<char>(value));
                i = j;
            } else {
                result.append(c);
                i++;
            }
        } else if (c == '\r') {
            // Line driver artefact, real carriage returns arrive escaped.
            i++;
        } else {
            result.append(c);
            i++;
        }
    }

    return result;
}

int TmuxControlSession::parsePaneId(const QByteArray &token)
{
    const QByteArray trimmed = token.trimmed();
    if (trimmed.isEmpty() || trimmed[0] != '%') {
        return -1;
    }
    bool ok = false;
    const int id = trimmed.mid(1).toInt(&ok);
    return ok ? id : -1;
}

int TmuxControlSession::parseWindowId(const QByteArray &token)
{
    const QByteArray trimmed = token.trimmed();
    if (trimmed.isEmpty() || trimmed[0] != '@') {
        return -1;
    }
    bool ok = false;
    const int id = trimmed.mid(1).toInt(&ok);
    return ok ? id : -1;
}

int TmuxControlSession::parseSessionId(const QByteArray &token)
{
    const QByteArray trimmed = token.trimmed();
    if (trimmed.isEmpty() || trimmed[0] != '$') {
        return -1;
    }
    bool ok = false;
    const int id = trimmed.mid(1).toInt(&ok);
    return ok ? id : -1;
}

} // namespace Splitmux

#include "moc_TmuxControlSession.cpp"
