/*
    SPDX-FileCopyrightText: 2025 Splitmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TmuxPaneStateRecovery.h"

#include "TmuxCommand.h"
#include "TmuxControlSession.h"

#include "session/TerminalCore.h"

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(lcTmuxRecovery, "splitmux.tmux.recovery")

namespace Splitmux
{

TmuxPaneStateRecovery::TmuxPaneStateRecovery(TmuxControlSession *session, TerminalCore *core, HandleResolver resolve, QObject *parent)
    : QObject(parent)
    , _session(session)
    , _core(core)
    , _resolve(std::move(resolve))
{
}

void TmuxPaneStateRecovery::queryPaneStates(int windowId)
{
    static const QString format = QStringLiteral(
        "#{pane_id}\t#{alternate_on}\t#{cursor_x}\t#{cursor_y}"
        "\t#{scroll_region_upper}\t#{scroll_region_lower}"
        "\t#{cursor_flag}\t#{insert_flag}\t#{keypad_cursor_flag}"
        "\t#{keypad_flag}\t#{wrap_flag}\t#{mouse_standard_flag}"
        "\t#{mouse_button_flag}\t#{mouse_any_flag}\t#{mouse_sgr_flag}");

    _session->sendCommand(TmuxCommand(QStringLiteral("list-panes")).windowTarget(windowId).format(format), [this](const TmuxReply &reply) {
        handlePaneStateResponse(reply);
    });
}

QList<TmuxPaneState> TmuxPaneStateRecovery::parsePaneStates(const QString &response)
{
    QList<TmuxPaneState> states;
    const QStringList lines = response.split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    for (const QString &line : lines) {
        const QStringList fields = line.split(QLatin1Char('\t'));
        if (fields.size() < 15 || !fields[0].startsWith(QLatin1Char('%'))) {
            qCDebug(lcTmuxRecovery) << "skipping pane state line:" << line;
            continue;
        }

        auto flag = [&fields](int index) {
            return fields[index] == QLatin1String("1");
        };

        TmuxPaneState state;
        state.paneId = fields[0].mid(1).toInt();
        state.alternateOn = flag(1);
        state.cursorX = fields[2].toInt();
        state.cursorY = fields[3].toInt();
        state.scrollRegionUpper = fields[4].toInt();
        state.scrollRegionLower = fields[5].toInt();
        state.cursorVisible = flag(6);
        state.insertMode = flag(7);
        state.appCursorKeys = flag(8);
        state.appKeypad = flag(9);
        state.wrapMode = flag(10);
        state.mouseStandard = flag(11);
        state.mouseButton = flag(12);
        state.mouseAny = flag(13);
        state.mouseSGR = flag(14);
        states.append(state);
    }
    return states;
}

void TmuxPaneStateRecovery::handlePaneStateResponse(const TmuxReply &reply)
{
    if (!reply.ok() || reply.response.isEmpty()) {
        return;
    }
    const QList<TmuxPaneState> states = parsePaneStates(reply.response);
    for (const TmuxPaneState &state : states) {
        _paneStates.insert(state.paneId, state);
    }
}

void TmuxPaneStateRecovery::setPaneDimensions(int paneId, int width, int height)
{
    _paneDimensions.insert(paneId, QSize(width, height));
}

void TmuxPaneStateRecovery::capturePaneHistory(int paneId)
{
    _pendingCapture.insert(paneId);
    _session->sendCommand(TmuxCommand(QStringLiteral("capture-pane"))
                              .flag(QStringLiteral("-p"))
                              .flag(QStringLiteral("-J"))
                              .flag(QStringLiteral("-e"))
                              .paneTarget(paneId)
                              .flag(QStringLiteral("-S"))
                              .arg(QStringLiteral("-")),
                          [this, paneId](const TmuxReply &reply) {
                              handleCapturePaneResponse(paneId, reply);
                          });
}

bool TmuxPaneStateRecovery::isPendingCapture(int paneId) const
{
    return _pendingCapture.contains(paneId);
}

bool TmuxPaneStateRecovery::hasPaneState(int paneId) const
{
    return _paneStates.contains(paneId);
}

QByteArray TmuxPaneStateRecovery::historyBytes(const QString &response)
{
    // Wipe whatever %output drew before the terminal had its final size.
    QByteArray bytes("\033[2J\033[H");

    QStringList lines = response.split(QLatin1Char('\n'));
    // capture-pane pads to the pane height; the padding would push real
    // content off screen.
    while (!lines.isEmpty() && lines.last().trimmed().isEmpty()) {
        lines.removeLast();
    }

    for (int i = 0; i < lines.size(); ++i) {
        bytes.append(lines[i].toUtf8());
        if (i < lines.size() - 1) {
            bytes.append("\r\n");
        }
    }
    return bytes;
}

void TmuxPaneStateRecovery::handleCapturePaneResponse(int paneId, const TmuxReply &reply)
{
    _pendingCapture.remove(paneId);

    const TerminalHandle handle = _resolve(paneId);
    if (!reply.ok() || reply.response.isEmpty() || handle == NullTerminalHandle) {
        qCDebug(lcTmuxRecovery) << "no history recovered for pane" << paneId << "status" << reply.status;
        Q_EMIT paneRecoveryComplete(paneId);
        return;
    }

    // Long lines must wrap at the pane's width, not the default one.
    if (_paneDimensions.contains(paneId)) {
        const QSize dims = _paneDimensions.take(paneId);
        _core->resizeTerminal(handle, dims.width(), dims.height());
    }

    _core->injectOutput(handle, historyBytes(reply.response));
    applyPaneState(paneId);
    Q_EMIT paneRecoveryComplete(paneId);
}

QByteArray TmuxPaneStateRecovery::stateBytes(const TmuxPaneState &state)
{
    QByteArray seq;

    if (state.alternateOn) {
        seq.append("\033[?1049h");
    }
    if (state.scrollRegionUpper != 0 || state.scrollRegionLower != -1) {
        const int lower = state.scrollRegionLower < 0 ? 9999 : state.scrollRegionLower;
        seq.append(QStringLiteral("\033[%1;%2r").arg(state.scrollRegionUpper + 1).arg(lower + 1).toUtf8());
    }
    seq.append(QStringLiteral("\033[%1;%2H").arg(state.cursorY + 1).arg(state.cursorX + 1).toUtf8());
    if (!state.cursorVisible) {
        seq.append("\033[?25l");
    }
    if (state.insertMode) {
        seq.append("\033[4h");
    }
    if (state.appCursorKeys) {
        seq.append("\033[?1h");
    }
    if (state.appKeypad) {
        seq.append("\033=");
    }
    if (!state.wrapMode) {
        seq.append("\033[?7l");
    }
    if (state.mouseStandard) {
        seq.append("\033[?1000h");
    }
    if (state.mouseButton) {
        seq.append("\033[?1002h");
    }
    if (state.mouseAny) {
        seq.append("\033[?1003h");
    }
    if (state.mouseSGR) {
        seq.append("\033[?1006h");
    }
    return seq;
}

void TmuxPaneStateRecovery::applyPaneState(int paneId)
{
    auto it = _paneStates.find(paneId);
    if (it == _paneStates.end()) {
        return;
    }
    const TerminalHandle handle = _resolve(paneId);
    if (handle != NullTerminalHandle) {
        _core->injectOutput(handle, stateBytes(it.value()));
    }
    _paneStates.erase(it);
}

void TmuxPaneStateRecovery::clear()
{
    _paneStates.clear();
    _paneDimensions.clear();
    _pendingCapture.clear();
}

} // namespace Splitmux

#include "moc_TmuxPaneStateRecovery.cpp"
