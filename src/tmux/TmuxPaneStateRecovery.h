/*
    SPDX-FileCopyrightText: 2025 Splitmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TMUXPANESTATERECOVERY_H
#define TMUXPANESTATERECOVERY_H

#include <QHash>
#include <QObject>
#include <QSet>
#include <QSize>

#include <functional>

#include "pane/PaneTypes.h"
#include "splitmuxprivate_export.h"

namespace Splitmux
{

class TerminalCore;
class TmuxControlSession;
struct TmuxReply;

struct TmuxPaneState {
    int paneId = -1;
    bool alternateOn = false;
    int cursorX = 0;
    int cursorY = 0;
    int scrollRegionUpper = 0;
    int scrollRegionLower = -1; // -1 = bottom of screen
    bool cursorVisible = true;
    bool insertMode = false;
    bool appCursorKeys = false;
    bool appKeypad = false;
    bool wrapMode = true;
    bool mouseStandard = false;
    bool mouseButton = false;
    bool mouseAny = false;
    bool mouseSGR = false;
};

/**
 * Fills freshly created terminals of an already running tmux session with
 * the pane's history and restores cursor and mode state, so attaching does
 * not start from a blank screen.
 */
class SPLITMUXPRIVATE_EXPORT TmuxPaneStateRecovery : public QObject
{
    Q_OBJECT
public:
    // Remote pane id -> terminal handle, NullTerminalHandle if unknown.
    using HandleResolver = std::function<TerminalHandle(int remotePaneId)>;

    TmuxPaneStateRecovery(TmuxControlSession *session, TerminalCore *core, HandleResolver resolve, QObject *parent = nullptr);

    void queryPaneStates(int windowId);
    void setPaneDimensions(int paneId, int width, int height);
    void capturePaneHistory(int paneId);
    void applyPaneState(int paneId);
    void clear();

    bool isPendingCapture(int paneId) const;
    bool hasPaneState(int paneId) const;

    // Exposed for tests: the bytes a capture-pane reply turns into.
    static QByteArray historyBytes(const QString &response);
    static QByteArray stateBytes(const TmuxPaneState &state);
    static QList<TmuxPaneState> parsePaneStates(const QString &response);

Q_SIGNALS:
    void paneRecoveryComplete(int paneId);

private:
    void handlePaneStateResponse(const TmuxReply &reply);
    void handleCapturePaneResponse(int paneId, const TmuxReply &reply);

    TmuxControlSession *_session;
    TerminalCore *_core;
    HandleResolver _resolve;
    QHash<int, TmuxPaneState> _paneStates;
    QHash<int, QSize> _paneDimensions;
    QSet<int> _pendingCapture;
};

} // namespace Splitmux

#endif // TMUXPANESTATERECOVERY_H
