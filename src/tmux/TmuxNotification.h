/*
    SPDX-FileCopyrightText: 2025 Splitmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TMUXNOTIFICATION_H
#define TMUXNOTIFICATION_H

#include <QByteArray>
#include <QString>

#include <variant>

namespace Splitmux
{

// Ids are the numbers after the tmux sigils (%pane, @window, $session);
// -1 when the line did not carry one.

// "%output %P data" and "%extended-output %P age : data".
// data has its octal escapes decoded.
struct TmuxOutputNotification {
    int paneId = -1;
    QByteArray data;
};

// "%layout-change @W layout visible-layout flags"
struct TmuxLayoutChangedNotification {
    int windowId = -1;
    QString layout;
    QString visibleLayout; // differs from layout while a pane is zoomed
    bool zoomed = false; // 'Z' in flags
};

// "%window-add @W", or "%unlinked-window-add @W" for a window that
// belongs to another session.
struct TmuxWindowAddedNotification {
    int windowId = -1;
    bool unlinked = false;
};

// "%window-close @W" / "%unlinked-window-close @W"
struct TmuxWindowClosedNotification {
    int windowId = -1;
    bool unlinked = false;
};

// "%window-renamed @W name"; the name may contain spaces.
struct TmuxWindowRenamedNotification {
    int windowId = -1;
    QString name;
};

// "%window-pane-changed @W %P": the window's active pane moved.
struct TmuxWindowPaneChangedNotification {
    int windowId = -1;
    int paneId = -1;
};

// "%session-changed $S name": this client now shows another session.
struct TmuxSessionChangedNotification {
    int sessionId = -1;
    QString name;
};

// "%session-renamed name"
struct TmuxSessionRenamedNotification {
    QString name;
};

// "%sessions-changed": a session was created or destroyed somewhere.
struct TmuxSessionsChangedNotification {
};

// "%session-window-changed $S @W": the session's current window changed.
struct TmuxSessionWindowChangedNotification {
    int sessionId = -1;
    int windowId = -1;
};

// "%pause %P": tmux stopped sending output for the pane because this
// client fell behind. Resumed with refresh-client -A '%P:continue'.
struct TmuxPausedNotification {
    int paneId = -1;
};

// "%continue %P": output for the pane flows again.
struct TmuxContinuedNotification {
    int paneId = -1;
};

// "%client-session-changed client $S name", about another client.
struct TmuxClientSessionChangedNotification {
    QString clientName;
    int sessionId = -1;
    QString sessionName;
};

// "%client-detached client", about another client.
struct TmuxClientDetachedNotification {
    QString clientName;
};

// "%exit [reason]": the server is about to close this client.
struct TmuxExitNotification {
    QString reason;
};

using TmuxNotification = std::variant<TmuxOutputNotification,
                                      TmuxLayoutChangedNotification,
                                      TmuxWindowAddedNotification,
                                      TmuxWindowClosedNotification,
                                      TmuxWindowRenamedNotification,
                                      TmuxWindowPaneChangedNotification,
                                      TmuxSessionChangedNotification,
                                      TmuxSessionRenamedNotification,
                                      TmuxSessionsChangedNotification,
                                      TmuxSessionWindowChangedNotification,
                                      TmuxPausedNotification,
                                      TmuxContinuedNotification,
                                      TmuxClientSessionChangedNotification,
                                      TmuxClientDetachedNotification,
                                      TmuxExitNotification>;

} // namespace Splitmux

#endif // TMUXNOTIFICATION_H
