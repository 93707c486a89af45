/*
    SPDX-FileCopyrightText: 2025 Splitmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TMUXSYNCENGINE_H
#define TMUXSYNCENGINE_H

#include <QHash>
#include <QObject>
#include <QPointer>

#include <optional>

#include "TmuxLayoutParser.h"
#include "TmuxMapping.h"
#include "TmuxNotification.h"
#include "pane/PaneTypes.h"
#include "settings/MultiplexerSettings.h"
#include "splitmuxprivate_export.h"

namespace Splitmux
{

class PaneManager;
class TerminalCore;
class TmuxCommand;
class TmuxControlSession;
class TmuxPaneStateRecovery;
class TmuxResizeCoordinator;
class Workspace;

// One row of list-sessions.
struct TmuxSessionInfo {
    int sessionId = -1; // $N
    QString name;
    int windows = 0;
    bool attached = false; // some client is attached
};

/**
 * Mirrors one tmux session into a Workspace.
 *
 * Every remote window is a tab with Remote authority. Layout notifications
 * are reconciled into the tab's PaneTree keeping the terminals of panes
 * that survive; local structural requests on those tabs are sent to tmux
 * and only take effect when tmux reports the new layout back.
 */
class SPLITMUXPRIVATE_EXPORT TmuxSyncEngine : public QObject
{
    Q_OBJECT
public:
    TmuxSyncEngine(TmuxControlSession *session, Workspace *workspace, QObject *parent = nullptr);
    ~TmuxSyncEngine() override;

    TmuxControlSession *session() const;
    const TmuxMapping &mapping() const;
    TmuxResizeCoordinator *resizeCoordinator() const;
    TmuxPaneStateRecovery *recovery() const;

    // Applies a full window layout all-or-nothing. Creates the tab for an
    // unknown window. Returns false, leaving everything as it was, when the
    // layout cannot be parsed or applied.
    bool applyLayout(int windowId, const QString &layout);
    std::optional<TmuxLayoutNode> snapshot(int windowId) const;

    bool isRemotePane(PaneId pane) const;
    int remotePaneFor(PaneId pane) const;
    TabId tabForWindow(int windowId) const;

    void sendKeys(PaneId pane, const QByteArray &data);
    void executeCommand(const TmuxCommand &command);
    void newWindow();
    // Answered by sessionsListed().
    void listSessions();
    // Asks tmux to apply the tab's current local geometry.
    bool pushLayout(TabId tab);
    void detach();
    void setClientSize(int columns, int rows);

    static QList<TmuxSessionInfo> parseSessionList(const QString &response);

public Q_SLOTS:
    void drainNotifications();

Q_SIGNALS:
    void initialWindowsOpened();
    void layoutApplied(int windowId, Splitmux::TabId tab);
    void parseErrorOccurred(const QString &message);
    void detached(const QString &reason);

private:
    void onReady();
    void onSessionDetached(const QString &reason);
    void onRemoteRequest(const PaneRequest &request);

    void listWindows(int windowId = -1);
    void handleListWindowsResponse(const QString &response);
    void recoverPanes(int windowId, const QList<int> &remotePanes);

    void handleNotification(const TmuxNotification &notification);
    void closeWindow(int windowId);
    void resetSession();

    PaneManager *managerForWindow(int windowId) const;

    QPointer<TmuxControlSession> _session;
    Workspace *_workspace;
    TerminalCore *_core;
    MultiplexerSettings _settings;

    TmuxMapping _mapping;
    TmuxResizeCoordinator *_resize;
    TmuxPaneStateRecovery *_recovery;
    QHash<int, TmuxLayoutNode> _snapshots;

    int _sessionId = -1;
    bool _initializing = false;
    bool _draining = false;
};

} // namespace Splitmux

Q_DECLARE_METATYPE(Splitmux::TmuxSessionInfo)

#endif // TMUXSYNCENGINE_H
