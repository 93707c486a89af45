/*
    SPDX-FileCopyrightText: 2025 Splitmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TmuxSyncEngine.h"

#include "TmuxCommand.h"
#include "TmuxControlSession.h"
#include "TmuxLayoutManager.h"
#include "TmuxPaneStateRecovery.h"
#include "TmuxResizeCoordinator.h"

#include "Workspace.h"
#include "pane/PaneManager.h"
#include "session/TerminalCore.h"

#include <QLoggingCategory>
#include <QSet>
#include <QSize>

#include <algorithm>
#include <type_traits>

Q_LOGGING_CATEGORY(lcTmuxSync, "splitmux.tmux.sync")

namespace Splitmux
{

// Notifications handled per drain before yielding to the event loop.
static const int DrainBatchSize = 64;

static void collectLeafSizes(const TmuxLayoutNode &node, QHash<int, QSize> &sizes)
{
    if (node.type == TmuxLayoutNodeType::Leaf) {
        sizes.insert(node.paneId, QSize(node.width, node.height));
        return;
    }
    for (const TmuxLayoutNode &child : node.children) {
        collectLeafSizes(child, sizes);
    }
}

TmuxSyncEngine::TmuxSyncEngine(TmuxControlSession *session, Workspace *workspace, QObject *parent)
    : QObject(parent)
    , _session(session)
    , _workspace(workspace)
    , _core(workspace->terminalCore())
    , _settings(workspace->settings())
    , _resize(new TmuxResizeCoordinator(session, this))
{
    _recovery = new TmuxPaneStateRecovery(
        session,
        _core,
        [this](int remotePaneId) {
            const PaneManager *manager = managerForWindow(_mapping.windowForPane(remotePaneId));
            return manager ? manager->tree().terminalHandle(_mapping.paneFor(remotePaneId)) : NullTerminalHandle;
        },
        this);

    connect(_session, &TmuxControlSession::ready, this, &TmuxSyncEngine::onReady);
    connect(_session, &TmuxControlSession::notificationsAvailable, this, &TmuxSyncEngine::drainNotifications);
    connect(_session, &TmuxControlSession::detached, this, &TmuxSyncEngine::onSessionDetached);
    connect(_session, &TmuxControlSession::parseErrorOccurred, this, [this](const QByteArray &line) {
        Q_EMIT parseErrorOccurred(QString::fromUtf8(line));
    });

    // A mirrored tab closed from our side no longer has a window to follow.
    connect(_workspace, &Workspace::tabClosed, this, [this](TabId tab) {
        const int windowId = _mapping.windowForTab(tab);
        if (windowId < 0) {
            return;
        }
        const QList<int> remotePanes = _mapping.panesInWindow(windowId);
        for (int remotePaneId : remotePanes) {
            if (_session) {
                _session->suppressOutput(remotePaneId);
            }
        }
        _mapping.unmapWindow(windowId);
        _snapshots.remove(windowId);
        _resize->removeWindow(windowId);
    });

    _workspace->attachSyncEngine(this);

    if (_session->state() == TmuxControlSession::State::Ready || _session->state() == TmuxControlSession::State::AwaitingReply) {
        onReady();
    }
}

TmuxSyncEngine::~TmuxSyncEngine()
{
    _resize->stop();
}

TmuxControlSession *TmuxSyncEngine::session() const
{
    return _session;
}

const TmuxMapping &TmuxSyncEngine::mapping() const
{
    return _mapping;
}

TmuxResizeCoordinator *TmuxSyncEngine::resizeCoordinator() const
{
    return _resize;
}

TmuxPaneStateRecovery *TmuxSyncEngine::recovery() const
{
    return _recovery;
}

std::optional<TmuxLayoutNode> TmuxSyncEngine::snapshot(int windowId) const
{
    auto it = _snapshots.constFind(windowId);
    if (it == _snapshots.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

bool TmuxSyncEngine::isRemotePane(PaneId pane) const
{
    return _mapping.remotePaneFor(pane) >= 0;
}

int TmuxSyncEngine::remotePaneFor(PaneId pane) const
{
    return _mapping.remotePaneFor(pane);
}

TabId TmuxSyncEngine::tabForWindow(int windowId) const
{
    return _mapping.tabForWindow(windowId);
}

PaneManager *TmuxSyncEngine::managerForWindow(int windowId) const
{
    const TabId tab = _mapping.tabForWindow(windowId);
    return tab == InvalidTabId ? nullptr : _workspace->paneManager(tab);
}

void TmuxSyncEngine::onReady()
{
    _resize->sendClientSize();
    listWindows();
}

void TmuxSyncEngine::listWindows(int windowId)
{
    TmuxCommand command(QStringLiteral("list-windows"));
    if (windowId >= 0) {
        command.windowTarget(windowId);
    } else {
        _initializing = true;
    }
    command.format(QStringLiteral("#{window_id} #{window_name} #{window_layout}"));

    _session->sendCommand(command, [this, windowId](const TmuxReply &reply) {
        if (!reply.ok()) {
            qCWarning(lcTmuxSync) << "list-windows failed, status" << reply.status << reply.response;
        } else {
            // "-t @N" names the session holding the window; keep only that window.
            const QStringList lines = reply.response.split(QLatin1Char('\n'), Qt::SkipEmptyParts);
            QString filtered;
            for (const QString &line : lines) {
                if (windowId < 0 || line.startsWith(QLatin1Char('@') + QString::number(windowId) + QLatin1Char(' '))) {
                    filtered += line + QLatin1Char('\n');
                }
            }
            handleListWindowsResponse(filtered);
        }

        if (windowId < 0) {
            _initializing = false;
            // Cancelled by a session that ended before answering: nothing was opened.
            if (_session && !_session->isTerminated()) {
                Q_EMIT initialWindowsOpened();
            }
        }
    });
}

void TmuxSyncEngine::handleListWindowsResponse(const QString &response)
{
    const QStringList lines = response.split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    for (const QString &line : lines) {
        // "@<id> <name> <layout>"; the name may contain spaces, the layout never does.
        const int firstSpace = line.indexOf(QLatin1Char(' '));
        const int lastSpace = line.lastIndexOf(QLatin1Char(' '));
        if (firstSpace < 0 || !line.startsWith(QLatin1Char('@'))) {
            qCDebug(lcTmuxSync) << "skipping list-windows line:" << line;
            continue;
        }

        bool ok = false;
        const int windowId = line.mid(1, firstSpace - 1).toInt(&ok);
        if (!ok) {
            continue;
        }
        const QString name = lastSpace > firstSpace ? line.mid(firstSpace + 1, lastSpace - firstSpace - 1) : QString();
        const bool known = _mapping.hasWindow(windowId);

        if (!applyLayout(windowId, line.mid(lastSpace + 1))) {
            continue;
        }
        _workspace->setTabTitle(_mapping.tabForWindow(windowId), name);

        if (!known && _settings.recoverPaneContent) {
            recoverPanes(windowId, _mapping.panesInWindow(windowId));
        }
    }
}

void TmuxSyncEngine::recoverPanes(int windowId, const QList<int> &remotePanes)
{
    QHash<int, QSize> sizes;
    collectLeafSizes(_snapshots.value(windowId), sizes);

    // Replies come back in order: the state is known before any history lands.
    _recovery->queryPaneStates(windowId);
    for (int remotePaneId : remotePanes) {
        const QSize size = sizes.value(remotePaneId);
        if (size.isValid()) {
            _recovery->setPaneDimensions(remotePaneId, size.width(), size.height());
        }
        _recovery->capturePaneHistory(remotePaneId);
    }
}

bool TmuxSyncEngine::applyLayout(int windowId, const QString &layout)
{
    const auto parsed = TmuxLayoutParser::parse(layout);
    if (!parsed) {
        qCWarning(lcTmuxSync) << "ignoring unparseable layout for window" << windowId << ":" << layout;
        Q_EMIT parseErrorOccurred(layout);
        return false;
    }

    const QList<int> remotePanes = TmuxLayoutParser::paneIds(*parsed);
    const QSet<int> incoming(remotePanes.begin(), remotePanes.end());
    if (incoming.size() != remotePanes.size()) {
        qCWarning(lcTmuxSync) << "layout for window" << windowId << "names a pane twice:" << layout;
        Q_EMIT parseErrorOccurred(layout);
        return false;
    }
    if (_settings.maxPanesPerTab > 0 && remotePanes.size() > _settings.maxPanesPerTab) {
        qCWarning(lcTmuxSync) << "window" << windowId << "has" << remotePanes.size() << "panes, limit is" << _settings.maxPanesPerTab;
        Q_EMIT parseErrorOccurred(layout);
        return false;
    }

    PaneManager *manager = managerForWindow(windowId);
    PaneTree working = manager ? manager->tree() : PaneTree();

    auto ownedRemote = [this, windowId](PaneId pane) {
        const int remotePaneId = _mapping.remotePaneFor(pane);
        return (remotePaneId >= 0 && _mapping.windowForPane(remotePaneId) == windowId) ? remotePaneId : -1;
    };

    // Panes that left the window are closed first so their siblings take
    // their place; what is left is then usually a geometry-only change.
    QList<int> removedRemote;
    const QList<PaneId> localPanes = working.panes();
    for (PaneId pane : localPanes) {
        const int remotePaneId = ownedRemote(pane);
        if (remotePaneId >= 0 && incoming.contains(remotePaneId)) {
            continue;
        }
        if (remotePaneId >= 0) {
            removedRemote.append(remotePaneId);
        }
        if (working.paneCount() > 1) {
            working.close(pane);
        }
    }

    QHash<PaneId, int> pendingRemote;
    QHash<PaneId, TerminalHandle> pendingHandles;

    auto resolve = [&](int remotePaneId) {
        TmuxLayoutManager::LeafBinding binding;
        if (_mapping.hasPane(remotePaneId) && _mapping.windowForPane(remotePaneId) == windowId && manager) {
            binding.pane = _mapping.paneFor(remotePaneId);
            binding.terminal = manager->tree().terminalHandle(binding.pane);
            return binding;
        }
        for (auto it = pendingRemote.constBegin(); it != pendingRemote.constEnd(); ++it) {
            if (it.value() == remotePaneId) {
                binding.pane = it.key();
                binding.terminal = pendingHandles.value(it.key());
                return binding;
            }
        }
        binding.pane = allocatePaneId();
        binding.terminal = _core ? _core->createTerminal(binding.pane) : NullTerminalHandle;
        pendingRemote.insert(binding.pane, remotePaneId);
        pendingHandles.insert(binding.pane, binding.terminal);
        return binding;
    };
    auto remoteOf = [&](PaneId pane) {
        auto it = pendingRemote.constFind(pane);
        return it != pendingRemote.constEnd() ? it.value() : ownedRemote(pane);
    };

    auto matchesLayout = [&](const PaneTree &tree) {
        QList<int> leaves;
        const QList<PaneId> panes = tree.panes();
        for (PaneId pane : panes) {
            leaves.append(remoteOf(pane));
        }
        std::sort(leaves.begin(), leaves.end());
        QList<int> expected = remotePanes;
        std::sort(expected.begin(), expected.end());
        return leaves == expected;
    };

    const TmuxLayoutNode binary = TmuxLayoutManager::binarize(*parsed);
    const int rebuilt = TmuxLayoutManager::reconcile(working, binary, resolve, remoteOf);

    if (!matchesLayout(working)) {
        qCDebug(lcTmuxSync) << "partial reconcile of window" << windowId << "did not converge, rebuilding it";
        working = PaneTree();
        TmuxLayoutManager::reconcile(working, binary, resolve, remoteOf);
    }
    if (!matchesLayout(working)) {
        qCWarning(lcTmuxSync) << "cannot apply layout for window" << windowId << ":" << layout;
        const QList<TerminalHandle> created = pendingHandles.values();
        for (TerminalHandle terminal : created) {
            if (_core && terminal != NullTerminalHandle) {
                _core->destroyTerminal(terminal);
            }
        }
        return false;
    }

    // Commit.
    if (!manager) {
        const TabId tab = _workspace->createTab(Authority::Remote);
        manager = _workspace->paneManager(tab);
        connect(manager, &PaneManager::remoteRequest, this, &TmuxSyncEngine::onRemoteRequest);
        _mapping.mapWindow(windowId, tab);
    }

    for (auto it = pendingRemote.constBegin(); it != pendingRemote.constEnd(); ++it) {
        if (working.contains(it.key())) {
            _mapping.mapPane(it.value(), it.key(), windowId);
            _session->resumeOutput(it.value());
        } else if (_core && pendingHandles.value(it.key()) != NullTerminalHandle) {
            // Allocated by the partial pass and dropped by the rebuild.
            _core->destroyTerminal(pendingHandles.value(it.key()));
        }
    }

    manager->applyRemoteTree(working);

    // %output for each pane wraps at the width tmux gave it.
    if (_core) {
        QHash<int, QSize> sizes;
        collectLeafSizes(*parsed, sizes);
        for (auto it = sizes.constBegin(); it != sizes.constEnd(); ++it) {
            const TerminalHandle terminal = manager->tree().terminalHandle(_mapping.paneFor(it.key()));
            if (terminal != NullTerminalHandle) {
                _core->resizeTerminal(terminal, it.value().width(), it.value().height());
            }
        }
    }

    for (int remotePaneId : removedRemote) {
        _mapping.unmapPane(remotePaneId);
        _session->suppressOutput(remotePaneId);
    }

    _resize->setWindowSize(windowId, parsed->width, parsed->height);
    _snapshots.insert(windowId, *parsed);

    qCDebug(lcTmuxSync) << "window" << windowId << "now" << working.describe(false) << "-" << pendingRemote.size() << "new," << removedRemote.size()
                        << "removed," << rebuilt << "subtree(s) rebuilt";
    Q_EMIT layoutApplied(windowId, manager->tabId());
    return true;
}

void TmuxSyncEngine::drainNotifications()
{
    if (_draining || !_session) {
        return;
    }

    _draining = true;
    for (int handled = 0; handled < DrainBatchSize && _session; ++handled) {
        auto notification = _session->takeNotification();
        if (!notification) {
            break;
        }
        handleNotification(*notification);
    }
    _draining = false;

    if (_session && _session->hasPendingNotifications()) {
        QMetaObject::invokeMethod(this, &TmuxSyncEngine::drainNotifications, Qt::QueuedConnection);
    }
}

void TmuxSyncEngine::handleNotification(const TmuxNotification &notification)
{
    std::visit(
        [this](const auto &n) {
            using T = std::decay_t<decltype(n)>;

            if constexpr (std::is_same_v<T, TmuxOutputNotification>) {
                const PaneId pane = _mapping.paneFor(n.paneId);
                const PaneManager *manager = managerForWindow(_mapping.windowForPane(n.paneId));
                if (pane == InvalidPaneId || !manager || !_core) {
                    return;
                }
                _core->injectOutput(manager->tree().terminalHandle(pane), n.data);
            } else if constexpr (std::is_same_v<T, TmuxLayoutChangedNotification>) {
                // The zoomed layout only shows one pane; the tree follows the full one.
                applyLayout(n.windowId, n.layout);
            } else if constexpr (std::is_same_v<T, TmuxWindowAddedNotification>) {
                if (!n.unlinked && !_initializing && !_mapping.hasWindow(n.windowId)) {
                    listWindows(n.windowId);
                }
            } else if constexpr (std::is_same_v<T, TmuxWindowClosedNotification>) {
                closeWindow(n.windowId);
            } else if constexpr (std::is_same_v<T, TmuxWindowRenamedNotification>) {
                const TabId tab = _mapping.tabForWindow(n.windowId);
                if (tab != InvalidTabId) {
                    _workspace->setTabTitle(tab, n.name);
                }
            } else if constexpr (std::is_same_v<T, TmuxWindowPaneChangedNotification>) {
                PaneManager *manager = managerForWindow(n.windowId);
                if (manager && _mapping.windowForPane(n.paneId) == n.windowId) {
                    manager->applyRemoteFocus(_mapping.paneFor(n.paneId));
                }
            } else if constexpr (std::is_same_v<T, TmuxSessionChangedNotification>) {
                if (_sessionId >= 0 && n.sessionId != _sessionId) {
                    qCInfo(lcTmuxSync) << "client switched to session" << n.name;
                    resetSession();
                    listWindows();
                }
                _sessionId = n.sessionId;
                _workspace->setWindowTitle(n.name);
            } else if constexpr (std::is_same_v<T, TmuxSessionRenamedNotification>) {
                _workspace->setWindowTitle(n.name);
            } else if constexpr (std::is_same_v<T, TmuxSessionWindowChangedNotification>) {
                if (n.sessionId == _sessionId) {
                    const TabId tab = _mapping.tabForWindow(n.windowId);
                    if (tab != InvalidTabId) {
                        _workspace->setActiveTab(tab);
                    }
                }
            } else if constexpr (std::is_same_v<T, TmuxExitNotification>) {
                // The session tears itself down and reports through detached().
            } else {
                qCDebug(lcTmuxSync) << "notification without effect on the workspace";
            }
        },
        notification);
}

void TmuxSyncEngine::closeWindow(int windowId)
{
    const TabId tab = _mapping.tabForWindow(windowId);
    if (tab == InvalidTabId) {
        return;
    }

    const QList<int> remotePanes = _mapping.panesInWindow(windowId);
    for (int remotePaneId : remotePanes) {
        _session->suppressOutput(remotePaneId);
    }
    _mapping.unmapWindow(windowId);
    _snapshots.remove(windowId);
    _resize->removeWindow(windowId);

    qCDebug(lcTmuxSync) << "window" << windowId << "closed, closing tab" << tab;
    _workspace->closeTab(tab);
}

void TmuxSyncEngine::resetSession()
{
    const QList<int> windows = _mapping.windows();
    for (int windowId : windows) {
        closeWindow(windowId);
    }
    _recovery->clear();
}

void TmuxSyncEngine::onSessionDetached(const QString &reason)
{
    // The panes stay; they just stop following tmux.
    const QList<int> windows = _mapping.windows();
    for (int windowId : windows) {
        PaneManager *manager = managerForWindow(windowId);
        if (manager) {
            disconnect(manager, nullptr, this, nullptr);
            manager->setAuthority(Authority::Local);
        }
    }

    _mapping.clear();
    _snapshots.clear();
    _resize->clear();
    _recovery->clear();
    _sessionId = -1;
    _initializing = false;

    qCInfo(lcTmuxSync) << "detached from tmux:" << reason << "-" << windows.size() << "tab(s) kept as local tabs";
    Q_EMIT detached(reason);
}

void TmuxSyncEngine::onRemoteRequest(const PaneRequest &request)
{
    const int remotePaneId = _mapping.remotePaneFor(request.pane);
    if (remotePaneId < 0 || !_session || _session->isTerminated()) {
        qCWarning(lcTmuxSync) << "dropping request for pane" << request.pane << "without a live tmux pane";
        return;
    }

    std::optional<TmuxCommand> command;
    switch (request.kind) {
    case PaneRequest::Split:
        command = TmuxCommand(QStringLiteral("split-window"))
                      .flag(request.direction == SplitDirection::Horizontal ? QStringLiteral("-h") : QStringLiteral("-v"))
                      .paneTarget(remotePaneId);
        break;
    case PaneRequest::Close:
        command = TmuxCommand(QStringLiteral("kill-pane")).paneTarget(remotePaneId);
        break;
    case PaneRequest::Resize: {
        const QSize size = _resize->windowSize(_mapping.windowForPane(remotePaneId));
        const bool horizontal = axisOf(request.resizeDirection) == SplitDirection::Horizontal;
        const int extent = horizontal ? size.width() : size.height();
        const int cells = qMax(1, qRound(qAbs(request.delta) * extent));

        QString flag;
        switch (request.resizeDirection) {
        case NavigationDirection::Left:
            flag = QStringLiteral("-L");
            break;
        case NavigationDirection::Right:
            flag = QStringLiteral("-R");
            break;
        case NavigationDirection::Up:
            flag = QStringLiteral("-U");
            break;
        case NavigationDirection::Down:
            flag = QStringLiteral("-D");
            break;
        }
        command = TmuxCommand(QStringLiteral("resize-pane")).paneTarget(remotePaneId).flag(flag).arg(QString::number(cells));
        break;
    }
    case PaneRequest::Focus:
        command = TmuxCommand(QStringLiteral("select-pane")).paneTarget(remotePaneId);
        break;
    }

    if (command) {
        executeCommand(*command);
    }
}

void TmuxSyncEngine::executeCommand(const TmuxCommand &command)
{
    if (!_session) {
        return;
    }
    if (command.verb() == QLatin1String("detach-client")) {
        detach();
        return;
    }

    const QString text = command.build();
    _session->sendCommand(command, [text](const TmuxReply &reply) {
        if (!reply.ok() && reply.status != TmuxReply::Cancelled) {
            qCWarning(lcTmuxSync) << text << "failed:" << reply.status << reply.response;
        }
    });
}

void TmuxSyncEngine::sendKeys(PaneId pane, const QByteArray &data)
{
    const int remotePaneId = _mapping.remotePaneFor(pane);
    if (remotePaneId < 0 || !_session) {
        return;
    }
    _session->sendKeys(remotePaneId, data);
}

void TmuxSyncEngine::newWindow()
{
    executeCommand(TmuxCommand(QStringLiteral("new-window")));
}

void TmuxSyncEngine::listSessions()
{
    if (!_session) {
        return;
    }
    // The name goes last: it is the only field that may contain spaces.
    const TmuxCommand command =
        TmuxCommand(QStringLiteral("list-sessions")).format(QStringLiteral("#{session_id} #{session_attached} #{session_windows} #{session_name}"));
    _session->sendCommand(command, [this](const TmuxReply &reply) {
        if (!reply.ok()) {
            qCWarning(lcTmuxSync) << "list-sessions failed, status" << reply.status << reply.response;
            Q_EMIT sessionsListed({});
            return;
        }
        Q_EMIT sessionsListed(parseSessionList(reply.response));
    });
}

QList<TmuxSessionInfo> TmuxSyncEngine::parseSessionList(const QString &response)
{
    QList<TmuxSessionInfo> sessions;
    const QStringList lines = response.split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    for (const QString &line : lines) {
        const QStringList fields = line.split(QLatin1Char(' '));
        if (fields.size() < 4 || !fields[0].startsWith(QLatin1Char('$'))) {
            qCDebug(lcTmuxSync) << "skipping list-sessions line:" << line;
            continue;
        }
        bool idOk = false;
        bool windowsOk = false;
        TmuxSessionInfo info;
        info.sessionId = fields[0].mid(1).toInt(&idOk);
        info.attached = fields[1].toInt() > 0;
        info.windows = fields[2].toInt(&windowsOk);
        info.name = fields.mid(3).join(QLatin1Char(' '));
        if (!idOk || !windowsOk || info.name.isEmpty()) {
            qCDebug(lcTmuxSync) << "skipping list-sessions line:" << line;
            continue;
        }
        sessions.append(info);
    }
    return sessions;
}

bool TmuxSyncEngine::pushLayout(TabId tab)
{
    const int windowId = _mapping.windowForTab(tab);
    const PaneManager *manager = _workspace->paneManager(tab);
    const QSize size = _resize->windowSize(windowId);
    if (windowId < 0 || !manager || !size.isValid()) {
        return false;
    }

    const QString layout = TmuxLayoutManager::serializeTree(manager->tree(), size.width(), size.height(), [this](PaneId pane) {
        return _mapping.remotePaneFor(pane);
    });
    executeCommand(TmuxCommand(QStringLiteral("select-layout")).windowTarget(windowId).quotedArg(layout));
    return true;
}

void TmuxSyncEngine::detach()
{
    if (_session) {
        _session->detach();
    }
}

void TmuxSyncEngine::setClientSize(int columns, int rows)
{
    _resize->setClientSize(columns, rows);
}

} // namespace Splitmux

#include "moc_TmuxSyncEngine.cpp"
