/*
    SPDX-FileCopyrightText: 2025 Splitmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "PaneManager.h"

#include "session/TerminalCore.h"

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(lcPaneManager, "splitmux.pane")

namespace Splitmux
{

PaneManager::PaneManager(TabId tab, Authority authority, TerminalCore *core, const MultiplexerSettings &settings, QObject *parent)
    : QObject(parent)
    , _tab(tab)
    , _core(core)
    , _settings(settings)
    , _authority(authority)
{
    applyTreeSettings(_tree);

    if (_authority == Authority::Local) {
        const PaneId pane = allocatePaneId();
        const TerminalHandle terminal = _core ? _core->createTerminal(pane) : NullTerminalHandle;
        _tree = PaneTree(pane, terminal);
        applyTreeSettings(_tree);
        _focus.focused = pane;
    }

    _focus.broadcast = _settings.broadcastInputDefault;
    if (_focus.broadcast) {
        const auto panes = _tree.panes();
        _focus.broadcastPanes = QSet<PaneId>(panes.begin(), panes.end());
    }
}

PaneManager::~PaneManager()
{
    if (!_core) {
        return;
    }
    const auto panes = _tree.panes();
    for (PaneId pane : panes) {
        const TerminalHandle terminal = _tree.terminalHandle(pane);
        if (terminal != NullTerminalHandle) {
            _core->destroyTerminal(terminal);
        }
    }
}

void PaneManager::applyTreeSettings(PaneTree &tree) const
{
    tree.setRatioBounds(_settings.minRatio, _settings.maxRatio);
    tree.setMaxPanes(_settings.maxPanesPerTab);
    tree.setLastPaneProtected(_settings.lastPanePolicy == MultiplexerSettings::LastPanePolicy::Protect);
}

TabId PaneManager::tabId() const
{
    return _tab;
}

const PaneTree &PaneManager::tree() const
{
    return _tree;
}

const FocusState &PaneManager::focusState() const
{
    return _focus;
}

PaneId PaneManager::focusedPane() const
{
    return _focus.focused;
}

Authority PaneManager::authority() const
{
    return _authority;
}

void PaneManager::setAuthority(Authority authority)
{
    if (_authority == authority) {
        return;
    }
    qCDebug(lcPaneManager) << "tab" << _tab << "is now" << (authority == Authority::Remote ? "remote" : "local");
    _authority = authority;
}

PaneId PaneManager::resolveTarget(PaneId target) const
{
    return target == InvalidPaneId ? _focus.focused : target;
}

void PaneManager::setFocus(PaneId pane)
{
    if (_focus.focused == pane) {
        return;
    }
    _focus.focused = pane;
    Q_EMIT focusChanged(_tab, pane);
}

PaneResult<PaneId> PaneManager::splitHorizontal(PaneId target)
{
    return split(target, SplitDirection::Horizontal);
}

PaneResult<PaneId> PaneManager::splitVertical(PaneId target)
{
    return split(target, SplitDirection::Vertical);
}

PaneResult<PaneId> PaneManager::split(PaneId target, SplitDirection direction, qreal ratio)
{
    PaneResult<PaneId> result;
    target = resolveTarget(target);
    if (!_tree.contains(target)) {
        result.error = PaneError::NotFound;
        return result;
    }

    if (_authority == Authority::Remote) {
        PaneRequest request;
        request.kind = PaneRequest::Split;
        request.tab = _tab;
        request.pane = target;
        request.direction = direction;
        Q_EMIT remoteRequest(request);
        result.error = PaneError::RemoteManaged;
        return result;
    }

    result = _tree.split(target, direction, ratio);
    if (!result.ok()) {
        qCDebug(lcPaneManager) << "split of" << target << "failed:" << paneErrorName(result.error);
        return result;
    }

    if (_core) {
        _tree.setTerminalHandle(result.value, _core->createTerminal(result.value));
    }
    if (_focus.broadcast) {
        _focus.broadcastPanes.insert(result.value);
    }

    Q_EMIT layoutChanged(_tab);
    return result;
}

PaneError PaneManager::closeFocused()
{
    return closePane(_focus.focused);
}

PaneError PaneManager::closePane(PaneId pane)
{
    if (!_tree.contains(pane)) {
        return PaneError::NotFound;
    }

    if (_authority == Authority::Remote) {
        PaneRequest request;
        request.kind = PaneRequest::Close;
        request.tab = _tab;
        request.pane = pane;
        Q_EMIT remoteRequest(request);
        return PaneError::RemoteManaged;
    }

    const TerminalHandle terminal = _tree.terminalHandle(pane);
    const auto result = _tree.close(pane);
    if (!result.ok()) {
        return result.error;
    }

    if (_core && terminal != NullTerminalHandle) {
        _core->destroyTerminal(terminal);
    }
    _focus.broadcastPanes.remove(pane);

    if (result.value.tabShouldClose) {
        _focus.focused = InvalidPaneId;
        Q_EMIT lastPaneClosed(_tab);
        return PaneError::None;
    }

    if (_focus.focused == pane) {
        setFocus(result.value.focusSuccessor);
    }
    Q_EMIT layoutChanged(_tab);
    return PaneError::None;
}

PaneResult<PaneId> PaneManager::navigate(NavigationDirection direction)
{
    PaneResult<PaneId> result;
    const auto target = _tree.findAdjacent(_focus.focused, direction, _contentBounds);
    if (!target.has_value()) {
        result.error = PaneError::NotFound;
        return result;
    }
    result.error = focusPane(*target);
    result.value = *target;
    return result;
}

PaneError PaneManager::resizeFocused(NavigationDirection direction, qreal delta)
{
    const NodeRef splitRef = _tree.enclosingSplit(_focus.focused, axisOf(direction));
    if (splitRef == NoNode) {
        return PaneError::NotFound;
    }

    if (_authority == Authority::Remote) {
        PaneRequest request;
        request.kind = PaneRequest::Resize;
        request.tab = _tab;
        request.pane = _focus.focused;
        request.resizeDirection = direction;
        request.delta = delta;
        Q_EMIT remoteRequest(request);
        return PaneError::RemoteManaged;
    }

    // The divider moves in the requested direction.
    const bool grow = (direction == NavigationDirection::Right || direction == NavigationDirection::Down);
    const qreal current = _tree.node(splitRef).ratio;
    const PaneError error = _tree.resize(splitRef, grow ? current + delta : current - delta);
    if (error == PaneError::None) {
        Q_EMIT layoutChanged(_tab);
    }
    return error;
}

bool PaneManager::toggleBroadcast()
{
    _focus.broadcast = !_focus.broadcast;
    if (_focus.broadcast) {
        const auto panes = _tree.panes();
        _focus.broadcastPanes = QSet<PaneId>(panes.begin(), panes.end());
    } else {
        _focus.broadcastPanes.clear();
    }
    Q_EMIT broadcastChanged(_tab, _focus.broadcast);
    return _focus.broadcast;
}

PaneError PaneManager::focusPane(PaneId pane)
{
    if (!_tree.contains(pane)) {
        return PaneError::NotFound;
    }
    if (_focus.focused == pane) {
        return PaneError::None;
    }
    setFocus(pane);

    if (_authority == Authority::Remote) {
        PaneRequest request;
        request.kind = PaneRequest::Focus;
        request.tab = _tab;
        request.pane = pane;
        Q_EMIT remoteRequest(request);
    }
    return PaneError::None;
}

PaneError PaneManager::applyRemoteFocus(PaneId pane)
{
    if (!_tree.contains(pane)) {
        return PaneError::NotFound;
    }
    setFocus(pane);
    return PaneError::None;
}

PaneResult<PaneId> PaneManager::focusPaneAt(const QPointF &point)
{
    PaneResult<PaneId> result;
    result.value = paneAt(point);
    result.error = focusPane(result.value);
    return result;
}

PaneId PaneManager::paneAt(const QPointF &point) const
{
    return _tree.paneAt(point, _contentBounds);
}

void PaneManager::setContentBounds(const QRectF &bounds)
{
    if (_contentBounds == bounds) {
        return;
    }
    _contentBounds = bounds;
    Q_EMIT layoutChanged(_tab);
}

QRectF PaneManager::contentBounds() const
{
    return _contentBounds;
}

QHash<PaneId, QRectF> PaneManager::paneBounds() const
{
    return _tree.computeBounds(_contentBounds);
}

void PaneManager::repairFocus(PaneId successor)
{
    if (successor != InvalidPaneId && _tree.contains(successor)) {
        setFocus(successor);
    } else if (!_tree.contains(_focus.focused)) {
        setFocus(_tree.firstPane());
    }
}

void PaneManager::applyRemoteTree(const PaneTree &tree, PaneId focus)
{
    const auto oldPanes = _tree.panes();
    const PaneTree previous = _tree;

    _tree = tree;
    applyTreeSettings(_tree);

    // Handles of panes that left the tree are released here.
    if (_core) {
        for (PaneId pane : oldPanes) {
            const TerminalHandle terminal = previous.terminalHandle(pane);
            if (terminal != NullTerminalHandle && _tree.terminalHandle(pane) != terminal) {
                _core->destroyTerminal(terminal);
            }
        }
    }

    if (_focus.broadcast) {
        const auto panes = _tree.panes();
        _focus.broadcastPanes = QSet<PaneId>(panes.begin(), panes.end());
    }

    repairFocus(focus);
    Q_EMIT layoutChanged(_tab);
}

} // namespace Splitmux

#include "moc_PaneManager.cpp"
