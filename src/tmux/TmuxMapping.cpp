/*
    SPDX-FileCopyrightText: 2025 Splitmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TmuxMapping.h"

#include <algorithm>

namespace Splitmux
{

void TmuxMapping::mapWindow(int windowId, TabId tab)
{
    _windowToTab.insert(windowId, tab);
    _tabToWindow.insert(tab, windowId);
}

QList<PaneId> TmuxMapping::unmapWindow(int windowId)
{
    QList<PaneId> released;
    const QList<int> panes = panesInWindow(windowId);
    for (int remotePaneId : panes) {
        released.append(paneFor(remotePaneId));
        unmapPane(remotePaneId);
    }

    auto it = _windowToTab.find(windowId);
    if (it != _windowToTab.end()) {
        _tabToWindow.remove(it.value());
        _windowToTab.erase(it);
    }
    return released;
}

TabId TmuxMapping::tabForWindow(int windowId) const
{
    return _windowToTab.value(windowId, InvalidTabId);
}

int TmuxMapping::windowForTab(TabId tab) const
{
    return _tabToWindow.value(tab, -1);
}

bool TmuxMapping::hasWindow(int windowId) const
{
    return _windowToTab.contains(windowId);
}

QList<int> TmuxMapping::windows() const
{
    QList<int> ids = _windowToTab.keys();
    std::sort(ids.begin(), ids.end());
    return ids;
}

void TmuxMapping::mapPane(int remotePaneId, PaneId pane, int windowId)
{
    auto existing = _remoteToPane.constFind(remotePaneId);
    if (existing != _remoteToPane.constEnd() && existing->pane != pane) {
        _paneToRemote.remove(existing->pane);
    }
    PaneEntry entry;
    entry.pane = pane;
    entry.windowId = windowId;
    _remoteToPane.insert(remotePaneId, entry);
    _paneToRemote.insert(pane, remotePaneId);
}

void TmuxMapping::unmapPane(int remotePaneId)
{
    auto it = _remoteToPane.find(remotePaneId);
    if (it == _remoteToPane.end()) {
        return;
    }
    _paneToRemote.remove(it->pane);
    _remoteToPane.erase(it);
}

PaneId TmuxMapping::paneFor(int remotePaneId) const
{
    return _remoteToPane.value(remotePaneId).pane;
}

int TmuxMapping::remotePaneFor(PaneId pane) const
{
    return _paneToRemote.value(pane, -1);
}

int TmuxMapping::windowForPane(int remotePaneId) const
{
    return _remoteToPane.value(remotePaneId).windowId;
}

bool TmuxMapping::hasPane(int remotePaneId) const
{
    return _remoteToPane.contains(remotePaneId);
}

QList<int> TmuxMapping::panesInWindow(int windowId) const
{
    QList<int> panes;
    for (auto it = _remoteToPane.constBegin(); it != _remoteToPane.constEnd(); ++it) {
        if (it->windowId == windowId) {
            panes.append(it.key());
        }
    }
    std::sort(panes.begin(), panes.end());
    return panes;
}

int TmuxMapping::paneCount() const
{
    return _remoteToPane.size();
}

void TmuxMapping::clear()
{
    _windowToTab.clear();
    _tabToWindow.clear();
    _remoteToPane.clear();
    _paneToRemote.clear();
}

} // namespace Splitmux
