/*
    SPDX-FileCopyrightText: 2025 Splitmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TMUXMAPPING_H
#define TMUXMAPPING_H

#include <QHash>
#include <QList>

#include "pane/PaneTypes.h"
#include "splitmuxprivate_export.h"

namespace Splitmux
{

/**
 * Remote window <-> tab and remote pane <-> local pane tables of one
 * attached session. The only place remote ids are translated.
 */
class SPLITMUXPRIVATE_EXPORT TmuxMapping
{
public:
    void mapWindow(int windowId, TabId tab);
    // Drops the window and every pane mapped in it.
    QList<PaneId> unmapWindow(int windowId);
    TabId tabForWindow(int windowId) const;
    int windowForTab(TabId tab) const;
    bool hasWindow(int windowId) const;
    QList<int> windows() const;

    void mapPane(int remotePaneId, PaneId pane, int windowId);
    void unmapPane(int remotePaneId);
    PaneId paneFor(int remotePaneId) const;
    int remotePaneFor(PaneId pane) const;
    int windowForPane(int remotePaneId) const;
    bool hasPane(int remotePaneId) const;
    QList<int> panesInWindow(int windowId) const;

    int paneCount() const;
    void clear();

private:
    struct PaneEntry {
        PaneId pane = InvalidPaneId;
        int windowId = -1;
    };

    QHash<int, TabId> _windowToTab;
    QHash<TabId, int> _tabToWindow;
    QHash<int, PaneEntry> _remoteToPane;
    QHash<PaneId, int> _paneToRemote;
};

} // namespace Splitmux

#endif // TMUXMAPPING_H
