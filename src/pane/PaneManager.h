/*
    SPDX-FileCopyrightText: 2025 Splitmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef PANEMANAGER_H
#define PANEMANAGER_H

#include <QObject>
#include <QPointF>
#include <QRectF>
#include <QSet>

#include "PaneTree.h"
#include "settings/MultiplexerSettings.h"
#include "splitmuxprivate_export.h"

namespace Splitmux
{

class TerminalCore;

struct FocusState {
    PaneId focused = InvalidPaneId;
    bool broadcast = false;
    QSet<PaneId> broadcastPanes;
};

/**
 * Owns the layout tree and focus of one tab.
 *
 * A Local tab is mutated directly. A Remote tab is only changed by the
 * sync engine through applyRemoteTree(); structural calls made on it are
 * answered with RemoteManaged and re-issued as remoteRequest().
 */
class SPLITMUXPRIVATE_EXPORT PaneManager : public QObject
{
    Q_OBJECT
public:
    // A Local tab starts with one pane; a Remote tab starts empty and is
    // filled by the first applyRemoteTree().
    PaneManager(TabId tab, Authority authority, TerminalCore *core, const MultiplexerSettings &settings, QObject *parent = nullptr);
    ~PaneManager() override;

    TabId tabId() const;
    const PaneTree &tree() const;
    const FocusState &focusState() const;
    PaneId focusedPane() const;

    Authority authority() const;
    void setAuthority(Authority authority);

    PaneResult<PaneId> splitHorizontal(PaneId target = InvalidPaneId);
    PaneResult<PaneId> splitVertical(PaneId target = InvalidPaneId);
    PaneResult<PaneId> split(PaneId target, SplitDirection direction, qreal ratio = 0.5);

    PaneError closeFocused();
    PaneError closePane(PaneId pane);

    PaneResult<PaneId> navigate(NavigationDirection direction);
    PaneError resizeFocused(NavigationDirection direction, qreal delta);
    bool toggleBroadcast();

    PaneError focusPane(PaneId pane);
    PaneResult<PaneId> focusPaneAt(const QPointF &point);
    PaneId paneAt(const QPointF &point) const;

    void setContentBounds(const QRectF &bounds);
    QRectF contentBounds() const;
    QHash<PaneId, QRectF> paneBounds() const;

    // Sync engine entry point; the tree's handles must already be created.
    void applyRemoteTree(const PaneTree &tree, PaneId focus = InvalidPaneId);
    // Focus change reported by the remote side; not forwarded back.
    PaneError applyRemoteFocus(PaneId pane);

Q_SIGNALS:
    void layoutChanged(Splitmux::TabId tab);
    void focusChanged(Splitmux::TabId tab, Splitmux::PaneId pane);
    void broadcastChanged(Splitmux::TabId tab, bool enabled);
    void lastPaneClosed(Splitmux::TabId tab);
    void remoteRequest(const Splitmux::PaneRequest &request);

private:
    PaneId resolveTarget(PaneId target) const;
    void setFocus(PaneId pane);
    void repairFocus(PaneId successor);
    void applyTreeSettings(PaneTree &tree) const;

    TabId _tab;
    TerminalCore *_core;
    MultiplexerSettings _settings;
    PaneTree _tree;
    FocusState _focus;
    Authority _authority = Authority::Local;
    QRectF _contentBounds = QRectF(0, 0, 1, 1);
};

} // namespace Splitmux

#endif // PANEMANAGER_H
