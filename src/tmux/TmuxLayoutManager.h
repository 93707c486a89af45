/*
    SPDX-FileCopyrightText: 2025 Splitmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TMUXLAYOUTMANAGER_H
#define TMUXLAYOUTMANAGER_H

#include <functional>

#include "TmuxLayoutParser.h"
#include "pane/PaneTree.h"
#include "splitmuxprivate_export.h"

namespace Splitmux
{

/**
 * Converts between tmux layouts and PaneTree.
 *
 * tmux containers hold two or more cells; a PaneTree split holds exactly
 * two. binarize() folds every container to the right:
 * {a,b,c} becomes {a,{b,c}} with the synthetic container's extent set so
 * that buildLayoutNode() gives back the same cell sizes.
 */
class SPLITMUXPRIVATE_EXPORT TmuxLayoutManager
{
public:
    struct LeafBinding {
        PaneId pane = InvalidPaneId;
        TerminalHandle terminal = NullTerminalHandle;
    };
    // Remote pane id -> local leaf, allocating one for unknown panes.
    using PaneResolver = std::function<LeafBinding(int remotePaneId)>;
    // Local pane -> remote pane id, -1 if unmapped.
    using RemoteResolver = std::function<int(PaneId pane)>;

    static TmuxLayoutNode binarize(const TmuxLayoutNode &node);
    // Share of the first child of a binary container.
    static qreal ratioOf(const TmuxLayoutNode &node);

    // Builds a detached subtree for a binarized layout node.
    static NodeRef buildSubtree(PaneTree &tree, const TmuxLayoutNode &node, const PaneResolver &resolve);

    // Brings `tree` in line with a binarized layout. Subtrees whose shape and
    // panes already match only get their ratios updated; the rest is rebuilt,
    // reusing the leaves of known panes. Returns the number of rebuilt subtrees.
    static int reconcile(PaneTree &tree, const TmuxLayoutNode &layout, const PaneResolver &resolve, const RemoteResolver &remoteOf);

    static TmuxLayoutNode buildLayoutNode(const PaneTree &tree, int columns, int rows, const RemoteResolver &remoteOf);
    // buildLayoutNode() serialized with checksum, ready for select-layout.
    static QString serializeTree(const PaneTree &tree, int columns, int rows, const RemoteResolver &remoteOf);

private:
    static int reconcileNode(PaneTree &tree, NodeRef ref, const TmuxLayoutNode &node, const PaneResolver &resolve, const RemoteResolver &remoteOf);
    static TmuxLayoutNode buildLayoutNode(const PaneTree &tree, NodeRef ref, int width, int height, int x, int y, const RemoteResolver &remoteOf);
};

} // namespace Splitmux

#endif // TMUXLAYOUTMANAGER_H
