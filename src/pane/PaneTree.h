/*
    SPDX-FileCopyrightText: 2025 Splitmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef PANETREE_H
#define PANETREE_H

#include <QHash>
#include <QList>
#include <QPointF>
#include <QRectF>
#include <QString>
#include <QVector>

#include <optional>

#include "PaneTypes.h"
#include "splitmuxprivate_export.h"

namespace Splitmux
{

using NodeRef = int;
const NodeRef NoNode = -1;

// Hands out the next process-wide pane id.
SPLITMUXPRIVATE_EXPORT PaneId allocatePaneId();

/**
 * Binary layout tree of one tab.
 *
 * Nodes live in an arena and are addressed by index. A split owns its two
 * children exclusively; there are no parent links, every walk starts at the
 * root. The tree is a value type, so a copy can be mutated and committed
 * or thrown away as a whole.
 */
class SPLITMUXPRIVATE_EXPORT PaneTree
{
public:
    struct Node {
        bool leaf = true;
        PaneId paneId = InvalidPaneId; // leaf only
        TerminalHandle terminal = NullTerminalHandle; // leaf only
        SplitDirection direction = SplitDirection::Horizontal; // split only
        qreal ratio = 0.5; // share of the first child, split only
        NodeRef first = NoNode;
        NodeRef second = NoNode;
        bool used = false;
    };

    struct CloseResult {
        bool tabShouldClose = false;
        PaneId focusSuccessor = InvalidPaneId;
    };

    PaneTree();
    explicit PaneTree(PaneId rootPane, TerminalHandle terminal = NullTerminalHandle);

    PaneResult<PaneId> split(PaneId target, SplitDirection direction, qreal ratio = 0.5);
    PaneResult<CloseResult> close(PaneId target);
    PaneError resize(NodeRef split, qreal ratio);

    QHash<PaneId, QRectF> computeBounds(const QRectF &rootBounds) const;
    std::optional<PaneId> findAdjacent(PaneId from, NavigationDirection direction, const QRectF &rootBounds = QRectF(0, 0, 1, 1)) const;
    PaneId paneAt(const QPointF &point, const QRectF &rootBounds) const;

    // Nearest ancestor split of the given axis, or NoNode.
    NodeRef enclosingSplit(PaneId pane, SplitDirection direction) const;
    // The ancestor split directly above the pane, or NoNode for a lone root.
    NodeRef parentSplit(PaneId pane) const;

    QList<PaneId> panes() const;
    int paneCount() const;
    bool contains(PaneId pane) const;
    bool isEmpty() const;
    PaneId firstPane() const;

    TerminalHandle terminalHandle(PaneId pane) const;
    bool setTerminalHandle(PaneId pane, TerminalHandle terminal);

    void setRatioBounds(qreal minRatio, qreal maxRatio);
    qreal minRatio() const;
    qreal maxRatio() const;
    // 0 means unlimited.
    void setMaxPanes(int maxPanes);
    int maxPanes() const;
    void setLastPaneProtected(bool isProtected);
    bool lastPaneProtected() const;

    // Arena access, used when a tree is assembled from an external layout.
    NodeRef root() const;
    const Node &node(NodeRef ref) const;
    bool isValid(NodeRef ref) const;
    NodeRef leafFor(PaneId pane) const;
    NodeRef createLeaf(PaneId pane, TerminalHandle terminal = NullTerminalHandle);
    NodeRef createSplit(SplitDirection direction, qreal ratio, NodeRef first, NodeRef second);
    // Puts a detached subtree where `target` was attached and frees `target`.
    void replaceSubtree(NodeRef target, NodeRef replacement);
    // Stores the ratio as given; remote layouts are trusted.
    void setRatio(NodeRef split, qreal ratio);

    // Compact shape dump, e.g. "H0.50(1,V0.30(2,3))"; leaves print as "*"
    // unless withIds is set.
    QString describe(bool withIds = false) const;

private:
    NodeRef allocNode();
    void freeSubtree(NodeRef ref);
    bool pathTo(PaneId pane, QVector<NodeRef> &path) const;
    bool pathTo(NodeRef from, PaneId pane, QVector<NodeRef> &path) const;
    NodeRef findParent(NodeRef from, NodeRef child) const;
    void collectPanes(NodeRef ref, QList<PaneId> &out) const;
    void boundsOf(NodeRef ref, const QRectF &rect, QHash<PaneId, QRectF> &out) const;
    void describeNode(NodeRef ref, bool withIds, QString &out) const;
    qreal clampRatio(qreal ratio) const;

    static void splitRect(const QRectF &rect, SplitDirection direction, qreal ratio, QRectF &first, QRectF &second);

    QVector<Node> _nodes;
    QVector<NodeRef> _freeList;
    NodeRef _root = NoNode;

    qreal _minRatio = 0.05;
    qreal _maxRatio = 0.95;
    int _maxPanes = 0;
    bool _lastPaneProtected = false;
};

} // namespace Splitmux

#endif // PANETREE_H
