/*
    SPDX-FileCopyrightText: 2025 Splitmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TmuxLayoutManager.h"

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(lcTmuxLayout, "splitmux.tmux.layout")

namespace Splitmux
{

static SplitDirection directionOf(TmuxLayoutNodeType type)
{
    return type == TmuxLayoutNodeType::HSplit ? SplitDirection::Horizontal : SplitDirection::Vertical;
}

static int extentAlong(const TmuxLayoutNode &node, TmuxLayoutNodeType axis)
{
    return axis == TmuxLayoutNodeType::HSplit ? node.width : node.height;
}

TmuxLayoutNode TmuxLayoutManager::binarize(const TmuxLayoutNode &node)
{
    if (node.type == TmuxLayoutNodeType::Leaf) {
        return node;
    }

    TmuxLayoutNode result = node;
    result.children.clear();
    result.children.append(binarize(node.children.first()));

    if (node.children.size() == 2) {
        result.children.append(binarize(node.children.at(1)));
        return result;
    }

    // The remaining cells plus the separators between them.
    TmuxLayoutNode rest;
    rest.type = node.type;
    rest.xOffset = node.children.at(1).xOffset;
    rest.yOffset = node.children.at(1).yOffset;
    rest.children = node.children.mid(1);
    const int firstExtent = extentAlong(node.children.first(), node.type);
    if (node.type == TmuxLayoutNodeType::HSplit) {
        rest.width = node.width - firstExtent - 1;
        rest.height = node.height;
    } else {
        rest.width = node.width;
        rest.height = node.height - firstExtent - 1;
    }
    result.children.append(binarize(rest));
    return result;
}

qreal TmuxLayoutManager::ratioOf(const TmuxLayoutNode &node)
{
    if (node.type == TmuxLayoutNodeType::Leaf || node.children.isEmpty()) {
        return 0.5;
    }
    // One cell of the extent is the separator.
    const int available = extentAlong(node, node.type) - 1;
    const int first = extentAlong(node.children.first(), node.type);
    if (available <= 0 || first <= 0 || first >= available) {
        return 0.5;
    }
    return qreal(first) / available;
}

NodeRef TmuxLayoutManager::buildSubtree(PaneTree &tree, const TmuxLayoutNode &node, const PaneResolver &resolve)
{
    if (node.type == TmuxLayoutNodeType::Leaf) {
        const LeafBinding binding = resolve(node.paneId);
        return tree.createLeaf(binding.pane, binding.terminal);
    }

    const NodeRef first = buildSubtree(tree, node.children.at(0), resolve);
    const NodeRef second = buildSubtree(tree, node.children.at(1), resolve);
    return tree.createSplit(directionOf(node.type), ratioOf(node), first, second);
}

int TmuxLayoutManager::reconcile(PaneTree &tree, const TmuxLayoutNode &layout, const PaneResolver &resolve, const RemoteResolver &remoteOf)
{
    if (tree.isEmpty()) {
        tree.replaceSubtree(tree.root(), buildSubtree(tree, layout, resolve));
        return 1;
    }
    return reconcileNode(tree, tree.root(), layout, resolve, remoteOf);
}

int TmuxLayoutManager::reconcileNode(PaneTree &tree, NodeRef ref, const TmuxLayoutNode &node, const PaneResolver &resolve, const RemoteResolver &remoteOf)
{
    // Copied: building below may grow the arena.
    const PaneTree::Node current = tree.node(ref);

    if (current.leaf && node.type == TmuxLayoutNodeType::Leaf && remoteOf(current.paneId) == node.paneId) {
        return 0;
    }

    if (!current.leaf && node.type != TmuxLayoutNodeType::Leaf && current.direction == directionOf(node.type)) {
        tree.setRatio(ref, ratioOf(node));
        return reconcileNode(tree, current.first, node.children.at(0), resolve, remoteOf)
            + reconcileNode(tree, current.second, node.children.at(1), resolve, remoteOf);
    }

    qCDebug(lcTmuxLayout) << "rebuilding subtree at node" << ref;
    tree.replaceSubtree(ref, buildSubtree(tree, node, resolve));
    return 1;
}

TmuxLayoutNode TmuxLayoutManager::buildLayoutNode(const PaneTree &tree, int columns, int rows, const RemoteResolver &remoteOf)
{
    if (tree.isEmpty()) {
        return TmuxLayoutNode();
    }
    return buildLayoutNode(tree, tree.root(), columns, rows, 0, 0, remoteOf);
}

TmuxLayoutNode TmuxLayoutManager::buildLayoutNode(const PaneTree &tree, NodeRef ref, int width, int height, int x, int y, const RemoteResolver &remoteOf)
{
    const PaneTree::Node &n = tree.node(ref);

    TmuxLayoutNode node;
    node.width = width;
    node.height = height;
    node.xOffset = x;
    node.yOffset = y;

    if (n.leaf) {
        node.type = TmuxLayoutNodeType::Leaf;
        node.paneId = remoteOf(n.paneId);
        return node;
    }

    const bool horizontal = (n.direction == SplitDirection::Horizontal);
    node.type = horizontal ? TmuxLayoutNodeType::HSplit : TmuxLayoutNodeType::VSplit;

    // Both children keep at least one cell; one more cell is the separator.
    const int available = (horizontal ? width : height) - 1;
    const int firstExtent = available >= 2 ? qBound(1, qRound(n.ratio * available), available - 1) : qMax(0, available / 2);
    const int secondExtent = qMax(0, available - firstExtent);

    TmuxLayoutNode first;
    TmuxLayoutNode second;
    if (horizontal) {
        first = buildLayoutNode(tree, n.first, firstExtent, height, x, y, remoteOf);
        second = buildLayoutNode(tree, n.second, secondExtent, height, x + firstExtent + 1, y, remoteOf);
    } else {
        first = buildLayoutNode(tree, n.first, width, firstExtent, x, y, remoteOf);
        second = buildLayoutNode(tree, n.second, width, secondExtent, x, y + firstExtent + 1, remoteOf);
    }

    // tmux has no same-direction nesting; lift such children into this container.
    for (const TmuxLayoutNode *child : {&first, &second}) {
        if (child->type == node.type) {
            node.children += child->children;
        } else {
            node.children.append(*child);
        }
    }
    return node;
}

QString TmuxLayoutManager::serializeTree(const PaneTree &tree, int columns, int rows, const RemoteResolver &remoteOf)
{
    return TmuxLayoutParser::serialize(buildLayoutNode(tree, columns, rows, remoteOf));
}

} // namespace Splitmux
