/*
    SPDX-FileCopyrightText: 2025 Splitmux contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "PaneTree.h"

#include <QLoggingCategory>

#include <atomic>
#include <cmath>

Q_LOGGING_CATEGORY(lcPaneTree, "splitmux.pane")

namespace Splitmux
{

PaneId allocatePaneId()
{
    static std::atomic<PaneId> nextId{1};
    return nextId.fetch_add(1);
}

PaneTree::PaneTree() = default;

PaneTree::PaneTree(PaneId rootPane, TerminalHandle terminal)
{
    _root = createLeaf(rootPane, terminal);
}

NodeRef PaneTree::allocNode()
{
    if (!_freeList.isEmpty()) {
        NodeRef ref = _freeList.takeLast();
        _nodes[ref] = Node();
        _nodes[ref].used = true;
        return ref;
    }
    Node node;
    node.used = true;
    _nodes.append(node);
    return _nodes.size() - 1;
}

void PaneTree::freeSubtree(NodeRef ref)
{
    if (!isValid(ref)) {
        return;
    }
    const Node n = _nodes[ref];
    if (!n.leaf) {
        freeSubtree(n.first);
        freeSubtree(n.second);
    }
    _nodes[ref] = Node();
    _freeList.append(ref);
}

bool PaneTree::isValid(NodeRef ref) const
{
    return ref >= 0 && ref < _nodes.size() && _nodes[ref].used;
}

NodeRef PaneTree::root() const
{
    return _root;
}

const PaneTree::Node &PaneTree::node(NodeRef ref) const
{
    Q_ASSERT(isValid(ref));
    return _nodes[ref];
}

NodeRef PaneTree::createLeaf(PaneId pane, TerminalHandle terminal)
{
    NodeRef ref = allocNode();
    _nodes[ref].leaf = true;
    _nodes[ref].paneId = pane;
    _nodes[ref].terminal = terminal;
    return ref;
}

NodeRef PaneTree::createSplit(SplitDirection direction, qreal ratio, NodeRef first, NodeRef second)
{
    NodeRef ref = allocNode();
    Node &n = _nodes[ref];
    n.leaf = false;
    n.direction = direction;
    n.ratio = ratio;
    n.first = first;
    n.second = second;
    return ref;
}

NodeRef PaneTree::findParent(NodeRef from, NodeRef child) const
{
    if (!isValid(from) || _nodes[from].leaf) {
        return NoNode;
    }
    const Node &n = _nodes[from];
    if (n.first == child || n.second == child) {
        return from;
    }
    NodeRef found = findParent(n.first, child);
    if (found != NoNode) {
        return found;
    }
    return findParent(n.second, child);
}

void PaneTree::replaceSubtree(NodeRef target, NodeRef replacement)
{
    if (target == replacement) {
        return;
    }
    if (target == _root || _root == NoNode) {
        _root = replacement;
    } else {
        NodeRef parent = findParent(_root, target);
        if (parent == NoNode) {
            qCWarning(lcPaneTree) << "replaceSubtree: node" << target << "is not attached";
            return;
        }
        Node &p = _nodes[parent];
        if (p.first == target) {
            p.first = replacement;
        } else {
            p.second = replacement;
        }
    }
    freeSubtree(target);
}

void PaneTree::setRatio(NodeRef split, qreal ratio)
{
    if (isValid(split) && !_nodes[split].leaf) {
        _nodes[split].ratio = ratio;
    }
}

bool PaneTree::pathTo(PaneId pane, QVector<NodeRef> &path) const
{
    path.clear();
    return pathTo(_root, pane, path);
}

bool PaneTree::pathTo(NodeRef from, PaneId pane, QVector<NodeRef> &path) const
{
    if (!isValid(from)) {
        return false;
    }
    path.append(from);
    const Node &n = _nodes[from];
    if (n.leaf) {
        if (n.paneId == pane) {
            return true;
        }
    } else if (pathTo(n.first, pane, path) || pathTo(n.second, pane, path)) {
        return true;
    }
    path.removeLast();
    return false;
}

NodeRef PaneTree::leafFor(PaneId pane) const
{
    QVector<NodeRef> path;
    return pathTo(pane, path) ? path.last() : NoNode;
}

qreal PaneTree::clampRatio(qreal ratio) const
{
    if (std::isnan(ratio)) {
        return 0.5;
    }
    return qBound(_minRatio, ratio, _maxRatio);
}

PaneResult<PaneId> PaneTree::split(PaneId target, SplitDirection direction, qreal ratio)
{
    PaneResult<PaneId> result;
    NodeRef leafRef = leafFor(target);
    if (leafRef == NoNode) {
        result.error = PaneError::NotFound;
        return result;
    }
    if (_maxPanes > 0 && paneCount() >= _maxPanes) {
        qCDebug(lcPaneTree) << "split of" << target << "refused, limit" << _maxPanes << "reached";
        result.error = PaneError::PaneLimitExceeded;
        return result;
    }

    // The split takes over the leaf's slot; the original leaf moves to `first`.
    const Node original = _nodes[leafRef];
    NodeRef moved = createLeaf(original.paneId, original.terminal);
    const PaneId newPane = allocatePaneId();
    NodeRef added = createLeaf(newPane);

    Node &slot = _nodes[leafRef];
    slot.leaf = false;
    slot.paneId = InvalidPaneId;
    slot.terminal = NullTerminalHandle;
    slot.direction = direction;
    slot.ratio = clampRatio(ratio);
    slot.first = moved;
    slot.second = added;

    result.value = newPane;
    return result;
}

PaneResult<PaneTree::CloseResult> PaneTree::close(PaneId target)
{
    PaneResult<CloseResult> result;
    QVector<NodeRef> path;
    if (!pathTo(target, path)) {
        result.error = PaneError::NotFound;
        return result;
    }

    if (path.size() == 1) {
        if (_lastPaneProtected) {
            result.error = PaneError::LastPaneProtected;
            return result;
        }
        freeSubtree(_root);
        _root = NoNode;
        result.value.tabShouldClose = true;
        return result;
    }

    const NodeRef leafRef = path.at(path.size() - 1);
    const NodeRef parentRef = path.at(path.size() - 2);
    const NodeRef sibling = (_nodes[parentRef].first == leafRef) ? _nodes[parentRef].second : _nodes[parentRef].first;

    // The sibling subtree takes the parent's place unchanged.
    if (path.size() == 2) {
        _root = sibling;
    } else {
        Node &grand = _nodes[path.at(path.size() - 3)];
        if (grand.first == parentRef) {
            grand.first = sibling;
        } else {
            grand.second = sibling;
        }
    }

    _nodes[parentRef].first = NoNode;
    _nodes[parentRef].second = NoNode;
    _nodes[parentRef].leaf = true;
    freeSubtree(leafRef);
    freeSubtree(parentRef);

    NodeRef cursor = sibling;
    while (!_nodes[cursor].leaf) {
        cursor = _nodes[cursor].first;
    }
    result.value.focusSuccessor = _nodes[cursor].paneId;
    return result;
}

PaneError PaneTree::resize(NodeRef split, qreal ratio)
{
    if (!isValid(split) || _nodes[split].leaf) {
        return PaneError::NotFound;
    }
    _nodes[split].ratio = clampRatio(ratio);
    return PaneError::None;
}

NodeRef PaneTree::enclosingSplit(PaneId pane, SplitDirection direction) const
{
    QVector<NodeRef> path;
    if (!pathTo(pane, path)) {
        return NoNode;
    }
    for (int i = path.size() - 2; i >= 0; --i) {
        if (_nodes[path.at(i)].direction == direction) {
            return path.at(i);
        }
    }
    return NoNode;
}

NodeRef PaneTree::parentSplit(PaneId pane) const
{
    QVector<NodeRef> path;
    if (!pathTo(pane, path) || path.size() < 2) {
        return NoNode;
    }
    return path.at(path.size() - 2);
}

void PaneTree::splitRect(const QRectF &rect, SplitDirection direction, qreal ratio, QRectF &first, QRectF &second)
{
    if (direction == SplitDirection::Horizontal) {
        const qreal w = rect.width() * ratio;
        first = QRectF(rect.x(), rect.y(), w, rect.height());
        second = QRectF(rect.x() + w, rect.y(), rect.width() - w, rect.height());
    } else {
        const qreal h = rect.height() * ratio;
        first = QRectF(rect.x(), rect.y(), rect.width(), h);
        second = QRectF(rect.x(), rect.y() + h, rect.width(), rect.height() - h);
    }
}

void PaneTree::boundsOf(NodeRef ref, const QRectF &rect, QHash<PaneId, QRectF> &out) const
{
    const Node &n = _nodes[ref];
    if (n.leaf) {
        out.insert(n.paneId, rect);
        return;
    }
    QRectF first;
    QRectF second;
    splitRect(rect, n.direction, n.ratio, first, second);
    boundsOf(n.first, first, out);
    boundsOf(n.second, second, out);
}

QHash<PaneId, QRectF> PaneTree::computeBounds(const QRectF &rootBounds) const
{
    QHash<PaneId, QRectF> bounds;
    if (isValid(_root)) {
        boundsOf(_root, rootBounds, bounds);
    }
    return bounds;
}

std::optional<PaneId> PaneTree::findAdjacent(PaneId from, NavigationDirection direction, const QRectF &rootBounds) const
{
    QVector<NodeRef> path;
    if (!pathTo(from, path)) {
        return std::nullopt;
    }

    const SplitDirection axis = axisOf(direction);
    const bool forward = (direction == NavigationDirection::Right || direction == NavigationDirection::Down);

    // Nearest ancestor of the right axis with the source on the near side.
    NodeRef neighbour = NoNode;
    for (int i = path.size() - 2; i >= 0; --i) {
        const Node &n = _nodes[path.at(i)];
        const NodeRef child = path.at(i + 1);
        if (n.direction != axis) {
            continue;
        }
        if (forward && n.first == child) {
            neighbour = n.second;
            break;
        }
        if (!forward && n.second == child) {
            neighbour = n.first;
            break;
        }
    }
    if (neighbour == NoNode) {
        return std::nullopt;
    }

    const QHash<PaneId, QRectF> bounds = computeBounds(rootBounds);
    const QRectF source = bounds.value(from);
    const qreal epsilon = 1e-9 * qMax<qreal>(1.0, qMax(rootBounds.width(), rootBounds.height()));

    QList<PaneId> subtree;
    collectPanes(neighbour, subtree);

    std::optional<PaneId> best;
    qreal bestEdge = 0;
    qreal bestCenter = 0;
    for (PaneId candidate : subtree) {
        const QRectF r = bounds.value(candidate);
        bool touches = false;
        qreal overlap = 0;
        qreal edgeDistance = 0;
        qreal centerDistance = 0;
        switch (direction) {
        case NavigationDirection::Right:
            touches = std::abs(r.left() - source.right()) <= epsilon;
            break;
        case NavigationDirection::Left:
            touches = std::abs(r.right() - source.left()) <= epsilon;
            break;
        case NavigationDirection::Down:
            touches = std::abs(r.top() - source.bottom()) <= epsilon;
            break;
        case NavigationDirection::Up:
            touches = std::abs(r.bottom() - source.top()) <= epsilon;
            break;
        }
        if (axis == SplitDirection::Horizontal) {
            overlap = qMin(r.bottom(), source.bottom()) - qMax(r.top(), source.top());
            edgeDistance = std::abs(r.top() - source.top());
            centerDistance = std::abs(r.center().y() - source.center().y());
        } else {
            overlap = qMin(r.right(), source.right()) - qMax(r.left(), source.left());
            edgeDistance = std::abs(r.left() - source.left());
            centerDistance = std::abs(r.center().x() - source.center().x());
        }
        if (!touches || overlap <= epsilon) {
            continue;
        }
        // Leading edge alignment first, then centre distance, then tree order.
        if (!best || edgeDistance < bestEdge - epsilon || (std::abs(edgeDistance - bestEdge) <= epsilon && centerDistance < bestCenter - epsilon)) {
            best = candidate;
            bestEdge = edgeDistance;
            bestCenter = centerDistance;
        }
    }

    return best;
}

PaneId PaneTree::paneAt(const QPointF &point, const QRectF &rootBounds) const
{
    if (!isValid(_root) || point.x() < rootBounds.left() || point.x() >= rootBounds.right() || point.y() < rootBounds.top()
        || point.y() >= rootBounds.bottom()) {
        return InvalidPaneId;
    }

    NodeRef ref = _root;
    QRectF rect = rootBounds;
    while (!_nodes[ref].leaf) {
        const Node &n = _nodes[ref];
        QRectF first;
        QRectF second;
        splitRect(rect, n.direction, n.ratio, first, second);
        const bool inFirst = (n.direction == SplitDirection::Horizontal) ? point.x() < second.left() : point.y() < second.top();
        ref = inFirst ? n.first : n.second;
        rect = inFirst ? first : second;
    }
    return _nodes[ref].paneId;
}

void PaneTree::collectPanes(NodeRef ref, QList<PaneId> &out) const
{
    if (!isValid(ref)) {
        return;
    }
    const Node &n = _nodes[ref];
    if (n.leaf) {
        out.append(n.paneId);
        return;
    }
    collectPanes(n.first, out);
    collectPanes(n.second, out);
}

QList<PaneId> PaneTree::panes() const
{
    QList<PaneId> result;
    collectPanes(_root, result);
    return result;
}

int PaneTree::paneCount() const
{
    return panes().size();
}

bool PaneTree::contains(PaneId pane) const
{
    return leafFor(pane) != NoNode;
}

bool PaneTree::isEmpty() const
{
    return !isValid(_root);
}

PaneId PaneTree::firstPane() const
{
    if (!isValid(_root)) {
        return InvalidPaneId;
    }
    NodeRef ref = _root;
    while (!_nodes[ref].leaf) {
        ref = _nodes[ref].first;
    }
    return _nodes[ref].paneId;
}

TerminalHandle PaneTree::terminalHandle(PaneId pane) const
{
    NodeRef ref = leafFor(pane);
    return ref == NoNode ? NullTerminalHandle : _nodes[ref].terminal;
}

bool PaneTree::setTerminalHandle(PaneId pane, TerminalHandle terminal)
{
    NodeRef ref = leafFor(pane);
    if (ref == NoNode) {
        return false;
    }
    _nodes[ref].terminal = terminal;
    return true;
}

void PaneTree::setRatioBounds(qreal minRatio, qreal maxRatio)
{
    _minRatio = minRatio;
    _maxRatio = maxRatio;
}

qreal PaneTree::minRatio() const
{
    return _minRatio;
}

qreal PaneTree::maxRatio() const
{
    return _maxRatio;
}

void PaneTree::setMaxPanes(int maxPanes)
{
    _maxPanes = qMax(0, maxPanes);
}

int PaneTree::maxPanes() const
{
    return _maxPanes;
}

void PaneTree::setLastPaneProtected(bool isProtected)
{
    _lastPaneProtected = isProtected;
}

bool PaneTree::lastPaneProtected() const
{
    return _lastPaneProtected;
}

void PaneTree::describeNode(NodeRef ref, bool withIds, QString &out) const
{
    const Node &n = _nodes[ref];
    if (n.leaf) {
        out += withIds ? QString::number(n.paneId) : QStringLiteral("*");
        return;
    }
    out += (n.direction == SplitDirection::Horizontal) ? QLatin1Char('H') : QLatin1Char('V');
    out += QString::number(n.ratio, 'f', 2);
    out += QLatin1Char('(');
    describeNode(n.first, withIds, out);
    out += QLatin1Char(',');
    describeNode(n.second, withIds, out);
    out += QLatin1Char(')');
}

QString PaneTree::describe(bool withIds) const
{
    QString out;
    if (isValid(_root)) {
        describeNode(_root, withIds, out);
    }
    return out;
}

} // namespace Splitmux
