/*
 * This file is part of Nikud
 * Copyright (c) 2026 The Nikud Authors
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program. If not, see <http://www.gnu.org/licenses/>.
 */
#include "nikud_node.h"

namespace nikud {

NodeTree::NodeTree()
{
    d_nodes.emplace_back();
    d_nodes.back().kind = NodeKind::DOCUMENT;
}

Node& NodeTree::node(NodeId id)
{
    Q_ASSERT(isValid(id));
    return d_nodes[id];
}

const Node& NodeTree::node(NodeId id) const
{
    Q_ASSERT(isValid(id));
    return d_nodes[id];
}

NodeId NodeTree::createNode(NodeKind kind)
{
    // Note: invalidates Node references (not ids) obtained earlier
    d_nodes.emplace_back();
    d_nodes.back().kind = kind;
    return static_cast<NodeId>(d_nodes.size()) - 1;
}

NodeId NodeTree::createText(const QString& literal, bool delim)
{
    NodeId id = createNode(NodeKind::TEXT);
    d_nodes[id].literal = literal;
    d_nodes[id].delim = delim;
    return id;
}

NodeId NodeTree::createCustom(std::shared_ptr<const CustomNodeType> type)
{
    NodeId id = createNode(NodeKind::CUSTOM);
    d_nodes[id].customType = std::move(type);
    return id;
}

QList<NodeId> NodeTree::children(NodeId id) const
{
    QList<NodeId> result;
    for (NodeId child = firstChild(id); child != INVALID_NODE; child = next(child)) {
        result.append(child);
    }
    return result;
}

void NodeTree::appendChild(NodeId parent, NodeId child)
{
    Q_ASSERT(parent != child);
    detach(child);

    Node& p = node(parent);
    Node& c = node(child);

    c.parent = parent;
    c.previous = p.lastChild;
    if (p.lastChild != INVALID_NODE) {
        node(p.lastChild).next = child;
    }
    else {
        p.firstChild = child;
    }
    p.lastChild = child;
}

void NodeTree::prependChild(NodeId parent, NodeId child)
{
    Q_ASSERT(parent != child);
    detach(child);

    Node& p = node(parent);
    Node& c = node(child);

    c.parent = parent;
    c.next = p.firstChild;
    if (p.firstChild != INVALID_NODE) {
        node(p.firstChild).previous = child;
    }
    else {
        p.lastChild = child;
    }
    p.firstChild = child;
}

void NodeTree::insertAfter(NodeId sibling, NodeId id)
{
    Q_ASSERT(sibling != id);
    detach(id);

    Node& s = node(sibling);
    Node& n = node(id);

    n.next = s.next;
    n.previous = sibling;
    n.parent = s.parent;
    if (s.next != INVALID_NODE) {
        node(s.next).previous = id;
    }
    else if (s.parent != INVALID_NODE) {
        node(s.parent).lastChild = id;
    }
    s.next = id;
}

void NodeTree::insertBefore(NodeId sibling, NodeId id)
{
    Q_ASSERT(sibling != id);
    detach(id);

    Node& s = node(sibling);
    Node& n = node(id);

    n.previous = s.previous;
    n.next = sibling;
    n.parent = s.parent;
    if (s.previous != INVALID_NODE) {
        node(s.previous).next = id;
    }
    else if (s.parent != INVALID_NODE) {
        node(s.parent).firstChild = id;
    }
    s.previous = id;
}

void NodeTree::replaceWith(NodeId id, NodeId replacement)
{
    if (id == replacement) {
        return;
    }

    detach(replacement);
    insertAfter(id, replacement);
    detach(id);
}

void NodeTree::detach(NodeId id)
{
    Node& n = node(id);

    if (n.previous != INVALID_NODE) {
        node(n.previous).next = n.next;
    }
    else if (n.parent != INVALID_NODE) {
        node(n.parent).firstChild = n.next;
    }

    if (n.next != INVALID_NODE) {
        node(n.next).previous = n.previous;
    }
    else if (n.parent != INVALID_NODE) {
        node(n.parent).lastChild = n.previous;
    }

    n.parent = INVALID_NODE;
    n.previous = INVALID_NODE;
    n.next = INVALID_NODE;
}

bool NodeTree::isStringContainer(NodeId id) const
{
    const Node& n = node(id);
    switch (n.kind) {
        case NodeKind::TEXT:
        case NodeKind::CODE:
        case NodeKind::QUOTE:
            return true;
        case NodeKind::CUSTOM:
            return n.customType && n.customType->isStringContainer();
        default:
            return false;
    }
}

QString NodeTree::textContent(NodeId id) const
{
    const Node& n = node(id);
    if (isStringContainer(id)) {
        return n.literal;
    }
    if (n.kind == NodeKind::IMAGE) {
        return n.label;
    }
    if (n.kind == NodeKind::SOFT_BREAK || n.kind == NodeKind::HARD_BREAK) {
        return QStringLiteral("\n");
    }

    QString result;
    for (NodeId child = n.firstChild; child != INVALID_NODE; child = next(child)) {
        result += textContent(child);
    }
    return result;
}

void NodeTree::mergeChildNodes(NodeId parent)
{
    NodeId first = firstChild(parent);
    NodeId last = lastChild(parent);

    // No children or just one child node, no need for merging
    if (first == INVALID_NODE || first == last) {
        return;
    }
    mergeTextNodesInclusive(first, last);
}

void NodeTree::mergeTextNodesBetweenExclusive(NodeId from, NodeId to)
{
    if (from == to || next(from) == to || next(from) == INVALID_NODE) {
        return;
    }
    mergeTextNodesInclusive(next(from), previous(to));
}

void NodeTree::mergeTextNodesInclusive(NodeId from, NodeId to)
{
    NodeId first = INVALID_NODE;
    NodeId last = INVALID_NODE;

    NodeId current = from;
    while (current != INVALID_NODE) {
        NodeId following = next(current);

        if (kind(current) == NodeKind::TEXT) {
            if (first == INVALID_NODE) {
                first = current;
            }
            last = current;
        }
        else {
            mergeIfNeeded(first, last);
            first = INVALID_NODE;
            last = INVALID_NODE;
        }

        if (current == to) {
            break;
        }
        current = following;
    }

    mergeIfNeeded(first, last);
}

void NodeTree::mergeIfNeeded(NodeId first, NodeId last)
{
    if (first == INVALID_NODE || last == INVALID_NODE || first == last) {
        return;
    }

    QString content = node(first).literal;
    NodeId stop = next(last);
    NodeId current = next(first);
    while (current != stop && current != INVALID_NODE && kind(current) == NodeKind::TEXT) {
        content += node(current).literal;
        NodeId unlink = current;
        current = next(current);
        detach(unlink);
    }
    node(first).literal = content;
}

}
