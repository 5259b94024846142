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
#pragma once

#include <QList>
#include <QString>

#include <memory>
#include <vector>

namespace nikud {

using NodeId = qsizetype;

static constexpr NodeId INVALID_NODE = -1;

enum class NodeKind
{
    DOCUMENT,
    PARAGRAPH,
    TEXT,
    SOFT_BREAK,
    HARD_BREAK,
    CODE,
    EMPHASIS,
    STRONG,
    LINK,
    IMAGE,
    MENTION,
    QUOTE,
    CUSTOM
};

/**
 * Capabilities of a node type defined by an extension. Extensions describe
 * their nodes through this interface instead of adding node kinds.
 */
class CustomNodeType
{
public:
    virtual ~CustomNodeType() = default;

    virtual QString name() const = 0;
    virtual bool isStringContainer() const { return false; }
};

struct Node
{
    NodeKind kind = NodeKind::TEXT;

    NodeId parent = INVALID_NODE;
    NodeId firstChild = INVALID_NODE;
    NodeId lastChild = INVALID_NODE;
    NodeId previous = INVALID_NODE;
    NodeId next = INVALID_NODE;

    // TEXT, CODE and QUOTE content
    QString literal;

    // Set on text created for delimiter runs and brackets
    bool delim = false;

    // LINK, IMAGE and MENTION
    QString url;
    QString title;

    // IMAGE alt text, flattened
    QString label;

    // MENTION
    QString name;
    QString prefix;
    QString identifier;

    std::shared_ptr<const CustomNodeType> customType;
};

/**
 * Arena of inline nodes. Nodes are addressed by stable indices, so
 * restructuring the tree is done by relinking indices and never invalidates
 * a NodeId held elsewhere (e.g. by a delimiter). Detached nodes stay in the
 * arena, unreachable from the root.
 */
class NodeTree
{
public:
    NodeTree();

    NodeTree(const NodeTree&) = delete;
    NodeTree& operator=(const NodeTree&) = delete;

    NodeId root() const { return 0; }
    qsizetype size() const { return d_nodes.size(); }

    Node& node(NodeId id);
    const Node& node(NodeId id) const;
    NodeKind kind(NodeId id) const { return node(id).kind; }

    NodeId createNode(NodeKind kind);
    NodeId createText(const QString& literal, bool delim = false);
    NodeId createCustom(std::shared_ptr<const CustomNodeType> type);

    NodeId parent(NodeId id) const { return node(id).parent; }
    NodeId firstChild(NodeId id) const { return node(id).firstChild; }
    NodeId lastChild(NodeId id) const { return node(id).lastChild; }
    NodeId next(NodeId id) const { return node(id).next; }
    NodeId previous(NodeId id) const { return node(id).previous; }
    QList<NodeId> children(NodeId id) const;

    void appendChild(NodeId parent, NodeId child);
    void prependChild(NodeId parent, NodeId child);
    void insertAfter(NodeId sibling, NodeId id);
    void insertBefore(NodeId sibling, NodeId id);
    void replaceWith(NodeId id, NodeId replacement);
    void detach(NodeId id);

    bool isStringContainer(NodeId id) const;
    QString textContent(NodeId id) const;

    void mergeChildNodes(NodeId parent);
    void mergeTextNodesBetweenExclusive(NodeId from, NodeId to);

private:
    bool isValid(NodeId id) const { return id >= 0 && id < static_cast<NodeId>(d_nodes.size()); }
    void mergeTextNodesInclusive(NodeId from, NodeId to);
    void mergeIfNeeded(NodeId first, NodeId last);

    std::vector<Node> d_nodes;
};

}
