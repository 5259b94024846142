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

#include "nikud_node.h"

#include <QHash>
#include <QList>
#include <QString>

#include <memory>
#include <optional>
#include <vector>

namespace nikud {

class Delimiter
{
public:
    Delimiter(QChar ch, int length, NodeId node, bool canOpen, bool canClose,
              std::optional<qsizetype> index = std::nullopt)
        : d_char(ch)
        , d_length(length)
        , d_originalLength(length)
        , d_node(node)
        , d_canOpen(canOpen)
        , d_canClose(canClose)
        , d_index(index) {}

    QChar character() const { return d_char; }
    int length() const { return d_length; }
    void setLength(int length) { d_length = length; }
    int originalLength() const { return d_originalLength; }

    NodeId node() const { return d_node; }
    std::optional<qsizetype> index() const { return d_index; }

    bool canOpen() const { return d_canOpen; }
    bool canClose() const { return d_canClose; }

    bool isActive() const { return d_active; }
    void deactivate() { d_active = false; }

    Delimiter* previous() const { return d_previous; }
    Delimiter* next() const { return d_next; }

private:
    friend class DelimiterStack;

    QChar d_char;
    int d_length;
    int d_originalLength;
    NodeId d_node;
    bool d_canOpen;
    bool d_canClose;
    bool d_active = true;
    bool d_inStack = false;
    std::optional<qsizetype> d_index;

    Delimiter* d_previous = nullptr;
    Delimiter* d_next = nullptr;
};

class DelimiterProcessor
{
public:
    virtual ~DelimiterProcessor() = default;

    virtual QChar openingCharacter() const = 0;
    virtual QChar closingCharacter() const = 0;
    virtual int minLength() const = 0;

    /**
     * Number of delimiter characters to use for pairing the given opener and
     * closer, or 0 if they can not be paired.
     */
    virtual int delimiterUse(const Delimiter& opener, const Delimiter& closer) const = 0;

    /**
     * Wrap the nodes between the opener and closer placeholders. Both are
     * still in the tree and already have the used characters removed.
     */
    virtual void process(NodeTree& tree, NodeId openerNode, NodeId closerNode, int delimiterUse) = 0;
};

class DelimiterProcessorCollection
{
public:
    void add(std::shared_ptr<DelimiterProcessor> processor);

    DelimiterProcessor* processorFor(QChar ch) const;
    QList<QChar> delimiterCharacters() const { return d_processors.keys(); }
    bool isEmpty() const { return d_processors.isEmpty(); }

private:
    QHash<QChar, std::shared_ptr<DelimiterProcessor>> d_processors;
};

/**
 * Ordered stack of pending delimiters for one block. The stack owns its
 * delimiters for the duration of the block's inline parse; removing a
 * delimiter only unlinks it.
 */
class DelimiterStack
{
public:
    explicit DelimiterStack(NodeTree& tree): d_tree(tree) {}

    DelimiterStack(const DelimiterStack&) = delete;
    DelimiterStack& operator=(const DelimiterStack&) = delete;

    Delimiter* top() const { return d_top; }
    qsizetype count() const;
    qsizetype activeCount(const Delimiter* stackBottom = nullptr) const;

    Delimiter* push(const Delimiter& delimiter);
    Delimiter* searchByCharacter(const QList<QChar>& characters) const;

    void removeDelimiter(Delimiter* delimiter);
    void removeDelimiterAndNode(Delimiter* delimiter);
    void removeDelimitersBetween(Delimiter* opener, Delimiter* closer);
    void removeEarlierMatches(QChar ch);
    void removeAll(const Delimiter* stackBottom = nullptr);

    void processDelimiters(const Delimiter* stackBottom, const DelimiterProcessorCollection& processors);

private:
    Delimiter* findEarliest(const Delimiter* stackBottom) const;

    NodeTree& d_tree;
    std::vector<std::unique_ptr<Delimiter>> d_storage;
    Delimiter* d_top = nullptr;
};

}
