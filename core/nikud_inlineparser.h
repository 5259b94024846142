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

#include "nikud_cursor.h"
#include "nikud_delimiters.h"
#include "nikud_node.h"
#include "nikud_references.h"

#include <QHash>
#include <QList>
#include <QSet>

namespace nikud {

class Environment;

/**
 * Everything an inline parser may look at or change while the inline
 * content of one block is parsed.
 */
class InlineParserContext
{
public:
    InlineParserContext(const QString& text,
                        NodeTree& tree,
                        NodeId container,
                        const ReferenceMap& referenceMap,
                        const DelimiterProcessorCollection& delimiterProcessors);

    Cursor& cursor() { return d_cursor; }
    DelimiterStack& delimiterStack() { return d_delimiterStack; }
    NodeTree& tree() { return d_tree; }
    NodeId container() const { return d_container; }
    const ReferenceMap& referenceMap() const { return d_referenceMap; }
    const DelimiterProcessorCollection& delimiterProcessors() const { return d_delimiterProcessors; }

    void appendNode(NodeId node);
    NodeId appendText(const QString& text, bool delim = false);

    // Per backtick run length, the position from which no run of that
    // length follows
    QHash<qsizetype, qsizetype>& backtickSearchLimits() { return d_backtickSearchLimits; }

private:
    Cursor d_cursor;
    NodeTree& d_tree;
    DelimiterStack d_delimiterStack;
    NodeId d_container;
    const ReferenceMap& d_referenceMap;
    const DelimiterProcessorCollection& d_delimiterProcessors;
    QHash<qsizetype, qsizetype> d_backtickSearchLimits;
};

/**
 * Handler for one or more trigger characters. Returning false means the
 * construct does not apply at the cursor position; the cursor must then be
 * where it was when parse() was called.
 */
class InlineParser
{
public:
    virtual ~InlineParser() = default;

    virtual QList<QChar> characters() const = 0;
    virtual bool parse(InlineParserContext& context) = 0;
};

/**
 * Runs over a block's inline nodes once they are complete.
 */
class InlinePostProcessor
{
public:
    virtual ~InlinePostProcessor() = default;

    virtual void process(NodeTree& tree, NodeId block) = 0;
};

class InlineParserEngine
{
public:
    explicit InlineParserEngine(Environment& environment);

    void parse(const QString& content, NodeTree& tree, NodeId block, const ReferenceMap& referenceMap);

private:
    bool parseCharacter(InlineParserContext& context);
    bool parseDelimiters(InlineParserContext& context, DelimiterProcessor& processor, QChar ch);
    void addPlainText(InlineParserContext& context);

    Environment& d_environment;
    QSet<QChar> d_specialCharacters;
};

}
