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
#include "nikud_environment.h"
#include "nikud_inlineparser.h"
#include "nikud_text_utils.h"

namespace nikud {

InlineParserContext::InlineParserContext(const QString& text,
                                         NodeTree& tree,
                                         NodeId container,
                                         const ReferenceMap& referenceMap,
                                         const DelimiterProcessorCollection& delimiterProcessors)
    : d_cursor(text)
    , d_tree(tree)
    , d_delimiterStack(tree)
    , d_container(container)
    , d_referenceMap(referenceMap)
    , d_delimiterProcessors(delimiterProcessors)
{
}

void InlineParserContext::appendNode(NodeId node)
{
    d_tree.appendChild(d_container, node);
}

NodeId InlineParserContext::appendText(const QString& text, bool delim)
{
    if (!delim) {
        NodeId last = d_tree.lastChild(d_container);
        if (last != INVALID_NODE && d_tree.kind(last) == NodeKind::TEXT && !d_tree.node(last).delim) {
            d_tree.node(last).literal.append(text);
            return last;
        }
    }

    NodeId node = d_tree.createText(text, delim);
    d_tree.appendChild(d_container, node);
    return node;
}

InlineParserEngine::InlineParserEngine(Environment& environment)
    : d_environment(environment)
{
    d_environment.initialize();

    for (QChar ch : d_environment.inlineParserCharacters()) {
        d_specialCharacters.insert(ch);
    }
    for (QChar ch : d_environment.delimiterProcessors().delimiterCharacters()) {
        d_specialCharacters.insert(ch);
    }
}

void InlineParserEngine::parse(const QString& content, NodeTree& tree, NodeId block, const ReferenceMap& referenceMap)
{
    const DelimiterProcessorCollection& processors = d_environment.delimiterProcessors();
    InlineParserContext context(content, tree, block, referenceMap, processors);

    Cursor& cursor = context.cursor();
    while (!cursor.isAtEnd()) {
        if (!parseCharacter(context)) {
            addPlainText(context);
        }
    }

    context.delimiterStack().processDelimiters(nullptr, processors);
    tree.mergeChildNodes(block);

    for (InlinePostProcessor* postProcessor : d_environment.inlinePostProcessors()) {
        postProcessor->process(tree, block);
    }
}

bool InlineParserEngine::parseCharacter(InlineParserContext& context)
{
    Cursor& cursor = context.cursor();
    QChar ch = cursor.character();

    for (InlineParser* parser : d_environment.inlineParsersFor(ch)) {
        CursorState state = cursor.saveState();
        if (parser->parse(context)) {
            return true;
        }

        cursor.restoreState(state);
    }

    DelimiterProcessor* processor = context.delimiterProcessors().processorFor(ch);
    if (processor != nullptr) {
        return parseDelimiters(context, *processor, ch);
    }
    return false;
}

bool InlineParserEngine::parseDelimiters(InlineParserContext& context, DelimiterProcessor& processor, QChar ch)
{
    Cursor& cursor = context.cursor();

    QChar charBefore = cursor.peek(-1);
    if (charBefore.isNull()) {
        charBefore = utils::LINE_END_CHAR;
    }

    qsizetype numDelims = 0;
    while (cursor.peek(numDelims) == ch) {
        numDelims++;
    }

    if (numDelims < processor.minLength()) {
        return false;
    }

    qsizetype start = cursor.position();
    cursor.advanceBy(numDelims);

    QChar charAfter = cursor.character();
    if (charAfter.isNull()) {
        charAfter = utils::LINE_END_CHAR;
    }

    utils::Flanking flanking = utils::determineFlanking(charBefore, charAfter);

    bool canOpen, canClose;
    if (ch == QLatin1Char('_')) {
        // Underscores may not open or close intraword
        canOpen = flanking.left && (!flanking.right || flanking.beforeIsPunctuation);
        canClose = flanking.right && (!flanking.left || flanking.afterIsPunctuation);
    }
    else {
        canOpen = flanking.left && ch == processor.openingCharacter();
        canClose = flanking.right && ch == processor.closingCharacter();
    }

    // A run that can neither open nor close is plain text
    if (!canOpen && !canClose) {
        context.appendText(cursor.substring(start, numDelims));
        return true;
    }

    NodeId node = context.appendText(cursor.substring(start, numDelims), true);
    context.delimiterStack().push(Delimiter(ch, static_cast<int>(numDelims), node, canOpen, canClose));
    return true;
}

void InlineParserEngine::addPlainText(InlineParserContext& context)
{
    Cursor& cursor = context.cursor();
    qsizetype start = cursor.position();

    // The current character is consumed even if special, as no handler
    // wanted it
    cursor.advance();
    while (!cursor.isAtEnd() && !d_specialCharacters.contains(cursor.character())) {
        cursor.advance();
    }

    context.appendText(cursor.substring(start, cursor.position() - start));
}

}
