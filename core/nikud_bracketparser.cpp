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
#include "nikud_bracketparser.h"
#include "nikud_cursor_matchers.h"
#include "nikud_linkparsing.h"
#include "nikud_text_utils.h"

namespace nikud {

namespace {

class LinkDestinationMatcher
{
    QString& d_destination;

public:
    LinkDestinationMatcher(QString& destination): d_destination(destination) {}

    bool tryMatch(Cursor& cursor) const
    {
        std::optional<QString> dest = links::parseLinkDestination(cursor);
        if (!dest) {
            return false;
        }
        d_destination = dest.value();
        return true;
    }
};

// A title must be separated from the destination by whitespace
class LinkTitleMatcher
{
    QString& d_title;

public:
    LinkTitleMatcher(QString& title): d_title(title) {}

    bool tryMatch(Cursor& cursor) const
    {
        if (!utils::isUnicodeWhitespace(cursor.peek(-1))) {
            return false;
        }

        std::optional<QString> title = links::parseLinkTitle(cursor);
        if (!title) {
            return false;
        }
        d_title = title.value();
        return true;
    }
};

}

bool CloseBracketParser::parse(InlineParserContext& context)
{
    DelimiterStack& delimiterStack = context.delimiterStack();
    NodeTree& tree = context.tree();

    Delimiter* opener = delimiterStack.searchByCharacter({ QLatin1Char('['), QLatin1Char('!') });
    if (opener == nullptr) {
        return false;
    }

    if (!opener->isActive()) {
        // No matched opener, so it goes
        delimiterStack.removeDelimiter(opener);
        return false;
    }

    Cursor& cursor = context.cursor();
    qsizetype startPos = cursor.position();
    CursorState previousState = cursor.saveState();

    cursor.advance();

    std::optional<LinkTarget> link = tryParseLink(cursor, context.referenceMap(), *opener, startPos);
    if (!link) {
        delimiterStack.removeDelimiter(opener);
        cursor.restoreState(previousState);
        return false;
    }

    bool isImage = opener->character() == QLatin1Char('!');

    NodeId inlineNode = tree.createNode(isImage ? NodeKind::IMAGE : NodeKind::LINK);
    tree.node(inlineNode).url = link->url;
    tree.node(inlineNode).title = link->title;

    tree.replaceWith(opener->node(), inlineNode);

    NodeId label;
    while ((label = tree.next(inlineNode)) != INVALID_NODE) {
        if (tree.kind(label) == NodeKind::MENTION) {
            // No links inside links, so a mention goes back to its source
            // text and is handled as such on the next round
            QString source = tree.node(label).prefix + tree.node(label).identifier;
            NodeId replacement = tree.createText(source);
            tree.replaceWith(label, replacement);
        }
        else {
            tree.appendChild(inlineNode, label);
        }
    }

    // Process delimiters such as emphasis inside the link or image
    const Delimiter* stackBottom = opener->previous();
    delimiterStack.processDelimiters(stackBottom, context.delimiterProcessors());
    delimiterStack.removeAll(stackBottom);

    if (isImage) {
        flattenImageLabel(tree, inlineNode);
    }
    else {
        tree.mergeChildNodes(inlineNode);

        // No links in links, so every earlier link opener is disabled. Earlier
        // image openers stay, as images may contain links.
        delimiterStack.removeEarlierMatches(QLatin1Char('['));
    }

    return true;
}

void CloseBracketParser::flattenImageLabel(NodeTree& tree, NodeId image) const
{
    // Image alt text is the plain text of its label, with whatever
    // delimiters were left unpaired kept as written
    QString alt;

    NodeId child;
    while ((child = tree.firstChild(image)) != INVALID_NODE) {
        alt += tree.textContent(child);
        tree.detach(child);
    }

    tree.node(image).label = alt;
}

std::optional<CloseBracketParser::LinkTarget> CloseBracketParser::tryParseLink(Cursor& cursor, const ReferenceMap& referenceMap, const Delimiter& opener, qsizetype startPos) const
{
    std::optional<LinkTarget> inlineLink = tryParseInlineLinkAndTitle(cursor);
    if (inlineLink) {
        return inlineLink;
    }

    std::optional<Reference> reference = tryParseReference(cursor, referenceMap, opener, startPos);
    if (reference) {
        return LinkTarget { reference->destination(), reference->title() };
    }
    return std::nullopt;
}

std::optional<CloseBracketParser::LinkTarget> CloseBracketParser::tryParseInlineLinkAndTitle(Cursor& cursor) const
{
    using namespace matchers;

    QString destination;
    QString title;

    auto matcher = All(
        Character(QLatin1Char('(')),
        SpaceOrNewline(),
        LinkDestinationMatcher(destination),
        SpaceOrNewline(),
        Optionally(LinkTitleMatcher(title)),
        SpaceOrNewline(),
        Character(QLatin1Char(')'))
    );

    if (!cursor.tryMatch(matcher)) {
        return std::nullopt;
    }
    return LinkTarget { destination, title };
}

std::optional<Reference> CloseBracketParser::tryParseReference(Cursor& cursor, const ReferenceMap& referenceMap, const Delimiter& opener, qsizetype startPos) const
{
    if (!opener.index()) {
        return std::nullopt;
    }

    CursorState savedState = cursor.saveState();
    qsizetype beforeLabel = cursor.position();
    qsizetype n = links::parseLinkLabel(cursor);

    qsizetype start, length;
    if (n == 0 || n == 2) {
        // Collapsed or shortcut reference, the link text is the label
        start = opener.index().value();
        length = startPos - start;
    }
    else {
        start = beforeLabel + 1;
        length = n - 2;
    }

    QString referenceLabel = cursor.substring(start, length);

    if (n == 0) {
        // Shortcut reference: nothing after the bracket belongs to the link
        cursor.restoreState(savedState);
    }

    return referenceMap.get(referenceLabel);
}

}
