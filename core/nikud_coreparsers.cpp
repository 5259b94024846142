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
#include "nikud_coreparsers.h"
#include "nikud_linkparsing.h"

#include <algorithm>

namespace nikud {

bool NewlineParser::parse(InlineParserContext& context)
{
    Cursor& cursor = context.cursor();
    NodeTree& tree = context.tree();

    cursor.advance();

    qsizetype spaces = 0;
    NodeId last = tree.lastChild(context.container());
    if (last != INVALID_NODE && tree.kind(last) == NodeKind::TEXT) {
        QString& literal = tree.node(last).literal;
        while (spaces < literal.size() && literal[literal.size() - 1 - spaces] == QLatin1Char(' ')) {
            spaces++;
        }
        literal.chop(spaces);
    }

    NodeKind kind = spaces >= 2 ? NodeKind::HARD_BREAK : NodeKind::SOFT_BREAK;
    context.appendNode(tree.createNode(kind));

    cursor.advanceWhile(QLatin1Char(' '));
    return true;
}

bool EscapableParser::parse(InlineParserContext& context)
{
    Cursor& cursor = context.cursor();
    cursor.advance();

    QChar next = cursor.character();
    if (next == QLatin1Char('\n')) {
        cursor.advance();
        context.appendNode(context.tree().createNode(NodeKind::HARD_BREAK));
    }
    else if (!next.isNull() && links::isEscapable(next)) {
        cursor.advance();
        context.appendText(QString(next));
    }
    else {
        context.appendText(QStringLiteral("\\"));
    }
    return true;
}

bool BacktickParser::parse(InlineParserContext& context)
{
    Cursor& cursor = context.cursor();
    const QString& text = cursor.text();

    qsizetype tickCount = cursor.advanceWhile(QLatin1Char('`'));
    QString ticks = cursor.previousText();
    qsizetype contentStart = cursor.position();

    // A run length already known to have no closer is not searched again
    QHash<qsizetype, qsizetype>& searchLimits = context.backtickSearchLimits();
    qsizetype pos = searchLimits.contains(tickCount) ? text.size() : contentStart;

    while (pos < text.size()) {
        if (text[pos] != QLatin1Char('`')) {
            pos++;
            continue;
        }

        qsizetype runStart = pos;
        while (pos < text.size() && text[pos] == QLatin1Char('`')) {
            pos++;
        }
        if (pos - runStart != tickCount) {
            continue;
        }

        QString code = text.mid(contentStart, runStart - contentStart);
        code.replace(QLatin1Char('\n'), QLatin1Char(' '));

        // One space on each side is stripped, unless the span is all spaces
        bool allSpaces = std::all_of(code.cbegin(), code.cend(), [](QChar ch) { return ch == QLatin1Char(' '); });
        if (!allSpaces && code.startsWith(QLatin1Char(' ')) && code.endsWith(QLatin1Char(' '))) {
            code = code.sliced(1, code.size() - 2);
        }

        cursor.advanceBy(pos - cursor.position());

        NodeId node = context.tree().createNode(NodeKind::CODE);
        context.tree().node(node).literal = code;
        context.appendNode(node);
        return true;
    }

    // No closing run, so the opening ticks are plain text
    if (!searchLimits.contains(tickCount)) {
        searchLimits.insert(tickCount, contentStart);
    }
    context.appendText(ticks);
    return true;
}

bool OpenBracketParser::parse(InlineParserContext& context)
{
    Cursor& cursor = context.cursor();
    cursor.advance();

    NodeId node = context.appendText(QStringLiteral("["), true);
    context.delimiterStack().push(Delimiter(QLatin1Char('['), 1, node, true, false, cursor.position()));
    return true;
}

bool BangParser::parse(InlineParserContext& context)
{
    Cursor& cursor = context.cursor();
    if (cursor.peek() != QLatin1Char('[')) {
        return false;
    }

    cursor.advanceBy(2);

    NodeId node = context.appendText(QStringLiteral("!["), true);
    context.delimiterStack().push(Delimiter(QLatin1Char('!'), 1, node, true, false, cursor.position()));
    return true;
}

}
