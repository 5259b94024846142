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
#include "nikud_cursor_matchers.h"
#include "nikud_smartpunct.h"
#include "nikud_text_utils.h"

namespace nikud {

QList<QChar> QuoteParser::characters() const
{
    return {
        quotes::DOUBLE_QUOTE,
        quotes::DOUBLE_QUOTE_OPENER,
        quotes::DOUBLE_QUOTE_CLOSER,
        quotes::SINGLE_QUOTE,
        quotes::SINGLE_QUOTE_OPENER,
        quotes::SINGLE_QUOTE_CLOSER,
    };
}

QChar QuoteParser::normalizedQuote(QChar ch)
{
    if (ch == quotes::DOUBLE_QUOTE_OPENER || ch == quotes::DOUBLE_QUOTE_CLOSER) {
        return quotes::DOUBLE_QUOTE;
    }
    if (ch == quotes::SINGLE_QUOTE_OPENER || ch == quotes::SINGLE_QUOTE_CLOSER) {
        return quotes::SINGLE_QUOTE;
    }
    return ch;
}

bool QuoteParser::parse(InlineParserContext& context)
{
    Cursor& cursor = context.cursor();
    NodeTree& tree = context.tree();

    QChar normalized = normalizedQuote(cursor.character());

    QChar charBefore = cursor.peek(-1);
    cursor.advance();
    QChar charAfter = cursor.character();

    utils::Flanking flanking = utils::determineFlanking(charBefore, charAfter);
    bool canOpen = flanking.left && !flanking.right;
    bool canClose = flanking.right;

    NodeId node = tree.createNode(NodeKind::QUOTE);
    tree.node(node).literal = QString(normalized);
    tree.node(node).delim = true;
    context.appendNode(node);

    context.delimiterStack().push(Delimiter(normalized, 1, node, canOpen, canClose));
    return true;
}

void QuoteProcessor::process(NodeTree& tree, NodeId openerNode, NodeId closerNode, int delimiterUse)
{
    Q_UNUSED(delimiterUse);

    NodeId opener = tree.createNode(NodeKind::QUOTE);
    tree.node(opener).literal = d_opener;
    tree.insertAfter(openerNode, opener);

    NodeId closer = tree.createNode(NodeKind::QUOTE);
    tree.node(closer).literal = d_closer;
    tree.insertBefore(closerNode, closer);
}

static void replaceQuotes(NodeTree& tree, NodeId parent)
{
    bool replaced = false;

    NodeId current = tree.firstChild(parent);
    while (current != INVALID_NODE) {
        NodeId following = tree.next(current);

        if (tree.kind(current) == NodeKind::QUOTE) {
            QString literal = tree.node(current).literal;
            if (literal == QString(quotes::SINGLE_QUOTE)) {
                literal = QString(quotes::SINGLE_QUOTE_CLOSER);
            }
            else if (literal == QString(quotes::DOUBLE_QUOTE)) {
                literal = QString(quotes::DOUBLE_QUOTE_CLOSER);
            }

            tree.replaceWith(current, tree.createText(literal));
            replaced = true;
        }
        else {
            replaceQuotes(tree, current);
        }

        current = following;
    }

    if (replaced) {
        tree.mergeChildNodes(parent);
    }
}

void UnpairedQuoteReplacer::process(NodeTree& tree, NodeId block)
{
    replaceQuotes(tree, block);
}

QString PunctuationParser::dashesFor(qsizetype hyphenCount)
{
    qsizetype emCount = 0;
    qsizetype enCount = 0;

    if (hyphenCount % 3 == 0) {
        emCount = hyphenCount / 3;
    }
    else if (hyphenCount % 2 == 0) {
        enCount = hyphenCount / 2;
    }
    else if (hyphenCount % 3 == 2) {
        emCount = (hyphenCount - 2) / 3;
        enCount = 1;
    }
    else {
        emCount = (hyphenCount - 4) / 3;
        enCount = 2;
    }

    return utils::repeated(quotes::EM_DASH, emCount) + utils::repeated(quotes::EN_DASH, enCount);
}

bool PunctuationParser::parse(InlineParserContext& context)
{
    Cursor& cursor = context.cursor();
    QChar ch = cursor.character();

    if (ch == QLatin1Char('.')) {
        if (!cursor.tryMatch(matchers::Ellipsis())) {
            return false;
        }
        context.appendText(QString(quotes::ELLIPSIS));
        return true;
    }

    if (ch == QLatin1Char('-')) {
        if (cursor.peek(-1) == QLatin1Char('-') || cursor.peek() != QLatin1Char('-')) {
            return false;
        }

        qsizetype count = cursor.advanceWhile(QLatin1Char('-'));
        context.appendText(dashesFor(count));
        return true;
    }

    return false;
}

static const char* QUOTE_OPTIONS[] = {
    "smartpunct.double_quote_opener",
    "smartpunct.double_quote_closer",
    "smartpunct.single_quote_opener",
    "smartpunct.single_quote_closer",
};

void SmartPunctExtension::validateConfiguration(const Configuration& config) const
{
    if (config.contains(QStringLiteral("smartpunct"))
        && config.get(QStringLiteral("smartpunct")).typeId() != QMetaType::QVariantMap) {
        throw ConfigurationError(QStringLiteral("smartpunct"), QStringLiteral("expected a map of options"));
    }

    for (const char* option : QUOTE_OPTIONS) {
        QString key = QString::fromLatin1(option);
        if (!config.contains(key)) {
            continue;
        }
        if (config.getString(key, QString()).size() != 1) {
            throw ConfigurationError(key, QStringLiteral("expected a single character"));
        }
    }
}

void SmartPunctExtension::registerInto(Environment& environment)
{
    const Configuration& config = environment.configuration();

    environment.addInlineParser(std::make_shared<QuoteParser>(), 10);
    environment.addInlineParser(std::make_shared<PunctuationParser>(), 0);

    environment.addDelimiterProcessor(std::make_shared<QuoteProcessor>(
        quotes::DOUBLE_QUOTE,
        config.getString(QStringLiteral("smartpunct.double_quote_opener"), QString(quotes::DOUBLE_QUOTE_OPENER)),
        config.getString(QStringLiteral("smartpunct.double_quote_closer"), QString(quotes::DOUBLE_QUOTE_CLOSER))));
    environment.addDelimiterProcessor(std::make_shared<QuoteProcessor>(
        quotes::SINGLE_QUOTE,
        config.getString(QStringLiteral("smartpunct.single_quote_opener"), QString(quotes::SINGLE_QUOTE_OPENER)),
        config.getString(QStringLiteral("smartpunct.single_quote_closer"), QString(quotes::SINGLE_QUOTE_CLOSER))));

    environment.addInlinePostProcessor(std::make_shared<UnpairedQuoteReplacer>());
}

}
