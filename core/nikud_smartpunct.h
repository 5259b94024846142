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

#include "nikud_delimiters.h"
#include "nikud_environment.h"
#include "nikud_inlineparser.h"

namespace nikud {

namespace quotes {
    static constexpr QChar DOUBLE_QUOTE = QLatin1Char('"');
    static constexpr QChar DOUBLE_QUOTE_OPENER = QChar(0x201C);
    static constexpr QChar DOUBLE_QUOTE_CLOSER = QChar(0x201D);

    static constexpr QChar SINGLE_QUOTE = QLatin1Char('\'');
    static constexpr QChar SINGLE_QUOTE_OPENER = QChar(0x2018);
    static constexpr QChar SINGLE_QUOTE_CLOSER = QChar(0x2019);

    static constexpr QChar ELLIPSIS = QChar(0x2026);
    static constexpr QChar EN_DASH = QChar(0x2013);
    static constexpr QChar EM_DASH = QChar(0x2014);
}

/**
 * Straight and curly quotes become QUOTE placeholders on the delimiter
 * stack, so they can be paired like emphasis.
 */
class QuoteParser : public InlineParser
{
public:
    QList<QChar> characters() const override;
    bool parse(InlineParserContext& context) override;

    static QChar normalizedQuote(QChar ch);
};

class QuoteProcessor : public DelimiterProcessor
{
public:
    QuoteProcessor(QChar normalizedCharacter, const QString& opener, const QString& closer)
        : d_char(normalizedCharacter)
        , d_opener(opener)
        , d_closer(closer) {}

    QChar openingCharacter() const override { return d_char; }
    QChar closingCharacter() const override { return d_char; }
    int minLength() const override { return 1; }

    int delimiterUse(const Delimiter&, const Delimiter&) const override { return 1; }
    void process(NodeTree& tree, NodeId openerNode, NodeId closerNode, int delimiterUse) override;

private:
    QChar d_char;
    QString d_opener;
    QString d_closer;
};

/**
 * Quotes left over after pairing are turned into closing (apostrophe
 * style) quotes, and all quote nodes into plain text.
 */
class UnpairedQuoteReplacer : public InlinePostProcessor
{
public:
    void process(NodeTree& tree, NodeId block) override;
};

/**
 * Ellipses ("..." or ". . .") and dashes ("--" and longer runs).
 */
class PunctuationParser : public InlineParser
{
public:
    QList<QChar> characters() const override { return { QLatin1Char('-'), QLatin1Char('.') }; }
    bool parse(InlineParserContext& context) override;

    static QString dashesFor(qsizetype hyphenCount);
};

/**
 * Options (one character strings):
 *   smartpunct.double_quote_opener, smartpunct.double_quote_closer,
 *   smartpunct.single_quote_opener, smartpunct.single_quote_closer
 */
class SmartPunctExtension : public Extension
{
public:
    QString name() const override { return QStringLiteral("smartpunct"); }
    void validateConfiguration(const Configuration& config) const override;
    void registerInto(Environment& environment) override;
};

}
