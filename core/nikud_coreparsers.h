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

#include "nikud_inlineparser.h"

namespace nikud {

/**
 * Line endings inside a block. Two or more spaces before the line ending
 * make it a hard break; the spaces are dropped either way, as are spaces at
 * the start of the next line.
 */
class NewlineParser : public InlineParser
{
public:
    QList<QChar> characters() const override { return { QLatin1Char('\n') }; }
    bool parse(InlineParserContext& context) override;
};

class EscapableParser : public InlineParser
{
public:
    QList<QChar> characters() const override { return { QLatin1Char('\\') }; }
    bool parse(InlineParserContext& context) override;
};

/**
 * Code spans. A backtick run without a closing run of the same length is
 * taken literally.
 */
class BacktickParser : public InlineParser
{
public:
    QList<QChar> characters() const override { return { QLatin1Char('`') }; }
    bool parse(InlineParserContext& context) override;
};

class OpenBracketParser : public InlineParser
{
public:
    QList<QChar> characters() const override { return { QLatin1Char('[') }; }
    bool parse(InlineParserContext& context) override;
};

class BangParser : public InlineParser
{
public:
    QList<QChar> characters() const override { return { QLatin1Char('!') }; }
    bool parse(InlineParserContext& context) override;
};

}
