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
#include "nikud_text_utils.h"

namespace nikud::utils {

bool isUnicodeWhitespace(QChar ch)
{
    return ch.category() == QChar::Separator_Space
        || ch == QLatin1Char('\t')
        || ch == QLatin1Char('\n')
        || ch == QLatin1Char('\f')
        || ch == QLatin1Char('\r');
}

bool isAsciiPunctuation(QChar ch)
{
    ushort c = ch.unicode();
    return (c >= 0x21 && c <= 0x2f)
        || (c >= 0x3a && c <= 0x40)
        || (c >= 0x5b && c <= 0x60)
        || (c >= 0x7b && c <= 0x7e);
}

bool isPunctuation(QChar ch)
{
    // Unicode P* and S* categories
    return isAsciiPunctuation(ch) || ch.isPunct() || ch.isSymbol();
}

bool isWordCharacter(QChar ch)
{
    return ch.isLetterOrNumber() || ch.isMark() || ch == QLatin1Char('_');
}

bool isSpaceOrTab(QChar ch)
{
    return ch == QLatin1Char(' ') || ch == QLatin1Char('\t');
}

Flanking determineFlanking(QChar charBefore, QChar charAfter)
{
    if (charBefore.isNull()) {
        charBefore = LINE_END_CHAR;
    }
    if (charAfter.isNull()) {
        charAfter = LINE_END_CHAR;
    }

    bool afterIsWhitespace = isUnicodeWhitespace(charAfter);
    bool afterIsPunctuation = isPunctuation(charAfter);
    bool beforeIsWhitespace = isUnicodeWhitespace(charBefore);
    bool beforeIsPunctuation = isPunctuation(charBefore);

    Flanking result;
    result.left = !afterIsWhitespace
        && (!afterIsPunctuation || beforeIsWhitespace || beforeIsPunctuation);
    result.right = !beforeIsWhitespace
        && (!beforeIsPunctuation || afterIsWhitespace || afterIsPunctuation);
    result.beforeIsPunctuation = beforeIsPunctuation;
    result.afterIsPunctuation = afterIsPunctuation;
    return result;
}

QString repeated(QChar ch, qsizetype count)
{
    return QString(count, ch);
}

}
