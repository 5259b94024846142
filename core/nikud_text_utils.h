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

#include <QString>

namespace nikud::utils {

// Stand-in for a missing character (start or end of the text) when deciding
// flanking. CommonMark treats both ends of a block as a line ending.
static constexpr QChar LINE_END_CHAR = QLatin1Char('\n');

bool isUnicodeWhitespace(QChar ch);
bool isPunctuation(QChar ch);
bool isAsciiPunctuation(QChar ch);
bool isWordCharacter(QChar ch);
bool isSpaceOrTab(QChar ch);

/**
 * Flanking status of a delimiter run, given the characters that surround it.
 */
struct Flanking
{
    bool left = false;
    bool right = false;
    bool beforeIsPunctuation = false;
    bool afterIsPunctuation = false;
};

Flanking determineFlanking(QChar charBefore, QChar charAfter);

QString repeated(QChar ch, qsizetype count);

}
