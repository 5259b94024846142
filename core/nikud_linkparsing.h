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

#include <QString>

#include <optional>

namespace nikud::links {

static constexpr qsizetype MAX_LABEL_LENGTH = 999;

bool isEscapable(QChar ch);
QString unescape(const QString& text);
QString normalizeUri(const QString& uri);

/**
 * Parse a link destination at the cursor, either in the <...> form or the
 * raw form with balanced parentheses. On failure the cursor is not moved.
 * The result is unescaped and percent-encoded.
 */
std::optional<QString> parseLinkDestination(Cursor& cursor);

/**
 * Parse a quoted or parenthesized link title at the cursor. On failure the
 * cursor is not moved.
 */
std::optional<QString> parseLinkTitle(Cursor& cursor);

/**
 * Parse a bracketed link label at the cursor. Returns the length of the
 * label including the brackets, or 0 if there is none (and then the cursor
 * is not moved).
 */
qsizetype parseLinkLabel(Cursor& cursor);

}
