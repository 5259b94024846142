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
#include "nikud_cursor.h"
#include "nikud_text_utils.h"

namespace nikud {

void Cursor::advanceBy(qsizetype count)
{
    d_state.previousPosition = d_state.position;
    d_state.position = qBound(qsizetype(0), d_state.position + count, d_text.size());
}

qsizetype Cursor::advanceWhile(QChar ch)
{
    qsizetype start = d_state.position;
    qsizetype pos = start;
    while (pos < d_text.size() && d_text[pos] == ch) {
        pos++;
    }

    d_state.previousPosition = start;
    d_state.position = pos;
    return pos - start;
}

qsizetype Cursor::advanceToNextNonSpaceOrNewline()
{
    qsizetype start = d_state.position;
    qsizetype pos = start;

    while (pos < d_text.size() && utils::isSpaceOrTab(d_text[pos])) {
        pos++;
    }

    // At most a single line ending may be skipped
    if (pos < d_text.size() && d_text[pos] == QLatin1Char('\n')) {
        pos++;
        while (pos < d_text.size() && utils::isSpaceOrTab(d_text[pos])) {
            pos++;
        }
    }

    d_state.previousPosition = start;
    d_state.position = pos;
    return pos - start;
}

QStringView Cursor::remainder() const
{
    if (isAtEnd()) {
        return QStringView();
    }
    return QStringView(d_text).sliced(d_state.position);
}

QString Cursor::substring(qsizetype start, qsizetype length) const
{
    if (start < 0 || length <= 0 || start >= d_text.size()) {
        return QString();
    }
    return d_text.mid(start, length);
}

QString Cursor::previousText() const
{
    return d_text.mid(d_state.previousPosition, d_state.position - d_state.previousPosition);
}

std::optional<QString> Cursor::match(const QRegularExpression& re)
{
    QRegularExpressionMatch m = matchAt(re);
    if (!m.hasMatch()) {
        return std::nullopt;
    }

    QString matched = m.captured(0);
    advanceBy(matched.size());
    return matched;
}

QRegularExpressionMatch Cursor::matchAt(const QRegularExpression& re) const
{
    return re.match(d_text, d_state.position, QRegularExpression::NormalMatch,
                    QRegularExpression::AnchorAtOffsetMatchOption);
}

void Cursor::restoreState(const CursorState& state)
{
    Q_ASSERT(state.position >= 0 && state.position <= d_text.size());
    d_state = state;
}

}
