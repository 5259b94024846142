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

#include <QRegularExpression>
#include <QString>
#include <QStringView>

#include <concepts>
#include <optional>

namespace nikud {

/**
 * Snapshot of everything a Cursor derives from its position. Restoring one
 * is equivalent to never having advanced past it.
 */
struct CursorState
{
    qsizetype position = 0;
    qsizetype previousPosition = 0;

    bool operator==(const CursorState&) const = default;
};

class Cursor;

template <typename M>
concept CursorMatcher = requires(const M m, Cursor& cursor) {
    { m.tryMatch(cursor) } -> std::same_as<bool>;
};

class Cursor
{
public:
    explicit Cursor(const QString& text): d_text(text) {}

    const QString& text() const { return d_text; }
    qsizetype position() const { return d_state.position; }
    bool isAtEnd() const { return d_state.position >= d_text.size(); }

    QChar character() const { return charAt(d_state.position); }
    QChar peek(qsizetype offset = 1) const { return charAt(d_state.position + offset); }

    void advance() { advanceBy(1); }
    void advanceBy(qsizetype count);
    qsizetype advanceWhile(QChar ch);
    qsizetype advanceToNextNonSpaceOrNewline();

    QStringView remainder() const;
    QString substring(qsizetype start, qsizetype length) const;
    QString previousText() const;

    std::optional<QString> match(const QRegularExpression& re);
    QRegularExpressionMatch matchAt(const QRegularExpression& re) const;

    CursorState saveState() const { return d_state; }
    void restoreState(const CursorState& state);

    template <CursorMatcher M>
    bool tryMatch(const M& matcher) {
        CursorState saved = saveState();
        if (!matcher.tryMatch(*this)) {
            restoreState(saved);
            return false;
        }
        return true;
    }

private:
    QChar charAt(qsizetype pos) const {
        if (pos < 0 || pos >= d_text.size()) {
            return QChar();
        }
        return d_text[pos];
    }

    QString d_text;
    CursorState d_state;
};

}
