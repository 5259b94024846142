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

#include <tuple>
#include <utility>

//
// Parser Combinator library over a Cursor
//
namespace nikud::matchers {

namespace detail {
    template <size_t I = 0,
            typename Callback,
            typename... TTypes>
    bool tupleForEach(const std::tuple<TTypes...>& t, Callback&& cb)
    {
        if constexpr (I < sizeof...(TTypes)) {
            if (!cb(std::get<I>(t))) {
                return false;
            }
            return tupleForEach<I + 1>(t, std::forward<Callback>(cb));
        }
        else {
            Q_UNUSED(t);
            Q_UNUSED(cb);
            return true;
        }
    }
}

template <CursorMatcher ...Matchers>
class All
{
    std::tuple<Matchers...> d_matchers;

public:
    All(Matchers ...matchers): d_matchers(matchers...) {}

    bool tryMatch(Cursor& cursor) const
    {
        return detail::tupleForEach(d_matchers, [&](CursorMatcher auto&& m) {
            return m.tryMatch(cursor);
        });
    }
};

template <CursorMatcher ...Matchers>
class Any
{
    std::tuple<Matchers...> d_matchers;

public:
    Any(Matchers ...matchers): d_matchers(matchers...) {}

    bool tryMatch(Cursor& cursor) const
    {
        return !detail::tupleForEach(d_matchers, [&](CursorMatcher auto&& m) {
            CursorState state = cursor.saveState();
            if (m.tryMatch(cursor)) {
                return false;
            }
            else {
                cursor.restoreState(state);
                return true;
            }
        });
    }
};

template <CursorMatcher M>
class Optionally
{
    M d_matcher;

public:
    Optionally(const M& matcher): d_matcher(matcher) {}

    bool tryMatch(Cursor& cursor) const
    {
        CursorState state = cursor.saveState();
        if (!d_matcher.tryMatch(cursor)) {
            cursor.restoreState(state);
        }
        return true;
    }
};

class Character
{
    QChar d_ch;

public:
    Character(QChar ch): d_ch(ch) {}

    bool tryMatch(Cursor& cursor) const
    {
        if (cursor.character() != d_ch) {
            return false;
        }
        cursor.advance();
        return true;
    }
};

class Sequence
{
    QStringView d_chars;

public:
    Sequence(QStringView chars): d_chars(chars) {}

    bool tryMatch(Cursor& cursor) const
    {
        for (QChar ch : d_chars) {
            if (cursor.character() != ch) {
                return false;
            }
            cursor.advance();
        }
        return true;
    }
};

// Spaces and tabs, including up to one line ending. Always succeeds.
class SpaceOrNewline
{
public:
    bool tryMatch(Cursor& cursor) const
    {
        cursor.advanceToNextNonSpaceOrNewline();
        return true;
    }
};

// Ellipsis, either "..." or ". . ."
inline auto Ellipsis() {
    return Any(
        Sequence(u"..."),
        Sequence(u". . .")
    );
}

}
