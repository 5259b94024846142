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

#include <optional>

namespace nikud {

/**
 * Resolves `]` against the nearest `[` or `![` opener on the delimiter
 * stack, producing a link or an image from either an inline destination or
 * a reference. When nothing applies the `]` is left to become literal text.
 */
class CloseBracketParser : public InlineParser
{
public:
    QList<QChar> characters() const override { return { QLatin1Char(']') }; }
    bool parse(InlineParserContext& context) override;

private:
    struct LinkTarget
    {
        QString url;
        QString title;
    };

    std::optional<LinkTarget> tryParseLink(Cursor& cursor, const ReferenceMap& referenceMap, const Delimiter& opener, qsizetype startPos) const;
    std::optional<LinkTarget> tryParseInlineLinkAndTitle(Cursor& cursor) const;
    std::optional<Reference> tryParseReference(Cursor& cursor, const ReferenceMap& referenceMap, const Delimiter& opener, qsizetype startPos) const;

    void flattenImageLabel(NodeTree& tree, NodeId image) const;
};

}
