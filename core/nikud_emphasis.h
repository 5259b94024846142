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

namespace nikud {

/**
 * Pairs `*` and `_` runs into emphasis and strong emphasis nodes.
 */
class EmphasisDelimiterProcessor : public DelimiterProcessor
{
public:
    explicit EmphasisDelimiterProcessor(QChar ch, bool enableEm = true, bool enableStrong = true)
        : d_char(ch)
        , d_enableEm(enableEm)
        , d_enableStrong(enableStrong) {}

    QChar openingCharacter() const override { return d_char; }
    QChar closingCharacter() const override { return d_char; }
    int minLength() const override { return 1; }

    int delimiterUse(const Delimiter& opener, const Delimiter& closer) const override;
    void process(NodeTree& tree, NodeId openerNode, NodeId closerNode, int delimiterUse) override;

    static bool violatesRuleOfThree(const Delimiter& opener, const Delimiter& closer);

private:
    QChar d_char;
    bool d_enableEm;
    bool d_enableStrong;
};

}
