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
#include "nikud_emphasis.h"

namespace nikud {

bool EmphasisDelimiterProcessor::violatesRuleOfThree(const Delimiter& opener, const Delimiter& closer)
{
    // Only delimiters that may act both ways are subject to the rule
    if (!opener.canClose() && !closer.canOpen()) {
        return false;
    }

    int openerLength = opener.originalLength();
    int closerLength = closer.originalLength();
    if ((openerLength + closerLength) % 3 != 0) {
        return false;
    }
    return !(openerLength % 3 == 0 && closerLength % 3 == 0);
}

int EmphasisDelimiterProcessor::delimiterUse(const Delimiter& opener, const Delimiter& closer) const
{
    if (violatesRuleOfThree(opener, closer)) {
        return 0;
    }

    // Strong takes precedence when both sides can spare two characters
    if (opener.length() >= 2 && closer.length() >= 2) {
        return d_enableStrong ? 2 : 0;
    }
    return d_enableEm ? 1 : 0;
}

void EmphasisDelimiterProcessor::process(NodeTree& tree, NodeId openerNode, NodeId closerNode, int delimiterUse)
{
    NodeId emphasis = tree.createNode(delimiterUse == 1 ? NodeKind::EMPHASIS : NodeKind::STRONG);

    NodeId current = tree.next(openerNode);
    while (current != INVALID_NODE && current != closerNode) {
        NodeId following = tree.next(current);
        tree.appendChild(emphasis, current);
        current = following;
    }

    tree.insertAfter(openerNode, emphasis);
}

}
