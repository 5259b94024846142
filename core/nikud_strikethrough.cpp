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
#include "nikud_strikethrough.h"

namespace nikud {

std::shared_ptr<const CustomNodeType> StrikethroughNodeType::instance()
{
    static const std::shared_ptr<const CustomNodeType> s_instance = std::make_shared<StrikethroughNodeType>();
    return s_instance;
}

int StrikethroughDelimiterProcessor::delimiterUse(const Delimiter& opener, const Delimiter& closer) const
{
    if (opener.length() > 2 || closer.length() > 2) {
        return 0;
    }
    if (opener.length() != closer.length()) {
        return 0;
    }
    return opener.length();
}

void StrikethroughDelimiterProcessor::process(NodeTree& tree, NodeId openerNode, NodeId closerNode, int delimiterUse)
{
    Q_UNUSED(delimiterUse);

    NodeId strikethrough = tree.createCustom(StrikethroughNodeType::instance());

    NodeId current = tree.next(openerNode);
    while (current != INVALID_NODE && current != closerNode) {
        NodeId following = tree.next(current);
        tree.appendChild(strikethrough, current);
        current = following;
    }

    tree.insertAfter(openerNode, strikethrough);
}

void StrikethroughExtension::registerInto(Environment& environment)
{
    environment.addDelimiterProcessor(std::make_shared<StrikethroughDelimiterProcessor>());
}

}
