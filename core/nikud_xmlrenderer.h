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

#include "nikud_node.h"

#include <QString>

QT_BEGIN_NAMESPACE
class QXmlStreamWriter;
QT_END_NAMESPACE

namespace nikud {

/**
 * Renders an inline tree using the CommonMark XML vocabulary.
 */
class XmlRenderer
{
public:
    QString renderDocument(const NodeTree& tree) const;

private:
    void renderNode(QXmlStreamWriter& writer, const NodeTree& tree, NodeId id) const;
    void renderChildren(QXmlStreamWriter& writer, const NodeTree& tree, NodeId id) const;
};

}
