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
#include "nikud_xmlrenderer.h"

#include <QByteArray>
#include <QXmlStreamWriter>

namespace nikud {

static const QString COMMONMARK_XML_NAMESPACE = QStringLiteral("http://commonmark.org/xml/1.0");

QString XmlRenderer::renderDocument(const NodeTree& tree) const
{
    QByteArray output;

    QXmlStreamWriter writer(&output);
    writer.setAutoFormatting(true);
    writer.setAutoFormattingIndent(4);

    writer.writeStartDocument();
    renderNode(writer, tree, tree.root());
    writer.writeEndDocument();

    return QString::fromUtf8(output);
}

void XmlRenderer::renderChildren(QXmlStreamWriter& writer, const NodeTree& tree, NodeId id) const
{
    for (NodeId child = tree.firstChild(id); child != INVALID_NODE; child = tree.next(child)) {
        renderNode(writer, tree, child);
    }
}

void XmlRenderer::renderNode(QXmlStreamWriter& writer, const NodeTree& tree, NodeId id) const
{
    const Node& node = tree.node(id);

    switch (node.kind) {
        case NodeKind::DOCUMENT:
            writer.writeStartElement(QStringLiteral("document"));
            writer.writeAttribute(QStringLiteral("xmlns"), COMMONMARK_XML_NAMESPACE);
            renderChildren(writer, tree, id);
            writer.writeEndElement();
            break;

        case NodeKind::PARAGRAPH:
            writer.writeStartElement(QStringLiteral("paragraph"));
            renderChildren(writer, tree, id);
            writer.writeEndElement();
            break;

        case NodeKind::TEXT:
        case NodeKind::QUOTE:
            writer.writeTextElement(QStringLiteral("text"), node.literal);
            break;

        case NodeKind::SOFT_BREAK:
            writer.writeEmptyElement(QStringLiteral("softbreak"));
            break;

        case NodeKind::HARD_BREAK:
            writer.writeEmptyElement(QStringLiteral("linebreak"));
            break;

        case NodeKind::CODE:
            writer.writeTextElement(QStringLiteral("code"), node.literal);
            break;

        case NodeKind::EMPHASIS:
            writer.writeStartElement(QStringLiteral("emph"));
            renderChildren(writer, tree, id);
            writer.writeEndElement();
            break;

        case NodeKind::STRONG:
            writer.writeStartElement(QStringLiteral("strong"));
            renderChildren(writer, tree, id);
            writer.writeEndElement();
            break;

        case NodeKind::LINK:
        case NodeKind::MENTION:
            // Mentions are links as far as the document model goes
            writer.writeStartElement(QStringLiteral("link"));
            writer.writeAttribute(QStringLiteral("destination"), node.url);
            writer.writeAttribute(QStringLiteral("title"), node.title);
            renderChildren(writer, tree, id);
            writer.writeEndElement();
            break;

        case NodeKind::IMAGE:
            writer.writeStartElement(QStringLiteral("image"));
            writer.writeAttribute(QStringLiteral("destination"), node.url);
            writer.writeAttribute(QStringLiteral("title"), node.title);
            if (!node.label.isEmpty()) {
                writer.writeTextElement(QStringLiteral("text"), node.label);
            }
            writer.writeEndElement();
            break;

        case NodeKind::CUSTOM:
            Q_ASSERT(node.customType);
            if (tree.isStringContainer(id)) {
                writer.writeTextElement(node.customType->name(), node.literal);
            }
            else {
                writer.writeStartElement(node.customType->name());
                renderChildren(writer, tree, id);
                writer.writeEndElement();
            }
            break;
    }
}

}
