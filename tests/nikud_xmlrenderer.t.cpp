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
#include "nikud_testutils.h"

#include "nikud_environment.h"
#include "nikud_mention.h"
#include "nikud_strikethrough.h"
#include "nikud_xmlrenderer.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace nikud;

static QString renderParagraphs(Environment& environment, const QStringList& paragraphs)
{
    InlineParserEngine engine(environment);

    NodeTree tree;
    for (const QString& text : paragraphs) {
        NodeId paragraph = tree.createNode(NodeKind::PARAGRAPH);
        tree.appendChild(tree.root(), paragraph);
        engine.parse(text, tree, paragraph, ReferenceMap());
    }

    return XmlRenderer().renderDocument(tree).trimmed();
}

TEST(XmlRendererTests, EmptyDocument) {
    NodeTree tree;

    EXPECT_THAT(XmlRenderer().renderDocument(tree).trimmed(), ::testing::Eq(QStringLiteral(
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        "<document xmlns=\"http://commonmark.org/xml/1.0\"/>")));
}

TEST(XmlRendererTests, Mention) {
    std::unique_ptr<Environment> environment = Environment::createCommonMarkEnvironment();
    environment->addInlineParser(MentionParser::createGitHubHandleParser());

    QString xml = renderParagraphs(*environment, { QStringLiteral("Hello @colinodell!") });

    EXPECT_THAT(xml, ::testing::Eq(QStringLiteral(
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        "<document xmlns=\"http://commonmark.org/xml/1.0\">\n"
        "    <paragraph>\n"
        "        <text>Hello </text>\n"
        "        <link destination=\"https://github.com/colinodell\" title=\"\">\n"
        "            <text>@colinodell</text>\n"
        "        </link>\n"
        "        <text>!</text>\n"
        "    </paragraph>\n"
        "</document>")));
}

TEST(XmlRendererTests, InlineElements) {
    std::unique_ptr<Environment> environment = Environment::createCommonMarkEnvironment();
    environment->addExtension(std::make_shared<StrikethroughExtension>());

    QString xml = renderParagraphs(*environment, {
        QStringLiteral("*a* **b** `c`\nd  \ne"),
        QStringLiteral("~~x~~ & ![alt](/i.png 'T')"),
    });

    EXPECT_THAT(xml, ::testing::Eq(QStringLiteral(
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        "<document xmlns=\"http://commonmark.org/xml/1.0\">\n"
        "    <paragraph>\n"
        "        <emph>\n"
        "            <text>a</text>\n"
        "        </emph>\n"
        "        <text> </text>\n"
        "        <strong>\n"
        "            <text>b</text>\n"
        "        </strong>\n"
        "        <text> </text>\n"
        "        <code>c</code>\n"
        "        <softbreak/>\n"
        "        <text>d</text>\n"
        "        <linebreak/>\n"
        "        <text>e</text>\n"
        "    </paragraph>\n"
        "    <paragraph>\n"
        "        <strikethrough>\n"
        "            <text>x</text>\n"
        "        </strikethrough>\n"
        "        <text> &amp; </text>\n"
        "        <image destination=\"/i.png\" title=\"T\">\n"
        "            <text>alt</text>\n"
        "        </image>\n"
        "    </paragraph>\n"
        "</document>")));
}
