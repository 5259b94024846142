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

#include "nikud_coreparsers.h"
#include "nikud_environment.h"
#include "nikud_text_utils.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace nikud;
using nikud::testutils::parseCommonMark;
using nikud::testutils::parseInlines;

TEST(TextUtilsTests, CharacterClasses) {
    EXPECT_TRUE(utils::isUnicodeWhitespace(QLatin1Char(' ')));
    EXPECT_TRUE(utils::isUnicodeWhitespace(QLatin1Char('\n')));
    EXPECT_TRUE(utils::isUnicodeWhitespace(QChar(0x00A0)));
    EXPECT_FALSE(utils::isUnicodeWhitespace(QLatin1Char('a')));

    EXPECT_TRUE(utils::isAsciiPunctuation(QLatin1Char('!')));
    EXPECT_TRUE(utils::isAsciiPunctuation(QLatin1Char('~')));
    EXPECT_FALSE(utils::isAsciiPunctuation(QChar(0x201C)));
    EXPECT_TRUE(utils::isPunctuation(QChar(0x201C)));
    EXPECT_FALSE(utils::isPunctuation(QLatin1Char('a')));
}

TEST(TextUtilsTests, Flanking) {
    utils::Flanking f = utils::determineFlanking(QLatin1Char(' '), QLatin1Char('a'));
    EXPECT_TRUE(f.left);
    EXPECT_FALSE(f.right);

    f = utils::determineFlanking(QLatin1Char('a'), QLatin1Char(' '));
    EXPECT_FALSE(f.left);
    EXPECT_TRUE(f.right);

    f = utils::determineFlanking(QLatin1Char('a'), QLatin1Char('b'));
    EXPECT_TRUE(f.left);
    EXPECT_TRUE(f.right);

    f = utils::determineFlanking(QLatin1Char('a'), QLatin1Char('.'));
    EXPECT_FALSE(f.left);
    EXPECT_TRUE(f.right);
    EXPECT_TRUE(f.afterIsPunctuation);

    // Start and end of the text act like whitespace
    f = utils::determineFlanking(QChar(), QChar());
    EXPECT_FALSE(f.left);
    EXPECT_FALSE(f.right);
}

TEST(NewlineParserTests, SoftAndHardBreaks) {
    EXPECT_THAT(parseCommonMark(QStringLiteral("foo\nbar")), ::testing::Eq(QStringLiteral("foo\nbar")));
    EXPECT_THAT(parseCommonMark(QStringLiteral("foo \nbar")), ::testing::Eq(QStringLiteral("foo\nbar")));
    EXPECT_THAT(parseCommonMark(QStringLiteral("foo  \nbar")), ::testing::Eq(QStringLiteral("foo<br />bar")));
    EXPECT_THAT(parseCommonMark(QStringLiteral("foo       \n     bar")), ::testing::Eq(QStringLiteral("foo<br />bar")));
}

TEST(NewlineParserTests, BreakNodes) {
    std::unique_ptr<Environment> environment = Environment::createCommonMarkEnvironment();
    InlineParserEngine engine(*environment);

    NodeTree tree;
    NodeId paragraph = tree.createNode(NodeKind::PARAGRAPH);
    tree.appendChild(tree.root(), paragraph);
    engine.parse(QStringLiteral("a\nb  \nc"), tree, paragraph, ReferenceMap());

    QList<NodeId> children = tree.children(paragraph);
    ASSERT_THAT(children.size(), ::testing::Eq(5));
    EXPECT_THAT(tree.kind(children[1]), ::testing::Eq(NodeKind::SOFT_BREAK));
    EXPECT_THAT(tree.kind(children[3]), ::testing::Eq(NodeKind::HARD_BREAK));
    EXPECT_THAT(tree.node(children[2]).literal, ::testing::Eq(QStringLiteral("b")));
}

TEST(EscapableParserTests, Escapes) {
    EXPECT_THAT(parseCommonMark(QStringLiteral("\\*not emphasized*")), ::testing::Eq(QStringLiteral("*not emphasized*")));
    EXPECT_THAT(parseCommonMark(QStringLiteral("\\[not a link](/foo)")), ::testing::Eq(QStringLiteral("[not a link](/foo)")));
    EXPECT_THAT(parseCommonMark(QStringLiteral("\\\\*emphasis*")), ::testing::Eq(QStringLiteral("\\<em>emphasis</em>")));
    EXPECT_THAT(parseCommonMark(QStringLiteral("\\a\\")), ::testing::Eq(QStringLiteral("\\a\\")));
    EXPECT_THAT(parseCommonMark(QStringLiteral("foo\\\nbar")), ::testing::Eq(QStringLiteral("foo<br />bar")));
}

TEST(BacktickParserTests, CodeSpans) {
    EXPECT_THAT(parseCommonMark(QStringLiteral("`foo`")), ::testing::Eq(QStringLiteral("<code>foo</code>")));
    EXPECT_THAT(parseCommonMark(QStringLiteral("`` foo ` bar ``")), ::testing::Eq(QStringLiteral("<code>foo ` bar</code>")));
    EXPECT_THAT(parseCommonMark(QStringLiteral("` `` `")), ::testing::Eq(QStringLiteral("<code>``</code>")));
    EXPECT_THAT(parseCommonMark(QStringLiteral("`  `")), ::testing::Eq(QStringLiteral("<code>  </code>")));
    EXPECT_THAT(parseCommonMark(QStringLiteral("`foo\nbar  \nbaz`")), ::testing::Eq(QStringLiteral("<code>foo bar   baz</code>")));
    EXPECT_THAT(parseCommonMark(QStringLiteral("`foo\\`bar`")), ::testing::Eq(QStringLiteral("<code>foo\\</code>bar`")));
}

TEST(BacktickParserTests, UnmatchedRuns) {
    EXPECT_THAT(parseCommonMark(QStringLiteral("```foo``")), ::testing::Eq(QStringLiteral("```foo``")));
    EXPECT_THAT(parseCommonMark(QStringLiteral("`foo")), ::testing::Eq(QStringLiteral("`foo")));
    EXPECT_THAT(parseCommonMark(QStringLiteral("`foo``bar``")), ::testing::Eq(QStringLiteral("`foo<code>bar</code>")));
}

TEST(BacktickParserTests, RunsWithoutCloserAreRememberedPerLength) {
    EXPECT_THAT(parseCommonMark(QStringLiteral("`` a ` b ` c ``` d")),
        ::testing::Eq(QStringLiteral("`` a <code>b</code> c ``` d")));
    EXPECT_THAT(parseCommonMark(QStringLiteral("`a ``b `c` ``d")),
        ::testing::Eq(QStringLiteral("<code>a ``b </code>c` ``d")));

    QString text;
    for (int i = 1; i <= 300; i++) {
        text += QString(i, QLatin1Char('`')) + QLatin1Char('x');
    }
    EXPECT_THAT(parseCommonMark(text), ::testing::Eq(text));
}

TEST(BacktickParserTests, PrecedenceOverOtherConstructs) {
    EXPECT_THAT(parseCommonMark(QStringLiteral("*foo`*`")), ::testing::Eq(QStringLiteral("*foo<code>*</code>")));
    EXPECT_THAT(parseCommonMark(QStringLiteral("[not a `link](/foo`)")),
        ::testing::Eq(QStringLiteral("[not a <code>link](/foo</code>)")));
}

TEST(InlineParserEngineTests, PlainText) {
    EXPECT_THAT(parseCommonMark(QString()), ::testing::Eq(QString()));
    EXPECT_THAT(parseCommonMark(QStringLiteral("hello world")), ::testing::Eq(QStringLiteral("hello world")));
    EXPECT_THAT(parseCommonMark(QStringLiteral("a ! b ] c")), ::testing::Eq(QStringLiteral("a ! b ] c")));
}

TEST(InlineParserEngineTests, CustomParser) {
    class DollarParser : public InlineParser
    {
    public:
        QList<QChar> characters() const override { return { QLatin1Char('$') }; }

        bool parse(InlineParserContext& context) override
        {
            Cursor& cursor = context.cursor();
            if (cursor.peek() != QLatin1Char('$')) {
                return false;
            }
            cursor.advanceBy(2);
            context.appendText(QStringLiteral("<money>"));
            return true;
        }
    };

    Environment environment;
    environment.addInlineParser(std::make_shared<DollarParser>());

    // A declined character is still plain text
    EXPECT_THAT(parseInlines(environment, QStringLiteral("a$$b$c")), ::testing::Eq(QStringLiteral("a<money>b$c")));
}

TEST(InlineParserEngineTests, ParserPriority) {
    class TaggingParser : public InlineParser
    {
    public:
        explicit TaggingParser(const QString& tag): d_tag(tag) {}

        QList<QChar> characters() const override { return { QLatin1Char('%') }; }

        bool parse(InlineParserContext& context) override
        {
            context.cursor().advance();
            context.appendText(d_tag);
            return true;
        }

    private:
        QString d_tag;
    };

    Environment environment;
    environment.addInlineParser(std::make_shared<TaggingParser>(QStringLiteral("low")), -5);
    environment.addInlineParser(std::make_shared<TaggingParser>(QStringLiteral("first")), 10);
    environment.addInlineParser(std::make_shared<TaggingParser>(QStringLiteral("second")), 10);

    EXPECT_THAT(parseInlines(environment, QStringLiteral("%")), ::testing::Eq(QStringLiteral("first")));
    EXPECT_THAT(environment.inlineParsersFor(QLatin1Char('%')).size(), ::testing::Eq(3));
    EXPECT_THAT(environment.inlineParsersFor(QLatin1Char('#')), ::testing::IsEmpty());
}
