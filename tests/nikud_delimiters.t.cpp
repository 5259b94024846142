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

#include "nikud_delimiters.h"
#include "nikud_emphasis.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>

using namespace nikud;
using nikud::testutils::toHtml;

namespace {

class BracketLikeProcessor : public DelimiterProcessor
{
public:
    BracketLikeProcessor(QChar open, QChar close): d_open(open), d_close(close) {}

    QChar openingCharacter() const override { return d_open; }
    QChar closingCharacter() const override { return d_close; }
    int minLength() const override { return 1; }

    int delimiterUse(const Delimiter&, const Delimiter&) const override { return 1; }
    void process(NodeTree&, NodeId, NodeId, int) override {}

private:
    QChar d_open;
    QChar d_close;
};

struct StackFixture
{
    NodeTree tree;
    DelimiterStack stack { tree };

    Delimiter* pushRun(QChar ch, int length, bool canOpen, bool canClose)
    {
        NodeId node = tree.createText(QString(length, ch), true);
        tree.appendChild(tree.root(), node);
        return stack.push(Delimiter(ch, length, node, canOpen, canClose));
    }

    void text(const QString& str)
    {
        tree.appendChild(tree.root(), tree.createText(str));
    }
};

}

TEST(DelimiterProcessorCollectionTests, Lookup) {
    DelimiterProcessorCollection processors;
    EXPECT_TRUE(processors.isEmpty());

    processors.add(std::make_shared<EmphasisDelimiterProcessor>(QLatin1Char('*')));
    processors.add(std::make_shared<BracketLikeProcessor>(QLatin1Char('<'), QLatin1Char('>')));

    EXPECT_THAT(processors.processorFor(QLatin1Char('*')), ::testing::NotNull());
    EXPECT_THAT(processors.processorFor(QLatin1Char('<')), ::testing::Eq(processors.processorFor(QLatin1Char('>'))));
    EXPECT_THAT(processors.processorFor(QLatin1Char('_')), ::testing::IsNull());
    EXPECT_THAT(processors.delimiterCharacters(), ::testing::UnorderedElementsAre(
        QLatin1Char('*'), QLatin1Char('<'), QLatin1Char('>')));
}

TEST(DelimiterProcessorCollectionTests, DuplicateCharacterRejected) {
    DelimiterProcessorCollection processors;
    processors.add(std::make_shared<EmphasisDelimiterProcessor>(QLatin1Char('*')));
    processors.add(std::make_shared<BracketLikeProcessor>(QLatin1Char('<'), QLatin1Char('>')));

    EXPECT_THROW(processors.add(std::make_shared<EmphasisDelimiterProcessor>(QLatin1Char('*'))), std::logic_error);
    EXPECT_THROW(processors.add(std::make_shared<BracketLikeProcessor>(QLatin1Char('('), QLatin1Char('>'))), std::logic_error);
    EXPECT_THAT(processors.processorFor(QLatin1Char('(')), ::testing::IsNull());
}

TEST(DelimiterStackTests, PushAndRemove) {
    StackFixture f;

    Delimiter* a = f.pushRun(QLatin1Char('*'), 1, true, false);
    Delimiter* b = f.pushRun(QLatin1Char('_'), 2, true, true);
    Delimiter* c = f.pushRun(QLatin1Char('*'), 1, false, true);

    EXPECT_THAT(f.stack.count(), ::testing::Eq(3));
    EXPECT_THAT(f.stack.top(), ::testing::Eq(c));
    EXPECT_THAT(c->previous(), ::testing::Eq(b));
    EXPECT_THAT(a->next(), ::testing::Eq(b));

    f.stack.removeDelimiter(b);
    EXPECT_THAT(f.stack.count(), ::testing::Eq(2));
    EXPECT_THAT(c->previous(), ::testing::Eq(a));
    EXPECT_THAT(a->next(), ::testing::Eq(c));

    // Removing twice has no further effect
    f.stack.removeDelimiter(b);
    EXPECT_THAT(f.stack.count(), ::testing::Eq(2));

    f.stack.removeDelimiter(c);
    EXPECT_THAT(f.stack.top(), ::testing::Eq(a));
    EXPECT_THAT(f.tree.children(f.tree.root()).size(), ::testing::Eq(3));
}

TEST(DelimiterStackTests, RemoveDelimiterAndNode) {
    StackFixture f;
    f.text(QStringLiteral("a"));
    Delimiter* d = f.pushRun(QLatin1Char('*'), 1, true, false);
    f.text(QStringLiteral("b"));

    f.stack.removeDelimiterAndNode(d);
    EXPECT_THAT(f.stack.count(), ::testing::Eq(0));
    EXPECT_THAT(toHtml(f.tree, f.tree.root()), ::testing::Eq(QStringLiteral("ab")));
}

TEST(DelimiterStackTests, RemoveBetween) {
    StackFixture f;

    Delimiter* opener = f.pushRun(QLatin1Char('*'), 1, true, false);
    f.pushRun(QLatin1Char('_'), 1, true, false);
    f.pushRun(QLatin1Char('['), 1, true, false);
    Delimiter* closer = f.pushRun(QLatin1Char('*'), 1, false, true);

    f.stack.removeDelimitersBetween(opener, closer);
    EXPECT_THAT(f.stack.count(), ::testing::Eq(2));
    EXPECT_THAT(closer->previous(), ::testing::Eq(opener));
}

TEST(DelimiterStackTests, SearchAndDeactivate) {
    StackFixture f;

    Delimiter* first = f.pushRun(QLatin1Char('['), 1, true, false);
    Delimiter* bang = f.pushRun(QLatin1Char('!'), 1, true, false);
    f.pushRun(QLatin1Char('*'), 1, true, false);

    EXPECT_THAT(f.stack.searchByCharacter({ QLatin1Char('['), QLatin1Char('!') }), ::testing::Eq(bang));
    EXPECT_THAT(f.stack.searchByCharacter({ QLatin1Char('~') }), ::testing::IsNull());
    EXPECT_THAT(f.stack.activeCount(), ::testing::Eq(3));

    f.stack.removeEarlierMatches(QLatin1Char('['));
    EXPECT_FALSE(first->isActive());
    EXPECT_TRUE(bang->isActive());
    EXPECT_THAT(f.stack.activeCount(), ::testing::Eq(2));
    EXPECT_THAT(f.stack.activeCount(bang), ::testing::Eq(1));

    // Deactivated entries are still found, callers decide what to do
    f.stack.removeDelimiter(bang);
    EXPECT_THAT(f.stack.searchByCharacter({ QLatin1Char('['), QLatin1Char('!') }), ::testing::Eq(first));
}

TEST(DelimiterStackTests, RemoveAllDownToBottom) {
    StackFixture f;

    Delimiter* bottom = f.pushRun(QLatin1Char('['), 1, true, false);
    f.pushRun(QLatin1Char('*'), 1, true, false);
    f.pushRun(QLatin1Char('*'), 1, true, false);

    f.stack.removeAll(bottom);
    EXPECT_THAT(f.stack.top(), ::testing::Eq(bottom));

    f.stack.removeAll();
    EXPECT_THAT(f.stack.top(), ::testing::IsNull());
}

TEST(DelimiterStackTests, ProcessPairsOpenerAndCloser) {
    StackFixture f;
    DelimiterProcessorCollection processors;
    processors.add(std::make_shared<EmphasisDelimiterProcessor>(QLatin1Char('*')));

    f.pushRun(QLatin1Char('*'), 2, true, false);
    f.text(QStringLiteral("foo"));
    f.pushRun(QLatin1Char('*'), 1, false, true);

    f.stack.processDelimiters(nullptr, processors);

    EXPECT_THAT(f.stack.count(), ::testing::Eq(0));
    EXPECT_THAT(toHtml(f.tree, f.tree.root()), ::testing::Eq(QStringLiteral("*<em>foo</em>")));
}

TEST(DelimiterStackTests, ProcessRespectsStackBottom) {
    StackFixture f;
    DelimiterProcessorCollection processors;
    processors.add(std::make_shared<EmphasisDelimiterProcessor>(QLatin1Char('*')));

    f.pushRun(QLatin1Char('*'), 1, true, false);
    Delimiter* bottom = f.pushRun(QLatin1Char('['), 1, true, false);
    f.text(QStringLiteral("foo"));
    f.pushRun(QLatin1Char('*'), 1, false, true);

    f.stack.processDelimiters(bottom, processors);

    // The closer could only pair with an opener below the bottom, so it is
    // dropped from the stack and left as text
    EXPECT_THAT(f.stack.count(), ::testing::Eq(2));
    EXPECT_THAT(f.stack.top(), ::testing::Eq(bottom));
    EXPECT_THAT(toHtml(f.tree, f.tree.root()), ::testing::Eq(QStringLiteral("*[foo*")));
}

TEST(DelimiterStackTests, ProcessOnlyShrinksTheStack) {
    StackFixture f;
    DelimiterProcessorCollection processors;
    processors.add(std::make_shared<EmphasisDelimiterProcessor>(QLatin1Char('*')));
    processors.add(std::make_shared<EmphasisDelimiterProcessor>(QLatin1Char('_')));

    Delimiter* below = f.pushRun(QLatin1Char('*'), 1, true, false);
    Delimiter* bottom = f.pushRun(QLatin1Char('['), 1, true, false);

    // **foo*bar**baz* _x___
    f.pushRun(QLatin1Char('*'), 2, true, false);
    f.text(QStringLiteral("foo"));
    f.pushRun(QLatin1Char('*'), 1, true, true);
    f.text(QStringLiteral("bar"));
    f.pushRun(QLatin1Char('*'), 2, true, true);
    f.text(QStringLiteral("baz"));
    f.pushRun(QLatin1Char('*'), 1, false, true);
    f.text(QStringLiteral(" "));
    f.pushRun(QLatin1Char('_'), 1, true, false);
    f.text(QStringLiteral("x"));
    f.pushRun(QLatin1Char('_'), 2, false, true);
    f.pushRun(QLatin1Char('_'), 1, false, true);

    qsizetype before = f.stack.activeCount(bottom);
    EXPECT_THAT(before, ::testing::Eq(7));

    f.stack.processDelimiters(bottom, processors);

    EXPECT_THAT(f.stack.activeCount(bottom), ::testing::Le(before));
    EXPECT_THAT(f.stack.activeCount(bottom), ::testing::Eq(0));
    EXPECT_THAT(f.stack.top(), ::testing::Eq(bottom));
    EXPECT_THAT(bottom->previous(), ::testing::Eq(below));
    EXPECT_THAT(toHtml(f.tree, f.tree.root()),
        ::testing::Eq(QStringLiteral("*[<strong>foo*bar</strong>baz* <em>x</em>__")));
}
