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

#include "nikud_commonmark.h"
#include "nikud_emphasis.h"
#include "nikud_environment.h"
#include "nikud_strikethrough.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>

using namespace nikud;
using nikud::testutils::parseInlines;

namespace {

class RecordingExtension : public Extension
{
public:
    QString name() const override { return QStringLiteral("recording"); }

    void validateConfiguration(const Configuration& config) const override
    {
        validated++;
        if (config.contains(QStringLiteral("recording.fail"))) {
            throw ConfigurationError(QStringLiteral("recording.fail"), QStringLiteral("requested"));
        }
    }

    void registerInto(Environment& environment) override
    {
        registered++;
        seenConfig = environment.configuration();
    }

    mutable int validated = 0;
    int registered = 0;
    Configuration seenConfig;
};

class ReentrantExtension : public Extension
{
public:
    QString name() const override { return QStringLiteral("reentrant"); }
    void validateConfiguration(const Configuration&) const override {}

    void registerInto(Environment& environment) override
    {
        environment.mergeConfig(QVariantMap{ { QStringLiteral("late"), true } });
    }
};

class SuffixPostProcessor : public InlinePostProcessor
{
public:
    explicit SuffixPostProcessor(const QString& suffix): d_suffix(suffix) {}

    void process(NodeTree& tree, NodeId block) override
    {
        tree.appendChild(block, tree.createText(d_suffix));
        tree.mergeChildNodes(block);
    }

private:
    QString d_suffix;
};

}

TEST(EnvironmentTests, CommonMarkEnvironment) {
    std::unique_ptr<Environment> environment = Environment::createCommonMarkEnvironment();

    ASSERT_THAT(environment->extensions().size(), ::testing::Eq(1));
    EXPECT_THAT(environment->extensions().first()->name(), ::testing::Eq(QStringLiteral("commonmark")));
    EXPECT_FALSE(environment->isInitialized());

    environment->initialize();
    EXPECT_TRUE(environment->isInitialized());
    EXPECT_THAT(environment->inlineParserCharacters(), ::testing::UnorderedElementsAre(
        QLatin1Char('\n'), QLatin1Char('\\'), QLatin1Char('`'), QLatin1Char(']'), QLatin1Char('['), QLatin1Char('!')));
    EXPECT_THAT(environment->delimiterProcessors().delimiterCharacters(),
        ::testing::UnorderedElementsAre(QLatin1Char('*'), QLatin1Char('_')));
}

TEST(EnvironmentTests, InitializeRegistersOnce) {
    auto extension = std::make_shared<RecordingExtension>();

    Environment environment(QVariantMap{ { QStringLiteral("answer"), 42 } });
    environment.addExtension(extension);
    EXPECT_THAT(extension->validated, ::testing::Eq(1));

    environment.initialize();
    environment.initialize();
    EXPECT_THAT(extension->registered, ::testing::Eq(1));
    EXPECT_THAT(extension->seenConfig.get(QStringLiteral("answer")).toInt(), ::testing::Eq(42));
}

TEST(EnvironmentTests, MergeValidatesAllExtensions) {
    auto extension = std::make_shared<RecordingExtension>();

    std::unique_ptr<Environment> environment = Environment::createCommonMarkEnvironment();
    environment->addExtension(extension);
    environment->mergeConfig(QVariantMap{ { QStringLiteral("x"), 1 } });
    EXPECT_THAT(extension->validated, ::testing::Eq(2));

    EXPECT_THROW(environment->mergeConfig(QVariantMap{
        { QStringLiteral("recording"), QVariantMap{ { QStringLiteral("fail"), true } } },
        { QStringLiteral("y"), 2 },
    }), ConfigurationError);

    // Rejected merges leave the configuration untouched
    EXPECT_FALSE(environment->configuration().contains(QStringLiteral("y")));
    EXPECT_TRUE(environment->configuration().contains(QStringLiteral("x")));
}

TEST(EnvironmentTests, CommonMarkOptionTypes) {
    EXPECT_THROW(Environment::createCommonMarkEnvironment(QVariantMap{
        { QStringLiteral("commonmark"), QVariantMap{ { QStringLiteral("enable_em"), QStringLiteral("yes") } } },
    }), ConfigurationError);

    EXPECT_THROW(Environment::createCommonMarkEnvironment(QVariantMap{
        { QStringLiteral("commonmark"), true },
    }), ConfigurationError);
}

TEST(EnvironmentTests, FrozenAfterInitialization) {
    std::unique_ptr<Environment> environment = Environment::createCommonMarkEnvironment();
    InlineParserEngine engine(*environment);

    EXPECT_TRUE(environment->isInitialized());
    EXPECT_THROW(environment->mergeConfig(QVariantMap{ { QStringLiteral("a"), 1 } }), std::logic_error);
    EXPECT_THROW(environment->addExtension(std::make_shared<StrikethroughExtension>()), std::logic_error);
    EXPECT_THROW(environment->addDelimiterProcessor(std::make_shared<EmphasisDelimiterProcessor>(QLatin1Char('='))), std::logic_error);
    EXPECT_THROW(environment->addInlinePostProcessor(std::make_shared<SuffixPostProcessor>(QStringLiteral("!"))), std::logic_error);
}

TEST(EnvironmentTests, NoConfigurationChangesWhileRegistering) {
    Environment environment;
    environment.addExtension(std::make_shared<ReentrantExtension>());

    EXPECT_THROW(environment.initialize(), std::logic_error);
}

TEST(EnvironmentTests, DuplicateDelimiterCharacter) {
    std::unique_ptr<Environment> environment = Environment::createCommonMarkEnvironment();
    environment->addDelimiterProcessor(std::make_shared<EmphasisDelimiterProcessor>(QLatin1Char('=')));

    EXPECT_THROW(environment->addDelimiterProcessor(std::make_shared<EmphasisDelimiterProcessor>(QLatin1Char('='))), std::logic_error);
}

TEST(EnvironmentTests, PostProcessorPriority) {
    Environment environment;
    environment.addInlinePostProcessor(std::make_shared<SuffixPostProcessor>(QStringLiteral("-low")), -1);
    environment.addInlinePostProcessor(std::make_shared<SuffixPostProcessor>(QStringLiteral("-high")), 5);
    environment.addInlinePostProcessor(std::make_shared<SuffixPostProcessor>(QStringLiteral("-mid")));

    EXPECT_THAT(parseInlines(environment, QStringLiteral("text")), ::testing::Eq(QStringLiteral("text-high-mid-low")));
}

TEST(EnvironmentTests, SharedBetweenParses) {
    std::unique_ptr<Environment> environment = Environment::createCommonMarkEnvironment();

    EXPECT_THAT(parseInlines(*environment, QStringLiteral("*a*")), ::testing::Eq(QStringLiteral("<em>a</em>")));
    EXPECT_THAT(parseInlines(*environment, QStringLiteral("**b**")), ::testing::Eq(QStringLiteral("<strong>b</strong>")));
}
