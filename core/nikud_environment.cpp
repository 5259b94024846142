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
#include "nikud_commonmark.h"
#include "nikud_environment.h"

#include <QDebug>
#include <QScopeGuard>

#include <algorithm>
#include <stdexcept>

namespace nikud {

Environment::Environment(const QVariantMap& config)
    : d_config(config)
{
}

std::unique_ptr<Environment> Environment::createCommonMarkEnvironment(const QVariantMap& config)
{
    auto environment = std::make_unique<Environment>();
    environment->addExtension(std::make_shared<CommonMarkCoreExtension>());
    environment->mergeConfig(config);
    return environment;
}

void Environment::assertUninitialized(const char* action) const
{
    if (d_initialized) {
        throw std::logic_error(QStringLiteral("Unable to %1: the environment is already initialized")
            .arg(QLatin1StringView(action)).toStdString());
    }
}

void Environment::mergeConfig(const QVariantMap& config)
{
    assertUninitialized("merge configuration");
    if (d_initializing) {
        throw std::logic_error("Unable to merge configuration while extensions are registering");
    }

    // Validate the merged result before committing to it, so that a
    // rejected merge keeps the previous configuration
    Configuration candidate = d_config;
    candidate.merge(config);
    for (const auto& extension : std::as_const(d_extensions)) {
        extension->validateConfiguration(candidate);
    }

    d_config = candidate;
}

void Environment::addExtension(std::shared_ptr<Extension> extension)
{
    assertUninitialized("add extension");
    if (d_initializing) {
        throw std::logic_error("Unable to add extensions while extensions are registering");
    }

    extension->validateConfiguration(d_config);
    d_extensions.append(extension);
}

void Environment::addInlineParser(std::shared_ptr<InlineParser> parser, int priority)
{
    assertUninitialized("add inline parser");
    d_inlineParsers.append({ priority, parser });
}

void Environment::addDelimiterProcessor(std::shared_ptr<DelimiterProcessor> processor)
{
    assertUninitialized("add delimiter processor");
    d_delimiterProcessors.add(processor);
}

void Environment::addInlinePostProcessor(std::shared_ptr<InlinePostProcessor> processor, int priority)
{
    assertUninitialized("add inline post processor");
    d_postProcessors.append({ priority, processor });
}

void Environment::initialize()
{
    if (d_initialized) {
        return;
    }

    d_initializing = true;
    {
        auto guard = qScopeGuard([this] { d_initializing = false; });
        for (const auto& extension : std::as_const(d_extensions)) {
            extension->registerInto(*this);
        }
    }

    // Higher priority first; registration order breaks ties
    auto byPriority = [](const auto& a, const auto& b) {
        return a.priority > b.priority;
    };
    std::stable_sort(d_inlineParsers.begin(), d_inlineParsers.end(), byPriority);
    std::stable_sort(d_postProcessors.begin(), d_postProcessors.end(), byPriority);

    for (const auto& entry : std::as_const(d_inlineParsers)) {
        const QList<QChar> characters = entry.item->characters();
        for (QChar ch : characters) {
            d_inlineParsersByChar[ch].append(entry.item.get());
        }
    }

    d_initialized = true;

    qDebug() << "Environment initialized with" << d_extensions.size() << "extensions,"
             << d_inlineParsers.size() << "inline parsers,"
             << d_delimiterProcessors.delimiterCharacters().size() << "delimiter characters and"
             << d_postProcessors.size() << "post processors";
}

QList<InlineParser*> Environment::inlineParsersFor(QChar ch) const
{
    return d_inlineParsersByChar.value(ch);
}

QList<InlinePostProcessor*> Environment::inlinePostProcessors() const
{
    QList<InlinePostProcessor*> result;
    for (const auto& entry : d_postProcessors) {
        result.append(entry.item.get());
    }
    return result;
}

}
