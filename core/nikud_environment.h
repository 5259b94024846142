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

#include "nikud_configuration.h"
#include "nikud_delimiters.h"
#include "nikud_inlineparser.h"

#include <QHash>
#include <QList>
#include <QVariantMap>

#include <memory>

namespace nikud {

class Environment;

/**
 * A bundle of inline parsers, delimiter processors and post processors,
 * together with the configuration options it understands.
 */
class Extension
{
public:
    virtual ~Extension() = default;

    virtual QString name() const = 0;

    /**
     * Throws ConfigurationError if the options this extension reads are
     * malformed.
     */
    virtual void validateConfiguration(const Configuration& config) const = 0;

    virtual void registerInto(Environment& environment) = 0;
};

/**
 * Configuration and extensions used for parsing. Extensions register their
 * handlers the first time the environment is used by a parser, and from
 * then on the environment can not be modified anymore.
 */
class Environment
{
public:
    Environment() {}
    explicit Environment(const QVariantMap& config);

    Environment(const Environment&) = delete;
    Environment& operator=(const Environment&) = delete;

    static std::unique_ptr<Environment> createCommonMarkEnvironment(const QVariantMap& config = QVariantMap());

    const Configuration& configuration() const { return d_config; }
    void mergeConfig(const QVariantMap& config);

    void addExtension(std::shared_ptr<Extension> extension);
    QList<std::shared_ptr<Extension>> extensions() const { return d_extensions; }

    void addInlineParser(std::shared_ptr<InlineParser> parser, int priority = 0);
    void addDelimiterProcessor(std::shared_ptr<DelimiterProcessor> processor);
    void addInlinePostProcessor(std::shared_ptr<InlinePostProcessor> processor, int priority = 0);

    bool isInitialized() const { return d_initialized; }
    void initialize();

    QList<InlineParser*> inlineParsersFor(QChar ch) const;
    QList<QChar> inlineParserCharacters() const { return d_inlineParsersByChar.keys(); }
    const DelimiterProcessorCollection& delimiterProcessors() const { return d_delimiterProcessors; }
    QList<InlinePostProcessor*> inlinePostProcessors() const;

private:
    template <typename T>
    struct Prioritized
    {
        int priority;
        std::shared_ptr<T> item;
    };

    void assertUninitialized(const char* action) const;

    Configuration d_config;
    QList<std::shared_ptr<Extension>> d_extensions;

    QList<Prioritized<InlineParser>> d_inlineParsers;
    QList<Prioritized<InlinePostProcessor>> d_postProcessors;
    DelimiterProcessorCollection d_delimiterProcessors;

    QHash<QChar, QList<InlineParser*>> d_inlineParsersByChar;

    bool d_initialized = false;
    bool d_initializing = false;
};

}
