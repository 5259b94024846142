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
#include "nikud_bracketparser.h"
#include "nikud_commonmark.h"
#include "nikud_coreparsers.h"
#include "nikud_emphasis.h"

namespace nikud {

static constexpr const char* BOOLEAN_OPTIONS[] = {
    "commonmark.enable_em",
    "commonmark.enable_strong",
    "commonmark.use_asterisk",
    "commonmark.use_underscore",
};

void CommonMarkCoreExtension::validateConfiguration(const Configuration& config) const
{
    if (config.contains(QStringLiteral("commonmark"))
        && config.get(QStringLiteral("commonmark")).typeId() != QMetaType::QVariantMap) {
        throw ConfigurationError(QStringLiteral("commonmark"), QStringLiteral("expected a map of options"));
    }

    for (const char* option : BOOLEAN_OPTIONS) {
        config.getBool(QString::fromLatin1(option), true);
    }
}

void CommonMarkCoreExtension::registerInto(Environment& environment)
{
    const Configuration& config = environment.configuration();

    environment.addInlineParser(std::make_shared<NewlineParser>(), 200);
    environment.addInlineParser(std::make_shared<EscapableParser>(), 80);
    environment.addInlineParser(std::make_shared<BacktickParser>(), 75);
    environment.addInlineParser(std::make_shared<CloseBracketParser>(), 30);
    environment.addInlineParser(std::make_shared<OpenBracketParser>(), 20);
    environment.addInlineParser(std::make_shared<BangParser>(), 10);

    bool enableEm = config.getBool(QStringLiteral("commonmark.enable_em"), true);
    bool enableStrong = config.getBool(QStringLiteral("commonmark.enable_strong"), true);

    if (config.getBool(QStringLiteral("commonmark.use_asterisk"), true)) {
        environment.addDelimiterProcessor(std::make_shared<EmphasisDelimiterProcessor>(QLatin1Char('*'), enableEm, enableStrong));
    }
    if (config.getBool(QStringLiteral("commonmark.use_underscore"), true)) {
        environment.addDelimiterProcessor(std::make_shared<EmphasisDelimiterProcessor>(QLatin1Char('_'), enableEm, enableStrong));
    }
}

}
