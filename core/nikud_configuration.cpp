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
#include "nikud_configuration.h"

#include <QStringList>

namespace nikud {

ConfigurationError::ConfigurationError(const QString& key, const QString& message)
    : std::runtime_error(QStringLiteral("Invalid configuration option \"%1\": %2").arg(key, message).toStdString())
    , d_key(key)
    , d_message(message)
{
}

void Configuration::merge(const QVariantMap& values)
{
    d_values = deepMerge(d_values, values);
}

QVariantMap Configuration::deepMerge(const QVariantMap& base, const QVariantMap& overrides)
{
    QVariantMap result = base;
    for (auto it = overrides.constBegin(); it != overrides.constEnd(); ++it) {
        const QVariant& value = it.value();

        auto existing = result.constFind(it.key());
        if (existing != result.constEnd()
            && existing.value().typeId() == QMetaType::QVariantMap
            && value.typeId() == QMetaType::QVariantMap) {
            result.insert(it.key(), deepMerge(existing.value().toMap(), value.toMap()));
        }
        else {
            result.insert(it.key(), value);
        }
    }
    return result;
}

std::optional<QVariant> Configuration::find(const QString& path) const
{
    const QStringList parts = path.split(QLatin1Char('.'));
    QVariantMap current = d_values;

    for (qsizetype i = 0; i < parts.size(); i++) {
        auto it = current.constFind(parts[i]);
        if (it == current.constEnd()) {
            return std::nullopt;
        }

        if (i + 1 == parts.size()) {
            return it.value();
        }
        if (it.value().typeId() != QMetaType::QVariantMap) {
            return std::nullopt;
        }
        current = it.value().toMap();
    }
    return std::nullopt;
}

bool Configuration::contains(const QString& path) const
{
    return find(path).has_value();
}

QVariant Configuration::get(const QString& path, const QVariant& defaultValue) const
{
    std::optional<QVariant> value = find(path);
    if (!value) {
        return defaultValue;
    }
    return *value;
}

bool Configuration::getBool(const QString& path, bool defaultValue) const
{
    std::optional<QVariant> value = find(path);
    if (!value) {
        return defaultValue;
    }
    if (value->typeId() != QMetaType::Bool) {
        throw ConfigurationError(path, QStringLiteral("expected a boolean"));
    }
    return value->toBool();
}

QString Configuration::getString(const QString& path, const QString& defaultValue) const
{
    std::optional<QVariant> value = find(path);
    if (!value) {
        return defaultValue;
    }
    if (value->typeId() != QMetaType::QString) {
        throw ConfigurationError(path, QStringLiteral("expected a string"));
    }
    return value->toString();
}

}
