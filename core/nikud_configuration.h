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

#include <QString>
#include <QVariant>
#include <QVariantMap>

#include <optional>
#include <stdexcept>

namespace nikud {

class ConfigurationError : public std::runtime_error
{
public:
    ConfigurationError(const QString& key, const QString& message);

    QString key() const { return d_key; }
    QString message() const { return d_message; }

private:
    QString d_key;
    QString d_message;
};

/**
 * Nested option tree. Sections are maps; options are addressed with dotted
 * paths such as "commonmark.enable_em".
 */
class Configuration
{
public:
    Configuration() {}
    explicit Configuration(const QVariantMap& values): d_values(values) {}

    bool operator==(const Configuration&) const = default;

    void merge(const QVariantMap& values);

    bool contains(const QString& path) const;
    QVariant get(const QString& path, const QVariant& defaultValue = QVariant()) const;
    QVariantMap section(const QString& path) const { return get(path).toMap(); }

    // Typed reads. A present option of the wrong type is an error.
    bool getBool(const QString& path, bool defaultValue) const;
    QString getString(const QString& path, const QString& defaultValue) const;

    const QVariantMap& toMap() const { return d_values; }

    static QVariantMap deepMerge(const QVariantMap& base, const QVariantMap& overrides);

private:
    std::optional<QVariant> find(const QString& path) const;

    QVariantMap d_values;
};

}
