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

#include <QHash>
#include <QString>

#include <optional>

namespace nikud {

class Reference
{
public:
    Reference() = default;
    Reference(const QString& label, const QString& destination, const QString& title)
        : d_label(label)
        , d_destination(destination)
        , d_title(title) {}

    QString label() const { return d_label; }
    QString destination() const { return d_destination; }
    QString title() const { return d_title; }

    bool operator==(const Reference&) const = default;

    static QString normalizeLabel(const QString& label);

private:
    QString d_label;
    QString d_destination;
    QString d_title;
};

/**
 * Link reference definitions, keyed by normalized label. Filled before
 * inline parsing starts and only read from while parsing.
 */
class ReferenceMap
{
public:
    bool add(const Reference& reference);

    bool contains(const QString& label) const;
    std::optional<Reference> get(const QString& label) const;

    qsizetype size() const { return d_references.size(); }
    bool isEmpty() const { return d_references.isEmpty(); }

private:
    QHash<QString, Reference> d_references;
};

}
