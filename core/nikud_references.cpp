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
#include "nikud_references.h"

namespace nikud {

QString Reference::normalizeLabel(const QString& label)
{
    // Collapse internal whitespace to a single space, trim, and case fold so
    // that e.g. "Foo  Bar" and "foo bar" are the same label
    return label.simplified().toCaseFolded();
}

bool ReferenceMap::add(const Reference& reference)
{
    QString key = Reference::normalizeLabel(reference.label());
    if (key.isEmpty() || d_references.contains(key)) {
        // The first definition of a label wins
        return false;
    }

    d_references.insert(key, reference);
    return true;
}

bool ReferenceMap::contains(const QString& label) const
{
    return d_references.contains(Reference::normalizeLabel(label));
}

std::optional<Reference> ReferenceMap::get(const QString& label) const
{
    auto it = d_references.constFind(Reference::normalizeLabel(label));
    if (it == d_references.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

}
