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

#include "nikud_environment.h"

namespace nikud {

/**
 * The CommonMark inline syntax: line breaks, escapes, code spans, emphasis,
 * links and images.
 *
 * Options (all booleans, default true):
 *   commonmark.enable_em, commonmark.enable_strong,
 *   commonmark.use_asterisk, commonmark.use_underscore
 */
class CommonMarkCoreExtension : public Extension
{
public:
    QString name() const override { return QStringLiteral("commonmark"); }
    void validateConfiguration(const Configuration& config) const override;
    void registerInto(Environment& environment) override;
};

}
