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

#include "nikud_delimiters.h"
#include "nikud_environment.h"

namespace nikud {

class StrikethroughNodeType : public CustomNodeType
{
public:
    QString name() const override { return QStringLiteral("strikethrough"); }

    static std::shared_ptr<const CustomNodeType> instance();
};

/**
 * `~text~` and `~~text~~`. Runs only pair with a run of the same length.
 */
class StrikethroughDelimiterProcessor : public DelimiterProcessor
{
public:
    QChar openingCharacter() const override { return QLatin1Char('~'); }
    QChar closingCharacter() const override { return QLatin1Char('~'); }
    int minLength() const override { return 1; }

    int delimiterUse(const Delimiter& opener, const Delimiter& closer) const override;
    void process(NodeTree& tree, NodeId openerNode, NodeId closerNode, int delimiterUse) override;
};

class StrikethroughExtension : public Extension
{
public:
    QString name() const override { return QStringLiteral("strikethrough"); }
    void validateConfiguration(const Configuration&) const override {}
    void registerInto(Environment& environment) override;
};

}
