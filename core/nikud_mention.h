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
#include "nikud_inlineparser.h"

#include <QMetaType>
#include <QRegularExpression>
#include <QString>

#include <functional>
#include <memory>

namespace nikud {

/**
 * A recognized mention, handed to a generator to decide where it links to.
 */
class Mention
{
public:
    Mention(const QString& name, const QString& prefix, const QString& identifier)
        : d_name(name)
        , d_prefix(prefix)
        , d_identifier(identifier)
        , d_label(prefix + identifier) {}

    QString name() const { return d_name; }
    QString prefix() const { return d_prefix; }
    QString identifier() const { return d_identifier; }

    QString url() const { return d_url; }
    void setUrl(const QString& url) { d_url = url; }
    bool hasUrl() const { return !d_url.isEmpty(); }

    QString label() const { return d_label; }
    void setLabel(const QString& label) { d_label = label; }

private:
    QString d_name;
    QString d_prefix;
    QString d_identifier;
    QString d_url;
    QString d_label;
};

class MentionGenerator
{
public:
    virtual ~MentionGenerator() = default;

    /**
     * Fill in the mention (at least its URL) and return it, or return
     * nullptr to leave the text as is.
     */
    virtual Mention* generateMention(Mention& mention) = 0;
};

using MentionGeneratorFunction = std::function<Mention*(Mention&)>;

class StringTemplateLinkGenerator : public MentionGenerator
{
public:
    explicit StringTemplateLinkGenerator(const QString& urlTemplate): d_urlTemplate(urlTemplate) {}

    Mention* generateMention(Mention& mention) override;

private:
    QString d_urlTemplate;
};

class CallbackGenerator : public MentionGenerator
{
public:
    explicit CallbackGenerator(MentionGeneratorFunction callback): d_callback(std::move(callback)) {}

    Mention* generateMention(Mention& mention) override;

private:
    MentionGeneratorFunction d_callback;
};

class MentionParser : public InlineParser
{
public:
    MentionParser(const QString& name,
                  const QString& prefix,
                  const QString& pattern,
                  std::shared_ptr<MentionGenerator> generator);

    static std::shared_ptr<MentionParser> createGitHubHandleParser();
    static std::shared_ptr<MentionParser> createTwitterHandleParser();

    QList<QChar> characters() const override { return { d_prefix.front() }; }
    bool parse(InlineParserContext& context) override;

private:
    QString d_name;
    QString d_prefix;
    QRegularExpression d_regex;
    std::shared_ptr<MentionGenerator> d_generator;
};

/**
 * Mention parsers configured under the "mentions" section, one per entry:
 *
 *   mentions.<name>.prefix     non empty string
 *   mentions.<name>.pattern    regular expression for the identifier
 *   mentions.<name>.generator  URL template with %s, a
 *                              MentionGeneratorFunction or a
 *                              std::shared_ptr<MentionGenerator>
 */
class MentionExtension : public Extension
{
public:
    QString name() const override { return QStringLiteral("mentions"); }
    void validateConfiguration(const Configuration& config) const override;
    void registerInto(Environment& environment) override;

    static QList<std::shared_ptr<MentionParser>> parsersFromConfiguration(const Configuration& config);
};

}

Q_DECLARE_METATYPE(nikud::MentionGeneratorFunction)
Q_DECLARE_METATYPE(std::shared_ptr<nikud::MentionGenerator>)
