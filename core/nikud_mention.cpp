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
#include "nikud_mention.h"
#include "nikud_text_utils.h"

#include <QDebug>
#include <QSet>

namespace nikud {

static const QString GITHUB_HANDLE_PATTERN = QStringLiteral(R"([a-z\d](?:[a-z\d]|-(?=[a-z\d])){0,38}(?!\w))");
static const QString TWITTER_HANDLE_PATTERN = QStringLiteral(R"([A-Za-z0-9_]{1,15}(?!\w))");

Mention* StringTemplateLinkGenerator::generateMention(Mention& mention)
{
    QString url = d_urlTemplate;
    url.replace(QStringLiteral("%s"), mention.identifier());
    mention.setUrl(url);
    return &mention;
}

Mention* CallbackGenerator::generateMention(Mention& mention)
{
    if (!d_callback) {
        return nullptr;
    }
    return d_callback(mention);
}

MentionParser::MentionParser(const QString& name,
                             const QString& prefix,
                             const QString& pattern,
                             std::shared_ptr<MentionGenerator> generator)
    : d_name(name)
    , d_prefix(prefix)
    , d_generator(generator)
{
    Q_ASSERT(!prefix.isEmpty());

    d_regex.setPattern(QRegularExpression::escape(prefix) + QStringLiteral("(") + pattern + QStringLiteral(")"));
    d_regex.setPatternOptions(QRegularExpression::CaseInsensitiveOption | QRegularExpression::UseUnicodePropertiesOption);
}

std::shared_ptr<MentionParser> MentionParser::createGitHubHandleParser()
{
    return std::make_shared<MentionParser>(
        QStringLiteral("github_handle"),
        QStringLiteral("@"),
        GITHUB_HANDLE_PATTERN,
        std::make_shared<StringTemplateLinkGenerator>(QStringLiteral("https://github.com/%s")));
}

std::shared_ptr<MentionParser> MentionParser::createTwitterHandleParser()
{
    return std::make_shared<MentionParser>(
        QStringLiteral("twitter_handle"),
        QStringLiteral("@"),
        TWITTER_HANDLE_PATTERN,
        std::make_shared<StringTemplateLinkGenerator>(QStringLiteral("https://twitter.com/%s")));
}

bool MentionParser::parse(InlineParserContext& context)
{
    Cursor& cursor = context.cursor();

    // The prefix may not be glued to a preceding word, as in an email address
    QChar previous = cursor.peek(-1);
    if (!previous.isNull() && utils::isWordCharacter(previous)) {
        return false;
    }

    QRegularExpressionMatch match = cursor.matchAt(d_regex);
    if (!match.hasMatch()) {
        return false;
    }

    Mention mention(d_name, d_prefix, match.captured(1));
    Mention* generated = d_generator->generateMention(mention);
    if (generated == nullptr) {
        return false;
    }
    if (!generated->hasUrl()) {
        qWarning() << "Mention generator for" << d_name << "produced no URL for" << generated->identifier();
        return false;
    }

    cursor.advanceBy(match.capturedLength(0));

    NodeTree& tree = context.tree();
    NodeId label = tree.createText(generated->label());
    NodeId node = tree.createNode(NodeKind::MENTION);

    Node& n = tree.node(node);
    n.name = generated->name();
    n.prefix = generated->prefix();
    n.identifier = generated->identifier();
    n.url = generated->url();

    tree.appendChild(node, label);
    context.appendNode(node);
    return true;
}

static bool hasUnescapedSlash(const QString& pattern)
{
    for (qsizetype i = 0; i < pattern.size(); i++) {
        if (pattern[i] == QLatin1Char('\\')) {
            i++;
        }
        else if (pattern[i] == QLatin1Char('/')) {
            return true;
        }
    }
    return false;
}

static std::shared_ptr<MentionGenerator> generatorFromVariant(const QString& key, const QVariant& value)
{
    if (value.typeId() == QMetaType::QString) {
        return std::make_shared<StringTemplateLinkGenerator>(value.toString());
    }
    else if (value.metaType() == QMetaType::fromType<MentionGeneratorFunction>()) {
        MentionGeneratorFunction callback = value.value<MentionGeneratorFunction>();
        if (!callback) {
            throw ConfigurationError(key, QStringLiteral("the generator callback is empty"));
        }
        return std::make_shared<CallbackGenerator>(callback);
    }
    else if (value.metaType() == QMetaType::fromType<std::shared_ptr<MentionGenerator>>()) {
        std::shared_ptr<MentionGenerator> generator = value.value<std::shared_ptr<MentionGenerator>>();
        if (!generator) {
            throw ConfigurationError(key, QStringLiteral("the generator object is null"));
        }
        return generator;
    }

    throw ConfigurationError(key, QStringLiteral("expected a URL template string, a callback or a MentionGenerator, got %1")
        .arg(QString::fromLatin1(value.metaType().name())));
}

QList<std::shared_ptr<MentionParser>> MentionExtension::parsersFromConfiguration(const Configuration& config)
{
    static const QSet<QString> KNOWN_KEYS = {
        QStringLiteral("prefix"),
        QStringLiteral("pattern"),
        QStringLiteral("generator"),
    };

    QList<std::shared_ptr<MentionParser>> result;

    QVariant section = config.get(QStringLiteral("mentions"));
    if (!section.isValid()) {
        return result;
    }
    if (section.typeId() != QMetaType::QVariantMap) {
        throw ConfigurationError(QStringLiteral("mentions"), QStringLiteral("expected a map of mention definitions"));
    }

    const QVariantMap mentions = section.toMap();
    for (auto it = mentions.constBegin(); it != mentions.constEnd(); ++it) {
        QString entryKey = QStringLiteral("mentions.") + it.key();
        if (it.value().typeId() != QMetaType::QVariantMap) {
            throw ConfigurationError(entryKey, QStringLiteral("expected a map with prefix, pattern and generator"));
        }

        const QVariantMap entry = it.value().toMap();
        for (auto opt = entry.constBegin(); opt != entry.constEnd(); ++opt) {
            if (opt.key() == QStringLiteral("symbol")) {
                throw ConfigurationError(entryKey + QStringLiteral(".symbol"), QStringLiteral("no longer supported, use \"prefix\" instead"));
            }
            if (!KNOWN_KEYS.contains(opt.key())) {
                throw ConfigurationError(entryKey + QLatin1Char('.') + opt.key(), QStringLiteral("unknown option"));
            }
        }

        QVariant prefix = entry.value(QStringLiteral("prefix"));
        if (prefix.typeId() != QMetaType::QString || prefix.toString().isEmpty()) {
            throw ConfigurationError(entryKey + QStringLiteral(".prefix"), QStringLiteral("expected a non empty string"));
        }

        QString patternKey = entryKey + QStringLiteral(".pattern");
        QVariant pattern = entry.value(QStringLiteral("pattern"));
        if (pattern.typeId() != QMetaType::QString || pattern.toString().isEmpty()) {
            throw ConfigurationError(patternKey, QStringLiteral("expected a non empty string"));
        }
        if (hasUnescapedSlash(pattern.toString())) {
            throw ConfigurationError(patternKey, QStringLiteral("must be a bare pattern without delimiters or flags"));
        }

        QRegularExpression re(pattern.toString());
        if (!re.isValid()) {
            throw ConfigurationError(patternKey, QStringLiteral("invalid regular expression: %1").arg(re.errorString()));
        }

        QString generatorKey = entryKey + QStringLiteral(".generator");
        if (!entry.contains(QStringLiteral("generator"))) {
            throw ConfigurationError(generatorKey, QStringLiteral("missing"));
        }
        std::shared_ptr<MentionGenerator> generator = generatorFromVariant(generatorKey, entry.value(QStringLiteral("generator")));

        result.append(std::make_shared<MentionParser>(it.key(), prefix.toString(), pattern.toString(), generator));
    }
    return result;
}

void MentionExtension::validateConfiguration(const Configuration& config) const
{
    parsersFromConfiguration(config);
}

void MentionExtension::registerInto(Environment& environment)
{
    const QList<std::shared_ptr<MentionParser>> parsers = parsersFromConfiguration(environment.configuration());
    for (const auto& parser : parsers) {
        environment.addInlineParser(parser);
    }
}

}
