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
#include "nikud_environment.h"
#include "nikud_inlineparser.h"
#include "nikud_mention.h"
#include "nikud_references.h"
#include "nikud_smartpunct.h"
#include "nikud_strikethrough.h"
#include "nikud_version.h"
#include "nikud_xmlrenderer.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTextStream>

#include <cstdio>
#include <memory>
#include <optional>

static std::optional<QByteArray> readInput(const QString& fileName)
{
    QFile file;
    bool ok;
    if (fileName.isEmpty() || fileName == QStringLiteral("-")) {
        ok = file.open(stdin, QIODevice::ReadOnly);
    }
    else {
        file.setFileName(fileName);
        ok = file.open(QIODevice::ReadOnly);
    }

    if (!ok) {
        qWarning() << "Failed to open" << (fileName.isEmpty() ? QStringLiteral("standard input") : fileName) << ":" << file.errorString();
        return std::nullopt;
    }
    return file.readAll();
}

static QVariantMap loadConfig(const QString& fileName)
{
    QFile file(fileName);
    if (!file.open(QIODevice::ReadOnly)) {
        throw nikud::ConfigurationError(QStringLiteral("--config"),
            QStringLiteral("can not read %1: %2").arg(fileName, file.errorString()));
    }

    QJsonParseError error;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &error);
    if (doc.isNull()) {
        throw nikud::ConfigurationError(QStringLiteral("--config"),
            QStringLiteral("%1 at offset %2").arg(error.errorString()).arg(error.offset));
    }
    if (!doc.isObject()) {
        throw nikud::ConfigurationError(QStringLiteral("--config"), QStringLiteral("expected a JSON object"));
    }
    return doc.object().toVariantMap();
}

static void addReferences(nikud::ReferenceMap& referenceMap, const QStringList& definitions)
{
    for (const QString& definition : definitions) {
        qsizetype pos = definition.indexOf(QLatin1Char('='));
        if (pos <= 0) {
            qWarning() << "Ignoring malformed reference definition" << definition;
            continue;
        }

        nikud::Reference reference(definition.left(pos), definition.mid(pos + 1), QString());
        if (!referenceMap.add(reference)) {
            qDebug() << "Reference" << reference.label() << "already defined";
        }
    }
}

/*
 * Minimal block splitting: paragraphs are separated by blank lines. Line
 * indentation and trailing whitespace at the end of a paragraph are not part
 * of its inline content.
 */
static QStringList splitParagraphs(const QString& text)
{
    QStringList result;
    QStringList current;

    auto flush = [&]() {
        if (!current.isEmpty()) {
            QString paragraph = current.join(QLatin1Char('\n'));
            while (paragraph.endsWith(QLatin1Char(' ')) || paragraph.endsWith(QLatin1Char('\t'))) {
                paragraph.chop(1);
            }
            result.append(paragraph);
            current.clear();
        }
    };

    const QStringList lines = text.split(QLatin1Char('\n'));
    for (QString line : lines) {
        if (line.endsWith(QLatin1Char('\r'))) {
            line.chop(1);
        }

        if (line.trimmed().isEmpty()) {
            flush();
            continue;
        }

        qsizetype indent = 0;
        while (indent < line.size() && (line[indent] == QLatin1Char(' ') || line[indent] == QLatin1Char('\t'))) {
            indent++;
        }
        current.append(line.mid(indent));
    }
    flush();

    return result;
}

int main(int argc, char** argv)
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("nikud");
    QCoreApplication::setApplicationVersion(nikud::NIKUD_VERSION);

    QCommandLineParser parser;
    parser.setApplicationDescription("Parse the inline content of Markdown paragraphs and print the resulting tree as XML");
    parser.addPositionalArgument("file", "Markdown file to parse (standard input if omitted)");
    parser.addOptions({
        QCommandLineOption{ "config", "JSON configuration file", "json" },
        QCommandLineOption{ "reference", "Link reference definition, may be repeated", "label=url" },
        QCommandLineOption{ "strikethrough", "Enable strikethrough" },
        QCommandLineOption{ "smart-punct", "Enable smart punctuation" },
        QCommandLineOption{ "mentions", "Enable mentions (GitHub handles unless configured otherwise)" }
    });
    parser.addVersionOption();
    parser.addHelpOption();
    parser.process(app);

    std::unique_ptr<nikud::Environment> environment = nikud::Environment::createCommonMarkEnvironment();
    try {
        if (parser.isSet("strikethrough")) {
            environment->addExtension(std::make_shared<nikud::StrikethroughExtension>());
        }
        if (parser.isSet("smart-punct")) {
            environment->addExtension(std::make_shared<nikud::SmartPunctExtension>());
        }
        if (parser.isSet("mentions")) {
            environment->addExtension(std::make_shared<nikud::MentionExtension>());
        }
        if (parser.isSet("config")) {
            environment->mergeConfig(loadConfig(parser.value("config")));
        }
    }
    catch (const nikud::ConfigurationError& e) {
        qWarning() << "Configuration error:" << e.what();
        return 1;
    }

    if (parser.isSet("mentions") && !environment->configuration().contains(QStringLiteral("mentions"))) {
        environment->addInlineParser(nikud::MentionParser::createGitHubHandleParser());
    }

    nikud::ReferenceMap referenceMap;
    addReferences(referenceMap, parser.values("reference"));

    QString fileName;
    if (!parser.positionalArguments().isEmpty()) {
        fileName = parser.positionalArguments().at(0);
    }

    std::optional<QByteArray> input = readInput(fileName);
    if (!input) {
        return 1;
    }

    nikud::NodeTree tree;
    nikud::InlineParserEngine engine(*environment);

    const QStringList paragraphs = splitParagraphs(QString::fromUtf8(input.value()));
    for (const QString& text : paragraphs) {
        nikud::NodeId paragraph = tree.createNode(nikud::NodeKind::PARAGRAPH);
        tree.appendChild(tree.root(), paragraph);
        engine.parse(text, tree, paragraph, referenceMap);
    }

    QTextStream out(stdout);
    out << nikud::XmlRenderer().renderDocument(tree);

    return 0;
}
