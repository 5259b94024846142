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
#include "nikud_linkparsing.h"
#include "nikud_text_utils.h"

#include <QByteArray>

namespace nikud::links {

Q_GLOBAL_STATIC(QRegularExpression, LINK_DESTINATION_BRACES_REGEX,
    QStringLiteral(R"(<(?:[^<>\n\\\x{0}]|\\[\s\S])*>)"))

Q_GLOBAL_STATIC(QRegularExpression, LINK_TITLE_REGEX,
    QStringLiteral(R"("(?:\\[\s\S]|[^"\x{0}])*"|'(?:\\[\s\S]|[^'\x{0}])*'|\((?:\\[\s\S]|[^()\x{0}])*\))"))

Q_GLOBAL_STATIC(QRegularExpression, LINK_LABEL_REGEX,
    QStringLiteral(R"(\[(?:[^\\\[\]]|\\[\s\S]){0,999}\])"))

static constexpr QLatin1StringView URI_SAFE_CHARS = QLatin1StringView(";/?:@&=+$,-_.!~*'()#");

static bool isHexDigit(char ch)
{
    return (ch >= '0' && ch <= '9')
        || (ch >= 'A' && ch <= 'F')
        || (ch >= 'a' && ch <= 'f');
}

static bool isAsciiAlphaNumeric(char ch)
{
    return (ch >= '0' && ch <= '9')
        || (ch >= 'A' && ch <= 'Z')
        || (ch >= 'a' && ch <= 'z');
}

bool isEscapable(QChar ch)
{
    return utils::isAsciiPunctuation(ch);
}

QString unescape(const QString& text)
{
    if (!text.contains(QLatin1Char('\\'))) {
        return text;
    }

    QString result;
    result.reserve(text.size());

    for (qsizetype i = 0; i < text.size(); i++) {
        if (text[i] == QLatin1Char('\\') && i + 1 < text.size() && isEscapable(text[i + 1])) {
            i++;
        }
        result.append(text[i]);
    }
    return result;
}

QString normalizeUri(const QString& uri)
{
    QByteArray bytes = uri.toUtf8();
    QByteArray result;
    result.reserve(bytes.size());

    for (qsizetype i = 0; i < bytes.size(); i++) {
        char ch = bytes[i];
        uchar uch = static_cast<uchar>(ch);

        if (ch == '%' && i + 2 < bytes.size() && isHexDigit(bytes[i + 1]) && isHexDigit(bytes[i + 2])) {
            // Already encoded, keep as is
            result.append(bytes.mid(i, 3));
            i += 2;
        }
        else if (uch < 0x80 && (isAsciiAlphaNumeric(ch) || URI_SAFE_CHARS.contains(QLatin1Char(ch)))) {
            result.append(ch);
        }
        else {
            result.append('%');
            result.append(QByteArray::number(uch, 16).rightJustified(2, '0').toUpper());
        }
    }
    return QString::fromLatin1(result);
}

static std::optional<QString> manuallyParseLinkDestination(Cursor& cursor)
{
    qsizetype startPos = cursor.position();
    CursorState startState = cursor.saveState();

    int openParens = 0;
    QChar ch;
    while (!(ch = cursor.character()).isNull()) {
        if (ch == QLatin1Char('\\') && isEscapable(cursor.peek())) {
            cursor.advanceBy(2);
        }
        else if (ch == QLatin1Char('(')) {
            cursor.advance();
            openParens++;
        }
        else if (ch == QLatin1Char(')')) {
            if (openParens < 1) {
                break;
            }
            cursor.advance();
            openParens--;
        }
        else if (utils::isUnicodeWhitespace(ch) || ch.category() == QChar::Other_Control) {
            break;
        }
        else {
            cursor.advance();
        }
    }

    if (openParens != 0) {
        cursor.restoreState(startState);
        return std::nullopt;
    }

    // An empty destination is only allowed right before the closing paren
    if (cursor.position() == startPos && ch != QLatin1Char(')')) {
        cursor.restoreState(startState);
        return std::nullopt;
    }

    return cursor.substring(startPos, cursor.position() - startPos);
}

std::optional<QString> parseLinkDestination(Cursor& cursor)
{
    std::optional<QString> braced = cursor.match(*LINK_DESTINATION_BRACES_REGEX);
    if (braced) {
        // Chop off surrounding <..>
        return normalizeUri(unescape(braced->sliced(1, braced->size() - 2)));
    }

    if (cursor.character() == QLatin1Char('<')) {
        return std::nullopt;
    }

    std::optional<QString> destination = manuallyParseLinkDestination(cursor);
    if (!destination) {
        return std::nullopt;
    }
    return normalizeUri(unescape(destination.value()));
}

std::optional<QString> parseLinkTitle(Cursor& cursor)
{
    std::optional<QString> title = cursor.match(*LINK_TITLE_REGEX);
    if (!title) {
        return std::nullopt;
    }
    return unescape(title->sliced(1, title->size() - 2));
}

qsizetype parseLinkLabel(Cursor& cursor)
{
    std::optional<QString> label = cursor.match(*LINK_LABEL_REGEX);
    if (!label) {
        return 0;
    }
    return label->size();
}

}
