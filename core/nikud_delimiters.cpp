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
#include "nikud_delimiters.h"

#include <stdexcept>

namespace nikud {

void DelimiterProcessorCollection::add(std::shared_ptr<DelimiterProcessor> processor)
{
    QChar opening = processor->openingCharacter();
    QChar closing = processor->closingCharacter();

    if (d_processors.contains(opening) || (closing != opening && d_processors.contains(closing))) {
        throw std::logic_error(QStringLiteral("Delimiter processor for character '%1' already exists")
            .arg(opening).toStdString());
    }

    d_processors.insert(opening, processor);
    if (closing != opening) {
        d_processors.insert(closing, processor);
    }
}

DelimiterProcessor* DelimiterProcessorCollection::processorFor(QChar ch) const
{
    auto it = d_processors.constFind(ch);
    if (it == d_processors.constEnd()) {
        return nullptr;
    }
    return it.value().get();
}

qsizetype DelimiterStack::count() const
{
    qsizetype result = 0;
    for (Delimiter* d = d_top; d != nullptr; d = d->d_previous) {
        result++;
    }
    return result;
}

qsizetype DelimiterStack::activeCount(const Delimiter* stackBottom) const
{
    qsizetype result = 0;
    for (Delimiter* d = d_top; d != nullptr && d != stackBottom; d = d->d_previous) {
        if (d->isActive()) {
            result++;
        }
    }
    return result;
}

Delimiter* DelimiterStack::push(const Delimiter& delimiter)
{
    d_storage.push_back(std::make_unique<Delimiter>(delimiter));
    Delimiter* d = d_storage.back().get();

    d->d_previous = d_top;
    d->d_next = nullptr;
    d->d_inStack = true;
    if (d_top != nullptr) {
        d_top->d_next = d;
    }
    d_top = d;
    return d;
}

Delimiter* DelimiterStack::searchByCharacter(const QList<QChar>& characters) const
{
    Delimiter* opener = d_top;
    while (opener != nullptr) {
        if (characters.contains(opener->character())) {
            break;
        }
        opener = opener->d_previous;
    }
    return opener;
}

void DelimiterStack::removeDelimiter(Delimiter* delimiter)
{
    // Already removed
    if (!delimiter->d_inStack) {
        return;
    }

    if (delimiter->d_previous != nullptr) {
        delimiter->d_previous->d_next = delimiter->d_next;
    }

    if (delimiter->d_next == nullptr) {
        // top of stack
        d_top = delimiter->d_previous;
    }
    else {
        delimiter->d_next->d_previous = delimiter->d_previous;
    }

    delimiter->d_previous = nullptr;
    delimiter->d_next = nullptr;
    delimiter->d_inStack = false;
}

void DelimiterStack::removeDelimiterAndNode(Delimiter* delimiter)
{
    d_tree.detach(delimiter->node());
    removeDelimiter(delimiter);
}

void DelimiterStack::removeDelimitersBetween(Delimiter* opener, Delimiter* closer)
{
    Delimiter* delimiter = closer->d_previous;
    while (delimiter != nullptr && delimiter != opener) {
        Delimiter* previous = delimiter->d_previous;
        removeDelimiter(delimiter);
        delimiter = previous;
    }
}

void DelimiterStack::removeEarlierMatches(QChar ch)
{
    for (Delimiter* opener = d_top; opener != nullptr; opener = opener->d_previous) {
        if (opener->character() == ch) {
            opener->deactivate();
        }
    }
}

void DelimiterStack::removeAll(const Delimiter* stackBottom)
{
    while (d_top != nullptr && d_top != stackBottom) {
        removeDelimiter(d_top);
    }
}

Delimiter* DelimiterStack::findEarliest(const Delimiter* stackBottom) const
{
    Delimiter* delimiter = d_top;
    while (delimiter != nullptr && delimiter->d_previous != stackBottom) {
        delimiter = delimiter->d_previous;
    }
    return delimiter;
}

void DelimiterStack::processDelimiters(const Delimiter* stackBottom, const DelimiterProcessorCollection& processors)
{
    // Per closing character, the lowest delimiter worth searching for an
    // opener. Anything at or below it is known not to match.
    QHash<QChar, const Delimiter*> openersBottom;

    // Find first closer above stackBottom
    Delimiter* closer = findEarliest(stackBottom);

    // Move forward, looking for closers, and handling each
    while (closer != nullptr) {
        QChar delimiterChar = closer->character();

        DelimiterProcessor* processor = processors.processorFor(delimiterChar);
        if (!closer->canClose() || processor == nullptr) {
            closer = closer->d_next;
            continue;
        }

        QChar openingChar = processor->openingCharacter();
        const Delimiter* bottom = openersBottom.value(delimiterChar, nullptr);

        int useDelims = 0;
        bool openerFound = false;
        bool potentialOpenerFound = false;

        Delimiter* opener = closer->d_previous;
        while (opener != nullptr && opener != stackBottom && opener != bottom) {
            if (opener->canOpen() && opener->character() == openingChar) {
                potentialOpenerFound = true;
                useDelims = processor->delimiterUse(*opener, *closer);
                if (useDelims > 0) {
                    openerFound = true;
                    break;
                }
            }
            opener = opener->d_previous;
        }

        if (!openerFound) {
            if (!potentialOpenerFound) {
                // Only when there was not even a candidate opener. One that
                // was rejected for its length (rule of three) may still pair
                // with a later closer.
                openersBottom.insert(delimiterChar, closer->d_previous);

                Delimiter* following = closer->d_next;
                if (!closer->canOpen()) {
                    // A closer that can't open is useless once we know it has
                    // no opener
                    removeDelimiter(closer);
                }
                closer = following;
            }
            else {
                closer = closer->d_next;
            }
            continue;
        }

        NodeId openerNode = opener->node();
        NodeId closerNode = closer->node();

        // Remove the used delimiters from the stack entries and placeholder nodes
        opener->setLength(opener->length() - useDelims);
        closer->setLength(closer->length() - useDelims);

        QString& openerText = d_tree.node(openerNode).literal;
        openerText.chop(useDelims);
        QString& closerText = d_tree.node(closerNode).literal;
        closerText.chop(useDelims);

        removeDelimitersBetween(opener, closer);

        // The processor re-parents the nodes between opener and closer, so
        // make them contiguous first
        d_tree.mergeTextNodesBetweenExclusive(openerNode, closerNode);
        processor->process(d_tree, openerNode, closerNode, useDelims);

        // No delimiter characters left, so the delimiter and the now empty
        // placeholder go away
        if (opener->length() == 0) {
            removeDelimiterAndNode(opener);
        }

        if (closer->length() == 0) {
            Delimiter* following = closer->d_next;
            removeDelimiterAndNode(closer);
            closer = following;
        }
    }

    removeAll(stackBottom);
}

}
