/*
 * textfit.cpp — Single-line truncation and paragraph reflow
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "textfit.h"

#include <QDebug>

#include <unicode/brkiter.h>
#include <unicode/locid.h>
#include <unicode/unistr.h>

#include <memory>

namespace TextFit {

static void chopCharacter(QString &s)
{
    if (s.size() >= 2 && s.at(s.size() - 1).isLowSurrogate()
        && s.at(s.size() - 2).isHighSurrogate())
        s.chop(2);
    else
        s.chop(1);
}

static int nextCharacter(const QString &s, int pos)
{
    if (pos + 1 < s.size() && s.at(pos).isHighSurrogate()
        && s.at(pos + 1).isLowSurrogate())
        return pos + 2;
    return pos + 1;
}

static QString trimmedRight(const QString &s)
{
    int end = s.size();
    while (end > 0 && s.at(end - 1).isSpace())
        --end;
    return s.left(end);
}

QString elide(const TextMeasurer &measurer, const QString &text,
              const TextStyle &style, qreal maxWidth)
{
    if (measurer.textWidth(text, style) <= maxWidth)
        return text;

    // No room for the ellipsis: keep the longest prefix that fits
    const QString suffix = measurer.textWidth(kEllipsis, style) <= maxWidth
        ? kEllipsis : QString();

    QString truncated = text;
    while (!truncated.isEmpty()
           && measurer.textWidth(truncated + suffix, style) > maxWidth)
        chopCharacter(truncated);
    return truncated + suffix;
}

QList<int> lineBreakOpportunities(const QString &text)
{
    QList<int> breaks;
    if (text.isEmpty())
        return breaks;

    UErrorCode err = U_ZERO_ERROR;
    std::unique_ptr<icu::BreakIterator> iter(
        icu::BreakIterator::createLineInstance(icu::Locale("pt", "BR"), err));
    if (U_FAILURE(err) || !iter) {
        qWarning() << "TextFit: ICU line break iterator unavailable:" << u_errorName(err);
        // Break after every run of spaces
        for (int i = 1; i < text.size(); ++i) {
            if (text.at(i - 1).isSpace() && !text.at(i).isSpace())
                breaks.append(i);
        }
        breaks.append(text.size());
        return breaks;
    }

    icu::UnicodeString ustr(reinterpret_cast<const UChar *>(text.utf16()),
                            text.length());
    iter->setText(ustr);
    for (int32_t pos = iter->first(); pos != icu::BreakIterator::DONE;
         pos = iter->next()) {
        if (pos > 0)
            breaks.append(pos);
    }
    if (breaks.isEmpty() || breaks.last() != text.size())
        breaks.append(text.size());
    return breaks;
}

static void wrapParagraph(const TextMeasurer &measurer, const QString &para,
                          const TextStyle &style, qreal width, QStringList &lines)
{
    const QList<int> breaks = lineBreakOpportunities(para);

    int start = 0;
    int lastFit = -1;
    int i = 0;
    while (i < breaks.size()) {
        const int b = breaks.at(i);
        const QString candidate = trimmedRight(para.mid(start, b - start));
        if (measurer.textWidth(candidate, style) <= width) {
            lastFit = b;
            ++i;
            continue;
        }

        if (lastFit > start) {
            lines.append(trimmedRight(para.mid(start, lastFit - start)));
            start = lastFit;
            lastFit = -1;
            continue;
        }

        // The word alone is wider than the line
        int end = nextCharacter(para, start);
        while (end < b) {
            const int next = nextCharacter(para, end);
            if (measurer.textWidth(para.mid(start, next - start), style) > width)
                break;
            end = next;
        }
        lines.append(para.mid(start, end - start));
        start = end;
        lastFit = -1;
    }

    if (start < para.size())
        lines.append(trimmedRight(para.mid(start)));
}

QStringList wrap(const TextMeasurer &measurer, const QString &text,
                 const TextStyle &style, qreal width)
{
    QStringList lines;
    QString normalized = text;
    normalized.replace(QLatin1String("\r\n"), QLatin1String("\n"));
    normalized.replace(QLatin1Char('\r'), QLatin1Char('\n'));

    const QStringList paragraphs = normalized.split(QLatin1Char('\n'));
    for (const QString &para : paragraphs) {
        if (para.trimmed().isEmpty()) {
            lines.append(QString());
            continue;
        }
        wrapParagraph(measurer, para, style, width, lines);
    }
    return lines;
}

} // namespace TextFit
