/*
 * textfit.h — Single-line truncation and paragraph reflow
 *
 * Both operations are driven by an abstract measurer so that the composer
 * can be exercised against a fixed-advance measurer in tests and against
 * HarfBuzz-shaped glyph advances in production.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TICKETREPORT_TEXTFIT_H
#define TICKETREPORT_TEXTFIT_H

#include <QColor>
#include <QList>
#include <QString>
#include <QStringList>

struct TextStyle {
    enum Weight { Regular, Bold };

    Weight weight = Regular;
    qreal size = 9.0;  // points
    QColor color = Qt::black;

    bool operator==(const TextStyle &o) const
    {
        return weight == o.weight && qFuzzyCompare(size, o.size) && color == o.color;
    }
};

class TextMeasurer
{
public:
    virtual ~TextMeasurer() = default;

    /// Advance width of @p text in points, as it would be drawn.
    virtual qreal textWidth(const QString &text, const TextStyle &style) const = 0;
};

namespace TextFit {

inline const QString kEllipsis = QStringLiteral("...");

/// Returns @p text unmodified when it fits in @p maxWidth.  Otherwise drops
/// trailing characters one at a time until the remainder plus "..." fits.
/// Below the width of "..." itself the prefix is returned without it.
QString elide(const TextMeasurer &measurer, const QString &text,
              const TextStyle &style, qreal maxWidth);

/// Greedy reflow at ICU line-break opportunities.  Explicit newlines start a
/// new paragraph and blank lines are kept as empty strings.  A word wider
/// than @p width is split between characters.
QStringList wrap(const TextMeasurer &measurer, const QString &text,
                 const TextStyle &style, qreal width);

/// Offsets (exclusive of 0, inclusive of text.size()) where a line may end.
QList<int> lineBreakOpportunities(const QString &text);

} // namespace TextFit

#endif // TICKETREPORT_TEXTFIT_H
