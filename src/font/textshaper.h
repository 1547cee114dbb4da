/*
 * textshaper.h — HarfBuzz shaping of single-line report text
 *
 * Report strings are short, single-direction runs in one face, so a run is
 * shaped as a whole with segment properties guessed from the text.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TICKETREPORT_TEXTSHAPER_H
#define TICKETREPORT_TEXTSHAPER_H

#include <QList>
#include <QString>

class FontManager;
struct FontFace;

struct ShapedGlyph {
    uint glyphId = 0;
    qreal xAdvance = 0;
    qreal xOffset = 0;
    qreal yOffset = 0;
    int cluster = 0; // character index in source text
};

struct ShapedRun {
    QList<ShapedGlyph> glyphs;
    FontFace *font = nullptr;
    qreal fontSize = 0;

    qreal width() const
    {
        qreal w = 0;
        for (const ShapedGlyph &g : glyphs)
            w += g.xAdvance;
        return w;
    }
};

class TextShaper {
public:
    explicit TextShaper(FontManager *fontManager);

    /// Shapes @p text; glyphs are recorded for subsetting only when
    /// @p markUsed is set, i.e. when the run is actually drawn.
    ShapedRun shape(const QString &text, FontFace *face, qreal fontSize,
                    bool markUsed) const;

private:
    FontManager *m_fontManager;
};

#endif // TICKETREPORT_TEXTSHAPER_H
