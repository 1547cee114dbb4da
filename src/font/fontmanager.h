/*
 * fontmanager.h — Font resolution, loading, metrics and subsetting
 *
 * fontconfig resolves a family to a TrueType file, FreeType provides the
 * metrics and the charmap, HarfBuzz the shaping font.  Only TrueType
 * (glyf) outlines are accepted because faces are embedded as CIDFontType2.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TICKETREPORT_FONTMANAGER_H
#define TICKETREPORT_FONTMANAGER_H

#include <QHash>
#include <QList>
#include <QObject>
#include <QSet>
#include <QString>

#include <ft2build.h>
#include FT_FREETYPE_H

#include <hb.h>

struct FontKey {
    QString family;
    bool bold;

    bool operator==(const FontKey &o) const
    {
        return family == o.family && bold == o.bold;
    }
};

inline size_t qHash(const FontKey &k, size_t seed = 0)
{
    return qHash(k.family, seed) ^ qHash(k.bold, seed);
}

struct FontFace {
    FT_Face ftFace = nullptr;
    hb_font_t *hbFont = nullptr;
    QString filePath;
    int faceIndex = 0;
    QByteArray rawData; // kept alive for FreeType/HarfBuzz

    QSet<uint> usedGlyphs;

    ~FontFace();
};

namespace sfnt { struct SubsetResult; }

class FontManager : public QObject {
    Q_OBJECT
public:
    explicit FontManager(QObject *parent = nullptr);
    ~FontManager() override;

    FontFace *loadFont(const QString &family, bool bold = false);
    FontFace *loadFontFromPath(const QString &filePath, int faceIndex = 0);

    void markGlyphUsed(FontFace *face, uint glyphId);
    /// Used glyph IDs in ascending order.
    QList<uint> usedGlyphs(FontFace *face) const;
    sfnt::SubsetResult subsetFont(FontFace *face) const;

    // Metrics (all in points at the given size)
    qreal ascent(FontFace *face, qreal sizePoints) const;
    qreal descent(FontFace *face, qreal sizePoints) const;
    qreal glyphWidth(FontFace *face, uint glyphId, qreal sizePoints) const;
    qreal capHeight(FontFace *face, qreal sizePoints) const;

    // Font info
    qreal unitsPerEm(FontFace *face) const;
    QString postScriptName(FontFace *face) const;
    int fontFlags(FontFace *face) const;
    qreal italicAngle(FontFace *face) const;

    // BBox in PDF units (per 1000 units = 1 em)
    QList<int> fontBBox(FontFace *face) const;

private:
    FT_Library m_ftLibrary = nullptr;
    QHash<FontKey, FontFace *> m_faces;
    QHash<QString, FontFace *> m_facesByPath;

    QString resolveFontPath(const QString &family, bool bold) const;
};

#endif // TICKETREPORT_FONTMANAGER_H
