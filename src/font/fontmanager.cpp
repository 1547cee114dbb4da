/*
 * fontmanager.cpp — Font resolution, loading, metrics and subsetting
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "fontmanager.h"
#include "sfnt.h"

#include <QDebug>
#include <QFile>

#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_TRUETYPE_TABLES_H
#include FT_TRUETYPE_TAGS_H

#include <hb.h>
#include <hb-ft.h>

#include <fontconfig/fontconfig.h>

#include <algorithm>

FontFace::~FontFace()
{
    if (hbFont) {
        hb_font_destroy(hbFont);
        hbFont = nullptr;
    }
    if (ftFace) {
        FT_Done_Face(ftFace);
        ftFace = nullptr;
    }
}

FontManager::FontManager(QObject *parent)
    : QObject(parent)
{
    FT_Error err = FT_Init_FreeType(&m_ftLibrary);
    if (err) {
        qWarning() << "FontManager: Failed to initialize FreeType:" << err;
        m_ftLibrary = nullptr;
    }
}

FontManager::~FontManager()
{
    // m_facesByPath owns the faces; m_faces may alias one file under
    // several keys when fontconfig falls back to the same file.
    m_faces.clear();
    qDeleteAll(m_facesByPath);
    m_facesByPath.clear();
    if (m_ftLibrary) {
        FT_Done_FreeType(m_ftLibrary);
        m_ftLibrary = nullptr;
    }
}

// Walks fontconfig's sorted candidates and returns the best TrueType match,
// so a missing family still resolves to a usable fallback.
QString FontManager::resolveFontPath(const QString &family, bool bold) const
{
    FcConfig *config = FcInitLoadConfigAndFonts();
    if (!config)
        return {};

    FcPattern *pat = FcPatternCreate();
    const QByteArray familyUtf8 = family.toUtf8();
    FcPatternAddString(pat, FC_FAMILY,
                       reinterpret_cast<const FcChar8 *>(familyUtf8.constData()));
    FcPatternAddInteger(pat, FC_WEIGHT, bold ? FC_WEIGHT_BOLD : FC_WEIGHT_REGULAR);
    FcPatternAddInteger(pat, FC_SLANT, FC_SLANT_ROMAN);
    FcPatternAddBool(pat, FC_SCALABLE, FcTrue);

    FcConfigSubstitute(config, pat, FcMatchPattern);
    FcDefaultSubstitute(pat);

    FcResult fcResult;
    FcFontSet *candidates = FcFontSort(config, pat, FcTrue, nullptr, &fcResult);
    QString path;
    if (candidates) {
        for (int i = 0; i < candidates->nfont && path.isEmpty(); ++i) {
            FcPattern *font = candidates->fonts[i];
            FcChar8 *format = nullptr;
            FcChar8 *file = nullptr;
            if (FcPatternGetString(font, FC_FONTFORMAT, 0, &format) != FcResultMatch
                || qstrcmp(reinterpret_cast<const char *>(format), "TrueType") != 0)
                continue;
            if (FcPatternGetString(font, FC_FILE, 0, &file) == FcResultMatch && file)
                path = QString::fromUtf8(reinterpret_cast<const char *>(file));
        }
        FcFontSetDestroy(candidates);
    }
    FcPatternDestroy(pat);
    FcConfigDestroy(config);
    return path;
}

FontFace *FontManager::loadFont(const QString &family, bool bold)
{
    FontKey key{family, bold};
    if (auto *existing = m_faces.value(key))
        return existing;

    QString path = resolveFontPath(family, bold);
    if (path.isEmpty()) {
        qWarning() << "FontManager: Could not resolve a TrueType font for" << family
                   << (bold ? "bold" : "regular");
        return nullptr;
    }

    FontFace *face = loadFontFromPath(path, 0);
    if (face)
        m_faces.insert(key, face);
    return face;
}

FontFace *FontManager::loadFontFromPath(const QString &filePath, int faceIndex)
{
    QString cacheKey = filePath + QLatin1Char(':') + QString::number(faceIndex);
    if (auto *existing = m_facesByPath.value(cacheKey))
        return existing;

    if (!m_ftLibrary)
        return nullptr;

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "FontManager: Cannot open font file:" << filePath;
        return nullptr;
    }

    auto *face = new FontFace;
    face->filePath = filePath;
    face->faceIndex = faceIndex;
    face->rawData = file.readAll();

    FT_Error err = FT_New_Memory_Face(
        m_ftLibrary,
        reinterpret_cast<const FT_Byte *>(face->rawData.constData()),
        face->rawData.size(),
        faceIndex,
        &face->ftFace);
    if (err) {
        qWarning() << "FontManager: FreeType failed to load:" << filePath << "error:" << err;
        delete face;
        return nullptr;
    }

    FT_ULong glyfLength = 0;
    if (!FT_IS_SFNT(face->ftFace)
        || FT_Load_Sfnt_Table(face->ftFace, TTAG_glyf, 0, nullptr, &glyfLength) != 0) {
        qWarning() << "FontManager: Not a TrueType-outline font:" << filePath;
        delete face;
        return nullptr;
    }

    face->hbFont = hb_ft_font_create_referenced(face->ftFace);
    if (!face->hbFont) {
        qWarning() << "FontManager: HarfBuzz font creation failed:" << filePath;
        delete face;
        return nullptr;
    }

    m_facesByPath.insert(cacheKey, face);
    return face;
}

void FontManager::markGlyphUsed(FontFace *face, uint glyphId)
{
    if (face)
        face->usedGlyphs.insert(glyphId);
}

QList<uint> FontManager::usedGlyphs(FontFace *face) const
{
    if (!face)
        return {};
    QList<uint> glyphs(face->usedGlyphs.cbegin(), face->usedGlyphs.cend());
    std::sort(glyphs.begin(), glyphs.end());
    return glyphs;
}

sfnt::SubsetResult FontManager::subsetFont(FontFace *face) const
{
    if (!face || face->rawData.isEmpty())
        return {};
    return sfnt::subsetFace(face->rawData, usedGlyphs(face), face->faceIndex);
}

// --- Metrics ---

static qreal ftUnitsToPoints(FT_Face face, FT_Long units, qreal sizePoints)
{
    if (!face || face->units_per_EM == 0)
        return 0;
    return static_cast<qreal>(units) * sizePoints / face->units_per_EM;
}

qreal FontManager::ascent(FontFace *face, qreal sizePoints) const
{
    if (!face || !face->ftFace) return sizePoints * 0.8;
    return ftUnitsToPoints(face->ftFace, face->ftFace->ascender, sizePoints);
}

qreal FontManager::descent(FontFace *face, qreal sizePoints) const
{
    if (!face || !face->ftFace) return sizePoints * 0.2;
    // FreeType descent is negative; return as positive
    return -ftUnitsToPoints(face->ftFace, face->ftFace->descender, sizePoints);
}

// Unhinted advance in design units, scaled linearly.
qreal FontManager::glyphWidth(FontFace *face, uint glyphId, qreal sizePoints) const
{
    if (!face || !face->ftFace) return 0;
    FT_Error err = FT_Load_Glyph(face->ftFace, glyphId,
                                 FT_LOAD_NO_SCALE | FT_LOAD_NO_BITMAP);
    if (err) return 0;
    return ftUnitsToPoints(face->ftFace, face->ftFace->glyph->advance.x, sizePoints);
}

qreal FontManager::capHeight(FontFace *face, qreal sizePoints) const
{
    if (!face || !face->ftFace) return sizePoints * 0.7;
    auto *os2 = reinterpret_cast<TT_OS2 *>(
        FT_Get_Sfnt_Table(face->ftFace, FT_SFNT_OS2));
    if (os2 && os2->sCapHeight > 0)
        return ftUnitsToPoints(face->ftFace, os2->sCapHeight, sizePoints);
    return sizePoints * 0.7;
}

qreal FontManager::unitsPerEm(FontFace *face) const
{
    if (!face || !face->ftFace || face->ftFace->units_per_EM == 0) return 1000;
    return face->ftFace->units_per_EM;
}

QString FontManager::postScriptName(FontFace *face) const
{
    if (!face || !face->ftFace) return {};
    const char *psName = FT_Get_Postscript_Name(face->ftFace);
    return psName ? QString::fromLatin1(psName) : QStringLiteral("Unknown");
}

int FontManager::fontFlags(FontFace *face) const
{
    if (!face || !face->ftFace) return 0;
    // PDF font flags (PDF32000-2008, Table 123)
    int flags = 1 << 5; // Nonsymbolic
    if (FT_IS_FIXED_WIDTH(face->ftFace))
        flags |= 1 << 0; // FixedPitch
    if (face->ftFace->style_flags & FT_STYLE_FLAG_ITALIC)
        flags |= 1 << 6; // Italic
    return flags;
}

qreal FontManager::italicAngle(FontFace *face) const
{
    if (!face || !face->ftFace) return 0;
    auto *post = reinterpret_cast<TT_Postscript *>(
        FT_Get_Sfnt_Table(face->ftFace, FT_SFNT_POST));
    if (post)
        return static_cast<qreal>(post->italicAngle) / 65536.0;
    return 0;
}

QList<int> FontManager::fontBBox(FontFace *face) const
{
    if (!face || !face->ftFace)
        return {0, 0, 1000, 1000};
    const FT_BBox bbox = face->ftFace->bbox;
    const qreal upem = unitsPerEm(face);
    auto scale = [upem](FT_Pos v) { return static_cast<int>(v * 1000 / upem); };
    return {scale(bbox.xMin), scale(bbox.yMin), scale(bbox.xMax), scale(bbox.yMax)};
}
