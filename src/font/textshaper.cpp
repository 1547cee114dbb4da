/*
 * textshaper.cpp — HarfBuzz shaping of single-line report text
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "textshaper.h"
#include "fontmanager.h"

#include <hb.h>
#include <hb-ft.h>

TextShaper::TextShaper(FontManager *fontManager)
    : m_fontManager(fontManager)
{
}

ShapedRun TextShaper::shape(const QString &text, FontFace *face, qreal fontSize,
                            bool markUsed) const
{
    ShapedRun shaped;
    shaped.font = face;
    shaped.fontSize = fontSize;
    if (text.isEmpty() || !face || !face->hbFont)
        return shaped;

    // Shape at the nominal size in 26.6 units, no hinting
    const int scale = static_cast<int>(fontSize * 64);
    FT_Set_Char_Size(face->ftFace, static_cast<FT_F26Dot6>(scale), 0, 72, 0);
    hb_ft_font_changed(face->hbFont);
    hb_font_set_scale(face->hbFont, scale, scale);
    hb_ft_font_set_load_flags(face->hbFont, FT_LOAD_NO_HINTING);

    hb_buffer_t *buf = hb_buffer_create();
    hb_buffer_add_utf16(buf, text.utf16(), text.length(), 0, text.length());
    hb_buffer_guess_segment_properties(buf);
    hb_buffer_set_language(buf, hb_language_from_string("pt", -1));
    hb_buffer_set_cluster_level(buf, HB_BUFFER_CLUSTER_LEVEL_MONOTONE_CHARACTERS);

    const char *shapers[] = {"ot", "fallback", nullptr};
    hb_shape_full(face->hbFont, buf, nullptr, 0, shapers);

    unsigned int count = hb_buffer_get_length(buf);
    hb_glyph_info_t *infos = hb_buffer_get_glyph_infos(buf, nullptr);
    hb_glyph_position_t *positions = hb_buffer_get_glyph_positions(buf, nullptr);

    shaped.glyphs.reserve(static_cast<int>(count));
    for (unsigned int i = 0; i < count; ++i) {
        ShapedGlyph g;
        g.glyphId = infos[i].codepoint;
        g.xAdvance = positions[i].x_advance / 64.0;
        g.xOffset = positions[i].x_offset / 64.0;
        g.yOffset = positions[i].y_offset / 64.0;
        g.cluster = static_cast<int>(infos[i].cluster);
        if (markUsed)
            m_fontManager->markGlyphUsed(face, g.glyphId);
        shaped.glyphs.append(g);
    }

    hb_buffer_destroy(buf);
    return shaped;
}
