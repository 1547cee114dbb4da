/*
 * sfnt.h — TrueType subsetting for embedded CID fonts
 *
 * Subsets keep the original glyph IDs (HB_SUBSET_FLAGS_RETAIN_GIDS), so the
 * content streams can address glyphs with /CIDToGIDMap /Identity.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TICKETREPORT_SFNT_H
#define TICKETREPORT_SFNT_H

#include <QByteArray>
#include <QList>

namespace sfnt {

struct SubsetResult {
    QByteArray fontData;
    bool success = false;
};

/// Glyph 0 (.notdef) is always retained.
SubsetResult subsetFace(const QByteArray &fontData, const QList<uint> &glyphIds,
                        int faceIndex = 0);

/// Six-letter subset tag ("ABCDEF+") derived from the glyph set, so that
/// the same subset always gets the same BaseFont name.
QByteArray subsetTag(const QList<uint> &glyphIds);

} // namespace sfnt

#endif // TICKETREPORT_SFNT_H
