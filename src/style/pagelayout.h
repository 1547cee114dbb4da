/*
 * pagelayout.h — Fixed A4 report geometry
 *
 * Distances are specified in millimetres and exposed in points (72 dpi),
 * top-down from the page's top-left corner.  Card heights are sized for
 * the worst case (all optional rows present) so that nothing on the
 * summary page depends on the data.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TICKETREPORT_PAGELAYOUT_H
#define TICKETREPORT_PAGELAYOUT_H

#include <QSizeF>

namespace PageLayout {

constexpr qreal kMmToPt = 72.0 / 25.4;
constexpr qreal mm(qreal v) { return v * kMmToPt; }

// A4 portrait
constexpr qreal kPageWidth = 595.28;
constexpr qreal kPageHeight = 841.89;
inline QSizeF pageSize() { return QSizeF(kPageWidth, kPageHeight); }

constexpr qreal kMargin = mm(18);
constexpr qreal kContentWidth = kPageWidth - 2 * kMargin;

// --- Header / footer ---
constexpr qreal kHeaderBandHeight = mm(28);   // banner fill / rule position
constexpr qreal kHeaderHeight = mm(36);       // consumed height, content starts here
constexpr qreal kLogoTop = mm(7);
constexpr qreal kLogoMaxHeight = mm(16);
constexpr qreal kLogoMaxWidth = mm(40);
constexpr qreal kFooterRuleY = kPageHeight - mm(15);

// --- Shared cursor steps ---
constexpr qreal kSectionTitleHeight = mm(11);
constexpr qreal kRowHeight = mm(7);
constexpr qreal kCardPadding = mm(4);
constexpr qreal kLabelWidth = mm(26);
constexpr qreal kPageTitleHeight = mm(20);

// --- Summary page ---
constexpr qreal kColumnGap = mm(12);
constexpr qreal kColumnWidth = (kContentWidth - kColumnGap) / 2;
constexpr qreal kCardGap = mm(8);
constexpr qreal kTopCardHeight = mm(44);      // three rows
constexpr qreal kMiddleCardHeight = mm(58);   // up to five rows
constexpr qreal kTeamCardHeight = mm(76);     // two rows + four-line table
constexpr qreal kTableRowHeight = mm(6);

// --- Narrative pages ---
constexpr qreal kNarrativeLineHeight = mm(6);
constexpr qreal kNarrativeLimit = kPageHeight - mm(35);   // last usable baseline
constexpr qreal kNarrativeCardBottom = kPageHeight - mm(24);

// --- Photo pages ---
constexpr int kPhotosPerPage = 4;
constexpr int kPhotoColumns = 2;
constexpr qreal kPhotoGap = mm(12);
constexpr qreal kPhotoWidth = (kContentWidth - kPhotoGap) / 2;
constexpr qreal kPhotoHeight = kPhotoWidth * 0.65;
constexpr qreal kCaptionHeight = mm(10);
constexpr qreal kPhotoGridOffset = mm(16);    // below the page title bar

} // namespace PageLayout

#endif // TICKETREPORT_PAGELAYOUT_H
