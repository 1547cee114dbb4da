/*
 * reportcanvas.cpp — Abstract drawing surface for report pages
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "reportcanvas.h"

ReportCanvas::~ReportCanvas() = default;

void ReportCanvas::drawAlignedText(const QString &text, const TextStyle &style,
                                   qreal x, qreal baselineY, Qt::Alignment alignment)
{
    if (text.isEmpty())
        return;

    qreal left = x;
    if (alignment & Qt::AlignHCenter)
        left = x - textWidth(text, style) / 2.0;
    else if (alignment & Qt::AlignRight)
        left = x - textWidth(text, style);
    drawText(text, style, left, baselineY);
}
