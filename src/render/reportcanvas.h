/*
 * reportcanvas.h — Abstract drawing surface for report pages
 *
 * Declares the primitives the page composer draws with.  Each backend
 * (PDF, or a recording surface in tests) implements them in its native
 * API.
 *
 * All coordinates are in points in a top-down system with the origin at
 * the top-left corner of the page.  Backends flip to their native system
 * inside the primitive.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TICKETREPORT_REPORTCANVAS_H
#define TICKETREPORT_REPORTCANVAS_H

#include "textfit.h"

#include <QByteArray>
#include <QColor>
#include <QPointF>
#include <QRectF>
#include <QSizeF>
#include <QString>

/// A photo ready for embedding: baseline JPEG bytes plus pixel size.
struct LoadedImage {
    QByteArray jpegData;
    int width = 0;
    int height = 0;

    bool isNull() const { return jpegData.isEmpty() || width <= 0 || height <= 0; }
};

class ReportCanvas : public TextMeasurer
{
public:
    ~ReportCanvas() override;

    /// False when the surface cannot produce output at all (no usable font,
    /// writer failure).  The composer refuses to start on an invalid canvas.
    virtual bool isValid() const = 0;
    virtual QString errorString() const = 0;

    /// Starts a new page; the only way pages are added.
    virtual void beginPage() = 0;
    virtual int pageCount() const = 0;
    virtual QSizeF pageSize() const = 0;

    // --- Text metrics ---

    virtual qreal ascent(const TextStyle &style) const = 0;
    virtual qreal descent(const TextStyle &style) const = 0;

    // --- Drawing primitives ---

    /// Fill and/or stroke a rectangle; an invalid color skips that part.
    virtual void drawRect(const QRectF &rect, const QColor &fill,
                          const QColor &stroke = QColor(),
                          qreal strokeWidth = 0) = 0;

    virtual void drawRoundedRect(const QRectF &rect, qreal radius,
                                 const QColor &fill, const QColor &stroke = QColor(),
                                 qreal strokeWidth = 0) = 0;

    virtual void drawLine(const QPointF &p1, const QPointF &p2,
                          const QColor &color, qreal width = 0.5) = 0;

    /// Single line of text starting at @p x on @p baselineY.
    virtual void drawText(const QString &text, const TextStyle &style,
                          qreal x, qreal baselineY) = 0;

    /// Draws @p image stretched to @p destRect.
    virtual void drawImage(const QRectF &destRect, const LoadedImage &image) = 0;

    // --- Convenience built on the primitives ---

    /// @p x is the left edge, the center or the right edge depending on
    /// @p alignment (Qt::AlignLeft, Qt::AlignHCenter, Qt::AlignRight).
    void drawAlignedText(const QString &text, const TextStyle &style,
                         qreal x, qreal baselineY, Qt::Alignment alignment);
};

#endif // TICKETREPORT_REPORTCANVAS_H
