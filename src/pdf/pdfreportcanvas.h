/*
 * pdfreportcanvas.h — ReportCanvas backend that writes PDF
 *
 * Text is shaped with HarfBuzz and drawn with subset CID TrueType fonts
 * (Identity-H, with a ToUnicode CMap so the text stays searchable).
 * Photos are embedded as DCTDecode image XObjects.
 *
 * Pages are streamed: a page's content stream and page object are written
 * as soon as the next page begins, and image XObjects are written when
 * drawn, so no page keeps its photos in memory.  Fonts are written last,
 * once every glyph in use is known.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TICKETREPORT_PDFREPORTCANVAS_H
#define TICKETREPORT_PDFREPORTCANVAS_H

#include "fontmanager.h"
#include "pdfwriter.h"
#include "reportcanvas.h"
#include "textshaper.h"

#include <QList>

class PdfReportCanvas : public ReportCanvas
{
public:
    PdfReportCanvas(const QString &fontFamily, const QSizeF &pageSize);
    ~PdfReportCanvas() override;

    /// Written into the document information dictionary.
    void setTitle(const QString &title) { m_title = title; }

    bool isValid() const override;
    QString errorString() const override { return m_error; }

    void beginPage() override;
    int pageCount() const override { return m_pageObjs.size(); }
    QSizeF pageSize() const override { return m_pageSize; }

    qreal textWidth(const QString &text, const TextStyle &style) const override;
    qreal ascent(const TextStyle &style) const override;
    qreal descent(const TextStyle &style) const override;

    void drawRect(const QRectF &rect, const QColor &fill,
                  const QColor &stroke = QColor(), qreal strokeWidth = 0) override;
    void drawRoundedRect(const QRectF &rect, qreal radius,
                         const QColor &fill, const QColor &stroke = QColor(),
                         qreal strokeWidth = 0) override;
    void drawLine(const QPointF &p1, const QPointF &p2,
                  const QColor &color, qreal width = 0.5) override;
    void drawText(const QString &text, const TextStyle &style,
                  qreal x, qreal baselineY) override;
    void drawImage(const QRectF &destRect, const LoadedImage &image) override;

    /// Writes fonts, page tree and trailer and returns the document.
    /// Returns an empty array on failure; the canvas accepts no drawing
    /// afterwards.
    QByteArray finish();

private:
    struct EmbeddedFont {
        FontFace *face = nullptr;
        QByteArray pdfName;
        Pdf::ObjId objId = 0;
    };

    FontFace *faceFor(const TextStyle &style) const;
    const EmbeddedFont *embeddedFont(FontFace *face) const;
    bool canDraw() const;

    void flushPage();
    void writeFont(const EmbeddedFont &font);
    QByteArray buildToUnicodeCMap(FontFace *face) const;

    qreal pdfY(qreal y) const { return m_pageSize.height() - y; }
    static QByteArray pdfCoord(qreal v);
    static QByteArray colorOperator(const QColor &color, bool fill);

    FontManager m_fontManager;
    TextShaper m_shaper;
    FontFace *m_regular = nullptr;
    FontFace *m_bold = nullptr;
    QList<EmbeddedFont> m_fonts;

    QByteArray m_output;
    Pdf::Writer m_writer;
    QSizeF m_pageSize;
    QString m_title;
    QString m_error;
    bool m_finished = false;

    // Current page
    QList<Pdf::ObjId> m_pageObjs;
    bool m_pageOpen = false;
    QByteArray m_content;
    Pdf::ResourceDict m_resources;
    int m_imageCount = 0;
};

#endif // TICKETREPORT_PDFREPORTCANVAS_H
