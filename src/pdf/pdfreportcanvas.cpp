/*
 * pdfreportcanvas.cpp — ReportCanvas backend that writes PDF
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pdfreportcanvas.h"
#include "sfnt.h"

#include <QDebug>
#include <QMap>

#include <iterator>

#include <ft2build.h>
#include FT_FREETYPE_H

// Bezier control distance for a quarter circle
static constexpr qreal kKappa = 0.5522847498;

PdfReportCanvas::PdfReportCanvas(const QString &fontFamily, const QSizeF &pageSize)
    : m_shaper(&m_fontManager)
    , m_pageSize(pageSize)
{
    m_regular = m_fontManager.loadFont(fontFamily, false);
    if (!m_regular) {
        m_error = QStringLiteral("no usable TrueType font for family \"%1\"").arg(fontFamily);
        return;
    }
    m_bold = m_fontManager.loadFont(fontFamily, true);
    if (!m_bold) {
        qWarning() << "PdfReportCanvas: no bold face for" << fontFamily
                   << "- using the regular face";
        m_bold = m_regular;
    }

    // Object numbers of the fonts are fixed up front; the font objects
    // themselves are written by finish().
    for (FontFace *face : {m_regular, m_bold}) {
        if (embeddedFont(face))
            continue;
        EmbeddedFont ef;
        ef.face = face;
        ef.pdfName = "F" + QByteArray::number(m_fonts.size() + 1);
        m_fonts.append(ef);
    }

    if (!m_writer.openBuffer(&m_output)) {
        m_error = QStringLiteral("cannot open the PDF output buffer");
        return;
    }
    m_writer.writeHeader();
    for (EmbeddedFont &ef : m_fonts)
        ef.objId = m_writer.newObject();
}

PdfReportCanvas::~PdfReportCanvas() = default;

bool PdfReportCanvas::isValid() const
{
    return m_error.isEmpty() && m_regular;
}

bool PdfReportCanvas::canDraw() const
{
    return isValid() && m_pageOpen && !m_finished;
}

FontFace *PdfReportCanvas::faceFor(const TextStyle &style) const
{
    return style.weight == TextStyle::Bold ? m_bold : m_regular;
}

const PdfReportCanvas::EmbeddedFont *PdfReportCanvas::embeddedFont(FontFace *face) const
{
    for (const EmbeddedFont &ef : m_fonts) {
        if (ef.face == face)
            return &ef;
    }
    return nullptr;
}

// --- PDF coordinate helpers ---

QByteArray PdfReportCanvas::pdfCoord(qreal v)
{
    return QByteArray::number(v, 'f', 2);
}

QByteArray PdfReportCanvas::colorOperator(const QColor &color, bool fill)
{
    if (!color.isValid())
        return {};
    const QByteArray op = fill ? " rg\n" : " RG\n";
    return QByteArray::number(color.redF(), 'f', 3) + " "
         + QByteArray::number(color.greenF(), 'f', 3) + " "
         + QByteArray::number(color.blueF(), 'f', 3) + op;
}

// --- Pages ---

void PdfReportCanvas::beginPage()
{
    if (!isValid() || m_finished)
        return;
    if (m_pageOpen)
        flushPage();

    m_pageObjs.append(m_writer.newObject());
    m_content.clear();
    m_resources = Pdf::ResourceDict();
    m_pageOpen = true;
}

void PdfReportCanvas::flushPage()
{
    const Pdf::ObjId contentObj = m_writer.startObj();
    m_writer.write("<<\n");
    m_writer.endObjectWithStream(contentObj, m_content);

    const Pdf::ObjId pageObj = m_pageObjs.last();
    m_writer.startObj(pageObj);
    m_writer.write("<<\n/Type /Page\n/Parent " + Pdf::toObjRef(m_writer.pagesObj()) + "\n");
    m_writer.write("/MediaBox [0 0 " + pdfCoord(m_pageSize.width()) + " "
                   + pdfCoord(m_pageSize.height()) + "]\n");
    m_writer.write("/Resources ");
    m_writer.writeResourceDict(m_resources);
    m_writer.write("/Contents " + Pdf::toObjRef(contentObj) + "\n>>");
    m_writer.endObj(pageObj);

    m_content.clear();
    m_resources = Pdf::ResourceDict();
    m_pageOpen = false;
}

// --- Text metrics ---

qreal PdfReportCanvas::textWidth(const QString &text, const TextStyle &style) const
{
    if (text.isEmpty())
        return 0;
    return m_shaper.shape(text, faceFor(style), style.size, false).width();
}

qreal PdfReportCanvas::ascent(const TextStyle &style) const
{
    return m_fontManager.ascent(faceFor(style), style.size);
}

qreal PdfReportCanvas::descent(const TextStyle &style) const
{
    return m_fontManager.descent(faceFor(style), style.size);
}

// --- Drawing primitives ---

void PdfReportCanvas::drawRect(const QRectF &rect, const QColor &fill,
                               const QColor &stroke, qreal strokeWidth)
{
    if (!canDraw())
        return;

    const QByteArray path = pdfCoord(rect.x()) + " " + pdfCoord(pdfY(rect.bottom())) + " "
                          + pdfCoord(rect.width()) + " " + pdfCoord(rect.height()) + " re ";
    if (fill.isValid())
        m_content += "q\n" + colorOperator(fill, true) + path + "f\nQ\n";
    if (stroke.isValid() && strokeWidth > 0) {
        m_content += "q\n" + colorOperator(stroke, false) + pdfCoord(strokeWidth) + " w\n"
                   + path + "S\nQ\n";
    }
}

void PdfReportCanvas::drawRoundedRect(const QRectF &rect, qreal radius,
                                      const QColor &fill, const QColor &stroke,
                                      qreal strokeWidth)
{
    if (!canDraw())
        return;
    const bool doFill = fill.isValid();
    const bool doStroke = stroke.isValid() && strokeWidth > 0;
    if (!doFill && !doStroke)
        return;

    const qreal r = qBound(0.0, radius, qMin(rect.width(), rect.height()) / 2.0);
    if (r <= 0) {
        drawRect(rect, fill, stroke, strokeWidth);
        return;
    }

    // PDF space: (x0, y0) bottom-left, (x1, y1) top-right
    const qreal x0 = rect.left();
    const qreal x1 = rect.right();
    const qreal y0 = pdfY(rect.bottom());
    const qreal y1 = pdfY(rect.top());
    const qreal k = r * kKappa;

    auto pt = [](qreal x, qreal y) { return pdfCoord(x) + " " + pdfCoord(y) + " "; };

    QByteArray path;
    path += pt(x0 + r, y0) + "m\n";
    path += pt(x1 - r, y0) + "l\n";
    path += pt(x1 - r + k, y0) + pt(x1, y0 + r - k) + pt(x1, y0 + r) + "c\n";
    path += pt(x1, y1 - r) + "l\n";
    path += pt(x1, y1 - r + k) + pt(x1 - r + k, y1) + pt(x1 - r, y1) + "c\n";
    path += pt(x0 + r, y1) + "l\n";
    path += pt(x0 + r - k, y1) + pt(x0, y1 - r + k) + pt(x0, y1 - r) + "c\n";
    path += pt(x0, y0 + r) + "l\n";
    path += pt(x0, y0 + r - k) + pt(x0 + r - k, y0) + pt(x0 + r, y0) + "c\n";

    m_content += "q\n";
    if (doFill)
        m_content += colorOperator(fill, true);
    if (doStroke)
        m_content += colorOperator(stroke, false) + pdfCoord(strokeWidth) + " w\n";
    m_content += path;
    if (doFill && doStroke)
        m_content += "B\n";
    else if (doFill)
        m_content += "f\n";
    else
        m_content += "S\n";
    m_content += "Q\n";
}

void PdfReportCanvas::drawLine(const QPointF &p1, const QPointF &p2,
                               const QColor &color, qreal width)
{
    if (!canDraw() || !color.isValid())
        return;

    m_content += "q\n" + colorOperator(color, false);
    m_content += pdfCoord(width) + " w\n";
    m_content += pdfCoord(p1.x()) + " " + pdfCoord(pdfY(p1.y())) + " m "
               + pdfCoord(p2.x()) + " " + pdfCoord(pdfY(p2.y())) + " l S\n";
    m_content += "Q\n";
}

void PdfReportCanvas::drawText(const QString &text, const TextStyle &style,
                               qreal x, qreal baselineY)
{
    if (!canDraw() || text.isEmpty())
        return;

    FontFace *face = faceFor(style);
    const EmbeddedFont *ef = embeddedFont(face);
    if (!ef)
        return;

    const ShapedRun run = m_shaper.shape(text, face, style.size, true);
    if (run.glyphs.isEmpty())
        return;

    m_resources.fonts.insert(ef->pdfName, ef->objId);

    const qreal pdfBaseY = pdfY(baselineY);
    m_content += "BT\n";
    m_content += "/" + ef->pdfName + " " + pdfCoord(style.size) + " Tf\n";
    m_content += colorOperator(style.color, true);

    qreal penX = x;
    for (const ShapedGlyph &g : run.glyphs) {
        m_content += "1 0 0 1 " + pdfCoord(penX + g.xOffset) + " "
                   + pdfCoord(pdfBaseY + g.yOffset) + " Tm\n";
        m_content += Pdf::toHexString16(static_cast<quint16>(g.glyphId)) + " Tj\n";
        penX += g.xAdvance;
    }

    m_content += "ET\n";
}

void PdfReportCanvas::drawImage(const QRectF &destRect, const LoadedImage &image)
{
    if (!canDraw() || image.isNull())
        return;

    const Pdf::ObjId imgObj = m_writer.startObj();
    m_writer.write("<<\n/Type /XObject\n/Subtype /Image\n");
    m_writer.write("/Width " + Pdf::toPdf(image.width) + "\n");
    m_writer.write("/Height " + Pdf::toPdf(image.height) + "\n");
    m_writer.write("/ColorSpace /DeviceRGB\n");
    m_writer.write("/BitsPerComponent 8\n");
    m_writer.write("/Filter /DCTDecode\n");
    m_writer.endObjectWithStream(imgObj, image.jpegData, false);

    const QByteArray name = "Im" + QByteArray::number(++m_imageCount);
    m_resources.xObjects.insert(name, imgObj);

    m_content += "q\n";
    m_content += pdfCoord(destRect.width()) + " 0 0 " + pdfCoord(destRect.height()) + " "
               + pdfCoord(destRect.x()) + " " + pdfCoord(pdfY(destRect.bottom())) + " cm\n";
    m_content += "/" + name + " Do\n";
    m_content += "Q\n";
}

// --- Document completion ---

QByteArray PdfReportCanvas::finish()
{
    if (!isValid())
        return {};
    if (m_finished) {
        m_error = QStringLiteral("document already finished");
        return {};
    }

    if (m_pageObjs.isEmpty())
        beginPage();
    if (m_pageOpen)
        flushPage();

    for (const EmbeddedFont &ef : m_fonts)
        writeFont(ef);

    m_writer.startObj(m_writer.pagesObj());
    m_writer.write("<<\n/Type /Pages\n/Kids [");
    for (Pdf::ObjId id : m_pageObjs)
        m_writer.write(Pdf::toObjRef(id) + " ");
    m_writer.write("]\n/Count " + Pdf::toPdf(m_pageObjs.size()) + "\n>>");
    m_writer.endObj(m_writer.pagesObj());

    // No CreationDate: identical input must give identical bytes
    m_writer.startObj(m_writer.infoObj());
    m_writer.write("<<\n");
    m_writer.write("/Producer " + Pdf::toLiteralString(QStringLiteral("TicketReport")) + "\n");
    if (!m_title.isEmpty())
        m_writer.write("/Title " + Pdf::toLiteralString(Pdf::toUTF16(m_title)) + "\n");
    m_writer.write(">>");
    m_writer.endObj(m_writer.infoObj());

    m_writer.startObj(m_writer.catalogObj());
    m_writer.write("<<\n/Type /Catalog\n/Pages " + Pdf::toObjRef(m_writer.pagesObj()) + "\n");
    m_writer.write("/Lang " + Pdf::toLiteralString(QByteArray("pt-BR")) + "\n");
    m_writer.write(">>");
    m_writer.endObj(m_writer.catalogObj());

    m_writer.writeXrefAndTrailer();
    m_finished = true;
    if (!m_writer.close()) {
        m_error = QStringLiteral("PDF writer failed to close");
        return {};
    }
    return m_output;
}

void PdfReportCanvas::writeFont(const EmbeddedFont &font)
{
    FontFace *face = font.face;
    const QList<uint> glyphs = m_fontManager.usedGlyphs(face);

    // 1. Font program, subset when possible
    sfnt::SubsetResult subset = m_fontManager.subsetFont(face);
    if (!subset.success)
        qWarning() << "PdfReportCanvas: subsetting failed, embedding the full font:"
                   << face->filePath;
    const QByteArray fontData = subset.success ? subset.fontData : face->rawData;

    const Pdf::ObjId fontStreamObj = m_writer.startObj();
    m_writer.write("<<\n/Length1 " + Pdf::toPdf(fontData.size()) + "\n");
    m_writer.endObjectWithStream(fontStreamObj, fontData);

    // 2. Font descriptor, metrics per 1000 units
    QByteArray psName = m_fontManager.postScriptName(face).toLatin1();
    if (subset.success)
        psName = sfnt::subsetTag(glyphs) + psName;

    const Pdf::ObjId fontDescObj = m_writer.startObj();
    m_writer.write("<<\n/Type /FontDescriptor\n");
    m_writer.write("/FontName " + Pdf::toName(psName) + "\n");
    const QList<int> bbox = m_fontManager.fontBBox(face);
    m_writer.write("/FontBBox [" + Pdf::toPdf(bbox[0]) + " " + Pdf::toPdf(bbox[1])
                   + " " + Pdf::toPdf(bbox[2]) + " " + Pdf::toPdf(bbox[3]) + "]\n");
    m_writer.write("/Flags " + Pdf::toPdf(m_fontManager.fontFlags(face)) + "\n");
    m_writer.write("/Ascent " + Pdf::toPdf(qRound(m_fontManager.ascent(face, 1000))) + "\n");
    m_writer.write("/Descent " + Pdf::toPdf(-qRound(m_fontManager.descent(face, 1000))) + "\n");
    m_writer.write("/CapHeight " + Pdf::toPdf(qRound(m_fontManager.capHeight(face, 1000))) + "\n");
    m_writer.write("/ItalicAngle " + Pdf::toPdf(m_fontManager.italicAngle(face)) + "\n");
    m_writer.write("/StemV 80\n");
    m_writer.write("/FontFile2 " + Pdf::toObjRef(fontStreamObj) + "\n");
    m_writer.write(">>");
    m_writer.endObj(fontDescObj);

    // 3. Glyph widths
    const Pdf::ObjId widthsObj = m_writer.startObj();
    m_writer.write("[");
    for (uint gid : glyphs) {
        const int width = qRound(m_fontManager.glyphWidth(face, gid, 1000));
        m_writer.write(Pdf::toPdf(gid) + " [" + Pdf::toPdf(width) + "] ");
    }
    m_writer.write("]");
    m_writer.endObj(widthsObj);

    // 4. ToUnicode CMap
    const Pdf::ObjId cmapObj = m_writer.startObj();
    m_writer.write("<<\n");
    m_writer.endObjectWithStream(cmapObj, buildToUnicodeCMap(face));

    // 5. Type0 font with CIDFontType2 descendant
    m_writer.startObj(font.objId);
    m_writer.write("<<\n/Type /Font\n/Subtype /Type0\n");
    m_writer.write("/BaseFont " + Pdf::toName(psName) + "\n");
    m_writer.write("/Encoding /Identity-H\n");
    m_writer.write("/ToUnicode " + Pdf::toObjRef(cmapObj) + "\n");
    m_writer.write("/DescendantFonts [<<\n/Type /Font\n/Subtype /CIDFontType2\n");
    m_writer.write("/BaseFont " + Pdf::toName(psName) + "\n");
    m_writer.write("/FontDescriptor " + Pdf::toObjRef(fontDescObj) + "\n");
    m_writer.write("/CIDSystemInfo <</Ordering(Identity)/Registry(Adobe)/Supplement 0>>\n");
    m_writer.write("/DW 1000\n");
    m_writer.write("/W " + Pdf::toObjRef(widthsObj) + "\n");
    m_writer.write("/CIDToGIDMap /Identity\n");
    m_writer.write(">>]\n>>");
    m_writer.endObj(font.objId);
}

static QByteArray utf16Hex(uint codepoint)
{
    if (codepoint > 0xFFFF) {
        const uint high = QChar::highSurrogate(codepoint);
        const uint low = QChar::lowSurrogate(codepoint);
        return QByteArray::number(high, 16).rightJustified(4, '0').toUpper()
             + QByteArray::number(low, 16).rightJustified(4, '0').toUpper();
    }
    return QByteArray::number(codepoint, 16).rightJustified(4, '0').toUpper();
}

QByteArray PdfReportCanvas::buildToUnicodeCMap(FontFace *face) const
{
    QByteArray cmap;
    cmap += "/CIDInit /ProcSet findresource begin\n";
    cmap += "12 dict begin\n";
    cmap += "begincmap\n";
    cmap += "/CIDSystemInfo << /Registry (Adobe) /Ordering (UCS) /Supplement 0 >> def\n";
    cmap += "/CMapName /Adobe-Identity-UCS def\n";
    cmap += "/CMapType 2 def\n";
    cmap += "1 begincodespacerange\n<0000> <FFFF>\nendcodespacerange\n";

    // Glyph → first code point mapped to it by the font's charmap
    QMap<uint, uint> mappings;
    if (face && face->ftFace) {
        FT_UInt gid = 0;
        FT_ULong charcode = FT_Get_First_Char(face->ftFace, &gid);
        while (gid != 0) {
            if (face->usedGlyphs.contains(gid) && !mappings.contains(gid))
                mappings.insert(gid, static_cast<uint>(charcode));
            charcode = FT_Get_Next_Char(face->ftFace, charcode, &gid);
        }
    }

    // bfchar blocks hold at most 100 entries
    auto it = mappings.cbegin();
    while (it != mappings.cend()) {
        const int batchSize = qMin<int>(100, static_cast<int>(std::distance(it, mappings.cend())));
        cmap += Pdf::toPdf(batchSize) + " beginbfchar\n";
        for (int i = 0; i < batchSize; ++i, ++it) {
            cmap += Pdf::toHexString16(static_cast<quint16>(it.key())) + " <"
                  + utf16Hex(it.value()) + ">\n";
        }
        cmap += "endbfchar\n";
    }

    cmap += "endcmap\n";
    cmap += "CMapName currentdict /CMap defineresource pop\n";
    cmap += "end\nend\n";
    return cmap;
}
