/*
 * pageprimitives.cpp — Stateless page building blocks
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pageprimitives.h"
#include "pagelayout.h"
#include "reportmetrics.h"

using PageLayout::mm;

// Linear mix of two colors, t = 0 gives a, t = 1 gives b
static QColor mix(const QColor &a, const QColor &b, qreal t)
{
    return QColor::fromRgbF(a.redF() + (b.redF() - a.redF()) * t,
                            a.greenF() + (b.greenF() - a.greenF()) * t,
                            a.blueF() + (b.blueF() - a.blueF()) * t);
}

PagePrimitives::PagePrimitives(ReportCanvas *canvas, const ReportTheme &theme)
    : m_canvas(canvas)
    , m_theme(theme)
{
}

// ---------------------------------------------------------------------------
// Text styles
// ---------------------------------------------------------------------------

TextStyle PagePrimitives::labelStyle() const
{
    return {TextStyle::Regular, 8.0, m_theme.label()};
}

TextStyle PagePrimitives::valueStyle() const
{
    return {TextStyle::Regular, 9.0, m_theme.text()};
}

TextStyle PagePrimitives::bodyStyle() const
{
    return {TextStyle::Regular, 10.0, m_theme.text()};
}

TextStyle PagePrimitives::bodyHeadingStyle() const
{
    return {TextStyle::Bold, 10.0, m_theme.heading()};
}

TextStyle PagePrimitives::captionStyle() const
{
    return {TextStyle::Regular, 8.0, m_theme.label()};
}

TextStyle PagePrimitives::badgeStyle() const
{
    return {TextStyle::Bold, 7.0, m_theme.bannerText()};
}

TextStyle PagePrimitives::placeholderStyle() const
{
    return {TextStyle::Regular, 9.0, m_theme.muted()};
}

// ---------------------------------------------------------------------------
// Primitives
// ---------------------------------------------------------------------------

void PagePrimitives::drawCard(qreal x, qreal y, qreal width, qreal height) const
{
    const QRectF rect(x, y, width, height);
    const qreal radius = m_theme.cornerRadius;

    if (m_theme.cardStyle == ReportTheme::CardStyle::Raised) {
        const int layers = m_theme.shadowLayers;
        // Outermost layer first, fading toward the page color
        for (int i = layers; i >= 1; --i) {
            const qreal offset = i * m_theme.shadowOffset;
            const QColor color = mix(m_theme.cardShadow(), Qt::white,
                                     static_cast<qreal>(i - 1) / layers);
            m_canvas->drawRoundedRect(rect.translated(offset, offset), radius, color);
        }
        m_canvas->drawRoundedRect(rect, radius, m_theme.cardFill(),
                                  m_theme.cardBorder(), 0.5);
        return;
    }

    m_canvas->drawRoundedRect(rect, radius, m_theme.cardFill(), m_theme.cardBorder(), 0.3);
}

qreal PagePrimitives::drawSectionTitle(const QString &title, qreal x, qreal y,
                                       qreal width) const
{
    const TextStyle style{TextStyle::Bold, 9.0, m_theme.heading()};
    m_canvas->drawText(title.toUpper(), style, x, y + mm(5));

    const qreal ruleY = y + mm(7.5);
    m_canvas->drawLine(QPointF(x, ruleY), QPointF(x + width, ruleY), m_theme.rule(), 0.5);
    m_canvas->drawLine(QPointF(x, ruleY), QPointF(x + qMin(width, mm(12)), ruleY),
                       m_theme.accent(), 1.0);

    return y + PageLayout::kSectionTitleHeight;
}

qreal PagePrimitives::drawLabelValueRow(const QString &label, const QString &value,
                                        qreal x, qreal y, qreal labelWidth,
                                        qreal maxValueWidth) const
{
    m_canvas->drawText(label, labelStyle(), x, y);

    const QString shown = value.trimmed().isEmpty() ? ReportMetrics::kPlaceholder : value;
    m_canvas->drawText(TextFit::elide(*m_canvas, shown, valueStyle(), maxValueWidth),
                       valueStyle(), x + labelWidth, y);

    return y + PageLayout::kRowHeight;
}

qreal PagePrimitives::drawPageTitle(const QString &title, const QString &subtitle,
                                    qreal y) const
{
    const qreal x = PageLayout::kMargin;
    const qreal width = PageLayout::kContentWidth;

    const TextStyle titleStyle{TextStyle::Bold, 16.0, m_theme.heading()};
    m_canvas->drawText(TextFit::elide(*m_canvas, title, titleStyle, width),
                       titleStyle, x, y + mm(8));

    if (!subtitle.isEmpty()) {
        const TextStyle subtitleStyle{TextStyle::Regular, 10.0, m_theme.label()};
        m_canvas->drawText(TextFit::elide(*m_canvas, subtitle, subtitleStyle, width),
                           subtitleStyle, x, y + mm(14));
    }

    return y + PageLayout::kPageTitleHeight;
}

qreal PagePrimitives::drawTable(const QList<TableColumn> &columns,
                                const QList<TableRow> &rows, qreal x, qreal y) const
{
    const qreal rowHeight = PageLayout::kTableRowHeight;
    const qreal cellPadding = mm(1.5);
    const qreal baselineOffset = rowHeight * 0.68;

    qreal tableWidth = 0;
    for (const TableColumn &c : columns)
        tableWidth += c.width;

    auto drawCells = [&](const QStringList &cells, const TextStyle &style, qreal top) {
        qreal cx = x;
        for (int i = 0; i < columns.size(); ++i) {
            const TableColumn &col = columns.at(i);
            const QString text = TextFit::elide(*m_canvas, cells.value(i), style,
                                                col.width - 2 * cellPadding);
            qreal anchor = cx + cellPadding;
            if (col.alignment & Qt::AlignRight)
                anchor = cx + col.width - cellPadding;
            else if (col.alignment & Qt::AlignHCenter)
                anchor = cx + col.width / 2;
            m_canvas->drawAlignedText(text, style, anchor, top + baselineOffset,
                                      col.alignment);
            cx += col.width;
        }
    };

    // Header
    const TextStyle headerStyle{TextStyle::Bold, 7.5, m_theme.label()};
    m_canvas->drawRect(QRectF(x, y, tableWidth, rowHeight), m_theme.tableHeaderFill());
    QStringList titles;
    for (const TableColumn &c : columns)
        titles.append(c.title);
    drawCells(titles, headerStyle, y);
    y += rowHeight;

    const TextStyle cellStyle{TextStyle::Regular, 8.0, m_theme.text()};
    const TextStyle totalStyle{TextStyle::Bold, 8.0, m_theme.heading()};
    for (const TableRow &row : rows) {
        if (row.emphasized)
            m_canvas->drawLine(QPointF(x, y), QPointF(x + tableWidth, y), m_theme.label(), 0.6);
        drawCells(row.cells, row.emphasized ? totalStyle : cellStyle, y);
        y += rowHeight;
        if (!row.emphasized)
            m_canvas->drawLine(QPointF(x, y), QPointF(x + tableWidth, y), m_theme.rule(), 0.3);
    }

    return y;
}
