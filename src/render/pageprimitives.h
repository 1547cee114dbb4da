/*
 * pageprimitives.h — Stateless page building blocks
 *
 * Each primitive draws at explicit coordinates on a ReportCanvas and, where
 * it advances a cursor, returns the y below what it drew.  None of them
 * ever starts a page.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TICKETREPORT_PAGEPRIMITIVES_H
#define TICKETREPORT_PAGEPRIMITIVES_H

#include <QList>
#include <QString>
#include <QStringList>

#include "reportcanvas.h"
#include "reporttheme.h"

struct TableColumn {
    QString title;
    qreal width = 0;
    Qt::Alignment alignment = Qt::AlignLeft;
};

struct TableRow {
    QStringList cells;
    bool emphasized = false;  // bold, ruled above (totals)
};

class PagePrimitives
{
public:
    PagePrimitives(ReportCanvas *canvas, const ReportTheme &theme);

    /// Rounded bordered container.  Raised themes stack offset layers of
    /// the shadow color underneath; flat themes draw only a hairline.
    void drawCard(qreal x, qreal y, qreal width, qreal height) const;

    /// Uppercase bold title on a ruled bar; returns the y below the bar.
    qreal drawSectionTitle(const QString &title, qreal x, qreal y, qreal width) const;

    /// Label at @p x and value at @p x + @p labelWidth on baseline @p y.
    /// A value wider than @p maxValueWidth is truncated with "..."; an empty
    /// value is drawn as "-".  Returns the next baseline.
    qreal drawLabelValueRow(const QString &label, const QString &value,
                            qreal x, qreal y, qreal labelWidth,
                            qreal maxValueWidth) const;

    /// Large page title with a subtitle line, within the content margins.
    qreal drawPageTitle(const QString &title, const QString &subtitle, qreal y) const;

    /// Header row plus one line per row; cells are truncated to fit.
    qreal drawTable(const QList<TableColumn> &columns, const QList<TableRow> &rows,
                    qreal x, qreal y) const;

    // --- Text styles shared by the composer ---

    TextStyle labelStyle() const;
    TextStyle valueStyle() const;
    TextStyle bodyStyle() const;
    TextStyle bodyHeadingStyle() const;
    TextStyle captionStyle() const;
    TextStyle badgeStyle() const;
    TextStyle placeholderStyle() const;

private:
    ReportCanvas *m_canvas;
    const ReportTheme &m_theme;
};

#endif // TICKETREPORT_PAGEPRIMITIVES_H
