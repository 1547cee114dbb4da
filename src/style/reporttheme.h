/*
 * reporttheme.h — Visual theme for generated reports
 *
 * Maps semantic color roles to QColor values and carries the handful of
 * shape parameters that distinguish the report variants (flat or raised
 * cards, ruled or banner header).  Loaded from JSON files of type
 * "reportTheme".
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TICKETREPORT_REPORTTHEME_H
#define TICKETREPORT_REPORTTHEME_H

#include <QColor>
#include <QHash>
#include <QJsonObject>
#include <QString>

class ReportTheme
{
public:
    enum class CardStyle { Flat, Raised };
    enum class HeaderStyle { Rule, Banner };

    ReportTheme() = default;

    QString id;          // e.g. "minimal"
    QString name;        // display name
    QString description;

    QString fontFamily = QStringLiteral("Liberation Sans");
    CardStyle cardStyle = CardStyle::Flat;
    HeaderStyle headerStyle = HeaderStyle::Rule;
    qreal cornerRadius = 5.67;   // points
    int shadowLayers = 0;        // Raised only
    qreal shadowOffset = 0.6;    // points per layer

    QHash<QString, QColor> colors; // role -> color

    // --- Color roles ---

    QColor text() const;
    QColor heading() const;
    QColor label() const;
    QColor muted() const;
    QColor rule() const;
    QColor accent() const;
    QColor cardFill() const;
    QColor cardBorder() const;
    QColor cardShadow() const;
    QColor tableHeaderFill() const;
    QColor placeholderFill() const;
    QColor bannerFill() const;
    QColor bannerText() const;

    bool operator==(const ReportTheme &other) const
    {
        return id == other.id && colors == other.colors
            && fontFamily == other.fontFamily && cardStyle == other.cardStyle
            && headerStyle == other.headerStyle;
    }

    // --- Serialization ---

    static ReportTheme fromJson(const QJsonObject &obj);
    QJsonObject toJson() const;
};

#endif // TICKETREPORT_REPORTTHEME_H
