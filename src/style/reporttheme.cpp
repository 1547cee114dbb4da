/*
 * reporttheme.cpp — Visual theme for generated reports
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "reporttheme.h"
#include "pagelayout.h"

#include <QJsonObject>

// ---------------------------------------------------------------------------
// Color roles
// ---------------------------------------------------------------------------

static QColor colorOrDefault(const QHash<QString, QColor> &colors,
                             const QString &role, const QColor &fallback)
{
    auto it = colors.constFind(role);
    return (it != colors.constEnd()) ? it.value() : fallback;
}

// Neutral gray scale used when a theme leaves a role out
static const QColor s_gray900{0x11, 0x18, 0x27};
static const QColor s_gray600{0x4b, 0x55, 0x63};
static const QColor s_gray400{0x9c, 0xa3, 0xaf};
static const QColor s_gray300{0xd1, 0xd5, 0xdb};
static const QColor s_gray200{0xe5, 0xe7, 0xeb};
static const QColor s_gray50{0xf9, 0xfa, 0xfb};
static const QColor s_blue500{0x3b, 0x82, 0xf6};

QColor ReportTheme::text() const
{
    return colorOrDefault(colors, QStringLiteral("text"), s_gray900);
}

QColor ReportTheme::heading() const
{
    return colorOrDefault(colors, QStringLiteral("heading"), s_gray900);
}

QColor ReportTheme::label() const
{
    return colorOrDefault(colors, QStringLiteral("label"), s_gray600);
}

QColor ReportTheme::muted() const
{
    return colorOrDefault(colors, QStringLiteral("muted"), s_gray400);
}

QColor ReportTheme::rule() const
{
    return colorOrDefault(colors, QStringLiteral("rule"), s_gray200);
}

QColor ReportTheme::accent() const
{
    return colorOrDefault(colors, QStringLiteral("accent"), s_blue500);
}

QColor ReportTheme::cardFill() const
{
    return colorOrDefault(colors, QStringLiteral("cardFill"), Qt::white);
}

QColor ReportTheme::cardBorder() const
{
    return colorOrDefault(colors, QStringLiteral("cardBorder"), s_gray200);
}

QColor ReportTheme::cardShadow() const
{
    return colorOrDefault(colors, QStringLiteral("cardShadow"), s_gray300);
}

QColor ReportTheme::tableHeaderFill() const
{
    return colorOrDefault(colors, QStringLiteral("tableHeaderFill"), s_gray50);
}

QColor ReportTheme::placeholderFill() const
{
    return colorOrDefault(colors, QStringLiteral("placeholderFill"), s_gray50);
}

QColor ReportTheme::bannerFill() const
{
    return colorOrDefault(colors, QStringLiteral("bannerFill"), s_gray900);
}

QColor ReportTheme::bannerText() const
{
    return colorOrDefault(colors, QStringLiteral("bannerText"), Qt::white);
}

// ---------------------------------------------------------------------------
// JSON serialization
// ---------------------------------------------------------------------------

// Shape lengths are stored in millimetres like the rest of the geometry.

ReportTheme ReportTheme::fromJson(const QJsonObject &obj)
{
    ReportTheme theme;

    theme.id          = obj.value(QLatin1String("id")).toString();
    theme.name        = obj.value(QLatin1String("name")).toString(theme.id);
    theme.description = obj.value(QLatin1String("description")).toString();
    theme.fontFamily  = obj.value(QLatin1String("fontFamily")).toString(theme.fontFamily);

    const QJsonObject cards = obj.value(QLatin1String("cards")).toObject();
    if (cards.value(QLatin1String("style")).toString() == QLatin1String("raised"))
        theme.cardStyle = CardStyle::Raised;
    if (cards.contains(QLatin1String("cornerRadius")))
        theme.cornerRadius = PageLayout::mm(cards.value(QLatin1String("cornerRadius")).toDouble());
    theme.shadowLayers = qBound(0, cards.value(QLatin1String("shadowLayers")).toInt(0), 8);
    if (cards.contains(QLatin1String("shadowOffset")))
        theme.shadowOffset = PageLayout::mm(cards.value(QLatin1String("shadowOffset")).toDouble());

    const QJsonObject header = obj.value(QLatin1String("header")).toObject();
    if (header.value(QLatin1String("style")).toString() == QLatin1String("banner"))
        theme.headerStyle = HeaderStyle::Banner;

    const QJsonObject colorsObj = obj.value(QLatin1String("colors")).toObject();
    for (auto it = colorsObj.begin(); it != colorsObj.end(); ++it) {
        QColor c(it.value().toString());
        if (c.isValid())
            theme.colors.insert(it.key(), c);
    }

    return theme;
}

QJsonObject ReportTheme::toJson() const
{
    QJsonObject obj;

    if (!id.isEmpty())
        obj[QLatin1String("id")] = id;
    obj[QLatin1String("name")]    = name;
    obj[QLatin1String("version")] = 1;
    obj[QLatin1String("type")]    = QStringLiteral("reportTheme");

    if (!description.isEmpty())
        obj[QLatin1String("description")] = description;
    obj[QLatin1String("fontFamily")] = fontFamily;

    QJsonObject cards;
    cards[QLatin1String("style")] = cardStyle == CardStyle::Raised
        ? QStringLiteral("raised") : QStringLiteral("flat");
    cards[QLatin1String("cornerRadius")] = cornerRadius / PageLayout::kMmToPt;
    cards[QLatin1String("shadowLayers")] = shadowLayers;
    cards[QLatin1String("shadowOffset")] = shadowOffset / PageLayout::kMmToPt;
    obj[QLatin1String("cards")] = cards;

    QJsonObject header;
    header[QLatin1String("style")] = headerStyle == HeaderStyle::Banner
        ? QStringLiteral("banner") : QStringLiteral("rule");
    obj[QLatin1String("header")] = header;

    QJsonObject colorsObj;
    for (auto it = colors.constBegin(); it != colors.constEnd(); ++it)
        colorsObj[it.key()] = it.value().name();
    obj[QLatin1String("colors")] = colorsObj;

    return obj;
}
