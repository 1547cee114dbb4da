#include "headerfooterrenderer.h"
#include "brandingconfig.h"
#include "pagelayout.h"
#include "reportcanvas.h"
#include "reportmetrics.h"
#include "reporttheme.h"

using PageLayout::mm;

namespace HeaderFooterRenderer {

// Logo rectangle aspect-fit into the logo slot at the left margin
static QRectF logoRect(const LoadedImage &logo, qreal margin)
{
    qreal h = PageLayout::kLogoMaxHeight;
    qreal w = h * logo.width / logo.height;
    if (w > PageLayout::kLogoMaxWidth) {
        w = PageLayout::kLogoMaxWidth;
        h = w * logo.height / logo.width;
    }
    const qreal top = PageLayout::kLogoTop + (PageLayout::kLogoMaxHeight - h) / 2;
    return QRectF(margin, top, w, h);
}

qreal drawHeader(ReportCanvas *canvas, const ReportTheme &theme,
                 const BrandingConfig &branding, qreal pageWidth, qreal margin,
                 const LoadedImage *logo)
{
    const bool banner = theme.headerStyle == ReportTheme::HeaderStyle::Banner;
    const QColor nameColor = banner ? theme.bannerText() : theme.heading();
    const QColor infoColor = banner ? theme.bannerText() : theme.label();

    if (banner)
        canvas->drawRect(QRectF(0, 0, pageWidth, PageLayout::kHeaderBandHeight),
                         theme.bannerFill());

    qreal nameX = margin;
    if (logo && !logo->isNull()) {
        const QRectF rect = logoRect(*logo, margin);
        canvas->drawImage(rect, *logo);
        nameX = rect.right() + mm(4);
    }

    const qreal right = pageWidth - margin;
    const TextStyle infoStyle{TextStyle::Regular, 7.0, infoColor};
    const QString phones = branding.phoneLine();
    const QString contacts = branding.contactLine();
    const qreal infoWidth = qMax(canvas->textWidth(phones, infoStyle),
                                 canvas->textWidth(contacts, infoStyle));
    canvas->drawAlignedText(phones, infoStyle, right, mm(12), Qt::AlignRight);
    canvas->drawAlignedText(contacts, infoStyle, right, mm(16), Qt::AlignRight);

    if (!branding.companyName.isEmpty()) {
        const TextStyle nameStyle{TextStyle::Bold, 13.0, nameColor};
        const qreal available = right - infoWidth - mm(6) - nameX;
        canvas->drawText(TextFit::elide(*canvas, branding.companyName, nameStyle, available),
                         nameStyle, nameX, mm(16));
    }

    if (!banner) {
        const qreal ruleY = PageLayout::kHeaderBandHeight;
        canvas->drawLine(QPointF(margin, ruleY), QPointF(right, ruleY), theme.rule(), 0.8);
    }

    return PageLayout::kHeaderHeight;
}

void drawFooter(ReportCanvas *canvas, const ReportTheme &theme,
                const BrandingConfig &branding, qreal pageWidth, qreal pageHeight,
                const QString &timestampLine)
{
    const qreal margin = PageLayout::kMargin;
    const qreal ruleY = pageHeight - mm(15);
    canvas->drawLine(QPointF(margin, ruleY), QPointF(pageWidth - margin, ruleY),
                     theme.rule(), 0.5);

    const TextStyle style{TextStyle::Regular, 7.0, theme.muted()};
    const qreal width = pageWidth - 2 * margin;
    const QString legal = branding.legalLine();
    if (!legal.isEmpty())
        canvas->drawAlignedText(TextFit::elide(*canvas, legal, style, width), style,
                                pageWidth / 2, ruleY + mm(6), Qt::AlignHCenter);
    if (!timestampLine.isEmpty())
        canvas->drawAlignedText(timestampLine, style, pageWidth / 2, ruleY + mm(10),
                                Qt::AlignHCenter);
}

QString timestampLine(const QDateTime &generatedAt, const QTimeZone &zone)
{
    if (!generatedAt.isValid())
        return {};
    return QStringLiteral("Relatório gerado em ")
        + ReportMetrics::formatDateTime(generatedAt, zone);
}

} // namespace HeaderFooterRenderer
