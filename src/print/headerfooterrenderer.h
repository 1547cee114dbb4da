#ifndef TICKETREPORT_HEADERFOOTERRENDERER_H
#define TICKETREPORT_HEADERFOOTERRENDERER_H

#include <QDateTime>
#include <QString>
#include <QTimeZone>

class ReportCanvas;
class ReportTheme;
struct BrandingConfig;
struct LoadedImage;

namespace HeaderFooterRenderer {

/// Branding name, phone and contact lines, and the logo when given.
/// Returns the height consumed from the top of the page.
qreal drawHeader(ReportCanvas *canvas, const ReportTheme &theme,
                 const BrandingConfig &branding, qreal pageWidth, qreal margin,
                 const LoadedImage *logo);

/// Ruled footer with the legal line and, when @p timestampLine is not
/// empty, a second line below it.
void drawFooter(ReportCanvas *canvas, const ReportTheme &theme,
                const BrandingConfig &branding, qreal pageWidth, qreal pageHeight,
                const QString &timestampLine = QString());

QString timestampLine(const QDateTime &generatedAt, const QTimeZone &zone);

} // namespace HeaderFooterRenderer

#endif // TICKETREPORT_HEADERFOOTERRENDERER_H
