/*
 * reportgenerator.h — One-call facade over canvas, composer and loader
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TICKETREPORT_REPORTGENERATOR_H
#define TICKETREPORT_REPORTGENERATOR_H

#include <QByteArray>
#include <QDateTime>
#include <QObject>
#include <QString>
#include <QTimeZone>

#include <memory>

#include "brandingconfig.h"
#include "reportinput.h"
#include "reporttheme.h"

class ImageLoader;
class PdfReportCanvas;
class ReportComposer;
struct FetchResult;

// Produces one PDF per generate() call.  The logo is fetched first, then
// the composer runs; finished() or failed() is emitted exactly once for a
// run that generate() accepted.  finished() may fire before generate()
// returns when the loader is synchronous.
class ReportGenerator : public QObject
{
    Q_OBJECT

public:
    explicit ReportGenerator(ImageLoader *loader, QObject *parent = nullptr);
    ~ReportGenerator() override;

    void setTheme(const ReportTheme &theme) { m_theme = theme; }
    void setBranding(const BrandingConfig &branding) { m_branding = branding; }
    void setGeneratedAt(const QDateTime &generatedAt) { m_generatedAt = generatedAt; }
    void setTimeZone(const QTimeZone &zone) { m_timeZone = zone; }

    /// Returns false, without emitting anything, when no drawing surface
    /// can be set up, a run is in progress, or the run fails before
    /// generate() returns (for example photos without a loader).
    bool generate(const ReportInput &input);
    bool isRunning() const { return m_running; }

    QString errorString() const { return m_error; }

signals:
    void finished(const QByteArray &pdf);
    void failed(const QString &message);
    void photoFailed(int index, const QString &message);

private:
    void onLogoFetched(const FetchResult &result);
    void startComposer();
    void onComposerFinished();
    void fail(const QString &message);
    void reset();

    ImageLoader *m_loader;
    ReportTheme m_theme;
    BrandingConfig m_branding;
    QDateTime m_generatedAt;
    QTimeZone m_timeZone = QTimeZone(QByteArrayLiteral("America/Sao_Paulo"));

    ReportInput m_input;
    std::unique_ptr<PdfReportCanvas> m_canvas;
    std::unique_ptr<ReportComposer> m_composer;
    LoadedImage m_logo;
    bool m_running = false;
    bool m_starting = false;
    QString m_error;
};

#endif // TICKETREPORT_REPORTGENERATOR_H
