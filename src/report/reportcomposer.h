/*
 * reportcomposer.h — Page-by-page report composition
 *
 * Drives a ReportCanvas through the fixed sequence of report pages:
 *
 *   Summary → Narrative → Photos(0..N-1) → Done
 *
 * The summary is always exactly one page.  The narrative reflows onto as
 * many pages as it needs.  Photos are fetched one at a time, in document
 * order, and each is drawn into its grid cell as soon as it resolves; a
 * photo that fails becomes a placeholder and never stops the document.
 *
 * Composition runs on the event loop: start() returns right away when the
 * image loader is asynchronous, and finished() is emitted once the last
 * page has been closed.  A loader that calls back synchronously simply
 * makes the whole run complete inside start().
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TICKETREPORT_REPORTCOMPOSER_H
#define TICKETREPORT_REPORTCOMPOSER_H

#include <QDateTime>
#include <QList>
#include <QObject>
#include <QPair>
#include <QRectF>
#include <QString>
#include <QTimeZone>

#include <memory>

#include "brandingconfig.h"
#include "imageloader.h"
#include "reportinput.h"
#include "reporttheme.h"

class PagePrimitives;
class ReportCanvas;

class ReportComposer : public QObject
{
    Q_OBJECT

public:
    enum class Phase { Idle, Summary, Narrative, Photos, Done };
    Q_ENUM(Phase)

    enum class PageKind { Summary, Narrative, Photos };
    Q_ENUM(PageKind)

    struct PhotoPlacement {
        int index = 0;    // position in ReportInput::photos
        int page = 0;     // photo page, 0-based
        int column = 0;
        int row = 0;
        QRectF cell;
        bool loaded = false;
        QString error;    // fetch failure, empty when loaded
    };

    struct Options {
        QDateTime generatedAt;   // invalid: no timestamp line
        QTimeZone timeZone = QTimeZone(QByteArrayLiteral("America/Sao_Paulo"));
    };

    ReportComposer(ReportCanvas *canvas, ImageLoader *loader, QObject *parent = nullptr);
    ~ReportComposer() override;

    void setTheme(const ReportTheme &theme) { m_theme = theme; }
    void setBranding(const BrandingConfig &branding) { m_branding = branding; }
    void setLogo(const LoadedImage &logo) { m_logo = logo; }
    void setOptions(const Options &options) { m_options = options; }

    /// Begins composing @p input.  Returns false, with errorString() set,
    /// when the canvas is unusable or a run is already in progress.
    bool start(const ReportInput &input);

    Phase phase() const { return m_phase; }
    bool isFinished() const { return m_phase == Phase::Done; }
    QString errorString() const { return m_error; }

    QList<PageKind> pageKinds() const { return m_pageKinds; }
    QList<PhotoPlacement> photoPlacements() const { return m_placements; }

    // --- Photo grid geometry ---

    static int photoPageCount(int photoCount);
    /// Page, column, row and cell rectangle of photo @p index.
    static PhotoPlacement placementFor(int index);

signals:
    void finished();
    void photoFailed(int index, const QString &message);

private:
    void advance();

    void openPage(PageKind kind);
    void closePage();

    void composeSummary();
    void composeNarrative();
    void openPhotoPage(int photoPage);
    void requestPhoto(int index);
    void onPhotoFetched(int index, const FetchResult &result);
    void drawPhotoCell(const PhotoPlacement &placement, const FetchResult &result);

    void drawInfoCard(const QString &title,
                      const QList<QPair<QString, QString>> &rows,
                      qreal x, qreal y, qreal width, qreal height);
    void drawTeamCard(qreal y);
    qreal drawNarrativeFrame(bool firstPage);

    ReportCanvas *m_canvas;
    ImageLoader *m_loader;
    std::unique_ptr<PagePrimitives> m_primitives;

    ReportTheme m_theme;
    BrandingConfig m_branding;
    LoadedImage m_logo;
    Options m_options;

    ReportInput m_input;
    Phase m_phase = Phase::Idle;
    QString m_error;

    QList<PageKind> m_pageKinds;
    QList<PhotoPlacement> m_placements;
    bool m_pageOpen = false;

    int m_nextPhoto = 0;
    bool m_waiting = false;     // a photo fetch is in flight
    bool m_advancing = false;   // advance() is on the stack
};

#endif // TICKETREPORT_REPORTCOMPOSER_H
