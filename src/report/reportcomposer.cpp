/*
 * reportcomposer.cpp — Page-by-page report composition
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "reportcomposer.h"
#include "headerfooterrenderer.h"
#include "pagelayout.h"
#include "pageprimitives.h"
#include "reportcanvas.h"
#include "reportmetrics.h"
#include "textfit.h"

#include <QDebug>
#include <QPointer>

using PageLayout::mm;
namespace M = ReportMetrics;

namespace {

const QString kSummaryTitle   = QStringLiteral("Relatório de Atendimento");
const QString kNarrativeTitle = QStringLiteral("Descrição do Evento");
const QString kSummaryHeading = QStringLiteral("Resumo");
const QString kDetailHeading  = QStringLiteral("Relatório Detalhado");
const QString kPhotosTitle    = QStringLiteral("Registro Fotográfico");
const QString kPhotoMissing   = QStringLiteral("Imagem não disponível");

// One line of narrative text; headings are drawn bold.
struct NarrativeLine {
    QString text;
    bool heading = false;
};

QString timeRange(const QDateTime &from, const QDateTime &to, const QTimeZone &zone)
{
    if (!from.isValid() && !to.isValid())
        return M::kPlaceholder;
    return M::formatTime(from, zone) + QStringLiteral(" às ") + M::formatTime(to, zone);
}

} // anonymous namespace

ReportComposer::ReportComposer(ReportCanvas *canvas, ImageLoader *loader, QObject *parent)
    : QObject(parent)
    , m_canvas(canvas)
    , m_loader(loader)
{
}

ReportComposer::~ReportComposer() = default;

// ---------------------------------------------------------------------------
// Photo grid geometry
// ---------------------------------------------------------------------------

int ReportComposer::photoPageCount(int photoCount)
{
    if (photoCount <= 0)
        return 0;
    return (photoCount + PageLayout::kPhotosPerPage - 1) / PageLayout::kPhotosPerPage;
}

ReportComposer::PhotoPlacement ReportComposer::placementFor(int index)
{
    PhotoPlacement p;
    p.index = index;
    p.page = index / PageLayout::kPhotosPerPage;
    const int slot = index % PageLayout::kPhotosPerPage;
    p.column = slot % PageLayout::kPhotoColumns;
    p.row = slot / PageLayout::kPhotoColumns;

    const qreal x = PageLayout::kMargin
        + p.column * (PageLayout::kPhotoWidth + PageLayout::kPhotoGap);
    const qreal y = PageLayout::kHeaderHeight + PageLayout::kPhotoGridOffset
        + p.row * (PageLayout::kPhotoHeight + PageLayout::kCaptionHeight + PageLayout::kPhotoGap);
    p.cell = QRectF(x, y, PageLayout::kPhotoWidth, PageLayout::kPhotoHeight);
    return p;
}

// ---------------------------------------------------------------------------
// State machine
// ---------------------------------------------------------------------------

bool ReportComposer::start(const ReportInput &input)
{
    if (m_phase != Phase::Idle && m_phase != Phase::Done) {
        m_error = QStringLiteral("a report is already being composed");
        return false;
    }
    if (!m_canvas || !m_canvas->isValid()) {
        m_error = m_canvas ? m_canvas->errorString()
                           : QStringLiteral("no drawing surface");
        return false;
    }
    if (!m_loader && !input.photos.isEmpty()) {
        m_error = QStringLiteral("no image loader for the photo pages");
        return false;
    }

    m_input = input;
    m_error.clear();
    m_pageKinds.clear();
    m_placements.clear();
    m_pageOpen = false;
    m_nextPhoto = 0;
    m_waiting = false;
    m_primitives = std::make_unique<PagePrimitives>(m_canvas, m_theme);

    m_phase = Phase::Summary;
    advance();
    return true;
}

// Runs phases until a fetch is in flight or the document is done.  A
// loader that resolves synchronously re-enters through onPhotoFetched();
// the guard turns that re-entry into another iteration of this loop.
void ReportComposer::advance()
{
    if (m_advancing)
        return;
    m_advancing = true;

    while (!m_waiting && m_phase != Phase::Done) {
        switch (m_phase) {
        case Phase::Idle:
        case Phase::Done:
            break;
        case Phase::Summary:
            composeSummary();
            m_phase = Phase::Narrative;
            break;
        case Phase::Narrative:
            composeNarrative();
            m_phase = m_input.photos.isEmpty() ? Phase::Done : Phase::Photos;
            break;
        case Phase::Photos:
            if (m_nextPhoto >= m_input.photos.size()) {
                m_phase = Phase::Done;
                break;
            }
            if (m_nextPhoto % PageLayout::kPhotosPerPage == 0)
                openPhotoPage(m_nextPhoto / PageLayout::kPhotosPerPage);
            requestPhoto(m_nextPhoto);
            break;
        }
    }

    m_advancing = false;

    if (m_phase == Phase::Done && !m_waiting) {
        closePage();
        emit finished();
    }
}

void ReportComposer::requestPhoto(int index)
{
    m_waiting = true;
    const QUrl url = ImageLoader::urlFromUserInput(m_input.photos.at(index).url);
    QPointer<ReportComposer> guard(this);
    m_loader->fetch(url, [guard, index](const FetchResult &result) {
        if (guard)
            guard->onPhotoFetched(index, result);
    });
}

void ReportComposer::onPhotoFetched(int index, const FetchResult &result)
{
    if (m_phase != Phase::Photos || !m_waiting || index != m_nextPhoto) {
        qWarning() << "ReportComposer: ignoring stale photo result" << index;
        return;
    }

    PhotoPlacement placement = placementFor(index);
    placement.loaded = result.ok && !result.image.isNull();
    if (!placement.loaded) {
        placement.error = result.errorString.isEmpty()
            ? QStringLiteral("invalid image") : result.errorString;
        qWarning() << "ReportComposer: photo" << index + 1 << "unavailable:"
                   << placement.error;
    }
    drawPhotoCell(placement, result);
    m_placements.append(placement);
    if (!placement.loaded)
        emit photoFailed(index, placement.error);

    ++m_nextPhoto;
    m_waiting = false;
    advance();
}

// ---------------------------------------------------------------------------
// Page chrome
// ---------------------------------------------------------------------------

void ReportComposer::openPage(PageKind kind)
{
    closePage();
    m_canvas->beginPage();
    m_pageKinds.append(kind);
    m_pageOpen = true;

    HeaderFooterRenderer::drawHeader(m_canvas, m_theme, m_branding,
                                     PageLayout::kPageWidth, PageLayout::kMargin,
                                     m_logo.isNull() ? nullptr : &m_logo);
}

void ReportComposer::closePage()
{
    if (!m_pageOpen)
        return;

    QString stamp;
    if (m_pageKinds.last() == PageKind::Summary)
        stamp = HeaderFooterRenderer::timestampLine(m_options.generatedAt, m_options.timeZone);
    HeaderFooterRenderer::drawFooter(m_canvas, m_theme, m_branding,
                                     PageLayout::kPageWidth, PageLayout::kPageHeight, stamp);
    m_pageOpen = false;
}

// ---------------------------------------------------------------------------
// Summary page
// ---------------------------------------------------------------------------

void ReportComposer::drawInfoCard(const QString &title,
                                  const QList<QPair<QString, QString>> &rows,
                                  qreal x, qreal y, qreal width, qreal height)
{
    const qreal pad = PageLayout::kCardPadding;
    m_primitives->drawCard(x, y, width, height);
    qreal cy = m_primitives->drawSectionTitle(title, x + pad, y + pad, width - 2 * pad) + mm(1);

    const qreal valueWidth = width - 2 * pad - PageLayout::kLabelWidth;
    for (const auto &row : rows)
        cy = m_primitives->drawLabelValueRow(row.first, row.second, x + pad, cy,
                                             PageLayout::kLabelWidth, valueWidth);
}

void ReportComposer::drawTeamCard(qreal y)
{
    const qreal x = PageLayout::kMargin;
    const qreal width = PageLayout::kContentWidth;
    const qreal pad = PageLayout::kCardPadding;
    const qreal inner = width - 2 * pad;
    const QTimeZone &zone = m_options.timeZone;

    m_primitives->drawCard(x, y, width, PageLayout::kTeamCardHeight);
    qreal cy = m_primitives->drawSectionTitle(QStringLiteral("Equipe Mobilizada"),
                                              x + pad, y + pad, inner) + mm(1);

    const qreal valueWidth = inner - PageLayout::kLabelWidth;
    cy = m_primitives->drawLabelValueRow(QStringLiteral("Efetivo:"),
                                         M::mobilizedSummary(m_input),
                                         x + pad, cy, PageLayout::kLabelWidth, valueWidth);
    cy = m_primitives->drawLabelValueRow(QStringLiteral("Operador:"),
                                         m_input.operatorName.value_or(QString()),
                                         x + pad, cy, PageLayout::kLabelWidth, valueWidth);

    const QList<TableColumn> columns = {
        {QStringLiteral("Função"), mm(26), Qt::AlignLeft},
        {QStringLiteral("Nome"), mm(46), Qt::AlignLeft},
        {QStringLiteral("Chegada / Saída"), mm(30), Qt::AlignLeft},
        {QStringLiteral("Tempo"), mm(22), Qt::AlignRight},
        {QStringLiteral("Distância"), mm(20), Qt::AlignRight},
        {QStringLiteral("Custo"), inner - mm(144), Qt::AlignRight},
    };

    QList<TableRow> rows;
    const QString primaryName = m_input.primaryAgent.name;
    rows.append({{QStringLiteral("Agente principal"),
                  primaryName.isEmpty() ? M::kPlaceholder : primaryName,
                  timeRange(m_input.startDatetime, m_input.endDatetime, zone),
                  M::formatDurationCompact(M::elapsedMinutes(m_input.startDatetime,
                                                             m_input.endDatetime)),
                  M::formatKm(M::distanceKm(m_input.activity)),
                  M::formatCurrency(M::totalCost(m_input.activity))},
                 false});

    const SupportAssignment *slots[] = {&m_input.supportAgent1, &m_input.supportAgent2};
    for (int i = 0; i < 2; ++i) {
        const SupportAssignment *slot = slots[i];
        if (!slot->isRendered())
            continue;
        const QString name = slot->agent && !slot->agent->name.isEmpty()
            ? slot->agent->name : M::kPlaceholder;
        rows.append({{QStringLiteral("Apoio %1").arg(i + 1),
                      name,
                      timeRange(slot->arrival, slot->departure, zone),
                      M::formatDurationCompact(M::elapsedMinutes(slot->arrival, slot->departure)),
                      M::formatKm(M::distanceKm(slot->activity)),
                      M::formatCurrency(M::totalCost(slot->activity))},
                     false});
    }

    rows.append({{QStringLiteral("Total"), QString(), QString(), QString(),
                  M::formatKm(M::teamDistanceKm(m_input)),
                  M::formatCurrency(M::teamCost(m_input))},
                 true});

    m_primitives->drawTable(columns, rows, x + pad, cy - mm(2));
}

void ReportComposer::composeSummary()
{
    openPage(PageKind::Summary);

    const QTimeZone &zone = m_options.timeZone;
    const QString serviceLabel = M::serviceTypeLabel(m_input.serviceType, m_input.serviceTypeKey);
    const QString code = m_input.code.isEmpty() ? M::kPlaceholder : m_input.code;
    qreal y = m_primitives->drawPageTitle(
        kSummaryTitle,
        serviceLabel + QStringLiteral("  •  Atendimento ") + code,
        PageLayout::kHeaderHeight);

    const qreal left = PageLayout::kMargin;
    const qreal right = left + PageLayout::kColumnWidth + PageLayout::kColumnGap;
    const qreal colWidth = PageLayout::kColumnWidth;

    drawInfoCard(QStringLiteral("Solicitante"),
                 {{QStringLiteral("Cliente:"), m_input.client.name},
                  {QStringLiteral("Telefone:"), m_input.client.contactPhone},
                  {QStringLiteral("Plano:"), m_input.planName}},
                 left, y, colWidth, PageLayout::kTopCardHeight);
    drawInfoCard(QStringLiteral("Localização"),
                 {{QStringLiteral("Cidade:"), m_input.city},
                  {QStringLiteral("Estado:"), m_input.state},
                  {QStringLiteral("Coordenadas:"), M::formatCoordinates(m_input.coordinates)}},
                 right, y, colWidth, PageLayout::kTopCardHeight);
    y += PageLayout::kTopCardHeight + PageLayout::kCardGap;

    drawInfoCard(QStringLiteral("Data e Hora"),
                 {{QStringLiteral("Início:"), M::formatDateTime(m_input.startDatetime, zone)},
                  {QStringLiteral("Término:"), M::formatDateTime(m_input.endDatetime, zone)},
                  {QStringLiteral("Duração:"),
                   M::formatDurationLong(M::elapsedMinutes(m_input.startDatetime,
                                                           m_input.endDatetime))}},
                 left, y, colWidth, PageLayout::kMiddleCardHeight);

    QList<QPair<QString, QString>> vehicleRows = {
        {QStringLiteral("Descrição:"), m_input.vehicle.description},
        {QStringLiteral("Cavalo:"), M::tractorLine(m_input.vehicle)},
    };
    const QList<Trailer> &trailers = m_input.vehicle.trailers;
    if (trailers.isEmpty())
        vehicleRows.append({QStringLiteral("Carretas:"), M::kPlaceholder});
    for (int i = 0; i < trailers.size() && i < 3; ++i)
        vehicleRows.append({QStringLiteral("Carreta %1:").arg(i + 1), M::trailerLine(trailers.at(i))});
    drawInfoCard(QStringLiteral("Veículo"), vehicleRows,
                 right, y, colWidth, PageLayout::kMiddleCardHeight);
    y += PageLayout::kMiddleCardHeight + PageLayout::kCardGap;

    drawTeamCard(y);
}

// ---------------------------------------------------------------------------
// Narrative pages
// ---------------------------------------------------------------------------

// Draws the card of a narrative page and returns the first text baseline.
qreal ReportComposer::drawNarrativeFrame(bool firstPage)
{
    const qreal x = PageLayout::kMargin;
    const qreal top = PageLayout::kHeaderHeight;
    const qreal pad = PageLayout::kCardPadding;

    m_primitives->drawCard(x, top, PageLayout::kContentWidth,
                           PageLayout::kNarrativeCardBottom - top);
    if (firstPage)
        return m_primitives->drawSectionTitle(kNarrativeTitle, x + pad, top + pad,
                                              PageLayout::kContentWidth - 2 * pad) + mm(2);
    return top + pad + mm(6);
}

void ReportComposer::composeNarrative()
{
    const TextStyle body = m_primitives->bodyStyle();
    const TextStyle heading = m_primitives->bodyHeadingStyle();
    const qreal textX = PageLayout::kMargin + PageLayout::kCardPadding;
    const qreal textWidth = PageLayout::kContentWidth - 2 * PageLayout::kCardPadding;

    QList<NarrativeLine> lines;
    auto appendBlock = [&](const QString &title, const QString &text) {
        lines.append({title, true});
        const QString trimmed = text.trimmed();
        if (trimmed.isEmpty()) {
            lines.append({M::kPlaceholder, false});
            return;
        }
        const QStringList wrapped = TextFit::wrap(*m_canvas, trimmed, body, textWidth);
        for (const QString &l : wrapped)
            lines.append({l, false});
    };

    if (!m_input.summary.trimmed().isEmpty()) {
        appendBlock(kSummaryHeading, m_input.summary);
        lines.append({QString(), false});
    }
    appendBlock(kDetailHeading, m_input.detailedReport);

    openPage(PageKind::Narrative);
    qreal cursor = drawNarrativeFrame(true);
    bool pageHasText = false;

    for (const NarrativeLine &line : lines) {
        if (cursor > PageLayout::kNarrativeLimit) {
            openPage(PageKind::Narrative);
            cursor = drawNarrativeFrame(false);
            pageHasText = false;
        }
        // A blank separator never opens a continuation page
        if (line.text.isEmpty() && !pageHasText)
            continue;
        m_canvas->drawText(line.text, line.heading ? heading : body, textX, cursor);
        pageHasText = true;
        cursor += PageLayout::kNarrativeLineHeight;
    }
}

// ---------------------------------------------------------------------------
// Photo pages
// ---------------------------------------------------------------------------

void ReportComposer::openPhotoPage(int photoPage)
{
    openPage(PageKind::Photos);

    const int total = m_input.photos.size();
    const int first = photoPage * PageLayout::kPhotosPerPage + 1;
    const int last = qMin(total, first + PageLayout::kPhotosPerPage - 1);
    const qreal top = PageLayout::kHeaderHeight;

    m_primitives->drawSectionTitle(kPhotosTitle, PageLayout::kMargin, top,
                                   PageLayout::kContentWidth);
    const QString counter = QStringLiteral("Página %1 de %2  •  Fotos %3 a %4 de %5")
                                .arg(photoPage + 1)
                                .arg(photoPageCount(total))
                                .arg(first)
                                .arg(last)
                                .arg(total);
    m_canvas->drawAlignedText(counter, m_primitives->labelStyle(),
                              PageLayout::kMargin + PageLayout::kContentWidth, top + mm(5),
                              Qt::AlignRight);
}

void ReportComposer::drawPhotoCell(const PhotoPlacement &placement, const FetchResult &result)
{
    const QRectF cell = placement.cell;

    if (placement.loaded) {
        const LoadedImage &image = result.image;
        const QRectF inner = cell.adjusted(mm(1), mm(1), -mm(1), -mm(1));
        const qreal scale = qMin(inner.width() / image.width, inner.height() / image.height);
        const QSizeF fitted(image.width * scale, image.height * scale);
        const QRectF target(inner.center().x() - fitted.width() / 2,
                            inner.center().y() - fitted.height() / 2,
                            fitted.width(), fitted.height());
        m_canvas->drawRect(cell, m_theme.placeholderFill());
        m_canvas->drawImage(target, image);
        m_canvas->drawRect(cell, QColor(), m_theme.cardBorder(), 0.5);
    } else {
        m_canvas->drawRect(cell, m_theme.placeholderFill(), m_theme.cardBorder(), 0.5);
        const TextStyle style = m_primitives->placeholderStyle();
        m_canvas->drawAlignedText(kPhotoMissing, style, cell.center().x(),
                                  cell.center().y() + style.size / 3, Qt::AlignHCenter);
    }

    // Number badge
    const TextStyle badge = m_primitives->badgeStyle();
    const QString number = QStringLiteral("#%1").arg(placement.index + 1);
    const QRectF badgeRect(cell.left() + mm(2), cell.top() + mm(2),
                           m_canvas->textWidth(number, badge) + mm(3), mm(4.5));
    m_canvas->drawRoundedRect(badgeRect, mm(1), m_theme.accent());
    m_canvas->drawText(number, badge, badgeRect.left() + mm(1.5), badgeRect.top() + mm(3.2));

    // First line of the caption only
    const QString caption = m_input.photos.at(placement.index).caption.trimmed();
    if (!caption.isEmpty()) {
        const TextStyle style = m_primitives->captionStyle();
        const QStringList wrapped = TextFit::wrap(*m_canvas, caption, style, cell.width());
        const QString firstLine = wrapped.isEmpty() ? QString() : wrapped.first();
        m_canvas->drawAlignedText(firstLine, style, cell.center().x(),
                                  cell.bottom() + mm(6), Qt::AlignHCenter);
    }
}
