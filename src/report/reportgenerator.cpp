/*
 * reportgenerator.cpp — One-call facade over canvas, composer and loader
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "reportgenerator.h"
#include "imageloader.h"
#include "pagelayout.h"
#include "pdfreportcanvas.h"
#include "reportcomposer.h"

#include <QDebug>
#include <QPointer>

ReportGenerator::ReportGenerator(ImageLoader *loader, QObject *parent)
    : QObject(parent)
    , m_loader(loader)
{
}

ReportGenerator::~ReportGenerator() = default;

bool ReportGenerator::generate(const ReportInput &input)
{
    if (m_running) {
        m_error = QStringLiteral("a report is already being generated");
        return false;
    }

    m_error.clear();
    m_input = input;
    m_logo = LoadedImage();
    m_canvas = std::make_unique<PdfReportCanvas>(m_theme.fontFamily, PageLayout::pageSize());
    if (!m_canvas->isValid()) {
        m_error = m_canvas->errorString();
        qWarning() << "ReportGenerator:" << m_error;
        m_canvas.reset();
        return false;
    }
    m_canvas->setTitle(input.code.isEmpty()
                           ? QStringLiteral("Relatório de Atendimento")
                           : QStringLiteral("Relatório de Atendimento %1").arg(input.code));
    m_running = true;
    m_starting = true;

    if (m_loader && !m_branding.logoPath.isEmpty()) {
        QPointer<ReportGenerator> guard(this);
        m_loader->fetch(ImageLoader::urlFromUserInput(m_branding.logoPath),
                        [guard](const FetchResult &result) {
                            if (guard)
                                guard->onLogoFetched(result);
                        });
    } else {
        startComposer();
    }

    m_starting = false;
    return m_running || m_error.isEmpty();
}

void ReportGenerator::onLogoFetched(const FetchResult &result)
{
    if (!m_running)
        return;
    if (result.ok)
        m_logo = result.image;
    else
        qWarning() << "ReportGenerator: logo unavailable, header is text-only:"
                   << result.errorString;
    startComposer();
}

void ReportGenerator::startComposer()
{
    m_composer = std::make_unique<ReportComposer>(m_canvas.get(), m_loader);
    m_composer->setTheme(m_theme);
    m_composer->setBranding(m_branding);
    m_composer->setLogo(m_logo);

    ReportComposer::Options options;
    options.generatedAt = m_generatedAt;
    options.timeZone = m_timeZone;
    m_composer->setOptions(options);

    connect(m_composer.get(), &ReportComposer::photoFailed,
            this, &ReportGenerator::photoFailed);
    connect(m_composer.get(), &ReportComposer::finished,
            this, &ReportGenerator::onComposerFinished);

    if (!m_composer->start(m_input))
        fail(m_composer->errorString());
}

void ReportGenerator::onComposerFinished()
{
    const QByteArray pdf = m_canvas->finish();
    if (pdf.isEmpty()) {
        fail(m_canvas->errorString());
        return;
    }
    reset();
    emit finished(pdf);
}

void ReportGenerator::fail(const QString &message)
{
    m_error = message.isEmpty() ? QStringLiteral("rendering failed") : message;
    qWarning() << "ReportGenerator:" << m_error;
    reset();
    // Inside generate() the failure is its return value
    if (!m_starting)
        emit failed(m_error);
}

// The composer may be on the stack when this runs; it is released from
// the event loop instead of in place.
void ReportGenerator::reset()
{
    m_running = false;
    if (m_composer) {
        m_composer->disconnect(this);
        m_composer.release()->deleteLater();
    }
    m_canvas.reset();
}
