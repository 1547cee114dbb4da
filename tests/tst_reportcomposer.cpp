#include "tst_reportcomposer.h"

#include <QSignalSpy>
#include <QTest>

#include <algorithm>

#include "pagelayout.h"
#include "recordingcanvas.h"
#include "reportcomposer.h"
#include "reportinputreader.h"

using PageKind = ReportComposer::PageKind;

namespace {

ReportInput makeInput(int photoCount)
{
    ReportInput in;
    in.code = QStringLiteral("CH-001");
    in.serviceType = ServiceType::Alarm;
    in.serviceTypeKey = QStringLiteral("alarme");
    in.city = QStringLiteral("Joinville");
    in.state = QStringLiteral("SC");
    in.startDatetime = QDateTime(QDate(2025, 12, 16), QTime(14, 0), QTimeZone::utc());
    in.endDatetime = in.startDatetime.addSecs(2 * 3600 + 5 * 60);
    in.client.name = QStringLiteral("Transportadora Exemplo");
    in.primaryAgent = Agent{QStringLiteral("João Silva"), true};
    in.detailedReport = QStringLiteral("Agente chegou ao local. Nada a relatar.");
    for (int i = 0; i < photoCount; ++i)
        in.photos.append(Photo{QStringLiteral("https://fotos.example.com/%1.jpg").arg(i + 1),
                               QStringLiteral("Foto %1").arg(i + 1)});
    return in;
}

struct Run {
    RecordingCanvas canvas{PageLayout::pageSize()};
    ScriptedImageLoader loader;
    ReportComposer composer{&canvas, &loader};

    explicit Run(ScriptedImageLoader::Mode mode = ScriptedImageLoader::Synchronous)
        : loader(mode)
    {
    }
};

// Baselines mirror the frame drawn on first and continuation narrative pages
qreal firstNarrativeBaseline()
{
    return PageLayout::kHeaderHeight + PageLayout::kCardPadding
        + PageLayout::kSectionTitleHeight + PageLayout::mm(2);
}

qreal continuationNarrativeBaseline()
{
    return PageLayout::kHeaderHeight + PageLayout::kCardPadding + PageLayout::mm(6);
}

int linesFitting(qreal firstBaseline)
{
    int n = 0;
    for (qreal y = firstBaseline; !(y > PageLayout::kNarrativeLimit);
         y += PageLayout::kNarrativeLineHeight)
        ++n;
    return n;
}

int expectedNarrativePages(int lineCount)
{
    const int first = linesFitting(firstNarrativeBaseline());
    const int next = linesFitting(continuationNarrativeBaseline());
    if (lineCount <= first)
        return 1;
    return 1 + (lineCount - first + next - 1) / next;
}

QString numberedParagraphs(int count)
{
    QStringList paragraphs;
    for (int i = 0; i < count; ++i)
        paragraphs.append(QStringLiteral("Linha %1 do relatório detalhado.").arg(i + 1));
    return paragraphs.join(QLatin1Char('\n'));
}

} // namespace

void ReportComposerTest::summaryIsOnePage()
{
    Run run;
    QSignalSpy finished(&run.composer, &ReportComposer::finished);

    ReportInput in = makeInput(0);
    in.vehicle.trailers = {Trailer{QStringLiteral("AAA1A11"), QStringLiteral("bau")},
                           Trailer{QStringLiteral("BBB2B22"), QStringLiteral("sider")},
                           Trailer{QStringLiteral("CCC3C33"), QStringLiteral("prancha")}};
    QVERIFY(run.composer.start(in));

    QCOMPARE(finished.count(), 1);
    QVERIFY(run.composer.isFinished());
    QCOMPARE(run.composer.pageKinds(), QList<PageKind>({PageKind::Summary, PageKind::Narrative}));
    QCOMPARE(run.canvas.pageCount(), 2);

    // Every summary card lands on the first page
    for (const char *title : {"SOLICITANTE", "LOCALIZAÇÃO", "DATA E HORA", "VEÍCULO",
                              "EQUIPE MOBILIZADA"})
        QCOMPARE(run.canvas.pageOfText(QString::fromUtf8(title)), 0);
    QCOMPARE(run.canvas.pageOfText(QStringLiteral("CCC3C33 (Prancha)")), 0);
}

void ReportComposerTest::photoPagination_data()
{
    QTest::addColumn<int>("photos");
    QTest::addColumn<int>("photoPages");

    QTest::newRow("none") << 0 << 0;
    QTest::newRow("one") << 1 << 1;
    QTest::newRow("full page") << 4 << 1;
    QTest::newRow("five") << 5 << 2;
    QTest::newRow("nine") << 9 << 3;
}

void ReportComposerTest::photoPagination()
{
    QFETCH(int, photos);
    QFETCH(int, photoPages);

    QCOMPARE(ReportComposer::photoPageCount(photos), photoPages);

    Run run;
    QVERIFY(run.composer.start(makeInput(photos)));
    QVERIFY(run.composer.isFinished());

    const QList<PageKind> kinds = run.composer.pageKinds();
    QCOMPARE(int(kinds.count(PageKind::Photos)), photoPages);
    QCOMPARE(run.composer.photoPlacements().size(), photos);
    QCOMPARE(run.canvas.ops(RecordingCanvas::Op::Image).size(), photos);

    const int firstPhotoPage = kinds.indexOf(PageKind::Photos);
    for (const ReportComposer::PhotoPlacement &p : run.composer.photoPlacements()) {
        QCOMPARE(p.page, p.index / 4);
        const QString badge = QStringLiteral("#%1").arg(p.index + 1);
        QCOMPARE(run.canvas.pageOfText(badge), firstPhotoPage + p.page);
    }

    if (photos == 9) {
        QVERIFY(run.canvas.texts().contains(
            QStringLiteral("Página 2 de 3  •  Fotos 5 a 8 de 9")));
        QVERIFY(run.canvas.texts().contains(
            QStringLiteral("Página 3 de 3  •  Fotos 9 a 9 de 9")));
    }
}

void ReportComposerTest::photoCellMapping()
{
    for (int i = 0; i < 12; ++i) {
        const ReportComposer::PhotoPlacement p = ReportComposer::placementFor(i);
        QCOMPARE(p.page, i / 4);
        QCOMPARE(p.column, (i % 4) % 2);
        QCOMPARE(p.row, (i % 4) / 2);
        QCOMPARE(p.cell.size(), QSizeF(PageLayout::kPhotoWidth, PageLayout::kPhotoHeight));
    }

    // Cells on a page never overlap and stay inside the content area
    const QRectF content(PageLayout::kMargin, PageLayout::kHeaderHeight,
                         PageLayout::kContentWidth, PageLayout::kFooterRuleY - PageLayout::kHeaderHeight);
    for (int i = 0; i < 4; ++i) {
        const QRectF a = ReportComposer::placementFor(i).cell;
        QVERIFY(content.contains(a.adjusted(0, 0, 0, PageLayout::kCaptionHeight)));
        for (int j = i + 1; j < 4; ++j)
            QVERIFY(!a.intersects(ReportComposer::placementFor(j).cell));
    }
}

void ReportComposerTest::photoFailureIsolation()
{
    Run run;
    const ReportInput in = makeInput(5);
    run.loader.failingUrls.insert(in.photos.at(2).url);
    QSignalSpy failed(&run.composer, &ReportComposer::photoFailed);
    QSignalSpy finished(&run.composer, &ReportComposer::finished);

    QVERIFY(run.composer.start(in));
    QCOMPARE(finished.count(), 1);

    QCOMPARE(failed.count(), 1);
    QCOMPARE(failed.first().at(0).toInt(), 2);

    const QList<ReportComposer::PhotoPlacement> placements = run.composer.photoPlacements();
    QCOMPARE(placements.size(), 5);
    for (const ReportComposer::PhotoPlacement &p : placements)
        QCOMPARE(p.loaded, p.index != 2);
    QVERIFY(!placements.at(2).error.isEmpty());

    QCOMPARE(int(run.composer.pageKinds().count(PageKind::Photos)), 2);
    QCOMPARE(run.canvas.ops(RecordingCanvas::Op::Image).size(), 4);
    QCOMPARE(int(run.canvas.texts().count(QStringLiteral("Imagem não disponível"))), 1);
    QVERIFY(run.canvas.texts().contains(QStringLiteral("#3")));
}

void ReportComposerTest::supportAgentOmission()
{
    {
        Run run;
        QVERIFY(run.composer.start(makeInput(0)));
        const QStringList texts = run.canvas.texts();
        QVERIFY(!texts.contains(QStringLiteral("Apoio 1")));
        QVERIFY(!texts.contains(QStringLiteral("Apoio 2")));
        QVERIFY(texts.contains(QStringLiteral("Agente principal")));
    }
    {
        // Slot 2 has activity but no agent: its row stays, slot 1 is omitted
        Run run;
        ReportInput in = makeInput(0);
        in.supportAgent2.activity.tollCost = 7.5;
        QVERIFY(run.composer.start(in));
        const QStringList texts = run.canvas.texts();
        QVERIFY(!texts.contains(QStringLiteral("Apoio 1")));
        QVERIFY(texts.contains(QStringLiteral("Apoio 2")));
        QVERIFY(texts.contains(QStringLiteral("R$ 7,50")));
    }
    {
        // A support object without a name is an unassigned slot
        const std::optional<ReportInput> in = ReportInputReader::read(R"({
            "code": "CH-002",
            "agent": {"name": "João Silva", "is_armed": true},
            "support_agent_1": {"name": "", "is_armed": false}
        })");
        QVERIFY(in.has_value());
        Run run;
        QVERIFY(run.composer.start(*in));
        const QStringList texts = run.canvas.texts();
        QVERIFY(!texts.contains(QStringLiteral("Apoio 1")));
        QVERIFY(texts.contains(QStringLiteral("01 agente armado")));
    }
}

void ReportComposerTest::narrativePagination()
{
    Run run;
    ReportInput in = makeInput(0);
    in.detailedReport = numberedParagraphs(150);

    QVERIFY(run.composer.start(in));

    // One heading line plus one line per paragraph
    const QList<PageKind> kinds = run.composer.pageKinds();
    const int narrativePages = int(kinds.count(PageKind::Narrative));
    QVERIFY(expectedNarrativePages(151) >= 3);
    QCOMPARE(narrativePages, expectedNarrativePages(151));

    // Body text sits between the header and the card bottom
    auto bodyBaselines = [&](int page) {
        QList<qreal> ys;
        for (const RecordingCanvas::Op &op : run.canvas.ops(RecordingCanvas::Op::Text, page)) {
            const qreal y = op.rect.y();
            if (y > PageLayout::kHeaderHeight && y < PageLayout::kNarrativeCardBottom)
                ys.append(y);
        }
        return ys;
    };

    int linesDrawn = 0;
    for (int page = 1; page <= narrativePages; ++page) {
        QCOMPARE(kinds.at(page), PageKind::Narrative);
        const QList<qreal> ys = bodyBaselines(page);
        QVERIFY(!ys.isEmpty());
        const qreal last = *std::max_element(ys.cbegin(), ys.cend());
        QVERIFY(last <= PageLayout::kNarrativeLimit);
        if (page < narrativePages)
            QVERIFY(last > PageLayout::kNarrativeLimit - PageLayout::kNarrativeLineHeight);
        linesDrawn += int(run.canvas.texts(page).filter(QStringLiteral("do relatório detalhado")).size());
    }
    QCOMPARE(linesDrawn, 150);

    // Continuation pages repeat the chrome but not the section title
    QCOMPARE(int(run.canvas.texts().count(QStringLiteral("DESCRIÇÃO DO EVENTO"))), 1);
}

void ReportComposerTest::narrativeFillingOnePage()
{
    const int capacity = linesFitting(firstNarrativeBaseline());
    QVERIFY(capacity > 2);

    {
        // Heading plus capacity - 1 paragraphs exactly fills the first page
        Run run;
        ReportInput in = makeInput(0);
        in.detailedReport = numberedParagraphs(capacity - 1);
        QVERIFY(run.composer.start(in));
        QCOMPARE(int(run.composer.pageKinds().count(PageKind::Narrative)), 1);
        QCOMPARE(run.canvas.pageCount(), 2);
    }
    {
        // One more line opens exactly one continuation page
        Run run;
        ReportInput in = makeInput(0);
        in.detailedReport = numberedParagraphs(capacity);
        QVERIFY(run.composer.start(in));
        QCOMPARE(int(run.composer.pageKinds().count(PageKind::Narrative)), 2);
        QCOMPARE(run.canvas.pageOfText(QStringLiteral("Linha %1 do relatório detalhado.").arg(capacity)), 2);
    }
}

void ReportComposerTest::timestampOnlyOnSummary()
{
    Run run;
    ReportComposer::Options options;
    options.generatedAt = QDateTime(QDate(2025, 12, 17), QTime(12, 30), QTimeZone::utc());
    run.composer.setOptions(options);
    QVERIFY(run.composer.start(makeInput(1)));

    const QString stamp = QStringLiteral("Relatório gerado em 17/12/2025 às 09:30");
    QCOMPARE(int(run.canvas.texts(0).count(stamp)), 1);
    for (int page = 1; page < run.canvas.pageCount(); ++page)
        QVERIFY(run.canvas.texts(page).filter(QStringLiteral("Relatório gerado em")).isEmpty());
}

void ReportComposerTest::synchronousLoader()
{
    Run run(ScriptedImageLoader::Synchronous);
    QSignalSpy finished(&run.composer, &ReportComposer::finished);

    const ReportInput in = makeInput(6);
    QVERIFY(run.composer.start(in));

    // Completed inside start() without nesting fetches
    QCOMPARE(finished.count(), 1);
    QCOMPARE(run.composer.phase(), ReportComposer::Phase::Done);
    QCOMPARE(run.loader.maxInFlight(), 1);
    QCOMPARE(run.loader.requested().size(), 6);
}

void ReportComposerTest::asynchronousLoader()
{
    Run run(ScriptedImageLoader::Asynchronous);
    QSignalSpy finished(&run.composer, &ReportComposer::finished);

    const ReportInput in = makeInput(6);
    QVERIFY(run.composer.start(in));
    QCOMPARE(run.composer.phase(), ReportComposer::Phase::Photos);
    QCOMPARE(finished.count(), 0);

    // A second run cannot start while this one waits on a fetch
    QVERIFY(!run.composer.start(in));
    QVERIFY(!run.composer.errorString().isEmpty());

    QVERIFY(finished.wait(5000));
    QCOMPARE(finished.count(), 1);
    QCOMPARE(run.loader.maxInFlight(), 1);

    QStringList expected;
    for (const Photo &p : in.photos)
        expected.append(p.url);
    QCOMPARE(run.loader.requested(), expected);
    QCOMPARE(run.composer.photoPlacements().size(), 6);
}

void ReportComposerTest::invalidCanvasIsFatal()
{
    Run run;
    run.canvas.setValid(false, QStringLiteral("no usable font"));
    QSignalSpy finished(&run.composer, &ReportComposer::finished);

    QVERIFY(!run.composer.start(makeInput(2)));
    QCOMPARE(run.composer.errorString(), QStringLiteral("no usable font"));
    QCOMPARE(run.canvas.pageCount(), 0);
    QCOMPARE(finished.count(), 0);
}

void ReportComposerTest::endToEndScenario()
{
    Run run;
    ReportInput in = makeInput(2);
    in.activity.kmStart = 100.0;
    in.activity.kmEnd = 180.0;
    in.activity.tollCost = 12.50;
    in.activity.foodCost = 0.0;
    in.activity.otherCosts = 0.0;

    QVERIFY(run.composer.start(in));
    QCOMPARE(run.composer.pageKinds(),
             QList<PageKind>({PageKind::Summary, PageKind::Narrative, PageKind::Photos}));

    const QStringList summary = run.canvas.texts(0);
    QVERIFY(summary.contains(QStringLiteral("80 km")));
    QVERIFY(summary.contains(QStringLiteral("R$ 12,50")));
    QVERIFY(summary.contains(QStringLiteral("01 agente armado")));
    QVERIFY(summary.contains(QStringLiteral("16/12/2025 às 11:00")));
    QVERIFY(summary.contains(QStringLiteral("2 horas e 5 minutos")));

    const QStringList photos = run.canvas.texts(2);
    QVERIFY(photos.contains(QStringLiteral("#1")));
    QVERIFY(photos.contains(QStringLiteral("#2")));
    QVERIFY(!photos.contains(QStringLiteral("#3")));
    QVERIFY(photos.contains(QStringLiteral("Foto 2")));
    QCOMPARE(run.canvas.ops(RecordingCanvas::Op::Image, 2).size(), 2);
}

QTEST_GUILESS_MAIN(ReportComposerTest)
