#include "tst_reportmetrics.h"

#include <QTest>

#include "reportmetrics.h"

using namespace ReportMetrics;

void ReportMetricsTest::distanceNeedsBothBounds()
{
    QCOMPARE(distanceKm(100.0, 180.5), std::optional<double>(80.5));
    QVERIFY(!distanceKm(std::nullopt, 180.0).has_value());
    QVERIFY(!distanceKm(100.0, std::nullopt).has_value());
    QCOMPARE(distanceKm(50.0, 50.0), std::optional<double>(0.0));
}

void ReportMetricsTest::negativeDistanceIsUnrenderable()
{
    // Never clamped to zero
    QVERIFY(!distanceKm(200.0, 150.0).has_value());
    QCOMPARE(formatKm(distanceKm(200.0, 150.0)), QStringLiteral("-"));
}

void ReportMetricsTest::totalCostTreatsMissingAsZero()
{
    QCOMPARE(totalCost(std::nullopt, std::nullopt, std::nullopt), 0.0);
    QCOMPARE(totalCost(10.5, std::nullopt, 4.5), 15.0);

    Activity act;
    act.tollCost = 12.0;
    act.foodCost = 30.0;
    act.otherCosts = 8.0;
    QCOMPARE(totalCost(act), 50.0);
}

void ReportMetricsTest::teamCostSumsRenderedSlots()
{
    ReportInput in;
    in.activity.tollCost = 10.0;
    in.supportAgent1.agent = Agent{QStringLiteral("Carlos"), true};
    in.supportAgent1.activity.foodCost = 25.0;
    QCOMPARE(teamCost(in), 35.0);

    // Slot 2 carries costs without an agent: still rendered, still counted
    in.supportAgent2.activity.otherCosts = 5.0;
    QVERIFY(in.supportAgent2.isRendered());
    QCOMPARE(teamCost(in), 40.0);
}

void ReportMetricsTest::teamDistanceSkipsUnrenderable()
{
    ReportInput in;
    QVERIFY(!teamDistanceKm(in).has_value());

    in.activity.kmStart = 1000.0;
    in.activity.kmEnd = 1080.0;
    in.supportAgent1.agent = Agent{QStringLiteral("Ana"), false};
    in.supportAgent1.activity.kmStart = 500.0;
    in.supportAgent1.activity.kmEnd = 450.0; // inverted, ignored
    QCOMPARE(teamDistanceKm(in), std::optional<double>(80.0));

    in.supportAgent1.activity.kmEnd = 520.0;
    QCOMPARE(teamDistanceKm(in), std::optional<double>(100.0));
}

void ReportMetricsTest::elapsedMinutes()
{
    const QDateTime start(QDate(2025, 12, 16), QTime(14, 0), QTimeZone::utc());
    QCOMPARE(ReportMetrics::elapsedMinutes(start, start.addSecs(125 * 60 + 30)),
             std::optional<qint64>(125));
    QVERIFY(!ReportMetrics::elapsedMinutes(start, QDateTime()).has_value());
    QCOMPARE(formatDurationLong(ReportMetrics::elapsedMinutes(start, start.addSecs(-600))),
             QStringLiteral("-"));
}

void ReportMetricsTest::mobilizedSummary_data()
{
    QTest::addColumn<int>("armed");
    QTest::addColumn<int>("unarmed");
    QTest::addColumn<QString>("expected");

    QTest::newRow("none") << 0 << 0 << QStringLiteral("-");
    QTest::newRow("one armed") << 1 << 0 << QStringLiteral("01 agente armado");
    QTest::newRow("two armed") << 2 << 0 << QStringLiteral("02 agentes armados");
    QTest::newRow("one unarmed") << 0 << 1 << QStringLiteral("01 agente desarmado");
    QTest::newRow("mixed") << 2 << 1
                           << QStringLiteral("02 agentes armados + 01 agente desarmado");
    QTest::newRow("mixed plural") << 1 << 2
                                  << QStringLiteral("01 agente armado + 02 agentes desarmados");
}

void ReportMetricsTest::mobilizedSummary()
{
    QFETCH(int, armed);
    QFETCH(int, unarmed);
    QFETCH(QString, expected);

    QList<Agent> agents;
    for (int i = 0; i < armed; ++i)
        agents.append(Agent{QStringLiteral("A%1").arg(i), true});
    for (int i = 0; i < unarmed; ++i)
        agents.append(Agent{QStringLiteral("U%1").arg(i), false});

    const Agent *slots[3] = {nullptr, nullptr, nullptr};
    for (int i = 0; i < agents.size(); ++i)
        slots[i] = &agents.at(i);

    QCOMPARE(ReportMetrics::mobilizedSummary(slots[0], slots[1], slots[2]), expected);
}

void ReportMetricsTest::formatCurrency_data()
{
    QTest::addColumn<double>("value");
    QTest::addColumn<QString>("expected");

    QTest::newRow("zero") << 0.0 << QStringLiteral("R$ 0,00");
    QTest::newRow("cents") << 12.5 << QStringLiteral("R$ 12,50");
    QTest::newRow("no grouping") << 1234.56 << QStringLiteral("R$ 1234,56");
}

void ReportMetricsTest::formatCurrency()
{
    QFETCH(double, value);
    QFETCH(QString, expected);
    QCOMPARE(ReportMetrics::formatCurrency(value), expected);
}

void ReportMetricsTest::formatDurations_data()
{
    QTest::addColumn<qint64>("minutes");
    QTest::addColumn<QString>("compact");
    QTest::addColumn<QString>("longForm");

    QTest::newRow("one minute") << qint64(1) << QStringLiteral("1 minuto") << QStringLiteral("1 minuto");
    QTest::newRow("minutes") << qint64(45) << QStringLiteral("45 minutos") << QStringLiteral("45 minutos");
    QTest::newRow("one hour") << qint64(60) << QStringLiteral("1 hora") << QStringLiteral("1 hora");
    QTest::newRow("hours") << qint64(120) << QStringLiteral("2 horas") << QStringLiteral("2 horas");
    QTest::newRow("mixed") << qint64(125) << QStringLiteral("2h 5min")
                           << QStringLiteral("2 horas e 5 minutos");
    QTest::newRow("zero") << qint64(0) << QStringLiteral("-") << QStringLiteral("-");
}

void ReportMetricsTest::formatDurations()
{
    QFETCH(qint64, minutes);
    QFETCH(QString, compact);
    QFETCH(QString, longForm);

    QCOMPARE(formatDurationCompact(minutes), compact);
    QCOMPARE(formatDurationLong(minutes), longForm);
}

void ReportMetricsTest::formatKmAndCoordinates()
{
    QCOMPARE(formatKm(80.0), QStringLiteral("80 km"));
    QCOMPARE(formatKm(80.5), QStringLiteral("80,5 km"));
    QCOMPARE(formatKm(std::nullopt), QStringLiteral("-"));

    QCOMPARE(formatCoordinates(Coordinates{-26.3044, -48.8455}),
             QStringLiteral("-26.304400, -48.845500"));
    QCOMPARE(formatCoordinates(std::nullopt), QStringLiteral("-"));
}

void ReportMetricsTest::formatDateTimeInZone()
{
    const QDateTime utc(QDate(2025, 12, 16), QTime(17, 47, 56), QTimeZone::utc());
    const QTimeZone saoPaulo(QByteArrayLiteral("America/Sao_Paulo"));
    QVERIFY(saoPaulo.isValid());

    QCOMPARE(formatDateTime(utc, saoPaulo), QStringLiteral("16/12/2025 às 14:47"));
    QCOMPARE(formatTime(utc, saoPaulo), QStringLiteral("14:47"));
    QCOMPARE(formatDateTime(QDateTime(), saoPaulo), QStringLiteral("-"));
}

void ReportMetricsTest::labels()
{
    QCOMPARE(serviceTypeLabel(ServiceType::Alarm), QStringLiteral("Alarme"));
    QCOMPARE(serviceTypeLabel(ServiceType::LogisticsEscort),
             QStringLiteral("Acompanhamento Logístico"));
    QCOMPARE(serviceTypeLabel(ServiceType::Other, QStringLiteral("escolta")),
             QStringLiteral("escolta"));
    QCOMPARE(bodyTypeLabel(QStringLiteral("bau")), QStringLiteral("Baú"));
    QCOMPARE(bodyTypeLabel(QStringLiteral("desconhecido")), QStringLiteral("desconhecido"));

    Vehicle v;
    QCOMPARE(tractorLine(v), QStringLiteral("-"));
    v.tractorPlate = QStringLiteral("ABC1D23");
    v.tractorBrand = QStringLiteral("Scania");
    v.tractorModel = QStringLiteral("R450");
    QCOMPARE(tractorLine(v), QStringLiteral("ABC1D23 - Scania R450"));
    QCOMPARE(trailerLine(Trailer{QStringLiteral("XYZ9K87"), QStringLiteral("grade_baixa")}),
             QStringLiteral("XYZ9K87 (Grade Baixa)"));
}

QTEST_GUILESS_MAIN(ReportMetricsTest)
