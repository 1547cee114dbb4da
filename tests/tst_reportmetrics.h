#ifndef TST_REPORTMETRICS_H
#define TST_REPORTMETRICS_H

#include <QObject>

class ReportMetricsTest : public QObject
{
    Q_OBJECT
private slots:
    void distanceNeedsBothBounds();
    void negativeDistanceIsUnrenderable();
    void totalCostTreatsMissingAsZero();
    void teamCostSumsRenderedSlots();
    void teamDistanceSkipsUnrenderable();
    void elapsedMinutes();
    void mobilizedSummary_data();
    void mobilizedSummary();
    void formatCurrency_data();
    void formatCurrency();
    void formatDurations_data();
    void formatDurations();
    void formatKmAndCoordinates();
    void formatDateTimeInZone();
    void labels();
};

#endif // TST_REPORTMETRICS_H
