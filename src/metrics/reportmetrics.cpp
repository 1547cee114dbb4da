/*
 * reportmetrics.cpp — Derived values and regional formatting for reports
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "reportmetrics.h"

#include <QHash>
#include <QStringList>

namespace ReportMetrics {

// ---------------------------------------------------------------------------
// Derived values
// ---------------------------------------------------------------------------

std::optional<qint64> elapsedMinutes(const QDateTime &start, const QDateTime &end)
{
    if (!start.isValid() || !end.isValid())
        return std::nullopt;
    return start.secsTo(end) / 60;
}

std::optional<double> distanceKm(std::optional<double> start, std::optional<double> end)
{
    if (!start || !end)
        return std::nullopt;
    if (*end < *start)
        return std::nullopt;
    return *end - *start;
}

std::optional<double> distanceKm(const Activity &activity)
{
    return distanceKm(activity.kmStart, activity.kmEnd);
}

double totalCost(std::optional<double> toll, std::optional<double> food,
                 std::optional<double> other)
{
    return toll.value_or(0.0) + food.value_or(0.0) + other.value_or(0.0);
}

double totalCost(const Activity &activity)
{
    return totalCost(activity.tollCost, activity.foodCost, activity.otherCosts);
}

double teamCost(const ReportInput &input)
{
    double sum = totalCost(input.activity);
    for (const SupportAssignment *slot : {&input.supportAgent1, &input.supportAgent2}) {
        if (slot->isRendered())
            sum += totalCost(slot->activity);
    }
    return sum;
}

std::optional<double> teamDistanceKm(const ReportInput &input)
{
    std::optional<double> sum = distanceKm(input.activity);
    for (const SupportAssignment *slot : {&input.supportAgent1, &input.supportAgent2}) {
        if (!slot->isRendered())
            continue;
        if (auto d = distanceKm(slot->activity))
            sum = sum.value_or(0.0) + *d;
    }
    return sum;
}

static QString agentClause(int count, const char *adjective)
{
    const bool plural = count > 1;
    return QStringLiteral("%1 agente%2 %3%4")
        .arg(count, 2, 10, QLatin1Char('0'))
        .arg(plural ? QStringLiteral("s") : QString())
        .arg(QLatin1String(adjective))
        .arg(plural ? QStringLiteral("s") : QString());
}

QString mobilizedSummary(const Agent *primary, const Agent *support1,
                         const Agent *support2)
{
    int armed = 0;
    int unarmed = 0;
    for (const Agent *agent : {primary, support1, support2}) {
        if (!agent)
            continue;
        if (agent->isArmed)
            ++armed;
        else
            ++unarmed;
    }

    QStringList parts;
    if (armed > 0)
        parts << agentClause(armed, "armado");
    if (unarmed > 0)
        parts << agentClause(unarmed, "desarmado");

    return parts.isEmpty() ? kPlaceholder : parts.join(QStringLiteral(" + "));
}

QString mobilizedSummary(const ReportInput &input)
{
    const Agent *primary = input.primaryAgent.name.isEmpty() ? nullptr : &input.primaryAgent;
    const Agent *s1 = input.supportAgent1.agent ? &*input.supportAgent1.agent : nullptr;
    const Agent *s2 = input.supportAgent2.agent ? &*input.supportAgent2.agent : nullptr;
    return mobilizedSummary(primary, s1, s2);
}

// ---------------------------------------------------------------------------
// Regional formatting
// ---------------------------------------------------------------------------

QString formatDateTime(const QDateTime &dt, const QTimeZone &zone)
{
    if (!dt.isValid())
        return kPlaceholder;
    return dt.toTimeZone(zone).toString(QStringLiteral("dd/MM/yyyy 'às' HH:mm"));
}

QString formatTime(const QDateTime &dt, const QTimeZone &zone)
{
    if (!dt.isValid())
        return kPlaceholder;
    return dt.toTimeZone(zone).toString(QStringLiteral("HH:mm"));
}

QString formatCurrency(double value)
{
    return QStringLiteral("R$ ")
        + QString::number(value, 'f', 2).replace(QLatin1Char('.'), QLatin1Char(','));
}

static QString plural(qint64 n, const char *singular, const char *pluralForm)
{
    return QString::number(n) + QLatin1Char(' ')
        + QLatin1String(n > 1 ? pluralForm : singular);
}

QString formatDurationCompact(std::optional<qint64> minutes)
{
    if (!minutes || *minutes <= 0)
        return kPlaceholder;
    const qint64 hours = *minutes / 60;
    const qint64 mins = *minutes % 60;
    if (hours == 0)
        return plural(mins, "minuto", "minutos");
    if (mins == 0)
        return plural(hours, "hora", "horas");
    return QStringLiteral("%1h %2min").arg(hours).arg(mins);
}

QString formatDurationLong(std::optional<qint64> minutes)
{
    if (!minutes || *minutes <= 0)
        return kPlaceholder;
    const qint64 hours = *minutes / 60;
    const qint64 mins = *minutes % 60;
    if (hours == 0)
        return plural(mins, "minuto", "minutos");
    if (mins == 0)
        return plural(hours, "hora", "horas");
    return plural(hours, "hora", "horas") + QStringLiteral(" e ")
        + plural(mins, "minuto", "minutos");
}

QString formatKm(std::optional<double> km)
{
    if (!km)
        return kPlaceholder;
    QString number = QString::number(*km, 'f', 1);
    if (number.endsWith(QLatin1String(".0")))
        number.chop(2);
    number.replace(QLatin1Char('.'), QLatin1Char(','));
    return number + QStringLiteral(" km");
}

QString formatCoordinates(const std::optional<Coordinates> &coordinates)
{
    if (!coordinates)
        return kPlaceholder;
    return QStringLiteral("%1, %2")
        .arg(coordinates->lat, 0, 'f', 6)
        .arg(coordinates->lng, 0, 'f', 6);
}

// ---------------------------------------------------------------------------
// Labels
// ---------------------------------------------------------------------------

QString serviceTypeLabel(ServiceType type, const QString &rawKey)
{
    switch (type) {
    case ServiceType::Alarm:
        return QStringLiteral("Alarme");
    case ServiceType::Investigation:
        return QStringLiteral("Averiguação");
    case ServiceType::Preservation:
        return QStringLiteral("Preservação");
    case ServiceType::LogisticsEscort:
        return QStringLiteral("Acompanhamento Logístico");
    case ServiceType::Other:
        break;
    }
    return rawKey.isEmpty() ? kPlaceholder : rawKey;
}

QString bodyTypeLabel(const QString &key)
{
    static const QHash<QString, QString> labels = {
        {QStringLiteral("grade_baixa"), QStringLiteral("Grade Baixa")},
        {QStringLiteral("grade_alta"), QStringLiteral("Grade Alta")},
        {QStringLiteral("bau"), QStringLiteral("Baú")},
        {QStringLiteral("sider"), QStringLiteral("Sider")},
        {QStringLiteral("frigorifico"), QStringLiteral("Frigorífico")},
        {QStringLiteral("container"), QStringLiteral("Contêiner")},
        {QStringLiteral("prancha"), QStringLiteral("Prancha")},
    };
    if (key.isEmpty())
        return kPlaceholder;
    return labels.value(key, key);
}

QString tractorLine(const Vehicle &vehicle)
{
    if (vehicle.tractorPlate.isEmpty())
        return kPlaceholder;
    QString line = vehicle.tractorPlate;
    if (!vehicle.tractorBrand.isEmpty())
        line += QStringLiteral(" - ") + vehicle.tractorBrand;
    if (!vehicle.tractorModel.isEmpty())
        line += QLatin1Char(' ') + vehicle.tractorModel;
    return line;
}

QString trailerLine(const Trailer &trailer)
{
    return QStringLiteral("%1 (%2)").arg(trailer.plate, bodyTypeLabel(trailer.bodyType));
}

} // namespace ReportMetrics
