/*
 * reportmetrics.h — Derived values and regional formatting for reports
 *
 * Pure functions only.  None of them fail: missing or inconsistent input
 * degrades to an empty optional or to the "-" placeholder so that the
 * composer always has a definite string to draw.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TICKETREPORT_REPORTMETRICS_H
#define TICKETREPORT_REPORTMETRICS_H

#include <QDateTime>
#include <QString>
#include <QTimeZone>

#include <optional>

#include "reportinput.h"

namespace ReportMetrics {

/// Placeholder drawn wherever a value cannot be rendered.
inline const QString kPlaceholder = QStringLiteral("-");

// --- Derived values ---

/// end - start in whole minutes (may be negative); empty when either
/// bound is missing.
std::optional<qint64> elapsedMinutes(const QDateTime &start, const QDateTime &end);

/// end - start when both are present and end >= start, empty otherwise.
/// A negative distance is never clamped to zero.
std::optional<double> distanceKm(std::optional<double> start, std::optional<double> end);
std::optional<double> distanceKm(const Activity &activity);

/// Sum of the three cost components; a missing component counts as 0.
double totalCost(std::optional<double> toll, std::optional<double> food,
                 std::optional<double> other);
double totalCost(const Activity &activity);

/// Ticket-level cost plus the cost of every rendered support slot.
double teamCost(const ReportInput &input);

/// Sum of every renderable distance (ticket and rendered support slots);
/// empty when none of them is renderable.
std::optional<double> teamDistanceKm(const ReportInput &input);

/// "02 agentes armados + 01 agente desarmado".  Null pointers are absent
/// slots; returns kPlaceholder when no agent is present at all.
QString mobilizedSummary(const Agent *primary, const Agent *support1,
                         const Agent *support2);
QString mobilizedSummary(const ReportInput &input);

// --- Regional formatting (output contract) ---

/// "dd/MM/yyyy 'às' HH:mm" in @p zone.
QString formatDateTime(const QDateTime &dt, const QTimeZone &zone);
QString formatTime(const QDateTime &dt, const QTimeZone &zone);

/// "R$ 1234,50" — comma decimal separator, no digit grouping.
QString formatCurrency(double value);

/// "45 minutos", "2 horas", "2h 5min".
QString formatDurationCompact(std::optional<qint64> minutes);
/// "45 minutos", "1 hora", "2 horas e 5 minutos".
QString formatDurationLong(std::optional<qint64> minutes);

/// "80 km", "80,5 km" or kPlaceholder.
QString formatKm(std::optional<double> km);

/// "-26.304400, -48.845500" or kPlaceholder.
QString formatCoordinates(const std::optional<Coordinates> &coordinates);

// --- Labels ---

QString serviceTypeLabel(ServiceType type, const QString &rawKey = QString());
QString bodyTypeLabel(const QString &key);

/// "ABC1D23 - Scania R450" (brand and model only when present).
QString tractorLine(const Vehicle &vehicle);
/// "XYZ9K87 (Baú)".
QString trailerLine(const Trailer &trailer);

} // namespace ReportMetrics

#endif // TICKETREPORT_REPORTMETRICS_H
