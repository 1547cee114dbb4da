/*
 * reportinputreader.h — JSON ticket snapshot → ReportInput
 *
 * Reads the denormalized record produced by the upstream data assembler
 * (store column names, nested relations).  Only the document shape is
 * checked; field-level validation already happened upstream.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TICKETREPORT_REPORTINPUTREADER_H
#define TICKETREPORT_REPORTINPUTREADER_H

#include <QByteArray>
#include <QJsonObject>
#include <QString>

#include <optional>

#include "reportinput.h"

namespace ReportInputReader {

ReportInput fromJson(const QJsonObject &obj);

/// Parse a JSON document.  Returns std::nullopt and fills @p errorMessage
/// when the payload is not a JSON object.
std::optional<ReportInput> read(const QByteArray &json, QString *errorMessage = nullptr);
std::optional<ReportInput> readFile(const QString &path, QString *errorMessage = nullptr);

ServiceType serviceTypeFromKey(const QString &key);

/// Accepts ISO 8601 as well as the "yyyy-MM-dd HH:mm:ss+00" form the
/// store emits.  Returns an invalid QDateTime for empty or unparsable input.
QDateTime parseTimestamp(const QString &text);

} // namespace ReportInputReader

#endif // TICKETREPORT_REPORTINPUTREADER_H
