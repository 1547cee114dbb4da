/*
 * reportinputreader.cpp — JSON ticket snapshot → ReportInput
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "reportinputreader.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonValue>
#include <QRegularExpression>

namespace ReportInputReader {

// ---------------------------------------------------------------------------
// Field helpers
// ---------------------------------------------------------------------------

static QString stringField(const QJsonObject &obj, const char *key)
{
    const QJsonValue v = obj.value(QLatin1String(key));
    if (v.isString())
        return v.toString().trimmed();
    if (v.isDouble())
        return QString::number(v.toDouble());
    return {};
}

// Numeric columns arrive either as JSON numbers or, for numeric(10,2)
// columns, as decimal strings.
static std::optional<double> numberField(const QJsonObject &obj, const QString &key)
{
    const QJsonValue v = obj.value(key);
    if (v.isDouble())
        return v.toDouble();
    if (v.isString()) {
        bool ok = false;
        double d = v.toString().trimmed().toDouble(&ok);
        if (ok)
            return d;
    }
    return std::nullopt;
}

static std::optional<Agent> agentField(const QJsonObject &obj, const char *key)
{
    const QJsonValue v = obj.value(QLatin1String(key));
    if (!v.isObject())
        return std::nullopt;
    const QJsonObject a = v.toObject();
    Agent agent;
    agent.name = stringField(a, "name");
    // An agent object without a name is an unassigned slot
    if (agent.name.isEmpty())
        return std::nullopt;
    agent.isArmed = a.value(QLatin1String("is_armed")).toBool(false);
    return agent;
}

static Activity activityFields(const QJsonObject &obj, const QString &prefix)
{
    Activity act;
    act.kmStart = numberField(obj, prefix + QLatin1String("km_start"));
    act.kmEnd = numberField(obj, prefix + QLatin1String("km_end"));
    act.tollCost = numberField(obj, prefix + QLatin1String("toll_cost"));
    act.foodCost = numberField(obj, prefix + QLatin1String("food_cost"));
    act.otherCosts = numberField(obj, prefix + QLatin1String("other_costs"));
    return act;
}

static SupportAssignment supportFields(const QJsonObject &obj, int slot)
{
    const QString prefix = QStringLiteral("support_agent_%1").arg(slot);
    SupportAssignment sa;
    sa.agent = agentField(obj, prefix.toLatin1().constData());
    sa.arrival = parseTimestamp(
        obj.value(prefix + QLatin1String("_arrival")).toString());
    sa.departure = parseTimestamp(
        obj.value(prefix + QLatin1String("_departure")).toString());
    sa.activity = activityFields(obj, prefix + QLatin1Char('_'));
    return sa;
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

ServiceType serviceTypeFromKey(const QString &key)
{
    const QString k = key.trimmed().toLower();
    if (k == QLatin1String("alarme") || k == QLatin1String("alarm"))
        return ServiceType::Alarm;
    if (k == QLatin1String("averiguacao") || k == QLatin1String("investigation"))
        return ServiceType::Investigation;
    if (k == QLatin1String("preservacao") || k == QLatin1String("preservation"))
        return ServiceType::Preservation;
    if (k == QLatin1String("acompanhamento_logistico")
        || k == QLatin1String("logistics-escort"))
        return ServiceType::LogisticsEscort;
    return ServiceType::Other;
}

QDateTime parseTimestamp(const QString &text)
{
    QString s = text.trimmed();
    if (s.isEmpty())
        return {};

    // "2025-12-16 17:47:56.12+00" → "2025-12-16T17:47:56.12+00:00"
    if (s.size() > 10 && s.at(10) == QLatin1Char(' '))
        s[10] = QLatin1Char('T');
    static const QRegularExpression shortOffset(
        QStringLiteral("(T\\d{2}:\\d{2}(?::\\d{2}(?:\\.\\d+)?)?[+-]\\d{2})$"));
    s.replace(shortOffset, QStringLiteral("\\1:00"));

    QDateTime dt = QDateTime::fromString(s, Qt::ISODateWithMs);
    if (!dt.isValid())
        dt = QDateTime::fromString(s, Qt::ISODate);
    return dt;
}

ReportInput fromJson(const QJsonObject &obj)
{
    ReportInput in;

    in.code = stringField(obj, "code");
    in.serviceTypeKey = stringField(obj, "service_type");
    in.serviceType = serviceTypeFromKey(in.serviceTypeKey);
    in.status = stringField(obj, "status");

    in.city = stringField(obj, "city");
    in.state = stringField(obj, "state");
    auto lat = numberField(obj, QStringLiteral("coordinates_lat"));
    auto lng = numberField(obj, QStringLiteral("coordinates_lng"));
    if (lat && lng)
        in.coordinates = Coordinates{*lat, *lng};

    in.startDatetime = parseTimestamp(stringField(obj, "start_datetime"));
    in.endDatetime = parseTimestamp(stringField(obj, "end_datetime"));

    in.activity = activityFields(obj, QString());

    const QJsonObject client = obj.value(QLatin1String("client")).toObject();
    in.client.name = stringField(client, "name");
    in.client.contactPhone = stringField(client, "contact_phone");

    if (auto primary = agentField(obj, "agent"))
        in.primaryAgent = *primary;
    in.supportAgent1 = supportFields(obj, 1);
    in.supportAgent2 = supportFields(obj, 2);

    const QJsonObject vehicle = obj.value(QLatin1String("vehicle")).toObject();
    in.vehicle.description = stringField(vehicle, "description");
    in.vehicle.tractorPlate = stringField(vehicle, "tractor_plate");
    in.vehicle.tractorBrand = stringField(vehicle, "tractor_brand");
    in.vehicle.tractorModel = stringField(vehicle, "tractor_model");
    for (int k = 1; k <= 3; ++k) {
        const QByteArray plateKey = "trailer" + QByteArray::number(k) + "_plate";
        const QByteArray bodyKey = "trailer" + QByteArray::number(k) + "_body_type";
        Trailer t;
        t.plate = stringField(vehicle, plateKey.constData());
        t.bodyType = stringField(vehicle, bodyKey.constData());
        if (!t.plate.isEmpty())
            in.vehicle.trailers.append(t);
    }

    in.planName = stringField(obj.value(QLatin1String("plan")).toObject(), "name");

    const QString op = stringField(obj, "operator_name");
    if (!op.isEmpty())
        in.operatorName = op;

    in.summary = obj.value(QLatin1String("summary")).toString();
    in.detailedReport = obj.value(QLatin1String("detailed_report")).toString();

    const QJsonArray photos = obj.value(QLatin1String("photos")).toArray();
    for (const QJsonValue &pv : photos) {
        const QJsonObject po = pv.toObject();
        Photo photo;
        photo.url = stringField(po, "file_url");
        photo.caption = stringField(po, "caption");
        in.photos.append(photo);
    }

    return in;
}

std::optional<ReportInput> read(const QByteArray &json, QString *errorMessage)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (doc.isNull()) {
        if (errorMessage)
            *errorMessage = parseError.errorString();
        return std::nullopt;
    }
    if (!doc.isObject()) {
        if (errorMessage)
            *errorMessage = QStringLiteral("ticket snapshot is not a JSON object");
        return std::nullopt;
    }
    return fromJson(doc.object());
}

std::optional<ReportInput> readFile(const QString &path, QString *errorMessage)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorMessage)
            *errorMessage = file.errorString();
        return std::nullopt;
    }
    return read(file.readAll(), errorMessage);
}

} // namespace ReportInputReader
