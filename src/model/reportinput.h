/*
 * reportinput.h — Resolved ticket snapshot consumed by the report generator
 *
 * Plain value types.  Every relation is already resolved upstream; the
 * generator never loads anything lazily from these structs.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TICKETREPORT_REPORTINPUT_H
#define TICKETREPORT_REPORTINPUT_H

#include <QDateTime>
#include <QList>
#include <QString>

#include <optional>

enum class ServiceType {
    Alarm,
    Investigation,
    Preservation,
    LogisticsEscort,
    Other,
};

struct Agent {
    QString name;
    bool isArmed = false;
};

struct Client {
    QString name;
    QString contactPhone;
};

struct Trailer {
    QString plate;
    QString bodyType; // raw key, e.g. "grade_baixa"
};

struct Vehicle {
    QString description;
    QString tractorPlate;
    QString tractorBrand;
    QString tractorModel;
    QList<Trailer> trailers; // at most 3, in slot order
};

// Kilometre and cost record shared by the ticket and each support agent.
struct Activity {
    std::optional<double> kmStart;
    std::optional<double> kmEnd;
    std::optional<double> tollCost;
    std::optional<double> foodCost;
    std::optional<double> otherCosts;

    bool hasKm() const { return kmStart.has_value() || kmEnd.has_value(); }
    bool hasCosts() const
    {
        return tollCost.value_or(0) != 0 || foodCost.value_or(0) != 0
            || otherCosts.value_or(0) != 0;
    }
};

struct SupportAssignment {
    std::optional<Agent> agent;
    QDateTime arrival;   // invalid when not recorded
    QDateTime departure; // invalid when not recorded
    Activity activity;

    // A slot without an agent and without any tracked activity is not
    // rendered anywhere in the document.
    bool isRendered() const
    {
        return agent.has_value() || activity.hasKm() || activity.hasCosts()
            || arrival.isValid() || departure.isValid();
    }
};

struct Photo {
    QString url;
    QString caption; // empty when absent
};

struct Coordinates {
    double lat = 0;
    double lng = 0;
};

struct ReportInput {
    // Identity
    QString code; // empty when the ticket has no code yet
    ServiceType serviceType = ServiceType::Alarm;
    QString serviceTypeKey; // raw value, used to label ServiceType::Other
    QString status;

    // Location
    QString city;
    QString state;
    std::optional<Coordinates> coordinates;

    // Timing
    QDateTime startDatetime;
    QDateTime endDatetime; // invalid when still open

    // Ticket-level (primary agent) kilometres and costs
    Activity activity;

    // Relations
    Client client;
    Agent primaryAgent;
    SupportAssignment supportAgent1;
    SupportAssignment supportAgent2;
    Vehicle vehicle;
    QString planName;
    std::optional<QString> operatorName;

    // Narrative
    QString summary;
    QString detailedReport;

    QList<Photo> photos;
};

#endif // TICKETREPORT_REPORTINPUT_H
