/*
 * brandingconfig.h — Company identity printed in report chrome
 *
 * Read from the [Branding] group of the application config.  Every field
 * is optional; empty fields are left out of the header and footer lines.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TICKETREPORT_BRANDINGCONFIG_H
#define TICKETREPORT_BRANDINGCONFIG_H

#include <QString>
#include <QStringList>

class KConfigGroup;

struct BrandingConfig
{
    QString companyName;
    QString taxId;           // CNPJ
    QString address;
    QString phoneCommercial;
    QString phoneMonitoring;
    QString email;
    QString instagram;       // handle without '@'
    QString website;
    QString logoPath;        // local path or URL; empty for a text-only header

    /// "Comercial: … • Monitoramento 24h: …"
    QString phoneLine() const;
    /// "e-mail • @handle • site"
    QString contactLine() const;
    /// "NAME • CNPJ … • address"
    QString legalLine() const;

    bool isEmpty() const;

    static BrandingConfig fromConfig(const KConfigGroup &group);
    void writeConfig(KConfigGroup &group) const;
};

#endif // TICKETREPORT_BRANDINGCONFIG_H
