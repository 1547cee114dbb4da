/*
 * reportsettings.h — Persistent settings of the report tool
 *
 * Thin typed accessors over a KConfig file (ticketreportrc by default):
 *
 *   [Branding]  Name, TaxId, Address, PhoneCommercial, PhoneMonitoring,
 *               Email, Instagram, Website, Logo
 *   [Report]    Theme, TimeZone, OutputDir
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TICKETREPORT_REPORTSETTINGS_H
#define TICKETREPORT_REPORTSETTINGS_H

#include <QByteArray>
#include <QString>

#include <KSharedConfig>

#include "brandingconfig.h"

class ReportSettings
{
public:
    /// Uses the application's default config file.
    ReportSettings();
    /// Uses the config file at @p path.
    explicit ReportSettings(const QString &path);
    explicit ReportSettings(KSharedConfigPtr config);

    BrandingConfig branding() const;
    void setBranding(const BrandingConfig &branding);

    QString themeId() const;
    void setThemeId(const QString &id);

    /// IANA zone used for every displayed date and time.
    QByteArray timeZoneId() const;
    void setTimeZoneId(const QByteArray &id);

    /// Empty means the current working directory.
    QString outputDir() const;
    void setOutputDir(const QString &dir);

    bool sync();

    static QByteArray defaultTimeZoneId() { return QByteArrayLiteral("America/Sao_Paulo"); }

private:
    KSharedConfigPtr m_config;
};

#endif // TICKETREPORT_REPORTSETTINGS_H
