/*
 * reportsettings.cpp — Persistent settings of the report tool
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "reportsettings.h"
#include "thememanager.h"

#include <KConfigGroup>

namespace {
constexpr const char *kBrandingGroup = "Branding";
constexpr const char *kReportGroup   = "Report";
constexpr const char *kThemeKey      = "Theme";
constexpr const char *kTimeZoneKey   = "TimeZone";
constexpr const char *kOutputDirKey  = "OutputDir";
}

ReportSettings::ReportSettings()
    : m_config(KSharedConfig::openConfig())
{
}

ReportSettings::ReportSettings(const QString &path)
    : m_config(KSharedConfig::openConfig(path, KConfig::SimpleConfig))
{
}

ReportSettings::ReportSettings(KSharedConfigPtr config)
    : m_config(std::move(config))
{
}

BrandingConfig ReportSettings::branding() const
{
    return BrandingConfig::fromConfig(KConfigGroup(m_config, QLatin1String(kBrandingGroup)));
}

void ReportSettings::setBranding(const BrandingConfig &branding)
{
    KConfigGroup group(m_config, QLatin1String(kBrandingGroup));
    branding.writeConfig(group);
}

QString ReportSettings::themeId() const
{
    KConfigGroup group(m_config, QLatin1String(kReportGroup));
    return group.readEntry(kThemeKey, ThemeManager::defaultThemeId());
}

void ReportSettings::setThemeId(const QString &id)
{
    KConfigGroup group(m_config, QLatin1String(kReportGroup));
    group.writeEntry(kThemeKey, id);
}

QByteArray ReportSettings::timeZoneId() const
{
    KConfigGroup group(m_config, QLatin1String(kReportGroup));
    const QString id = group.readEntry(kTimeZoneKey, QString());
    return id.isEmpty() ? defaultTimeZoneId() : id.toUtf8();
}

void ReportSettings::setTimeZoneId(const QByteArray &id)
{
    KConfigGroup group(m_config, QLatin1String(kReportGroup));
    group.writeEntry(kTimeZoneKey, QString::fromUtf8(id));
}

QString ReportSettings::outputDir() const
{
    KConfigGroup group(m_config, QLatin1String(kReportGroup));
    return group.readPathEntry(kOutputDirKey, QString());
}

void ReportSettings::setOutputDir(const QString &dir)
{
    KConfigGroup group(m_config, QLatin1String(kReportGroup));
    group.writePathEntry(kOutputDirKey, dir);
}

bool ReportSettings::sync()
{
    return m_config->sync();
}
