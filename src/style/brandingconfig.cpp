/*
 * brandingconfig.cpp — Company identity printed in report chrome
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "brandingconfig.h"

#include <KConfigGroup>

static const QString kSeparator = QStringLiteral("  •  ");

static QString joinNonEmpty(const QStringList &parts)
{
    QStringList kept;
    for (const QString &p : parts) {
        if (!p.trimmed().isEmpty())
            kept.append(p.trimmed());
    }
    return kept.join(kSeparator);
}

QString BrandingConfig::phoneLine() const
{
    return joinNonEmpty({
        phoneCommercial.isEmpty() ? QString() : QStringLiteral("Comercial: ") + phoneCommercial,
        phoneMonitoring.isEmpty() ? QString()
                                  : QStringLiteral("Monitoramento 24h: ") + phoneMonitoring,
    });
}

QString BrandingConfig::contactLine() const
{
    QString handle = instagram.trimmed();
    if (!handle.isEmpty() && !handle.startsWith(QLatin1Char('@')))
        handle.prepend(QLatin1Char('@'));
    return joinNonEmpty({email, handle, website});
}

QString BrandingConfig::legalLine() const
{
    return joinNonEmpty({
        companyName,
        taxId.isEmpty() ? QString() : QStringLiteral("CNPJ ") + taxId,
        address,
    });
}

bool BrandingConfig::isEmpty() const
{
    return companyName.isEmpty() && taxId.isEmpty() && address.isEmpty()
        && phoneCommercial.isEmpty() && phoneMonitoring.isEmpty() && email.isEmpty()
        && instagram.isEmpty() && website.isEmpty() && logoPath.isEmpty();
}

BrandingConfig BrandingConfig::fromConfig(const KConfigGroup &group)
{
    BrandingConfig b;
    b.companyName     = group.readEntry("Name", QString());
    b.taxId           = group.readEntry("TaxId", QString());
    b.address         = group.readEntry("Address", QString());
    b.phoneCommercial = group.readEntry("PhoneCommercial", QString());
    b.phoneMonitoring = group.readEntry("PhoneMonitoring", QString());
    b.email           = group.readEntry("Email", QString());
    b.instagram       = group.readEntry("Instagram", QString());
    b.website         = group.readEntry("Website", QString());
    b.logoPath        = group.readPathEntry("Logo", QString());
    return b;
}

void BrandingConfig::writeConfig(KConfigGroup &group) const
{
    group.writeEntry("Name", companyName);
    group.writeEntry("TaxId", taxId);
    group.writeEntry("Address", address);
    group.writeEntry("PhoneCommercial", phoneCommercial);
    group.writeEntry("PhoneMonitoring", phoneMonitoring);
    group.writeEntry("Email", email);
    group.writeEntry("Instagram", instagram);
    group.writeEntry("Website", website);
    group.writePathEntry("Logo", logoPath);
}
