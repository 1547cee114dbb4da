/*
 * thememanager.cpp — Discovery and loading of report themes
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "thememanager.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStandardPaths>

static const QLatin1String kThemeType("reportTheme");

static QJsonObject readThemeFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "ThemeManager: cannot open" << path << file.errorString();
        return {};
    }

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &error);
    if (doc.isNull()) {
        qWarning() << "ThemeManager: invalid JSON in" << path << error.errorString();
        return {};
    }
    return doc.object();
}

ThemeManager::ThemeManager(QObject *parent)
    : QObject(parent)
{
    discoverThemes(userThemesDir());
}

ThemeManager::ThemeManager(const QString &userDir, QObject *parent)
    : QObject(parent)
{
    discoverThemes(userDir);
}

QString ThemeManager::userThemesDir()
{
    return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation)
           + QLatin1String("/themes");
}

// ---------------------------------------------------------------------------
// Discovery
// ---------------------------------------------------------------------------

void ThemeManager::discoverThemes(const QString &userDir)
{
    scanDirectory(QStringLiteral(":/themes"), true);
    if (!userDir.isEmpty())
        scanDirectory(userDir, false);
}

void ThemeManager::scanDirectory(const QString &dirPath, bool builtin)
{
    QDir dir(dirPath);
    if (!dir.exists())
        return;

    const QStringList entries = dir.entryList({QStringLiteral("*.json")},
                                              QDir::Files, QDir::Name);
    for (const QString &entry : entries) {
        const QString path = dir.filePath(entry);
        const QJsonObject root = readThemeFile(path);
        if (root.value(QLatin1String("type")).toString() != kThemeType)
            continue;

        QString id = root.value(QLatin1String("id")).toString();
        if (id.isEmpty())
            id = QFileInfo(entry).completeBaseName();

        if (hasTheme(id)) {
            if (!builtin)
                qDebug() << "ThemeManager: user theme" << path << "ignored, id taken:" << id;
            continue;
        }

        const QString name = root.value(QLatin1String("name")).toString(id);
        m_themes.append({id, name, path, builtin});
    }
}

// ---------------------------------------------------------------------------
// Accessors
// ---------------------------------------------------------------------------

QStringList ThemeManager::availableThemes() const
{
    QStringList ids;
    for (const auto &t : m_themes)
        ids.append(t.id);
    return ids;
}

QString ThemeManager::themeName(const QString &id) const
{
    for (const auto &t : m_themes) {
        if (t.id == id)
            return t.name;
    }
    return id;
}

bool ThemeManager::hasTheme(const QString &id) const
{
    for (const auto &t : m_themes) {
        if (t.id == id)
            return true;
    }
    return false;
}

bool ThemeManager::isBuiltin(const QString &id) const
{
    for (const auto &t : m_themes) {
        if (t.id == id)
            return t.builtin;
    }
    return false;
}

ReportTheme ThemeManager::theme(const QString &id) const
{
    for (const auto &t : m_themes) {
        if (t.id != id)
            continue;
        const QJsonObject root = readThemeFile(t.path);
        if (root.isEmpty())
            break;
        ReportTheme theme = ReportTheme::fromJson(root);
        if (theme.id.isEmpty())
            theme.id = id;
        return theme;
    }

    qWarning() << "ThemeManager: theme not available, using defaults:" << id;
    ReportTheme fallback;
    fallback.id = defaultThemeId();
    fallback.name = QStringLiteral("Minimal");
    return fallback;
}
