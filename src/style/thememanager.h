/*
 * thememanager.h — Discovery and loading of report themes
 *
 * Scans built-in Qt resources (:/themes/) and the user data directory
 * for JSON theme files and presents them by ID.  A user theme never
 * shadows a built-in one with the same ID.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TICKETREPORT_THEMEMANAGER_H
#define TICKETREPORT_THEMEMANAGER_H

#include <QList>
#include <QObject>
#include <QString>
#include <QStringList>

#include "reporttheme.h"

class ThemeManager : public QObject
{
    Q_OBJECT

public:
    explicit ThemeManager(QObject *parent = nullptr);
    /// Scans @p userDir instead of the user data directory.
    explicit ThemeManager(const QString &userDir, QObject *parent = nullptr);

    /// IDs of all themes (built-in first, then user, each sorted).
    QStringList availableThemes() const;
    QString themeName(const QString &id) const;
    bool hasTheme(const QString &id) const;
    bool isBuiltin(const QString &id) const;

    /// Loads a theme.  An unknown or unreadable ID yields the default
    /// theme and a warning.
    ReportTheme theme(const QString &id) const;

    static QString defaultThemeId() { return QStringLiteral("minimal"); }
    static QString userThemesDir();

private:
    void discoverThemes(const QString &userDir);
    void scanDirectory(const QString &dirPath, bool builtin);

    struct ThemeInfo {
        QString id;
        QString name;
        QString path;
        bool builtin = false;
    };
    QList<ThemeInfo> m_themes;
};

#endif // TICKETREPORT_THEMEMANAGER_H
