/*
 * documentemitter.cpp — Delivery of a finished report to disk
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "documentemitter.h"

#include <QDebug>
#include <QDir>
#include <QRegularExpression>
#include <QSaveFile>

QString DocumentEmitter::fileNameFor(const QString &code)
{
    QString stem = code.trimmed();
    if (stem.isEmpty())
        return QStringLiteral("Relatorio_Atendimento.pdf");

    static const QRegularExpression unsafe(QStringLiteral("[/\\\\:]"));
    stem.replace(unsafe, QStringLiteral("_"));
    return QStringLiteral("Relatorio_%1.pdf").arg(stem);
}

QString DocumentEmitter::deliver(const QByteArray &pdf, const QString &code,
                                 const QString &directory)
{
    m_error.clear();

    if (pdf.isEmpty()) {
        m_error = QStringLiteral("no document to write");
        return {};
    }

    QDir dir(directory.isEmpty() ? QDir::currentPath() : directory);
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        m_error = QStringLiteral("cannot create directory %1").arg(dir.path());
        qWarning() << "DocumentEmitter:" << m_error;
        return {};
    }

    const QString path = dir.absoluteFilePath(fileNameFor(code));
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        m_error = file.errorString();
        qWarning() << "DocumentEmitter: cannot open" << path << m_error;
        return {};
    }
    if (file.write(pdf) != pdf.size()) {
        m_error = file.errorString();
        file.cancelWriting();
        qWarning() << "DocumentEmitter: short write to" << path << m_error;
        return {};
    }
    if (!file.commit()) {
        m_error = file.errorString();
        qWarning() << "DocumentEmitter: cannot commit" << path << m_error;
        return {};
    }
    return path;
}
