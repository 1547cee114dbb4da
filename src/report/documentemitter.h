/*
 * documentemitter.h — Delivery of a finished report to disk
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TICKETREPORT_DOCUMENTEMITTER_H
#define TICKETREPORT_DOCUMENTEMITTER_H

#include <QByteArray>
#include <QString>

class DocumentEmitter
{
public:
    /// "Relatorio_<code>.pdf"; "Relatorio_Atendimento.pdf" when the ticket
    /// has no code.  Path separators in the code become underscores.
    static QString fileNameFor(const QString &code);

    /// Writes @p pdf atomically into @p directory (created when missing)
    /// and returns the final path.  Returns an empty string on failure.
    QString deliver(const QByteArray &pdf, const QString &code, const QString &directory);

    QString errorString() const { return m_error; }

private:
    QString m_error;
};

#endif // TICKETREPORT_DOCUMENTEMITTER_H
