/*
 * pdfwriter.h — Low-level PDF object writer
 *
 * Derived from the Scribus PDF writer (Andreas Vox, 2014) and reduced to
 * what the report canvas needs:
 *   - PDF-1.7, no encryption
 *   - In-memory QByteArray output only
 *   - Ordered resource dictionaries and a content-derived file ID, so that
 *     identical drawing calls always produce identical bytes
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TICKETREPORT_PDFWRITER_H
#define TICKETREPORT_PDFWRITER_H

#include <type_traits>

#include <QByteArray>
#include <QCryptographicHash>
#include <QList>
#include <QMap>
#include <QString>

namespace Pdf {

using ObjId = uint32_t;

// --- PDF serialization helpers (cf. PDF32000-2008) ---

bool isDelimiter(char c);

uchar toPdfDocEncoding(QChar c);
QByteArray toPdfDocEncoding(const QString &s);

QByteArray toUTF16(const QString &s);

template <typename T, std::enable_if_t<std::is_integral_v<T> || std::is_enum_v<T>, bool> = true>
inline QByteArray toPdf(T v) { return QByteArray::number(static_cast<qlonglong>(v)); }

template <typename T, std::enable_if_t<std::is_floating_point_v<T>, bool> = true>
inline QByteArray toPdf(T v) { return QByteArray::number(v, 'f', 6); }

QByteArray toObjRef(ObjId id);

QByteArray toLiteralString(const QByteArray &s);
QByteArray toLiteralString(const QString &s);

QByteArray toHexString(const QByteArray &s);
QByteArray toHexString16(quint16 b);

QByteArray toName(const QByteArray &s);

// --- Resource dictionary ---

struct ResourceDict {
    QMap<QByteArray, ObjId> fonts;
    QMap<QByteArray, ObjId> xObjects;
};

// --- PDF Writer ---

class Writer {
public:
    Writer();

    bool openBuffer(QByteArray *buffer);
    bool close(bool aborted = false);

    bool isOpen() const { return m_buffer != nullptr; }

    // PDF structure
    void writeHeader();
    void writeXrefAndTrailer();
    void write(const QByteArray &bytes);
    void writeResourceDict(const ResourceDict &dict);

    // Object management
    ObjId reserveObjects(unsigned int n);
    ObjId newObject() { return reserveObjects(1); }
    void startObj(ObjId id);
    ObjId startObj();
    void endObj(ObjId id);

    /// Closes the open dictionary of @p id with /Length (and /Filter when
    /// compressed) and appends the stream.  Streams of 128 bytes or less are
    /// never compressed.  Pass compress = false for data that already
    /// carries its own filter, e.g. DCTDecode images.
    void endObjectWithStream(ObjId id, const QByteArray &streamContent,
                             bool compress = true);

    // Well-known object IDs (assigned by openBuffer)
    ObjId catalogObj() const { return m_catalogObj; }
    ObjId infoObj() const { return m_infoObj; }
    ObjId pagesObj() const { return m_pagesObj; }

private:
    ObjId m_objCounter = 0;
    ObjId m_currentObj = 0;

    QByteArray *m_buffer = nullptr;

    QList<qint64> m_xref;
    qint64 m_bytesWritten = 0;

    ObjId m_catalogObj = 0;
    ObjId m_infoObj = 0;
    ObjId m_pagesObj = 0;

    // Digest of everything written before the trailer; becomes /ID.
    QCryptographicHash m_digest;

    void writeRaw(const QByteArray &bytes);
};

} // namespace Pdf

#endif // TICKETREPORT_PDFWRITER_H
