#include "tst_pdfwriter.h"

#include <QRegularExpression>
#include <QTest>

#include "pdfwriter.h"

namespace {

// Minimal document: catalog, empty page tree, one content stream.
QByteArray buildDocument(const QByteArray &content)
{
    QByteArray out;
    Pdf::Writer w;
    if (!w.openBuffer(&out))
        return {};
    w.writeHeader();

    const Pdf::ObjId stream = w.startObj();
    w.write("<<\n");
    w.endObjectWithStream(stream, content);

    w.startObj(w.pagesObj());
    w.write("<< /Type /Pages /Kids [] /Count 0 >>");
    w.endObj(w.pagesObj());

    w.startObj(w.infoObj());
    w.write("<< /Producer " + Pdf::toLiteralString(QStringLiteral("TicketReport")) + " >>");
    w.endObj(w.infoObj());

    w.startObj(w.catalogObj());
    w.write("<< /Type /Catalog /Pages " + Pdf::toObjRef(w.pagesObj()) + " >>");
    w.endObj(w.catalogObj());

    w.writeXrefAndTrailer();
    w.close();
    return out;
}

} // namespace

void PdfWriterTest::serializesStrings()
{
    QCOMPARE(Pdf::toLiteralString(QByteArrayLiteral("a(b)c\\")),
             QByteArrayLiteral("(a\\(b\\)c\\\\)"));
    QCOMPARE(Pdf::toLiteralString(QByteArrayLiteral("\n")), QByteArrayLiteral("(\\012)"));
    QCOMPARE(Pdf::toHexString(QByteArrayLiteral("\x01\xab")), QByteArrayLiteral("<01AB>"));

    // UTF-16BE with byte order mark
    const QByteArray utf16 = Pdf::toUTF16(QStringLiteral("Relatório"));
    QVERIFY(utf16.startsWith("\xfe\xff"));
    QCOMPARE(utf16.size(), 2 + 2 * 9);
}

void PdfWriterTest::serializesNamesAndNumbers()
{
    QCOMPARE(Pdf::toName(QByteArrayLiteral("F1")), QByteArrayLiteral("/F1"));
    QCOMPARE(Pdf::toName(QByteArrayLiteral("A B#")), QByteArrayLiteral("/A#20B#23"));
    QCOMPARE(Pdf::toPdf(42), QByteArrayLiteral("42"));
    QCOMPARE(Pdf::toPdf(1.5), QByteArrayLiteral("1.500000"));
    QCOMPARE(Pdf::toObjRef(7), QByteArrayLiteral("7 0 R"));
}

void PdfWriterTest::xrefPointsAtObjects()
{
    const QByteArray pdf = buildDocument(QByteArrayLiteral("0 0 m 10 10 l S"));
    QVERIFY(pdf.startsWith("%PDF-1.7\n"));
    QVERIFY(pdf.endsWith("%%EOF\n"));

    const int startXrefPos = pdf.lastIndexOf("startxref\n");
    QVERIFY(startXrefPos > 0);
    const qint64 xrefOffset = pdf.mid(startXrefPos + 10).split('\n').first().toLongLong();
    QCOMPARE(pdf.mid(xrefOffset, 5), QByteArrayLiteral("xref\n"));

    const QList<QByteArray> lines = pdf.mid(xrefOffset).split('\n');
    const QList<QByteArray> header = lines.at(1).split(' ');
    QCOMPARE(header.at(0), QByteArrayLiteral("0"));
    const int count = header.at(1).toInt();
    QCOMPARE(count, 5); // free entry, catalog, info, pages, stream

    for (int id = 1; id < count; ++id) {
        const QByteArray entry = lines.at(2 + id);
        QVERIFY2(entry.endsWith(" n "), entry.constData());
        const qint64 offset = entry.left(10).toLongLong();
        const QByteArray expected = QByteArray::number(id) + " 0 obj\n";
        QCOMPARE(pdf.mid(offset, expected.size()), expected);
    }
    QVERIFY(lines.at(2).endsWith(" f "));
}

void PdfWriterTest::smallStreamsStayUncompressed()
{
    const QByteArray small = buildDocument(QByteArrayLiteral("0 0 m 10 10 l S"));
    QVERIFY(small.contains("/Length 15\n>>\nstream\n0 0 m 10 10 l S\nendstream"));
    QVERIFY(!small.contains("/FlateDecode"));

    const QByteArray big = buildDocument(QByteArray(2000, 'x'));
    QVERIFY(big.contains("/Filter /FlateDecode"));
    QVERIFY(big.size() < 2000);
}

void PdfWriterTest::fileIdFollowsContent()
{
    static const QRegularExpression idPattern(
        QStringLiteral("/ID \\[<([0-9A-F]+)><([0-9A-F]+)>\\]"));

    const QByteArray a1 = buildDocument(QByteArrayLiteral("1 0 0 rg"));
    const QByteArray a2 = buildDocument(QByteArrayLiteral("1 0 0 rg"));
    const QByteArray b = buildDocument(QByteArrayLiteral("0 1 0 rg"));

    QCOMPARE(a1, a2);

    const auto matchA = idPattern.match(QString::fromLatin1(a1));
    const auto matchB = idPattern.match(QString::fromLatin1(b));
    QVERIFY(matchA.hasMatch());
    QVERIFY(matchB.hasMatch());
    QCOMPARE(matchA.captured(1), matchA.captured(2));
    QCOMPARE(matchA.captured(1).size(), 32); // MD5
    QVERIFY(matchA.captured(1) != matchB.captured(1));
}

void PdfWriterTest::closeAbortedClearsBuffer()
{
    QByteArray out;
    Pdf::Writer w;
    QVERIFY(!w.openBuffer(nullptr));
    QVERIFY(w.openBuffer(&out));
    w.writeHeader();
    QVERIFY(!out.isEmpty());
    QVERIFY(!w.close(true));
    QVERIFY(out.isEmpty());
    QVERIFY(!w.isOpen());
    QVERIFY(!w.close());
}

QTEST_GUILESS_MAIN(PdfWriterTest)
