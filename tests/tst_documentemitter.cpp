#include "tst_documentemitter.h"

#include <QDir>
#include <QFile>
#include <QRegularExpression>
#include <QTemporaryDir>
#include <QTest>

#include "documentemitter.h"

void DocumentEmitterTest::fileNames_data()
{
    QTest::addColumn<QString>("code");
    QTest::addColumn<QString>("expected");

    QTest::newRow("code") << QStringLiteral("CH-001") << QStringLiteral("Relatorio_CH-001.pdf");
    QTest::newRow("no code") << QString() << QStringLiteral("Relatorio_Atendimento.pdf");
    QTest::newRow("blank code") << QStringLiteral("  ") << QStringLiteral("Relatorio_Atendimento.pdf");
    QTest::newRow("separators") << QStringLiteral("2025/12\\01")
                                << QStringLiteral("Relatorio_2025_12_01.pdf");
}

void DocumentEmitterTest::fileNames()
{
    QFETCH(QString, code);
    QFETCH(QString, expected);
    QCOMPARE(DocumentEmitter::fileNameFor(code), expected);
}

void DocumentEmitterTest::deliversIntoDirectory()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString target = dir.filePath(QStringLiteral("saida/relatorios"));

    DocumentEmitter emitter;
    const QByteArray pdf("%PDF-1.7\n%%EOF\n");
    const QString path = emitter.deliver(pdf, QStringLiteral("CH-001"), target);

    QVERIFY2(!path.isEmpty(), qPrintable(emitter.errorString()));
    QCOMPARE(path, QDir(target).absoluteFilePath(QStringLiteral("Relatorio_CH-001.pdf")));

    QFile file(path);
    QVERIFY(file.open(QIODevice::ReadOnly));
    QCOMPARE(file.readAll(), pdf);
}

void DocumentEmitterTest::replacesExistingReport()
{
    QTemporaryDir dir;
    DocumentEmitter emitter;
    QVERIFY(!emitter.deliver("first", QStringLiteral("X"), dir.path()).isEmpty());
    const QString path = emitter.deliver("second", QStringLiteral("X"), dir.path());
    QVERIFY(!path.isEmpty());

    QFile file(path);
    QVERIFY(file.open(QIODevice::ReadOnly));
    QCOMPARE(file.readAll(), QByteArray("second"));
    QCOMPARE(QDir(dir.path()).entryList(QDir::Files).size(), 1);
}

void DocumentEmitterTest::reportsUnwritableTarget()
{
    QTemporaryDir dir;
    // A regular file where the directory should be
    const QString blocker = dir.filePath(QStringLiteral("blocker"));
    QFile file(blocker);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.close();

    DocumentEmitter emitter;
    QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("^DocumentEmitter:")));
    const QString path = emitter.deliver("%PDF", QString(), blocker + QStringLiteral("/sub"));
    QVERIFY(path.isEmpty());
    QVERIFY(!emitter.errorString().isEmpty());
}

void DocumentEmitterTest::rejectsEmptyDocument()
{
    QTemporaryDir dir;
    DocumentEmitter emitter;
    QVERIFY(emitter.deliver(QByteArray(), QStringLiteral("X"), dir.path()).isEmpty());
    QVERIFY(!emitter.errorString().isEmpty());
    QVERIFY(QDir(dir.path()).entryList(QDir::Files).isEmpty());
}

QTEST_GUILESS_MAIN(DocumentEmitterTest)
