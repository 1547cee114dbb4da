#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QTextStream>
#include <QTimeZone>

#include <KAboutData>
#include <KLocalizedString>

#include "documentemitter.h"
#include "imageloader.h"
#include "reportgenerator.h"
#include "reportinputreader.h"
#include "reportsettings.h"
#include "thememanager.h"

namespace {

enum ExitCode {
    ExitOk = 0,
    ExitInvalidInput = 1,
    ExitRenderFailed = 2,
    ExitNotWritable = 3,
};

void printError(const QString &message)
{
    QTextStream(stderr) << QCoreApplication::applicationName() << ": " << message << Qt::endl;
}

// SOURCE_DATE_EPOCH pins the footer timestamp for reproducible output.
QDateTime generationTime()
{
    const QByteArray epoch = qgetenv("SOURCE_DATE_EPOCH");
    if (!epoch.isEmpty()) {
        bool ok = false;
        const qint64 secs = epoch.toLongLong(&ok);
        if (ok)
            return QDateTime::fromSecsSinceEpoch(secs).toUTC();
        printError(i18n("Ignoring invalid SOURCE_DATE_EPOCH: %1", QString::fromLatin1(epoch)));
    }
    return QDateTime::currentDateTimeUtc();
}

} // anonymous namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    KLocalizedString::setApplicationDomain("ticketreport");

    KAboutData aboutData(
        QStringLiteral("ticketreport"),
        i18n("TicketReport"),
        QStringLiteral("0.1.0"),
        i18n("Renders service ticket reports as PDF"),
        KAboutLicense::GPL_V2,
        i18n("(c) 2025-2026"));
    aboutData.setOrganizationDomain("ticketreport.org");
    KAboutData::setApplicationData(aboutData);

    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);
    parser.addPositionalArgument(
        QStringLiteral("snapshot"),
        i18n("Ticket snapshot (JSON) to render"),
        QStringLiteral("[snapshot]"));

    const QCommandLineOption outputOption(
        {QStringLiteral("o"), QStringLiteral("output-dir")},
        i18n("Directory the report is written to"), i18n("dir"));
    const QCommandLineOption themeOption(
        {QStringLiteral("t"), QStringLiteral("theme")},
        i18n("Visual theme of the report"), i18n("id"));
    const QCommandLineOption configOption(
        {QStringLiteral("c"), QStringLiteral("config")},
        i18n("Read branding and defaults from this file"), i18n("file"));
    const QCommandLineOption logoOption(
        QStringLiteral("logo"), i18n("Logo image for the page header"), i18n("path"));
    const QCommandLineOption listThemesOption(
        QStringLiteral("list-themes"), i18n("List the available themes and exit"));
    const QCommandLineOption noTimestampOption(
        QStringLiteral("no-timestamp"), i18n("Omit the generation time from the summary page"));
    parser.addOptions({outputOption, themeOption, configOption, logoOption,
                       listThemesOption, noTimestampOption});

    parser.process(app);
    aboutData.processCommandLine(&parser);

    ThemeManager themes;
    if (parser.isSet(listThemesOption)) {
        QTextStream out(stdout);
        for (const QString &id : themes.availableThemes())
            out << id << '\t' << themes.themeName(id) << Qt::endl;
        return ExitOk;
    }

    const QStringList args = parser.positionalArguments();
    if (args.size() != 1) {
        printError(i18n("Expected exactly one snapshot file"));
        return ExitInvalidInput;
    }

    ReportSettings settings = parser.isSet(configOption)
        ? ReportSettings(parser.value(configOption))
        : ReportSettings();

    const QString themeId = parser.isSet(themeOption) ? parser.value(themeOption)
                                                      : settings.themeId();
    if (!themes.hasTheme(themeId)) {
        printError(i18n("Unknown theme: %1", themeId));
        return ExitInvalidInput;
    }

    QTimeZone zone(settings.timeZoneId());
    if (!zone.isValid()) {
        printError(i18n("Unknown time zone: %1", QString::fromLatin1(settings.timeZoneId())));
        return ExitInvalidInput;
    }

    QString readError;
    const std::optional<ReportInput> input = ReportInputReader::readFile(args.first(), &readError);
    if (!input) {
        printError(i18n("Cannot read %1: %2", args.first(), readError));
        return ExitInvalidInput;
    }

    BrandingConfig branding = settings.branding();
    if (parser.isSet(logoOption))
        branding.logoPath = parser.value(logoOption);

    NetworkImageLoader loader;
    ReportGenerator generator(&loader);
    generator.setTheme(themes.theme(themeId));
    generator.setBranding(branding);
    generator.setTimeZone(zone);
    if (!parser.isSet(noTimestampOption))
        generator.setGeneratedAt(generationTime());

    const QString outputDir = parser.isSet(outputOption) ? parser.value(outputOption)
                                                         : settings.outputDir();
    int exitCode = ExitOk;
    bool done = false;

    QObject::connect(&generator, &ReportGenerator::finished, &app,
                     [&](const QByteArray &pdf) {
        DocumentEmitter emitter;
        const QString path = emitter.deliver(pdf, input->code, outputDir);
        if (path.isEmpty()) {
            printError(i18n("Cannot write report: %1", emitter.errorString()));
            exitCode = ExitNotWritable;
        } else {
            QTextStream(stdout) << QDir::toNativeSeparators(path) << Qt::endl;
        }
        done = true;
        app.exit(exitCode);
    });
    QObject::connect(&generator, &ReportGenerator::failed, &app,
                     [&](const QString &message) {
        printError(i18n("Rendering failed: %1", message));
        exitCode = ExitRenderFailed;
        done = true;
        app.exit(exitCode);
    });

    if (!generator.generate(*input)) {
        printError(i18n("Rendering failed: %1", generator.errorString()));
        return ExitRenderFailed;
    }

    // A synchronous run has already finished; exit() before exec() is a no-op.
    if (done)
        return exitCode;
    return app.exec();
}
