#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTextStream>

#include <functional>

#include "appconfig.h"
#include "contenthasher.h"
#include "ingestiontransaction.h"
#include "jobmanager.h"
#include "librarycontext.h"
#include "librarymanager.h"
#include "logging.h"
#include "mediaprobe.h"
#include "progress.h"
#include "retagbatchprocessor.h"

namespace {

constexpr auto kLogFileName = "photovault.log";

void printJson(const QJsonObject &object)
{
    QTextStream out(stdout);
    out << QString::fromUtf8(QJsonDocument(object).toJson(QJsonDocument::Compact)) << '\n';
    out.flush();
}

int fail(const QString &message)
{
    QTextStream err(stderr);
    err << "photovault: " << message << '\n';
    return 1;
}

QJsonObject assetToJson(const MediaAsset &asset)
{
    QJsonObject object;
    object.insert(QStringLiteral("id"), asset.id);
    object.insert(QStringLiteral("path"), asset.currentPath);
    object.insert(QStringLiteral("original_filename"), asset.originalFilename);
    object.insert(QStringLiteral("captured_at"), formatCaptureDate(asset.capturedAt));
    object.insert(QStringLiteral("hash"), asset.contentHash);
    object.insert(QStringLiteral("type"), fileTypeToString(asset.fileType));
    object.insert(QStringLiteral("width"), asset.width);
    object.insert(QStringLiteral("height"), asset.height);
    object.insert(QStringLiteral("size"), asset.byteSize);
    return object;
}

QJsonObject trashEntryToJson(const TrashEntry &entry)
{
    QJsonObject object;
    object.insert(QStringLiteral("id"), entry.id);
    object.insert(QStringLiteral("original_path"), entry.originalPath);
    object.insert(QStringLiteral("trash_path"), entry.trashPath);
    object.insert(QStringLiteral("category"), dispositionToString(entry.category));
    object.insert(QStringLiteral("reason"), entry.reason);
    object.insert(QStringLiteral("created_at"), entry.timestamp.toString(Qt::ISODate));
    return object;
}

void installLibraryLog(const QString &libraryPath)
{
    const QString logPath = QDir(QDir(libraryPath).filePath(QStringLiteral(".logs"))).filePath(QString::fromLatin1(kLogFileName));
    QString error;
    if (!Logging::installFileLog(logPath, &error)) {
        qWarning() << "File logging disabled:" << error;
    }
}

// Runs one asynchronous operation to completion, printing its events.
int runOperation(QCoreApplication &app, LibraryManager &manager, JobManager &jobs,
                 const std::function<QSharedPointer<ProgressChannel>()> &start)
{
    int exitCode = 0;
    QObject::connect(&jobs, &JobManager::jobUpdated, &app, [](const JobInfo &info) {
        if (jobStateIsFinal(info.state)) {
            QTextStream err(stderr);
            err << "photovault: " << jobSummaryLine(info) << '\n';
        }
    });
    QObject::connect(&manager, &LibraryManager::operationEvent, &app, [](const ProgressEvent &event) {
        printJson(event.toJson());
    });
    QObject::connect(&manager, &LibraryManager::errorOccurred, &app, [&exitCode](const QString &message) {
        exitCode = fail(message);
    });
    QObject::connect(&manager, &LibraryManager::operationFinished, &app, [&app]() {
        app.quit();
    });

    const QSharedPointer<ProgressChannel> channel = start();
    if (!channel) {
        return exitCode == 0 ? 1 : exitCode;
    }
    app.exec();
    return exitCode;
}

}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("PhotoVault"));
    QCoreApplication::setOrganizationName(QStringLiteral("PhotoVault"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Content-addressed, date-organized media library"));
    parser.addHelpOption();
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("create | import | retag | terraform | assets | trash | probe"));
    parser.addPositionalArgument(QStringLiteral("arguments"), QStringLiteral("Command arguments"), QStringLiteral("[arguments...]"));

    const QCommandLineOption configOption(QStringLiteral("config"), QStringLiteral("Configuration file."), QStringLiteral("path"));
    const QCommandLineOption exiftoolOption(QStringLiteral("exiftool"), QStringLiteral("exiftool executable."), QStringLiteral("program"));
    const QCommandLineOption ffmpegOption(QStringLiteral("ffmpeg"), QStringLiteral("ffmpeg executable."), QStringLiteral("program"));
    const QCommandLineOption ffprobeOption(QStringLiteral("ffprobe"), QStringLiteral("ffprobe executable."), QStringLiteral("program"));
    const QCommandLineOption idsOption(QStringLiteral("ids"), QStringLiteral("Comma separated asset ids (retag)."), QStringLiteral("ids"));
    const QCommandLineOption dateOption(QStringLiteral("date"), QStringLiteral("New capture date \"YYYY:MM:DD HH:MM:SS\" (retag)."), QStringLiteral("date"));
    const QCommandLineOption modeOption(QStringLiteral("mode"), QStringLiteral("same, shift or sequence (retag)."), QStringLiteral("mode"), QStringLiteral("same"));
    const QCommandLineOption intervalOption(QStringLiteral("interval"), QStringLiteral("Seconds between assets in sequence mode."), QStringLiteral("seconds"), QStringLiteral("300"));
    parser.addOptions({configOption, exiftoolOption, ffmpegOption, ffprobeOption, idsOption, dateOption, modeOption, intervalOption});
    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        parser.showHelp(1);
    }
    const QString command = positional.first();
    const QStringList arguments = positional.mid(1);

    AppConfig config;
    QString configError;
    const QString configPath = parser.isSet(configOption) ? parser.value(configOption) : AppConfig::defaultConfigPath();
    if (!AppConfig::load(configPath, &config, &configError)) {
        return fail(configError);
    }
    if (parser.isSet(exiftoolOption)) {
        config.exiftoolProgram = parser.value(exiftoolOption);
    }
    if (parser.isSet(ffmpegOption)) {
        config.ffmpegProgram = parser.value(ffmpegOption);
    }
    if (parser.isSet(ffprobeOption)) {
        config.ffprobeProgram = parser.value(ffprobeOption);
    }

    if (command == QLatin1String("probe")) {
        if (arguments.isEmpty()) {
            return fail(QStringLiteral("probe needs a file"));
        }
        const QString filePath = QFileInfo(arguments.first()).absoluteFilePath();
        LibraryContext context(QFileInfo(filePath).absolutePath(), config);

        QJsonObject object;
        object.insert(QStringLiteral("file"), filePath);
        object.insert(QStringLiteral("media"), MediaProbe::isMediaFile(filePath));
        if (MediaProbe::isMediaFile(filePath)) {
            object.insert(QStringLiteral("type"), fileTypeToString(MediaProbe::fileTypeForPath(filePath)));
        }
        QString error;
        const QString hash = ContentHasher::hashFile(filePath, &error);
        if (hash.isEmpty()) {
            return fail(error);
        }
        object.insert(QStringLiteral("hash"), hash);

        CaptureDateSource source = CaptureDateSource::FileModified;
        const QDateTime captured = context.extractor().extract(filePath, &source, &error);
        if (captured.isValid()) {
            object.insert(QStringLiteral("captured_at"), formatCaptureDate(captured));
            object.insert(QStringLiteral("date_source"),
                          source == CaptureDateSource::Embedded ? QStringLiteral("embedded") : QStringLiteral("file_modified"));
        }
        const QSize dimensions = IngestionTransaction::dimensionsFor(context, filePath);
        if (dimensions.isValid()) {
            object.insert(QStringLiteral("width"), dimensions.width());
            object.insert(QStringLiteral("height"), dimensions.height());
        }
        const ToolFailure gate = context.normalizer().checkFormat(filePath);
        object.insert(QStringLiteral("normalizable"), gate.category == Disposition::None);
        if (gate.category != Disposition::None) {
            object.insert(QStringLiteral("category"), dispositionToString(gate.category));
            object.insert(QStringLiteral("reason"), gate.message);
        }
        printJson(object);
        return 0;
    }

    JobManager jobs;
    LibraryManager manager(config);
    manager.setJobManager(&jobs);

    if (command == QLatin1String("create")) {
        const QString libraryPath = arguments.isEmpty() ? config.libraryPath : arguments.first();
        if (libraryPath.isEmpty()) {
            return fail(QStringLiteral("create needs a library path"));
        }
        QString error;
        if (!manager.createLibrary(libraryPath, &error)) {
            return fail(error);
        }
        printJson({{QStringLiteral("library"), manager.libraryPath()}});
        return 0;
    }

    if (command == QLatin1String("terraform")) {
        if (arguments.isEmpty()) {
            return fail(QStringLiteral("terraform needs a folder"));
        }
        const QString rootPath = arguments.first();
        // Logging into a plain folder would be a change before pre-flight.
        if (LibraryContext::isLibrary(rootPath)) {
            installLibraryLog(rootPath);
        }
        const int exitCode = runOperation(app, manager, jobs, [&manager, &rootPath]() {
            return manager.terraform(rootPath);
        });
        Logging::uninstallFileLog();
        return exitCode;
    }

    QStringList operands;
    const QString libraryPath = LibraryContext::splitLibraryArgument(arguments, config.libraryPath, &operands);
    if (libraryPath.isEmpty()) {
        return fail(QStringLiteral("%1 needs a library path").arg(command));
    }
    QString openError;
    if (!manager.openLibrary(libraryPath, &openError)) {
        return fail(openError);
    }

    if (command == QLatin1String("assets")) {
        for (const MediaAsset &asset : manager.assets()) {
            printJson(assetToJson(asset));
        }
        return 0;
    }

    if (command == QLatin1String("trash")) {
        for (const TrashEntry &entry : manager.trashEntries()) {
            printJson(trashEntryToJson(entry));
        }
        return 0;
    }

    installLibraryLog(libraryPath);
    int exitCode = 0;

    if (command == QLatin1String("import")) {
        const QStringList &paths = operands;
        if (paths.isEmpty()) {
            exitCode = fail(QStringLiteral("import needs files or folders"));
        } else {
            exitCode = runOperation(app, manager, jobs, [&manager, &paths]() {
                return manager.importFiles(paths);
            });
        }
    } else if (command == QLatin1String("retag")) {
        QVector<qint64> ids;
        bool idsOk = parser.isSet(idsOption);
        for (const QString &part : parser.value(idsOption).split(QLatin1Char(','), Qt::SkipEmptyParts)) {
            bool ok = false;
            const qint64 id = part.trimmed().toLongLong(&ok);
            idsOk = idsOk && ok;
            ids.append(id);
        }
        const QDateTime date = parseCaptureDate(parser.value(dateOption));
        bool modeOk = false;
        const RetagMode mode = retagModeFromString(parser.value(modeOption), &modeOk);
        bool intervalOk = false;
        const int interval = parser.value(intervalOption).toInt(&intervalOk);

        if (!idsOk || ids.isEmpty()) {
            exitCode = fail(QStringLiteral("retag needs --ids 1,2,..."));
        } else if (!date.isValid()) {
            exitCode = fail(QStringLiteral("retag needs --date \"YYYY:MM:DD HH:MM:SS\""));
        } else if (!modeOk) {
            exitCode = fail(QStringLiteral("Unknown retag mode: %1").arg(parser.value(modeOption)));
        } else if (!intervalOk || interval < 0) {
            exitCode = fail(QStringLiteral("Invalid interval: %1").arg(parser.value(intervalOption)));
        } else {
            exitCode = runOperation(app, manager, jobs, [&]() {
                return manager.retagAssets(ids, date, mode, interval);
            });
        }
    } else {
        exitCode = fail(QStringLiteral("Unknown command: %1").arg(command));
    }

    Logging::uninstallFileLog();
    return exitCode;
}
