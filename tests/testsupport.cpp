#include "testsupport.h"

#include "fileoperations.h"

#include <gtest/gtest.h>

#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QSqlDatabase>
#include <QSqlError>
#include <QSqlQuery>
#include <QUuid>

namespace {
constexpr auto kMagic = "FAKEMEDIA";
constexpr auto kDatePrefix = "DATE=";
constexpr auto kFailPrefix = "FAIL:";
constexpr auto kNoWrite = "NOWRITE";

struct ParsedMedia
{
    bool valid = false;
    QDateTime captureDate;
    QByteArray payload;
};

ParsedMedia parse(const QByteArray &contents)
{
    ParsedMedia media;
    QList<QByteArray> lines = contents.split('\n');
    if (lines.isEmpty() || lines.first() != kMagic) {
        return media;
    }
    media.valid = true;
    lines.removeFirst();
    if (!lines.isEmpty() && lines.first().startsWith(kDatePrefix)) {
        media.captureDate = parseCaptureDate(QString::fromLatin1(lines.first().mid(int(qstrlen(kDatePrefix)))));
        lines.removeFirst();
    }
    media.payload = lines.join('\n');
    return media;
}

ToolFailure failureFor(Disposition category, const QString &message)
{
    ToolFailure failure;
    failure.category = category;
    failure.message = message;
    return failure;
}
}

FakeMetadataTool::FakeMetadataTool(const QString &name, bool available)
    : m_name(name)
    , m_available(available)
{
}

QString FakeMetadataTool::name() const
{
    return m_name;
}

bool FakeMetadataTool::isAvailable() const
{
    return m_available.load();
}

void FakeMetadataTool::setAvailable(bool available)
{
    m_available.store(available);
}

int FakeMetadataTool::writeCount() const
{
    return m_writeCount.load();
}

bool FakeMetadataTool::readCaptureDate(const QString &filePath, QDateTime *captureDate, ToolFailure *failure) const
{
    const ParsedMedia media = parse(TestSupport::readFile(filePath));
    if (!media.valid) {
        if (failure) {
            *failure = failureFor(Disposition::Corrupted, QStringLiteral("%1: not a valid media file").arg(filePath));
        }
        return false;
    }
    if (!media.captureDate.isValid()) {
        if (failure) {
            *failure = ToolFailure();
        }
        return false;
    }
    if (captureDate) {
        *captureDate = media.captureDate;
    }
    return true;
}

bool FakeMetadataTool::writeCaptureDate(const QString &sourcePath,
                                        const QString &destinationPath,
                                        const QDateTime &captureDate,
                                        int timeoutMs,
                                        ToolFailure *failure) const
{
    Q_UNUSED(timeoutMs);
    ++m_writeCount;

    if (QFileInfo::exists(destinationPath)) {
        if (failure) {
            *failure = failureFor(Disposition::PermissionDenied, QStringLiteral("%1 already exists").arg(destinationPath));
        }
        return false;
    }

    const QByteArray contents = TestSupport::readFile(sourcePath);
    const ParsedMedia media = parse(contents);
    if (!media.valid) {
        if (failure) {
            *failure = failureFor(Disposition::Corrupted, QStringLiteral("%1: file format error").arg(sourcePath));
        }
        return false;
    }

    for (const QByteArray &line : media.payload.split('\n')) {
        if (line.startsWith(kFailPrefix)) {
            bool ok = false;
            const Disposition category = dispositionFromString(QString::fromLatin1(line.mid(int(qstrlen(kFailPrefix)))), &ok);
            if (failure) {
                *failure = failureFor(ok ? category : Disposition::UnsupportedFormat,
                                      QStringLiteral("scripted failure for %1").arg(sourcePath));
            }
            return false;
        }
    }

    QByteArray output;
    if (media.payload.contains(kNoWrite)) {
        output = contents;
    } else {
        output = TestSupport::fakeMedia(captureDate, media.payload);
    }
    if (!TestSupport::writeFile(destinationPath, output)) {
        if (failure) {
            *failure = failureFor(Disposition::PermissionDenied, QStringLiteral("cannot write %1").arg(destinationPath));
        }
        return false;
    }
    return true;
}

namespace TestSupport {

QDateTime date(int year, int month, int day, int hour, int minute, int second)
{
    return QDateTime(QDate(year, month, day), QTime(hour, minute, second));
}

QByteArray fakeMedia(const QDateTime &captureDate, const QByteArray &payload)
{
    QByteArray contents(kMagic);
    contents.append('\n');
    if (captureDate.isValid()) {
        contents.append(kDatePrefix).append(formatCaptureDate(captureDate).toLatin1()).append('\n');
    }
    contents.append(payload);
    return contents;
}

QByteArray corruptMedia(const QByteArray &payload)
{
    return QByteArray("\xff\xd8 truncated ") + payload;
}

bool writeFile(const QString &filePath, const QByteArray &contents)
{
    if (!FileOperations::ensureDirectory(QFileInfo(filePath).absolutePath())) {
        return false;
    }
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    return file.write(contents) == contents.size();
}

QByteArray readFile(const QString &filePath)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        return QByteArray();
    }
    return file.readAll();
}

MetadataToolSet fakeTools(bool available)
{
    MetadataToolSet tools;
    tools.imageTool = std::make_shared<FakeMetadataTool>(QStringLiteral("fake-exiftool"), available);
    tools.videoTool = std::make_shared<FakeMetadataTool>(QStringLiteral("fake-ffmpeg"), available);
    return tools;
}

std::unique_ptr<LibraryContext> openLibrary(const QString &rootPath, const MetadataToolSet &tools, const AppConfig &config)
{
    auto context = std::make_unique<LibraryContext>(rootPath, config);
    context->setTools(tools.imageTool, tools.videoTool);
    QString error;
    if (!context->open(&error)) {
        ADD_FAILURE() << "Unable to open library: " << error.toStdString();
        return nullptr;
    }
    return context;
}

bool executeSql(const QString &databasePath, const QString &statement)
{
    const QString connectionName = QStringLiteral("testsupport_") + QUuid::createUuid().toString(QUuid::Id128);
    bool ok = false;
    {
        QSqlDatabase database = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), connectionName);
        database.setDatabaseName(databasePath);
        if (database.open()) {
            QSqlQuery query(database);
            ok = query.exec(statement);
            if (!ok) {
                ADD_FAILURE() << query.lastError().text().toStdString();
            }
            database.close();
        }
    }
    QSqlDatabase::removeDatabase(connectionName);
    return ok;
}

QStringList filesBelow(const QString &directoryPath)
{
    QStringList files;
    const QDir root(directoryPath);
    QDirIterator it(directoryPath, QDir::Files | QDir::Hidden | QDir::System, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        files.append(root.relativeFilePath(it.next()));
    }
    files.sort();
    return files;
}

} // namespace TestSupport
