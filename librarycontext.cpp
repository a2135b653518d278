#include "librarycontext.h"

#include "exiftooladapter.h"
#include "ffmpegadapter.h"
#include "fileoperations.h"
#include "mediaprobe.h"

#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>

namespace {
constexpr auto kDatabaseFileName = "photo_library.db";
constexpr auto kTrashDirName = ".trash";
constexpr auto kStagingDirName = ".import_temp";
constexpr auto kLogsDirName = ".logs";
constexpr auto kBackupsDirName = ".db_backups";
constexpr auto kThumbnailsDirName = ".thumbnails";
constexpr auto kLockFileName = ".photovault.lock";
}

LibraryContext::LibraryContext(const QString &rootPath, const AppConfig &config)
    : m_config(config)
    , m_rootPath(QDir::cleanPath(QDir(rootPath).absolutePath()))
    , m_imageTool(std::make_shared<ExifToolAdapter>(config.exiftoolProgram, config.readTimeoutMs))
    , m_videoTool(std::make_shared<FfmpegAdapter>(config.ffmpegProgram, config.ffprobeProgram, config.readTimeoutMs))
{
    rebuildToolUsers();
}

LibraryContext::~LibraryContext()
{
    close();
}

bool LibraryContext::open(QString *errorMessage)
{
    close();

    QDir root(m_rootPath);
    if (!root.exists() && !root.mkpath(QStringLiteral("."))) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Unable to create library directory at %1").arg(m_rootPath);
        }
        return false;
    }

    for (const QString &name : reservedDirectoryNames()) {
        if (!FileOperations::ensureDirectory(root.filePath(name), errorMessage)) {
            return false;
        }
    }

    if (!m_store.open(databasePath(), errorMessage)) {
        return false;
    }

    m_trash = std::make_unique<TrashBin>(trashDirectory(), &m_store);
    if (!m_trash->ensureCategoryDirectories(errorMessage)) {
        close();
        return false;
    }
    return true;
}

void LibraryContext::close()
{
    m_trash.reset();
    m_store.close();
}

bool LibraryContext::isOpen() const
{
    return m_store.isOpen();
}

bool LibraryContext::isLibrary(const QString &rootPath)
{
    return QFileInfo::exists(QDir(rootPath).filePath(QString::fromLatin1(kDatabaseFileName)));
}

QString LibraryContext::splitLibraryArgument(const QStringList &arguments,
                                             const QString &configuredLibrary,
                                             QStringList *operands)
{
    if (!arguments.isEmpty() && (configuredLibrary.isEmpty() || isLibrary(arguments.first()))) {
        if (operands) {
            *operands = arguments.mid(1);
        }
        return arguments.first();
    }
    if (operands) {
        *operands = arguments;
    }
    return configuredLibrary;
}

QStringList LibraryContext::reservedDirectoryNames()
{
    return {
        QString::fromLatin1(kTrashDirName),
        QString::fromLatin1(kStagingDirName),
        QString::fromLatin1(kLogsDirName),
        QString::fromLatin1(kBackupsDirName),
        QString::fromLatin1(kThumbnailsDirName)
    };
}

QString LibraryContext::databaseFileName()
{
    return QString::fromLatin1(kDatabaseFileName);
}

const AppConfig &LibraryContext::config() const
{
    return m_config;
}

QString LibraryContext::rootPath() const
{
    return m_rootPath;
}

QString LibraryContext::databasePath() const
{
    return QDir(m_rootPath).filePath(QString::fromLatin1(kDatabaseFileName));
}

QString LibraryContext::trashDirectory() const
{
    return QDir(m_rootPath).filePath(QString::fromLatin1(kTrashDirName));
}

QString LibraryContext::stagingDirectory() const
{
    return QDir(m_rootPath).filePath(QString::fromLatin1(kStagingDirName));
}

QString LibraryContext::logDirectory() const
{
    return QDir(m_rootPath).filePath(QString::fromLatin1(kLogsDirName));
}

QString LibraryContext::backupDirectory() const
{
    return QDir(m_rootPath).filePath(QString::fromLatin1(kBackupsDirName));
}

QString LibraryContext::lockFilePath() const
{
    return QDir(m_rootPath).filePath(QString::fromLatin1(kLockFileName));
}

QString LibraryContext::absolutePath(const QString &relativePath) const
{
    return QDir::cleanPath(QDir(m_rootPath).filePath(relativePath));
}

QString LibraryContext::relativePath(const QString &absolutePath) const
{
    return QDir(m_rootPath).relativeFilePath(absolutePath);
}

bool LibraryContext::isInsideLibrary(const QString &absolutePath) const
{
    const QString cleaned = QDir::cleanPath(QFileInfo(absolutePath).absoluteFilePath());
    return cleaned.startsWith(m_rootPath + QLatin1Char('/'));
}

AssetStore *LibraryContext::store()
{
    return &m_store;
}

const AssetStore *LibraryContext::store() const
{
    return &m_store;
}

TrashBin *LibraryContext::trash()
{
    return m_trash.get();
}

void LibraryContext::setTools(const std::shared_ptr<MetadataTool> &imageTool, const std::shared_ptr<MetadataTool> &videoTool)
{
    m_imageTool = imageTool;
    m_videoTool = videoTool;
    rebuildToolUsers();
}

const MetadataTool *LibraryContext::imageTool() const
{
    return m_imageTool.get();
}

const MetadataTool *LibraryContext::videoTool() const
{
    return m_videoTool.get();
}

const MetadataTool *LibraryContext::toolFor(const QString &filePath) const
{
    return MediaProbe::isVideoFile(filePath) ? videoTool() : imageTool();
}

const MetadataNormalizer &LibraryContext::normalizer() const
{
    return *m_normalizer;
}

const CaptureDateExtractor &LibraryContext::extractor() const
{
    return *m_extractor;
}

void LibraryContext::rebuildToolUsers()
{
    NormalizerSettings settings;
    settings.imageTimeoutMs = m_config.imageTimeoutMs;
    settings.videoTimeoutMs = m_config.videoTimeoutMs;
    m_normalizer = std::make_unique<MetadataNormalizer>(m_imageTool.get(), m_videoTool.get(), settings);
    m_extractor = std::make_unique<CaptureDateExtractor>(m_imageTool.get(), m_videoTool.get());
}

bool LibraryContext::backupDatabase(const QString &reason, QString *errorMessage)
{
    if (m_config.maxDatabaseBackups <= 0 || !QFileInfo::exists(databasePath())) {
        return true;
    }
    if (!FileOperations::ensureDirectory(backupDirectory(), errorMessage)) {
        return false;
    }

    const QString stamp = QDateTime::currentDateTime().toString(QStringLiteral("yyyyMMdd_HHmmss"));
    const QString fileName = QStringLiteral("photo_library_%1_%2.db").arg(stamp, reason);
    const QString destination = FileOperations::uniqueFilePath(backupDirectory(), fileName);
    if (!QFile::copy(databasePath(), destination)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Unable to back up database to %1").arg(destination);
        }
        return false;
    }

    QDir backups(backupDirectory());
    const QFileInfoList existing = backups.entryInfoList({QStringLiteral("photo_library_*.db")}, QDir::Files, QDir::Time);
    for (int i = m_config.maxDatabaseBackups; i < existing.size(); ++i) {
        if (!QFile::remove(existing.at(i).absoluteFilePath())) {
            qWarning() << "Unable to prune old backup" << existing.at(i).absoluteFilePath();
        }
    }
    return true;
}
