#include "appconfig.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QSaveFile>
#include <QStandardPaths>

namespace {
constexpr auto kConfigFileName = "config.json";
}

QJsonObject AppConfig::toJson() const
{
    QJsonObject object;
    object.insert(QStringLiteral("library_path"), libraryPath);
    object.insert(QStringLiteral("exiftool"), exiftoolProgram);
    object.insert(QStringLiteral("ffmpeg"), ffmpegProgram);
    object.insert(QStringLiteral("ffprobe"), ffprobeProgram);
    object.insert(QStringLiteral("image_timeout_ms"), imageTimeoutMs);
    object.insert(QStringLiteral("video_timeout_ms"), videoTimeoutMs);
    object.insert(QStringLiteral("read_timeout_ms"), readTimeoutMs);
    object.insert(QStringLiteral("min_free_space_ratio"), minFreeSpaceRatio);
    object.insert(QStringLiteral("progress_every_files"), progressEveryFiles);
    object.insert(QStringLiteral("progress_interval_ms"), progressIntervalMs);
    object.insert(QStringLiteral("cleanup_max_passes"), cleanupMaxPasses);
    object.insert(QStringLiteral("max_database_backups"), maxDatabaseBackups);
    return object;
}

AppConfig AppConfig::fromJson(const QJsonObject &object)
{
    AppConfig config;
    config.libraryPath = object.value(QStringLiteral("library_path")).toString(config.libraryPath);
    config.exiftoolProgram = object.value(QStringLiteral("exiftool")).toString(config.exiftoolProgram);
    config.ffmpegProgram = object.value(QStringLiteral("ffmpeg")).toString(config.ffmpegProgram);
    config.ffprobeProgram = object.value(QStringLiteral("ffprobe")).toString(config.ffprobeProgram);
    config.imageTimeoutMs = object.value(QStringLiteral("image_timeout_ms")).toInt(config.imageTimeoutMs);
    config.videoTimeoutMs = object.value(QStringLiteral("video_timeout_ms")).toInt(config.videoTimeoutMs);
    config.readTimeoutMs = object.value(QStringLiteral("read_timeout_ms")).toInt(config.readTimeoutMs);
    config.minFreeSpaceRatio = object.value(QStringLiteral("min_free_space_ratio")).toDouble(config.minFreeSpaceRatio);
    config.progressEveryFiles = qMax(1, object.value(QStringLiteral("progress_every_files")).toInt(config.progressEveryFiles));
    config.progressIntervalMs = qMax(0, object.value(QStringLiteral("progress_interval_ms")).toInt(config.progressIntervalMs));
    config.cleanupMaxPasses = qMax(1, object.value(QStringLiteral("cleanup_max_passes")).toInt(config.cleanupMaxPasses));
    config.maxDatabaseBackups = qMax(0, object.value(QStringLiteral("max_database_backups")).toInt(config.maxDatabaseBackups));
    return config;
}

bool AppConfig::load(const QString &filePath, AppConfig *config, QString *errorMessage)
{
    if (!config) {
        return false;
    }
    if (!QFileInfo::exists(filePath)) {
        *config = AppConfig();
        return true;
    }

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Unable to read config %1: %2").arg(filePath, file.errorString());
        }
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Invalid config %1: %2").arg(filePath, parseError.errorString());
        }
        return false;
    }

    *config = fromJson(document.object());
    return true;
}

bool AppConfig::save(const QString &filePath, QString *errorMessage) const
{
    const QFileInfo info(filePath);
    if (!QDir().mkpath(info.absolutePath())) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Unable to create %1").arg(info.absolutePath());
        }
        return false;
    }

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Unable to write config %1: %2").arg(filePath, file.errorString());
        }
        return false;
    }
    file.write(QJsonDocument(toJson()).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Unable to save config %1: %2").arg(filePath, file.errorString());
        }
        return false;
    }
    return true;
}

QString AppConfig::defaultConfigPath()
{
    const QString base = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    return QDir(base).filePath(QString::fromLatin1(kConfigFileName));
}
