#ifndef APPCONFIG_H
#define APPCONFIG_H

#include <QJsonObject>
#include <QString>

struct AppConfig
{
    QString libraryPath;
    QString exiftoolProgram = QStringLiteral("exiftool");
    QString ffmpegProgram = QStringLiteral("ffmpeg");
    QString ffprobeProgram = QStringLiteral("ffprobe");
    int imageTimeoutMs = 30000;
    int videoTimeoutMs = 60000;
    int readTimeoutMs = 5000;
    double minFreeSpaceRatio = 0.10;
    int progressEveryFiles = 25;
    int progressIntervalMs = 1000;
    int cleanupMaxPasses = 10;
    int maxDatabaseBackups = 20;

    QJsonObject toJson() const;
    static AppConfig fromJson(const QJsonObject &object);

    // A missing file yields the defaults; a malformed one is an error.
    static bool load(const QString &filePath, AppConfig *config, QString *errorMessage = nullptr);
    bool save(const QString &filePath, QString *errorMessage = nullptr) const;

    static QString defaultConfigPath();
};

#endif // APPCONFIG_H
