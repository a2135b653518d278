#ifndef MEDIATYPES_H
#define MEDIATYPES_H

#include <QDateTime>
#include <QMetaType>
#include <QString>

enum class MediaFileType {
    Image,
    Video
};

enum class Disposition {
    None,
    Duplicate,
    Corrupted,
    UnsupportedFormat,
    PermissionDenied,
    Timeout,
    MissingTool,
    RawSkipped
};

struct MediaAsset
{
    qint64 id = -1;
    QString contentHash;
    QString currentPath;        // relative to the library root
    QString originalFilename;
    QDateTime capturedAt;
    MediaFileType fileType = MediaFileType::Image;
    int width = 0;
    int height = 0;
    qint64 byteSize = 0;

    bool isValid() const { return id > 0; }
};

struct TrashEntry
{
    qint64 id = -1;
    QString originalPath;
    QString trashPath;          // relative to the trash directory
    Disposition category = Disposition::None;
    QString reason;
    QDateTime timestamp;
};

QString dispositionToString(Disposition disposition);
Disposition dispositionFromString(const QString &value, bool *ok = nullptr);
QString dispositionToDisplayText(Disposition disposition);
QList<Disposition> rejectionDispositions();

QString fileTypeToString(MediaFileType type);
MediaFileType fileTypeFromString(const QString &value);

// Canonical capture timestamps use the EXIF layout "yyyy:MM:dd HH:mm:ss".
QString formatCaptureDate(const QDateTime &dateTime);
QDateTime parseCaptureDate(const QString &text);

Q_DECLARE_METATYPE(MediaAsset)

#endif // MEDIATYPES_H
