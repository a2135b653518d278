#include "mediatypes.h"

#include <QObject>

namespace {
constexpr auto kCaptureDateFormat = "yyyy:MM:dd HH:mm:ss";
}

QString dispositionToString(Disposition disposition)
{
    switch (disposition) {
    case Disposition::None:
        return QStringLiteral("none");
    case Disposition::Duplicate:
        return QStringLiteral("duplicate");
    case Disposition::Corrupted:
        return QStringLiteral("corrupted");
    case Disposition::UnsupportedFormat:
        return QStringLiteral("unsupported_format");
    case Disposition::PermissionDenied:
        return QStringLiteral("permission_denied");
    case Disposition::Timeout:
        return QStringLiteral("timeout");
    case Disposition::MissingTool:
        return QStringLiteral("missing_tool");
    case Disposition::RawSkipped:
        return QStringLiteral("raw_skipped");
    }
    return QStringLiteral("none");
}

Disposition dispositionFromString(const QString &value, bool *ok)
{
    const QString key = value.trimmed().toLower();
    if (ok) {
        *ok = true;
    }
    if (key == QLatin1String("duplicate")) {
        return Disposition::Duplicate;
    }
    if (key == QLatin1String("corrupted")) {
        return Disposition::Corrupted;
    }
    if (key == QLatin1String("unsupported_format")) {
        return Disposition::UnsupportedFormat;
    }
    if (key == QLatin1String("permission_denied")) {
        return Disposition::PermissionDenied;
    }
    if (key == QLatin1String("timeout")) {
        return Disposition::Timeout;
    }
    if (key == QLatin1String("missing_tool")) {
        return Disposition::MissingTool;
    }
    if (key == QLatin1String("raw_skipped")) {
        return Disposition::RawSkipped;
    }
    if (ok && key != QLatin1String("none")) {
        *ok = false;
    }
    return Disposition::None;
}

QString dispositionToDisplayText(Disposition disposition)
{
    switch (disposition) {
    case Disposition::None:
        return QObject::tr("Accepted");
    case Disposition::Duplicate:
        return QObject::tr("Duplicate");
    case Disposition::Corrupted:
        return QObject::tr("Corrupted");
    case Disposition::UnsupportedFormat:
        return QObject::tr("Unsupported format");
    case Disposition::PermissionDenied:
        return QObject::tr("Permission denied");
    case Disposition::Timeout:
        return QObject::tr("Timed out");
    case Disposition::MissingTool:
        return QObject::tr("Missing tool");
    case Disposition::RawSkipped:
        return QObject::tr("RAW skipped");
    }
    return QObject::tr("Unknown");
}

QList<Disposition> rejectionDispositions()
{
    return {
        Disposition::Duplicate,
        Disposition::Corrupted,
        Disposition::UnsupportedFormat,
        Disposition::PermissionDenied,
        Disposition::Timeout,
        Disposition::MissingTool,
        Disposition::RawSkipped
    };
}

QString fileTypeToString(MediaFileType type)
{
    return type == MediaFileType::Video ? QStringLiteral("video") : QStringLiteral("image");
}

MediaFileType fileTypeFromString(const QString &value)
{
    return value.compare(QLatin1String("video"), Qt::CaseInsensitive) == 0 ? MediaFileType::Video
                                                                           : MediaFileType::Image;
}

QString formatCaptureDate(const QDateTime &dateTime)
{
    if (!dateTime.isValid()) {
        return QString();
    }
    return dateTime.toString(QString::fromLatin1(kCaptureDateFormat));
}

QDateTime parseCaptureDate(const QString &text)
{
    const QString trimmed = text.trimmed();
    if (trimmed.isEmpty()) {
        return QDateTime();
    }
    QDateTime parsed = QDateTime::fromString(trimmed, QString::fromLatin1(kCaptureDateFormat));
    if (!parsed.isValid()) {
        // Accept ISO input as well (YYYY-MM-DDTHH:MM:SS or with a space)
        QString iso = trimmed;
        iso.replace(QLatin1Char(' '), QLatin1Char('T'));
        parsed = QDateTime::fromString(iso.left(19), Qt::ISODate);
    }
    return parsed;
}
