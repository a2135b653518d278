#include "ffmpegadapter.h"

#include <QDebug>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

namespace {
constexpr int kVersionProbeTimeoutMs = 5000;

// Container creation_time is written as UTC-labelled wall clock so that the
// value read back is the same naive timestamp that went in.
QString containerTimestamp(const QDateTime &captureDate)
{
    return captureDate.toString(QStringLiteral("yyyy-MM-ddTHH:mm:ss")) + QLatin1Char('Z');
}
}

FfmpegAdapter::FfmpegAdapter(const QString &ffmpegProgram, const QString &ffprobeProgram, int readTimeoutMs)
    : m_ffmpeg(ffmpegProgram)
    , m_ffprobe(ffprobeProgram)
    , m_readTimeoutMs(readTimeoutMs)
{
}

QString FfmpegAdapter::name() const
{
    return QStringLiteral("ffmpeg");
}

bool FfmpegAdapter::isAvailable() const
{
    if (m_availability < 0) {
        const ToolResult ffmpeg = m_ffmpeg.run({QStringLiteral("-version")}, kVersionProbeTimeoutMs);
        const ToolResult ffprobe = m_ffprobe.run({QStringLiteral("-version")}, kVersionProbeTimeoutMs);
        m_availability = (ffmpeg.succeeded() && ffprobe.succeeded()) ? 1 : 0;
        if (m_availability == 0) {
            qDebug() << "ffmpeg/ffprobe probe failed:" << ffmpeg.errorString << ffprobe.errorString;
        }
    }
    return m_availability == 1;
}

bool FfmpegAdapter::readCaptureDate(const QString &filePath, QDateTime *captureDate, ToolFailure *failure) const
{
    const ToolResult result = m_ffprobe.run({QStringLiteral("-v"), QStringLiteral("quiet"),
                                             QStringLiteral("-show_entries"), QStringLiteral("format_tags=creation_time"),
                                             QStringLiteral("-of"), QStringLiteral("default=noprint_wrappers=1:nokey=1"),
                                             filePath},
                                            m_readTimeoutMs);
    if (!result.succeeded()) {
        if (failure) {
            *failure = classifyToolFailure(QStringLiteral("ffprobe"), result);
        }
        return false;
    }

    // e.g. 2019-06-01T14:03:22.000000Z
    const QString raw = QString::fromUtf8(result.standardOutput).trimmed();
    const QDateTime parsed = parseCaptureDate(raw.section(QLatin1Char('\n'), 0, 0));
    if (!parsed.isValid()) {
        if (failure) {
            *failure = ToolFailure();
        }
        return false;
    }
    if (captureDate) {
        *captureDate = parsed;
    }
    return true;
}

bool FfmpegAdapter::writeCaptureDate(const QString &sourcePath,
                                     const QString &destinationPath,
                                     const QDateTime &captureDate,
                                     int timeoutMs,
                                     ToolFailure *failure) const
{
    const ToolResult result = m_ffmpeg.run({QStringLiteral("-v"), QStringLiteral("error"),
                                            QStringLiteral("-nostdin"),
                                            QStringLiteral("-i"), sourcePath,
                                            QStringLiteral("-map_metadata"), QStringLiteral("0"),
                                            QStringLiteral("-metadata"),
                                            QStringLiteral("creation_time=%1").arg(containerTimestamp(captureDate)),
                                            QStringLiteral("-codec"), QStringLiteral("copy"),
                                            QStringLiteral("-y"), destinationPath},
                                           timeoutMs);
    if (!result.succeeded()) {
        if (failure) {
            *failure = classifyToolFailure(name(), result);
        }
        QFile::remove(destinationPath);
        return false;
    }

    if (!QFile::exists(destinationPath)) {
        if (failure) {
            failure->category = Disposition::Corrupted;
            failure->message = QStringLiteral("ffmpeg produced no output for %1").arg(sourcePath);
        }
        return false;
    }
    return true;
}

QSize FfmpegAdapter::readDimensions(const QString &filePath) const
{
    const ToolResult result = m_ffprobe.run({QStringLiteral("-v"), QStringLiteral("quiet"),
                                             QStringLiteral("-print_format"), QStringLiteral("json"),
                                             QStringLiteral("-show_streams"),
                                             QStringLiteral("-select_streams"), QStringLiteral("v:0"),
                                             filePath},
                                            m_readTimeoutMs);
    if (!result.succeeded()) {
        return QSize();
    }

    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(result.standardOutput, &parseError);
    if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
        qDebug() << "Unable to parse ffprobe output for" << filePath << ":" << parseError.errorString();
        return QSize();
    }

    const QJsonArray streams = document.object().value(QStringLiteral("streams")).toArray();
    for (const QJsonValue &value : streams) {
        const QJsonObject stream = value.toObject();
        const int width = stream.value(QStringLiteral("width")).toInt();
        const int height = stream.value(QStringLiteral("height")).toInt();
        if (width > 0 && height > 0) {
            return QSize(width, height);
        }
    }
    return QSize();
}
