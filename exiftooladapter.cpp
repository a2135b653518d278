#include "exiftooladapter.h"

#include <QDebug>
#include <QFile>

namespace {
constexpr int kVersionProbeTimeoutMs = 5000;
constexpr auto kExifDateFormat = "%Y:%m:%d %H:%M:%S";
}

ExifToolAdapter::ExifToolAdapter(const QString &program, int readTimeoutMs)
    : m_runner(program)
    , m_readTimeoutMs(readTimeoutMs)
{
}

QString ExifToolAdapter::name() const
{
    return QStringLiteral("exiftool");
}

bool ExifToolAdapter::isAvailable() const
{
    if (m_availability < 0) {
        const ToolResult result = m_runner.run({QStringLiteral("-ver")}, kVersionProbeTimeoutMs);
        m_availability = result.succeeded() ? 1 : 0;
        if (!result.succeeded()) {
            qDebug() << "exiftool probe failed:" << result.errorString;
        }
    }
    return m_availability == 1;
}

bool ExifToolAdapter::readCaptureDate(const QString &filePath, QDateTime *captureDate, ToolFailure *failure) const
{
    const ToolResult result = m_runner.run({QStringLiteral("-DateTimeOriginal"),
                                            QStringLiteral("-s3"),
                                            QStringLiteral("-d"),
                                            QString::fromLatin1(kExifDateFormat),
                                            filePath},
                                           m_readTimeoutMs);
    if (!result.succeeded()) {
        if (failure) {
            *failure = classifyToolFailure(name(), result);
        }
        return false;
    }

    const QDateTime parsed = parseCaptureDate(QString::fromUtf8(result.standardOutput));
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

bool ExifToolAdapter::writeCaptureDate(const QString &sourcePath,
                                       const QString &destinationPath,
                                       const QDateTime &captureDate,
                                       int timeoutMs,
                                       ToolFailure *failure) const
{
    const QString value = formatCaptureDate(captureDate);
    const ToolResult result = m_runner.run({QStringLiteral("-DateTimeOriginal=%1").arg(value),
                                            QStringLiteral("-CreateDate=%1").arg(value),
                                            QStringLiteral("-ModifyDate=%1").arg(value),
                                            QStringLiteral("-P"),
                                            QStringLiteral("-o"),
                                            destinationPath,
                                            sourcePath},
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
            failure->category = Disposition::UnsupportedFormat;
            failure->message = QStringLiteral("exiftool produced no output for %1").arg(sourcePath);
        }
        return false;
    }
    return true;
}
