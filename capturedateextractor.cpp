#include "capturedateextractor.h"

#include "mediaprobe.h"
#include "metadatatool.h"

#include <QDebug>
#include <QFileInfo>

CaptureDateExtractor::CaptureDateExtractor(const MetadataTool *imageTool, const MetadataTool *videoTool)
    : m_imageTool(imageTool)
    , m_videoTool(videoTool)
{
}

QDateTime CaptureDateExtractor::extract(const QString &filePath, CaptureDateSource *source, QString *errorMessage) const
{
    const QFileInfo info(filePath);
    if (!info.exists() || !info.isFile()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("File not found: %1").arg(filePath);
        }
        return QDateTime();
    }
    if (!info.isReadable()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("File is not readable: %1").arg(filePath);
        }
        return QDateTime();
    }

    const QDateTime embedded = readEmbedded(filePath);
    if (embedded.isValid()) {
        if (source) {
            *source = CaptureDateSource::Embedded;
        }
        return embedded;
    }

    QDateTime modified = info.lastModified();
    if (!modified.isValid()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("No usable timestamp for %1").arg(filePath);
        }
        return QDateTime();
    }
    modified.setTime(QTime(modified.time().hour(), modified.time().minute(), modified.time().second()));
    if (source) {
        *source = CaptureDateSource::FileModified;
    }
    return modified;
}

QDateTime CaptureDateExtractor::readEmbedded(const QString &filePath) const
{
    if (MediaProbe::isRawFile(filePath)) {
        QDateTime rawDate;
        QString rawError;
        if (MediaProbe::rawCaptureDate(filePath, &rawDate, &rawError)) {
            return rawDate;
        }
        qDebug() << rawError;
    }

    const MetadataTool *tool = toolFor(filePath);
    if (!tool) {
        return QDateTime();
    }

    QDateTime embedded;
    ToolFailure failure;
    if (tool->readCaptureDate(filePath, &embedded, &failure)) {
        return embedded;
    }
    if (failure.category != Disposition::None) {
        qDebug() << "Capture date read failed for" << filePath << ":" << failure.message;
    }
    return QDateTime();
}

const MetadataTool *CaptureDateExtractor::toolFor(const QString &filePath) const
{
    return MediaProbe::isVideoFile(filePath) ? m_videoTool : m_imageTool;
}
