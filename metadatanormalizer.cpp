#include "metadatanormalizer.h"

#include "fileoperations.h"
#include "mediaprobe.h"
#include "metadatatool.h"

#include <QDebug>
#include <QFile>
#include <QFileInfo>

namespace {

ToolFailure makeFailure(Disposition category, const QString &message)
{
    ToolFailure failure;
    failure.category = category;
    failure.message = message;
    return failure;
}

}

MetadataNormalizer::MetadataNormalizer(const MetadataTool *imageTool,
                                       const MetadataTool *videoTool,
                                       const NormalizerSettings &settings)
    : m_imageTool(imageTool)
    , m_videoTool(videoTool)
    , m_settings(settings)
{
}

ToolFailure MetadataNormalizer::precheck(const QString &filePath) const
{
    const QFileInfo info(filePath);
    if (!info.exists() || !info.isFile()) {
        return makeFailure(Disposition::Corrupted, QStringLiteral("File not found: %1").arg(filePath));
    }
    if (!info.isReadable() || !info.isWritable()) {
        return makeFailure(Disposition::PermissionDenied,
                           QStringLiteral("Insufficient permissions to rewrite %1").arg(filePath));
    }
    if (!QFileInfo(info.absolutePath()).isWritable()) {
        return makeFailure(Disposition::PermissionDenied,
                           QStringLiteral("Directory is not writable: %1").arg(info.absolutePath()));
    }
    if (info.size() == 0) {
        return makeFailure(Disposition::Corrupted, QStringLiteral("File is empty: %1").arg(filePath));
    }

    return checkFormat(filePath);
}

ToolFailure MetadataNormalizer::checkFormat(const QString &filePath) const
{
    const QString extension = MediaProbe::normalizedExtension(filePath);
    if (MediaProbe::isRawFile(filePath)) {
        return makeFailure(Disposition::RawSkipped,
                           QStringLiteral("RAW metadata is not rewritten (.%1)").arg(extension));
    }
    if (MediaProbe::unsupportedVideoExtensions().contains(extension)) {
        return makeFailure(Disposition::UnsupportedFormat,
                           QStringLiteral("Video container .%1 cannot be rewritten without re-encoding").arg(extension));
    }
    if (!MediaProbe::isPhotoFile(filePath) && !MediaProbe::isVideoFile(filePath)) {
        return makeFailure(Disposition::UnsupportedFormat,
                           QStringLiteral("Unsupported file type: .%1").arg(extension));
    }

    const MetadataTool *tool = toolFor(filePath);
    if (!tool || !tool->isAvailable()) {
        return makeFailure(Disposition::MissingTool,
                           QStringLiteral("%1 is not installed").arg(tool ? tool->name() : QStringLiteral("Metadata tool")));
    }
    return ToolFailure();
}

bool MetadataNormalizer::normalize(const QString &filePath, const QDateTime &captureDate, ToolFailure *failure) const
{
    if (!captureDate.isValid()) {
        if (failure) {
            *failure = makeFailure(Disposition::Corrupted, QStringLiteral("No capture date to write into %1").arg(filePath));
        }
        return false;
    }

    const ToolFailure rejection = precheck(filePath);
    if (rejection.category != Disposition::None) {
        if (failure) {
            *failure = rejection;
        }
        return false;
    }

    const MetadataTool *tool = toolFor(filePath);
    const QString workingPath = FileOperations::temporarySiblingPath(filePath, QStringLiteral("normalize"));

    ToolFailure writeFailure;
    if (!tool->writeCaptureDate(filePath, workingPath, captureDate, timeoutFor(filePath), &writeFailure)) {
        QFile::remove(workingPath);
        if (writeFailure.category == Disposition::None) {
            writeFailure.category = Disposition::UnsupportedFormat;
        }
        if (failure) {
            *failure = writeFailure;
        }
        return false;
    }

    QDateTime written;
    ToolFailure readFailure;
    if (!tool->readCaptureDate(workingPath, &written, &readFailure)
        || formatCaptureDate(written) != formatCaptureDate(captureDate)) {
        QFile::remove(workingPath);
        if (failure) {
            if (readFailure.category != Disposition::None) {
                *failure = readFailure;
            } else {
                *failure = makeFailure(Disposition::UnsupportedFormat,
                                       QStringLiteral("Capture date did not persist in %1 (read back '%2')")
                                           .arg(QFileInfo(filePath).fileName(), formatCaptureDate(written)));
            }
        }
        return false;
    }

    QString replaceError;
    if (!FileOperations::replaceFile(workingPath, filePath, &replaceError)) {
        QFile::remove(workingPath);
        if (failure) {
            *failure = makeFailure(Disposition::PermissionDenied, replaceError);
        }
        return false;
    }

    qDebug() << "Normalized" << filePath << "to" << formatCaptureDate(captureDate);
    return true;
}

const MetadataTool *MetadataNormalizer::toolFor(const QString &filePath) const
{
    return MediaProbe::isVideoFile(filePath) ? m_videoTool : m_imageTool;
}

int MetadataNormalizer::timeoutFor(const QString &filePath) const
{
    return MediaProbe::isVideoFile(filePath) ? m_settings.videoTimeoutMs : m_settings.imageTimeoutMs;
}
