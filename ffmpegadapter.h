#ifndef FFMPEGADAPTER_H
#define FFMPEGADAPTER_H

#include "metadatatool.h"

class FfmpegAdapter : public MetadataTool
{
public:
    explicit FfmpegAdapter(const QString &ffmpegProgram = QStringLiteral("ffmpeg"),
                           const QString &ffprobeProgram = QStringLiteral("ffprobe"),
                           int readTimeoutMs = 5000);

    QString name() const override;
    bool isAvailable() const override;
    bool readCaptureDate(const QString &filePath,
                         QDateTime *captureDate,
                         ToolFailure *failure = nullptr) const override;
    bool writeCaptureDate(const QString &sourcePath,
                          const QString &destinationPath,
                          const QDateTime &captureDate,
                          int timeoutMs,
                          ToolFailure *failure = nullptr) const override;
    QSize readDimensions(const QString &filePath) const override;

private:
    ToolRunner m_ffmpeg;
    ToolRunner m_ffprobe;
    int m_readTimeoutMs = 5000;
    mutable int m_availability = -1;
};

#endif // FFMPEGADAPTER_H
