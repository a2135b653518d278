#ifndef CAPTUREDATEEXTRACTOR_H
#define CAPTUREDATEEXTRACTOR_H

#include <QDateTime>
#include <QString>

class MetadataTool;

enum class CaptureDateSource {
    Embedded,
    FileModified
};

class CaptureDateExtractor
{
public:
    CaptureDateExtractor(const MetadataTool *imageTool, const MetadataTool *videoTool);

    // Embedded timestamp when present, otherwise the file's last-modified
    // time. Returns an invalid QDateTime only when the file is unreadable.
    QDateTime extract(const QString &filePath,
                      CaptureDateSource *source = nullptr,
                      QString *errorMessage = nullptr) const;

    QDateTime readEmbedded(const QString &filePath) const;

private:
    const MetadataTool *toolFor(const QString &filePath) const;

    const MetadataTool *m_imageTool = nullptr;
    const MetadataTool *m_videoTool = nullptr;
};

#endif // CAPTUREDATEEXTRACTOR_H
