#ifndef METADATANORMALIZER_H
#define METADATANORMALIZER_H

#include <QDateTime>
#include <QString>

#include "toolrunner.h"

class MetadataTool;

struct NormalizerSettings
{
    int imageTimeoutMs = 30000;
    int videoTimeoutMs = 60000;
};

class MetadataNormalizer
{
public:
    MetadataNormalizer(const MetadataTool *imageTool,
                       const MetadataTool *videoTool,
                       const NormalizerSettings &settings = NormalizerSettings());

    // Rewrites the embedded capture timestamp of filePath in place. The file
    // is either replaced by a verified rewrite or left untouched.
    bool normalize(const QString &filePath, const QDateTime &captureDate, ToolFailure *failure = nullptr) const;

    // Rejections decided from the file type alone (RAW, unsupported
    // containers, unknown types) plus tool availability.
    ToolFailure checkFormat(const QString &filePath) const;
    // checkFormat() plus existence and permission checks on filePath itself.
    ToolFailure precheck(const QString &filePath) const;

private:
    const MetadataTool *toolFor(const QString &filePath) const;
    int timeoutFor(const QString &filePath) const;

    const MetadataTool *m_imageTool = nullptr;
    const MetadataTool *m_videoTool = nullptr;
    NormalizerSettings m_settings;
};

#endif // METADATANORMALIZER_H
