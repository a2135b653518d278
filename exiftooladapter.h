#ifndef EXIFTOOLADAPTER_H
#define EXIFTOOLADAPTER_H

#include "metadatatool.h"

class ExifToolAdapter : public MetadataTool
{
public:
    explicit ExifToolAdapter(const QString &program = QStringLiteral("exiftool"), int readTimeoutMs = 5000);

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

private:
    ToolRunner m_runner;
    int m_readTimeoutMs = 5000;
    mutable int m_availability = -1;
};

#endif // EXIFTOOLADAPTER_H
