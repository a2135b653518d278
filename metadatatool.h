#ifndef METADATATOOL_H
#define METADATATOOL_H

#include <QDateTime>
#include <QSize>
#include <QString>

#include "toolrunner.h"

// Black-box contract of an external utility that can read and write the
// embedded capture timestamp of one family of media formats.
class MetadataTool
{
public:
    virtual ~MetadataTool() = default;

    virtual QString name() const = 0;

    // True when the utility is installed and answers a version probe.
    virtual bool isAvailable() const = 0;

    // Returns false with failure->category == Disposition::None when the file
    // simply carries no embedded timestamp.
    virtual bool readCaptureDate(const QString &filePath,
                                 QDateTime *captureDate,
                                 ToolFailure *failure = nullptr) const = 0;

    // Writes a copy of sourcePath to destinationPath (which must not exist)
    // whose embedded capture timestamp fields equal captureDate.
    virtual bool writeCaptureDate(const QString &sourcePath,
                                  const QString &destinationPath,
                                  const QDateTime &captureDate,
                                  int timeoutMs,
                                  ToolFailure *failure = nullptr) const = 0;

    virtual QSize readDimensions(const QString &filePath) const
    {
        Q_UNUSED(filePath);
        return QSize();
    }
};

#endif // METADATATOOL_H
