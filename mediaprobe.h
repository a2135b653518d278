#ifndef MEDIAPROBE_H
#define MEDIAPROBE_H

#include <QDateTime>
#include <QSet>
#include <QSize>
#include <QString>
#include <QStringList>

#include "mediatypes.h"

namespace MediaProbe {

const QSet<QString>& rawFileExtensions();
const QSet<QString>& photoExtensions();
const QSet<QString>& videoExtensions();
const QSet<QString>& unsupportedVideoExtensions();
QStringList supportedNameFilters();

QString normalizedExtension(const QString &filePath);
bool isRawFile(const QString &filePath);
bool isVideoFile(const QString &filePath);
bool isPhotoFile(const QString &filePath);
bool isMediaFile(const QString &filePath);
MediaFileType fileTypeForPath(const QString &filePath);

QSize imageDimensions(const QString &filePath);
bool rawCaptureDate(const QString &filePath, QDateTime *captureDate, QString *errorMessage = nullptr);

} // namespace MediaProbe

#endif // MEDIAPROBE_H
