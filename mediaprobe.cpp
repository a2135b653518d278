#include "mediaprobe.h"

#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QImageReader>
#include <libraw/libraw.h>

#include <utility>

namespace MediaProbe {

const QSet<QString>& rawFileExtensions() {
    static const QSet<QString> exts = {
        "arw","cr2","cr3","crw","dng","erf","kdc","mrw","nef","nrw","orf","pef",
        "raf","raw","rw2","rwz","sr2","srw","x3f"
    };
    return exts;
}

const QSet<QString>& photoExtensions() {
    static const QSet<QString> exts = {
        "jpg","jpeg","heic","heif","png","gif","bmp","tiff","tif","webp","avif","jp2"
    };
    return exts;
}

const QSet<QString>& videoExtensions() {
    static const QSet<QString> exts = {
        "mov","mp4","m4v","mkv","webm","flv","3gp",
        "mpg","mpeg","vob","ts","mts","avi","wmv"
    };
    return exts;
}

// Containers whose metadata cannot be rewritten by stream copy without
// risking corruption or forcing a re-encode.
const QSet<QString>& unsupportedVideoExtensions() {
    static const QSet<QString> exts = {
        "mpg","mpeg","vob","ts","mts","avi","wmv"
    };
    return exts;
}

QStringList supportedNameFilters() {
    QStringList filters;
    for (const QString &ext : photoExtensions()) filters << "*." + ext;
    for (const QString &ext : videoExtensions()) filters << "*." + ext;
    for (const QString &ext : rawFileExtensions()) filters << "*." + ext;
    filters.sort();
    return filters;
}

QString normalizedExtension(const QString &filePath) {
    return QFileInfo(filePath).suffix().toLower();
}

bool isRawFile(const QString &filePath) {
    return rawFileExtensions().contains(normalizedExtension(filePath));
}

bool isVideoFile(const QString &filePath) {
    return videoExtensions().contains(normalizedExtension(filePath));
}

bool isPhotoFile(const QString &filePath) {
    return photoExtensions().contains(normalizedExtension(filePath));
}

bool isMediaFile(const QString &filePath) {
    return isPhotoFile(filePath) || isVideoFile(filePath) || isRawFile(filePath);
}

MediaFileType fileTypeForPath(const QString &filePath) {
    return isVideoFile(filePath) ? MediaFileType::Video : MediaFileType::Image;
}

QSize imageDimensions(const QString &filePath)
{
    if (isRawFile(filePath)) {
        LibRaw rawProcessor;
        int ret = rawProcessor.open_file(QFile::encodeName(filePath).constData());
        if (ret != LIBRAW_SUCCESS) {
            qDebug() << "LibRaw open_file failed for" << filePath << ":" << libraw_strerror(ret);
            return {};
        }
        int width = rawProcessor.imgdata.sizes.width;
        int height = rawProcessor.imgdata.sizes.height;
        const int flip = rawProcessor.imgdata.sizes.flip;
        if (flip == 5 || flip == 6) {
            std::swap(width, height);
        }
        rawProcessor.recycle();
        return QSize(width, height);
    }

    QImageReader reader(filePath);
    reader.setAutoTransform(true);
    QSize size = reader.size();
    if (!size.isValid()) {
        return {};
    }
    const QImageIOHandler::Transformations transform = reader.transformation();
    if (transform.testFlag(QImageIOHandler::TransformationRotate90)) {
        size.transpose();
    }
    return size;
}

bool rawCaptureDate(const QString &filePath, QDateTime *captureDate, QString *errorMessage)
{
    LibRaw rawProcessor;
    int ret = rawProcessor.open_file(QFile::encodeName(filePath).constData());
    if (ret != LIBRAW_SUCCESS) {
        if (errorMessage) *errorMessage = QStringLiteral("LibRaw open_file failed: %1").arg(QString::fromUtf8(libraw_strerror(ret)));
        return false;
    }
    const time_t timestamp = rawProcessor.imgdata.other.timestamp;
    rawProcessor.recycle();

    if (timestamp <= 0) {
        if (errorMessage) *errorMessage = QStringLiteral("No capture timestamp recorded in %1").arg(filePath);
        return false;
    }
    if (captureDate) {
        *captureDate = QDateTime::fromSecsSinceEpoch(static_cast<qint64>(timestamp));
    }
    return true;
}

} // namespace MediaProbe
