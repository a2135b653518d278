#include "contenthasher.h"

#include <QCryptographicHash>
#include <QFile>

namespace ContentHasher {

QString hashFile(const QString &filePath, QString *errorMessage)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Unable to read %1: %2").arg(filePath, file.errorString());
        }
        return QString();
    }

    QCryptographicHash hash(QCryptographicHash::Sha256);
    while (!file.atEnd()) {
        const QByteArray chunk = file.read(kChunkSize);
        if (chunk.isEmpty()) {
            if (file.error() != QFileDevice::NoError) {
                if (errorMessage) {
                    *errorMessage = QStringLiteral("Read error while hashing %1: %2").arg(filePath, file.errorString());
                }
                return QString();
            }
            break;
        }
        hash.addData(chunk);
    }

    return QString::fromLatin1(hash.result().toHex());
}

QString shortHash(const QString &contentHash)
{
    return contentHash.left(kShortHashLength).toLower();
}

} // namespace ContentHasher
