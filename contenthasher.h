#ifndef CONTENTHASHER_H
#define CONTENTHASHER_H

#include <QString>

namespace ContentHasher {

constexpr qint64 kChunkSize = 1024 * 1024;
constexpr int kShortHashLength = 8;

// Returns the lowercase hex SHA-256 digest of the file contents, or an empty
// string when the file cannot be read.
QString hashFile(const QString &filePath, QString *errorMessage = nullptr);
QString shortHash(const QString &contentHash);

} // namespace ContentHasher

#endif // CONTENTHASHER_H
