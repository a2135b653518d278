#ifndef FILEOPERATIONS_H
#define FILEOPERATIONS_H

#include <QString>
#include <QStringList>

enum class TransferMode {
    Copy,
    Move
};

namespace FileOperations {

bool ensureDirectory(const QString &directoryPath, QString *errorMessage = nullptr);

// Move falls back to copy + remove when a rename is not possible
// (different filesystems). Never overwrites an existing destination.
bool transferFile(const QString &sourcePath,
                  const QString &destinationPath,
                  TransferMode mode,
                  QString *errorMessage = nullptr);

// Atomically replaces destinationPath with sourcePath (same filesystem).
bool replaceFile(const QString &sourcePath, const QString &destinationPath, QString *errorMessage = nullptr);

// "<dir>/<base>.<ext>", or "<dir>/<base>_N.<ext>" for the first free N.
QString uniqueFilePath(const QString &directoryPath, const QString &fileName);

// Hidden, not-yet-existing path beside filePath carrying the same extension.
QString temporarySiblingPath(const QString &filePath, const QString &tag);

bool isHiddenName(const QString &name);

// Removes empty directories below rootPath, deepest first. Hidden
// directories are never descended into or removed; hidden files such as
// .DS_Store do not keep an otherwise empty directory alive. Passes repeat
// until nothing more is removed or maxPasses is reached.
int removeEmptyDirectories(const QString &rootPath, int maxPasses, QStringList *removedDirectories = nullptr);

// Removes the directory containing filePath and its parents while they are
// empty, stopping at stopAtPath.
void pruneEmptyParents(const QString &filePath, const QString &stopAtPath);

} // namespace FileOperations

#endif // FILEOPERATIONS_H
