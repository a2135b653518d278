#include "fileoperations.h"

#include "treewalker.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QUuid>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>

namespace FileOperations {

bool ensureDirectory(const QString &directoryPath, QString *errorMessage)
{
    QDir dir(directoryPath);
    if (dir.exists()) {
        return true;
    }
    if (!dir.mkpath(QStringLiteral("."))) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Unable to create directory %1").arg(directoryPath);
        }
        return false;
    }
    return true;
}

bool transferFile(const QString &sourcePath, const QString &destinationPath, TransferMode mode, QString *errorMessage)
{
    if (QFileInfo::exists(destinationPath)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Destination already exists: %1").arg(destinationPath);
        }
        return false;
    }
    if (!ensureDirectory(QFileInfo(destinationPath).absolutePath(), errorMessage)) {
        return false;
    }

    if (mode == TransferMode::Move) {
        QFile source(sourcePath);
        if (source.rename(destinationPath)) {
            return true;
        }
        qDebug() << "Rename failed, falling back to copy for" << sourcePath << ":" << source.errorString();
    }

    QFile source(sourcePath);
    if (!source.copy(destinationPath)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Failed to copy %1 to %2: %3").arg(sourcePath, destinationPath, source.errorString());
        }
        return false;
    }

    if (QFileInfo(destinationPath).size() != QFileInfo(sourcePath).size()) {
        QFile::remove(destinationPath);
        if (errorMessage) {
            *errorMessage = QStringLiteral("Incomplete copy of %1").arg(sourcePath);
        }
        return false;
    }

    if (mode == TransferMode::Move && !QFile::remove(sourcePath)) {
        QFile::remove(destinationPath);
        if (errorMessage) {
            *errorMessage = QStringLiteral("Unable to remove %1 after copying it").arg(sourcePath);
        }
        return false;
    }
    return true;
}

bool replaceFile(const QString &sourcePath, const QString &destinationPath, QString *errorMessage)
{
    if (std::rename(QFile::encodeName(sourcePath).constData(), QFile::encodeName(destinationPath).constData()) != 0) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Unable to replace %1: %2")
                                .arg(destinationPath, QString::fromLocal8Bit(std::strerror(errno)));
        }
        return false;
    }
    return true;
}

QString uniqueFilePath(const QString &directoryPath, const QString &fileName)
{
    const QDir dir(directoryPath);
    QString candidate = dir.filePath(fileName);
    if (!QFileInfo::exists(candidate)) {
        return candidate;
    }

    const QFileInfo info(fileName);
    const QString base = info.completeBaseName();
    const QString suffix = info.suffix();
    for (int counter = 1;; ++counter) {
        const QString name = suffix.isEmpty()
            ? QStringLiteral("%1_%2").arg(base).arg(counter)
            : QStringLiteral("%1_%2.%3").arg(base).arg(counter).arg(suffix);
        candidate = dir.filePath(name);
        if (!QFileInfo::exists(candidate)) {
            return candidate;
        }
    }
}

QString temporarySiblingPath(const QString &filePath, const QString &tag)
{
    const QFileInfo info(filePath);
    const QString suffix = info.suffix();
    QString candidate;
    do {
        QString name = QStringLiteral(".%1.%2-%3").arg(info.completeBaseName(), tag,
                                                       QUuid::createUuid().toString(QUuid::Id128).left(12));
        if (!suffix.isEmpty()) {
            name.append(QLatin1Char('.')).append(suffix);
        }
        candidate = info.dir().filePath(name);
    } while (QFileInfo::exists(candidate));
    return candidate;
}

bool isHiddenName(const QString &name)
{
    return name.startsWith(QLatin1Char('.'));
}

namespace {

bool removeIfEmpty(const QString &directoryPath)
{
    QDir dir(directoryPath);
    const QFileInfoList entries = dir.entryInfoList(QDir::AllEntries | QDir::Hidden | QDir::System | QDir::NoDotAndDotDot);
    for (const QFileInfo &entry : entries) {
        if (entry.isDir() || !isHiddenName(entry.fileName())) {
            return false;
        }
    }
    for (const QFileInfo &entry : entries) {
        if (!QFile::remove(entry.absoluteFilePath())) {
            qWarning() << "Unable to remove" << entry.absoluteFilePath();
            return false;
        }
    }
    return QDir().rmdir(dir.absolutePath());
}

}

int removeEmptyDirectories(const QString &rootPath, int maxPasses, QStringList *removedDirectories)
{
    TreeWalker walker(rootPath);
    walker.setExclusion(TreeWalker::anyOf({TreeWalker::hiddenEntries(), TreeWalker::symlinks()}));

    int totalRemoved = 0;
    for (int pass = 0; pass < maxPasses; ++pass) {
        QStringList directories = walker.directories();
        std::reverse(directories.begin(), directories.end());

        int removedThisPass = 0;
        for (const QString &directory : std::as_const(directories)) {
            if (removeIfEmpty(directory)) {
                ++removedThisPass;
                if (removedDirectories) {
                    removedDirectories->append(directory);
                }
            }
        }

        totalRemoved += removedThisPass;
        if (removedThisPass == 0) {
            break;
        }
    }
    return totalRemoved;
}

void pruneEmptyParents(const QString &filePath, const QString &stopAtPath)
{
    const QString stopAt = QDir::cleanPath(QDir(stopAtPath).absolutePath());
    QString current = QDir::cleanPath(QFileInfo(filePath).absolutePath());
    while (current.startsWith(stopAt + QLatin1Char('/')) && current != stopAt) {
        QDir dir(current);
        if (!dir.isEmpty(QDir::AllEntries | QDir::Hidden | QDir::System | QDir::NoDotAndDotDot)) {
            break;
        }
        if (!QDir().rmdir(current)) {
            break;
        }
        current = QFileInfo(current).absolutePath();
    }
}

} // namespace FileOperations
