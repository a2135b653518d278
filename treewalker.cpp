#include "treewalker.h"

#include "mediaprobe.h"

#include <QDir>

TreeWalker::TreeWalker(const QString &rootPath)
    : m_rootPath(QDir(rootPath).absolutePath())
{
}

void TreeWalker::setExclusion(const Predicate &isExcluded)
{
    m_isExcluded = isExcluded;
}

QStringList TreeWalker::files() const
{
    QStringList result;
    walk(m_rootPath, &result, nullptr);
    return result;
}

QStringList TreeWalker::directories() const
{
    QStringList result;
    walk(m_rootPath, nullptr, &result);
    return result;
}

void TreeWalker::walk(const QString &directoryPath, QStringList *files, QStringList *directories) const
{
    QDir dir(directoryPath);
    const QFileInfoList entries = dir.entryInfoList(QDir::AllEntries | QDir::Hidden | QDir::System | QDir::NoDotAndDotDot,
                                                    QDir::Name);
    for (const QFileInfo &entry : entries) {
        if (m_isExcluded && m_isExcluded(entry)) {
            continue;
        }
        if (entry.isDir()) {
            // Directory links are never followed.
            if (entry.isSymLink()) {
                continue;
            }
            if (directories) {
                directories->append(entry.absoluteFilePath());
            }
            walk(entry.absoluteFilePath(), files, directories);
        } else if (files) {
            files->append(entry.absoluteFilePath());
        }
    }
}

TreeWalker::Predicate TreeWalker::hiddenEntries()
{
    return [](const QFileInfo &info) {
        return info.fileName().startsWith(QLatin1Char('.'));
    };
}

TreeWalker::Predicate TreeWalker::symlinks()
{
    return [](const QFileInfo &info) {
        return info.isSymLink();
    };
}

TreeWalker::Predicate TreeWalker::rawFiles()
{
    return [](const QFileInfo &info) {
        return !info.isDir() && MediaProbe::isRawFile(info.fileName());
    };
}

TreeWalker::Predicate TreeWalker::anyOf(const std::vector<Predicate> &predicates)
{
    return [predicates](const QFileInfo &info) {
        for (const Predicate &predicate : predicates) {
            if (predicate && predicate(info)) {
                return true;
            }
        }
        return false;
    };
}
