#ifndef TREEWALKER_H
#define TREEWALKER_H

#include <QFileInfo>
#include <QString>
#include <QStringList>

#include <functional>
#include <vector>

class TreeWalker
{
public:
    // Returns true for entries that must be skipped. A matching directory is
    // pruned together with everything below it.
    using Predicate = std::function<bool(const QFileInfo &info)>;

    explicit TreeWalker(const QString &rootPath);

    void setExclusion(const Predicate &isExcluded);

    // Files in deterministic (name-sorted, depth-first) order.
    QStringList files() const;
    // Directories below the root, parents before children.
    QStringList directories() const;

    static Predicate hiddenEntries();
    static Predicate symlinks();
    static Predicate rawFiles();
    static Predicate anyOf(const std::vector<Predicate> &predicates);

private:
    void walk(const QString &directoryPath, QStringList *files, QStringList *directories) const;

    QString m_rootPath;
    Predicate m_isExcluded;
};

#endif // TREEWALKER_H
