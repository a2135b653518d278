#ifndef TRASHBIN_H
#define TRASHBIN_H

#include <QString>

#include "fileoperations.h"
#include "mediatypes.h"

class AssetStore;

class TrashBin
{
public:
    TrashBin(const QString &trashDirectory, AssetStore *store);

    QString trashDirectory() const;
    QString categoryDirectory(Disposition category) const;

    // Places filePath under .trash/<category>/ and records a TrashEntry.
    // originalPath is what the entry reports; it defaults to filePath.
    bool admit(const QString &filePath,
               Disposition category,
               const QString &reason,
               TransferMode mode,
               TrashEntry *entry = nullptr,
               QString *errorMessage = nullptr,
               const QString &originalPath = QString());

    bool ensureCategoryDirectories(QString *errorMessage = nullptr) const;

private:
    QString m_trashDirectory;
    AssetStore *m_store = nullptr;
};

#endif // TRASHBIN_H
