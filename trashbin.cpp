#include "trashbin.h"

#include "assetstore.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>

TrashBin::TrashBin(const QString &trashDirectory, AssetStore *store)
    : m_trashDirectory(trashDirectory)
    , m_store(store)
{
}

QString TrashBin::trashDirectory() const
{
    return m_trashDirectory;
}

QString TrashBin::categoryDirectory(Disposition category) const
{
    return QDir(m_trashDirectory).filePath(dispositionToString(category));
}

bool TrashBin::ensureCategoryDirectories(QString *errorMessage) const
{
    for (Disposition category : rejectionDispositions()) {
        if (!FileOperations::ensureDirectory(categoryDirectory(category), errorMessage)) {
            return false;
        }
    }
    return true;
}

bool TrashBin::admit(const QString &filePath,
                     Disposition category,
                     const QString &reason,
                     TransferMode mode,
                     TrashEntry *entry,
                     QString *errorMessage,
                     const QString &originalPath)
{
    const QString directory = categoryDirectory(category);
    if (!FileOperations::ensureDirectory(directory, errorMessage)) {
        return false;
    }

    const QString reportedPath = originalPath.isEmpty() ? filePath : originalPath;
    const QString destination = FileOperations::uniqueFilePath(directory, QFileInfo(reportedPath).fileName());
    if (!FileOperations::transferFile(filePath, destination, mode, errorMessage)) {
        return false;
    }

    TrashEntry record;
    record.originalPath = reportedPath;
    record.trashPath = QDir(m_trashDirectory).relativeFilePath(destination);
    record.category = category;
    record.reason = reason;
    record.timestamp = QDateTime::currentDateTime();

    if (m_store) {
        QString storeError;
        if (!m_store->recordTrashEntry(&record, &storeError)) {
            // The file itself is safe in the trash; only the log row is missing.
            qWarning() << "Trashed" << reportedPath << "but could not record it:" << storeError;
        }
    }

    qDebug() << "Trashed" << reportedPath << "as" << dispositionToString(category);
    if (entry) {
        *entry = record;
    }
    return true;
}
