#ifndef ASSETSTORE_H
#define ASSETSTORE_H

#include <QSqlDatabase>
#include <QSqlRecord>
#include <QString>
#include <QVector>

#include "mediatypes.h"

// SQLite-backed record of active assets and trash entries. Each instance owns
// its own named connection, so a worker thread opens its own store.
class AssetStore
{
public:
    AssetStore();
    ~AssetStore();

    bool open(const QString &databasePath, QString *errorMessage = nullptr);
    void close();
    bool isOpen() const;
    QString databasePath() const;

    MediaAsset findByHash(const QString &contentHash, qint64 excludeAssetId = -1) const;
    MediaAsset findById(qint64 assetId) const;
    MediaAsset findByPath(const QString &relativePath) const;
    bool pathInUse(const QString &relativePath, qint64 excludeAssetId = -1) const;
    QVector<MediaAsset> assets() const;
    int assetCount() const;

    bool insertAsset(MediaAsset *asset, QString *errorMessage = nullptr);
    bool updateAsset(const MediaAsset &asset, QString *errorMessage = nullptr);
    bool deleteAsset(qint64 assetId, QString *errorMessage = nullptr);

    bool recordTrashEntry(TrashEntry *entry, QString *errorMessage = nullptr);
    bool deleteTrashEntry(qint64 entryId, QString *errorMessage = nullptr);
    QVector<TrashEntry> trashEntries() const;
    // Most recent entry whose original_path matches; invalid id when none.
    TrashEntry latestTrashEntryFor(const QString &originalPath) const;

private:
    Q_DISABLE_COPY(AssetStore)

    bool initializeSchema(QString *errorMessage);
    MediaAsset hydrateAsset(const QSqlRecord &record) const;
    MediaAsset findOne(const QString &whereClause, const QVariant &value, qint64 excludeAssetId) const;
    QVector<TrashEntry> queryTrashEntries(const QString &whereClause, const QVariant &value) const;

    QString m_databasePath;
    QString m_connectionName;
    QSqlDatabase m_database;
};

#endif // ASSETSTORE_H
