#include "assetstore.h"

#include <QDebug>
#include <QSqlError>
#include <QSqlQuery>
#include <QUuid>
#include <QVariant>

namespace {
constexpr auto kAssetColumns = "id, original_filename, current_path, date_taken, content_hash, "
                               "file_size, file_type, width, height";
}

AssetStore::AssetStore() = default;

AssetStore::~AssetStore()
{
    close();
}

bool AssetStore::open(const QString &databasePath, QString *errorMessage)
{
    close();

    m_connectionName = QUuid::createUuid().toString(QUuid::Id128);
    QSqlDatabase db = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), m_connectionName);
    db.setDatabaseName(databasePath);
    db.setConnectOptions(QStringLiteral("QSQLITE_BUSY_TIMEOUT=5000"));

    if (!db.open()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Failed to open library database: %1").arg(db.lastError().text());
        }
        db = QSqlDatabase();
        QSqlDatabase::removeDatabase(m_connectionName);
        m_connectionName.clear();
        return false;
    }

    m_database = db;
    m_databasePath = databasePath;

    if (!initializeSchema(errorMessage)) {
        close();
        return false;
    }
    return true;
}

void AssetStore::close()
{
    if (!m_connectionName.isEmpty()) {
        if (m_database.isOpen()) {
            m_database.close();
        }
        m_database = QSqlDatabase();
        QSqlDatabase::removeDatabase(m_connectionName);
        m_connectionName.clear();
    }
    m_databasePath.clear();
}

bool AssetStore::isOpen() const
{
    return m_database.isValid() && m_database.isOpen();
}

QString AssetStore::databasePath() const
{
    return m_databasePath;
}

bool AssetStore::initializeSchema(QString *errorMessage)
{
    QSqlQuery query(m_database);
    const QStringList statements = {
        QStringLiteral(
            "CREATE TABLE IF NOT EXISTS photos ("
            "id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "original_filename TEXT NOT NULL,"
            "current_path TEXT NOT NULL UNIQUE,"
            "date_taken TEXT,"
            "content_hash TEXT NOT NULL UNIQUE,"
            "file_size INTEGER DEFAULT 0,"
            "file_type TEXT NOT NULL,"
            "width INTEGER DEFAULT 0,"
            "height INTEGER DEFAULT 0,"
            "imported_at TEXT NOT NULL"
            ");"),
        QStringLiteral("CREATE INDEX IF NOT EXISTS idx_photos_date_taken ON photos(date_taken)"),
        QStringLiteral(
            "CREATE TABLE IF NOT EXISTS trash_entries ("
            "id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "original_path TEXT NOT NULL,"
            "trash_path TEXT,"
            "category TEXT NOT NULL,"
            "reason TEXT,"
            "created_at TEXT NOT NULL"
            ");")
    };

    for (const QString &statement : statements) {
        if (!query.exec(statement)) {
            if (errorMessage) {
                *errorMessage = QStringLiteral("Failed to initialize library schema: %1").arg(query.lastError().text());
            }
            return false;
        }
    }
    return true;
}

MediaAsset AssetStore::hydrateAsset(const QSqlRecord &record) const
{
    MediaAsset asset;
    asset.id = record.value(QStringLiteral("id")).toLongLong();
    asset.originalFilename = record.value(QStringLiteral("original_filename")).toString();
    asset.currentPath = record.value(QStringLiteral("current_path")).toString();
    asset.capturedAt = parseCaptureDate(record.value(QStringLiteral("date_taken")).toString());
    asset.contentHash = record.value(QStringLiteral("content_hash")).toString();
    asset.byteSize = record.value(QStringLiteral("file_size")).toLongLong();
    asset.fileType = fileTypeFromString(record.value(QStringLiteral("file_type")).toString());
    asset.width = record.value(QStringLiteral("width")).toInt();
    asset.height = record.value(QStringLiteral("height")).toInt();
    return asset;
}

MediaAsset AssetStore::findOne(const QString &whereClause, const QVariant &value, qint64 excludeAssetId) const
{
    if (!isOpen()) {
        return MediaAsset();
    }

    QSqlQuery query(m_database);
    query.prepare(QStringLiteral("SELECT %1 FROM photos WHERE %2 AND id != ? LIMIT 1")
                      .arg(QString::fromLatin1(kAssetColumns), whereClause));
    query.addBindValue(value);
    query.addBindValue(excludeAssetId);
    if (!query.exec()) {
        qWarning() << "Asset lookup failed:" << query.lastError().text();
        return MediaAsset();
    }
    if (!query.next()) {
        return MediaAsset();
    }
    return hydrateAsset(query.record());
}

MediaAsset AssetStore::findByHash(const QString &contentHash, qint64 excludeAssetId) const
{
    return findOne(QStringLiteral("content_hash = ?"), contentHash, excludeAssetId);
}

MediaAsset AssetStore::findById(qint64 assetId) const
{
    return findOne(QStringLiteral("id = ?"), assetId, -1);
}

MediaAsset AssetStore::findByPath(const QString &relativePath) const
{
    return findOne(QStringLiteral("current_path = ?"), relativePath, -1);
}

bool AssetStore::pathInUse(const QString &relativePath, qint64 excludeAssetId) const
{
    return findOne(QStringLiteral("current_path = ?"), relativePath, excludeAssetId).isValid();
}

QVector<MediaAsset> AssetStore::assets() const
{
    QVector<MediaAsset> result;
    if (!isOpen()) {
        return result;
    }

    QSqlQuery query(m_database);
    if (!query.exec(QStringLiteral("SELECT %1 FROM photos ORDER BY id ASC").arg(QString::fromLatin1(kAssetColumns)))) {
        qWarning() << "Failed to query assets:" << query.lastError().text();
        return result;
    }
    while (query.next()) {
        result.append(hydrateAsset(query.record()));
    }
    return result;
}

int AssetStore::assetCount() const
{
    if (!isOpen()) {
        return 0;
    }
    QSqlQuery query(m_database);
    if (!query.exec(QStringLiteral("SELECT COUNT(*) FROM photos")) || !query.next()) {
        qWarning() << "Failed to count assets:" << query.lastError().text();
        return 0;
    }
    return query.value(0).toInt();
}

bool AssetStore::insertAsset(MediaAsset *asset, QString *errorMessage)
{
    if (!asset || !isOpen()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("No open library to insert into.");
        }
        return false;
    }

    QSqlQuery insert(m_database);
    insert.prepare(QStringLiteral(
        "INSERT INTO photos (original_filename, current_path, date_taken, content_hash, file_size, "
        "file_type, width, height, imported_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)"));
    insert.addBindValue(asset->originalFilename);
    insert.addBindValue(asset->currentPath);
    insert.addBindValue(formatCaptureDate(asset->capturedAt));
    insert.addBindValue(asset->contentHash);
    insert.addBindValue(asset->byteSize);
    insert.addBindValue(fileTypeToString(asset->fileType));
    insert.addBindValue(asset->width);
    insert.addBindValue(asset->height);
    insert.addBindValue(QDateTime::currentDateTimeUtc().toString(Qt::ISODate));

    if (!insert.exec()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Failed to insert asset record: %1").arg(insert.lastError().text());
        }
        return false;
    }

    asset->id = insert.lastInsertId().toLongLong();
    return true;
}

bool AssetStore::updateAsset(const MediaAsset &asset, QString *errorMessage)
{
    if (!isOpen() || !asset.isValid()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Cannot update asset %1.").arg(asset.id);
        }
        return false;
    }

    QSqlQuery update(m_database);
    update.prepare(QStringLiteral(
        "UPDATE photos SET current_path = ?, date_taken = ?, content_hash = ?, file_size = ?, "
        "width = ?, height = ? WHERE id = ?"));
    update.addBindValue(asset.currentPath);
    update.addBindValue(formatCaptureDate(asset.capturedAt));
    update.addBindValue(asset.contentHash);
    update.addBindValue(asset.byteSize);
    update.addBindValue(asset.width);
    update.addBindValue(asset.height);
    update.addBindValue(asset.id);

    if (!update.exec()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Failed to update asset %1: %2").arg(asset.id).arg(update.lastError().text());
        }
        return false;
    }
    if (update.numRowsAffected() != 1) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Asset %1 no longer exists.").arg(asset.id);
        }
        return false;
    }
    return true;
}

bool AssetStore::deleteAsset(qint64 assetId, QString *errorMessage)
{
    if (!isOpen()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("No open library.");
        }
        return false;
    }

    QSqlQuery remove(m_database);
    remove.prepare(QStringLiteral("DELETE FROM photos WHERE id = ?"));
    remove.addBindValue(assetId);
    if (!remove.exec()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Failed to delete asset %1: %2").arg(assetId).arg(remove.lastError().text());
        }
        return false;
    }
    return true;
}

bool AssetStore::recordTrashEntry(TrashEntry *entry, QString *errorMessage)
{
    if (!entry || !isOpen()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("No open library to record trash entry.");
        }
        return false;
    }

    if (!entry->timestamp.isValid()) {
        entry->timestamp = QDateTime::currentDateTime();
    }

    QSqlQuery insert(m_database);
    insert.prepare(QStringLiteral(
        "INSERT INTO trash_entries (original_path, trash_path, category, reason, created_at) "
        "VALUES (?, ?, ?, ?, ?)"));
    insert.addBindValue(entry->originalPath);
    insert.addBindValue(entry->trashPath);
    insert.addBindValue(dispositionToString(entry->category));
    insert.addBindValue(entry->reason);
    insert.addBindValue(entry->timestamp.toString(Qt::ISODate));

    if (!insert.exec()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Failed to record trash entry: %1").arg(insert.lastError().text());
        }
        return false;
    }
    entry->id = insert.lastInsertId().toLongLong();
    return true;
}

bool AssetStore::deleteTrashEntry(qint64 entryId, QString *errorMessage)
{
    if (!isOpen()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("No open library.");
        }
        return false;
    }

    QSqlQuery remove(m_database);
    remove.prepare(QStringLiteral("DELETE FROM trash_entries WHERE id = ?"));
    remove.addBindValue(entryId);
    if (!remove.exec()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Failed to delete trash entry %1: %2").arg(entryId).arg(remove.lastError().text());
        }
        return false;
    }
    return true;
}

QVector<TrashEntry> AssetStore::trashEntries() const
{
    return queryTrashEntries(QString(), QVariant());
}

TrashEntry AssetStore::latestTrashEntryFor(const QString &originalPath) const
{
    const QVector<TrashEntry> entries = queryTrashEntries(QStringLiteral("original_path = ?"), originalPath);
    return entries.isEmpty() ? TrashEntry() : entries.last();
}

QVector<TrashEntry> AssetStore::queryTrashEntries(const QString &whereClause, const QVariant &value) const
{
    QVector<TrashEntry> result;
    if (!isOpen()) {
        return result;
    }

    QSqlQuery query(m_database);
    QString sql = QStringLiteral("SELECT id, original_path, trash_path, category, reason, created_at FROM trash_entries");
    if (!whereClause.isEmpty()) {
        sql += QStringLiteral(" WHERE ") + whereClause;
    }
    sql += QStringLiteral(" ORDER BY id ASC");
    query.prepare(sql);
    if (!whereClause.isEmpty()) {
        query.addBindValue(value);
    }
    if (!query.exec()) {
        qWarning() << "Failed to query trash entries:" << query.lastError().text();
        return result;
    }
    while (query.next()) {
        TrashEntry entry;
        entry.id = query.value(0).toLongLong();
        entry.originalPath = query.value(1).toString();
        entry.trashPath = query.value(2).toString();
        entry.category = dispositionFromString(query.value(3).toString());
        entry.reason = query.value(4).toString();
        entry.timestamp = QDateTime::fromString(query.value(5).toString(), Qt::ISODate);
        result.append(entry);
    }
    return result;
}
