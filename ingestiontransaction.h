#ifndef INGESTIONTRANSACTION_H
#define INGESTIONTRANSACTION_H

#include <QDateTime>
#include <QSize>
#include <QString>

#include "fileoperations.h"
#include "mediatypes.h"
#include "pathderiver.h"
#include "toolrunner.h"

class AssetStore;
class LibraryContext;

enum class IngestionState {
    Pending,
    Staged,
    Normalized,
    Rehashed,
    Committed,
    DuplicateDetected,
    RolledBack
};

QString ingestionStateToString(IngestionState state);

struct IngestionOutcome
{
    IngestionState state = IngestionState::Pending;
    Disposition disposition = Disposition::None;
    QString message;
    MediaAsset asset;           // valid once committed
    TrashEntry trashEntry;      // set when the file went to the trash

    bool committed() const { return state == IngestionState::Committed; }
};

// Hooks called before each risky filesystem mutation of a transaction.
class TransactionObserver
{
public:
    virtual ~TransactionObserver() = default;
    virtual void aboutToStage(const QString &sourcePath, const QString &stagedPath) = 0;
    virtual void aboutToCommit(const QString &sourcePath, const QString &finalPath, const QString &contentHash) = 0;
    // The file sits at finalPath; its record is written next.
    virtual void aboutToRecord(const QString &sourcePath, const QString &finalPath)
    {
        Q_UNUSED(sourcePath);
        Q_UNUSED(finalPath);
    }
};

struct DedupeCheck
{
    bool hashed = false;
    QString contentHash;
    MediaAsset conflict;
    QString errorMessage;

    bool isDuplicate() const { return conflict.isValid(); }
};

// One file's path into the library:
// hash-check -> stage -> normalize -> rehash -> dedupe-check -> commit.
class IngestionTransaction
{
public:
    IngestionTransaction(LibraryContext *context, const QString &sourcePath, TransferMode stageMode);

    void setCaptureDate(const QDateTime &captureDate);
    void setObserver(TransactionObserver *observer);

    QString sourcePath() const;
    QString stagedPath() const;
    IngestionState state() const;

    IngestionOutcome run();

    // Hash filePath and look for another active asset with that content.
    static DedupeCheck rehashAndCheck(const AssetStore &store, const QString &filePath, qint64 excludeAssetId = -1);

    // First free canonical location, ignoring the location held by
    // excludeAssetId.
    static PathDeriver::DerivedPath canonicalPathFor(const LibraryContext &context,
                                                     const QDateTime &captureDate,
                                                     const QString &contentHash,
                                                     const QString &extension,
                                                     qint64 excludeAssetId = -1);

    static QSize dimensionsFor(const LibraryContext &context, const QString &filePath);

private:
    IngestionOutcome rejectSource(Disposition category, const QString &message);
    IngestionOutcome rollBack(Disposition category, const QString &message);
    IngestionOutcome trashStaged(Disposition category, const QString &message, IngestionState finalState);

    LibraryContext *m_context = nullptr;
    QString m_sourcePath;
    QString m_stagedPath;
    TransferMode m_stageMode = TransferMode::Copy;
    QDateTime m_captureDate;
    TransactionObserver *m_observer = nullptr;
    IngestionState m_state = IngestionState::Pending;
};

#endif // INGESTIONTRANSACTION_H
