#include "ingestiontransaction.h"

#include "assetstore.h"
#include "contenthasher.h"
#include "librarycontext.h"
#include "mediaprobe.h"
#include "metadatatool.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QUuid>

QString ingestionStateToString(IngestionState state)
{
    switch (state) {
    case IngestionState::Pending:
        return QStringLiteral("pending");
    case IngestionState::Staged:
        return QStringLiteral("staged");
    case IngestionState::Normalized:
        return QStringLiteral("normalized");
    case IngestionState::Rehashed:
        return QStringLiteral("rehashed");
    case IngestionState::Committed:
        return QStringLiteral("committed");
    case IngestionState::DuplicateDetected:
        return QStringLiteral("duplicate_detected");
    case IngestionState::RolledBack:
        return QStringLiteral("rolled_back");
    }
    return QStringLiteral("pending");
}

IngestionTransaction::IngestionTransaction(LibraryContext *context, const QString &sourcePath, TransferMode stageMode)
    : m_context(context)
    , m_sourcePath(QFileInfo(sourcePath).absoluteFilePath())
    , m_stageMode(stageMode)
{
    QString stagedName = QUuid::createUuid().toString(QUuid::Id128);
    const QString extension = MediaProbe::normalizedExtension(sourcePath);
    if (!extension.isEmpty()) {
        stagedName.append(QLatin1Char('.')).append(extension);
    }
    if (m_context) {
        m_stagedPath = QDir(m_context->stagingDirectory()).filePath(stagedName);
    }
}

void IngestionTransaction::setCaptureDate(const QDateTime &captureDate)
{
    m_captureDate = captureDate;
}

void IngestionTransaction::setObserver(TransactionObserver *observer)
{
    m_observer = observer;
}

QString IngestionTransaction::sourcePath() const
{
    return m_sourcePath;
}

QString IngestionTransaction::stagedPath() const
{
    return m_stagedPath;
}

IngestionState IngestionTransaction::state() const
{
    return m_state;
}

IngestionOutcome IngestionTransaction::run()
{
    IngestionOutcome outcome;
    if (!m_context || !m_context->isOpen()) {
        m_state = IngestionState::RolledBack;
        outcome.state = m_state;
        outcome.disposition = Disposition::Corrupted;
        outcome.message = QStringLiteral("No open library");
        return outcome;
    }

    const QFileInfo sourceInfo(m_sourcePath);
    if (!sourceInfo.exists() || !sourceInfo.isFile()) {
        m_state = IngestionState::RolledBack;
        outcome.state = m_state;
        outcome.disposition = Disposition::Corrupted;
        outcome.message = QStringLiteral("File not found: %1").arg(m_sourcePath);
        return outcome;
    }
    if (!sourceInfo.isReadable()) {
        return rejectSource(Disposition::PermissionDenied, QStringLiteral("File is not readable"));
    }

    const ToolFailure gate = m_context->normalizer().checkFormat(m_sourcePath);
    if (gate.category != Disposition::None) {
        return rejectSource(gate.category, gate.message);
    }

    // Pre-normalization check: never touch the library for known content.
    const DedupeCheck before = rehashAndCheck(*m_context->store(), m_sourcePath);
    if (!before.hashed) {
        return rejectSource(Disposition::Corrupted, before.errorMessage);
    }
    if (before.isDuplicate()) {
        return rejectSource(Disposition::Duplicate,
                            QStringLiteral("Already in library as %1").arg(before.conflict.currentPath));
    }

    QDateTime captureDate = m_captureDate;
    if (!captureDate.isValid()) {
        QString dateError;
        captureDate = m_context->extractor().extract(m_sourcePath, nullptr, &dateError);
        if (!captureDate.isValid()) {
            return rejectSource(Disposition::Corrupted, dateError);
        }
    }

    if (m_observer) {
        m_observer->aboutToStage(m_sourcePath, m_stagedPath);
    }
    QString stageError;
    if (!FileOperations::transferFile(m_sourcePath, m_stagedPath, m_stageMode, &stageError)) {
        // The source is still where it was.
        m_state = IngestionState::RolledBack;
        outcome.state = m_state;
        outcome.disposition = Disposition::PermissionDenied;
        outcome.message = stageError;
        return outcome;
    }
    m_state = IngestionState::Staged;

    ToolFailure normalizeFailure;
    if (!m_context->normalizer().normalize(m_stagedPath, captureDate, &normalizeFailure)) {
        return rollBack(normalizeFailure.category, normalizeFailure.message);
    }
    m_state = IngestionState::Normalized;

    const DedupeCheck after = rehashAndCheck(*m_context->store(), m_stagedPath);
    if (!after.hashed) {
        return rollBack(Disposition::Corrupted, after.errorMessage);
    }
    m_state = IngestionState::Rehashed;
    if (after.isDuplicate()) {
        return trashStaged(Disposition::Duplicate,
                           QStringLiteral("Identical after normalization to %1").arg(after.conflict.currentPath),
                           IngestionState::DuplicateDetected);
    }

    const QString extension = MediaProbe::normalizedExtension(m_sourcePath);
    const PathDeriver::DerivedPath target = canonicalPathFor(*m_context, captureDate, after.contentHash, extension);
    const QString finalPath = m_context->absolutePath(target.relativePath());

    if (m_observer) {
        m_observer->aboutToCommit(m_sourcePath, finalPath, after.contentHash);
    }
    QString placeError;
    if (!FileOperations::transferFile(m_stagedPath, finalPath, TransferMode::Move, &placeError)) {
        return rollBack(Disposition::PermissionDenied, placeError);
    }

    MediaAsset asset;
    asset.contentHash = after.contentHash;
    asset.currentPath = target.relativePath();
    asset.originalFilename = sourceInfo.fileName();
    asset.capturedAt = captureDate;
    asset.fileType = MediaProbe::fileTypeForPath(m_sourcePath);
    asset.byteSize = QFileInfo(finalPath).size();
    const QSize dimensions = dimensionsFor(*m_context, finalPath);
    asset.width = dimensions.width() > 0 ? dimensions.width() : 0;
    asset.height = dimensions.height() > 0 ? dimensions.height() : 0;

    if (m_observer) {
        m_observer->aboutToRecord(m_sourcePath, finalPath);
    }
    QString storeError;
    if (!m_context->store()->insertAsset(&asset, &storeError)) {
        // Filesystem first, record second: undo the placement.
        QString undoError;
        if (!FileOperations::transferFile(finalPath, m_stagedPath, TransferMode::Move, &undoError)) {
            qWarning() << "Unable to withdraw" << finalPath << "after failed insert:" << undoError;
            m_state = IngestionState::RolledBack;
            IngestionOutcome stranded;
            stranded.state = m_state;
            stranded.disposition = Disposition::PermissionDenied;
            stranded.message = QStringLiteral("%1; file stranded at %2 without a record: %3")
                                   .arg(storeError, finalPath, undoError);
            return stranded;
        }
        if (storeError.contains(QLatin1String("UNIQUE")) && storeError.contains(QLatin1String("content_hash"))) {
            return trashStaged(Disposition::Duplicate, storeError, IngestionState::DuplicateDetected);
        }
        return rollBack(Disposition::Corrupted, storeError);
    }

    m_state = IngestionState::Committed;
    outcome.state = m_state;
    outcome.asset = asset;
    qDebug() << "Committed" << m_sourcePath << "as" << asset.currentPath;
    return outcome;
}

IngestionOutcome IngestionTransaction::rejectSource(Disposition category, const QString &message)
{
    IngestionOutcome outcome;
    m_state = category == Disposition::Duplicate ? IngestionState::DuplicateDetected : IngestionState::RolledBack;
    outcome.state = m_state;
    outcome.disposition = category;
    outcome.message = message;

    QString trashError;
    if (!m_context->trash()->admit(m_sourcePath, category, message, m_stageMode, &outcome.trashEntry, &trashError)) {
        qWarning() << "Rejected file left in place:" << m_sourcePath << trashError;
    }
    return outcome;
}

IngestionOutcome IngestionTransaction::rollBack(Disposition category, const QString &message)
{
    if (m_stageMode == TransferMode::Move) {
        // The staged file is the only copy of the source.
        return trashStaged(category, message, IngestionState::RolledBack);
    }

    if (QFileInfo::exists(m_stagedPath) && !QFile::remove(m_stagedPath)) {
        qWarning() << "Unable to remove staged file" << m_stagedPath;
    }
    return rejectSource(category == Disposition::None ? Disposition::Corrupted : category, message);
}

IngestionOutcome IngestionTransaction::trashStaged(Disposition category, const QString &message, IngestionState finalState)
{
    IngestionOutcome outcome;
    m_state = finalState;
    outcome.state = finalState;
    outcome.disposition = category == Disposition::None ? Disposition::Corrupted : category;
    outcome.message = message;

    QString trashError;
    if (!m_context->trash()->admit(m_stagedPath, outcome.disposition, message, TransferMode::Move,
                                   &outcome.trashEntry, &trashError, m_sourcePath)) {
        qWarning() << "Unable to trash staged file" << m_stagedPath << ":" << trashError;
    }
    return outcome;
}

DedupeCheck IngestionTransaction::rehashAndCheck(const AssetStore &store, const QString &filePath, qint64 excludeAssetId)
{
    DedupeCheck check;
    check.contentHash = ContentHasher::hashFile(filePath, &check.errorMessage);
    if (check.contentHash.isEmpty()) {
        return check;
    }
    check.hashed = true;
    check.conflict = store.findByHash(check.contentHash, excludeAssetId);
    return check;
}

PathDeriver::DerivedPath IngestionTransaction::canonicalPathFor(const LibraryContext &context,
                                                                const QDateTime &captureDate,
                                                                const QString &contentHash,
                                                                const QString &extension,
                                                                qint64 excludeAssetId)
{
    return PathDeriver::derive(captureDate, contentHash, extension, [&context, excludeAssetId](const QString &relativePath) {
        const MediaAsset holder = context.store()->findByPath(relativePath);
        if (holder.isValid()) {
            return holder.id != excludeAssetId;
        }
        return QFileInfo::exists(context.absolutePath(relativePath));
    });
}

QSize IngestionTransaction::dimensionsFor(const LibraryContext &context, const QString &filePath)
{
    if (MediaProbe::isVideoFile(filePath)) {
        const MetadataTool *tool = context.videoTool();
        return tool ? tool->readDimensions(filePath) : QSize();
    }
    return MediaProbe::imageDimensions(filePath);
}
