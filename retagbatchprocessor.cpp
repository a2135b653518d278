#include "retagbatchprocessor.h"

#include "assetstore.h"
#include "fileoperations.h"
#include "ingestiontransaction.h"
#include "librarycontext.h"
#include "mediaprobe.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QUuid>

#include <algorithm>

QString retagModeToString(RetagMode mode)
{
    switch (mode) {
    case RetagMode::Same:
        return QStringLiteral("same");
    case RetagMode::Shift:
        return QStringLiteral("shift");
    case RetagMode::Sequence:
        return QStringLiteral("sequence");
    }
    return QStringLiteral("same");
}

RetagMode retagModeFromString(const QString &value, bool *ok)
{
    if (ok) {
        *ok = true;
    }
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("same")) {
        return RetagMode::Same;
    }
    if (normalized == QLatin1String("shift")) {
        return RetagMode::Shift;
    }
    if (normalized == QLatin1String("sequence")) {
        return RetagMode::Sequence;
    }
    if (ok) {
        *ok = false;
    }
    return RetagMode::Same;
}

RetagBatchProcessor::RetagBatchProcessor(LibraryContext *context)
    : m_context(context)
{
    if (m_context) {
        m_throttle.everyFiles = m_context->config().progressEveryFiles;
        m_throttle.intervalMs = m_context->config().progressIntervalMs;
    }
}

void RetagBatchProcessor::setThrottle(const ThrottleSettings &throttle)
{
    m_throttle = throttle;
}

QHash<qint64, QDateTime> RetagBatchProcessor::planTargetDates(const QVector<MediaAsset> &assets, const RetagRequest &request)
{
    QHash<qint64, QDateTime> targets;
    if (assets.isEmpty()) {
        return targets;
    }

    switch (request.mode) {
    case RetagMode::Same:
        for (const MediaAsset &asset : assets) {
            targets.insert(asset.id, request.newDate);
        }
        break;
    case RetagMode::Shift: {
        const QDateTime anchor = assets.first().capturedAt;
        const qint64 offset = anchor.isValid() ? anchor.secsTo(request.newDate) : 0;
        for (const MediaAsset &asset : assets) {
            targets.insert(asset.id, asset.capturedAt.isValid() ? asset.capturedAt.addSecs(offset) : request.newDate);
        }
        break;
    }
    case RetagMode::Sequence: {
        QVector<MediaAsset> ordered = assets;
        std::stable_sort(ordered.begin(), ordered.end(), [](const MediaAsset &a, const MediaAsset &b) {
            if (a.capturedAt != b.capturedAt) {
                return a.capturedAt < b.capturedAt;
            }
            return a.id < b.id;
        });
        const qint64 interval = qMax(0, request.intervalSeconds);
        for (int i = 0; i < ordered.size(); ++i) {
            targets.insert(ordered.at(i).id, request.newDate.addSecs(interval * i));
        }
        break;
    }
    }
    return targets;
}

bool RetagBatchProcessor::run(const RetagRequest &request,
                              ProgressSink *sink,
                              const std::shared_ptr<CancellationToken> &token,
                              OperationSummary *summary,
                              QString *errorMessage)
{
    if (!m_context || !m_context->isOpen()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("No library is open");
        }
        return false;
    }
    if (!request.newDate.isValid()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Invalid capture date");
        }
        return false;
    }

    QVector<qint64> requested;
    for (qint64 id : request.assetIds) {
        if (!requested.contains(id)) {
            requested.append(id);
        }
    }

    if (!requested.isEmpty() && !m_context->backupDatabase(QStringLiteral("retag"), errorMessage)) {
        return false;
    }

    QVector<MediaAsset> found;
    QHash<qint64, MediaAsset> byId;
    for (qint64 id : requested) {
        const MediaAsset asset = m_context->store()->findById(id);
        if (asset.isValid()) {
            found.append(asset);
            byId.insert(id, asset);
        }
    }
    const QHash<qint64, QDateTime> targets = planTargetDates(found, request);

    QVector<qint64> order = requested;
    std::sort(order.begin(), order.end());

    ProgressReporter reporter(OperationKind::Retag, sink, m_throttle);
    reporter.start(order.size());

    for (qint64 id : order) {
        if (isCancelled(token)) {
            reporter.summary().cancelled = true;
            qDebug() << "Retag cancelled after" << reporter.summary().current << "of" << order.size() << "assets";
            break;
        }

        const auto it = byId.constFind(id);
        if (it == byId.constEnd()) {
            const QString label = QStringLiteral("asset #%1").arg(id);
            reporter.fileStarted(label);
            reporter.reject(label, Disposition::Corrupted, QStringLiteral("Asset %1 does not exist").arg(id));
            reporter.fileFinished();
            continue;
        }

        reporter.fileStarted(it->currentPath);
        // Earlier assets in this batch may have changed the store; reload.
        const MediaAsset current = m_context->store()->findById(id);
        if (!current.isValid()) {
            reporter.reject(it->currentPath, Disposition::Corrupted, QStringLiteral("Asset %1 disappeared").arg(id));
        } else {
            retagAsset(current, targets.value(id, request.newDate), &reporter);
        }
        reporter.fileFinished();
    }

    reporter.complete();
    if (summary) {
        *summary = reporter.summary();
    }
    return true;
}

void RetagBatchProcessor::retagAsset(const MediaAsset &asset, const QDateTime &targetDate, ProgressReporter *reporter)
{
    const QString currentPath = m_context->absolutePath(asset.currentPath);
    if (!QFileInfo::exists(currentPath)) {
        reporter->reject(asset.currentPath, Disposition::Corrupted, QStringLiteral("File is missing from the library"));
        return;
    }

    const QString extension = MediaProbe::normalizedExtension(currentPath);

    // Rewrite a working copy so the asset is untouched until the new version
    // has been verified and placed.
    const QString workingPath = stagingPathFor(extension);
    QString error;
    if (!FileOperations::transferFile(currentPath, workingPath, TransferMode::Copy, &error)) {
        reporter->reject(asset.currentPath, Disposition::PermissionDenied, error);
        return;
    }

    ToolFailure failure;
    if (!m_context->normalizer().normalize(workingPath, targetDate, &failure)) {
        QFile::remove(workingPath);
        reporter->reject(asset.currentPath, failure.category == Disposition::None ? Disposition::Corrupted : failure.category,
                         failure.message);
        return;
    }

    const DedupeCheck check = IngestionTransaction::rehashAndCheck(*m_context->store(), workingPath, asset.id);
    if (!check.hashed) {
        QFile::remove(workingPath);
        reporter->reject(asset.currentPath, Disposition::Corrupted, check.errorMessage);
        return;
    }

    if (check.isDuplicate()) {
        QFile::remove(workingPath);
        const QString reason = QStringLiteral("Identical after retag to %1").arg(check.conflict.currentPath);
        QString trashError;
        TrashEntry entry;
        if (!m_context->trash()->admit(currentPath, Disposition::Duplicate, reason, TransferMode::Move,
                                       &entry, &trashError)) {
            reporter->reject(asset.currentPath, Disposition::PermissionDenied,
                             QStringLiteral("%1; unable to move to trash: %2").arg(reason, trashError));
            return;
        }
        QString storeError;
        if (!m_context->store()->deleteAsset(asset.id, &storeError)) {
            // The record stays active, so the file has to come back.
            const QString trashedPath = QDir(m_context->trashDirectory()).filePath(entry.trashPath);
            QString undoError;
            if (!FileOperations::transferFile(trashedPath, currentPath, TransferMode::Move, &undoError)) {
                reporter->reject(asset.currentPath, Disposition::PermissionDenied,
                                 QStringLiteral("%1; file left in trash at %2: %3").arg(storeError, trashedPath, undoError));
                return;
            }
            if (entry.id >= 0 && !m_context->store()->deleteTrashEntry(entry.id, &undoError)) {
                qWarning() << "Stale trash entry for" << asset.currentPath << ":" << undoError;
            }
            reporter->reject(asset.currentPath, Disposition::Corrupted, storeError);
            return;
        }
        FileOperations::pruneEmptyParents(currentPath, m_context->rootPath());
        reporter->reject(asset.currentPath, Disposition::Duplicate, reason);
        return;
    }

    const PathDeriver::DerivedPath target =
        IngestionTransaction::canonicalPathFor(*m_context, targetDate, check.contentHash, extension, asset.id);
    const QString finalPath = m_context->absolutePath(target.relativePath());

    // Park the old version so it can be restored if anything below fails.
    const QString backupPath = stagingPathFor(extension);
    if (!FileOperations::transferFile(currentPath, backupPath, TransferMode::Move, &error)) {
        QFile::remove(workingPath);
        reporter->reject(asset.currentPath, Disposition::PermissionDenied, error);
        return;
    }

    auto restore = [&]() {
        QString restoreError;
        if (!FileOperations::transferFile(backupPath, currentPath, TransferMode::Move, &restoreError)) {
            qWarning() << "Unable to restore" << asset.currentPath << "from" << backupPath << ":" << restoreError;
        }
    };

    if (!FileOperations::transferFile(workingPath, finalPath, TransferMode::Move, &error)) {
        QFile::remove(workingPath);
        restore();
        reporter->reject(asset.currentPath, Disposition::PermissionDenied, error);
        return;
    }

    MediaAsset updated = asset;
    updated.contentHash = check.contentHash;
    updated.currentPath = target.relativePath();
    updated.capturedAt = targetDate;
    updated.byteSize = QFileInfo(finalPath).size();

    QString storeError;
    if (!m_context->store()->updateAsset(updated, &storeError)) {
        QFile::remove(finalPath);
        restore();
        reporter->reject(asset.currentPath, Disposition::Corrupted, storeError);
        return;
    }

    QFile::remove(backupPath);
    if (updated.currentPath != asset.currentPath) {
        FileOperations::pruneEmptyParents(currentPath, m_context->rootPath());
    }
    ++reporter->summary().succeeded;
    qDebug() << "Retagged" << asset.currentPath << "->" << updated.currentPath;
}

QString RetagBatchProcessor::stagingPathFor(const QString &extension) const
{
    QString name = QUuid::createUuid().toString(QUuid::Id128);
    if (!extension.isEmpty()) {
        name.append(QLatin1Char('.')).append(extension);
    }
    return QDir(m_context->stagingDirectory()).filePath(name);
}
