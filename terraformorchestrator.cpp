#include "terraformorchestrator.h"

#include "assetstore.h"
#include "fileoperations.h"
#include "mediaprobe.h"
#include "metadatatool.h"
#include "treewalker.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonObject>
#include <QStorageInfo>
#include <QUuid>

namespace {
constexpr auto kWriteProbePrefix = ".photovault_write_probe_";
constexpr auto kTrashRelativeRoot = ".trash";
}

TerraformOrchestrator::TerraformOrchestrator(const QString &rootPath, const AppConfig &config)
    : m_context(rootPath, config)
{
    m_throttle.everyFiles = config.progressEveryFiles;
    m_throttle.intervalMs = config.progressIntervalMs;
}

TerraformOrchestrator::~TerraformOrchestrator()
{
    m_manifest.close();
    m_context.close();
    releaseLock();
}

LibraryContext &TerraformOrchestrator::context()
{
    return m_context;
}

void TerraformOrchestrator::setTools(const std::shared_ptr<MetadataTool> &imageTool,
                                     const std::shared_ptr<MetadataTool> &videoTool)
{
    m_context.setTools(imageTool, videoTool);
}

void TerraformOrchestrator::setThrottle(const ThrottleSettings &throttle)
{
    m_throttle = throttle;
}

QString TerraformOrchestrator::manifestPath() const
{
    return m_manifest.filePath();
}

QStringList TerraformOrchestrator::removedDirectories() const
{
    return m_removedDirectories;
}

bool TerraformOrchestrator::preflight(QString *errorMessage)
{
    const QFileInfo rootInfo(m_context.rootPath());
    if (!rootInfo.exists() || !rootInfo.isDir()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Not a directory: %1").arg(m_context.rootPath());
        }
        return false;
    }

    if (!m_lock && !acquireLock(errorMessage)) {
        return false;
    }

    if (!checkTools(errorMessage) || !checkFreeSpace(errorMessage) || !checkWritable(errorMessage)) {
        releaseLock();
        return false;
    }
    return true;
}

bool TerraformOrchestrator::acquireLock(QString *errorMessage)
{
    auto lock = std::make_unique<QLockFile>(m_context.lockFilePath());
    // Never stale by age: only a dead owner process releases the lock.
    lock->setStaleLockTime(0);
    if (!lock->tryLock(0)) {
        if (errorMessage) {
            qint64 pid = 0;
            QString hostname;
            QString application;
            if (lock->getLockInfo(&pid, &hostname, &application)) {
                *errorMessage = QStringLiteral("Another reorganization is running on this library (pid %1 on %2)")
                                    .arg(pid)
                                    .arg(hostname);
            } else {
                *errorMessage = QStringLiteral("Unable to lock %1").arg(m_context.lockFilePath());
            }
        }
        return false;
    }
    m_lock = std::move(lock);
    return true;
}

void TerraformOrchestrator::releaseLock()
{
    if (m_lock) {
        m_lock->unlock();
        m_lock.reset();
    }
}

bool TerraformOrchestrator::checkTools(QString *errorMessage) const
{
    QStringList missing;
    for (const MetadataTool *tool : {m_context.imageTool(), m_context.videoTool()}) {
        if (!tool) {
            missing.append(QStringLiteral("metadata tool"));
        } else if (!tool->isAvailable()) {
            missing.append(tool->name());
        }
    }
    if (!missing.isEmpty()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Required tools are not available: %1").arg(missing.join(QStringLiteral(", ")));
        }
        return false;
    }
    return true;
}

bool TerraformOrchestrator::checkFreeSpace(QString *errorMessage) const
{
    const QStorageInfo storage(m_context.rootPath());
    if (!storage.isValid() || storage.bytesTotal() <= 0) {
        qWarning() << "Unable to determine free space for" << m_context.rootPath();
        return true;
    }

    const double ratio = static_cast<double>(storage.bytesAvailable()) / static_cast<double>(storage.bytesTotal());
    if (ratio < m_context.config().minFreeSpaceRatio) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Insufficient free space: %1% available, %2% required")
                                .arg(ratio * 100.0, 0, 'f', 1)
                                .arg(m_context.config().minFreeSpaceRatio * 100.0, 0, 'f', 1);
        }
        return false;
    }
    return true;
}

bool TerraformOrchestrator::checkWritable(QString *errorMessage) const
{
    const QString probePath = QDir(m_context.rootPath())
                                  .filePath(QString::fromLatin1(kWriteProbePrefix)
                                            + QUuid::createUuid().toString(QUuid::Id128));
    QFile probe(probePath);
    if (!probe.open(QIODevice::WriteOnly) || probe.write("probe") != 5) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Library directory is not writable: %1").arg(probe.errorString());
        }
        probe.close();
        QFile::remove(probePath);
        return false;
    }
    probe.close();
    if (!QFile::remove(probePath)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Unable to remove write probe %1").arg(probePath);
        }
        return false;
    }
    return true;
}

bool TerraformOrchestrator::run(ProgressSink *sink,
                                const std::shared_ptr<CancellationToken> &token,
                                OperationSummary *summary,
                                QString *errorMessage)
{
    if (!m_lock && !preflight(errorMessage)) {
        return false;
    }

    if (!m_context.open(errorMessage)) {
        releaseLock();
        return false;
    }
    if (!m_context.backupDatabase(QStringLiteral("terraform"), errorMessage)) {
        m_context.close();
        releaseLock();
        return false;
    }

    const ResumeState resume = Manifest::computeResumeState(Manifest::readUnfinishedRuns(m_context.logDirectory()));

    const QDateTime startedAt = QDateTime::currentDateTime();
    if (!m_manifest.open(m_context.logDirectory(), startedAt, errorMessage)) {
        m_context.close();
        releaseLock();
        return false;
    }

    // Files recovery puts back at their original path go first and are not
    // subject to cancellation: their recover record needs a terminal one.
    QStringList files;
    if (!resume.interrupted.isEmpty()) {
        qDebug() << "Recovering" << resume.interrupted.size() << "interrupted files from a previous run";
        files = recoverInterrupted(resume.interrupted);
    }
    const int recoveredCount = files.size();
    QSet<QString> exclude = resume.settledInPlace;
    for (const QString &file : std::as_const(files)) {
        exclude.insert(m_context.relativePath(file));
    }
    files += discover(exclude);

    ManifestRecord startRecord;
    startRecord.timestamp = startedAt;
    startRecord.event = ManifestEvent::Start;
    startRecord.extra.insert(QStringLiteral("root"), m_context.rootPath());
    startRecord.extra.insert(QStringLiteral("total"), files.size());
    writeRecord(startRecord);

    ProgressReporter reporter(OperationKind::Terraform, sink, m_throttle);
    reporter.start(files.size());

    for (int i = 0; i < files.size(); ++i) {
        if (i >= recoveredCount && isCancelled(token)) {
            reporter.summary().cancelled = true;
            qDebug() << "Terraform cancelled after" << reporter.summary().current << "of" << files.size() << "files";
            break;
        }
        processFile(files.at(i), &reporter);
    }

    m_removedDirectories.clear();
    FileOperations::removeEmptyDirectories(m_context.rootPath(), m_context.config().cleanupMaxPasses,
                                           &m_removedDirectories);

    const OperationSummary &totals = reporter.summary();
    ManifestRecord completeRecord;
    completeRecord.event = ManifestEvent::Complete;
    completeRecord.extra.insert(QStringLiteral("processed"), totals.succeeded);
    completeRecord.extra.insert(QStringLiteral("duplicates"), totals.duplicates);
    completeRecord.extra.insert(QStringLiteral("errors"), totals.errors);
    completeRecord.extra.insert(QStringLiteral("skipped"), totals.skipped);
    completeRecord.extra.insert(QStringLiteral("cancelled"), totals.cancelled);
    writeRecord(completeRecord);

    reporter.complete();
    if (summary) {
        *summary = reporter.summary();
    }

    m_manifest.close();
    m_context.close();
    releaseLock();
    return true;
}

QStringList TerraformOrchestrator::recoverInterrupted(const QVector<ManifestRecord> &interrupted)
{
    QStringList returned;
    for (const ManifestRecord &record : interrupted) {
        const QString originalPath = m_context.absolutePath(record.originalPath);

        if (!record.newPath.isEmpty()) {
            const MediaAsset committed = m_context.store()->findByPath(record.newPath);
            if (committed.isValid() && (record.hash.isEmpty() || committed.contentHash == record.hash)) {
                // The record made it into the store; only the log is behind.
                ManifestRecord success;
                success.event = ManifestEvent::Success;
                success.originalPath = record.originalPath;
                success.newPath = record.newPath;
                success.hash = committed.contentHash;
                success.step = QStringLiteral("recovered");
                writeRecord(success);
                continue;
            }
        }

        if (QFileInfo::exists(originalPath)) {
            // Nothing was moved yet; discovery picks the file up again.
            continue;
        }

        QString leftoverPath;
        if (!record.newPath.isEmpty() && QFileInfo::exists(m_context.absolutePath(record.newPath))) {
            leftoverPath = record.newPath;
        } else if (!record.stagedPath.isEmpty() && QFileInfo::exists(m_context.absolutePath(record.stagedPath))) {
            leftoverPath = record.stagedPath;
        }

        if (leftoverPath.isEmpty()) {
            recordTrashedWhileInterrupted(record);
            continue;
        }

        ManifestRecord recover;
        recover.event = ManifestEvent::Processing;
        recover.originalPath = record.originalPath;
        if (leftoverPath == record.newPath) {
            recover.newPath = record.newPath;
        } else {
            recover.stagedPath = record.stagedPath;
        }
        recover.step = QStringLiteral("recover");
        writeRecord(recover);

        QString error;
        if (FileOperations::transferFile(m_context.absolutePath(leftoverPath), originalPath, TransferMode::Move, &error)) {
            qDebug() << "Moved" << leftoverPath << "back to" << record.originalPath;
            returned.append(originalPath);
            continue;
        }

        qWarning() << "Unable to return" << leftoverPath << "to" << record.originalPath << ":" << error;
        ManifestRecord failed;
        failed.event = ManifestEvent::Failed;
        failed.originalPath = record.originalPath;
        failed.category = Disposition::PermissionDenied;
        failed.reason = QStringLiteral("Unable to return %1: %2").arg(leftoverPath, error);
        failed.step = QStringLiteral("recover");
        writeRecord(failed);
    }
    return returned;
}

void TerraformOrchestrator::recordTrashedWhileInterrupted(const ManifestRecord &record)
{
    const TrashEntry entry = m_context.store()->latestTrashEntryFor(m_context.absolutePath(record.originalPath));
    const bool trashedByThatRun = entry.id >= 0
        && (!record.timestamp.isValid() || entry.timestamp.toSecsSinceEpoch() >= record.timestamp.toSecsSinceEpoch());
    if (!trashedByThatRun) {
        qWarning() << "Interrupted file" << record.originalPath << "is gone and was never trashed";
        return;
    }

    ManifestRecord terminal;
    terminal.event = entry.category == Disposition::RawSkipped ? ManifestEvent::Skipped : ManifestEvent::Failed;
    terminal.originalPath = record.originalPath;
    terminal.category = entry.category;
    terminal.reason = entry.reason;
    terminal.trashPath = QString::fromLatin1(kTrashRelativeRoot) + QLatin1Char('/') + entry.trashPath;
    terminal.step = QStringLiteral("recovered");
    writeRecord(terminal);
}

QStringList TerraformOrchestrator::discover(const QSet<QString> &exclude) const
{
    TreeWalker walker(m_context.rootPath());
    walker.setExclusion(TreeWalker::anyOf({
        TreeWalker::hiddenEntries(),
        [](const QFileInfo &info) {
            if (info.isSymLink()) {
                qDebug() << "Skipping symlink" << info.absoluteFilePath();
                return true;
            }
            return false;
        }
    }));

    QStringList files;
    for (const QString &file : walker.files()) {
        if (!MediaProbe::isMediaFile(file)) {
            continue;
        }
        const QString relative = m_context.relativePath(file);
        if (exclude.contains(relative) || m_context.store()->findByPath(relative).isValid()) {
            continue;
        }
        files.append(file);
    }
    return files;
}

void TerraformOrchestrator::processFile(const QString &filePath, ProgressReporter *reporter)
{
    const QString relative = m_context.relativePath(filePath);
    reporter->fileStarted(relative);

    ManifestRecord processing;
    processing.event = ManifestEvent::Processing;
    processing.originalPath = relative;
    processing.step = QStringLiteral("begin");
    writeRecord(processing);

    IngestionTransaction transaction(&m_context, filePath, TransferMode::Move);
    transaction.setObserver(this);
    const IngestionOutcome outcome = transaction.run();

    ManifestRecord result;
    result.originalPath = relative;
    if (outcome.committed()) {
        result.event = ManifestEvent::Success;
        result.newPath = outcome.asset.currentPath;
        result.hash = outcome.asset.contentHash;
        ++reporter->summary().succeeded;
    } else {
        result.event = outcome.disposition == Disposition::RawSkipped ? ManifestEvent::Skipped : ManifestEvent::Failed;
        result.reason = outcome.message;
        result.category = outcome.disposition;
        if (!outcome.trashEntry.trashPath.isEmpty()) {
            result.trashPath = QString::fromLatin1(kTrashRelativeRoot) + QLatin1Char('/') + outcome.trashEntry.trashPath;
        }
        reporter->reject(relative, outcome.disposition, outcome.message);
    }
    writeRecord(result);
    reporter->fileFinished();
}

void TerraformOrchestrator::aboutToStage(const QString &sourcePath, const QString &stagedPath)
{
    ManifestRecord record;
    record.event = ManifestEvent::Processing;
    record.originalPath = m_context.relativePath(sourcePath);
    record.stagedPath = m_context.relativePath(stagedPath);
    record.step = QStringLiteral("stage");
    writeRecord(record);
}

void TerraformOrchestrator::aboutToCommit(const QString &sourcePath, const QString &finalPath, const QString &contentHash)
{
    ManifestRecord record;
    record.event = ManifestEvent::Processing;
    record.originalPath = m_context.relativePath(sourcePath);
    record.newPath = m_context.relativePath(finalPath);
    record.hash = contentHash;
    record.step = QStringLiteral("commit");
    writeRecord(record);
}

void TerraformOrchestrator::writeRecord(const ManifestRecord &record)
{
    QString error;
    if (!m_manifest.append(record, &error)) {
        qWarning() << "Manifest write failed:" << error;
    }
}
