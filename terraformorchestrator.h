#ifndef TERRAFORMORCHESTRATOR_H
#define TERRAFORMORCHESTRATOR_H

#include <QLockFile>
#include <QSet>
#include <QString>
#include <QStringList>

#include <memory>

#include "appconfig.h"
#include "ingestiontransaction.h"
#include "librarycontext.h"
#include "manifest.h"
#include "progress.h"

class MetadataTool;

// Converts an arbitrary folder tree into a managed library in place. Every
// file is moved through an IngestionTransaction, one at a time, with a
// manifest record written before and after each mutation.
class TerraformOrchestrator : public TransactionObserver
{
public:
    explicit TerraformOrchestrator(const QString &rootPath, const AppConfig &config = AppConfig());
    ~TerraformOrchestrator() override;

    LibraryContext &context();
    void setTools(const std::shared_ptr<MetadataTool> &imageTool, const std::shared_ptr<MetadataTool> &videoTool);
    void setThrottle(const ThrottleSettings &throttle);

    // Lock, tools, free space and a real write probe. On failure nothing in
    // the tree has been changed and the lock is released.
    bool preflight(QString *errorMessage = nullptr);

    // Runs preflight() when it has not been run yet.
    bool run(ProgressSink *sink,
             const std::shared_ptr<CancellationToken> &token = nullptr,
             OperationSummary *summary = nullptr,
             QString *errorMessage = nullptr);

    QString manifestPath() const;
    QStringList removedDirectories() const;

    void aboutToStage(const QString &sourcePath, const QString &stagedPath) override;
    void aboutToCommit(const QString &sourcePath, const QString &finalPath, const QString &contentHash) override;

private:
    bool acquireLock(QString *errorMessage);
    void releaseLock();
    bool checkTools(QString *errorMessage) const;
    bool checkFreeSpace(QString *errorMessage) const;
    bool checkWritable(QString *errorMessage) const;

    // Returns the files moved back to their original path.
    QStringList recoverInterrupted(const QVector<ManifestRecord> &interrupted);
    void recordTrashedWhileInterrupted(const ManifestRecord &record);
    QStringList discover(const QSet<QString> &exclude) const;
    void processFile(const QString &filePath, ProgressReporter *reporter);
    void writeRecord(const ManifestRecord &record);

    LibraryContext m_context;
    ThrottleSettings m_throttle;
    std::unique_ptr<QLockFile> m_lock;
    Manifest m_manifest;
    QStringList m_removedDirectories;
};

#endif // TERRAFORMORCHESTRATOR_H
