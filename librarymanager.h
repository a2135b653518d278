#ifndef LIBRARYMANAGER_H
#define LIBRARYMANAGER_H

#include <QObject>
#include <QDateTime>
#include <QFuture>
#include <QFutureWatcher>
#include <QSharedPointer>
#include <QString>
#include <QStringList>
#include <QUuid>
#include <QVector>

#include <functional>
#include <memory>

#include "appconfig.h"
#include "mediatypes.h"
#include "progress.h"
#include "retagbatchprocessor.h"

class JobManager;
class LibraryContext;
class MetadataTool;

struct MetadataToolSet
{
    std::shared_ptr<MetadataTool> imageTool;
    std::shared_ptr<MetadataTool> videoTool;
};

// Owns the open library and runs the long operations on a worker thread.
// Each operation returns a channel carrying its progress events; the same
// events are re-emitted on the manager's thread through operationEvent().
// Only one operation runs at a time.
class LibraryManager : public QObject
{
    Q_OBJECT
public:
    // Called once per operation, on the worker thread, to provide fresh tool
    // instances. Without a factory the tools named in the config are used.
    using ToolFactory = std::function<MetadataToolSet()>;

    explicit LibraryManager(const AppConfig &config = AppConfig(), QObject *parent = nullptr);
    ~LibraryManager() override;

    bool hasOpenLibrary() const;
    QString libraryPath() const;
    const AppConfig &config() const;

    bool createLibrary(const QString &directoryPath, QString *errorMessage = nullptr);
    bool openLibrary(const QString &directoryPath, QString *errorMessage = nullptr);
    void closeLibrary();

    void setJobManager(JobManager *jobManager);
    void setToolFactory(const ToolFactory &factory);

    QVector<MediaAsset> assets() const;
    QVector<TrashEntry> trashEntries() const;
    QString resolvePath(const QString &relativePath) const;

    QSharedPointer<ProgressChannel> importFiles(const QStringList &paths);
    QSharedPointer<ProgressChannel> retagAssets(const QVector<qint64> &assetIds,
                                                const QDateTime &newDate,
                                                RetagMode mode = RetagMode::Same,
                                                int intervalSeconds = 300);
    QSharedPointer<ProgressChannel> terraform(const QString &rootPath);

    bool isBusy() const;
    void cancelActiveOperation();
    void waitForActiveOperation();

signals:
    void libraryOpened(const QString &path);
    void libraryClosed();
    void assetsChanged();
    void operationEvent(const ProgressEvent &event);
    void operationFinished(const OperationSummary &summary);
    void errorOccurred(const QString &message);

private:
    struct OperationResult
    {
        bool ok = false;
        QString errorMessage;
        OperationSummary summary;
    };
    using Operation = std::function<OperationResult(ProgressSink *sink, const std::shared_ptr<CancellationToken> &token)>;

    QSharedPointer<ProgressChannel> startOperation(OperationKind kind, const QString &title, const Operation &operation);
    void handleEvent(const QUuid &jobId, const ProgressEvent &event);
    void finishOperation();

    AppConfig m_config;
    ToolFactory m_toolFactory;
    std::unique_ptr<LibraryContext> m_context;
    JobManager *m_jobManager = nullptr;

    QFutureWatcher<OperationResult> *m_watcher = nullptr;
    QFuture<OperationResult> m_future;
    std::shared_ptr<CancellationToken> m_activeToken;
    QUuid m_activeJobId;
    bool m_operationActive = false;
};

#endif // LIBRARYMANAGER_H
