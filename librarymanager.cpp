#include "librarymanager.h"

#include "importbatchprocessor.h"
#include "jobmanager.h"
#include "librarycontext.h"
#include "metadatatool.h"
#include "terraformorchestrator.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QMetaObject>
#include <QtConcurrent>

namespace {

class ForwardingSink : public ProgressSink
{
public:
    ForwardingSink(const QSharedPointer<ProgressChannel> &channel,
                   const std::function<void(const ProgressEvent &)> &forward)
        : m_channel(channel)
        , m_forward(forward)
    {
    }

    void publish(const ProgressEvent &event) override
    {
        m_channel->publish(event);
        if (m_forward) {
            m_forward(event);
        }
    }

private:
    QSharedPointer<ProgressChannel> m_channel;
    std::function<void(const ProgressEvent &)> m_forward;
};

std::unique_ptr<LibraryContext> makeContext(const QString &rootPath,
                                            const AppConfig &config,
                                            const LibraryManager::ToolFactory &factory)
{
    auto context = std::make_unique<LibraryContext>(rootPath, config);
    if (factory) {
        const MetadataToolSet tools = factory();
        context->setTools(tools.imageTool, tools.videoTool);
    }
    return context;
}

}

LibraryManager::LibraryManager(const AppConfig &config, QObject *parent)
    : QObject(parent)
    , m_config(config)
{
    qRegisterMetaType<ProgressEvent>("ProgressEvent");
    qRegisterMetaType<OperationSummary>("OperationSummary");

    m_watcher = new QFutureWatcher<OperationResult>(this);
    connect(m_watcher, &QFutureWatcher<OperationResult>::finished, this, [this]() {
        finishOperation();
    });
}

LibraryManager::~LibraryManager()
{
    cancelActiveOperation();
    waitForActiveOperation();
    closeLibrary();
}

bool LibraryManager::hasOpenLibrary() const
{
    return m_context && m_context->isOpen();
}

QString LibraryManager::libraryPath() const
{
    return m_context ? m_context->rootPath() : QString();
}

const AppConfig &LibraryManager::config() const
{
    return m_config;
}

bool LibraryManager::createLibrary(const QString &directoryPath, QString *errorMessage)
{
    if (LibraryContext::isLibrary(directoryPath)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("A library already exists at %1").arg(directoryPath);
        }
        return false;
    }

    closeLibrary();
    auto context = makeContext(directoryPath, m_config, m_toolFactory);
    if (!context->open(errorMessage)) {
        return false;
    }
    m_context = std::move(context);

    emit libraryOpened(m_context->rootPath());
    emit assetsChanged();
    return true;
}

bool LibraryManager::openLibrary(const QString &directoryPath, QString *errorMessage)
{
    if (!QFileInfo(directoryPath).isDir()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Library directory does not exist: %1").arg(directoryPath);
        }
        return false;
    }
    if (!LibraryContext::isLibrary(directoryPath)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("No library database found in %1").arg(directoryPath);
        }
        return false;
    }

    closeLibrary();
    auto context = makeContext(directoryPath, m_config, m_toolFactory);
    if (!context->open(errorMessage)) {
        return false;
    }
    m_context = std::move(context);

    emit libraryOpened(m_context->rootPath());
    emit assetsChanged();
    return true;
}

void LibraryManager::closeLibrary()
{
    if (m_operationActive) {
        cancelActiveOperation();
        waitForActiveOperation();
    }
    if (!m_context) {
        return;
    }
    m_context->close();
    m_context.reset();
    emit libraryClosed();
}

void LibraryManager::setJobManager(JobManager *jobManager)
{
    m_jobManager = jobManager;
}

void LibraryManager::setToolFactory(const ToolFactory &factory)
{
    m_toolFactory = factory;
}

QVector<MediaAsset> LibraryManager::assets() const
{
    if (!hasOpenLibrary()) {
        return {};
    }
    return m_context->store()->assets();
}

QVector<TrashEntry> LibraryManager::trashEntries() const
{
    if (!hasOpenLibrary()) {
        return {};
    }
    return m_context->store()->trashEntries();
}

QString LibraryManager::resolvePath(const QString &relativePath) const
{
    if (!m_context) {
        return QString();
    }
    return m_context->absolutePath(relativePath);
}

QSharedPointer<ProgressChannel> LibraryManager::importFiles(const QStringList &paths)
{
    if (!hasOpenLibrary()) {
        emit errorOccurred(QStringLiteral("Open a library before importing"));
        return {};
    }

    const QString rootPath = m_context->rootPath();
    const AppConfig config = m_config;
    const ToolFactory factory = m_toolFactory;
    return startOperation(OperationKind::Import, tr("Importing %n file(s)", nullptr, paths.size()),
                          [rootPath, config, factory, paths](ProgressSink *sink, const std::shared_ptr<CancellationToken> &token) {
        OperationResult result;
        auto context = makeContext(rootPath, config, factory);
        if (!context->open(&result.errorMessage)) {
            return result;
        }
        ImportBatchProcessor processor(context.get());
        result.ok = processor.run(paths, sink, token, &result.summary, &result.errorMessage);
        return result;
    });
}

QSharedPointer<ProgressChannel> LibraryManager::retagAssets(const QVector<qint64> &assetIds,
                                                            const QDateTime &newDate,
                                                            RetagMode mode,
                                                            int intervalSeconds)
{
    if (!hasOpenLibrary()) {
        emit errorOccurred(QStringLiteral("Open a library before retagging"));
        return {};
    }

    RetagRequest request;
    request.assetIds = assetIds;
    request.newDate = newDate;
    request.mode = mode;
    request.intervalSeconds = intervalSeconds;

    const QString rootPath = m_context->rootPath();
    const AppConfig config = m_config;
    const ToolFactory factory = m_toolFactory;
    return startOperation(OperationKind::Retag, tr("Retagging %n asset(s)", nullptr, assetIds.size()),
                          [rootPath, config, factory, request](ProgressSink *sink, const std::shared_ptr<CancellationToken> &token) {
        OperationResult result;
        auto context = makeContext(rootPath, config, factory);
        if (!context->open(&result.errorMessage)) {
            return result;
        }
        RetagBatchProcessor processor(context.get());
        result.ok = processor.run(request, sink, token, &result.summary, &result.errorMessage);
        return result;
    });
}

QSharedPointer<ProgressChannel> LibraryManager::terraform(const QString &rootPath)
{
    const AppConfig config = m_config;
    const ToolFactory factory = m_toolFactory;
    const QString absoluteRoot = QDir::cleanPath(QDir(rootPath).absolutePath());
    return startOperation(OperationKind::Terraform, tr("Terraforming %1").arg(absoluteRoot),
                          [absoluteRoot, config, factory](ProgressSink *sink, const std::shared_ptr<CancellationToken> &token) {
        OperationResult result;
        TerraformOrchestrator orchestrator(absoluteRoot, config);
        if (factory) {
            const MetadataToolSet tools = factory();
            orchestrator.setTools(tools.imageTool, tools.videoTool);
        }
        result.ok = orchestrator.run(sink, token, &result.summary, &result.errorMessage);
        return result;
    });
}

bool LibraryManager::isBusy() const
{
    return m_operationActive;
}

void LibraryManager::cancelActiveOperation()
{
    if (m_activeToken) {
        m_activeToken->cancelled.store(true);
    }
}

void LibraryManager::waitForActiveOperation()
{
    if (!m_operationActive) {
        return;
    }
    m_future.waitForFinished();
    finishOperation();
}

QSharedPointer<ProgressChannel> LibraryManager::startOperation(OperationKind kind,
                                                               const QString &title,
                                                               const Operation &operation)
{
    if (m_operationActive) {
        emit errorOccurred(QStringLiteral("Another operation is already running"));
        return {};
    }

    auto channel = QSharedPointer<ProgressChannel>::create();
    auto token = std::make_shared<CancellationToken>();

    QUuid jobId;
    if (m_jobManager) {
        jobId = m_jobManager->startJob(JobManager::categoryFor(kind), title);
    }

    const std::function<void(const ProgressEvent &)> forward = [this, jobId](const ProgressEvent &event) {
        QMetaObject::invokeMethod(this, [this, jobId, event]() {
            handleEvent(jobId, event);
        }, Qt::QueuedConnection);
    };

    m_activeToken = token;
    m_activeJobId = jobId;
    m_operationActive = true;

    m_future = QtConcurrent::run([kind, operation, channel, token, forward]() {
        ForwardingSink sink(channel, forward);
        OperationResult result = operation(&sink, token);
        result.summary.kind = kind;
        channel->close();
        return result;
    });
    m_watcher->setFuture(m_future);
    return channel;
}

void LibraryManager::handleEvent(const QUuid &jobId, const ProgressEvent &event)
{
    if (m_jobManager && !jobId.isNull()) {
        m_jobManager->applyEvent(jobId, event);
    }
    emit operationEvent(event);
}

void LibraryManager::finishOperation()
{
    if (!m_operationActive) {
        return;
    }
    m_operationActive = false;

    const OperationResult result = m_future.result();
    const QUuid jobId = m_activeJobId;
    m_activeJobId = QUuid();
    m_activeToken.reset();

    if (!result.ok) {
        qWarning() << "Operation failed:" << result.errorMessage;
        if (m_jobManager && !jobId.isNull()) {
            m_jobManager->failJob(jobId, result.errorMessage);
        }
        emit errorOccurred(result.errorMessage);
    }

    emit operationFinished(result.summary);
    emit assetsChanged();
}
