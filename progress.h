#ifndef PROGRESS_H
#define PROGRESS_H

#include <QElapsedTimer>
#include <QHash>
#include <QJsonObject>
#include <QMetaType>
#include <QMutex>
#include <QQueue>
#include <QString>
#include <QVector>
#include <QWaitCondition>

#include <atomic>
#include <memory>

#include "mediatypes.h"

enum class OperationKind {
    Import,
    Retag,
    Terraform
};

enum class ProgressEventType {
    Start,
    Progress,
    Rejected,
    Complete
};

struct RejectedFile
{
    QString file;
    Disposition category = Disposition::None;
    QString message;
};

struct OperationSummary
{
    OperationKind kind = OperationKind::Import;
    int total = 0;
    int current = 0;
    int succeeded = 0;      // imported, updated or processed
    int duplicates = 0;
    int errors = 0;
    int skipped = 0;
    bool cancelled = false;
    QHash<int, int> categoryCounts;
    QVector<RejectedFile> rejected;

    void recordRejection(const QString &file, Disposition category, const QString &message);
    int count(Disposition category) const;
    QJsonObject toJson() const;
};

struct ProgressEvent
{
    ProgressEventType type = ProgressEventType::Progress;
    OperationKind kind = OperationKind::Import;
    int total = 0;
    int current = 0;
    int succeeded = 0;
    int duplicates = 0;
    int errors = 0;
    int skipped = 0;
    bool cancelled = false;
    QString file;
    QString reason;
    Disposition category = Disposition::None;
    QJsonObject byCategory;

    QJsonObject toJson() const;
};

// Cooperative cancellation, checked by the workers between files.
struct CancellationToken
{
    std::atomic<bool> cancelled{false};
};

inline bool isCancelled(const std::shared_ptr<CancellationToken> &token)
{
    return token && token->cancelled.load();
}

QString operationKindToString(OperationKind kind);
QString progressEventTypeToString(ProgressEventType type);
QString succeededKey(OperationKind kind);

class ProgressSink
{
public:
    virtual ~ProgressSink() = default;
    virtual void publish(const ProgressEvent &event) = 0;
};

// Unbounded, thread-safe queue between the worker and whoever consumes the
// event stream. The producer never blocks.
class ProgressChannel : public ProgressSink
{
public:
    void publish(const ProgressEvent &event) override;
    void close();
    bool isClosed() const;

    // Blocks until an event is available or the channel is closed and
    // drained. Returns false once nothing more will arrive (or on timeout).
    bool next(ProgressEvent *event, int timeoutMs = -1);
    QVector<ProgressEvent> drain();

private:
    mutable QMutex m_mutex;
    QWaitCondition m_available;
    QQueue<ProgressEvent> m_events;
    bool m_closed = false;
};

struct ThrottleSettings
{
    int everyFiles = 25;
    int intervalMs = 1000;
};

// Turns per-file bookkeeping into the start/progress/rejected/complete
// protocol, throttling progress by file count or elapsed time.
class ProgressReporter
{
public:
    ProgressReporter(OperationKind kind, ProgressSink *sink, const ThrottleSettings &throttle = ThrottleSettings());

    OperationSummary &summary();
    const OperationSummary &summary() const;

    void start(int total);
    void fileStarted(const QString &file);
    void fileFinished();
    void reject(const QString &file, Disposition category, const QString &message);
    void complete();

private:
    void publish(const ProgressEvent &event);
    ProgressEvent snapshot(ProgressEventType type) const;
    void emitProgress();

    ProgressSink *m_sink = nullptr;
    ThrottleSettings m_throttle;
    OperationSummary m_summary;
    QString m_currentFile;
    QElapsedTimer m_sinceLastProgress;
    int m_lastReportedCount = 0;
};

Q_DECLARE_METATYPE(ProgressEvent)
Q_DECLARE_METATYPE(OperationSummary)

#endif // PROGRESS_H
