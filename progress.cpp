#include "progress.h"

#include <QDeadlineTimer>
#include <QMutexLocker>

void OperationSummary::recordRejection(const QString &file, Disposition category, const QString &message)
{
    switch (category) {
    case Disposition::None:
        return;
    case Disposition::Duplicate:
        ++duplicates;
        break;
    case Disposition::RawSkipped:
        ++skipped;
        break;
    default:
        ++errors;
        break;
    }
    categoryCounts[static_cast<int>(category)] += 1;

    RejectedFile rejection;
    rejection.file = file;
    rejection.category = category;
    rejection.message = message;
    rejected.append(rejection);
}

int OperationSummary::count(Disposition category) const
{
    return categoryCounts.value(static_cast<int>(category), 0);
}

QJsonObject OperationSummary::toJson() const
{
    QJsonObject object;
    object.insert(succeededKey(kind), succeeded);
    object.insert(QStringLiteral("duplicates"), duplicates);
    object.insert(QStringLiteral("errors"), errors);
    object.insert(QStringLiteral("skipped"), skipped);
    object.insert(QStringLiteral("cancelled"), cancelled);
    QJsonObject byCategory;
    for (auto it = categoryCounts.cbegin(); it != categoryCounts.cend(); ++it) {
        byCategory.insert(dispositionToString(static_cast<Disposition>(it.key())), it.value());
    }
    object.insert(QStringLiteral("by_category"), byCategory);
    return object;
}

QJsonObject ProgressEvent::toJson() const
{
    QJsonObject object;
    object.insert(QStringLiteral("type"), progressEventTypeToString(type));
    object.insert(QStringLiteral("operation"), operationKindToString(kind));

    switch (type) {
    case ProgressEventType::Start:
        object.insert(QStringLiteral("total"), total);
        break;
    case ProgressEventType::Progress:
        object.insert(QStringLiteral("current"), current);
        object.insert(QStringLiteral("total"), total);
        object.insert(succeededKey(kind), succeeded);
        object.insert(QStringLiteral("duplicates"), duplicates);
        object.insert(QStringLiteral("errors"), errors);
        if (!file.isEmpty()) {
            object.insert(QStringLiteral("file"), file);
        }
        break;
    case ProgressEventType::Rejected:
        object.insert(QStringLiteral("file"), file);
        object.insert(QStringLiteral("reason"), reason);
        object.insert(QStringLiteral("category"), dispositionToString(category));
        break;
    case ProgressEventType::Complete:
        object.insert(succeededKey(kind), succeeded);
        object.insert(QStringLiteral("duplicates"), duplicates);
        object.insert(QStringLiteral("errors"), errors);
        object.insert(QStringLiteral("skipped"), skipped);
        object.insert(QStringLiteral("cancelled"), cancelled);
        object.insert(QStringLiteral("by_category"), byCategory);
        break;
    }
    return object;
}

QString operationKindToString(OperationKind kind)
{
    switch (kind) {
    case OperationKind::Import:
        return QStringLiteral("import");
    case OperationKind::Retag:
        return QStringLiteral("retag");
    case OperationKind::Terraform:
        return QStringLiteral("terraform");
    }
    return QStringLiteral("import");
}

QString progressEventTypeToString(ProgressEventType type)
{
    switch (type) {
    case ProgressEventType::Start:
        return QStringLiteral("start");
    case ProgressEventType::Progress:
        return QStringLiteral("progress");
    case ProgressEventType::Rejected:
        return QStringLiteral("rejected");
    case ProgressEventType::Complete:
        return QStringLiteral("complete");
    }
    return QStringLiteral("progress");
}

QString succeededKey(OperationKind kind)
{
    switch (kind) {
    case OperationKind::Import:
        return QStringLiteral("imported");
    case OperationKind::Retag:
        return QStringLiteral("updated");
    case OperationKind::Terraform:
        return QStringLiteral("processed");
    }
    return QStringLiteral("imported");
}

void ProgressChannel::publish(const ProgressEvent &event)
{
    QMutexLocker locker(&m_mutex);
    if (m_closed) {
        return;
    }
    m_events.enqueue(event);
    m_available.wakeAll();
}

void ProgressChannel::close()
{
    QMutexLocker locker(&m_mutex);
    m_closed = true;
    m_available.wakeAll();
}

bool ProgressChannel::isClosed() const
{
    QMutexLocker locker(&m_mutex);
    return m_closed;
}

bool ProgressChannel::next(ProgressEvent *event, int timeoutMs)
{
    QMutexLocker locker(&m_mutex);
    QDeadlineTimer deadline = timeoutMs < 0 ? QDeadlineTimer(QDeadlineTimer::Forever) : QDeadlineTimer(timeoutMs);
    while (m_events.isEmpty() && !m_closed) {
        if (!m_available.wait(&m_mutex, deadline)) {
            return false;
        }
    }
    if (m_events.isEmpty()) {
        return false;
    }
    const ProgressEvent front = m_events.dequeue();
    if (event) {
        *event = front;
    }
    return true;
}

QVector<ProgressEvent> ProgressChannel::drain()
{
    QMutexLocker locker(&m_mutex);
    QVector<ProgressEvent> events;
    events.reserve(m_events.size());
    while (!m_events.isEmpty()) {
        events.append(m_events.dequeue());
    }
    return events;
}

ProgressReporter::ProgressReporter(OperationKind kind, ProgressSink *sink, const ThrottleSettings &throttle)
    : m_sink(sink)
    , m_throttle(throttle)
{
    m_summary.kind = kind;
}

OperationSummary &ProgressReporter::summary()
{
    return m_summary;
}

const OperationSummary &ProgressReporter::summary() const
{
    return m_summary;
}

void ProgressReporter::start(int total)
{
    m_summary.total = total;
    m_summary.current = 0;
    m_lastReportedCount = 0;
    m_sinceLastProgress.start();
    publish(snapshot(ProgressEventType::Start));
}

void ProgressReporter::fileStarted(const QString &file)
{
    m_currentFile = file;
}

void ProgressReporter::fileFinished()
{
    ++m_summary.current;
    const bool countDue = m_summary.current - m_lastReportedCount >= qMax(1, m_throttle.everyFiles);
    const bool timeDue = m_sinceLastProgress.isValid() && m_sinceLastProgress.elapsed() >= m_throttle.intervalMs;
    if (countDue || timeDue) {
        emitProgress();
    }
}

void ProgressReporter::reject(const QString &file, Disposition category, const QString &message)
{
    m_summary.recordRejection(file, category, message);
    ProgressEvent event = snapshot(ProgressEventType::Rejected);
    event.file = file;
    event.category = category;
    event.reason = message;
    publish(event);
}

void ProgressReporter::complete()
{
    if (m_lastReportedCount != m_summary.current || m_summary.current == 0) {
        emitProgress();
    }
    ProgressEvent event = snapshot(ProgressEventType::Complete);
    for (auto it = m_summary.categoryCounts.cbegin(); it != m_summary.categoryCounts.cend(); ++it) {
        event.byCategory.insert(dispositionToString(static_cast<Disposition>(it.key())), it.value());
    }
    publish(event);
}

void ProgressReporter::emitProgress()
{
    m_lastReportedCount = m_summary.current;
    m_sinceLastProgress.restart();
    publish(snapshot(ProgressEventType::Progress));
}

ProgressEvent ProgressReporter::snapshot(ProgressEventType type) const
{
    ProgressEvent event;
    event.type = type;
    event.kind = m_summary.kind;
    event.total = m_summary.total;
    event.current = m_summary.current;
    event.succeeded = m_summary.succeeded;
    event.duplicates = m_summary.duplicates;
    event.errors = m_summary.errors;
    event.skipped = m_summary.skipped;
    event.cancelled = m_summary.cancelled;
    event.file = m_currentFile;
    return event;
}

void ProgressReporter::publish(const ProgressEvent &event)
{
    if (m_sink) {
        m_sink->publish(event);
    }
}
