#include "jobmanager.h"

#include <QtGlobal>
#include <QTimer>

namespace {
constexpr int kSuccessRetentionMs = 4000;
constexpr int kFailureRetentionMs = 8000;
}

JobManager::JobManager(QObject *parent)
    : QObject(parent)
{
}

QUuid JobManager::startJob(JobCategory category, const QString &title, const QString &detail)
{
    JobInfo info;
    info.id = QUuid::createUuid();
    info.category = category;
    info.state = JobState::Running;
    info.title = title;
    info.detail = detail;
    info.progress = -1;
    info.indeterminate = true;
    info.startedAt = QDateTime::currentDateTime();

    JobEntry entry;
    entry.info = info;

    m_jobs.insert(info.id, entry);
    m_order.append(info.id);

    emit jobAdded(info);
    return info.id;
}

void JobManager::updateProgress(const QUuid &id, int completedSteps, int totalSteps)
{
    JobInfo *info = findJob(id);
    if (!info) {
        return;
    }
    if (totalSteps >= 0) {
        info->totalSteps = totalSteps;
        info->indeterminate = false;
        info->completedSteps = qMax(0, completedSteps);
        const int clampedTotal = qMax(1, totalSteps);
        const double ratio = static_cast<double>(info->completedSteps) / static_cast<double>(clampedTotal);
        info->progress = static_cast<int>(qBound(0.0, ratio, 1.0) * 100.0);
    } else {
        info->totalSteps = -1;
        info->completedSteps = completedSteps;
        info->progress = completedSteps;
    }
    publishUpdate(*info);
}

void JobManager::completeJob(const QUuid &id, const QString &detail)
{
    JobInfo *info = findJob(id);
    if (!info) {
        return;
    }
    if (!detail.isEmpty()) {
        info->detail = detail;
    }
    updateJobState(*info, JobState::Succeeded);
    scheduleRemoval(id, kSuccessRetentionMs);
}

void JobManager::failJob(const QUuid &id, const QString &errorDetail)
{
    JobInfo *info = findJob(id);
    if (!info) {
        return;
    }
    if (!errorDetail.isEmpty()) {
        info->detail = errorDetail;
    }
    updateJobState(*info, JobState::Failed);
    scheduleRemoval(id, kFailureRetentionMs);
}

void JobManager::cancelJob(const QUuid &id, const QString &detail)
{
    JobInfo *info = findJob(id);
    if (!info) {
        return;
    }
    if (!detail.isEmpty()) {
        info->detail = detail;
    }
    updateJobState(*info, JobState::Cancelled);
    scheduleRemoval(id, kSuccessRetentionMs);
}

void JobManager::applyEvent(const QUuid &id, const ProgressEvent &event)
{
    JobInfo *info = findJob(id);
    if (!info) {
        return;
    }

    switch (event.type) {
    case ProgressEventType::Start:
        updateProgress(id, 0, event.total);
        break;
    case ProgressEventType::Progress:
        if (!event.file.isEmpty()) {
            info->detail = event.file;
        }
        updateProgress(id, event.current, event.total);
        break;
    case ProgressEventType::Rejected:
        ++info->rejectedCount;
        info->detail = QObject::tr("%1: %2").arg(dispositionToDisplayText(event.category), event.file);
        publishUpdate(*info);
        break;
    case ProgressEventType::Complete: {
        const QString detail = QObject::tr("%1 %2, %3 duplicates, %4 errors, %5 skipped")
                                   .arg(event.succeeded)
                                   .arg(succeededKey(event.kind))
                                   .arg(event.duplicates)
                                   .arg(event.errors)
                                   .arg(event.skipped);
        if (event.cancelled) {
            cancelJob(id, detail);
        } else {
            completeJob(id, detail);
        }
        break;
    }
    }
}

QVector<JobInfo> JobManager::jobs() const
{
    QVector<JobInfo> list;
    list.reserve(m_order.size());
    for (const QUuid &id : m_order) {
        const JobInfo *info = findJob(id);
        if (!info) {
            continue;
        }
        list.append(*info);
    }
    return list;
}

JobInfo JobManager::job(const QUuid &id) const
{
    const JobInfo *info = findJob(id);
    return info ? *info : JobInfo();
}

int JobManager::activeJobCount() const
{
    int count = 0;
    for (const auto &entry : m_jobs) {
        if (entry.info.state == JobState::Running || entry.info.state == JobState::Pending) {
            ++count;
        }
    }
    return count;
}

JobCategory JobManager::categoryFor(OperationKind kind)
{
    switch (kind) {
    case OperationKind::Import:
        return JobCategory::Import;
    case OperationKind::Retag:
        return JobCategory::Retag;
    case OperationKind::Terraform:
        return JobCategory::Terraform;
    }
    return JobCategory::Misc;
}

JobInfo *JobManager::findJob(const QUuid &id)
{
    auto it = m_jobs.find(id);
    if (it == m_jobs.end()) {
        return nullptr;
    }
    return &it.value().info;
}

const JobInfo *JobManager::findJob(const QUuid &id) const
{
    auto it = m_jobs.constFind(id);
    if (it == m_jobs.constEnd()) {
        return nullptr;
    }
    return &it.value().info;
}

void JobManager::updateJobState(JobInfo &info, JobState newState)
{
    if (info.state == newState) {
        return;
    }
    info.state = newState;
    if (newState == JobState::Succeeded) {
        info.progress = 100;
        info.indeterminate = false;
    }
    info.finishedAt = QDateTime::currentDateTime();
    publishUpdate(info);
}

void JobManager::publishUpdate(const JobInfo &info)
{
    emit jobUpdated(info);
}

void JobManager::scheduleRemoval(const QUuid &id, int delayMs)
{
    auto it = m_jobs.find(id);
    if (it == m_jobs.end()) {
        return;
    }
    if (it->removalScheduled) {
        return;
    }
    it->removalScheduled = true;
    QTimer::singleShot(delayMs, this, [this, id]() {
        auto entryIt = m_jobs.find(id);
        if (entryIt == m_jobs.end()) {
            return;
        }
        m_jobs.erase(entryIt);
        m_order.removeAll(id);
        emit jobRemoved(id);
    });
}

QString jobCategoryToDisplayText(JobCategory category)
{
    switch (category) {
    case JobCategory::Import:
        return QObject::tr("Import");
    case JobCategory::Retag:
        return QObject::tr("Retag");
    case JobCategory::Terraform:
        return QObject::tr("Terraform");
    case JobCategory::Misc:
    default:
        return QObject::tr("Task");
    }
}


bool jobStateIsFinal(JobState state)
{
    return state == JobState::Succeeded || state == JobState::Failed || state == JobState::Cancelled;
}

QString jobSummaryLine(const JobInfo &info)
{
    QString state;
    switch (info.state) {
    case JobState::Pending:
        state = QObject::tr("pending");
        break;
    case JobState::Running:
        state = QObject::tr("running");
        break;
    case JobState::Succeeded:
        state = QObject::tr("finished");
        break;
    case JobState::Failed:
        state = QObject::tr("failed");
        break;
    case JobState::Cancelled:
        state = QObject::tr("cancelled");
        break;
    }

    QString line = QObject::tr("%1 %2").arg(jobCategoryToDisplayText(info.category), state);
    if (!info.detail.isEmpty()) {
        line += QObject::tr(": %1").arg(info.detail);
    }
    if (info.rejectedCount > 0) {
        line += QObject::tr(" (%n rejected)", nullptr, info.rejectedCount);
    }
    return line;
}
