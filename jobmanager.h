#ifndef JOBMANAGER_H
#define JOBMANAGER_H

#include <QObject>
#include <QDateTime>
#include <QHash>
#include <QList>
#include <QString>
#include <QUuid>
#include <QVector>

#include "progress.h"

enum class JobState {
    Pending,
    Running,
    Succeeded,
    Failed,
    Cancelled
};

enum class JobCategory {
    Import,
    Retag,
    Terraform,
    Misc
};

struct JobInfo {
    QUuid id;
    JobCategory category = JobCategory::Misc;
    JobState state = JobState::Pending;
    QString title;
    QString detail;
    int progress = -1;          // 0 - 100, -1 for indeterminate
    int completedSteps = 0;
    int totalSteps = -1;
    bool indeterminate = true;
    int rejectedCount = 0;
    QDateTime startedAt;
    QDateTime finishedAt;
};

class JobManager : public QObject
{
    Q_OBJECT
public:
    explicit JobManager(QObject *parent = nullptr);

    QUuid startJob(JobCategory category, const QString &title, const QString &detail = QString());
    void updateProgress(const QUuid &id, int completedSteps, int totalSteps = -1);
    void completeJob(const QUuid &id, const QString &detail = QString());
    void failJob(const QUuid &id, const QString &errorDetail);
    void cancelJob(const QUuid &id, const QString &detail = QString());

    // Folds one event of an operation's progress stream into the job.
    void applyEvent(const QUuid &id, const ProgressEvent &event);

    QVector<JobInfo> jobs() const;
    JobInfo job(const QUuid &id) const;
    int activeJobCount() const;

    static JobCategory categoryFor(OperationKind kind);

signals:
    void jobAdded(const JobInfo &info);
    void jobUpdated(const JobInfo &info);
    void jobRemoved(const QUuid &id);

private:
    struct JobEntry {
        JobInfo info;
        bool removalScheduled = false;
    };

    JobInfo *findJob(const QUuid &id);
    const JobInfo *findJob(const QUuid &id) const;
    void updateJobState(JobInfo &info, JobState newState);
    void publishUpdate(const JobInfo &info);
    void scheduleRemoval(const QUuid &id, int delayMs);

    QHash<QUuid, JobEntry> m_jobs;
    QList<QUuid> m_order;
};

QString jobCategoryToDisplayText(JobCategory category);
bool jobStateIsFinal(JobState state);
// One line for a terminal, e.g. "Import finished: 8 imported, ... (2 rejected)".
QString jobSummaryLine(const JobInfo &info);

#endif // JOBMANAGER_H
