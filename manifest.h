#ifndef MANIFEST_H
#define MANIFEST_H

#include <QDateTime>
#include <QFile>
#include <QJsonObject>
#include <QSet>
#include <QString>
#include <QVector>

#include "mediatypes.h"

enum class ManifestEvent {
    Start,
    Processing,
    Success,
    Failed,
    Skipped,
    Complete
};

struct ManifestRecord
{
    QDateTime timestamp;
    ManifestEvent event = ManifestEvent::Processing;
    QString originalPath;
    QString stagedPath;
    QString newPath;
    QString hash;
    QString reason;
    QString trashPath;
    QString step;
    Disposition category = Disposition::None;
    QJsonObject extra;

    QJsonObject toJson() const;
    static ManifestRecord fromJson(const QJsonObject &object, bool *ok = nullptr);
};

QString manifestEventToString(ManifestEvent event);
ManifestEvent manifestEventFromString(const QString &value, bool *ok = nullptr);

// What unfinished earlier runs left behind.
struct ResumeState
{
    // Original paths that were rejected but whose file stayed where it was,
    // so a resumed run does not reject them again.
    QSet<QString> settledInPlace;
    // Last "processing" record of each file that never reached a terminal
    // record, in log order.
    QVector<ManifestRecord> interrupted;
};

// Append-only newline-delimited JSON log of one terraform run.
class Manifest
{
public:
    Manifest();
    ~Manifest();

    bool open(const QString &directory, const QDateTime &startedAt, QString *errorMessage = nullptr);
    void close();
    bool isOpen() const;
    QString filePath() const;

    // Each record is flushed before this returns.
    bool append(const ManifestRecord &record, QString *errorMessage = nullptr);

    static QString fileNameFor(const QDateTime &startedAt);
    static QStringList manifestFiles(const QString &directory);
    static QVector<ManifestRecord> readFile(const QString &filePath, QString *errorMessage = nullptr);
    // Records of the runs started after the newest run that reached its
    // complete record, oldest first. Finished runs need no recovery.
    static QVector<ManifestRecord> readUnfinishedRuns(const QString &directory);
    static ResumeState computeResumeState(const QVector<ManifestRecord> &records);

private:
    Q_DISABLE_COPY(Manifest)

    QFile m_file;
};

#endif // MANIFEST_H
