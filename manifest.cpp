#include "manifest.h"

#include "fileoperations.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QHash>
#include <QJsonDocument>

#include <algorithm>

namespace {
constexpr auto kManifestPrefix = "terraform_";
constexpr auto kManifestSuffix = ".jsonl";

void insertIfSet(QJsonObject *object, const char *key, const QString &value)
{
    if (!value.isEmpty()) {
        object->insert(QLatin1String(key), value);
    }
}
}

QJsonObject ManifestRecord::toJson() const
{
    QJsonObject object = extra;
    object.insert(QStringLiteral("timestamp"), timestamp.toString(Qt::ISODateWithMs));
    object.insert(QStringLiteral("event"), manifestEventToString(event));
    insertIfSet(&object, "original_path", originalPath);
    insertIfSet(&object, "staged_path", stagedPath);
    insertIfSet(&object, "new_path", newPath);
    insertIfSet(&object, "hash", hash);
    insertIfSet(&object, "reason", reason);
    insertIfSet(&object, "trash_path", trashPath);
    insertIfSet(&object, "step", step);
    if (category != Disposition::None) {
        object.insert(QStringLiteral("category"), dispositionToString(category));
    }
    return object;
}

ManifestRecord ManifestRecord::fromJson(const QJsonObject &object, bool *ok)
{
    ManifestRecord record;
    bool eventOk = false;
    record.event = manifestEventFromString(object.value(QStringLiteral("event")).toString(), &eventOk);
    record.timestamp = QDateTime::fromString(object.value(QStringLiteral("timestamp")).toString(), Qt::ISODateWithMs);
    record.originalPath = object.value(QStringLiteral("original_path")).toString();
    record.stagedPath = object.value(QStringLiteral("staged_path")).toString();
    record.newPath = object.value(QStringLiteral("new_path")).toString();
    record.hash = object.value(QStringLiteral("hash")).toString();
    record.reason = object.value(QStringLiteral("reason")).toString();
    record.trashPath = object.value(QStringLiteral("trash_path")).toString();
    record.step = object.value(QStringLiteral("step")).toString();
    record.category = dispositionFromString(object.value(QStringLiteral("category")).toString());

    static const QStringList knownKeys = {
        QStringLiteral("timestamp"), QStringLiteral("event"), QStringLiteral("original_path"),
        QStringLiteral("staged_path"), QStringLiteral("new_path"), QStringLiteral("hash"),
        QStringLiteral("reason"), QStringLiteral("trash_path"), QStringLiteral("step"),
        QStringLiteral("category")
    };
    for (auto it = object.begin(); it != object.end(); ++it) {
        if (!knownKeys.contains(it.key())) {
            record.extra.insert(it.key(), it.value());
        }
    }

    if (ok) {
        *ok = eventOk;
    }
    return record;
}

QString manifestEventToString(ManifestEvent event)
{
    switch (event) {
    case ManifestEvent::Start:
        return QStringLiteral("start");
    case ManifestEvent::Processing:
        return QStringLiteral("processing");
    case ManifestEvent::Success:
        return QStringLiteral("success");
    case ManifestEvent::Failed:
        return QStringLiteral("failed");
    case ManifestEvent::Skipped:
        return QStringLiteral("skipped");
    case ManifestEvent::Complete:
        return QStringLiteral("complete");
    }
    return QStringLiteral("processing");
}

ManifestEvent manifestEventFromString(const QString &value, bool *ok)
{
    if (ok) {
        *ok = true;
    }
    if (value == QLatin1String("start")) {
        return ManifestEvent::Start;
    }
    if (value == QLatin1String("processing")) {
        return ManifestEvent::Processing;
    }
    if (value == QLatin1String("success")) {
        return ManifestEvent::Success;
    }
    if (value == QLatin1String("failed")) {
        return ManifestEvent::Failed;
    }
    if (value == QLatin1String("skipped")) {
        return ManifestEvent::Skipped;
    }
    if (value == QLatin1String("complete")) {
        return ManifestEvent::Complete;
    }
    if (ok) {
        *ok = false;
    }
    return ManifestEvent::Processing;
}

Manifest::Manifest() = default;

Manifest::~Manifest()
{
    close();
}

bool Manifest::open(const QString &directory, const QDateTime &startedAt, QString *errorMessage)
{
    close();
    if (!FileOperations::ensureDirectory(directory, errorMessage)) {
        return false;
    }

    const QString path = FileOperations::uniqueFilePath(directory, fileNameFor(startedAt));
    m_file.setFileName(path);
    if (!m_file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Unable to open manifest %1: %2").arg(path, m_file.errorString());
        }
        return false;
    }
    return true;
}

void Manifest::close()
{
    if (m_file.isOpen()) {
        m_file.close();
    }
}

bool Manifest::isOpen() const
{
    return m_file.isOpen();
}

QString Manifest::filePath() const
{
    return m_file.fileName();
}

bool Manifest::append(const ManifestRecord &record, QString *errorMessage)
{
    if (!m_file.isOpen()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Manifest is not open");
        }
        return false;
    }

    ManifestRecord stamped = record;
    if (!stamped.timestamp.isValid()) {
        stamped.timestamp = QDateTime::currentDateTime();
    }

    QByteArray line = QJsonDocument(stamped.toJson()).toJson(QJsonDocument::Compact);
    line.append('\n');
    if (m_file.write(line) != line.size() || !m_file.flush()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Failed to append to manifest %1: %2").arg(m_file.fileName(), m_file.errorString());
        }
        return false;
    }
    return true;
}

QString Manifest::fileNameFor(const QDateTime &startedAt)
{
    return QString::fromLatin1(kManifestPrefix)
        + startedAt.toString(QStringLiteral("yyyyMMdd_HHmmss"))
        + QString::fromLatin1(kManifestSuffix);
}

QStringList Manifest::manifestFiles(const QString &directory)
{
    QDir dir(directory);
    const QStringList names = dir.entryList({QString::fromLatin1(kManifestPrefix) + QLatin1Char('*') + QString::fromLatin1(kManifestSuffix)},
                                            QDir::Files, QDir::Name);
    QStringList paths;
    for (const QString &name : names) {
        paths.append(dir.filePath(name));
    }
    return paths;
}

QVector<ManifestRecord> Manifest::readFile(const QString &filePath, QString *errorMessage)
{
    QVector<ManifestRecord> records;
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Unable to read manifest %1: %2").arg(filePath, file.errorString());
        }
        return records;
    }

    int lineNumber = 0;
    while (!file.atEnd()) {
        const QByteArray line = file.readLine().trimmed();
        ++lineNumber;
        if (line.isEmpty()) {
            continue;
        }
        QJsonParseError parseError;
        const QJsonDocument document = QJsonDocument::fromJson(line, &parseError);
        if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
            // A crash can leave a partially written last line.
            qWarning() << "Ignoring malformed manifest line" << lineNumber << "in" << filePath;
            continue;
        }
        bool ok = false;
        const ManifestRecord record = ManifestRecord::fromJson(document.object(), &ok);
        if (ok) {
            records.append(record);
        }
    }
    return records;
}

QVector<ManifestRecord> Manifest::readUnfinishedRuns(const QString &directory)
{
    QVector<QVector<ManifestRecord>> runs;
    for (const QString &path : manifestFiles(directory)) {
        const QVector<ManifestRecord> run = readFile(path);
        const bool finished = std::any_of(run.cbegin(), run.cend(), [](const ManifestRecord &record) {
            return record.event == ManifestEvent::Complete;
        });
        if (finished) {
            runs.clear();
        } else {
            runs.append(run);
        }
    }

    QVector<ManifestRecord> records;
    for (const QVector<ManifestRecord> &run : std::as_const(runs)) {
        records += run;
    }
    return records;
}

ResumeState Manifest::computeResumeState(const QVector<ManifestRecord> &records)
{
    ResumeState state;
    QHash<QString, int> pendingIndex;
    QVector<ManifestRecord> pending;

    for (const ManifestRecord &record : records) {
        switch (record.event) {
        case ManifestEvent::Processing: {
            const auto it = pendingIndex.constFind(record.originalPath);
            if (it != pendingIndex.constEnd()) {
                ManifestRecord &existing = pending[it.value()];
                // Keep the most informative view of the in-flight file.
                if (!record.stagedPath.isEmpty()) {
                    existing.stagedPath = record.stagedPath;
                }
                if (!record.newPath.isEmpty()) {
                    existing.newPath = record.newPath;
                }
                if (!record.hash.isEmpty()) {
                    existing.hash = record.hash;
                }
                existing.step = record.step;
                existing.timestamp = record.timestamp;
            } else {
                pendingIndex.insert(record.originalPath, pending.size());
                pending.append(record);
            }
            break;
        }
        case ManifestEvent::Success:
            state.settledInPlace.remove(record.originalPath);
            pendingIndex.remove(record.originalPath);
            break;
        case ManifestEvent::Failed:
        case ManifestEvent::Skipped:
            // A trashed file vacated its path; anything there now is new.
            if (record.trashPath.isEmpty()) {
                state.settledInPlace.insert(record.originalPath);
            } else {
                state.settledInPlace.remove(record.originalPath);
            }
            pendingIndex.remove(record.originalPath);
            break;
        case ManifestEvent::Start:
        case ManifestEvent::Complete:
            break;
        }
    }

    QList<int> indexes = pendingIndex.values();
    std::sort(indexes.begin(), indexes.end());
    for (int index : std::as_const(indexes)) {
        state.interrupted.append(pending.at(index));
    }
    return state;
}
