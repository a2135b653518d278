#ifndef RETAGBATCHPROCESSOR_H
#define RETAGBATCHPROCESSOR_H

#include <QDateTime>
#include <QHash>
#include <QString>
#include <QVector>

#include <memory>

#include "mediatypes.h"
#include "progress.h"

class LibraryContext;

enum class RetagMode {
    Same,       // every asset gets the new date
    Shift,      // the first requested asset moves to the new date, the rest keep their offsets
    Sequence    // assets ordered by capture date get newDate + index * interval
};

QString retagModeToString(RetagMode mode);
RetagMode retagModeFromString(const QString &value, bool *ok = nullptr);

struct RetagRequest
{
    QVector<qint64> assetIds;
    QDateTime newDate;
    RetagMode mode = RetagMode::Same;
    int intervalSeconds = 300;
};

// Applies a new capture date to existing assets one at a time in ascending
// id order. An asset that becomes identical to one already kept is demoted
// to the duplicate trash; an asset whose rewrite fails keeps its old date.
class RetagBatchProcessor
{
public:
    explicit RetagBatchProcessor(LibraryContext *context);

    void setThrottle(const ThrottleSettings &throttle);

    // Target date per asset id. assets must be in request order.
    static QHash<qint64, QDateTime> planTargetDates(const QVector<MediaAsset> &assets, const RetagRequest &request);

    bool run(const RetagRequest &request,
             ProgressSink *sink,
             const std::shared_ptr<CancellationToken> &token = nullptr,
             OperationSummary *summary = nullptr,
             QString *errorMessage = nullptr);

private:
    void retagAsset(const MediaAsset &asset, const QDateTime &targetDate, ProgressReporter *reporter);
    QString stagingPathFor(const QString &extension) const;

    LibraryContext *m_context = nullptr;
    ThrottleSettings m_throttle;
};

#endif // RETAGBATCHPROCESSOR_H
