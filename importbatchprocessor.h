#ifndef IMPORTBATCHPROCESSOR_H
#define IMPORTBATCHPROCESSOR_H

#include <QString>
#include <QStringList>

#include <memory>

#include "progress.h"

class LibraryContext;

// Sequential driver for importing files into an open library. Sources are
// copied; they are never modified or removed.
class ImportBatchProcessor
{
public:
    explicit ImportBatchProcessor(LibraryContext *context);

    void setThrottle(const ThrottleSettings &throttle);

    // Directories are expanded into the media files below them, skipping
    // hidden entries and symlinks. Order is deterministic.
    static QStringList expandPaths(const QStringList &paths);

    bool run(const QStringList &paths,
             ProgressSink *sink,
             const std::shared_ptr<CancellationToken> &token = nullptr,
             OperationSummary *summary = nullptr,
             QString *errorMessage = nullptr);

private:
    LibraryContext *m_context = nullptr;
    ThrottleSettings m_throttle;
};

#endif // IMPORTBATCHPROCESSOR_H
