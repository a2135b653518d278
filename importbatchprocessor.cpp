#include "importbatchprocessor.h"

#include "ingestiontransaction.h"
#include "librarycontext.h"
#include "mediaprobe.h"
#include "treewalker.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QSet>

ImportBatchProcessor::ImportBatchProcessor(LibraryContext *context)
    : m_context(context)
{
    if (m_context) {
        m_throttle.everyFiles = m_context->config().progressEveryFiles;
        m_throttle.intervalMs = m_context->config().progressIntervalMs;
    }
}

void ImportBatchProcessor::setThrottle(const ThrottleSettings &throttle)
{
    m_throttle = throttle;
}

QStringList ImportBatchProcessor::expandPaths(const QStringList &paths)
{
    QStringList expanded;
    QSet<QString> seen;
    for (const QString &path : paths) {
        const QFileInfo info(path);
        if (!info.isDir()) {
            const QString absolute = QDir::cleanPath(info.absoluteFilePath());
            if (!seen.contains(absolute)) {
                seen.insert(absolute);
                expanded.append(absolute);
            }
            continue;
        }

        TreeWalker walker(info.absoluteFilePath());
        walker.setExclusion(TreeWalker::anyOf({TreeWalker::hiddenEntries(), TreeWalker::symlinks()}));
        for (const QString &file : walker.files()) {
            if (!MediaProbe::isMediaFile(file) || seen.contains(file)) {
                continue;
            }
            seen.insert(file);
            expanded.append(file);
        }
    }
    return expanded;
}

bool ImportBatchProcessor::run(const QStringList &paths,
                               ProgressSink *sink,
                               const std::shared_ptr<CancellationToken> &token,
                               OperationSummary *summary,
                               QString *errorMessage)
{
    if (!m_context || !m_context->isOpen()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("No library is open");
        }
        return false;
    }

    const QStringList files = expandPaths(paths);
    ProgressReporter reporter(OperationKind::Import, sink, m_throttle);
    reporter.start(files.size());

    for (const QString &file : files) {
        if (isCancelled(token)) {
            reporter.summary().cancelled = true;
            qDebug() << "Import cancelled after" << reporter.summary().current << "of" << files.size() << "files";
            break;
        }

        reporter.fileStarted(file);
        if (m_context->isInsideLibrary(file)) {
            reporter.reject(file, Disposition::Duplicate, QStringLiteral("File is already inside the library"));
            reporter.fileFinished();
            continue;
        }

        IngestionTransaction transaction(m_context, file, TransferMode::Copy);
        const IngestionOutcome outcome = transaction.run();
        if (outcome.committed()) {
            ++reporter.summary().succeeded;
        } else {
            reporter.reject(file, outcome.disposition, outcome.message);
        }
        reporter.fileFinished();
    }

    reporter.complete();
    if (summary) {
        *summary = reporter.summary();
    }
    return true;
}
