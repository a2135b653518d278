#include <gtest/gtest.h>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include "assetstore.h"
#include "importbatchprocessor.h"
#include "librarycontext.h"
#include "testsupport.h"

namespace {

class RecordingSink : public ProgressSink
{
public:
    void publish(const ProgressEvent &event) override { events.append(event); }

    QVector<ProgressEvent> ofType(ProgressEventType type) const
    {
        QVector<ProgressEvent> matching;
        for (const ProgressEvent &event : events) {
            if (event.type == type) {
                matching.append(event);
            }
        }
        return matching;
    }

    QVector<ProgressEvent> events;
};

class CancelAfterSink : public RecordingSink
{
public:
    CancelAfterSink(const std::shared_ptr<CancellationToken> &token, int progressEvents)
        : m_token(token)
        , m_remaining(progressEvents)
    {
    }

    void publish(const ProgressEvent &event) override
    {
        RecordingSink::publish(event);
        if (event.type == ProgressEventType::Progress && --m_remaining == 0) {
            m_token->cancelled.store(true);
        }
    }

private:
    std::shared_ptr<CancellationToken> m_token;
    int m_remaining;
};

}

class ImportBatchProcessorTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(m_sourceDir.isValid());
        ASSERT_TRUE(m_libraryDir.isValid());
        m_context = TestSupport::openLibrary(m_libraryDir.path());
        ASSERT_TRUE(m_context);
    }

    QString source(const QString &relativePath, const QByteArray &contents)
    {
        const QString path = m_sourceDir.filePath(relativePath);
        EXPECT_TRUE(TestSupport::writeFile(path, contents));
        return path;
    }

    QTemporaryDir m_sourceDir;
    QTemporaryDir m_libraryDir;
    std::unique_ptr<LibraryContext> m_context;
};

TEST_F(ImportBatchProcessorTest, BatchWithKnownDuplicates)
{
    // Seed the library with two assets.
    const QStringList seeds = {
        source(QStringLiteral("seed/one.jpg"), TestSupport::fakeMedia(TestSupport::date(2019, 3, 1), "one")),
        source(QStringLiteral("seed/two.mp4"), TestSupport::fakeMedia(TestSupport::date(2019, 3, 2), "two")),
    };
    ImportBatchProcessor seeder(m_context.get());
    OperationSummary seeded;
    ASSERT_TRUE(seeder.run(seeds, nullptr, nullptr, &seeded));
    ASSERT_EQ(seeded.succeeded, 2);

    QStringList batch;
    for (int i = 0; i < 8; ++i) {
        batch.append(source(QStringLiteral("batch/new_%1.jpg").arg(i),
                            TestSupport::fakeMedia(TestSupport::date(2020, 1, i + 1), QByteArray("new ") + QByteArray::number(i))));
    }
    // Byte copies of the stored assets.
    for (const MediaAsset &asset : m_context->store()->assets()) {
        batch.append(source(QStringLiteral("batch/again_%1").arg(asset.originalFilename),
                            TestSupport::readFile(m_context->absolutePath(asset.currentPath))));
    }
    ASSERT_EQ(batch.size(), 10);

    RecordingSink sink;
    ImportBatchProcessor processor(m_context.get());
    OperationSummary summary;
    QString error;
    ASSERT_TRUE(processor.run(batch, &sink, nullptr, &summary, &error)) << error.toStdString();

    EXPECT_EQ(summary.succeeded, 8);
    EXPECT_EQ(summary.duplicates, 2);
    EXPECT_EQ(summary.errors, 0);
    EXPECT_EQ(summary.skipped, 0);
    EXPECT_FALSE(summary.cancelled);
    EXPECT_EQ(m_context->store()->assetCount(), 10);

    int duplicateEntries = 0;
    for (const TrashEntry &entry : m_context->store()->trashEntries()) {
        EXPECT_EQ(entry.category, Disposition::Duplicate);
        ++duplicateEntries;
    }
    EXPECT_EQ(duplicateEntries, 2);

    // Sources are left where they were.
    for (const QString &path : batch) {
        EXPECT_TRUE(QFileInfo::exists(path)) << path.toStdString();
    }

    ASSERT_FALSE(sink.events.isEmpty());
    EXPECT_EQ(sink.events.first().type, ProgressEventType::Start);
    EXPECT_EQ(sink.events.first().total, 10);
    EXPECT_EQ(sink.events.last().type, ProgressEventType::Complete);
    EXPECT_EQ(sink.events.last().succeeded, 8);
    EXPECT_EQ(sink.ofType(ProgressEventType::Rejected).size(), 2);

    const QJsonObject json = summary.toJson();
    EXPECT_EQ(json.value(QStringLiteral("imported")).toInt(), 8);
    EXPECT_EQ(json.value(QStringLiteral("duplicates")).toInt(), 2);
    EXPECT_EQ(json.value(QStringLiteral("errors")).toInt(), 0);
}

TEST_F(ImportBatchProcessorTest, DirectoriesExpandToVisibleMediaOnly)
{
    source(QStringLiteral("album/b.jpg"), TestSupport::fakeMedia(TestSupport::date(2018, 1, 1), "b"));
    source(QStringLiteral("album/a.jpg"), TestSupport::fakeMedia(TestSupport::date(2018, 1, 2), "a"));
    source(QStringLiteral("album/nested/c.mp4"), TestSupport::fakeMedia(TestSupport::date(2018, 1, 3), "c"));
    source(QStringLiteral("album/notes.txt"), "not media");
    source(QStringLiteral("album/.hidden/d.jpg"), TestSupport::fakeMedia(TestSupport::date(2018, 1, 4), "d"));
    source(QStringLiteral("album/.e.jpg"), TestSupport::fakeMedia(TestSupport::date(2018, 1, 5), "e"));
    const QString loose = source(QStringLiteral("loose.jpg"), TestSupport::fakeMedia(TestSupport::date(2018, 1, 6), "f"));

    const QString album = m_sourceDir.filePath(QStringLiteral("album"));
    const QStringList expanded = ImportBatchProcessor::expandPaths({album, loose, album});

    QStringList names;
    for (const QString &path : expanded) {
        EXPECT_TRUE(QFileInfo(path).isAbsolute());
        names.append(QDir(m_sourceDir.path()).relativeFilePath(path));
    }
    names.sort();
    EXPECT_EQ(names, (QStringList{QStringLiteral("album/a.jpg"), QStringLiteral("album/b.jpg"),
                                  QStringLiteral("album/nested/c.mp4"), QStringLiteral("loose.jpg")}));
}

TEST_F(ImportBatchProcessorTest, FilesInsideLibraryAreNotReimported)
{
    const QString path = source(QStringLiteral("a.jpg"), TestSupport::fakeMedia(TestSupport::date(2017, 7, 7), "a"));
    ImportBatchProcessor processor(m_context.get());
    ASSERT_TRUE(processor.run({path}, nullptr));

    const MediaAsset asset = m_context->store()->assets().first();
    OperationSummary summary;
    ASSERT_TRUE(processor.run({m_context->absolutePath(asset.currentPath)}, nullptr, nullptr, &summary));
    EXPECT_EQ(summary.succeeded, 0);
    EXPECT_EQ(summary.duplicates, 1);
    EXPECT_TRUE(m_context->store()->trashEntries().isEmpty());
    EXPECT_TRUE(QFileInfo::exists(m_context->absolutePath(asset.currentPath)));
}

TEST_F(ImportBatchProcessorTest, FailuresAreCategorizedAndBatchContinues)
{
    const QStringList batch = {
        source(QStringLiteral("1.jpg"), TestSupport::fakeMedia(TestSupport::date(2016, 1, 1), "ok")),
        source(QStringLiteral("2.jpg"), TestSupport::corruptMedia()),
        source(QStringLiteral("3.jpg"), TestSupport::fakeMedia(TestSupport::date(2016, 1, 3), "FAIL:timeout")),
        source(QStringLiteral("4.cr2"), TestSupport::fakeMedia(TestSupport::date(2016, 1, 4), "raw")),
        source(QStringLiteral("5.avi"), TestSupport::fakeMedia(TestSupport::date(2016, 1, 5), "old container")),
        source(QStringLiteral("6.jpg"), TestSupport::fakeMedia(TestSupport::date(2016, 1, 6), "ok too")),
    };

    ImportBatchProcessor processor(m_context.get());
    OperationSummary summary;
    ASSERT_TRUE(processor.run(batch, nullptr, nullptr, &summary));

    EXPECT_EQ(summary.succeeded, 2);
    EXPECT_EQ(summary.errors, 3);
    EXPECT_EQ(summary.skipped, 1);
    EXPECT_EQ(summary.count(Disposition::Corrupted), 1);
    EXPECT_EQ(summary.count(Disposition::Timeout), 1);
    EXPECT_EQ(summary.count(Disposition::RawSkipped), 1);
    EXPECT_EQ(summary.count(Disposition::UnsupportedFormat), 1);
    EXPECT_EQ(summary.rejected.size(), 4);
    EXPECT_EQ(m_context->store()->assetCount(), 2);
    EXPECT_TRUE(TestSupport::filesBelow(m_context->stagingDirectory()).isEmpty());
}

TEST_F(ImportBatchProcessorTest, CancellationStopsBetweenFiles)
{
    QStringList batch;
    for (int i = 0; i < 6; ++i) {
        batch.append(source(QStringLiteral("%1.jpg").arg(i),
                            TestSupport::fakeMedia(TestSupport::date(2015, 2, i + 1), QByteArray::number(i))));
    }

    auto token = std::make_shared<CancellationToken>();
    CancelAfterSink sink(token, 2);
    ImportBatchProcessor processor(m_context.get());
    processor.setThrottle(ThrottleSettings{1, 0});

    OperationSummary summary;
    ASSERT_TRUE(processor.run(batch, &sink, token, &summary));
    EXPECT_TRUE(summary.cancelled);
    EXPECT_LT(summary.succeeded, 6);
    EXPECT_GT(summary.succeeded, 0);
    EXPECT_EQ(m_context->store()->assetCount(), summary.succeeded);
    EXPECT_TRUE(TestSupport::filesBelow(m_context->stagingDirectory()).isEmpty());
    ASSERT_FALSE(sink.events.isEmpty());
    EXPECT_EQ(sink.events.last().type, ProgressEventType::Complete);
    EXPECT_TRUE(sink.events.last().cancelled);
}

TEST_F(ImportBatchProcessorTest, ClosedLibraryIsAnError)
{
    m_context->close();
    ImportBatchProcessor processor(m_context.get());
    QString error;
    EXPECT_FALSE(processor.run({source(QStringLiteral("a.jpg"), TestSupport::fakeMedia(QDateTime(), "a"))}, nullptr, nullptr,
                               nullptr, &error));
    EXPECT_FALSE(error.isEmpty());
}
