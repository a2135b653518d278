#include <gtest/gtest.h>

#include <QDir>
#include <QFileInfo>
#include <QTemporaryDir>

#include "assetstore.h"
#include "contenthasher.h"
#include "importbatchprocessor.h"
#include "librarycontext.h"
#include "retagbatchprocessor.h"
#include "testsupport.h"

class RetagBatchProcessorTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(m_sourceDir.isValid());
        ASSERT_TRUE(m_libraryDir.isValid());
        m_context = TestSupport::openLibrary(m_libraryDir.path());
        ASSERT_TRUE(m_context);
    }

    MediaAsset import(const QString &name, const QDateTime &date, const QByteArray &payload)
    {
        const QString path = m_sourceDir.filePath(name);
        EXPECT_TRUE(TestSupport::writeFile(path, TestSupport::fakeMedia(date, payload)));
        ImportBatchProcessor processor(m_context.get());
        OperationSummary summary;
        EXPECT_TRUE(processor.run({path}, nullptr, nullptr, &summary));
        EXPECT_EQ(summary.succeeded, 1);
        return m_context->store()->findByPath(lastPathFor(name));
    }

    QString lastPathFor(const QString &name) const
    {
        for (const MediaAsset &asset : m_context->store()->assets()) {
            if (asset.originalFilename == name) {
                return asset.currentPath;
            }
        }
        return QString();
    }

    OperationSummary retag(const QVector<qint64> &ids, const QDateTime &date, RetagMode mode = RetagMode::Same,
                           int interval = 300)
    {
        RetagRequest request;
        request.assetIds = ids;
        request.newDate = date;
        request.mode = mode;
        request.intervalSeconds = interval;

        RetagBatchProcessor processor(m_context.get());
        OperationSummary summary;
        QString error;
        EXPECT_TRUE(processor.run(request, nullptr, nullptr, &summary, &error)) << error.toStdString();
        return summary;
    }

    QTemporaryDir m_sourceDir;
    QTemporaryDir m_libraryDir;
    std::unique_ptr<LibraryContext> m_context;
};

TEST_F(RetagBatchProcessorTest, ConvergingAssetIsDemotedToTrash)
{
    const MediaAsset first = import(QStringLiteral("first.jpg"), TestSupport::date(2010, 1, 1), "same pixels");
    const MediaAsset second = import(QStringLiteral("second.jpg"), TestSupport::date(2011, 1, 1), "other pixels");
    const MediaAsset third = import(QStringLiteral("third.jpg"), TestSupport::date(2012, 1, 1), "same pixels");
    ASSERT_TRUE(first.isValid());
    ASSERT_TRUE(second.isValid());
    ASSERT_TRUE(third.isValid());

    const QDateTime target = TestSupport::date(2020, 2, 20, 20, 20);
    const OperationSummary summary = retag({third.id, first.id, second.id}, target);

    EXPECT_EQ(summary.succeeded, 2);
    EXPECT_EQ(summary.duplicates, 1);
    EXPECT_EQ(summary.errors, 0);

    const MediaAsset updatedFirst = m_context->store()->findById(first.id);
    const MediaAsset updatedSecond = m_context->store()->findById(second.id);
    ASSERT_TRUE(updatedFirst.isValid());
    ASSERT_TRUE(updatedSecond.isValid());
    EXPECT_FALSE(m_context->store()->findById(third.id).isValid());

    for (const MediaAsset &asset : {updatedFirst, updatedSecond}) {
        EXPECT_EQ(asset.capturedAt, target);
        EXPECT_TRUE(asset.currentPath.startsWith(QLatin1String("2020/2020-02-20/img_20200220_")));
        EXPECT_EQ(ContentHasher::hashFile(m_context->absolutePath(asset.currentPath)), asset.contentHash);
    }
    EXPECT_FALSE(QFileInfo::exists(m_context->absolutePath(first.currentPath)));
    EXPECT_FALSE(QFileInfo::exists(m_context->absolutePath(third.currentPath)));

    const QVector<TrashEntry> entries = m_context->store()->trashEntries();
    ASSERT_EQ(entries.size(), 1);
    EXPECT_EQ(entries.first().category, Disposition::Duplicate);
    EXPECT_EQ(entries.first().originalPath, m_context->absolutePath(third.currentPath));
    EXPECT_TRUE(QFileInfo::exists(QDir(m_context->trashDirectory()).filePath(entries.first().trashPath)));

    // Emptied date folders of the old locations are gone.
    EXPECT_FALSE(QFileInfo::exists(m_context->absolutePath(QStringLiteral("2012"))));
    EXPECT_FALSE(QFileInfo::exists(m_context->absolutePath(QStringLiteral("2010"))));
}

TEST_F(RetagBatchProcessorTest, DemotionIsUndoneWhenRecordCannotBeDeleted)
{
    const MediaAsset first = import(QStringLiteral("first.jpg"), TestSupport::date(2010, 1, 1), "same pixels");
    const MediaAsset second = import(QStringLiteral("second.jpg"), TestSupport::date(2012, 1, 1), "same pixels");
    ASSERT_TRUE(first.isValid());
    ASSERT_TRUE(second.isValid());
    const QByteArray secondBytes = TestSupport::readFile(m_context->absolutePath(second.currentPath));

    ASSERT_TRUE(TestSupport::executeSql(m_context->databasePath(),
                                        QStringLiteral("CREATE TRIGGER keep_photos BEFORE DELETE ON photos "
                                                       "BEGIN SELECT RAISE(ABORT, 'photos are read-only'); END")));

    const OperationSummary summary = retag({first.id, second.id}, TestSupport::date(2020, 2, 20));

    EXPECT_EQ(summary.succeeded, 1);
    EXPECT_EQ(summary.duplicates, 0);
    EXPECT_EQ(summary.errors, 1);
    EXPECT_EQ(summary.count(Disposition::Corrupted), 1);

    // The record is still active and still points at the untouched file.
    const MediaAsset kept = m_context->store()->findById(second.id);
    ASSERT_TRUE(kept.isValid());
    EXPECT_EQ(kept.currentPath, second.currentPath);
    EXPECT_EQ(kept.capturedAt, TestSupport::date(2012, 1, 1));
    EXPECT_EQ(TestSupport::readFile(m_context->absolutePath(kept.currentPath)), secondBytes);

    EXPECT_TRUE(m_context->store()->trashEntries().isEmpty());
    EXPECT_TRUE(TestSupport::filesBelow(m_context->trashDirectory()).isEmpty());
}

TEST_F(RetagBatchProcessorTest, FailedRewriteKeepsOldDate)
{
    const MediaAsset stuck = import(QStringLiteral("stuck.jpg"), TestSupport::date(2010, 5, 5), "NOWRITE");
    const MediaAsset fine = import(QStringLiteral("fine.jpg"), TestSupport::date(2010, 6, 6), "fine");
    const QByteArray before = TestSupport::readFile(m_context->absolutePath(stuck.currentPath));

    const OperationSummary summary = retag({stuck.id, fine.id}, TestSupport::date(2021, 1, 1));
    EXPECT_EQ(summary.succeeded, 1);
    EXPECT_EQ(summary.errors, 1);
    EXPECT_EQ(summary.count(Disposition::UnsupportedFormat), 1);

    const MediaAsset unchanged = m_context->store()->findById(stuck.id);
    EXPECT_EQ(unchanged.capturedAt, stuck.capturedAt);
    EXPECT_EQ(unchanged.currentPath, stuck.currentPath);
    EXPECT_EQ(unchanged.contentHash, stuck.contentHash);
    EXPECT_EQ(TestSupport::readFile(m_context->absolutePath(stuck.currentPath)), before);

    EXPECT_EQ(m_context->store()->findById(fine.id).capturedAt, TestSupport::date(2021, 1, 1));
    EXPECT_TRUE(m_context->store()->trashEntries().isEmpty());
    EXPECT_TRUE(TestSupport::filesBelow(m_context->stagingDirectory()).isEmpty());
}

TEST_F(RetagBatchProcessorTest, UnknownIdsAreReportedNotFatal)
{
    const MediaAsset asset = import(QStringLiteral("a.jpg"), TestSupport::date(2009, 9, 9), "a");
    const OperationSummary summary = retag({asset.id, 9999}, TestSupport::date(2019, 9, 9));
    EXPECT_EQ(summary.total, 2);
    EXPECT_EQ(summary.succeeded, 1);
    EXPECT_EQ(summary.errors, 1);
    ASSERT_EQ(summary.rejected.size(), 1);
    EXPECT_EQ(summary.rejected.first().file, QStringLiteral("asset #9999"));
}

TEST_F(RetagBatchProcessorTest, RetagToCurrentDateKeepsPath)
{
    const MediaAsset asset = import(QStringLiteral("a.jpg"), TestSupport::date(2009, 9, 9), "a");
    const OperationSummary summary = retag({asset.id}, asset.capturedAt);
    EXPECT_EQ(summary.succeeded, 1);
    EXPECT_EQ(summary.duplicates, 0);
    EXPECT_EQ(m_context->store()->findById(asset.id).currentPath, asset.currentPath);
}

TEST_F(RetagBatchProcessorTest, TakesDatabaseBackupFirst)
{
    const MediaAsset asset = import(QStringLiteral("a.jpg"), TestSupport::date(2009, 9, 9), "a");
    retag({asset.id}, TestSupport::date(2019, 1, 1));

    const QStringList backups = QDir(m_context->backupDirectory()).entryList(QDir::Files);
    ASSERT_EQ(backups.size(), 1);
    EXPECT_TRUE(backups.first().contains(QLatin1String("retag")));
}

TEST_F(RetagBatchProcessorTest, InvalidDateIsRejected)
{
    RetagBatchProcessor processor(m_context.get());
    RetagRequest request;
    request.assetIds = {1};
    QString error;
    EXPECT_FALSE(processor.run(request, nullptr, nullptr, nullptr, &error));
    EXPECT_FALSE(error.isEmpty());
}

TEST(RetagPlanTest, ShiftKeepsRelativeOffsets)
{
    MediaAsset a;
    a.id = 4;
    a.capturedAt = TestSupport::date(2000, 1, 1, 10, 0);
    MediaAsset b;
    b.id = 2;
    b.capturedAt = TestSupport::date(2000, 1, 1, 12, 30);

    RetagRequest request;
    request.mode = RetagMode::Shift;
    request.newDate = TestSupport::date(2005, 5, 5, 8, 0);

    const QHash<qint64, QDateTime> plan = RetagBatchProcessor::planTargetDates({a, b}, request);
    EXPECT_EQ(plan.value(4), TestSupport::date(2005, 5, 5, 8, 0));
    EXPECT_EQ(plan.value(2), TestSupport::date(2005, 5, 5, 10, 30));
}

TEST(RetagPlanTest, SequenceFollowsCaptureOrder)
{
    MediaAsset late;
    late.id = 1;
    late.capturedAt = TestSupport::date(2000, 1, 3);
    MediaAsset early;
    early.id = 2;
    early.capturedAt = TestSupport::date(2000, 1, 1);
    MediaAsset tie;
    tie.id = 3;
    tie.capturedAt = TestSupport::date(2000, 1, 1);

    RetagRequest request;
    request.mode = RetagMode::Sequence;
    request.newDate = TestSupport::date(2010, 1, 1, 9, 0);
    request.intervalSeconds = 60;

    const QHash<qint64, QDateTime> plan = RetagBatchProcessor::planTargetDates({late, tie, early}, request);
    EXPECT_EQ(plan.value(2), TestSupport::date(2010, 1, 1, 9, 0));
    EXPECT_EQ(plan.value(3), TestSupport::date(2010, 1, 1, 9, 1));
    EXPECT_EQ(plan.value(1), TestSupport::date(2010, 1, 1, 9, 2));
}

TEST(RetagPlanTest, ModeNamesRoundTrip)
{
    bool ok = false;
    EXPECT_EQ(retagModeFromString(QStringLiteral(" Shift "), &ok), RetagMode::Shift);
    EXPECT_TRUE(ok);
    EXPECT_EQ(retagModeToString(RetagMode::Sequence), QStringLiteral("sequence"));
    retagModeFromString(QStringLiteral("sideways"), &ok);
    EXPECT_FALSE(ok);
}
