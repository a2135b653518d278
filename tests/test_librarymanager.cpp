#include <gtest/gtest.h>

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QTemporaryDir>

#include "jobmanager.h"
#include "librarymanager.h"
#include "testsupport.h"

class LibraryManagerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(m_sourceDir.isValid());
        ASSERT_TRUE(m_libraryDir.isValid());
        m_manager.setToolFactory([]() { return TestSupport::fakeTools(); });
        m_manager.setJobManager(&m_jobs);
    }

    QString source(const QString &name, const QByteArray &contents)
    {
        const QString path = m_sourceDir.filePath(name);
        EXPECT_TRUE(TestSupport::writeFile(path, contents));
        return path;
    }

    QTemporaryDir m_sourceDir;
    QTemporaryDir m_libraryDir;
    JobManager m_jobs;
    LibraryManager m_manager;
};

TEST_F(LibraryManagerTest, CreateThenOpenLibrary)
{
    QString error;
    ASSERT_TRUE(m_manager.createLibrary(m_libraryDir.path(), &error)) << error.toStdString();
    EXPECT_TRUE(m_manager.hasOpenLibrary());
    EXPECT_TRUE(QFileInfo::exists(QDir(m_libraryDir.path()).filePath(LibraryContext::databaseFileName())));

    EXPECT_FALSE(m_manager.createLibrary(m_libraryDir.path(), &error));
    EXPECT_FALSE(error.isEmpty());

    m_manager.closeLibrary();
    EXPECT_FALSE(m_manager.hasOpenLibrary());
    ASSERT_TRUE(m_manager.openLibrary(m_libraryDir.path(), &error)) << error.toStdString();

    QTemporaryDir plain;
    ASSERT_TRUE(plain.isValid());
    EXPECT_FALSE(m_manager.openLibrary(plain.path(), &error));
    EXPECT_TRUE(m_manager.hasOpenLibrary());
}

TEST_F(LibraryManagerTest, ImportStreamsEventsThroughChannel)
{
    ASSERT_TRUE(m_manager.createLibrary(m_libraryDir.path()));
    const QStringList files = {
        source(QStringLiteral("a.jpg"), TestSupport::fakeMedia(TestSupport::date(2022, 1, 1), "a")),
        source(QStringLiteral("b.jpg"), TestSupport::fakeMedia(TestSupport::date(2022, 1, 2), "b")),
        source(QStringLiteral("c.jpg"), TestSupport::corruptMedia()),
    };

    OperationSummary finished;
    bool finishedEmitted = false;
    QObject::connect(&m_manager, &LibraryManager::operationFinished, [&](const OperationSummary &summary) {
        finished = summary;
        finishedEmitted = true;
    });

    const QSharedPointer<ProgressChannel> channel = m_manager.importFiles(files);
    ASSERT_TRUE(channel);
    EXPECT_TRUE(m_manager.isBusy());

    QVector<ProgressEvent> events;
    ProgressEvent event;
    while (channel->next(&event, 10000)) {
        events.append(event);
    }
    m_manager.waitForActiveOperation();

    ASSERT_FALSE(events.isEmpty());
    EXPECT_EQ(events.first().type, ProgressEventType::Start);
    EXPECT_EQ(events.last().type, ProgressEventType::Complete);
    EXPECT_EQ(events.last().succeeded, 2);
    EXPECT_EQ(events.last().errors, 1);

    EXPECT_TRUE(finishedEmitted);
    EXPECT_EQ(finished.kind, OperationKind::Import);
    EXPECT_EQ(finished.succeeded, 2);
    EXPECT_FALSE(m_manager.isBusy());
    EXPECT_EQ(m_manager.assets().size(), 2);
    EXPECT_EQ(m_manager.trashEntries().size(), 1);

    // Queued job updates arrive through the event loop.
    QCoreApplication::processEvents();
    const QVector<JobInfo> jobs = m_jobs.jobs();
    ASSERT_EQ(jobs.size(), 1);
    EXPECT_EQ(jobs.first().category, JobCategory::Import);
    EXPECT_EQ(jobs.first().state, JobState::Succeeded);
    EXPECT_EQ(jobs.first().rejectedCount, 1);
}

TEST_F(LibraryManagerTest, RetagRunsAgainstOpenLibrary)
{
    ASSERT_TRUE(m_manager.createLibrary(m_libraryDir.path()));
    m_manager.importFiles({source(QStringLiteral("a.jpg"), TestSupport::fakeMedia(TestSupport::date(2022, 5, 5), "a"))});
    m_manager.waitForActiveOperation();
    ASSERT_EQ(m_manager.assets().size(), 1);
    const MediaAsset asset = m_manager.assets().first();

    const QSharedPointer<ProgressChannel> channel =
        m_manager.retagAssets({asset.id}, TestSupport::date(2023, 3, 3, 3, 3, 3));
    ASSERT_TRUE(channel);
    m_manager.waitForActiveOperation();

    const MediaAsset updated = m_manager.assets().first();
    EXPECT_EQ(updated.capturedAt, TestSupport::date(2023, 3, 3, 3, 3, 3));
    EXPECT_TRUE(QFileInfo::exists(m_manager.resolvePath(updated.currentPath)));
    EXPECT_TRUE(channel->isClosed());
}

TEST_F(LibraryManagerTest, OnlyOneOperationAtATime)
{
    ASSERT_TRUE(m_manager.createLibrary(m_libraryDir.path()));
    QStringList files;
    for (int i = 0; i < 20; ++i) {
        files.append(source(QStringLiteral("%1.jpg").arg(i), TestSupport::fakeMedia(TestSupport::date(2022, 2, 1 + i), QByteArray::number(i))));
    }

    QStringList errors;
    QObject::connect(&m_manager, &LibraryManager::errorOccurred, [&errors](const QString &message) { errors.append(message); });

    const QSharedPointer<ProgressChannel> first = m_manager.importFiles(files);
    ASSERT_TRUE(first);
    const QSharedPointer<ProgressChannel> second = m_manager.importFiles(files);
    EXPECT_FALSE(second);
    EXPECT_EQ(errors.size(), 1);

    m_manager.waitForActiveOperation();
    EXPECT_EQ(m_manager.assets().size(), 20);
}

TEST_F(LibraryManagerTest, ImportWithoutLibraryReportsError)
{
    QStringList errors;
    QObject::connect(&m_manager, &LibraryManager::errorOccurred, [&errors](const QString &message) { errors.append(message); });
    EXPECT_FALSE(m_manager.importFiles({source(QStringLiteral("a.jpg"), "x")}));
    EXPECT_EQ(errors.size(), 1);
}

TEST_F(LibraryManagerTest, TerraformOfFolderWithoutToolsFails)
{
    m_manager.setToolFactory([]() { return TestSupport::fakeTools(false); });
    source(QStringLiteral("a.jpg"), TestSupport::fakeMedia(TestSupport::date(2022, 1, 1), "a"));

    QString reported;
    QObject::connect(&m_manager, &LibraryManager::errorOccurred, [&reported](const QString &message) { reported = message; });
    ASSERT_TRUE(m_manager.terraform(m_sourceDir.path()));
    m_manager.waitForActiveOperation();

    EXPECT_TRUE(reported.contains(QLatin1String("not available")));
    EXPECT_TRUE(QFileInfo::exists(m_sourceDir.filePath(QStringLiteral("a.jpg"))));
    EXPECT_FALSE(LibraryContext::isLibrary(m_sourceDir.path()));
}

TEST(LibraryArgumentTest, FirstOperandNamesLibraryWithoutConfiguredOne)
{
    QStringList operands;
    EXPECT_EQ(LibraryContext::splitLibraryArgument({QStringLiteral("/lib"), QStringLiteral("a.jpg")}, QString(), &operands),
              QStringLiteral("/lib"));
    EXPECT_EQ(operands, QStringList{QStringLiteral("a.jpg")});

    EXPECT_TRUE(LibraryContext::splitLibraryArgument({}, QString(), &operands).isEmpty());
    EXPECT_TRUE(operands.isEmpty());
}

TEST(LibraryArgumentTest, ConfiguredLibraryKeepsEveryPath)
{
    QTemporaryDir sources;
    ASSERT_TRUE(sources.isValid());
    const QString a = sources.filePath(QStringLiteral("a.jpg"));
    const QString b = sources.filePath(QStringLiteral("b.jpg"));

    QStringList operands;
    EXPECT_EQ(LibraryContext::splitLibraryArgument({a, b}, QStringLiteral("/configured"), &operands),
              QStringLiteral("/configured"));
    EXPECT_EQ(operands, (QStringList{a, b}));

    EXPECT_EQ(LibraryContext::splitLibraryArgument({}, QStringLiteral("/configured"), &operands),
              QStringLiteral("/configured"));
    EXPECT_TRUE(operands.isEmpty());
}

TEST(LibraryArgumentTest, ExplicitLibraryOverridesConfiguredOne)
{
    QTemporaryDir library;
    ASSERT_TRUE(library.isValid());
    ASSERT_TRUE(TestSupport::openLibrary(library.path()));

    QStringList operands;
    EXPECT_EQ(LibraryContext::splitLibraryArgument({library.path(), QStringLiteral("a.jpg")},
                                                   QStringLiteral("/configured"), &operands),
              library.path());
    EXPECT_EQ(operands, QStringList{QStringLiteral("a.jpg")});
}
