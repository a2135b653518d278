#include <gtest/gtest.h>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include "contenthasher.h"
#include "metadatanormalizer.h"
#include "testsupport.h"

class MetadataNormalizerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(m_dir.isValid());
    }

    QString makeFile(const QString &name, const QByteArray &contents)
    {
        const QString path = m_dir.filePath(name);
        EXPECT_TRUE(TestSupport::writeFile(path, contents));
        return path;
    }

    QStringList leftovers() const
    {
        return QDir(m_dir.path()).entryList(QDir::Files | QDir::Hidden | QDir::NoDotAndDotDot);
    }

    QTemporaryDir m_dir;
    FakeMetadataTool m_imageTool{QStringLiteral("fake-exiftool")};
    FakeMetadataTool m_videoTool{QStringLiteral("fake-ffmpeg")};
    MetadataNormalizer m_normalizer{&m_imageTool, &m_videoTool};
};

TEST_F(MetadataNormalizerTest, RewritesCaptureDateInPlace)
{
    const QString path = makeFile(QStringLiteral("photo.jpg"),
                                  TestSupport::fakeMedia(TestSupport::date(2001, 1, 1), "pixels"));
    const QDateTime target = TestSupport::date(2022, 2, 22, 22, 22, 22);

    ToolFailure failure;
    ASSERT_TRUE(m_normalizer.normalize(path, target, &failure)) << failure.message.toStdString();
    EXPECT_EQ(TestSupport::readFile(path), TestSupport::fakeMedia(target, "pixels"));
    EXPECT_EQ(leftovers(), QStringList{QStringLiteral("photo.jpg")});
}

TEST_F(MetadataNormalizerTest, UsesVideoToolForVideos)
{
    const QString path = makeFile(QStringLiteral("clip.mp4"), TestSupport::fakeMedia(QDateTime(), "frames"));
    ASSERT_TRUE(m_normalizer.normalize(path, TestSupport::date(2018, 3, 3)));
    EXPECT_EQ(m_videoTool.writeCount(), 1);
    EXPECT_EQ(m_imageTool.writeCount(), 0);
}

TEST_F(MetadataNormalizerTest, RejectsRawWithoutCallingTool)
{
    const QString path = makeFile(QStringLiteral("shot.CR2"), TestSupport::fakeMedia(QDateTime(), "raw"));
    ToolFailure failure;
    EXPECT_FALSE(m_normalizer.normalize(path, TestSupport::date(2018, 3, 3), &failure));
    EXPECT_EQ(failure.category, Disposition::RawSkipped);
    EXPECT_EQ(m_imageTool.writeCount(), 0);
}

TEST_F(MetadataNormalizerTest, RejectsUnsupportedContainers)
{
    const QString path = makeFile(QStringLiteral("old.avi"), TestSupport::fakeMedia(QDateTime(), "frames"));
    EXPECT_EQ(m_normalizer.checkFormat(path).category, Disposition::UnsupportedFormat);

    const QString text = makeFile(QStringLiteral("notes.txt"), "hello");
    EXPECT_EQ(m_normalizer.checkFormat(text).category, Disposition::UnsupportedFormat);
}

TEST_F(MetadataNormalizerTest, MissingToolIsReported)
{
    m_imageTool.setAvailable(false);
    const QString path = makeFile(QStringLiteral("photo.jpg"), TestSupport::fakeMedia(QDateTime(), "pixels"));
    ToolFailure failure;
    EXPECT_FALSE(m_normalizer.normalize(path, TestSupport::date(2018, 3, 3), &failure));
    EXPECT_EQ(failure.category, Disposition::MissingTool);
}

TEST_F(MetadataNormalizerTest, FailedWriteLeavesFileUntouched)
{
    const QByteArray original = TestSupport::fakeMedia(TestSupport::date(2001, 1, 1), "FAIL:timeout");
    const QString path = makeFile(QStringLiteral("slow.jpg"), original);

    ToolFailure failure;
    EXPECT_FALSE(m_normalizer.normalize(path, TestSupport::date(2018, 3, 3), &failure));
    EXPECT_EQ(failure.category, Disposition::Timeout);
    EXPECT_EQ(TestSupport::readFile(path), original);
    EXPECT_EQ(leftovers(), QStringList{QStringLiteral("slow.jpg")});
}

TEST_F(MetadataNormalizerTest, UnverifiedWriteIsRejected)
{
    const QByteArray original = TestSupport::fakeMedia(TestSupport::date(2001, 1, 1), "NOWRITE");
    const QString path = makeFile(QStringLiteral("stubborn.jpg"), original);

    ToolFailure failure;
    EXPECT_FALSE(m_normalizer.normalize(path, TestSupport::date(2018, 3, 3), &failure));
    EXPECT_EQ(failure.category, Disposition::UnsupportedFormat);
    EXPECT_EQ(TestSupport::readFile(path), original);
    EXPECT_EQ(leftovers(), QStringList{QStringLiteral("stubborn.jpg")});
}

TEST_F(MetadataNormalizerTest, CorruptFileIsCorrupted)
{
    const QString path = makeFile(QStringLiteral("broken.jpg"), TestSupport::corruptMedia());
    ToolFailure failure;
    EXPECT_FALSE(m_normalizer.normalize(path, TestSupport::date(2018, 3, 3), &failure));
    EXPECT_EQ(failure.category, Disposition::Corrupted);
}

TEST_F(MetadataNormalizerTest, EmptyFileIsCorrupted)
{
    const QString path = makeFile(QStringLiteral("empty.jpg"), QByteArray());
    EXPECT_EQ(m_normalizer.precheck(path).category, Disposition::Corrupted);
}

TEST_F(MetadataNormalizerTest, NormalizationConvergesDistinctFiles)
{
    const QString first = makeFile(QStringLiteral("x.jpg"), TestSupport::fakeMedia(TestSupport::date(2001, 1, 1), "same"));
    const QString second = makeFile(QStringLiteral("y.jpg"), TestSupport::fakeMedia(TestSupport::date(2002, 2, 2), "same"));
    ASSERT_NE(ContentHasher::hashFile(first), ContentHasher::hashFile(second));

    const QDateTime target = TestSupport::date(2010, 10, 10);
    ASSERT_TRUE(m_normalizer.normalize(first, target));
    ASSERT_TRUE(m_normalizer.normalize(second, target));
    EXPECT_EQ(ContentHasher::hashFile(first), ContentHasher::hashFile(second));
}
