#include <gtest/gtest.h>

#include <QCryptographicHash>
#include <QDir>
#include <QTemporaryDir>

#include "contenthasher.h"
#include "testsupport.h"

TEST(ContentHasherTest, MatchesSha256OfContents)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("a.jpg"));
    const QByteArray contents = QByteArray(3 * 1024 * 1024 + 17, 'x');
    ASSERT_TRUE(TestSupport::writeFile(path, contents));

    QString error;
    const QString hash = ContentHasher::hashFile(path, &error);
    EXPECT_TRUE(error.isEmpty());
    EXPECT_EQ(hash, QString::fromLatin1(QCryptographicHash::hash(contents, QCryptographicHash::Sha256).toHex()));
    EXPECT_EQ(hash.size(), 64);
}

TEST(ContentHasherTest, EmptyFileHasWellKnownDigest)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("empty.png"));
    ASSERT_TRUE(TestSupport::writeFile(path, QByteArray()));
    EXPECT_EQ(ContentHasher::hashFile(path),
              QStringLiteral("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"));
}

TEST(ContentHasherTest, MissingFileReportsError)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    QString error;
    EXPECT_TRUE(ContentHasher::hashFile(dir.filePath(QStringLiteral("nope.jpg")), &error).isEmpty());
    EXPECT_FALSE(error.isEmpty());
}

TEST(ContentHasherTest, ShortHashIsLowercasePrefix)
{
    EXPECT_EQ(ContentHasher::shortHash(QStringLiteral("DEADBEEFCAFE")), QStringLiteral("deadbeef"));
}
