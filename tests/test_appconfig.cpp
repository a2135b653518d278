#include <gtest/gtest.h>

#include <QTemporaryDir>

#include "appconfig.h"
#include "testsupport.h"

TEST(AppConfigTest, MissingFileGivesDefaults)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    AppConfig config;
    config.progressEveryFiles = 3;
    QString error;
    ASSERT_TRUE(AppConfig::load(dir.filePath(QStringLiteral("absent.json")), &config, &error));
    EXPECT_EQ(config.progressEveryFiles, 25);
    EXPECT_EQ(config.progressIntervalMs, 1000);
    EXPECT_DOUBLE_EQ(config.minFreeSpaceRatio, 0.10);
    EXPECT_EQ(config.exiftoolProgram, QStringLiteral("exiftool"));
}

TEST(AppConfigTest, SavedValuesLoadBack)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("nested/config.json"));

    AppConfig config;
    config.libraryPath = QStringLiteral("/photos");
    config.ffmpegProgram = QStringLiteral("/opt/ffmpeg/bin/ffmpeg");
    config.videoTimeoutMs = 120000;
    config.minFreeSpaceRatio = 0.25;
    QString error;
    ASSERT_TRUE(config.save(path, &error)) << error.toStdString();

    AppConfig loaded;
    ASSERT_TRUE(AppConfig::load(path, &loaded, &error)) << error.toStdString();
    EXPECT_EQ(loaded.libraryPath, QStringLiteral("/photos"));
    EXPECT_EQ(loaded.ffmpegProgram, QStringLiteral("/opt/ffmpeg/bin/ffmpeg"));
    EXPECT_EQ(loaded.videoTimeoutMs, 120000);
    EXPECT_DOUBLE_EQ(loaded.minFreeSpaceRatio, 0.25);
}

TEST(AppConfigTest, PartialFileKeepsOtherDefaultsAndClampsCounts)
{
    const AppConfig config = AppConfig::fromJson(QJsonObject{
        {QStringLiteral("progress_every_files"), 0},
        {QStringLiteral("exiftool"), QStringLiteral("/usr/local/bin/exiftool")},
    });
    EXPECT_EQ(config.progressEveryFiles, 1);
    EXPECT_EQ(config.exiftoolProgram, QStringLiteral("/usr/local/bin/exiftool"));
    EXPECT_EQ(config.imageTimeoutMs, 30000);
}

TEST(AppConfigTest, MalformedFileIsAnError)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("config.json"));
    ASSERT_TRUE(TestSupport::writeFile(path, "{ not json"));

    AppConfig config;
    QString error;
    EXPECT_FALSE(AppConfig::load(path, &config, &error));
    EXPECT_TRUE(error.contains(path));
}
