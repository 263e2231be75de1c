#include <QDir>
#include <QFile>
#include <QTemporaryDir>
#include <QUrl>

#include <gtest/gtest.h>

import baran.core.types;
import baran.utils.download_utils;
import baran.utils.category_utils;
import baran.utils.format_utils;
import baran.utils.network_utils;

namespace utils = baran::utils;

TEST(FormatUtils, SpeedUsesBinaryUnits)
{
    EXPECT_EQ(utils::formatSpeed(0), QStringLiteral("0 B/s"));
    EXPECT_EQ(utils::formatSpeed(512), QStringLiteral("512.00 B/s"));
    EXPECT_EQ(utils::formatSpeed(1536), QStringLiteral("1.50 KB/s"));
    EXPECT_EQ(utils::formatSpeed(5LL * 1024 * 1024), QStringLiteral("5.00 MB/s"));
}

TEST(FormatUtils, EtaSwitchesUnitsAtMinuteAndHour)
{
    EXPECT_EQ(utils::formatEta(59), QStringLiteral("59s"));
    EXPECT_EQ(utils::formatEta(125), QStringLiteral("2m 5s"));
    EXPECT_EQ(utils::formatEta(3725), QStringLiteral("1h 2m"));
    EXPECT_EQ(utils::formatEta(-4), QStringLiteral("0s"));
}

TEST(FormatUtils, ParsesExtractorSizes)
{
    EXPECT_EQ(utils::parseBytes(QStringLiteral("12.5MiB")), 13107200);
    EXPECT_EQ(utils::parseBytes(QStringLiteral("~1.5KB")), 1500);
    EXPECT_EQ(utils::parseBytes(QStringLiteral("Unknown")), std::nullopt);
    EXPECT_EQ(utils::parseSpeed(QStringLiteral("2.00MiB/s")), 2097152);
    EXPECT_EQ(utils::parseSpeed(QStringLiteral("Unknown B/s")), std::nullopt);
}

TEST(FormatUtils, ParsesClockEta)
{
    EXPECT_EQ(utils::parseEta(QStringLiteral("01:02:03")), 3723);
    EXPECT_EQ(utils::parseEta(QStringLiteral("00:42")), 42);
    EXPECT_EQ(utils::parseEta(QStringLiteral("Unknown")), std::nullopt);
}

TEST(DownloadUtils, SanitizeReplacesInvalidCharacters)
{
    EXPECT_EQ(utils::sanitizeFilename(QStringLiteral("a<b>:c?.mp4")), QStringLiteral("a_b__c_.mp4"));
    EXPECT_EQ(utils::sanitizeFilename(QStringLiteral("   ")), QStringLiteral("download"));
    EXPECT_EQ(utils::sanitizeFilename(QString(300, QLatin1Char('x'))).size(), 200);
}

TEST(DownloadUtils, DispositionPrefersExtendedForm)
{
    EXPECT_EQ(utils::filenameFromDisposition(QStringLiteral("attachment; filename=\"plain.zip\"")),
              QStringLiteral("plain.zip"));
    EXPECT_EQ(utils::filenameFromDisposition(
                  QStringLiteral("attachment; filename=\"plain.zip\"; filename*=UTF-8''r%C3%A9sum%C3%A9.pdf")),
              QStringLiteral("résumé.pdf"));
    EXPECT_TRUE(utils::filenameFromDisposition(QStringLiteral("inline")).isEmpty());
}

TEST(DownloadUtils, FileNameFromUrlIgnoresBareRoutes)
{
    EXPECT_EQ(utils::fileNameFromUrl(QUrl(QStringLiteral("https://example.com/files/setup.exe?x=1"))),
              QStringLiteral("setup.exe"));
    EXPECT_TRUE(utils::fileNameFromUrl(QUrl(QStringLiteral("https://example.com/watch"))).isEmpty());
    EXPECT_EQ(utils::extensionFromUrl(QUrl(QStringLiteral("https://example.com/a/B.ZIP"))), QStringLiteral(".zip"));
}

TEST(DownloadUtils, UniqueFileNameSkipsFilesAndControlFiles)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    EXPECT_EQ(utils::uniqueFileName(dir.path(), QStringLiteral("file.zip")), QStringLiteral("file.zip"));

    QFile first(QDir(dir.path()).filePath(QStringLiteral("file.zip")));
    ASSERT_TRUE(first.open(QIODevice::WriteOnly));
    first.close();
    QFile control(QDir(dir.path()).filePath(QStringLiteral("file (1).zip.aria2")));
    ASSERT_TRUE(control.open(QIODevice::WriteOnly));
    control.close();

    EXPECT_EQ(utils::uniqueFileName(dir.path(), QStringLiteral("file.zip")), QStringLiteral("file (2).zip"));
}

TEST(DownloadUtils, SubPathIsCreated)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = utils::downloadSubPath(dir.path(), QStringLiteral("videos"));
    EXPECT_TRUE(QDir(path).exists());
    EXPECT_TRUE(utils::freeDiskSpace(path).has_value());
}

TEST(CategoryUtils, DetectsByExtension)
{
    EXPECT_EQ(utils::detectCategory(QStringLiteral("movie.MKV")), QStringLiteral("videos"));
    EXPECT_EQ(utils::detectCategory(QStringLiteral("https://cdn.example.com/track.mp3?sig=1")), QStringLiteral("audios"));
    EXPECT_EQ(utils::detectCategory(QStringLiteral("setup.msi")), QStringLiteral("programs"));
    EXPECT_EQ(utils::detectCategory(QStringLiteral("backup.tar")), QStringLiteral("archives"));
    EXPECT_EQ(utils::detectCategory(QStringLiteral("noext")), QStringLiteral("others"));
    EXPECT_TRUE(utils::categoryNames().contains(utils::playlistCategory()));
}

TEST(NetworkUtils, PrivateHostLiterals)
{
    EXPECT_TRUE(utils::isPrivateHostLiteral(QStringLiteral("127.0.0.1")));
    EXPECT_TRUE(utils::isPrivateHostLiteral(QStringLiteral("10.1.2.3")));
    EXPECT_TRUE(utils::isPrivateHostLiteral(QStringLiteral("172.20.0.1")));
    EXPECT_TRUE(utils::isPrivateHostLiteral(QStringLiteral("192.168.1.1")));
    EXPECT_TRUE(utils::isPrivateHostLiteral(QStringLiteral("169.254.10.10")));
    EXPECT_TRUE(utils::isPrivateHostLiteral(QStringLiteral("[::1]")));
    EXPECT_TRUE(utils::isPrivateHostLiteral(QStringLiteral("fe80::1")));
    EXPECT_TRUE(utils::isPrivateHostLiteral(QStringLiteral("fd00::1")));
    EXPECT_TRUE(utils::isPrivateHostLiteral(QStringLiteral("localhost")));
    EXPECT_FALSE(utils::isPrivateHostLiteral(QStringLiteral("8.8.8.8")));
    EXPECT_FALSE(utils::isPrivateHostLiteral(QStringLiteral("example.com")));
}

TEST(NetworkUtils, HostMatchingCoversSubdomains)
{
    const QStringList domains = {QStringLiteral("youtube.com")};
    EXPECT_TRUE(utils::hostMatchesAny(QStringLiteral("www.youtube.com"), domains));
    EXPECT_TRUE(utils::hostMatchesAny(QStringLiteral("m.youtube.com"), domains));
    EXPECT_FALSE(utils::hostMatchesAny(QStringLiteral("notyoutube.com"), domains));
}

TEST(Types, StatusHelpers)
{
    EXPECT_EQ(utils::statusName(DownloadStatus::Merging), QStringLiteral("merging"));
    EXPECT_TRUE(utils::isActiveStatus(DownloadStatus::Merging));
    EXPECT_FALSE(utils::isActiveStatus(DownloadStatus::Pending));
    EXPECT_TRUE(utils::isTerminalStatus(DownloadStatus::Cancelled));
    EXPECT_FALSE(utils::isTerminalStatus(DownloadStatus::Paused));
    EXPECT_EQ(utils::classifyModeFromString(QStringLiteral("VIDEO")), ClassifyMode::Video);
    EXPECT_EQ(utils::classifyModeFromString(QStringLiteral("bogus")), ClassifyMode::Auto);
    EXPECT_EQ(utils::conflictPolicyFromString(QStringLiteral("skip")), FileConflictPolicy::Skip);
    EXPECT_EQ(utils::conflictPolicyFromString(QStringLiteral("")), FileConflictPolicy::Rename);
}
