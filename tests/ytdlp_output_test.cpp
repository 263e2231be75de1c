#include <QStringList>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <optional>
#include <string>

import baran.core.types;
import baran.services.ytdlp_output;

namespace utils = baran::utils;

TEST(OutputLineClassifier, ParsesProgressLine)
{
    const OutputEvent ev = OutputLineClassifier::classify(
        QStringLiteral("[download]  42.5% of ~ 10.00MiB at  1.00MiB/s ETA 00:05"));
    EXPECT_EQ(ev.kind, OutputEvent::Kind::Progress);
    EXPECT_DOUBLE_EQ(ev.percent, 42.5);
    EXPECT_EQ(ev.totalBytes, 10485760);
    EXPECT_EQ(ev.speedText, QStringLiteral("1.00MiB/s"));
    EXPECT_EQ(ev.etaText, QStringLiteral("00:05"));
}

TEST(OutputLineClassifier, RecognisesFileAnnouncements)
{
    const OutputEvent destination = OutputLineClassifier::classify(QStringLiteral("[download] Destination: /tmp/a.mp4"));
    EXPECT_EQ(destination.kind, OutputEvent::Kind::Destination);
    EXPECT_EQ(destination.path, QStringLiteral("/tmp/a.mp4"));

    const OutputEvent already = OutputLineClassifier::classify(
        QStringLiteral("[download] /tmp/a.mp4 has already been downloaded"));
    EXPECT_EQ(already.kind, OutputEvent::Kind::AlreadyDownloaded);
    EXPECT_EQ(already.path, QStringLiteral("/tmp/a.mp4"));

    const OutputEvent merging = OutputLineClassifier::classify(
        QStringLiteral("[Merger] Merging formats into \"/tmp/a.mp4\""));
    EXPECT_EQ(merging.kind, OutputEvent::Kind::Merging);
    EXPECT_EQ(merging.path, QStringLiteral("/tmp/a.mp4"));
}

TEST(OutputLineClassifier, ErrorsWarningsAndNoise)
{
    const OutputEvent error = OutputLineClassifier::classify(QStringLiteral("ERROR: [youtube] abc: Video unavailable"));
    EXPECT_EQ(error.kind, OutputEvent::Kind::Error);
    EXPECT_EQ(error.message, QStringLiteral("[youtube] abc: Video unavailable"));

    EXPECT_EQ(OutputLineClassifier::classify(QStringLiteral("WARNING: slow")).kind, OutputEvent::Kind::Warning);
    EXPECT_EQ(OutputLineClassifier::classify(QStringLiteral("[youtube] abc: Downloading webpage")).kind,
              OutputEvent::Kind::None);
    EXPECT_EQ(OutputLineClassifier::classify(QStringLiteral("   ")).kind, OutputEvent::Kind::None);
}

TEST(ProgressTracker, FirstLargeSampleDoesNotCountBytes)
{
    ProgressTracker tracker(1000);
    DownloadProgress progress;

    OutputEvent ev;
    ev.kind = OutputEvent::Kind::Progress;
    ev.percent = 60.0;
    ASSERT_TRUE(tracker.apply(ev, progress));
    EXPECT_EQ(progress.totalBytes, 1000);
    EXPECT_EQ(progress.downloadedBytes, 0);
    EXPECT_DOUBLE_EQ(progress.progress, 60.0);
    EXPECT_TRUE(tracker.hasSample());

    ev.percent = 70.0;
    ev.speedText = QStringLiteral("1.00MiB/s");
    ev.etaText = QStringLiteral("00:05");
    ASSERT_TRUE(tracker.apply(ev, progress));
    EXPECT_EQ(progress.downloadedBytes, 700);
    EXPECT_EQ(progress.speed, 1048576);
    EXPECT_EQ(progress.eta, 5);

    ev.percent = 150.0;
    ASSERT_TRUE(tracker.apply(ev, progress));
    EXPECT_DOUBLE_EQ(progress.progress, 100.0);
    EXPECT_EQ(progress.downloadedBytes, 1000);
    EXPECT_DOUBLE_EQ(tracker.lastPercent(), 100.0);
}

TEST(ProgressTracker, IgnoresOtherEvents)
{
    ProgressTracker tracker;
    DownloadProgress progress;
    OutputEvent ev;
    ev.kind = OutputEvent::Kind::Destination;
    EXPECT_FALSE(tracker.apply(ev, progress));
    EXPECT_FALSE(tracker.hasSample());
}

TEST(ExtractorErrors, KnownFailuresAreExplained)
{
    EXPECT_THAT(utils::mapExtractorError({QStringLiteral("Sign in to confirm your age")}, 1).toStdString(),
                ::testing::StartsWith("Age restricted:"));
    EXPECT_EQ(utils::mapExtractorError({QStringLiteral("ERROR: Unable to parse data")}, 1),
              QStringLiteral("Critical Error: Cannot parse video data from provider. Try again later."));
    EXPECT_EQ(utils::mapExtractorError({QStringLiteral("ERROR: [youtube] x: Video unavailable")}, 1),
              QStringLiteral("Video unavailable: This video might be private or region-restricted."));
    EXPECT_EQ(utils::mapExtractorError({QStringLiteral("something went wrong")}, 2),
              QStringLiteral("Download failed (Exit code: 2). something went wrong"));
    EXPECT_EQ(utils::mapExtractorError({QStringLiteral("ERROR: boom")}, std::nullopt), QStringLiteral("boom"));
    EXPECT_EQ(utils::mapExtractorError({}, std::nullopt), QStringLiteral("Unknown download error occurred"));
}

TEST(ExtractorErrors, MetadataFailures)
{
    const std::string unsupported = utils::mapMetadataError(QStringLiteral("ERROR: Unsupported URL: x")).toStdString();
    EXPECT_THAT(unsupported, ::testing::StartsWith("Unable to parse video data."));
    EXPECT_THAT(unsupported, ::testing::HasSubstr("Original error: ERROR: Unsupported URL: x"));
    EXPECT_EQ(utils::mapMetadataError(QStringLiteral("ERROR: Private video")),
              QStringLiteral("This video is unavailable or private."));
    EXPECT_EQ(utils::mapMetadataError(QString()), QStringLiteral("Failed to fetch metadata"));
    EXPECT_EQ(utils::mapMetadataError(QStringLiteral("network down")), QStringLiteral("network down"));
}
