#include <QDir>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QTest>

#include <gtest/gtest.h>

#include <memory>
#include <optional>

#include "fakes.h"

import baran.core.types;
import baran.core.linkclassifier;
import baran.core.downloadengine;
import baran.services.engine_settings;
import baran.utils.category_utils;

namespace utils = baran::utils;

class DownloadEngineTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ASSERT_TRUE(dir.isValid());
        settings = std::make_unique<EngineSettings>(QDir(dir.path()).filePath(QStringLiteral("engine.ini")));
        settings->setDownloadDirectory(dir.path());
#if !defined(Q_OS_WIN)
        settings->setYtDlpPath(writeFakeExtractor(dir.path()));
#endif
        engine = std::make_unique<DownloadEngine>(settings.get(), &socket, &daemon);
    }

    SubmitResult submit(const QString& url, ClassifyMode mode, const DownloadOptions& options = {})
    {
        std::optional<SubmitResult> result;
        engine->submit(url, options, mode, [&result](const SubmitResult& r) { result = r; });
        if (!QTest::qWaitFor([&result]() { return result.has_value(); }, 5000)) return SubmitResult{false, {}, QStringLiteral("timeout")};
        return *result;
    }

    QTemporaryDir dir;
    FakeRpcSocket socket;
    FakeDaemon daemon;
    std::unique_ptr<EngineSettings> settings;
    std::unique_ptr<DownloadEngine> engine;
};

TEST_F(DownloadEngineTest, InvalidUrlsAreRejectedUpFront)
{
    EXPECT_EQ(submit(QString(), ClassifyMode::Auto).error, QStringLiteral("Invalid URL provided"));
    EXPECT_EQ(submit(QStringLiteral("ftp://example.com/a.zip"), ClassifyMode::Auto).error,
              QStringLiteral("Only HTTP and HTTPS protocols are supported"));
    EXPECT_EQ(engine->jobCount(), 0);
    EXPECT_EQ(daemon.ensureCount, 0);
}

TEST_F(DownloadEngineTest, PrivateTargetsAreRejected)
{
    const SubmitResult result = submit(QStringLiteral("http://10.0.0.1/a.zip"), ClassifyMode::Auto);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, LinkClassifier::ssrfReason());
    EXPECT_EQ(socket.count(QStringLiteral("aria2.addUri")), 0);
    EXPECT_TRUE(engine->listAll().isEmpty());
}

TEST_F(DownloadEngineTest, StartReportsMissingExtractor)
{
    settings->setYtDlpPath(QDir(dir.path()).filePath(QStringLiteral("missing")));
    QSignalSpy errors(engine.get(), &DownloadEngine::configurationError);
    engine->start();
    EXPECT_EQ(errors.count(), 1);
    EXPECT_TRUE(QTest::qWaitFor([this]() { return daemon.ensureCount == 1; }, 1000));
}

TEST_F(DownloadEngineTest, UnknownIdsAreRejected)
{
    EXPECT_FALSE(engine->pause(QStringLiteral("nope")));
    EXPECT_FALSE(engine->resume(QStringLiteral("nope")));
    EXPECT_FALSE(engine->cancel(QStringLiteral("nope")));
    EXPECT_FALSE(engine->status(QStringLiteral("nope")).has_value());
    EXPECT_TRUE(engine->allTerminal());
}

#if !defined(Q_OS_WIN)
TEST_F(DownloadEngineTest, VideoModeRoutesToExtraction)
{
    DownloadOptions options;
    options.filename = QStringLiteral("slow.mp4");
    options.outputPath = dir.path();
    QSignalSpy removed(engine.get(), &DownloadEngine::itemRemoved);

    const SubmitResult result = submit(QStringLiteral("https://www.youtube.com/watch?v=slow"), ClassifyMode::Video, options);
    ASSERT_TRUE(result.success) << result.error.toStdString();
    ASSERT_EQ(result.items.size(), 1);
    const QString id = result.items.first().id;
    EXPECT_EQ(result.items.first().backend, Backend::Extraction);
    ASSERT_TRUE(result.items.first().videoInfo.has_value());
    EXPECT_EQ(result.items.first().videoInfo->title, QStringLiteral("First"));
    EXPECT_EQ(socket.count(QStringLiteral("aria2.addUri")), 0);

    EXPECT_EQ(engine->jobCount(), 1);
    EXPECT_FALSE(engine->allTerminal());
    EXPECT_TRUE(engine->cancel(id));
    EXPECT_FALSE(engine->status(id).has_value());
    EXPECT_EQ(removed.count(), 1);
}

TEST_F(DownloadEngineTest, PlaylistsExpandIntoOneJobPerEntry)
{
    const SubmitResult result = submit(QStringLiteral("https://www.youtube.com/playlist?list=PL1"), ClassifyMode::Video);
    ASSERT_TRUE(result.success) << result.error.toStdString();
    ASSERT_EQ(result.items.size(), 2);

    const QString expectedDir = QDir(QDir(dir.path()).filePath(utils::playlistCategory())).filePath(QStringLiteral("Road trip"));
    for (const DownloadItem& item : result.items) {
        EXPECT_EQ(QDir::cleanPath(item.outputPath), QDir::cleanPath(expectedDir));
        EXPECT_EQ(item.backend, Backend::Extraction);
    }
    EXPECT_EQ(result.items.at(0).url, QStringLiteral("https://www.youtube.com/watch?v=v1"));
    EXPECT_EQ(result.items.at(1).url, QStringLiteral("https://www.youtube.com/watch?v=v2"));

    ASSERT_TRUE(QTest::qWaitFor([this]() { return engine->allTerminal(); }, 10000));
    const QVector<DownloadItem> all = engine->listAll();
    ASSERT_EQ(all.size(), 2);
    EXPECT_GE(all.at(0).createdAt, all.at(1).createdAt);
    EXPECT_EQ(engine->clearCompleted(), 2);
    EXPECT_EQ(engine->jobCount(), 0);
}

TEST_F(DownloadEngineTest, MetadataFailureFailsSubmit)
{
    const SubmitResult result = submit(QStringLiteral("https://www.youtube.com/watch?v=fail"), ClassifyMode::Video);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, QStringLiteral("This video is unavailable or private."));
    EXPECT_EQ(engine->jobCount(), 0);
}
#endif
