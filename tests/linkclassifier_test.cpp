#include <QHash>
#include <QTest>
#include <QUrl>

#include <gtest/gtest.h>

#include <optional>

import baran.core.types;
import baran.core.linkclassifier;

namespace {

QUrl url(const char* text)
{
    return QUrl(QString::fromLatin1(text));
}

} // namespace

TEST(LinkClassifier, ForcedVideoModeWinsWithoutNetwork)
{
    LinkClassifier classifier;
    std::optional<LinkTypeResult> result;
    classifier.classify(QStringLiteral("https://unreachable.invalid/file.zip"), ClassifyMode::Video,
                        [&result](const LinkTypeResult& r) { result = r; });

    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->isDirect);
    EXPECT_EQ(result->reason, QStringLiteral("Forced video mode"));
}

TEST(LinkClassifier, RejectsNonHttpProtocols)
{
    const auto verdict = LinkClassifier::preflight(url("ftp://example.com/file.zip"), ClassifyMode::Auto);
    ASSERT_TRUE(verdict.has_value());
    EXPECT_FALSE(verdict->isDirect);
    EXPECT_EQ(verdict->reason, LinkClassifier::protocolReason());
}

TEST(LinkClassifier, BlocksPrivateTargets)
{
    for (const char* target : {"http://127.0.0.1/a.zip", "http://192.168.0.10/a.zip", "http://[::1]/a.zip",
                               "http://localhost:8080/a.zip", "http://169.254.169.254/latest"}) {
        const auto verdict = LinkClassifier::preflight(url(target), ClassifyMode::Auto);
        ASSERT_TRUE(verdict.has_value()) << target;
        EXPECT_EQ(verdict->reason, LinkClassifier::ssrfReason()) << target;
    }
}

TEST(LinkClassifier, PrivateTargetIsReportedThroughClassify)
{
    LinkClassifier classifier;
    std::optional<LinkTypeResult> result;
    classifier.classify(QStringLiteral("http://10.0.0.1/file.zip"), ClassifyMode::Direct,
                        [&result](const LinkTypeResult& r) { result = r; });
    ASSERT_TRUE(QTest::qWaitFor([&result]() { return result.has_value(); }, 1000));
    EXPECT_FALSE(result->isDirect);
    EXPECT_EQ(result->reason, LinkClassifier::ssrfReason());
}

TEST(LinkClassifier, KnownPlatformWatchPage)
{
    const auto autoVerdict = LinkClassifier::preflight(url("https://www.youtube.com/watch?v=abc"), ClassifyMode::Auto);
    ASSERT_TRUE(autoVerdict.has_value());
    EXPECT_FALSE(autoVerdict->isDirect);
    EXPECT_EQ(autoVerdict->reason, QStringLiteral("Known video platform"));

    const auto directVerdict = LinkClassifier::preflight(url("https://youtube.com/watch?v=abc"), ClassifyMode::Direct);
    ASSERT_TRUE(directVerdict.has_value());
    EXPECT_EQ(directVerdict->reason, QStringLiteral("VIDEO_LINK_IN_DIRECT_MODE"));
}

TEST(LinkClassifier, KnownPlatformDirectFileFallsThrough)
{
    const QUrl file = url("https://www.youtube.com/downloads/clip.mp4");
    EXPECT_FALSE(LinkClassifier::preflight(file, ClassifyMode::Auto).has_value());

    const LinkTypeResult verdict = LinkClassifier::fallbackVerdict(file, ClassifyMode::Auto);
    EXPECT_TRUE(verdict.isDirect);
    EXPECT_EQ(verdict.reason, QStringLiteral("File extension .mp4 indicates direct download"));
    EXPECT_EQ(verdict.filename, QStringLiteral("clip.mp4"));
}

TEST(LinkClassifier, HeadersDecideBeforeExtension)
{
    HeadProbeResult html;
    html.contentType = QStringLiteral("text/html; charset=utf-8");
    const auto page = LinkClassifier::verdictFromHeaders(url("https://example.com/file.zip"), ClassifyMode::Auto, html);
    ASSERT_TRUE(page.has_value());
    EXPECT_FALSE(page->isDirect);
    EXPECT_EQ(page->reason, QStringLiteral("Content-Type indicates web page"));

    const auto pageDirect = LinkClassifier::verdictFromHeaders(url("https://example.com/"), ClassifyMode::Direct, html);
    ASSERT_TRUE(pageDirect.has_value());
    EXPECT_EQ(pageDirect->reason, QStringLiteral("WEB_PAGE_IN_DIRECT_MODE"));

    HeadProbeResult zip;
    zip.contentType = QStringLiteral("application/zip");
    zip.contentLength = 4096;
    const auto archive = LinkClassifier::verdictFromHeaders(url("https://example.com/get?id=1"), ClassifyMode::Auto, zip);
    ASSERT_TRUE(archive.has_value());
    EXPECT_TRUE(archive->isDirect);
    EXPECT_EQ(archive->reason, QStringLiteral("Content-Type indicates direct download"));
    EXPECT_EQ(archive->contentLength, 4096);
}

TEST(LinkClassifier, DispositionMarksDownload)
{
    HeadProbeResult head;
    head.contentType = QStringLiteral("text/plain");
    head.contentDisposition = QStringLiteral("attachment; filename=\"report.txt\"");
    const auto verdict = LinkClassifier::verdictFromHeaders(url("https://example.com/export"), ClassifyMode::Auto, head);
    ASSERT_TRUE(verdict.has_value());
    EXPECT_TRUE(verdict->isDirect);
    EXPECT_EQ(verdict->reason, QStringLiteral("Content-Disposition header indicates file download"));
    EXPECT_EQ(verdict->filename, QStringLiteral("report.txt"));
}

TEST(LinkClassifier, InconclusiveDefaultsDependOnMode)
{
    const QUrl page = url("https://example.com/article");
    EXPECT_EQ(LinkClassifier::fallbackVerdict(page, ClassifyMode::Auto).reason,
              QStringLiteral("Unknown link type, defaulting to yt-dlp"));
    EXPECT_FALSE(LinkClassifier::fallbackVerdict(page, ClassifyMode::Auto).isDirect);

    const LinkTypeResult direct = LinkClassifier::fallbackVerdict(page, ClassifyMode::Direct);
    EXPECT_TRUE(direct.isDirect);
    EXPECT_EQ(direct.reason, QStringLiteral("Defaulting to direct download for unknown link type in direct mode"));
}

TEST(LinkClassifier, ContentTypeTables)
{
    EXPECT_TRUE(LinkClassifier::isDirectContentType(QStringLiteral("application/octet-stream")));
    EXPECT_TRUE(LinkClassifier::isDirectContentType(QStringLiteral("Video/MP4")));
    EXPECT_FALSE(LinkClassifier::isDirectContentType(QStringLiteral("application/json")));
    EXPECT_TRUE(LinkClassifier::isWebPageContentType(QStringLiteral("application/xhtml+xml")));
    EXPECT_TRUE(LinkClassifier::isDirectExtension(QStringLiteral(".ISO")));
    EXPECT_FALSE(LinkClassifier::isDirectExtension(QStringLiteral(".html")));
}

TEST(LinkClassifier, BatchReturnsOneVerdictPerUniqueUrl)
{
    LinkClassifier classifier;
    QStringList urls;
    for (int i = 0; i < 7; ++i) urls.append(QStringLiteral("https://youtube.com/watch?v=%1").arg(i));
    urls.append(urls.first());

    std::optional<QHash<QString, LinkTypeResult>> results;
    classifier.classifyMany(urls, ClassifyMode::Video,
                            [&results](const QHash<QString, LinkTypeResult>& r) { results = r; });

    ASSERT_TRUE(QTest::qWaitFor([&results]() { return results.has_value(); }, 1000));
    EXPECT_EQ(results->size(), 7);
    for (const LinkTypeResult& verdict : *results) EXPECT_EQ(verdict.reason, QStringLiteral("Forced video mode"));
}
