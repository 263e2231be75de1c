module;
#include <QDebug>
#include <QHash>
#include <QHostAddress>
#include <QHostInfo>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QPointer>
#include <QSet>
#include <QSslError>
#include <QString>
#include <QStringList>
#include <QTimer>
#include <QUrl>

#include <functional>
#include <memory>
#include <optional>
#include <utility>

module baran.core.linkclassifier;

import baran.core.types;
import baran.utils.download_utils;
import baran.utils.network_utils;

namespace utils = baran::utils;

static constexpr int kProbeTimeoutMs = 5000;
static constexpr int kMaxRedirects = 5;
static constexpr int kBatchChunk = 5;

static const QStringList& platformHosts()
{
    static const QStringList hosts = {
        QStringLiteral("youtube.com"), QStringLiteral("youtu.be"), QStringLiteral("youtube-nocookie.com"),
        QStringLiteral("tiktok.com"), QStringLiteral("instagram.com"), QStringLiteral("twitter.com"),
        QStringLiteral("x.com"), QStringLiteral("facebook.com"), QStringLiteral("fb.watch"),
        QStringLiteral("vimeo.com"), QStringLiteral("dailymotion.com"), QStringLiteral("dai.ly"),
        QStringLiteral("twitch.tv"), QStringLiteral("soundcloud.com"), QStringLiteral("bandcamp.com"),
        QStringLiteral("vk.com"), QStringLiteral("bilibili.com"), QStringLiteral("nicovideo.jp"),
    };
    return hosts;
}

static const QSet<QString>& directExtensions()
{
    static const QSet<QString> exts = {
        QStringLiteral(".zip"), QStringLiteral(".rar"), QStringLiteral(".7z"), QStringLiteral(".tar"),
        QStringLiteral(".gz"), QStringLiteral(".bz2"), QStringLiteral(".xz"), QStringLiteral(".tgz"),
        QStringLiteral(".exe"), QStringLiteral(".msi"), QStringLiteral(".deb"), QStringLiteral(".rpm"),
        QStringLiteral(".dmg"), QStringLiteral(".pkg"), QStringLiteral(".appimage"), QStringLiteral(".vspackage"),
        QStringLiteral(".vsix"), QStringLiteral(".pdf"), QStringLiteral(".doc"), QStringLiteral(".docx"),
        QStringLiteral(".xls"), QStringLiteral(".xlsx"), QStringLiteral(".ppt"), QStringLiteral(".pptx"),
        QStringLiteral(".mp4"), QStringLiteral(".mkv"), QStringLiteral(".avi"), QStringLiteral(".mov"),
        QStringLiteral(".wmv"), QStringLiteral(".flv"), QStringLiteral(".webm"), QStringLiteral(".mp3"),
        QStringLiteral(".wav"), QStringLiteral(".flac"), QStringLiteral(".aac"), QStringLiteral(".ogg"),
        QStringLiteral(".m4a"), QStringLiteral(".jpg"), QStringLiteral(".jpeg"), QStringLiteral(".png"),
        QStringLiteral(".gif"), QStringLiteral(".webp"), QStringLiteral(".svg"), QStringLiteral(".bmp"),
        QStringLiteral(".tiff"), QStringLiteral(".iso"), QStringLiteral(".img"),
    };
    return exts;
}

static const QStringList& directContentTypes()
{
    static const QStringList types = {
        QStringLiteral("application/zip"), QStringLiteral("application/x-zip"),
        QStringLiteral("application/x-zip-compressed"), QStringLiteral("application/x-rar"),
        QStringLiteral("application/x-rar-compressed"), QStringLiteral("application/x-7z-compressed"),
        QStringLiteral("application/x-tar"), QStringLiteral("application/gzip"),
        QStringLiteral("application/x-gzip"), QStringLiteral("application/x-bzip2"),
        QStringLiteral("application/x-xz"), QStringLiteral("application/octet-stream"),
        QStringLiteral("application/pdf"), QStringLiteral("application/msword"),
        QStringLiteral("application/vnd.ms-excel"), QStringLiteral("application/vnd.ms-powerpoint"),
        QStringLiteral("application/vnd.openxmlformats-officedocument"),
        QStringLiteral("application/x-msdownload"), QStringLiteral("application/x-msi"),
        QStringLiteral("application/x-deb"), QStringLiteral("application/x-rpm"),
        QStringLiteral("application/x-apple-diskimage"),
        QStringLiteral("image/png"), QStringLiteral("image/jpeg"), QStringLiteral("image/gif"),
        QStringLiteral("image/webp"), QStringLiteral("image/svg+xml"), QStringLiteral("image/tiff"),
        QStringLiteral("image/bmp"),
        QStringLiteral("video/mp4"), QStringLiteral("video/x-msvideo"), QStringLiteral("video/x-matroska"),
        QStringLiteral("video/quicktime"), QStringLiteral("video/x-flv"), QStringLiteral("video/webm"),
        QStringLiteral("video/3gpp"), QStringLiteral("video/mpeg"),
        QStringLiteral("audio/mpeg"), QStringLiteral("audio/mp3"), QStringLiteral("audio/wav"),
        QStringLiteral("audio/flac"), QStringLiteral("audio/aac"), QStringLiteral("audio/ogg"),
        QStringLiteral("audio/x-m4a"), QStringLiteral("audio/webm"),
        QStringLiteral("application/x-iso9660-image"),
    };
    return types;
}

static const QStringList& webPageContentTypes()
{
    static const QStringList types = {
        QStringLiteral("text/html"), QStringLiteral("application/xhtml+xml"),
        QStringLiteral("text/xml"), QStringLiteral("application/xml"),
    };
    return types;
}

static QString mimeEssence(const QString& contentType)
{
    return contentType.section(QLatin1Char(';'), 0, 0).trimmed().toLower();
}

static LinkTypeResult verdict(bool isDirect, const QString& reason)
{
    LinkTypeResult result;
    result.isDirect = isDirect;
    result.reason = reason;
    return result;
}

LinkClassifier::LinkClassifier(QObject* parent)
    : QObject(parent)
{
}

QString LinkClassifier::browserUserAgent()
{
    return QStringLiteral("Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
                          "(KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36");
}

QString LinkClassifier::ssrfReason()
{
    return QStringLiteral("Private/internal network URLs are not allowed (SSRF protection)");
}

QString LinkClassifier::protocolReason()
{
    return QStringLiteral("Only HTTP and HTTPS protocols are supported");
}

bool LinkClassifier::isKnownPlatform(const QString& host)
{
    return utils::hostMatchesAny(host, platformHosts());
}

bool LinkClassifier::isDirectExtension(const QString& ext)
{
    return directExtensions().contains(ext.toLower());
}

bool LinkClassifier::isDirectContentType(const QString& contentType)
{
    const QString type = mimeEssence(contentType);
    if (type.isEmpty()) return false;
    for (const QString& candidate : directContentTypes()) {
        if (type == candidate || type.startsWith(candidate + QLatin1Char('/'))) return true;
    }
    return false;
}

bool LinkClassifier::isWebPageContentType(const QString& contentType)
{
    const QString type = mimeEssence(contentType);
    if (type.isEmpty()) return false;
    for (const QString& candidate : webPageContentTypes()) {
        if (type.startsWith(candidate)) return true;
    }
    return false;
}

std::optional<LinkTypeResult> LinkClassifier::preflight(const QUrl& url, ClassifyMode mode)
{
    if (mode == ClassifyMode::Video)
        return verdict(false, QStringLiteral("Forced video mode"));

    if (!utils::isHttpUrl(url))
        return verdict(false, protocolReason());

    if (utils::isPrivateHostLiteral(url.host()))
        return verdict(false, ssrfReason());

    if (isKnownPlatform(url.host())) {
        const bool likelyFile = isDirectExtension(utils::extensionFromUrl(url));
        if (!likelyFile && mode == ClassifyMode::Direct)
            return verdict(false, QStringLiteral("VIDEO_LINK_IN_DIRECT_MODE"));
        if (!likelyFile)
            return verdict(false, QStringLiteral("Known video platform"));
    }
    return std::nullopt;
}

std::optional<LinkTypeResult> LinkClassifier::verdictFromHeaders(const QUrl& url, ClassifyMode mode, const HeadProbeResult& head)
{
    if (!head.contentType.isEmpty()) {
        if (isWebPageContentType(head.contentType)) {
            if (mode == ClassifyMode::Direct)
                return verdict(false, QStringLiteral("WEB_PAGE_IN_DIRECT_MODE"));
            LinkTypeResult result = verdict(false, QStringLiteral("Content-Type indicates web page"));
            result.contentType = head.contentType;
            return result;
        }

        if (isDirectContentType(head.contentType)) {
            LinkTypeResult result = verdict(true, QStringLiteral("Content-Type indicates direct download"));
            result.contentType = head.contentType;
            result.contentLength = head.contentLength;
            result.filename = utils::filenameFromDisposition(head.contentDisposition);
            if (result.filename.isEmpty()) result.filename = utils::fileNameFromUrl(url);
            return result;
        }
    }

    if (!head.contentDisposition.isEmpty()) {
        const QString filename = utils::filenameFromDisposition(head.contentDisposition);
        if (!filename.isEmpty()) {
            LinkTypeResult result = verdict(true, QStringLiteral("Content-Disposition header indicates file download"));
            result.contentType = head.contentType;
            result.contentLength = head.contentLength;
            result.filename = filename;
            return result;
        }
    }
    return std::nullopt;
}

LinkTypeResult LinkClassifier::fallbackVerdict(const QUrl& url, ClassifyMode mode)
{
    const QString ext = utils::extensionFromUrl(url);
    if (!ext.isEmpty() && isDirectExtension(ext)) {
        LinkTypeResult result = verdict(true, QStringLiteral("File extension %1 indicates direct download").arg(ext));
        result.filename = utils::fileNameFromUrl(url);
        return result;
    }

    if (mode == ClassifyMode::Direct)
        return verdict(true, QStringLiteral("Defaulting to direct download for unknown link type in direct mode"));

    return verdict(false, QStringLiteral("Unknown link type, defaulting to yt-dlp"));
}

void LinkClassifier::classify(const QString& urlStr, ClassifyMode mode, Callback done)
{
    const QUrl url(urlStr.trimmed());

    if (auto early = preflight(url, mode)) {
        finish(urlStr, *early, done);
        return;
    }

    QPointer<LinkClassifier> self(this);
    resolvesToPrivate(url, [self, urlStr, url, mode, done](bool isPrivate) {
        if (!self) return;
        if (isPrivate) {
            self->finish(urlStr, verdict(false, ssrfReason()), done);
            return;
        }

        self->probe(url, url, kMaxRedirects, false,
                    [self, urlStr, url, mode, done](std::optional<HeadProbeResult> head, const QString& error) {
            if (!self) return;
            if (head) {
                if (auto fromHeaders = verdictFromHeaders(url, mode, *head)) {
                    fromHeaders->suggestedUserAgent = browserUserAgent();
                    self->finish(urlStr, *fromHeaders, done);
                    return;
                }
            } else {
                static const QStringList quiet = {
                    QStringLiteral("HTTP 401"), QStringLiteral("HTTP 403"),
                    QStringLiteral("HTTP 404"), QStringLiteral("Request timeout"),
                };
                bool silent = false;
                for (const QString& code : quiet) {
                    if (error.contains(code)) { silent = true; break; }
                }
                if (!silent) qWarning() << "HEAD probe failed, using fallback:" << urlStr << error;
            }

            LinkTypeResult result = fallbackVerdict(url, mode);
            if (head) result.suggestedUserAgent = browserUserAgent();
            self->finish(urlStr, result, done);
        });
    });
}

void LinkClassifier::classifyMany(const QStringList& urls, ClassifyMode mode, BatchCallback done)
{
    struct BatchState {
        QStringList urls;
        int next = 0;
        int outstanding = 0;
        QHash<QString, LinkTypeResult> results;
        std::function<void()> runChunk;
    };

    auto state = std::make_shared<BatchState>();
    state->urls = urls;
    state->urls.removeDuplicates();

    QPointer<LinkClassifier> self(this);
    std::weak_ptr<BatchState> weak = state;
    state->runChunk = [self, weak, mode, done]() {
        auto st = weak.lock();
        if (!st || !self) return;
        if (st->next >= st->urls.size()) {
            if (done) done(st->results);
            return;
        }

        const int begin = st->next;
        const int end = qMin(begin + kBatchChunk, st->urls.size());
        st->next = end;
        st->outstanding = end - begin;
        for (int i = begin; i < end; ++i) {
            const QString url = st->urls.at(i);
            self->classify(url, mode, [st, url](const LinkTypeResult& result) {
                st->results.insert(url, result);
                if (--st->outstanding == 0) st->runChunk();
            });
        }
    };

    if (state->urls.isEmpty()) {
        if (done) done({});
        return;
    }
    state->runChunk();
}

void LinkClassifier::finish(const QString& url, const LinkTypeResult& result, const Callback& done)
{
    qDebug() << "Classified" << url << "direct:" << result.isDirect << "reason:" << result.reason;
    emit classified(url, result);
    if (done) done(result);
}

void LinkClassifier::resolvesToPrivate(const QUrl& url, PrivateCheck done)
{
    const QString host = url.host();
    if (utils::isPrivateHostLiteral(host)) {
        done(true);
        return;
    }
    QHostAddress literal;
    if (literal.setAddress(host)) {
        done(false);
        return;
    }

    QHostInfo::lookupHost(host, this, [done](const QHostInfo& info) {
        if (info.error() != QHostInfo::NoError) {
            done(false);
            return;
        }
        for (const QHostAddress& address : info.addresses()) {
            if (utils::isPrivateAddress(address)) {
                done(true);
                return;
            }
        }
        done(false);
    });
}

void LinkClassifier::probe(const QUrl& origin, const QUrl& url, int redirectsLeft, bool retried, ProbeCallback done)
{
    QNetworkRequest req(url);
    req.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::ManualRedirectPolicy);
    req.setRawHeader("User-Agent", browserUserAgent().toUtf8());
    req.setRawHeader("Accept", "text/html,application/xhtml+xml,application/xml;q=0.9,image/avif,image/webp,*/*;q=0.8");
    req.setRawHeader("Accept-Language", "en-US,en;q=0.5");
    req.setRawHeader("Upgrade-Insecure-Requests", "1");
    req.setRawHeader("Referer", url.toEncoded());

    QNetworkReply* reply = m_network.head(req);
    QPointer<QNetworkReply> replyPtr(reply);
    auto timedOut = std::make_shared<bool>(false);

#if QT_CONFIG(ssl)
    connect(reply, &QNetworkReply::sslErrors, reply, [replyPtr](const QList<QSslError>&) {
        if (replyPtr) replyPtr->ignoreSslErrors();
    });
#endif

    QTimer::singleShot(kProbeTimeoutMs, reply, [replyPtr, timedOut]() {
        if (!replyPtr || replyPtr->isFinished()) return;
        *timedOut = true;
        replyPtr->abort();
    });

    QPointer<LinkClassifier> self(this);
    connect(reply, &QNetworkReply::finished, this, [self, reply, origin, url, redirectsLeft, retried, timedOut, done]() {
        reply->deleteLater();
        if (!self) return;

        if (*timedOut) {
            if (!retried) {
                qDebug() << "HEAD probe timed out, retrying:" << url;
                self->probe(origin, url, redirectsLeft, true, done);
                return;
            }
            done(std::nullopt, QStringLiteral("Request timeout"));
            return;
        }

        const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        const QByteArray location = reply->rawHeader("Location");

        if (status >= 300 && status < 400 && !location.isEmpty()) {
            if (redirectsLeft <= 0) {
                done(std::nullopt, QStringLiteral("Too many redirects"));
                return;
            }
            const QUrl target = url.resolved(QUrl::fromEncoded(location));
            if (!baran::utils::isHttpUrl(target)) {
                done(std::nullopt, QStringLiteral("Redirect to invalid protocol blocked"));
                return;
            }
            self->resolvesToPrivate(target, [self, origin, target, redirectsLeft, done](bool isPrivate) {
                if (!self) return;
                if (isPrivate) {
                    done(std::nullopt, QStringLiteral("Redirect to private network blocked (SSRF protection)"));
                    return;
                }
                self->probe(origin, target, redirectsLeft - 1, false, done);
            });
            return;
        }

        if (status >= 400) {
            done(std::nullopt, QStringLiteral("HTTP %1").arg(status));
            return;
        }
        if (reply->error() != QNetworkReply::NoError || status <= 0) {
            done(std::nullopt, reply->errorString());
            return;
        }

        HeadProbeResult result;
        result.contentType = QString::fromUtf8(reply->rawHeader("Content-Type"));
        const QByteArray length = reply->rawHeader("Content-Length");
        bool ok = false;
        const qint64 parsed = length.toLongLong(&ok);
        if (ok) result.contentLength = parsed;
        result.contentDisposition = QString::fromUtf8(reply->rawHeader("Content-Disposition"));
        result.finalUrl = url;
        done(result, QString());
    });
}
