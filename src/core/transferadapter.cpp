module;
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QPointer>
#include <QString>
#include <QStringList>
#include <QTimer>
#include <QUrl>
#include <QUuid>

#include <functional>
#include <memory>
#include <optional>
#include <utility>

module baran.core.transferadapter;

import baran.core.types;
import baran.core.backend;
import baran.core.jobtable;
import baran.core.filereaper;
import baran.core.linkclassifier;
import baran.services.engine_settings;
import baran.services.aria2_client;
import baran.utils.download_utils;
import baran.utils.category_utils;
import baran.utils.format_utils;

namespace utils = baran::utils;

static constexpr int kClassifyTimeoutMs = 5000;
static constexpr int kRemoveAttempts = 3;
static constexpr int kRemoveRetryDelayMs = 1000;
static constexpr int kHandleReleaseMs = 1500;
static constexpr int kErrorCleanupDelayMs = 1000;
static constexpr int kRemovedGidTtlMs = 30000;
static constexpr int kRemovedGidFailedTtlMs = 60000;
static constexpr int kFileRetries = 10;
static constexpr int kFileRetryDelayMs = 1000;
static constexpr int kControlRetries = 5;
static constexpr int kControlRetryDelayMs = 500;
static constexpr int kPollWaitingLimit = 100;
static constexpr int kSyncListLimit = 1000;

namespace {

QJsonArray statusKeys(bool withSpeed)
{
    QJsonArray keys = {
        QStringLiteral("gid"), QStringLiteral("status"), QStringLiteral("totalLength"),
        QStringLiteral("completedLength"), QStringLiteral("files"), QStringLiteral("errorCode"),
        QStringLiteral("errorMessage"), QStringLiteral("dir"),
    };
    if (withSpeed) keys.append(QStringLiteral("downloadSpeed"));
    return keys;
}

qint64 numberField(const QJsonObject& obj, const QString& key)
{
    const QJsonValue value = obj.value(key);
    if (value.isString()) return value.toString().toLongLong();
    return qint64(value.toDouble());
}

QStringList filePaths(const QJsonValue& result)
{
    QStringList paths;
    for (const QJsonValue& file : result.toObject().value(QStringLiteral("files")).toArray()) {
        const QString path = file.toObject().value(QStringLiteral("path")).toString();
        if (!path.isEmpty()) paths.append(path);
    }
    return paths;
}

bool isNotFound(const QString& error)
{
    return error.contains(QStringLiteral("not found"), Qt::CaseInsensitive);
}

} // namespace

TransferAdapter::TransferAdapter(Aria2RpcClient* rpc, LinkClassifier* classifier, EngineSettings* settings,
                                 FileReaper* reaper, QObject* parent)
    : DownloadBackend(parent),
    m_rpc(rpc),
    m_classifier(classifier),
    m_settings(settings),
    m_reaper(reaper),
    m_scheduler([settings]() { return settings ? settings->maxConcurrentDownloads() : 1; })
{
    m_pollTimer.setSingleShot(true);
    m_pollTimer.setInterval(kPollIntervalMs);
    connect(&m_pollTimer, &QTimer::timeout, this, &TransferAdapter::poll);

    connect(m_rpc, &Aria2RpcClient::notificationReceived, this, &TransferAdapter::onNotification);
    connect(m_rpc, &Aria2RpcClient::connected, this, [this]() {
        QPointer<TransferAdapter> self(this);
        QTimer::singleShot(0, this, [self]() {
            if (self) self->reconcile();
        });
    });
    if (m_settings) {
        connect(m_settings, &EngineSettings::maxConcurrentDownloadsChanged, this, &TransferAdapter::updateGlobalOptions);
    }
}

void TransferAdapter::connectDaemon(std::function<void(bool ok, const QString& error)> done)
{
    m_rpc->ensureConnected([done = std::move(done)](bool ok, const QString& error) {
        if (!ok) qWarning() << "Failed to connect to aria2:" << error;
        if (done) done(ok, error);
    });
}

void TransferAdapter::shutdown()
{
    stopPolling();
    m_rpc->shutdown();
}

QString TransferAdapter::validateUrl(const QString& url)
{
    const QString trimmed = url.trimmed();
    if (trimmed.isEmpty()) return QStringLiteral("Invalid URL provided");

    const QUrl parsed(trimmed, QUrl::StrictMode);
    if (!parsed.isValid() || parsed.scheme().isEmpty()) return QStringLiteral("Invalid URL format");

    const QString scheme = parsed.scheme().toLower();
    if (scheme != QStringLiteral("http") && scheme != QStringLiteral("https"))
        return QStringLiteral("Only HTTP and HTTPS protocols are supported");
    if (parsed.host().isEmpty()) return QStringLiteral("Invalid URL format");
    return QString();
}

std::optional<DownloadStatus> TransferAdapter::statusFromDaemon(const QString& status)
{
    if (status == QStringLiteral("active")) return DownloadStatus::Downloading;
    if (status == QStringLiteral("waiting")) return DownloadStatus::Pending;
    if (status == QStringLiteral("paused")) return DownloadStatus::Paused;
    if (status == QStringLiteral("error")) return DownloadStatus::Failed;
    if (status == QStringLiteral("complete")) return DownloadStatus::Completed;
    if (status == QStringLiteral("removed")) return DownloadStatus::Cancelled;
    return std::nullopt;
}

QJsonObject TransferAdapter::transferOptions(const QString& dir, const QString& userAgent,
                                             const QString& referer, const QString& out)
{
    QJsonObject options;
    options.insert(QStringLiteral("dir"), dir);
    options.insert(QStringLiteral("max-connection-per-server"), QStringLiteral("4"));
    options.insert(QStringLiteral("split"), QStringLiteral("8"));
    options.insert(QStringLiteral("min-split-size"), QStringLiteral("4M"));
    options.insert(QStringLiteral("continue"), QStringLiteral("true"));
    options.insert(QStringLiteral("auto-file-renaming"), QStringLiteral("true"));
#if defined(Q_OS_WIN)
    options.insert(QStringLiteral("file-allocation"), QStringLiteral("falloc"));
#else
    options.insert(QStringLiteral("file-allocation"), QStringLiteral("none"));
#endif
    options.insert(QStringLiteral("connect-timeout"), QStringLiteral("60"));
    options.insert(QStringLiteral("timeout"), QStringLiteral("60"));
    options.insert(QStringLiteral("max-tries"), QStringLiteral("0"));
    options.insert(QStringLiteral("retry-wait"), QStringLiteral("5"));
    options.insert(QStringLiteral("disk-cache"), QStringLiteral("64M"));
    options.insert(QStringLiteral("stream-piece-selector"), QStringLiteral("geom"));
    options.insert(QStringLiteral("disable-ipv6"), QStringLiteral("true"));
    options.insert(QStringLiteral("header"), QJsonArray{
        QStringLiteral("User-Agent: %1").arg(userAgent),
        QStringLiteral("Referer: %1").arg(referer),
    });
    options.insert(QStringLiteral("check-certificate"), QStringLiteral("false"));
    if (!out.isEmpty()) options.insert(QStringLiteral("out"), utils::sanitizeFilename(out));
    return options;
}

void TransferAdapter::startDownload(const DownloadOptions& options, const std::optional<LinkTypeResult>& hint, StartCallback done)
{
    if (const QString invalid = validateUrl(options.url); !invalid.isEmpty()) {
        if (done) done(SubmitResult{false, {}, invalid});
        return;
    }

    QPointer<TransferAdapter> self(this);
    m_rpc->ensureConnected([self, options, hint, done](bool ok, const QString& error) {
        if (!self) return;
        if (!ok) {
            if (done) done(SubmitResult{false, {}, error.isEmpty() ? QStringLiteral("Not connected to aria2") : error});
            return;
        }
        if (hint) {
            self->proceedStart(options, *hint, done);
            return;
        }

        // Whichever finishes first wins; the other is ignored.
        auto settled = std::make_shared<bool>(false);
        QTimer::singleShot(kClassifyTimeoutMs, self, [self, options, done, settled]() {
            if (!self || *settled) return;
            *settled = true;
            qWarning() << "Link detection timed out, proceeding with defaults";
            LinkTypeResult fallback;
            fallback.isDirect = true;
            fallback.filename = QStringLiteral("download_%1").arg(QDateTime::currentMSecsSinceEpoch());
            self->proceedStart(options, fallback, done);
        });
        self->m_classifier->classify(options.url, ClassifyMode::Direct, [self, options, done, settled](const LinkTypeResult& link) {
            if (!self || *settled) return;
            *settled = true;
            self->proceedStart(options, link, done);
        });
    });
}

void TransferAdapter::proceedStart(const DownloadOptions& options, const LinkTypeResult& link, StartCallback done)
{
    if (link.reason == LinkClassifier::ssrfReason() || link.reason == LinkClassifier::protocolReason()) {
        if (done) done(SubmitResult{false, {}, link.reason});
        return;
    }

    const QString initialFilename = options.filename.isEmpty() ? link.filename : options.filename;
    const QString root = m_settings ? m_settings->downloadDirectory() : QDir::homePath();

    QString outputDir = options.outputPath;
    if (outputDir.isEmpty()) {
        const QString category = utils::detectCategory(initialFilename.isEmpty() ? options.url : initialFilename);
        outputDir = utils::downloadSubPath(root, category);
    }

    // Duplicates: an in-flight job for the same URL or target file is returned as is.
    const QVector<DownloadItem> existing = m_table.snapshot();
    for (const DownloadItem& d : existing) {
        const bool sameUrl = d.url == options.url;
        const bool sameFile = !options.filename.isEmpty() && d.filename == options.filename && d.outputPath == outputDir;
        if (!sameUrl && !sameFile) continue;

        if (d.status == DownloadStatus::Downloading || d.status == DownloadStatus::Pending) {
            qInfo() << "Found existing active transfer for" << (options.filename.isEmpty() ? options.url : options.filename);
            const QString gid = gidFor(d.id);
            if (!link.suggestedUserAgent.isEmpty() && !gid.isEmpty()) {
                QJsonObject change;
                change.insert(QStringLiteral("header"), QJsonArray{
                    QStringLiteral("User-Agent: %1").arg(link.suggestedUserAgent),
                    QStringLiteral("Referer: %1").arg(options.url),
                });
                const QString id = d.id;
                m_rpc->call(QStringLiteral("aria2.changeOption"), QJsonArray{gid, change}, [id](const RpcReply& reply) {
                    if (!reply.ok) qWarning() << "Failed to update options for" << id << ":" << reply.error;
                    else qDebug() << "Updated options for" << id << "with suggested user agent";
                });
            }
            if (done) done(SubmitResult{true, {d}, QString()});
            return;
        }
        if (d.status == DownloadStatus::Failed || d.status == DownloadStatus::Cancelled) {
            qInfo() << "Removing old transfer to avoid duplicates:" << (d.filename.isEmpty() ? d.id : d.filename);
            cancel(d.id);
        }
    }

    QString finalFilename = initialFilename;
    if (!finalFilename.isEmpty()) {
        const QString fullPath = QDir(outputDir).filePath(finalFilename);
        if (QFileInfo::exists(fullPath)) {
            switch (m_settings ? m_settings->onFileExists() : FileConflictPolicy::Rename) {
            case FileConflictPolicy::Skip:
                qInfo() << "File exists, skipping:" << fullPath;
                if (done) done(SubmitResult{true, {}, QStringLiteral("File already exists (skipped)")});
                return;
            case FileConflictPolicy::Overwrite:
                qInfo() << "File exists, overwriting:" << fullPath;
                if (!QFile::remove(fullPath)) qWarning() << "Failed to delete existing file for overwrite:" << fullPath;
                if (QFileInfo::exists(fullPath + QStringLiteral(".aria2"))) QFile::remove(fullPath + QStringLiteral(".aria2"));
                break;
            case FileConflictPolicy::Rename:
                finalFilename = utils::uniqueFileName(outputDir, finalFilename);
                qInfo() << "File exists, renamed to:" << finalFilename;
                break;
            }
        }
    }

    if (!QDir().mkpath(outputDir)) qWarning() << "Failed to create output directory" << outputDir;

#if defined(Q_OS_WIN)
    QTimer::singleShot(0, this, [outputDir]() {
        const auto free = utils::freeDiskSpace(outputDir);
        if (free && *free < kMinFreeSpace)
            qWarning() << "Low disk space warning:" << qRound64(double(*free) / (1024.0 * 1024.0)) << "MB available";
    });
#else
    if (const auto free = utils::freeDiskSpace(outputDir); free && *free < kMinFreeSpace) {
        const qint64 freeMb = qRound64(double(*free) / (1024.0 * 1024.0));
        if (done) done(SubmitResult{false, {}, QStringLiteral("Insufficient disk space. Available: %1MB, Required: %2MB")
                                                   .arg(freeMb).arg(kMinFreeSpace / (1024 * 1024))});
        return;
    }
#endif

    const QString userAgent = link.suggestedUserAgent.isEmpty() ? LinkClassifier::browserUserAgent() : link.suggestedUserAgent;
    const QJsonObject aria2Options = transferOptions(outputDir, userAgent, options.url, finalFilename);
    const QString finalUrl = QUrl(options.url.trimmed()).toString(QUrl::FullyEncoded);

    DownloadItem item;
    item.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    item.url = options.url;
    item.options = options;
    item.backend = Backend::Transfer;
    item.status = DownloadStatus::Pending;
    item.outputPath = outputDir;
    item.filename = finalFilename.isEmpty() ? QString() : utils::sanitizeFilename(finalFilename);
    item.createdAt = QDateTime::currentDateTime();
    item.progress.downloadId = item.id;
    item.progress.status = DownloadStatus::Pending;
    item.progress.totalBytes = link.contentLength;
    item.progress.filename = item.filename;

    // Registered before addUri so a cancel during the call is observed below.
    m_table.insert(item);
    emit statusChanged(item);

    const QString id = item.id;
    m_starting.insert(id);
    QPointer<TransferAdapter> self(this);
    m_rpc->call(QStringLiteral("aria2.addUri"), QJsonArray{QJsonArray{finalUrl}, aria2Options},
                [self, id, done](const RpcReply& reply) {
        if (!self) return;
        self->m_starting.remove(id);
        if (!reply.ok) {
            qWarning() << "Failed to start transfer:" << reply.error;
            if (self->m_table.remove(id)) emit self->itemRemoved(id);
            if (done) done(SubmitResult{false, {}, reply.error});
            return;
        }

        const QString gid = reply.result.toString();
        if (!self->m_table.contains(id)) {
            qWarning() << "Job" << id << "was cancelled during initialization, purging gid" << gid;
            self->m_removedGids.insert(gid);
            self->m_rpc->call(QStringLiteral("aria2.forceRemove"), QJsonArray{gid}, {});
            self->m_rpc->call(QStringLiteral("aria2.removeDownloadResult"), QJsonArray{gid}, {});
            self->expireRemovedGid(gid, kRemovedGidTtlMs);
            if (done) done(SubmitResult{false, {}, QStringLiteral("Download cancelled during initialization")});
            return;
        }

        const QString existingId = self->m_gidToId.value(gid);
        if (!existingId.isEmpty() && existingId != id) {
            if (const DownloadItem* existing = self->m_table.find(existingId)) {
                qInfo() << "aria2 matched new request to existing gid" << gid;
                const DownloadItem copy = *existing;
                if (self->m_table.remove(id)) emit self->itemRemoved(id);
                if (done) done(SubmitResult{true, {copy}, QString()});
                return;
            }
        }

        self->m_gidToId.insert(gid, id);
        self->startPolling();
        qInfo() << "Started transfer" << id << "gid" << gid;
        const DownloadItem* stored = self->m_table.find(id);
        if (done) done(SubmitResult{true, {stored ? *stored : DownloadItem{}}, QString()});
    }, kAddTimeoutMs);
}

QString TransferAdapter::gidFor(const QString& id) const
{
    for (auto it = m_gidToId.constBegin(); it != m_gidToId.constEnd(); ++it) {
        if (it.value() == id) return it.key();
    }
    return QString();
}

void TransferAdapter::onNotification(const QString& method, const QString& gid)
{
    const QString id = m_gidToId.value(gid);
    if (id.isEmpty() || !m_table.contains(id)) return;

    if (method == QStringLiteral("aria2.onDownloadStart")) {
        applyDaemonStatus(id, DownloadStatus::Downloading);
    } else if (method == QStringLiteral("aria2.onDownloadPause")) {
        applyDaemonStatus(id, DownloadStatus::Paused);
    } else if (method == QStringLiteral("aria2.onDownloadStop")) {
        applyDaemonStatus(id, DownloadStatus::Cancelled);
    } else if (method == QStringLiteral("aria2.onDownloadComplete")) {
        handleComplete(id);
    } else if (method == QStringLiteral("aria2.onDownloadError")) {
        QPointer<TransferAdapter> self(this);
        m_rpc->call(QStringLiteral("aria2.tellStatus"), QJsonArray{gid, QJsonArray{QStringLiteral("errorMessage")}},
                    [self, id, gid](const RpcReply& reply) {
            if (!self) return;
            if (!reply.ok) {
                self->handleError(id, QStringLiteral("Download failed"));
                return;
            }
            QString message = reply.result.toObject().value(QStringLiteral("errorMessage")).toString();
            if (message.isEmpty()) message = QStringLiteral("Download failed (Unknown reason)");
            qWarning() << "aria2 reported an error for gid" << gid << ":" << message;
            self->handleError(id, message);
        });
    }
}

void TransferAdapter::setIntent(const QString& id, DownloadStatus status)
{
    m_intents.insert(id, Intent{status, QDateTime::currentMSecsSinceEpoch()});
}

bool TransferAdapter::intentHolds(const QString& id, DownloadStatus reported)
{
    auto it = m_intents.find(id);
    if (it == m_intents.end()) return false;
    if (QDateTime::currentMSecsSinceEpoch() - it->atMs >= kIntentGraceMs || it->status == reported) {
        m_intents.erase(it);
        return false;
    }
    return !utils::isTerminalStatus(reported);
}

void TransferAdapter::applyDaemonStatus(const QString& id, DownloadStatus status)
{
    if (status == DownloadStatus::Completed) {
        handleComplete(id);
        return;
    }
    if (intentHolds(id, status)) return;

    DownloadItem* item = m_table.find(id);
    if (!item || !m_table.applyStatus(id, status)) return;

    if (status == DownloadStatus::Paused) {
        item->progress.speed = 0;
        item->progress.speedString.clear();
        item->progress.eta.reset();
        item->progress.etaString.clear();
    }
    emit statusChanged(*item);
    if (status == DownloadStatus::Downloading || status == DownloadStatus::Pending) startPolling();
}

void TransferAdapter::updateFromStatus(const QString& id, const QJsonObject& status)
{
    DownloadItem* item = m_table.find(id);
    if (!item) return;

    const qint64 total = numberField(status, QStringLiteral("totalLength"));
    const qint64 completed = numberField(status, QStringLiteral("completedLength"));
    const qint64 speed = numberField(status, QStringLiteral("downloadSpeed"));

    DownloadProgress sample = item->progress;
    sample.progress = total > 0 ? double(completed) / double(total) * 100.0 : 0.0;
    sample.downloadedBytes = completed;
    if (total > 0) sample.totalBytes = total;
    sample.speed = speed;
    sample.speedString = utils::formatSpeed(speed);
    if (speed > 0 && total > 0) {
        sample.eta = qRound64(double(total - completed) / double(speed));
        sample.etaString = utils::formatEta(*sample.eta);
    } else {
        sample.eta.reset();
        sample.etaString.clear();
    }
    const QJsonArray files = status.value(QStringLiteral("files")).toArray();
    if (!files.isEmpty()) {
        const QString path = files.first().toObject().value(QStringLiteral("path")).toString();
        if (!path.isEmpty()) sample.filename = QFileInfo(path).fileName();
    }

    if (const auto mapped = statusFromDaemon(status.value(QStringLiteral("status")).toString()))
        applyDaemonStatus(id, *mapped);

    item = m_table.find(id);
    if (item && m_table.applyProgress(id, sample)) emit progressChanged(item->progress);
}

void TransferAdapter::handleComplete(const QString& id)
{
    DownloadItem* item = m_table.find(id);
    if (!item || !m_table.applyStatus(id, DownloadStatus::Completed)) return;

    m_intents.remove(id);
    if (item->progress.totalBytes) item->progress.downloadedBytes = *item->progress.totalBytes;
    item->progress.speed = 0;
    item->progress.eta.reset();
    qInfo() << "Transfer" << id << "completed:" << item->filename;
    emit downloadCompleted(*item);
    emit statusChanged(*item);
}

void TransferAdapter::handleError(const QString& id, const QString& message)
{
    DownloadItem* item = m_table.find(id);
    if (!item || item->status == DownloadStatus::Failed) return;

    item->error = message;
    m_table.applyStatus(id, DownloadStatus::Failed);
    m_intents.remove(id);
    qWarning() << "Transfer" << id << "failed:" << message;

    const QString gid = gidFor(id);
    QStringList fallback;
    if (!item->outputPath.isEmpty() && !item->filename.isEmpty())
        fallback.append(QDir(item->outputPath).filePath(item->filename));

    emit downloadFailed(*item, message);
    emit statusChanged(*item);

    if (gid.isEmpty()) return;

    QPointer<TransferAdapter> self(this);
    m_rpc->call(QStringLiteral("aria2.tellStatus"), QJsonArray{gid, QJsonArray{QStringLiteral("files")}},
                [self, gid, fallback](const RpcReply& reply) {
        if (!self) return;
        QStringList paths = reply.ok ? filePaths(reply.result) : QStringList();
        if (!reply.ok) qWarning() << "Could not read file paths on error:" << reply.error;
        if (paths.isEmpty()) paths = fallback;

        self->m_rpc->call(QStringLiteral("aria2.forceRemove"), QJsonArray{gid}, [self, gid, paths](const RpcReply&) {
            if (!self) return;
            self->m_rpc->call(QStringLiteral("aria2.removeDownloadResult"), QJsonArray{gid}, [self, paths](const RpcReply&) {
                if (!self) return;
                QTimer::singleShot(kErrorCleanupDelayMs, self, [self, paths]() {
                    if (self) self->deletePaths(paths);
                });
            });
        });
    });
}

void TransferAdapter::deletePaths(const QStringList& paths)
{
    if (!m_reaper) return;
    for (const QString& path : paths) {
        if (path.isEmpty()) continue;
        m_reaper->removeWithRetry(path, kFileRetries, kFileRetryDelayMs, [path](bool removed) {
            qDebug() << "Cleanup:" << QFileInfo(path).fileName() << (removed ? "cleaned" : "failed");
        });
        m_reaper->removeWithRetry(path + QStringLiteral(".aria2"), kControlRetries, kControlRetryDelayMs);
    }
}

bool TransferAdapter::pause(const QString& id)
{
    const QString gid = gidFor(id);
    DownloadItem* item = m_table.find(id);
    if (gid.isEmpty() || !item) return false;
    if (item->status != DownloadStatus::Downloading && item->status != DownloadStatus::Pending
        && item->status != DownloadStatus::Paused) {
        return false;
    }

    setIntent(id, DownloadStatus::Paused);
    if (m_table.applyStatus(id, DownloadStatus::Paused)) {
        item->progress.speed = 0;
        item->progress.speedString.clear();
        item->progress.eta.reset();
        item->progress.etaString.clear();
        emit statusChanged(*item);
    }

    m_rpc->call(QStringLiteral("aria2.pause"), QJsonArray{gid}, [id](const RpcReply& reply) {
        if (!reply.ok) qWarning() << "Background pause failed for" << id << ":" << reply.error;
    });
    return true;
}

bool TransferAdapter::resume(const QString& id)
{
    DownloadItem* item = m_table.find(id);
    if (!item) return false;
    if (item->status == DownloadStatus::Downloading) return true;
    if (item->status != DownloadStatus::Paused && item->status != DownloadStatus::Pending) {
        qWarning() << "Cannot resume transfer in status" << utils::statusName(item->status);
        return false;
    }

    const QString gid = gidFor(id);
    if (gid.isEmpty()) return false;

    const DownloadStatus target = m_scheduler.availableSlots(m_table) > 0 ? DownloadStatus::Downloading
                                                                          : DownloadStatus::Pending;
    setIntent(id, target);
    if (m_table.applyStatus(id, target)) emit statusChanged(*item);
    startPolling();

    m_rpc->call(QStringLiteral("aria2.unpause"), QJsonArray{gid}, [id](const RpcReply& reply) {
        if (!reply.ok && !reply.error.contains(QStringLiteral("cannot be unpaused")))
            qWarning() << "Background resume failed for" << id << ":" << reply.error;
    });
    return true;
}

bool TransferAdapter::cancel(const QString& id)
{
    const DownloadItem* found = m_table.find(id);
    if (!found) return false;

    DownloadItem item = *found;
    item.status = DownloadStatus::Cancelled;
    item.progress.status = DownloadStatus::Cancelled;

    const QString gid = gidFor(id);
    if (!gid.isEmpty()) m_removedGids.insert(gid);

    QStringList paths;
    if (!item.outputPath.isEmpty() && !item.filename.isEmpty())
        paths.append(QDir(item.outputPath).filePath(item.filename));

    m_table.remove(id);
    if (!gid.isEmpty()) m_gidToId.remove(gid);
    m_intents.remove(id);

    qInfo() << "Cancelled transfer" << id;
    emit statusChanged(item);
    emit itemRemoved(id);

    QPointer<TransferAdapter> self(this);
    if (gid.isEmpty()) {
        if (!paths.isEmpty()) {
            QTimer::singleShot(kRemoveRetryDelayMs, this, [self, paths]() {
                if (self) self->deletePaths(paths);
            });
        }
        return true;
    }

    m_rpc->call(QStringLiteral("aria2.tellStatus"), QJsonArray{gid, QJsonArray{QStringLiteral("files")}},
                [self, gid, paths](const RpcReply& reply) mutable {
        if (!self) return;
        if (reply.ok) {
            for (const QString& p : filePaths(reply.result)) {
                if (!paths.contains(p)) paths.append(p);
            }
        }
        self->removeFromDaemon(gid, QStringLiteral("aria2.forceRemove"), kRemoveAttempts, [self, gid, paths](bool removed) {
            if (!self) return;
            self->removeFromDaemon(gid, QStringLiteral("aria2.removeDownloadResult"), kRemoveAttempts, [self, gid, paths, removed](bool) {
                if (!self) return;
                QTimer::singleShot(kHandleReleaseMs, self, [self, gid, paths, removed]() {
                    if (!self) return;
                    self->deletePaths(paths);
                    self->expireRemovedGid(gid, removed ? kRemovedGidTtlMs : kRemovedGidFailedTtlMs);
                });
            });
        });
    });
    return true;
}

void TransferAdapter::removeFromDaemon(const QString& gid, const QString& method, int attemptsLeft, std::function<void(bool)> done)
{
    QPointer<TransferAdapter> self(this);
    m_rpc->call(method, QJsonArray{gid}, [self, gid, method, attemptsLeft, done](const RpcReply& reply) {
        if (!self) return;
        if (reply.ok || isNotFound(reply.error)) {
            if (done) done(true);
            return;
        }
        if (attemptsLeft <= 1) {
            qWarning() << method << "failed for gid" << gid << ":" << reply.error;
            if (done) done(false);
            return;
        }
        QTimer::singleShot(kRemoveRetryDelayMs, self, [self, gid, method, attemptsLeft, done]() {
            if (self) self->removeFromDaemon(gid, method, attemptsLeft - 1, done);
        });
    });
}

void TransferAdapter::expireRemovedGid(const QString& gid, int delayMs)
{
    QPointer<TransferAdapter> self(this);
    QTimer::singleShot(delayMs, this, [self, gid]() {
        if (self) self->m_removedGids.remove(gid);
    });
}

std::optional<DownloadItem> TransferAdapter::status(const QString& id) const
{
    if (const DownloadItem* item = m_table.find(id)) return *item;
    return std::nullopt;
}

QVector<DownloadItem> TransferAdapter::listAll() const
{
    return m_table.snapshot();
}

int TransferAdapter::clearCompleted()
{
    const QStringList removed = m_table.removeIf([](const DownloadItem& item) {
        return item.status == DownloadStatus::Completed || item.status == DownloadStatus::Cancelled
               || item.status == DownloadStatus::Failed;
    });
    for (const QString& id : removed) {
        const QString gid = gidFor(id);
        m_intents.remove(id);
        if (gid.isEmpty()) continue;
        m_gidToId.remove(gid);
        m_rpc->call(QStringLiteral("aria2.removeDownloadResult"), QJsonArray{gid}, {});
    }
    return removed.size();
}

void TransferAdapter::updateGlobalOptions()
{
    if (!m_settings || !m_rpc->isConnected()) return;
    const int limit = m_settings->maxConcurrentDownloads();
    QJsonObject options;
    options.insert(QStringLiteral("max-concurrent-downloads"), QString::number(limit));
    m_rpc->call(QStringLiteral("aria2.changeGlobalOption"), QJsonArray{options}, [limit](const RpcReply& reply) {
        if (reply.ok) qInfo() << "Global settings updated: max-concurrent =" << limit;
        else qWarning() << "Failed to update global options:" << reply.error;
    });
}

void TransferAdapter::startPolling()
{
    if (m_polling) return;
    m_polling = true;
    if (!m_pollInFlight) m_pollTimer.start();
}

void TransferAdapter::stopPolling()
{
    m_polling = false;
    m_pollTimer.stop();
}

void TransferAdapter::poll()
{
    bool hasActive = false;
    for (const QString& id : m_table.ids()) {
        const DownloadItem* item = m_table.find(id);
        if (item && (item->status == DownloadStatus::Downloading || item->status == DownloadStatus::Pending)) {
            hasActive = true;
            break;
        }
    }
    if (!m_rpc->isConnected() || !hasActive) {
        qDebug() << "Polling idle, stopping";
        stopPolling();
        return;
    }

    struct Gather {
        int remaining = 2;
        QJsonArray statuses;
    };
    auto gather = std::make_shared<Gather>();
    m_pollInFlight = true;

    QPointer<TransferAdapter> self(this);
    const auto collect = [self, gather](const RpcReply& reply) {
        if (!self) return;
        if (reply.ok) {
            for (const QJsonValue& v : reply.result.toArray()) gather->statuses.append(v);
        } else if (!reply.timedOut) {
            qWarning() << "Polling error:" << reply.error;
        }
        if (--gather->remaining > 0) return;

        self->m_pollInFlight = false;
        for (const QJsonValue& v : std::as_const(gather->statuses)) {
            const QJsonObject status = v.toObject();
            const QString id = self->m_gidToId.value(status.value(QStringLiteral("gid")).toString());
            if (id.isEmpty()) continue;
            if (status.value(QStringLiteral("status")).toString() == QStringLiteral("error")) {
                qWarning() << "Polled transfer" << id << "has error status, code"
                           << status.value(QStringLiteral("errorCode")).toString();
                const QString message = status.value(QStringLiteral("errorMessage")).toString();
                self->handleError(id, message.isEmpty() ? QStringLiteral("Download failed") : message);
            } else {
                self->updateFromStatus(id, status);
            }
        }
        if (self->m_polling) self->m_pollTimer.start();
    };

    m_rpc->call(QStringLiteral("aria2.tellActive"), QJsonArray{statusKeys(true)}, collect);
    m_rpc->call(QStringLiteral("aria2.tellWaiting"), QJsonArray{0, kPollWaitingLimit, statusKeys(true)}, collect);
}

void TransferAdapter::reconcile()
{
    QPointer<TransferAdapter> self(this);
    syncWithDaemon([self]() {
        if (self) self->restoreActive();
    });
    updateGlobalOptions();
}

void TransferAdapter::syncWithDaemon(std::function<void()> then)
{
    qDebug() << "Syncing with aria2";

    struct Gather {
        int remaining = 3;
        QJsonArray tasks;
    };
    auto gather = std::make_shared<Gather>();

    QPointer<TransferAdapter> self(this);
    const auto collect = [self, gather, then](const RpcReply& reply) {
        if (!self) return;
        if (reply.ok) {
            for (const QJsonValue& v : reply.result.toArray()) gather->tasks.append(v);
        } else {
            qWarning() << "Sync failed:" << reply.error;
        }
        if (--gather->remaining > 0) return;

        for (const QJsonValue& v : std::as_const(gather->tasks)) {
            const QJsonObject task = v.toObject();
            const QString gid = task.value(QStringLiteral("gid")).toString();
            if (gid.isEmpty() || self->m_gidToId.contains(gid) || self->m_removedGids.contains(gid)) continue;

            const QJsonObject file = task.value(QStringLiteral("files")).toArray().at(0).toObject();
            const QString uri = file.value(QStringLiteral("uris")).toArray().at(0).toObject().value(QStringLiteral("uri")).toString();
            const QString url = uri.isEmpty() ? QStringLiteral("Unknown URL") : uri;

            bool matched = false;
            const QVector<DownloadItem> items = self->m_table.snapshot();
            for (const DownloadItem& existing : items) {
                if (existing.url == url) {
                    qInfo() << "aria2 gid" << gid << "now carries transfer" << existing.id;
                    self->bindGid(gid, existing.id);
                    matched = true;
                    break;
                }
            }
            if (matched) continue;

            const QString path = file.value(QStringLiteral("path")).toString();
            const qint64 total = numberField(task, QStringLiteral("totalLength"));
            const qint64 completed = numberField(task, QStringLiteral("completedLength"));
            const QString daemonStatus = task.value(QStringLiteral("status")).toString();
            const DownloadStatus status = statusFromDaemon(daemonStatus).value_or(DownloadStatus::Pending);

            DownloadItem item;
            item.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
            item.url = url;
            item.options.url = url;
            item.backend = Backend::Transfer;
            item.status = status;
            item.filename = path.isEmpty() ? QStringLiteral("Unknown File") : QFileInfo(path).fileName();
            item.outputPath = path.isEmpty() ? task.value(QStringLiteral("dir")).toString() : QFileInfo(path).absolutePath();
            item.options.outputPath = item.outputPath;
            item.createdAt = QDateTime::currentDateTime();
            if (completed > 0) item.startedAt = item.createdAt;
            if (status == DownloadStatus::Completed) item.completedAt = item.createdAt;
            item.progress.downloadId = item.id;
            item.progress.status = status;
            item.progress.progress = total > 0 ? qMin(100.0, double(completed) / double(total) * 100.0) : 0.0;
            item.progress.downloadedBytes = completed;
            if (total > 0) item.progress.totalBytes = total;
            item.progress.speedString = utils::formatSpeed(0);
            item.progress.filename = item.filename;

            self->m_table.insert(item);
            self->m_gidToId.insert(gid, item.id);
            qInfo() << "Adopted aria2 transfer" << gid << "as" << item.id;
            emit self->statusChanged(item);
            if (status == DownloadStatus::Downloading || status == DownloadStatus::Pending) self->startPolling();
        }
        if (then) then();
    };

    m_rpc->call(QStringLiteral("aria2.tellActive"), QJsonArray{statusKeys(true)}, collect);
    m_rpc->call(QStringLiteral("aria2.tellWaiting"), QJsonArray{0, kSyncListLimit, statusKeys(false)}, collect);
    m_rpc->call(QStringLiteral("aria2.tellStopped"), QJsonArray{0, kSyncListLimit, statusKeys(false)}, collect);
}

void TransferAdapter::restoreActive()
{
    qDebug() << "Checking for lost transfers to restore";
    const QStringList ids = m_table.ids();
    for (const QString& id : ids) {
        const DownloadItem* item = m_table.find(id);
        if (!item || (item->status != DownloadStatus::Downloading && item->status != DownloadStatus::Pending)) continue;

        const QString gid = gidFor(id);
        if (gid.isEmpty()) {
            if (!m_starting.contains(id)) restore(id);
            continue;
        }

        QPointer<TransferAdapter> self(this);
        m_rpc->call(QStringLiteral("aria2.tellStatus"), QJsonArray{gid}, [self, id, gid](const RpcReply& reply) {
            if (!self || reply.ok) return;
            if (self->m_gidToId.value(gid) != id) return;
            self->m_gidToId.remove(gid);
            self->restore(id);
        });
    }
}

void TransferAdapter::restore(const QString& id)
{
    const DownloadItem* item = m_table.find(id);
    if (!item) return;
    qWarning() << "Restoring lost transfer:" << (item->filename.isEmpty() ? item->url : item->filename);

    const QString root = m_settings ? m_settings->downloadDirectory() : QDir::homePath();
    const QString dir = item->outputPath.isEmpty() ? utils::downloadSubPath(root, QStringLiteral("others")) : item->outputPath;
    const QJsonObject options = transferOptions(dir, LinkClassifier::browserUserAgent(), item->url, item->filename);

    QPointer<TransferAdapter> self(this);
    m_rpc->call(QStringLiteral("aria2.addUri"), QJsonArray{QJsonArray{item->url}, options}, [self, id](const RpcReply& reply) {
        if (!self || !self->m_table.contains(id)) return;
        if (!reply.ok) {
            qWarning() << "Failed to restore transfer" << id << ":" << reply.error;
            self->handleError(id, QStringLiteral("Restoration failed after daemon restart"));
            return;
        }
        self->bindGid(reply.result.toString(), id);
        self->applyDaemonStatus(id, DownloadStatus::Downloading);
    }, kAddTimeoutMs);
}

void TransferAdapter::bindGid(const QString& gid, const QString& id)
{
    // A job owns exactly one gid.
    for (auto it = m_gidToId.begin(); it != m_gidToId.end();) {
        if (it.value() == id && it.key() != gid) it = m_gidToId.erase(it);
        else ++it;
    }
    m_gidToId.insert(gid, id);
}
