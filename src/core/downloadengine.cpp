module;
#include <QDebug>
#include <QDir>
#include <QPointer>
#include <QString>
#include <QStringList>
#include <QVector>

#include <algorithm>
#include <functional>
#include <memory>
#include <optional>
#include <utility>

module baran.core.downloadengine;

import baran.core.types;
import baran.core.backend;
import baran.core.filereaper;
import baran.core.linkclassifier;
import baran.core.transferadapter;
import baran.core.extractionadapter;
import baran.services.engine_settings;
import baran.services.rpc_socket;
import baran.services.aria2_daemon;
import baran.services.aria2_client;
import baran.utils.download_utils;
import baran.utils.category_utils;

namespace utils = baran::utils;

DownloadEngine::DownloadEngine(EngineSettings* settings, RpcSocket* socket, DaemonControl* daemon, QObject* parent)
    : QObject(parent),
    m_settings(settings)
{
    if (!socket) {
        m_ownedSocket = std::make_unique<WebSocketRpcSocket>();
        socket = m_ownedSocket.get();
    }
    if (!daemon) {
        m_ownedDaemon = std::make_unique<Aria2Daemon>(settings);
        daemon = m_ownedDaemon.get();
    }
    m_daemon = daemon;

    m_reaper = std::make_unique<FileReaper>();
    m_classifier = std::make_unique<LinkClassifier>();
    m_rpc = std::make_unique<Aria2RpcClient>(socket, daemon, settings);
    m_transfer = std::make_unique<TransferAdapter>(m_rpc.get(), m_classifier.get(), settings, m_reaper.get());
    m_extraction = std::make_unique<ExtractionAdapter>(settings, m_reaper.get());

    relay(m_transfer.get());
    relay(m_extraction.get());

    connect(m_daemon, &DaemonControl::daemonError, this, [this](const QString& message) {
        qCritical() << "Transfer daemon error:" << message;
        emit configurationError(message);
    });
    connect(m_reaper.get(), &FileReaper::removalFailed, this, [](const QString& path) {
        qWarning() << "Could not remove" << path << "- deferred";
    });
}

DownloadEngine::~DownloadEngine()
{
    shutdown();
}

void DownloadEngine::relay(DownloadBackend* backend)
{
    connect(backend, &DownloadBackend::progressChanged, this, &DownloadEngine::progressChanged);
    connect(backend, &DownloadBackend::statusChanged, this, &DownloadEngine::statusChanged);
    connect(backend, &DownloadBackend::downloadCompleted, this, &DownloadEngine::downloadCompleted);
    connect(backend, &DownloadBackend::downloadFailed, this, &DownloadEngine::downloadFailed);
    connect(backend, &DownloadBackend::itemRemoved, this, &DownloadEngine::itemRemoved);
    connect(backend, &DownloadBackend::statusChanged, this, &DownloadEngine::jobsChanged);
    connect(backend, &DownloadBackend::itemRemoved, this, &DownloadEngine::jobsChanged);
}

void DownloadEngine::start()
{
    if (m_extraction->program().isEmpty()) {
        qCritical() << "yt-dlp is not available";
        emit configurationError(QStringLiteral("yt-dlp is not available"));
    }
    m_transfer->connectDaemon([](bool ok, const QString& error) {
        if (ok) qInfo() << "Connected to aria2";
        else qWarning() << "aria2 unavailable:" << error;
    });
}

void DownloadEngine::shutdown()
{
    if (m_transfer) m_transfer->shutdown();
    if (m_ownedDaemon) m_ownedDaemon->stop();
}

void DownloadEngine::submit(const QString& url, const DownloadOptions& options, ClassifyMode mode, SubmitCallback done)
{
    if (const QString invalid = TransferAdapter::validateUrl(url); !invalid.isEmpty()) {
        qWarning() << "Rejected submit:" << invalid;
        if (done) done(SubmitResult{false, {}, invalid});
        return;
    }

    DownloadOptions resolved = options;
    resolved.url = url.trimmed();

    QPointer<DownloadEngine> self(this);
    m_classifier->classify(resolved.url, mode, [self, resolved, done](const LinkTypeResult& link) {
        if (!self) return;
        if (link.reason == LinkClassifier::ssrfReason() || link.reason == LinkClassifier::protocolReason()) {
            if (done) done(SubmitResult{false, {}, link.reason});
            return;
        }
        qInfo() << "Routing" << resolved.url << (link.isDirect ? "to aria2" : "to yt-dlp") << "-" << link.reason;
        if (link.isDirect) self->m_transfer->startDownload(resolved, link, done);
        else self->routeExtraction(resolved.url, resolved, done);
    });
}

void DownloadEngine::routeExtraction(const QString& url, const DownloadOptions& options, SubmitCallback done)
{
    QPointer<DownloadEngine> self(this);
    m_extraction->fetchMetadata(url, [self, options, done](const std::optional<VideoInfo>& info, const QString& error) {
        if (!self) return;
        if (!info) {
            if (done) done(SubmitResult{false, {}, error});
            return;
        }
        if (info->isPlaylist && info->playlist) {
            self->expandPlaylist(*info, options, done);
            return;
        }
        const SubmitResult result = self->m_extraction->startDownload(info, options);
        if (done) done(result);
    });
}

void DownloadEngine::expandPlaylist(const VideoInfo& info, const DownloadOptions& options, SubmitCallback done)
{
    const PlaylistInfo& playlist = *info.playlist;
    QString title = playlist.title.isEmpty() ? info.title : playlist.title;
    if (title.isEmpty()) title = QStringLiteral("playlist");

    const QString root = m_settings ? m_settings->downloadDirectory() : QDir::homePath();
    const QString playlistDir = utils::downloadSubPath(utils::downloadSubPath(root, utils::playlistCategory()),
                                                       utils::sanitizeFilename(title));

    qInfo() << "Expanding playlist" << title << "with" << playlist.videos.size() << "entries";

    SubmitResult combined;
    for (const PlaylistEntry& entry : playlist.videos) {
        if (entry.url.isEmpty()) continue;
        DownloadOptions entryOptions = options;
        entryOptions.url = entry.url;
        entryOptions.filename.clear();
        if (entryOptions.outputPath.isEmpty()) entryOptions.outputPath = playlistDir;

        const SubmitResult result = m_extraction->startDownload(std::nullopt, entryOptions);
        if (!result.success) {
            qWarning() << "Playlist entry" << entry.index << "rejected:" << result.error;
            combined.error = result.error;
            continue;
        }
        combined.items += result.items;
    }
    combined.success = !combined.items.isEmpty();
    if (combined.success) combined.error.clear();
    else if (combined.error.isEmpty()) combined.error = QStringLiteral("Playlist has no downloadable entries");
    if (done) done(combined);
}

DownloadBackend* DownloadEngine::ownerOf(const QString& id) const
{
    if (m_transfer->status(id)) return m_transfer.get();
    if (m_extraction->status(id)) return m_extraction.get();
    return nullptr;
}

bool DownloadEngine::pause(const QString& id)
{
    DownloadBackend* backend = ownerOf(id);
    return backend && backend->pause(id);
}

bool DownloadEngine::resume(const QString& id)
{
    DownloadBackend* backend = ownerOf(id);
    return backend && backend->resume(id);
}

bool DownloadEngine::cancel(const QString& id)
{
    DownloadBackend* backend = ownerOf(id);
    return backend && backend->cancel(id);
}

std::optional<DownloadItem> DownloadEngine::status(const QString& id) const
{
    if (auto item = m_transfer->status(id)) return item;
    return m_extraction->status(id);
}

QVector<DownloadItem> DownloadEngine::listAll() const
{
    QVector<DownloadItem> all = m_transfer->listAll();
    all += m_extraction->listAll();
    std::stable_sort(all.begin(), all.end(), [](const DownloadItem& a, const DownloadItem& b) {
        return a.createdAt > b.createdAt;
    });
    return all;
}

int DownloadEngine::clearCompleted()
{
    const int removed = m_transfer->clearCompleted() + m_extraction->clearCompleted();
    if (removed > 0) emit jobsChanged();
    return removed;
}

void DownloadEngine::classify(const QString& url, ClassifyMode mode, ClassifyCallback done)
{
    m_classifier->classify(url, mode, std::move(done));
}

void DownloadEngine::classifyMany(const QStringList& urls, ClassifyMode mode, BatchCallback done)
{
    m_classifier->classifyMany(urls, mode, std::move(done));
}

void DownloadEngine::fetchMetadata(const QString& url, ExtractionAdapter::MetadataCallback done)
{
    m_extraction->fetchMetadata(url, std::move(done));
}

int DownloadEngine::jobCount() const
{
    return m_transfer->listAll().size() + m_extraction->listAll().size();
}

bool DownloadEngine::allTerminal() const
{
    const QVector<DownloadItem> all = listAll();
    return std::all_of(all.begin(), all.end(), [](const DownloadItem& item) {
        return utils::isTerminalStatus(item.status);
    });
}
