/*!
 * @file        downloadengine.cppm
 * @brief       Composition root and caller-facing surface of the engine.
 * @details     Owns the classifier, the aria2 stack (socket, daemon supervisor,
 *              RPC client), both backends and the file reaper, and wires them
 *              together with an explicit start/shutdown lifecycle.
 *
 *              submit() validates the URL synchronously, asks the classifier
 *              for a verdict and routes the job: direct links go to the
 *              transfer backend, everything else goes through a metadata fetch
 *              to the extraction backend. Playlists expand into one extraction
 *              job per entry.
 *
 *              Job operations are routed by id to whichever backend owns the
 *              job. Backend signals are relayed unchanged, so a consumer only
 *              ever subscribes to this object.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/baran/blob/main/LICENSE.md
 */

module;
#include <QHash>
#include <QObject>
#include <QPointer>
#include <QString>
#include <QStringList>
#include <QVector>

#include <functional>
#include <memory>
#include <optional>

#ifndef Q_MOC_RUN
export module baran.core.downloadengine;
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
#endif

#ifdef Q_MOC_RUN
#define BARAN_MODULE_EXPORT
#else
#define BARAN_MODULE_EXPORT export
#endif

/**
 * @brief Download orchestration engine.
 *
 * DownloadEngine is the single object an application (or the CLI) talks to.
 * Nothing on its surface throws: results travel through SubmitResult,
 * booleans, std::optional and the relayed signals.
 */
BARAN_MODULE_EXPORT class DownloadEngine : public QObject {

    Q_OBJECT

    //!< @brief Number of jobs across both backends.
    Q_PROPERTY(int jobCount READ jobCount NOTIFY jobsChanged)

public:
    using SubmitCallback = std::function<void(const SubmitResult&)>;
    using ClassifyCallback = LinkClassifier::Callback;
    using BatchCallback = LinkClassifier::BatchCallback;

    /**
     * @brief Construct the engine.
     *
     * When socket or daemon are null the production implementations
     * (QWebSocket transport, aria2c supervisor) are created and owned.
     *
     * @param settings Engine settings, not owned.
     * @param socket Optional RPC transport, not owned.
     * @param daemon Optional daemon supervisor, not owned.
     * @param parent Optional parent QObject.
     */
    explicit DownloadEngine(EngineSettings* settings, RpcSocket* socket = nullptr,
                            DaemonControl* daemon = nullptr, QObject* parent = nullptr);
    ~DownloadEngine() override;

    //!< @brief Connect to the transfer daemon in the background.
    void start();

    //!< @brief Stop polling, close the RPC connection and stop an owned daemon.
    void shutdown();

    /**
     * @brief Submit a URL.
     * @param url Source URL.
     * @param options Download options; options.url is overwritten by url.
     * @param mode Classifier mode.
     * @param done Invoked once with the created job(s) or an error.
     */
    void submit(const QString& url, const DownloadOptions& options, ClassifyMode mode, SubmitCallback done);

    bool pause(const QString& id);
    bool resume(const QString& id);
    bool cancel(const QString& id);

    //!< @brief Return a copy of the job, if any backend owns it.
    std::optional<DownloadItem> status(const QString& id) const;

    //!< @brief Return all jobs sorted by creation time, newest first.
    QVector<DownloadItem> listAll() const;

    //!< @brief Drop finished jobs from both backends. Returns how many were removed.
    int clearCompleted();

    //!< @brief Classify a single URL.
    void classify(const QString& url, ClassifyMode mode, ClassifyCallback done);

    //!< @brief Classify a batch of URLs.
    void classifyMany(const QStringList& urls, ClassifyMode mode, BatchCallback done);

    //!< @brief Fetch metadata through the extraction backend.
    void fetchMetadata(const QString& url, ExtractionAdapter::MetadataCallback done);

    //!< @brief Return the total number of jobs.
    int jobCount() const;

    //!< @brief Return true when every job is Completed, Failed or Cancelled.
    bool allTerminal() const;

    TransferAdapter* transfer() const { return m_transfer.get(); }
    ExtractionAdapter* extraction() const { return m_extraction.get(); }
    LinkClassifier* classifier() const { return m_classifier.get(); }

signals:
    void progressChanged(const DownloadProgress& progress);
    void statusChanged(const DownloadItem& item);
    void downloadCompleted(const DownloadItem& item);
    void downloadFailed(const DownloadItem& item, const QString& message);
    void itemRemoved(const QString& id);
    void jobsChanged();

    /**
     * @brief Emitted on configuration errors that block a whole backend.
     * @param message For example "aria2 binary not found".
     */
    void configurationError(const QString& message);

private:
    void routeExtraction(const QString& url, const DownloadOptions& options, SubmitCallback done);
    void expandPlaylist(const VideoInfo& info, const DownloadOptions& options, SubmitCallback done);
    void relay(DownloadBackend* backend);
    DownloadBackend* ownerOf(const QString& id) const;

    // Backends must be destroyed before the client, the client before the transport.
    EngineSettings* m_settings = nullptr;                   //!< Not owned.
    std::unique_ptr<RpcSocket> m_ownedSocket;               //!< Production transport, when not injected.
    std::unique_ptr<DaemonControl> m_ownedDaemon;           //!< Production supervisor, when not injected.
    DaemonControl* m_daemon = nullptr;                      //!< Daemon in use.
    std::unique_ptr<FileReaper> m_reaper;
    std::unique_ptr<LinkClassifier> m_classifier;
    std::unique_ptr<Aria2RpcClient> m_rpc;
    std::unique_ptr<TransferAdapter> m_transfer;
    std::unique_ptr<ExtractionAdapter> m_extraction;
};

#include "downloadengine.moc"
