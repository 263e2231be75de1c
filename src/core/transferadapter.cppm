/*!
 * @file        transferadapter.cppm
 * @brief       RPC-controlled raw file transfer backend (aria2).
 * @details     Maps jobs onto aria2 transfers through Aria2RpcClient and keeps
 *              the job table in step with the daemon from two independent
 *              producers: pushed notifications and a 2 second polling loop.
 *              Both feed the same idempotent update path, so either source
 *              alone keeps the table correct.
 *
 *              After every (re)connect the adapter reconciles: transfers the
 *              daemon knows but the table does not are matched by URL or
 *              adopted, and jobs the table believes active but the daemon lost
 *              are submitted again.
 *
 *              pause and resume flip local state immediately. For five seconds
 *              afterwards a contradicting non-terminal daemon status is
 *              ignored; after that the daemon's view wins again.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/baran/blob/main/LICENSE.md
 */

module;
#include <QHash>
#include <QJsonObject>
#include <QObject>
#include <QSet>
#include <QString>
#include <QStringList>
#include <QTimer>
#include <QVector>
#include <QtGlobal>

#include <functional>
#include <optional>

#ifndef Q_MOC_RUN
export module baran.core.transferadapter;
import baran.core.types;
import baran.core.backend;
import baran.core.jobtable;
import baran.core.filereaper;
import baran.core.linkclassifier;
import baran.services.engine_settings;
import baran.services.aria2_client;
#endif

#ifdef Q_MOC_RUN
#define BARAN_MODULE_EXPORT
#else
#define BARAN_MODULE_EXPORT export
#endif

/**
 * @brief aria2 backend.
 *
 * Owns its job table, the gid to job id map and the set of gids removed on
 * purpose. All three are only touched from the event loop thread.
 */
BARAN_MODULE_EXPORT class TransferAdapter : public DownloadBackend {

    Q_OBJECT

public:
    using StartCallback = std::function<void(const SubmitResult&)>;

    static constexpr qint64 kMinFreeSpace = 100LL * 1024 * 1024;   //!< 100 MB floor.
    static constexpr int kAddTimeoutMs = 60000;                     //!< aria2.addUri timeout.
    static constexpr int kPollIntervalMs = 2000;                    //!< Polling period.
    static constexpr int kIntentGraceMs = 5000;                     //!< Local intent window.

    /**
     * @brief Construct the backend.
     * @param rpc aria2 RPC client, not owned.
     * @param classifier Link classifier used for filename and user agent hints, not owned.
     * @param settings Engine settings, not owned.
     * @param reaper File deletion helper, not owned.
     * @param parent Optional parent QObject.
     */
    TransferAdapter(Aria2RpcClient* rpc, LinkClassifier* classifier, EngineSettings* settings,
                    FileReaper* reaper, QObject* parent = nullptr);

    /**
     * @brief Connect to the daemon, starting it if necessary.
     * @param done Invoked once the connection attempt settles.
     */
    void connectDaemon(std::function<void(bool ok, const QString& error)> done = {});

    //!< @brief Stop polling and close the RPC connection.
    void shutdown();

    /**
     * @brief Start a transfer.
     *
     * Validates the URL, classifies it in direct mode for filename and user
     * agent hints (bounded to 5 s), applies the duplicate and conflict rules,
     * checks free space, registers the job and only then issues aria2.addUri.
     *
     * @param options Download options.
     * @param hint Verdict from an earlier classification, skips the probe.
     * @param done Invoked once with the result.
     */
    void startDownload(const DownloadOptions& options, const std::optional<LinkTypeResult>& hint, StartCallback done);

    bool pause(const QString& id) override;
    bool resume(const QString& id) override;
    bool cancel(const QString& id) override;
    std::optional<DownloadItem> status(const QString& id) const override;
    QVector<DownloadItem> listAll() const override;
    int clearCompleted() override;

    //!< @brief Push max-concurrent-downloads to the daemon.
    void updateGlobalOptions();

    //!< @brief Run a reconciliation pass now (sync, then restore).
    void reconcile();

    //!< @brief Return the gid linked to a job, empty when none.
    QString gidFor(const QString& id) const;

    //!< @brief Return true while the gid is suppressed from reconciliation.
    bool isRemovedGid(const QString& gid) const { return m_removedGids.contains(gid); }

    //!< @brief Return true while the polling loop is armed.
    bool isPolling() const { return m_polling; }

    //!< @brief Map an aria2 status word to a job status.
    static std::optional<DownloadStatus> statusFromDaemon(const QString& status);

    /**
     * @brief aria2.addUri options for a transfer.
     * @param dir Output directory.
     * @param userAgent User-Agent header value.
     * @param referer Referer header value.
     * @param out Output file name, omitted when empty.
     */
    static QJsonObject transferOptions(const QString& dir, const QString& userAgent,
                                       const QString& referer, const QString& out);

    /**
     * @brief Validate a URL before any job is created.
     * @return The error message, or empty when the URL is acceptable.
     */
    static QString validateUrl(const QString& url);

private:
    struct Intent {
        DownloadStatus status = DownloadStatus::Pending;
        qint64 atMs = 0;
    };

    void proceedStart(const DownloadOptions& options, const LinkTypeResult& link, StartCallback done);
    void onNotification(const QString& method, const QString& gid);
    void applyDaemonStatus(const QString& id, DownloadStatus status);
    void updateFromStatus(const QString& id, const QJsonObject& status);
    void handleComplete(const QString& id);
    void handleError(const QString& id, const QString& message);
    void startPolling();
    void stopPolling();
    void poll();
    void syncWithDaemon(std::function<void()> then);
    void restoreActive();
    void restore(const QString& id);
    void bindGid(const QString& gid, const QString& id);
    void removeFromDaemon(const QString& gid, const QString& method, int attemptsLeft, std::function<void(bool)> done);
    void deletePaths(const QStringList& paths);
    void expireRemovedGid(const QString& gid, int delayMs);
    bool intentHolds(const QString& id, DownloadStatus reported);
    void setIntent(const QString& id, DownloadStatus status);

    Aria2RpcClient* m_rpc = nullptr;            //!< Not owned.
    LinkClassifier* m_classifier = nullptr;     //!< Not owned.
    EngineSettings* m_settings = nullptr;       //!< Not owned.
    FileReaper* m_reaper = nullptr;             //!< Not owned.
    JobTable m_table;                           //!< Owned jobs.
    Scheduler m_scheduler;                      //!< Admission policy for resume.
    QHash<QString, QString> m_gidToId;          //!< aria2 gid to job id.
    QSet<QString> m_removedGids;                //!< Gids removed on purpose.
    QSet<QString> m_starting;                   //!< Jobs with aria2.addUri in flight.
    QHash<QString, Intent> m_intents;           //!< Recent local pause/resume intents.
    QTimer m_pollTimer;                         //!< Polling loop.
    bool m_polling = false;                     //!< Polling armed.
    bool m_pollInFlight = false;                //!< A poll is waiting for replies.
};

#include "transferadapter.moc"
