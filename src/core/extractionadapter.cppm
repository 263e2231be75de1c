/*!
 * @file        extractionadapter.cppm
 * @brief       Process-supervised media extraction backend (yt-dlp).
 * @details     Runs one yt-dlp child process per active job, turns its line
 *              output into progress, status and filename updates, and maps
 *              its failures to user-facing messages.
 *
 *              Admission is shared with the transfer backend's policy: the
 *              concurrency limit is read from EngineSettings on every pass,
 *              and every queue mutation (submit, pause, resume, cancel,
 *              process exit) triggers a new pass.
 *
 *              Pausing kills the process; resuming re-queues the job and yt-dlp
 *              picks up its own partial files on the next run.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/baran/blob/main/LICENSE.md
 */

module;
#include <QByteArray>
#include <QHash>
#include <QObject>
#include <QPointer>
#include <QProcess>
#include <QString>
#include <QStringList>
#include <QVector>

#include <functional>
#include <optional>

#ifndef Q_MOC_RUN
export module baran.core.extractionadapter;
import baran.core.types;
import baran.core.backend;
import baran.core.jobtable;
import baran.core.filereaper;
import baran.services.engine_settings;
import baran.services.ytdlp_output;
#endif

#ifdef Q_MOC_RUN
#define BARAN_MODULE_EXPORT
#else
#define BARAN_MODULE_EXPORT export
#endif

/**
 * @brief yt-dlp backend.
 *
 * Owns its job table. Jobs are created Pending and admitted by the scheduler.
 */
BARAN_MODULE_EXPORT class ExtractionAdapter : public DownloadBackend {

    Q_OBJECT

public:
    //!< @brief Metadata completion: info on success, otherwise a user-facing error.
    using MetadataCallback = std::function<void(const std::optional<VideoInfo>& info, const QString& error)>;

    /**
     * @brief Construct the backend.
     * @param settings Engine settings, not owned.
     * @param reaper File deletion helper, not owned.
     * @param parent Optional parent QObject.
     */
    ExtractionAdapter(EngineSettings* settings, FileReaper* reaper, QObject* parent = nullptr);
    ~ExtractionAdapter() override;

    /**
     * @brief Fetch and normalize metadata for a URL.
     *
     * Runs yt-dlp in metadata-only mode. The run is killed after two minutes.
     *
     * @param url Page or playlist URL.
     * @param done Invoked once with the result.
     */
    void fetchMetadata(const QString& url, MetadataCallback done);

    /**
     * @brief Create a Pending job and run an admission pass.
     * @param info Metadata fetched earlier, if any.
     * @param options Download options.
     * @return The created job, or "yt-dlp is not available".
     */
    SubmitResult startDownload(const std::optional<VideoInfo>& info, const DownloadOptions& options);

    bool pause(const QString& id) override;
    bool resume(const QString& id) override;
    bool cancel(const QString& id) override;
    std::optional<DownloadItem> status(const QString& id) const override;
    QVector<DownloadItem> listAll() const override;
    int clearCompleted() override;

    //!< @brief Return the yt-dlp executable, empty when not found.
    QString program() const;

    //!< @brief Return the number of running child processes.
    int runningProcesses() const { return m_runs.size(); }

    /**
     * @brief Resolve a templated filename against the output directory.
     *
     * Picks the newest file starting with the part of the template before
     * ".%", skipping partial files and separate format streams.
     *
     * @param directory Output directory.
     * @param templ Filename or template.
     * @return Resolved file name, or empty when nothing matches.
     */
    static QString resolveTemplatedFilename(const QString& directory, const QString& templ);

    //!< @brief Returns true for partial downloads and "<title>.fNNN.<ext>" streams.
    static bool isIntermediateFile(const QString& name);

private:
    struct Run {
        QPointer<QProcess> process;
        ProgressTracker tracker;
        QStringList errorLines;
        QByteArray stdoutBuffer;
        QByteArray stderrBuffer;
        bool reachedCompletion = false;
    };

    void processQueue();
    void execute(const QString& id);
    void readOutput(const QString& id, QProcess* process, bool flush);
    void handleLine(const QString& id, const QString& line, bool fromStderr);
    void handleFinished(const QString& id, QProcess* process, int exitCode, QProcess::ExitStatus exitStatus);
    void handleStartFailure(const QString& id, QProcess* process);
    void finalizeCompleted(DownloadItem& item);
    void markFailed(const QString& id, const QString& message);
    void detachProcess(QProcess* process);
    void cleanupFiles(const DownloadItem& item, bool removePrimary);

    EngineSettings* m_settings = nullptr;   //!< Not owned.
    FileReaper* m_reaper = nullptr;         //!< Not owned.
    JobTable m_table;                       //!< Owned jobs.
    Scheduler m_scheduler;                  //!< Admission policy.
    QHash<QString, Run> m_runs;             //!< Running processes by job id.
};

#include "extractionadapter.moc"
