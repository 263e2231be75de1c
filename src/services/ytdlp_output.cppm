/*!
 * @file        ytdlp_output.cppm
 * @brief       Structured parsing of yt-dlp console output.
 * @details     OutputLineClassifier turns one line printed by the extractor
 *              into a typed OutputEvent: progress sample, destination file,
 *              already-downloaded notice, merge start, error or warning.
 *
 *              ProgressTracker folds progress events into a DownloadProgress
 *              snapshot. Byte counts are derived from percent and the known
 *              total, never from raw counters, and an implausibly high first
 *              sample is discarded.
 *
 *              Error mapping turns stderr lines into short actionable messages.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/baran/blob/main/LICENSE.md
 */

module;
#include <QString>
#include <QStringList>
#include <QtGlobal>

#include <optional>

#ifndef Q_MOC_RUN
export module baran.services.ytdlp_output;
import baran.core.types;
#endif

#ifdef Q_MOC_RUN
#define BARAN_MODULE_EXPORT
#else
#define BARAN_MODULE_EXPORT export
#endif

//!< @brief One recognized announcement from the extractor.
BARAN_MODULE_EXPORT struct OutputEvent {
    enum class Kind {
        None,
        Progress,
        Destination,
        AlreadyDownloaded,
        Merging,
        Error,
        Warning
    };

    Kind kind = Kind::None;
    double percent = 0.0;                   //!< Progress percent, unclamped.
    std::optional<qint64> totalBytes;       //!< Total size when printed.
    QString speedText;                      //!< Speed as printed ("1.2MiB/s").
    QString etaText;                        //!< ETA as printed ("00:42").
    QString path;                           //!< File path for file announcements.
    QString message;                        //!< Text for errors and warnings.
};

/**
 * @brief Stateless line classifier.
 */
BARAN_MODULE_EXPORT class OutputLineClassifier {
public:
    /**
     * @brief Classify one output line.
     * @param line Line without the trailing newline.
     * @return Event; Kind::None for unrecognized lines.
     */
    static OutputEvent classify(const QString& line);
};

/**
 * @brief Applies progress events to a snapshot for a single run.
 */
BARAN_MODULE_EXPORT class ProgressTracker {
public:
    /**
     * @brief Construct a tracker.
     * @param initialTotal Estimated total bytes from metadata, if any.
     */
    explicit ProgressTracker(std::optional<qint64> initialTotal = std::nullopt);

    /**
     * @brief Fold one event into a snapshot.
     * @param event Classified event; only Kind::Progress is applied.
     * @param progress Snapshot to update.
     * @return True if the snapshot was updated.
     */
    bool apply(const OutputEvent& event, DownloadProgress& progress);

    //!< @brief Returns true once the first progress sample was applied.
    bool hasSample() const { return m_seen; }

    //!< @brief Returns the last percent applied.
    double lastPercent() const { return m_lastPercent; }

private:
    std::optional<qint64> m_initialTotal;   //!< Metadata estimate.
    bool m_seen = false;                    //!< First sample applied.
    double m_lastPercent = 0.0;             //!< Last clamped percent.
};

BARAN_MODULE_EXPORT namespace baran::utils {

/**
 * @brief Map extractor stderr to a user-facing download error.
 * @param stderrLines Collected error and warning lines.
 * @param exitCode Process exit code, if the process exited normally.
 * @return Message with a remediation hint where one is known.
 */
QString mapExtractorError(const QStringList& stderrLines, std::optional<int> exitCode);

/**
 * @brief Map a metadata fetch failure to a user-facing message.
 * @param error Raw error text.
 * @return Friendly message.
 */
QString mapMetadataError(const QString& error);

} // namespace baran::utils
