/*!
 * @file        types.cppm
 * @brief       Value types shared by the classifier, both backends and the engine.
 * @details     Declares the job record (DownloadItem), its progress snapshot,
 *              the caller-supplied options, the classifier verdict and the
 *              media metadata produced by the extractor.
 *
 *              All types are plain copyable values. A DownloadItem is owned by
 *              the backend that created it; callers only ever receive copies.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/baran/blob/main/LICENSE.md
 */

module;
#include <QDateTime>
#include <QString>
#include <QStringList>
#include <QVector>
#include <QtGlobal>

#include <optional>

#ifndef Q_MOC_RUN
export module baran.core.types;
#endif

#ifdef Q_MOC_RUN
#define BARAN_MODULE_EXPORT
#else
#define BARAN_MODULE_EXPORT export
#endif

/**
 * @brief Lifecycle state of a download job.
 *
 * Pending and Paused are the only states eligible for admission by the
 * scheduler. Merging only occurs on the extraction backend.
 */
BARAN_MODULE_EXPORT enum class DownloadStatus {
    Pending,        //!< Queued, waiting for a slot.
    Downloading,    //!< Actively transferring.
    Merging,        //!< Post-processing after the raw transfer.
    Paused,         //!< Stopped by the user, resumable.
    Completed,      //!< Finished successfully.
    Failed,         //!< Finished with an error.
    Cancelled       //!< Stopped and discarded by the user.
};

//!< @brief Classifier mode: "auto", "direct" or "video".
BARAN_MODULE_EXPORT enum class ClassifyMode {
    Auto,
    Direct,
    Video
};

//!< @brief Policy applied when the target file already exists.
BARAN_MODULE_EXPORT enum class FileConflictPolicy {
    Skip,
    Overwrite,
    Rename
};

//!< @brief Which backend owns a job.
BARAN_MODULE_EXPORT enum class Backend {
    Transfer,
    Extraction
};

/**
 * @brief Caller supplied download options.
 *
 * Immutable once a job has been created from them.
 */
BARAN_MODULE_EXPORT struct DownloadOptions {
    QString url;                        //!< Source URL.
    QString filename;                   //!< Explicit filename or extractor template.
    QString outputPath;                 //!< Output directory, empty for category default.
    QString quality;                    //!< Quality key ("1080p", "bestaudio") or selector.
    QString format;                     //!< Merge container or audio format.
    bool audioOnly = false;             //!< Extract audio only.
    bool downloadSubtitles = false;     //!< Write subtitle files.
    QStringList subtitleLanguages;      //!< Subtitle languages, empty for all.
    bool embedSubtitles = false;        //!< Embed subtitles in the container.
    bool downloadThumbnail = false;     //!< Write the thumbnail.
    bool embedThumbnail = false;        //!< Embed the thumbnail.
    bool embedMetadata = false;         //!< Embed metadata tags.
    QString rateLimit;                  //!< Rate limit such as "2M".
    QString proxy;                      //!< Proxy URL.
    QString cookiesFile;                //!< Netscape cookie file.
    bool verbose = false;               //!< Verbose extractor output.
};

/**
 * @brief Frequently overwritten progress snapshot of a job.
 *
 * progress is always clamped to [0, 100].
 */
BARAN_MODULE_EXPORT struct DownloadProgress {
    QString downloadId;                     //!< Owning job id.
    DownloadStatus status = DownloadStatus::Pending;
    double progress = 0.0;                  //!< Percent complete.
    qint64 downloadedBytes = 0;             //!< Bytes downloaded.
    std::optional<qint64> totalBytes;       //!< Total bytes when known.
    qint64 speed = 0;                       //!< Bytes per second.
    QString speedString;                    //!< Human readable speed.
    std::optional<qint64> eta;              //!< Remaining seconds when known.
    QString etaString;                      //!< Human readable ETA.
    QString filename;                       //!< Resolved filename when known.
};

//!< @brief One encoding offered by the extractor.
BARAN_MODULE_EXPORT struct FormatInfo {
    QString formatId;
    QString extension;
    QString resolution;
    QString quality;
    std::optional<qint64> filesize;
    std::optional<qint64> filesizeApprox;
    std::optional<double> fps;
    QString vcodec;
    QString acodec;
    bool hasVideo = false;
    bool hasAudio = false;
    std::optional<double> tbr;      //!< Total bitrate in kbit/s.
    QString protocol;
};

//!< @brief One selectable quality, grouped by vertical resolution.
BARAN_MODULE_EXPORT struct QualityOption {
    QString key;                            //!< "1080p" or "bestaudio".
    QString label;                          //!< "Full HD (1080p)", "Audio Only", ...
    QString quality;                        //!< "1080p" or "audio".
    QString resolution;
    std::optional<qint64> totalSize;        //!< Estimated total bytes.
    std::optional<FormatInfo> videoFormat;
    std::optional<FormatInfo> audioFormat;  //!< Set when audio is a separate stream.
};

//!< @brief Thumbnail reference.
BARAN_MODULE_EXPORT struct ThumbnailInfo {
    QString url;
    int width = 0;
    int height = 0;
};

//!< @brief One entry of a playlist. index starts at 1.
BARAN_MODULE_EXPORT struct PlaylistEntry {
    QString id;
    QString title;
    std::optional<double> duration;
    QString thumbnail;
    QString url;
    int index = 0;
};

//!< @brief Playlist description.
BARAN_MODULE_EXPORT struct PlaylistInfo {
    QString id;
    QString title;
    QString uploader;
    QString thumbnail;
    int videoCount = 0;
    QVector<PlaylistEntry> videos;
};

//!< @brief Normalized video or playlist description from the extractor.
BARAN_MODULE_EXPORT struct VideoInfo {
    QString id;
    QString title;
    QString description;
    std::optional<double> duration;
    QString uploader;
    QString uploaderUrl;
    QString thumbnail;
    QVector<ThumbnailInfo> thumbnails;
    QVector<FormatInfo> formats;
    QVector<QualityOption> qualityOptions;
    QStringList subtitleLanguages;
    QString webpageUrl;
    QString extractor;
    QString extractorKey;
    bool isLive = false;
    bool isPlaylist = false;
    std::optional<PlaylistInfo> playlist;
};

/**
 * @brief The job record.
 *
 * Owned exclusively by the backend that created it.
 */
BARAN_MODULE_EXPORT struct DownloadItem {
    QString id;
    QString url;
    DownloadOptions options;
    Backend backend = Backend::Transfer;
    DownloadStatus status = DownloadStatus::Pending;
    DownloadProgress progress;
    QString outputPath;
    QString filename;
    QDateTime createdAt;
    QDateTime startedAt;        //!< Invalid until started.
    QDateTime completedAt;      //!< Invalid until completed.
    QString error;              //!< Empty when no error was recorded.
    int retryCount = 0;
    std::optional<VideoInfo> videoInfo;
};

//!< @brief Classifier verdict.
BARAN_MODULE_EXPORT struct LinkTypeResult {
    bool isDirect = false;
    QString reason;
    QString contentType;
    std::optional<qint64> contentLength;
    QString filename;
    QString suggestedUserAgent;
};

/**
 * @brief Result of a submit or start call.
 *
 * On success items holds one job, or one job per entry for an expanded
 * playlist. A skipped conflict is a success without items.
 */
BARAN_MODULE_EXPORT struct SubmitResult {
    bool success = false;
    QVector<DownloadItem> items;
    QString error;
};

BARAN_MODULE_EXPORT namespace baran::utils {

//!< @brief Returns the lower-case wire name of a status ("downloading", ...).
QString statusName(DownloadStatus status);

//!< @brief Returns true for Downloading and Merging.
bool isActiveStatus(DownloadStatus status);

//!< @brief Returns true for Completed, Failed and Cancelled.
bool isTerminalStatus(DownloadStatus status);

//!< @brief Parses "auto", "direct" or "video"; anything else is Auto.
ClassifyMode classifyModeFromString(const QString& mode);

//!< @brief Parses "skip", "overwrite" or "rename"; anything else is Rename.
FileConflictPolicy conflictPolicyFromString(const QString& policy);

//!< @brief Returns the wire name of a conflict policy.
QString conflictPolicyName(FileConflictPolicy policy);

} // namespace baran::utils
