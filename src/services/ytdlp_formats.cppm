/*!
 * @file        ytdlp_formats.cppm
 * @brief       Metadata normalization, quality grouping and argument building for yt-dlp.
 * @details     Converts the extractor's JSON dump into VideoInfo, groups the
 *              offered encodings into one QualityOption per vertical
 *              resolution, and translates DownloadOptions plus a chosen
 *              quality into an extractor command line.
 *
 *              Format selectors always carry a fallback chain (exact ids,
 *              height-bounded best, unconstrained best) so a stale format id
 *              never fails the job outright.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/baran/blob/main/LICENSE.md
 */

module;
#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <QVector>
#include <QtGlobal>

#include <optional>

#ifndef Q_MOC_RUN
export module baran.services.ytdlp_formats;
import baran.core.types;
#endif

#ifdef Q_MOC_RUN
#define BARAN_MODULE_EXPORT
#else
#define BARAN_MODULE_EXPORT export
#endif

BARAN_MODULE_EXPORT namespace baran::utils {

//!< @brief Maximum number of playlist entries kept in metadata.
inline constexpr int kMaxPlaylistEntries = 1000;

/**
 * @brief Normalize the extractor JSON dump.
 * @param root Parsed "--dump-single-json" document.
 * @return Video or playlist description with quality options computed.
 */
VideoInfo parseVideoInfo(const QJsonObject& root);

/**
 * @brief Vertical resolution of a format.
 *
 * Reads "1080p" or "1920x1080" from the resolution, then "1080p" from the
 * quality field.
 *
 * @param format Format to inspect.
 * @return Height in pixels, if known.
 */
std::optional<int> heightFromFormat(const FormatInfo& format);

/**
 * @brief Estimated size of a format.
 * @param format Format.
 * @param duration Media duration in seconds.
 * @return Reported size, approximate size, or bitrate times duration.
 */
std::optional<qint64> estimateFormatSize(const FormatInfo& format, std::optional<double> duration);

//!< @brief Human label for a height: "Full HD (1080p)", "HD (720p)", ...
QString qualityLabel(int height);

/**
 * @brief Returns true for protocols excluded from quality grouping.
 *
 * f4m, ism, rtmp, rtsp and mms are always excluded. HLS (m3u8) is excluded
 * only when other protocols are available.
 *
 * @param protocol Format protocol.
 * @param hlsOnly True when every candidate format is HLS.
 */
bool isExcludedProtocol(const QString& protocol, bool hlsOnly);

/**
 * @brief Group formats into selectable qualities.
 * @param formats Formats offered by the extractor.
 * @param duration Media duration in seconds.
 * @return Options by descending height, audio-only last.
 */
QVector<QualityOption> buildQualityOptions(const QVector<FormatInfo>& formats, std::optional<double> duration);

/**
 * @brief Format selector expression for a download.
 * @param options Download options.
 * @param info Metadata, if fetched.
 * @return Selector passed to "-f".
 */
QString formatSelector(const DownloadOptions& options, const std::optional<VideoInfo>& info);

/**
 * @brief Full extractor command line for a download.
 * @param options Download options.
 * @param outputTemplate Absolute output path or template.
 * @param info Metadata, if fetched.
 * @param ffmpegPath Merge tool path, empty when unavailable.
 * @return Arguments with the URL last.
 */
QStringList buildDownloadArgs(const DownloadOptions& options, const QString& outputTemplate,
                              const std::optional<VideoInfo>& info, const QString& ffmpegPath);

//!< @brief Arguments for a metadata-only run.
QStringList metadataArgs(const QString& url);

//!< @brief Quality suffix for the filename ("1080p"), empty when none applies.
QString qualityLabelForFilename(const std::optional<VideoInfo>& info, const QString& quality);

/**
 * @brief Output filename or template.
 * @param options Download options.
 * @param info Metadata, if fetched.
 * @param qualitySuffix Result of qualityLabelForFilename().
 * @return "%(title).100s[.<quality>].%(ext)s" or a sanitized explicit name.
 */
QString filenameTemplate(const DownloadOptions& options, const std::optional<VideoInfo>& info, const QString& qualitySuffix);

//!< @brief Best initial size estimate for progress reporting.
std::optional<qint64> initialTotalBytes(const std::optional<VideoInfo>& info, const QString& quality);

} // namespace baran::utils
