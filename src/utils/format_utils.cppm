/*!
 * @file        format_utils.cppm
 * @brief       Human-readable formatting and parsing of sizes, speeds and ETAs.
 * @details     Shared by the transfer backend, which receives raw byte counters
 *              from the daemon, and the extraction backend, which receives
 *              pre-formatted strings such as "12.5MiB" or "01:02" from the
 *              extractor's progress lines.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/baran/blob/main/LICENSE.md
 */

module;
#include <QString>
#include <QtGlobal>

#include <optional>

#ifndef Q_MOC_RUN
export module baran.utils.format_utils;
#endif

#ifdef Q_MOC_RUN
#define BARAN_MODULE_EXPORT
#else
#define BARAN_MODULE_EXPORT export
#endif

BARAN_MODULE_EXPORT namespace baran::utils {

/**
 * @brief Formats a transfer rate.
 * @param bytesPerSecond Rate in bytes per second.
 * @return "0 B/s" for zero, otherwise a value with two decimals in B/s, KB/s, MB/s or GB/s.
 */
QString formatSpeed(qint64 bytesPerSecond);

/**
 * @brief Formats a remaining time.
 * @param seconds Remaining seconds.
 * @return "Ns", "Mm Ss" or "Hh Mm".
 */
QString formatEta(qint64 seconds);

/**
 * @brief Formats a byte count with binary units.
 * @param bytes Byte count.
 * @return Value such as "1.50 MB".
 */
QString formatBytes(qint64 bytes);

/**
 * @brief Parses a size string as printed by the extractor.
 *
 * Accepts decimal and binary units ("KiB", "MB", ...) and an optional
 * leading "~" for estimates.
 *
 * @param text Size text such as "12.34MiB".
 * @return Bytes, or std::nullopt when the text is not a size.
 */
std::optional<qint64> parseBytes(const QString& text);

/**
 * @brief Parses "SS", "MM:SS" or "HH:MM:SS" into seconds.
 * @param text ETA text.
 * @return Seconds, or std::nullopt when the text is not a time.
 */
std::optional<qint64> parseEta(const QString& text);

/**
 * @brief Parses a speed string such as "2.5MiB/s".
 * @param text Speed text.
 * @return Bytes per second, or std::nullopt.
 */
std::optional<qint64> parseSpeed(const QString& text);

} // namespace baran::utils
