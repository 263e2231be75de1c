/*!
 * @file        download_utils.cppm
 * @brief       Path, filename and URL helpers shared by both download backends.
 * @details     Provides small, reusable helper functions for path normalization,
 *              filename inference from URLs and Content-Disposition headers,
 *              filename sanitization, conflict-free renaming and free space
 *              inspection.
 *
 *              All helpers are side-effect free except for the filesystem
 *              queries they perform.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/baran/blob/main/LICENSE.md
 */

module;
#include <QUrl>
#include <QString>
#include <QtGlobal>

#include <optional>

#ifndef Q_MOC_RUN
export module baran.utils.download_utils;
#endif

#ifdef Q_MOC_RUN
#define BARAN_MODULE_EXPORT
#else
#define BARAN_MODULE_EXPORT export
#endif

BARAN_MODULE_EXPORT namespace baran::utils {

/**
 * @brief Normalizes a local filesystem path or file URL.
 *
 * Converts file URLs to local paths and ensures a consistent representation
 * suitable for filesystem operations.
 *
 * @param path Local path or file:// URL.
 * @return Normalized local filesystem path.
 */
QString normalizeFilePath(const QString& path);

/**
 * @brief Extracts a filename from a Content-Disposition header value.
 *
 * The RFC 5987 form (`filename*=UTF-8''...`) wins over the plain
 * `filename=` parameter when both are present.
 *
 * @param value Raw Content-Disposition header value.
 * @return Extracted filename, or an empty string if none could be determined.
 */
QString filenameFromDisposition(const QString& value);

/**
 * @brief Infers a filename from the last URL path segment.
 *
 * Only segments that contain a dot and are longer than three characters
 * are accepted, so bare routes such as `/watch` yield nothing.
 *
 * @param url Source URL.
 * @return Decoded filename or an empty string.
 */
QString fileNameFromUrl(const QUrl& url);

/**
 * @brief Returns the lower-case extension of the URL path including the dot.
 * @param url Source URL.
 * @return Extension such as ".zip", or an empty string.
 */
QString extensionFromUrl(const QUrl& url);

/**
 * @brief Normalizes a host string.
 *
 * Converts the host to lowercase and strips a leading `www.` as well as any
 * scheme or path component.
 *
 * @param host Input host string.
 * @return Normalized host name.
 */
QString normalizeHost(const QString& host);

/**
 * @brief Replaces characters that are invalid in filenames.
 *
 * Invalid characters become `_`, the result is trimmed and cut to
 * @p maxLength characters. An empty result becomes "download".
 *
 * @param name Raw filename.
 * @param maxLength Maximum number of characters.
 * @return Safe filename.
 */
QString sanitizeFilename(const QString& name, int maxLength = 200);

/**
 * @brief Generates a unique file path if the given path already exists.
 *
 * Appends " (n)" before the extension to avoid overwriting existing files.
 *
 * @param path Desired file path.
 * @return A unique, non-existing file path.
 */
QString uniqueFilePath(const QString& path);

/**
 * @brief Generates a unique filename inside a directory.
 * @param directory Target directory.
 * @param fileName Desired filename.
 * @return The filename itself, or "base (n).ext" if it already exists.
 */
QString uniqueFileName(const QString& directory, const QString& fileName);

/**
 * @brief Checks whether a normalized path exists and refers to a regular file.
 *
 * @param path Normalized filesystem path.
 * @return true if the path exists and is a file, false otherwise.
 */
bool fileExistsPath(const QString& path);

/**
 * @brief Returns the free space available to the user on the volume of @p path.
 * @param path Any path on the volume; the nearest existing parent is used.
 * @return Bytes available, or std::nullopt if the volume cannot be queried.
 */
std::optional<qint64> freeDiskSpace(const QString& path);

/**
 * @brief Returns `<root>/<subDir>` and makes sure it exists.
 * @param root Download root directory.
 * @param subDir Category sub-directory.
 * @return Absolute directory path.
 */
QString downloadSubPath(const QString& root, const QString& subDir);

} // namespace baran::utils
