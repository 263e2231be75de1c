/*!
 * @file        category_utils.cppm
 * @brief       Download category detection and classification helpers.
 * @details     Maps filenames or URLs to the category sub-directories used under
 *              the download root (videos, audios, images, documents, archives,
 *              programs, playlists, others).
 *
 *              These helpers centralize category logic so the transfer and
 *              extraction backends resolve output directories consistently.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/baran/blob/main/LICENSE.md
 */

module;
#include <QString>
#include <QStringList>

#ifndef Q_MOC_RUN
export module baran.utils.category_utils;
#endif

#ifdef Q_MOC_RUN
#define BARAN_MODULE_EXPORT
#else
#define BARAN_MODULE_EXPORT export
#endif

BARAN_MODULE_EXPORT namespace baran::utils {

/**
 * @brief Detects the category sub-directory for a given file name, path or URL.
 *
 * The category is inferred from the extension; query strings and fragments
 * are ignored. Unknown extensions map to "others".
 *
 * @param filePath File name, path or URL.
 * @return One of the names returned by categoryNames().
 */
QString detectCategory(const QString& filePath);

/**
 * @brief Returns the list of all category sub-directory names.
 * @return List of category name strings.
 */
QStringList categoryNames();

//!< @brief Sub-directory used for expanded playlists.
QString playlistCategory();

} // namespace baran::utils
