/*!
 * @file        filereaper.cppm
 * @brief       Retrying file deletion with deferred cleanup of locked files.
 * @details     Backends call removeWithRetry() after cancelling or failing a
 *              job. Each attempt runs on the event loop; between attempts the
 *              reaper waits without blocking. On Windows, where handles linger
 *              after a child process exits, the file is first renamed out of
 *              the way so that the original name is free immediately.
 *
 *              A file that is still present after the last attempt is queued
 *              and retried periodically instead of being abandoned.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/baran/blob/main/LICENSE.md
 */

module;
#include <QObject>
#include <QString>
#include <QStringList>
#include <QTimer>

#include <functional>

#ifndef Q_MOC_RUN
export module baran.core.filereaper;
#endif

#ifdef Q_MOC_RUN
#define BARAN_MODULE_EXPORT
#else
#define BARAN_MODULE_EXPORT export
#endif

/**
 * @brief Asynchronous file remover.
 */
BARAN_MODULE_EXPORT class FileReaper : public QObject {

    Q_OBJECT

public:
    using Callback = std::function<void(bool removed)>;

    /**
     * @brief Construct the reaper.
     * @param parent Optional parent QObject.
     */
    explicit FileReaper(QObject* parent = nullptr);

    /**
     * @brief Delete a file, retrying while it is locked.
     * @param path File to delete. A missing file counts as removed.
     * @param retries Maximum number of attempts.
     * @param delayMs Delay between attempts.
     * @param done Optional completion callback.
     */
    void removeWithRetry(const QString& path, int retries, int delayMs, Callback done = {});

    /**
     * @brief Delete a file and its partial variants.
     * @param path Final file path.
     * @param suffixes Suffixes appended to path ("part", ".aria2", ...).
     * @param retries Attempts per file.
     * @param delayMs Delay between attempts.
     */
    void removeWithVariants(const QString& path, const QStringList& suffixes, int retries, int delayMs);

    /**
     * @brief Rename a file so that the original name is released.
     * @param path File to rename.
     * @return New path, or an empty string on failure.
     */
    static QString renameForDeletion(const QString& path);

    //!< @brief Return files waiting for a deferred attempt.
    QStringList pendingDeletions() const { return m_deferred; }

    //!< @brief Attempt all deferred deletions now.
    void flushDeferred();

signals:
    /**
     * @brief Emitted when a file could not be removed after all attempts.
     * @param path File that remains on disk.
     */
    void removalFailed(const QString& path);

private:
    void attempt(const QString& path, int attemptsLeft, int delayMs, Callback done);
    void defer(const QString& path);

    QStringList m_deferred;     //!< Files queued for a later attempt.
    QTimer m_deferredTimer;     //!< Periodic deferred pass.
};

#include "filereaper.moc"
