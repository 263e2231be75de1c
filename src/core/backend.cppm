/*!
 * @file        backend.cppm
 * @brief       Common surface of the transfer and extraction backends.
 * @details     Both backends own a job table and publish the same event
 *              channels. The engine routes job operations by id to whichever
 *              backend owns the job and relays these signals unchanged.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/baran/blob/main/LICENSE.md
 */

module;
#include <QObject>
#include <QString>
#include <QVector>

#include <optional>

#ifndef Q_MOC_RUN
export module baran.core.backend;
import baran.core.types;
#endif

#ifdef Q_MOC_RUN
#define BARAN_MODULE_EXPORT
#else
#define BARAN_MODULE_EXPORT export
#endif

/**
 * @brief Abstract download backend.
 *
 * Job operations never throw. pause, resume and cancel return false when the
 * id is unknown or the job is not in a state that allows the operation.
 */
BARAN_MODULE_EXPORT class DownloadBackend : public QObject {

    Q_OBJECT

public:
    explicit DownloadBackend(QObject* parent = nullptr) : QObject(parent) {}
    ~DownloadBackend() override = default;

    virtual bool pause(const QString& id) = 0;
    virtual bool resume(const QString& id) = 0;

    /**
     * @brief Cancel a job.
     *
     * The job leaves the table before this returns and itemRemoved is emitted
     * exactly once. Process and file cleanup continues in the background.
     *
     * @param id Job id.
     * @return True if the job existed.
     */
    virtual bool cancel(const QString& id) = 0;

    //!< @brief Return a copy of the job, if owned by this backend.
    virtual std::optional<DownloadItem> status(const QString& id) const = 0;

    //!< @brief Return copies of all jobs, newest first.
    virtual QVector<DownloadItem> listAll() const = 0;

    //!< @brief Drop Completed and Cancelled jobs. Returns how many were removed.
    virtual int clearCompleted() = 0;

signals:
    void progressChanged(const DownloadProgress& progress);
    void statusChanged(const DownloadItem& item);
    void downloadCompleted(const DownloadItem& item);
    void downloadFailed(const DownloadItem& item, const QString& message);
    void itemRemoved(const QString& id);
};

#include "backend.moc"
