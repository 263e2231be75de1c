/*!
 * @file        jobtable.cppm
 * @brief       In-memory job table and admission scheduler shared by both backends.
 * @details     JobTable keeps the authoritative DownloadItem records of one
 *              backend keyed by job id, remembering insertion order so that
 *              pending jobs are admitted first-in first-out.
 *
 *              Scheduler computes how many pending jobs may start given the
 *              concurrency limit. The limit is read through a provider at every
 *              admission pass so configuration changes apply immediately.
 *
 *              All status and progress updates go through applyStatus() and
 *              applyProgress(), which are idempotent: replaying the same update
 *              reports "no change" and callers emit nothing.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/baran/blob/main/LICENSE.md
 */

module;
#include <QHash>
#include <QString>
#include <QStringList>
#include <QVector>

#include <functional>

#ifndef Q_MOC_RUN
export module baran.core.jobtable;
import baran.core.types;
#endif

#ifdef Q_MOC_RUN
#define BARAN_MODULE_EXPORT
#else
#define BARAN_MODULE_EXPORT export
#endif

/**
 * @brief Job records of a single backend.
 *
 * Single writer: only the owning adapter mutates the table.
 */
BARAN_MODULE_EXPORT class JobTable {
public:
    /**
     * @brief Insert or replace a job.
     * @param item Job record; item.id must be non-empty.
     */
    void insert(const DownloadItem& item);

    /**
     * @brief Look up a job.
     * @param id Job id.
     * @return Pointer into the table, or nullptr. Invalidated by insert/remove.
     */
    DownloadItem* find(const QString& id);
    const DownloadItem* find(const QString& id) const;

    //!< @brief Return true if the table holds the id.
    bool contains(const QString& id) const { return m_items.contains(id); }

    /**
     * @brief Remove a job.
     * @param id Job id.
     * @return True if a job was removed.
     */
    bool remove(const QString& id);

    /**
     * @brief Remove every job matching a predicate.
     * @param pred Predicate.
     * @return Removed ids in insertion order.
     */
    QStringList removeIf(const std::function<bool(const DownloadItem&)>& pred);

    //!< @brief Return the number of jobs.
    int size() const { return m_items.size(); }

    //!< @brief Return job ids in insertion order.
    QStringList ids() const { return m_order; }

    //!< @brief Return copies of all jobs, newest first.
    QVector<DownloadItem> snapshot() const;

    //!< @brief Return the number of Downloading or Merging jobs.
    int activeCount() const;

    //!< @brief Return ids of Pending jobs in insertion order.
    QStringList pendingInOrder() const;

    /**
     * @brief Transition a job to a status.
     * @param id Job id.
     * @param status New status.
     * @return True only if the job exists and its status changed.
     *
     * Sets startedAt on the first transition into Downloading and completedAt
     * on Completed. Keeps the progress snapshot status in sync.
     */
    bool applyStatus(const QString& id, DownloadStatus status);

    /**
     * @brief Merge a progress sample into a job.
     * @param id Job id.
     * @param progress Sample; percent is clamped to [0, 100].
     * @return True if any observable field changed.
     */
    bool applyProgress(const QString& id, const DownloadProgress& progress);

private:
    QHash<QString, DownloadItem> m_items;   //!< Jobs by id.
    QStringList m_order;                    //!< Insertion order.
};

/**
 * @brief Admission control over a JobTable.
 */
BARAN_MODULE_EXPORT class Scheduler {
public:
    using LimitProvider = std::function<int()>;

    /**
     * @brief Construct a scheduler.
     * @param limit Provider of the concurrency limit, queried on every pass.
     */
    explicit Scheduler(LimitProvider limit);

    //!< @brief Return the current limit, at least 1.
    int limit() const;

    //!< @brief Return how many more jobs may become active.
    int availableSlots(const JobTable& table) const;

    /**
     * @brief Select pending jobs to start.
     * @param table Job table.
     * @return Up to availableSlots() pending ids, in queue order.
     */
    QStringList admit(const JobTable& table) const;

private:
    LimitProvider m_limit;  //!< Concurrency limit source.
};
