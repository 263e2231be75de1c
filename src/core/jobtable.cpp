module;
#include <QDateTime>
#include <QHash>
#include <QString>
#include <QStringList>
#include <QVector>
#include <QtGlobal>

#include <algorithm>
#include <functional>
#include <utility>

module baran.core.jobtable;

import baran.core.types;

namespace utils = baran::utils;

void JobTable::insert(const DownloadItem& item)
{
    if (item.id.isEmpty()) return;
    if (!m_items.contains(item.id)) m_order.append(item.id);
    m_items.insert(item.id, item);
}

DownloadItem* JobTable::find(const QString& id)
{
    auto it = m_items.find(id);
    return it == m_items.end() ? nullptr : &it.value();
}

const DownloadItem* JobTable::find(const QString& id) const
{
    auto it = m_items.constFind(id);
    return it == m_items.constEnd() ? nullptr : &it.value();
}

bool JobTable::remove(const QString& id)
{
    if (m_items.remove(id) == 0) return false;
    m_order.removeAll(id);
    return true;
}

QStringList JobTable::removeIf(const std::function<bool(const DownloadItem&)>& pred)
{
    QStringList removed;
    for (const QString& id : std::as_const(m_order)) {
        const auto it = m_items.constFind(id);
        if (it != m_items.constEnd() && pred(it.value())) removed.append(id);
    }
    for (const QString& id : std::as_const(removed)) remove(id);
    return removed;
}

QVector<DownloadItem> JobTable::snapshot() const
{
    QVector<DownloadItem> out;
    out.reserve(m_order.size());
    for (const QString& id : m_order) out.append(m_items.value(id));
    std::stable_sort(out.begin(), out.end(), [](const DownloadItem& a, const DownloadItem& b) {
        return a.createdAt > b.createdAt;
    });
    return out;
}

int JobTable::activeCount() const
{
    int count = 0;
    for (const DownloadItem& item : m_items) {
        if (utils::isActiveStatus(item.status)) count++;
    }
    return count;
}

QStringList JobTable::pendingInOrder() const
{
    QStringList out;
    for (const QString& id : m_order) {
        const auto it = m_items.constFind(id);
        if (it != m_items.constEnd() && it->status == DownloadStatus::Pending) out.append(id);
    }
    return out;
}

bool JobTable::applyStatus(const QString& id, DownloadStatus status)
{
    DownloadItem* item = find(id);
    if (!item || item->status == status) return false;
    item->status = status;
    item->progress.status = status;
    if (status == DownloadStatus::Downloading && !item->startedAt.isValid())
        item->startedAt = QDateTime::currentDateTime();
    if (status == DownloadStatus::Completed) {
        item->completedAt = QDateTime::currentDateTime();
        item->progress.progress = 100.0;
    }
    return true;
}

bool JobTable::applyProgress(const QString& id, const DownloadProgress& sample)
{
    DownloadItem* item = find(id);
    if (!item) return false;

    DownloadProgress next = sample;
    next.downloadId = id;
    next.status = item->status;
    next.progress = qBound(0.0, sample.progress, 100.0);
    if (next.filename.isEmpty()) next.filename = item->progress.filename;
    if (!next.totalBytes) next.totalBytes = item->progress.totalBytes;

    const DownloadProgress& cur = item->progress;
    const bool changed = !qFuzzyCompare(cur.progress + 1.0, next.progress + 1.0)
                         || cur.downloadedBytes != next.downloadedBytes
                         || cur.totalBytes != next.totalBytes
                         || cur.speed != next.speed
                         || cur.eta != next.eta
                         || cur.filename != next.filename
                         || cur.speedString != next.speedString
                         || cur.etaString != next.etaString;
    if (!changed) return false;
    item->progress = next;
    if (!next.filename.isEmpty()) item->filename = next.filename;
    return true;
}

Scheduler::Scheduler(LimitProvider limit)
    : m_limit(std::move(limit))
{
}

int Scheduler::limit() const
{
    const int value = m_limit ? m_limit() : 1;
    return qMax(1, value);
}

int Scheduler::availableSlots(const JobTable& table) const
{
    return qMax(0, limit() - table.activeCount());
}

QStringList Scheduler::admit(const JobTable& table) const
{
    const int slots = availableSlots(table);
    if (slots == 0) return {};
    return table.pendingInOrder().mid(0, slots);
}
