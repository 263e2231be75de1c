module;
#include <QString>

module baran.core.types;

namespace baran::utils {

QString statusName(DownloadStatus status)
{
    switch (status) {
    case DownloadStatus::Pending: return QStringLiteral("pending");
    case DownloadStatus::Downloading: return QStringLiteral("downloading");
    case DownloadStatus::Merging: return QStringLiteral("merging");
    case DownloadStatus::Paused: return QStringLiteral("paused");
    case DownloadStatus::Completed: return QStringLiteral("completed");
    case DownloadStatus::Failed: return QStringLiteral("failed");
    case DownloadStatus::Cancelled: return QStringLiteral("cancelled");
    }
    return QStringLiteral("pending");
}

bool isActiveStatus(DownloadStatus status)
{
    return status == DownloadStatus::Downloading || status == DownloadStatus::Merging;
}

bool isTerminalStatus(DownloadStatus status)
{
    return status == DownloadStatus::Completed
        || status == DownloadStatus::Failed
        || status == DownloadStatus::Cancelled;
}

ClassifyMode classifyModeFromString(const QString& mode)
{
    const QString m = mode.trimmed().toLower();
    if (m == QStringLiteral("direct")) return ClassifyMode::Direct;
    if (m == QStringLiteral("video")) return ClassifyMode::Video;
    return ClassifyMode::Auto;
}

FileConflictPolicy conflictPolicyFromString(const QString& policy)
{
    const QString p = policy.trimmed().toLower();
    if (p == QStringLiteral("skip")) return FileConflictPolicy::Skip;
    if (p == QStringLiteral("overwrite")) return FileConflictPolicy::Overwrite;
    return FileConflictPolicy::Rename;
}

QString conflictPolicyName(FileConflictPolicy policy)
{
    switch (policy) {
    case FileConflictPolicy::Skip: return QStringLiteral("skip");
    case FileConflictPolicy::Overwrite: return QStringLiteral("overwrite");
    case FileConflictPolicy::Rename: return QStringLiteral("rename");
    }
    return QStringLiteral("rename");
}

} // namespace baran::utils
