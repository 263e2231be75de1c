#include <QDateTime>
#include <QString>

#include <gtest/gtest.h>

import baran.core.types;
import baran.core.jobtable;

namespace {

DownloadItem makeItem(const QString& id, qint64 createdOffsetMs = 0,
                      DownloadStatus status = DownloadStatus::Pending)
{
    DownloadItem item;
    item.id = id;
    item.url = QStringLiteral("https://example.com/%1.zip").arg(id);
    item.status = status;
    item.progress.status = status;
    item.progress.downloadId = id;
    item.createdAt = QDateTime::fromMSecsSinceEpoch(1700000000000LL + createdOffsetMs);
    return item;
}

} // namespace

TEST(JobTable, SnapshotIsNewestFirst)
{
    JobTable table;
    table.insert(makeItem(QStringLiteral("a"), 0));
    table.insert(makeItem(QStringLiteral("b"), 2000));
    table.insert(makeItem(QStringLiteral("c"), 1000));

    const QVector<DownloadItem> items = table.snapshot();
    ASSERT_EQ(items.size(), 3);
    EXPECT_EQ(items.at(0).id, QStringLiteral("b"));
    EXPECT_EQ(items.at(1).id, QStringLiteral("c"));
    EXPECT_EQ(items.at(2).id, QStringLiteral("a"));
}

TEST(JobTable, ApplyStatusIsIdempotent)
{
    JobTable table;
    table.insert(makeItem(QStringLiteral("a")));

    EXPECT_TRUE(table.applyStatus(QStringLiteral("a"), DownloadStatus::Downloading));
    const QDateTime started = table.find(QStringLiteral("a"))->startedAt;
    EXPECT_TRUE(started.isValid());

    EXPECT_FALSE(table.applyStatus(QStringLiteral("a"), DownloadStatus::Downloading));
    EXPECT_EQ(table.find(QStringLiteral("a"))->startedAt, started);
    EXPECT_FALSE(table.applyStatus(QStringLiteral("missing"), DownloadStatus::Downloading));
}

TEST(JobTable, CompletionForcesFullProgress)
{
    JobTable table;
    table.insert(makeItem(QStringLiteral("a")));
    ASSERT_TRUE(table.applyStatus(QStringLiteral("a"), DownloadStatus::Completed));

    const DownloadItem* item = table.find(QStringLiteral("a"));
    EXPECT_DOUBLE_EQ(item->progress.progress, 100.0);
    EXPECT_EQ(item->progress.status, DownloadStatus::Completed);
    EXPECT_TRUE(item->completedAt.isValid());
}

TEST(JobTable, ProgressIsClampedAndReplayIsNoop)
{
    JobTable table;
    table.insert(makeItem(QStringLiteral("a")));

    DownloadProgress sample;
    sample.progress = 140.0;
    sample.downloadedBytes = 10;
    sample.filename = QStringLiteral("a.zip");

    EXPECT_TRUE(table.applyProgress(QStringLiteral("a"), sample));
    EXPECT_DOUBLE_EQ(table.find(QStringLiteral("a"))->progress.progress, 100.0);
    EXPECT_EQ(table.find(QStringLiteral("a"))->filename, QStringLiteral("a.zip"));
    EXPECT_FALSE(table.applyProgress(QStringLiteral("a"), sample));

    sample.progress = -3.0;
    EXPECT_TRUE(table.applyProgress(QStringLiteral("a"), sample));
    EXPECT_DOUBLE_EQ(table.find(QStringLiteral("a"))->progress.progress, 0.0);
}

TEST(JobTable, RemoveIfReturnsRemovedIds)
{
    JobTable table;
    table.insert(makeItem(QStringLiteral("a"), 0, DownloadStatus::Completed));
    table.insert(makeItem(QStringLiteral("b"), 1, DownloadStatus::Downloading));
    table.insert(makeItem(QStringLiteral("c"), 2, DownloadStatus::Cancelled));

    const QStringList removed = table.removeIf([](const DownloadItem& item) {
        return item.status == DownloadStatus::Completed || item.status == DownloadStatus::Cancelled;
    });
    EXPECT_EQ(removed, (QStringList{QStringLiteral("a"), QStringLiteral("c")}));
    EXPECT_EQ(table.size(), 1);
    EXPECT_TRUE(table.contains(QStringLiteral("b")));
}

TEST(Scheduler, AdmitsPendingInSubmissionOrderUpToLimit)
{
    int limit = 2;
    Scheduler scheduler([&limit]() { return limit; });

    JobTable table;
    table.insert(makeItem(QStringLiteral("a")));
    table.insert(makeItem(QStringLiteral("b")));
    table.insert(makeItem(QStringLiteral("c")));

    EXPECT_EQ(scheduler.admit(table), (QStringList{QStringLiteral("a"), QStringLiteral("b")}));

    table.applyStatus(QStringLiteral("a"), DownloadStatus::Downloading);
    table.applyStatus(QStringLiteral("b"), DownloadStatus::Merging);
    EXPECT_EQ(scheduler.availableSlots(table), 0);
    EXPECT_TRUE(scheduler.admit(table).isEmpty());

    limit = 3;
    EXPECT_EQ(scheduler.admit(table), (QStringList{QStringLiteral("c")}));
}

TEST(Scheduler, LimitNeverDropsBelowOne)
{
    Scheduler scheduler([]() { return 0; });
    EXPECT_EQ(scheduler.limit(), 1);

    Scheduler unset(Scheduler::LimitProvider{});
    EXPECT_EQ(unset.limit(), 1);
}
