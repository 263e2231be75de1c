#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QTest>

#include <gtest/gtest.h>

#include <optional>

import baran.core.filereaper;

namespace {

QString touch(const QString& dir, const QString& name)
{
    const QString path = QDir(dir).filePath(name);
    QFile file(path);
    if (file.open(QIODevice::WriteOnly)) file.write("x");
    return path;
}

} // namespace

TEST(FileReaper, RemovesExistingFile)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = touch(dir.path(), QStringLiteral("a.bin"));

    FileReaper reaper;
    std::optional<bool> result;
    reaper.removeWithRetry(path, 3, 10, [&result](bool removed) { result = removed; });

    ASSERT_TRUE(QTest::qWaitFor([&result]() { return result.has_value(); }, 2000));
    EXPECT_TRUE(*result);
    EXPECT_FALSE(QFileInfo::exists(path));
}

TEST(FileReaper, MissingFileCountsAsRemoved)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    FileReaper reaper;
    std::optional<bool> result;
    reaper.removeWithRetry(QDir(dir.path()).filePath(QStringLiteral("gone.bin")), 3, 10,
                           [&result](bool removed) { result = removed; });
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(*result);
}

TEST(FileReaper, VariantsAreRemovedWithThePrimary)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = touch(dir.path(), QStringLiteral("clip.mp4"));
    const QString part = touch(dir.path(), QStringLiteral("clip.mp4.part"));
    const QString control = touch(dir.path(), QStringLiteral("clip.mp4.aria2"));
    const QString other = touch(dir.path(), QStringLiteral("other.mp4"));

    FileReaper reaper;
    reaper.removeWithVariants(path, {QStringLiteral(".part"), QStringLiteral(".aria2"), QStringLiteral(".ytdl")}, 2, 10);

    EXPECT_TRUE(QTest::qWaitFor([&]() {
        return !QFileInfo::exists(path) && !QFileInfo::exists(part) && !QFileInfo::exists(control);
    }, 2000));
    EXPECT_TRUE(QFileInfo::exists(other));
}

#ifndef Q_OS_WIN
TEST(FileReaper, UndeletableFileIsDeferred)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    // A non-empty directory cannot be removed through QFile.
    const QString path = QDir(dir.path()).filePath(QStringLiteral("locked"));
    ASSERT_TRUE(QDir().mkpath(path));
    touch(path, QStringLiteral("inner"));

    FileReaper reaper;
    QSignalSpy failed(&reaper, &FileReaper::removalFailed);
    std::optional<bool> result;
    reaper.removeWithRetry(path, 2, 10, [&result](bool removed) { result = removed; });

    ASSERT_TRUE(QTest::qWaitFor([&result]() { return result.has_value(); }, 2000));
    EXPECT_FALSE(*result);
    EXPECT_EQ(failed.count(), 1);
    EXPECT_TRUE(reaper.pendingDeletions().contains(path));
}
#endif
