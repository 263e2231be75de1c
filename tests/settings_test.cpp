#include <QDir>
#include <QSettings>
#include <QSignalSpy>
#include <QTemporaryDir>

#include <gtest/gtest.h>

import baran.core.types;
import baran.services.engine_settings;

class EngineSettingsTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ASSERT_TRUE(dir.isValid());
        file = QDir(dir.path()).filePath(QStringLiteral("engine.ini"));
    }

    QTemporaryDir dir;
    QString file;
};

TEST_F(EngineSettingsTest, Defaults)
{
    EngineSettings settings(file);
    EXPECT_EQ(settings.maxConcurrentDownloads(), 3);
    EXPECT_EQ(settings.onFileExists(), FileConflictPolicy::Rename);
    EXPECT_EQ(settings.rpcPort(), 6800);
    EXPECT_EQ(settings.rpcSecret(), QStringLiteral("baran-secret"));
    EXPECT_TRUE(settings.downloadDirectory().endsWith(QStringLiteral("Baran")));
}

TEST_F(EngineSettingsTest, ConcurrencyIsClampedAndNotified)
{
    EngineSettings settings(file);
    QSignalSpy spy(&settings, &EngineSettings::maxConcurrentDownloadsChanged);

    settings.setMaxConcurrentDownloads(0);
    EXPECT_EQ(settings.maxConcurrentDownloads(), 1);
    settings.setMaxConcurrentDownloads(1);
    EXPECT_EQ(spy.count(), 1);
}

TEST_F(EngineSettingsTest, ValuesPersistAcrossInstances)
{
    {
        EngineSettings settings(file);
        settings.setMaxConcurrentDownloads(5);
        settings.setOnFileExistsName(QStringLiteral("overwrite"));
        settings.setProxy(QStringLiteral("http://proxy:8080"));
        settings.setRpcPort(6900);
    }
    EngineSettings reloaded(file);
    EXPECT_EQ(reloaded.maxConcurrentDownloads(), 5);
    EXPECT_EQ(reloaded.onFileExists(), FileConflictPolicy::Overwrite);
    EXPECT_EQ(reloaded.onFileExistsName(), QStringLiteral("overwrite"));
    EXPECT_EQ(reloaded.proxy(), QStringLiteral("http://proxy:8080"));
    EXPECT_EQ(reloaded.rpcPort(), 6900);

    QSettings raw(file, QSettings::IniFormat);
    EXPECT_EQ(raw.value(QStringLiteral("engine/maxConcurrentDownloads")).toInt(), 5);
}

TEST_F(EngineSettingsTest, RejectsInvalidPortAndEmptySecret)
{
    EngineSettings settings(file);
    settings.setRpcPort(70000);
    settings.setRpcSecret(QString());
    EXPECT_EQ(settings.rpcPort(), 6800);
    EXPECT_EQ(settings.rpcSecret(), QStringLiteral("baran-secret"));
}

TEST_F(EngineSettingsTest, ConfiguredExecutableMustExist)
{
    EXPECT_TRUE(EngineSettings::resolveExecutable(QDir(dir.path()).filePath(QStringLiteral("missing")),
                                                  QStringLiteral("yt-dlp")).isEmpty());
}
