module;
#include <QDir>
#include <QFileInfo>
#include <QSettings>
#include <QStandardPaths>
#include <QString>

#include <memory>

module baran.services.engine_settings;

import baran.core.types;

namespace utils = baran::utils;

static QString settingsGroup()
{
    return QStringLiteral("engine");
}

static std::unique_ptr<QSettings> openStore(const QString& fileName)
{
    if (fileName.isEmpty()) return std::make_unique<QSettings>();
    return std::make_unique<QSettings>(fileName, QSettings::IniFormat);
}

EngineSettings::EngineSettings(const QString& fileName, QObject* parent)
    : QObject(parent),
    m_fileName(fileName)
{
    m_downloadDirectory = QDir(QStandardPaths::writableLocation(QStandardPaths::DownloadLocation))
                              .filePath(QStringLiteral("Baran"));
    loadSettings();
}

void EngineSettings::setMaxConcurrentDownloads(int value)
{
    if (value < 1) value = 1;
    if (m_maxConcurrentDownloads == value) return;
    m_maxConcurrentDownloads = value;
    saveSettings();
    emit maxConcurrentDownloadsChanged();
}

QString EngineSettings::onFileExistsName() const
{
    return utils::conflictPolicyName(m_onFileExists);
}

void EngineSettings::setOnFileExists(FileConflictPolicy policy)
{
    if (m_onFileExists == policy) return;
    m_onFileExists = policy;
    saveSettings();
    emit onFileExistsChanged();
}

void EngineSettings::setOnFileExistsName(const QString& name)
{
    setOnFileExists(utils::conflictPolicyFromString(name));
}

void EngineSettings::setDownloadDirectory(const QString& path)
{
    const QString next = path.trimmed();
    if (next.isEmpty() || m_downloadDirectory == next) return;
    m_downloadDirectory = next;
    saveSettings();
    emit downloadDirectoryChanged();
}

void EngineSettings::setProxy(const QString& value)
{
    if (m_proxy == value) return;
    m_proxy = value;
    saveSettings();
    emit networkOptionsChanged();
}

void EngineSettings::setCookiesFile(const QString& value)
{
    if (m_cookiesFile == value) return;
    m_cookiesFile = value;
    saveSettings();
    emit networkOptionsChanged();
}

void EngineSettings::setRateLimit(const QString& value)
{
    if (m_rateLimit == value) return;
    m_rateLimit = value;
    saveSettings();
    emit networkOptionsChanged();
}

void EngineSettings::setAria2Path(const QString& value)
{
    if (m_aria2Path == value) return;
    m_aria2Path = value;
    saveSettings();
    emit backendOptionsChanged();
}

void EngineSettings::setYtDlpPath(const QString& value)
{
    if (m_ytDlpPath == value) return;
    m_ytDlpPath = value;
    saveSettings();
    emit backendOptionsChanged();
}

void EngineSettings::setFfmpegPath(const QString& value)
{
    if (m_ffmpegPath == value) return;
    m_ffmpegPath = value;
    saveSettings();
    emit backendOptionsChanged();
}

void EngineSettings::setRpcPort(int value)
{
    if (value <= 0 || value > 65535 || m_rpcPort == value) return;
    m_rpcPort = value;
    saveSettings();
    emit backendOptionsChanged();
}

void EngineSettings::setRpcSecret(const QString& value)
{
    if (value.isEmpty() || m_rpcSecret == value) return;
    m_rpcSecret = value;
    saveSettings();
    emit backendOptionsChanged();
}

QString EngineSettings::resolveExecutable(const QString& configured, const QString& name)
{
    if (!configured.isEmpty()) {
        QFileInfo info(configured);
        if (info.exists() && info.isExecutable()) return info.absoluteFilePath();
        return QString();
    }
    return QStandardPaths::findExecutable(name);
}

void EngineSettings::loadSettings()
{
    auto settings = openStore(m_fileName);
    settings->beginGroup(settingsGroup());
    m_maxConcurrentDownloads = qMax(1, settings->value(QStringLiteral("maxConcurrentDownloads"), m_maxConcurrentDownloads).toInt());
    m_onFileExists = utils::conflictPolicyFromString(
        settings->value(QStringLiteral("onFileExists"), utils::conflictPolicyName(m_onFileExists)).toString());
    const QString dir = settings->value(QStringLiteral("downloadDirectory")).toString().trimmed();
    if (!dir.isEmpty()) m_downloadDirectory = dir;
    m_proxy = settings->value(QStringLiteral("proxy"), m_proxy).toString();
    m_cookiesFile = settings->value(QStringLiteral("cookiesFile"), m_cookiesFile).toString();
    m_rateLimit = settings->value(QStringLiteral("rateLimit"), m_rateLimit).toString();
    m_aria2Path = settings->value(QStringLiteral("aria2Path"), m_aria2Path).toString();
    m_ytDlpPath = settings->value(QStringLiteral("ytDlpPath"), m_ytDlpPath).toString();
    m_ffmpegPath = settings->value(QStringLiteral("ffmpegPath"), m_ffmpegPath).toString();
    m_rpcPort = settings->value(QStringLiteral("rpcPort"), m_rpcPort).toInt();
    m_rpcSecret = settings->value(QStringLiteral("rpcSecret"), m_rpcSecret).toString();
    settings->endGroup();
}

void EngineSettings::saveSettings()
{
    auto settings = openStore(m_fileName);
    settings->beginGroup(settingsGroup());
    settings->setValue(QStringLiteral("maxConcurrentDownloads"), m_maxConcurrentDownloads);
    settings->setValue(QStringLiteral("onFileExists"), utils::conflictPolicyName(m_onFileExists));
    settings->setValue(QStringLiteral("downloadDirectory"), m_downloadDirectory);
    settings->setValue(QStringLiteral("proxy"), m_proxy);
    settings->setValue(QStringLiteral("cookiesFile"), m_cookiesFile);
    settings->setValue(QStringLiteral("rateLimit"), m_rateLimit);
    settings->setValue(QStringLiteral("aria2Path"), m_aria2Path);
    settings->setValue(QStringLiteral("ytDlpPath"), m_ytDlpPath);
    settings->setValue(QStringLiteral("ffmpegPath"), m_ffmpegPath);
    settings->setValue(QStringLiteral("rpcPort"), m_rpcPort);
    settings->setValue(QStringLiteral("rpcSecret"), m_rpcSecret);
    settings->endGroup();
}
