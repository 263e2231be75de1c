/*!
 * @file        engine_settings.cppm
 * @brief       Persistent engine configuration backed by QSettings.
 * @details     Holds the options both backends read at use time: concurrency
 *              limit, file conflict policy, download root, network options,
 *              external binary locations and the daemon RPC endpoint.
 *
 *              Every setter persists immediately and emits a change signal so
 *              that a live change (for example a new concurrency limit) takes
 *              effect on the next admission pass.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/baran/blob/main/LICENSE.md
 */

module;
#include <QObject>
#include <QString>

#ifndef Q_MOC_RUN
export module baran.services.engine_settings;
import baran.core.types;
#endif

#ifdef Q_MOC_RUN
#define BARAN_MODULE_EXPORT
#else
#define BARAN_MODULE_EXPORT export
#endif

/**
 * @brief Engine configuration.
 *
 * Values are loaded once from QSettings (group "engine") and written back on
 * every change. Tests pass an explicit INI file so they never touch the user
 * configuration.
 */
BARAN_MODULE_EXPORT class EngineSettings : public QObject {

    Q_OBJECT

    //!< @brief Maximum concurrent downloads per backend (>= 1).
    Q_PROPERTY(int maxConcurrentDownloads READ maxConcurrentDownloads WRITE setMaxConcurrentDownloads NOTIFY maxConcurrentDownloadsChanged)

    //!< @brief Conflict policy name: skip, overwrite or rename.
    Q_PROPERTY(QString onFileExists READ onFileExistsName WRITE setOnFileExistsName NOTIFY onFileExistsChanged)

    //!< @brief Root directory for category sub-directories.
    Q_PROPERTY(QString downloadDirectory READ downloadDirectory WRITE setDownloadDirectory NOTIFY downloadDirectoryChanged)

    //!< @brief Default proxy URL.
    Q_PROPERTY(QString proxy READ proxy WRITE setProxy NOTIFY networkOptionsChanged)

    //!< @brief Default cookie file.
    Q_PROPERTY(QString cookiesFile READ cookiesFile WRITE setCookiesFile NOTIFY networkOptionsChanged)

    //!< @brief Default extractor rate limit.
    Q_PROPERTY(QString rateLimit READ rateLimit WRITE setRateLimit NOTIFY networkOptionsChanged)

public:
    /**
     * @brief Construct the settings object.
     * @param fileName INI file to use; empty selects the application default store.
     * @param parent Optional parent QObject.
     */
    explicit EngineSettings(const QString& fileName = QString(), QObject* parent = nullptr);

    //!< @brief Return the concurrency limit.
    int maxConcurrentDownloads() const { return m_maxConcurrentDownloads; }

    /**
     * @brief Set the concurrency limit.
     * @param value New limit, clamped to at least 1.
     */
    void setMaxConcurrentDownloads(int value);

    //!< @brief Return the conflict policy.
    FileConflictPolicy onFileExists() const { return m_onFileExists; }

    //!< @brief Return the conflict policy name.
    QString onFileExistsName() const;

    /**
     * @brief Set the conflict policy.
     * @param policy New policy.
     */
    void setOnFileExists(FileConflictPolicy policy);

    /**
     * @brief Set the conflict policy by name.
     * @param name "skip", "overwrite" or "rename".
     */
    void setOnFileExistsName(const QString& name);

    //!< @brief Return the download root directory.
    QString downloadDirectory() const { return m_downloadDirectory; }

    /**
     * @brief Set the download root directory.
     * @param path Directory path.
     */
    void setDownloadDirectory(const QString& path);

    //!< @brief Return the default proxy.
    QString proxy() const { return m_proxy; }
    void setProxy(const QString& value);

    //!< @brief Return the default cookie file.
    QString cookiesFile() const { return m_cookiesFile; }
    void setCookiesFile(const QString& value);

    //!< @brief Return the default rate limit.
    QString rateLimit() const { return m_rateLimit; }
    void setRateLimit(const QString& value);

    //!< @brief Return the configured aria2c path, empty for PATH lookup.
    QString aria2Path() const { return m_aria2Path; }
    void setAria2Path(const QString& value);

    //!< @brief Return the configured yt-dlp path, empty for PATH lookup.
    QString ytDlpPath() const { return m_ytDlpPath; }
    void setYtDlpPath(const QString& value);

    //!< @brief Return the configured ffmpeg path, empty for PATH lookup.
    QString ffmpegPath() const { return m_ffmpegPath; }
    void setFfmpegPath(const QString& value);

    //!< @brief Return the daemon RPC port.
    int rpcPort() const { return m_rpcPort; }
    void setRpcPort(int value);

    //!< @brief Return the daemon RPC secret.
    QString rpcSecret() const { return m_rpcSecret; }
    void setRpcSecret(const QString& value);

    /**
     * @brief Resolve an executable from an explicit path or the PATH.
     * @param configured Configured path, may be empty.
     * @param name Executable name for PATH lookup.
     * @return Absolute path, or an empty string if not found.
     */
    static QString resolveExecutable(const QString& configured, const QString& name);

signals:
    //!< @brief Emitted when the concurrency limit changes.
    void maxConcurrentDownloadsChanged();

    //!< @brief Emitted when the conflict policy changes.
    void onFileExistsChanged();

    //!< @brief Emitted when the download root changes.
    void downloadDirectoryChanged();

    //!< @brief Emitted when proxy, cookies or rate limit change.
    void networkOptionsChanged();

    //!< @brief Emitted when binary paths or the RPC endpoint change.
    void backendOptionsChanged();

private:
    //!< @brief Load all values from the store.
    void loadSettings();

    //!< @brief Write all values to the store.
    void saveSettings();

    QString m_fileName;                                         //!< INI file, empty for the default store.
    int m_maxConcurrentDownloads = 3;                           //!< Concurrency limit.
    FileConflictPolicy m_onFileExists = FileConflictPolicy::Rename; //!< Conflict policy.
    QString m_downloadDirectory;                                //!< Download root.
    QString m_proxy;                                            //!< Proxy URL.
    QString m_cookiesFile;                                      //!< Cookie file.
    QString m_rateLimit;                                        //!< Rate limit.
    QString m_aria2Path;                                        //!< aria2c path.
    QString m_ytDlpPath;                                        //!< yt-dlp path.
    QString m_ffmpegPath;                                       //!< ffmpeg path.
    int m_rpcPort = 6800;                                       //!< RPC port.
    QString m_rpcSecret = QStringLiteral("baran-secret");       //!< RPC secret.
};

#include "engine_settings.moc"
