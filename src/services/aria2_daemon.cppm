/*!
 * @file        aria2_daemon.cppm
 * @brief       Supervisor for the external aria2c transfer daemon.
 * @details     DaemonControl is the seam the RPC client uses to make sure a
 *              daemon is listening and to force a restart when it stops
 *              answering. Aria2Daemon implements it with QProcess.
 *
 *              The daemon runs with RPC enabled on the configured loopback
 *              port and secret, and persists its session under the
 *              application data directory so unfinished transfers survive a
 *              restart. A daemon that is already listening on the port is
 *              adopted instead of spawning a second one. A forced restart
 *              kills aria2c by name when the daemon was adopted or the port
 *              stays busy, and fails instead of re-adopting a listener that
 *              survives the kill.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/baran/blob/main/LICENSE.md
 */

module;
#include <QObject>
#include <QPointer>
#include <QProcess>
#include <QString>
#include <QStringList>
#include <QVector>

#include <functional>

#ifndef Q_MOC_RUN
export module baran.services.aria2_daemon;
import baran.services.engine_settings;
#endif

#ifdef Q_MOC_RUN
#define BARAN_MODULE_EXPORT
#else
#define BARAN_MODULE_EXPORT export
#endif

/**
 * @brief Abstract daemon supervisor.
 */
BARAN_MODULE_EXPORT class DaemonControl : public QObject {

    Q_OBJECT

public:
    //!< @brief Completion callback: ok, and an error message when not ok.
    using Callback = std::function<void(bool ok, const QString& error)>;

    explicit DaemonControl(QObject* parent = nullptr) : QObject(parent) {}
    ~DaemonControl() override = default;

    /**
     * @brief Make sure a daemon is listening.
     * @param done Completion callback.
     */
    virtual void ensureRunning(Callback done) = 0;

    /**
     * @brief Kill the daemon, wait for the port to be released, start again.
     * @param done Completion callback.
     */
    virtual void restart(Callback done) = 0;

    //!< @brief Stop the daemon owned by this supervisor.
    virtual void stop() = 0;

    //!< @brief Returns true if a daemon is believed to be running.
    virtual bool isRunning() const = 0;

    //!< @brief Returns the last configuration or startup error.
    virtual QString lastError() const = 0;

signals:
    /**
     * @brief Emitted on configuration or startup errors.
     * @param message Description, for example "aria2 binary not found".
     */
    void daemonError(const QString& message);
};

/**
 * @brief QProcess based aria2c supervisor.
 */
BARAN_MODULE_EXPORT class Aria2Daemon : public DaemonControl {

    Q_OBJECT

public:
    /**
     * @brief Construct the supervisor.
     * @param settings Engine settings (binary path, port, secret, concurrency).
     * @param parent Optional parent QObject.
     */
    explicit Aria2Daemon(EngineSettings* settings, QObject* parent = nullptr);
    ~Aria2Daemon() override;

    void ensureRunning(Callback done) override;
    void restart(Callback done) override;
    void stop() override;
    bool isRunning() const override;
    QString lastError() const override { return m_lastError; }

    //!< @brief Returns the session file path.
    static QString sessionPath();

    /**
     * @brief Build the aria2c command line.
     * @param port RPC port.
     * @param secret RPC secret.
     * @param maxConcurrent Daemon-side concurrency limit.
     * @param session Session file path.
     * @return Argument list.
     */
    static QStringList daemonArguments(int port, const QString& secret, int maxConcurrent, const QString& session);

    /**
     * @brief Override the restart timings.
     * @param cooldownMs Pause between stopping the daemon and probing the port.
     * @param portBusyDelayMs Pause between probes of a busy port.
     */
    void setRestartDelays(int cooldownMs, int portBusyDelayMs);

private:
    using PortCallback = std::function<void(bool listening)>;

    void probePort(PortCallback done);
    void waitForPort(int attemptsLeft, Callback done);
    void waitForPortRelease(int retriesLeft, Callback done);
    void start();
    void killByName();
    void settleWaiters(bool ok, const QString& error);
    void fail(const QString& message);

    EngineSettings* m_settings = nullptr;   //!< Configuration source.
    QPointer<QProcess> m_process;           //!< Owned daemon process.
    bool m_adopted = false;                 //!< True when an external daemon was found on the port.
    bool m_starting = false;                //!< True while a start is in flight.
    QVector<Callback> m_waiters;            //!< Callers waiting for the in-flight start.
    QString m_lastError;                    //!< Last error message.
    int m_restartCooldownMs = 0;            //!< Delay before probing after a stop.
    int m_portBusyDelayMs = 0;              //!< Delay between busy-port probes.
};

#include "aria2_daemon.moc"
