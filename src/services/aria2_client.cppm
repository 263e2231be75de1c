/*!
 * @file        aria2_client.cppm
 * @brief       JSON-RPC client for the aria2 transfer daemon.
 * @details     Keeps one persistent socket to the daemon, correlates replies
 *              with requests, relays daemon notifications and keeps the
 *              connection alive.
 *
 *              Every request carries a bounded timeout. Two consecutive
 *              timeouts mean the daemon is alive at the socket level but not
 *              answering, so the client tears the socket down, restarts the
 *              daemon and reconnects. Only one such recovery runs at a time.
 *
 *              When the socket closes, every pending request is rejected at
 *              once and a reconnect loop with capped backoff starts.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/baran/blob/main/LICENSE.md
 */

module;
#include <QHash>
#include <QJsonArray>
#include <QJsonValue>
#include <QObject>
#include <QPointer>
#include <QString>
#include <QTimer>
#include <QVector>

#include <functional>

#ifndef Q_MOC_RUN
export module baran.services.aria2_client;
import baran.services.engine_settings;
import baran.services.rpc_socket;
import baran.services.aria2_daemon;
#endif

#ifdef Q_MOC_RUN
#define BARAN_MODULE_EXPORT
#else
#define BARAN_MODULE_EXPORT export
#endif

//!< @brief Outcome of one RPC call.
BARAN_MODULE_EXPORT struct RpcReply {
    bool ok = false;        //!< True when the daemon returned a result.
    QJsonValue result;      //!< Result payload.
    QString error;          //!< Error message when not ok.
    bool timedOut = false;  //!< True when no reply arrived in time.
};

/**
 * @brief aria2 JSON-RPC client.
 */
BARAN_MODULE_EXPORT class Aria2RpcClient : public QObject {

    Q_OBJECT

public:
    using ReplyCallback = std::function<void(const RpcReply&)>;
    using ConnectCallback = std::function<void(bool ok, const QString& error)>;

    static constexpr int kDefaultTimeoutMs = 5000;

    /**
     * @brief Construct the client.
     * @param socket Transport, not owned.
     * @param daemon Daemon supervisor, not owned.
     * @param settings Port and secret source.
     * @param parent Optional parent QObject.
     */
    Aria2RpcClient(RpcSocket* socket, DaemonControl* daemon, EngineSettings* settings, QObject* parent = nullptr);

    /**
     * @brief Connect if needed.
     * @param done Invoked once the shared connection attempt settles.
     *
     * Concurrent callers share a single in-flight attempt.
     */
    void ensureConnected(ConnectCallback done);

    /**
     * @brief Issue one RPC call.
     * @param method Method name, for example "aria2.addUri".
     * @param params Positional parameters without the secret token.
     * @param done Invoked exactly once.
     * @param timeoutMs Reply timeout.
     */
    void call(const QString& method, const QJsonArray& params, ReplyCallback done, int timeoutMs = kDefaultTimeoutMs);

    //!< @brief Returns true while the socket is open.
    bool isConnected() const { return m_connected; }

    //!< @brief Returns the number of forced recoveries performed.
    int recoveryCount() const { return m_recoveryCount; }

    //!< @brief Returns the number of requests awaiting a reply.
    int pendingCount() const { return m_pending.size(); }

    //!< @brief Close the connection and stop reconnecting.
    void shutdown();

signals:
    //!< @brief Emitted when the socket opens.
    void connected();

    //!< @brief Emitted when the socket closes.
    void disconnected();

    /**
     * @brief Emitted for daemon notifications.
     * @param method Notification method, for example "aria2.onDownloadComplete".
     * @param gid Daemon handle.
     */
    void notificationReceived(const QString& method, const QString& gid);

    //!< @brief Emitted when a forced recovery begins.
    void recoveryStarted();

private:
    struct PendingRequest {
        ReplyCallback done;
        QPointer<QTimer> timer;
        QString method;
    };

    void connectSocket();
    void onOpened();
    void onClosed();
    void onSocketError(const QString& message);
    void onText(const QString& message);
    void onRequestTimeout(const QString& id);
    void settleConnect(bool ok, const QString& error);
    void rejectAll(const QString& reason);
    void attemptReconnect();
    void forceRecovery();
    void startHeartbeat();
    void stopHeartbeat();

    RpcSocket* m_socket = nullptr;              //!< Transport.
    DaemonControl* m_daemon = nullptr;          //!< Daemon supervisor.
    EngineSettings* m_settings = nullptr;       //!< Port and secret.
    QHash<QString, PendingRequest> m_pending;   //!< Correlation map by request id.
    QVector<ConnectCallback> m_connectWaiters;  //!< Callers awaiting the shared attempt.
    quint64 m_nextId = 0;                       //!< Request id counter.
    bool m_connected = false;                   //!< Socket open.
    bool m_connecting = false;                  //!< Connection attempt in flight.
    bool m_reconnecting = false;                //!< Reconnect loop running.
    bool m_recovering = false;                  //!< Forced recovery running.
    bool m_shutdown = false;                    //!< No further reconnects.
    int m_consecutiveTimeouts = 0;              //!< Timeouts since the last reply.
    int m_recoveryCount = 0;                    //!< Forced recoveries so far.
    int m_reconnectDelayMs = 0;                 //!< Current reconnect backoff.
    QTimer m_pingTimer;                         //!< Socket keep-alive.
    QTimer m_versionTimer;                      //!< Low-cost RPC liveness probe.
};

#include "aria2_client.moc"
