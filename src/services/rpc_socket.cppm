/*!
 * @file        rpc_socket.cppm
 * @brief       Message socket abstraction used by the daemon RPC client.
 * @details     RpcSocket is the text-frame transport between Aria2RpcClient and
 *              the transfer daemon. WebSocketRpcSocket is the production
 *              implementation on top of QWebSocket; tests substitute a scripted
 *              socket.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/baran/blob/main/LICENSE.md
 */

module;
#include <QObject>
#include <QString>
#include <QUrl>
#include <QWebSocket>

#ifndef Q_MOC_RUN
export module baran.services.rpc_socket;
#endif

#ifdef Q_MOC_RUN
#define BARAN_MODULE_EXPORT
#else
#define BARAN_MODULE_EXPORT export
#endif

/**
 * @brief Abstract text-message socket.
 */
BARAN_MODULE_EXPORT class RpcSocket : public QObject {

    Q_OBJECT

public:
    explicit RpcSocket(QObject* parent = nullptr) : QObject(parent) {}
    ~RpcSocket() override = default;

    /**
     * @brief Start connecting.
     * @param url Endpoint URL.
     *
     * Completion is reported through opened() or errorOccurred() followed by closed().
     */
    virtual void open(const QUrl& url) = 0;

    //!< @brief Close gracefully.
    virtual void close() = 0;

    //!< @brief Drop the connection immediately; closed() is still emitted.
    virtual void abort() = 0;

    //!< @brief Returns true while connected.
    virtual bool isOpen() const = 0;

    /**
     * @brief Send one text frame.
     * @param message Frame payload.
     * @return True if the frame was queued.
     */
    virtual bool sendText(const QString& message) = 0;

    //!< @brief Send a keep-alive ping.
    virtual void ping() = 0;

signals:
    void opened();
    void closed();
    void textReceived(const QString& message);
    void errorOccurred(const QString& message);
};

/**
 * @brief RpcSocket over QWebSocket.
 */
BARAN_MODULE_EXPORT class WebSocketRpcSocket : public RpcSocket {

    Q_OBJECT

public:
    explicit WebSocketRpcSocket(QObject* parent = nullptr);

    void open(const QUrl& url) override;
    void close() override;
    void abort() override;
    bool isOpen() const override;
    bool sendText(const QString& message) override;
    void ping() override;

private:
    QWebSocket m_socket;    //!< Underlying socket.
};

#include "rpc_socket.moc"
