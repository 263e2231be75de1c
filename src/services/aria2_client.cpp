module;
#include <QDebug>
#include <QHash>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <QPointer>
#include <QString>
#include <QTimer>
#include <QUrl>
#include <QVector>

#include <functional>
#include <memory>
#include <utility>

module baran.services.aria2_client;

import baran.services.engine_settings;
import baran.services.rpc_socket;
import baran.services.aria2_daemon;

static constexpr int kTimeoutThreshold = 2;
static constexpr int kPingIntervalMs = 30000;
static constexpr int kVersionIntervalMs = 60000;
static constexpr int kReconnectInitialMs = 2000;
static constexpr int kReconnectMaxMs = 30000;
static constexpr int kRecoverySettleMs = 2000;
static constexpr int kRecoveryRetryMs = 5000;

Aria2RpcClient::Aria2RpcClient(RpcSocket* socket, DaemonControl* daemon, EngineSettings* settings, QObject* parent)
    : QObject(parent),
    m_socket(socket),
    m_daemon(daemon),
    m_settings(settings)
{
    connect(m_socket, &RpcSocket::opened, this, &Aria2RpcClient::onOpened);
    connect(m_socket, &RpcSocket::closed, this, &Aria2RpcClient::onClosed);
    connect(m_socket, &RpcSocket::errorOccurred, this, &Aria2RpcClient::onSocketError);
    connect(m_socket, &RpcSocket::textReceived, this, &Aria2RpcClient::onText);

    m_pingTimer.setInterval(kPingIntervalMs);
    connect(&m_pingTimer, &QTimer::timeout, this, [this]() {
        if (m_socket->isOpen()) m_socket->ping();
    });

    m_versionTimer.setInterval(kVersionIntervalMs);
    connect(&m_versionTimer, &QTimer::timeout, this, [this]() {
        if (!m_connected) return;
        call(QStringLiteral("aria2.getVersion"), {}, [](const RpcReply& reply) {
            if (!reply.ok) qWarning() << "Heartbeat RPC failed:" << reply.error;
        });
    });
}

void Aria2RpcClient::ensureConnected(ConnectCallback done)
{
    if (m_connected && m_socket->isOpen()) {
        if (done) done(true, QString());
        return;
    }
    if (m_shutdown) {
        if (done) done(false, QStringLiteral("RPC client is shut down"));
        return;
    }

    if (done) m_connectWaiters.append(std::move(done));
    if (m_connecting || m_recovering) return;
    connectSocket();
}

void Aria2RpcClient::connectSocket()
{
    m_connecting = true;
    QPointer<Aria2RpcClient> self(this);
    m_daemon->ensureRunning([self](bool ok, const QString& error) {
        if (!self) return;
        if (!ok) {
            self->settleConnect(false, error);
            return;
        }
        QUrl url;
        url.setScheme(QStringLiteral("ws"));
        url.setHost(QStringLiteral("127.0.0.1"));
        url.setPort(self->m_settings->rpcPort());
        url.setPath(QStringLiteral("/jsonrpc"));
        qDebug() << "Connecting to aria2 RPC at" << url.toString();
        self->m_socket->open(url);
    });
}

void Aria2RpcClient::call(const QString& method, const QJsonArray& params, ReplyCallback done, int timeoutMs)
{
    if (!m_connected || !m_socket->isOpen()) {
        QPointer<Aria2RpcClient> self(this);
        ensureConnected([self, method, params, done, timeoutMs](bool ok, const QString& error) {
            if (!self) return;
            if (!ok) {
                RpcReply reply;
                reply.error = error.isEmpty() ? QStringLiteral("Not connected to aria2") : error;
                if (done) done(reply);
                return;
            }
            self->call(method, params, done, timeoutMs);
        });
        return;
    }

    const QString id = QStringLiteral("baran-%1").arg(++m_nextId);

    QJsonArray fullParams;
    fullParams.append(QStringLiteral("token:%1").arg(m_settings->rpcSecret()));
    for (const QJsonValue& value : params) fullParams.append(value);

    QJsonObject request;
    request.insert(QStringLiteral("jsonrpc"), QStringLiteral("2.0"));
    request.insert(QStringLiteral("id"), id);
    request.insert(QStringLiteral("method"), method);
    request.insert(QStringLiteral("params"), fullParams);

    auto* timer = new QTimer(this);
    timer->setSingleShot(true);
    timer->setInterval(timeoutMs);
    connect(timer, &QTimer::timeout, this, [this, id]() { onRequestTimeout(id); });

    m_pending.insert(id, PendingRequest{std::move(done), timer, method});
    timer->start();

    qDebug() << "Sending RPC request:" << method;
    if (!m_socket->sendText(QString::fromUtf8(QJsonDocument(request).toJson(QJsonDocument::Compact)))) {
        PendingRequest pending = m_pending.take(id);
        if (pending.timer) pending.timer->deleteLater();
        RpcReply reply;
        reply.error = QStringLiteral("Failed to send RPC request");
        if (pending.done) pending.done(reply);
    }
}

void Aria2RpcClient::shutdown()
{
    m_shutdown = true;
    stopHeartbeat();
    rejectAll(QStringLiteral("RPC client is shut down"));
    if (m_socket->isOpen()) m_socket->close();
}

void Aria2RpcClient::onOpened()
{
    qInfo() << "Connected to aria2 RPC";
    m_connected = true;
    m_reconnecting = false;
    m_consecutiveTimeouts = 0;
    startHeartbeat();
    settleConnect(true, QString());
    emit connected();
}

void Aria2RpcClient::onClosed()
{
    const bool wasConnected = m_connected;
    m_connected = false;
    stopHeartbeat();
    rejectAll(QStringLiteral("WebSocket connection closed"));

    if (m_connecting && !m_recovering) settleConnect(false, QStringLiteral("WebSocket connection closed"));

    if (wasConnected) {
        qInfo() << "Disconnected from aria2 RPC";
        emit disconnected();
    }
    if (!m_recovering && !m_shutdown && wasConnected) attemptReconnect();
}

void Aria2RpcClient::onSocketError(const QString& message)
{
    qWarning() << "aria2 RPC socket error:" << message;
    if (!m_connected && m_connecting) {
        rejectAll(message);
        settleConnect(false, message);
    }
}

void Aria2RpcClient::onText(const QString& message)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(message.toUtf8(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "Failed to parse RPC message:" << parseError.errorString();
        return;
    }
    const QJsonObject obj = doc.object();

    const QString id = obj.value(QStringLiteral("id")).toString();
    if (!id.isEmpty() && m_pending.contains(id)) {
        PendingRequest pending = m_pending.take(id);
        if (pending.timer) {
            pending.timer->stop();
            pending.timer->deleteLater();
        }
        m_consecutiveTimeouts = 0;

        RpcReply reply;
        if (obj.contains(QStringLiteral("error"))) {
            const QString text = obj.value(QStringLiteral("error")).toObject().value(QStringLiteral("message")).toString();
            reply.error = text.isEmpty() ? QStringLiteral("aria2 RPC error") : text;
        } else {
            reply.ok = true;
            reply.result = obj.value(QStringLiteral("result"));
        }
        if (pending.done) pending.done(reply);
        return;
    }

    const QString method = obj.value(QStringLiteral("method")).toString();
    if (method.isEmpty()) return;

    const QJsonValue first = obj.value(QStringLiteral("params")).toArray().at(0);
    const QString gid = first.isObject() ? first.toObject().value(QStringLiteral("gid")).toString()
                                         : first.toString();
    if (gid.isEmpty()) return;
    qDebug() << "Notification received:" << method << gid;
    emit notificationReceived(method, gid);
}

void Aria2RpcClient::onRequestTimeout(const QString& id)
{
    if (!m_pending.contains(id)) return;
    PendingRequest pending = m_pending.take(id);
    if (pending.timer) pending.timer->deleteLater();

    m_consecutiveTimeouts++;
    qWarning() << "RPC request timed out:" << pending.method << "consecutive:" << m_consecutiveTimeouts;
    if (m_consecutiveTimeouts >= kTimeoutThreshold) {
        m_consecutiveTimeouts = 0;
        if (!m_recovering) {
            qWarning() << "Multiple RPC timeouts, forcing recovery";
            forceRecovery();
        }
    }

    RpcReply reply;
    reply.error = QStringLiteral("Request timeout");
    reply.timedOut = true;
    if (pending.done) pending.done(reply);
}

void Aria2RpcClient::settleConnect(bool ok, const QString& error)
{
    m_connecting = false;
    const QVector<ConnectCallback> waiters = std::exchange(m_connectWaiters, {});
    for (const ConnectCallback& cb : waiters) cb(ok, error);
}

void Aria2RpcClient::rejectAll(const QString& reason)
{
    const QHash<QString, PendingRequest> pending = std::exchange(m_pending, {});
    for (const PendingRequest& request : pending) {
        if (request.timer) {
            request.timer->stop();
            request.timer->deleteLater();
        }
        RpcReply reply;
        reply.error = reason;
        if (request.done) request.done(reply);
    }
}

void Aria2RpcClient::attemptReconnect()
{
    if (m_reconnecting || m_shutdown) return;
    m_reconnecting = true;
    m_reconnectDelayMs = kReconnectInitialMs;
    qInfo() << "Connection lost, reconnecting in the background";

    auto tryOnce = std::make_shared<std::function<void()>>();
    QPointer<Aria2RpcClient> self(this);
    std::weak_ptr<std::function<void()>> weak = tryOnce;
    *tryOnce = [self, weak]() {
        if (!self || self->m_shutdown) return;
        auto retry = weak.lock();
        self->ensureConnected([self, retry](bool ok, const QString&) {
            if (!self) return;
            if (ok) {
                qInfo() << "Reconnected to aria2 RPC";
                self->m_reconnecting = false;
                return;
            }
            const int delay = self->m_reconnectDelayMs;
            self->m_reconnectDelayMs = qMin(int(self->m_reconnectDelayMs * 1.5), kReconnectMaxMs);
            QTimer::singleShot(delay, self, [retry]() { if (retry) (*retry)(); });
        });
    };
    (*tryOnce)();
}

void Aria2RpcClient::forceRecovery()
{
    m_recovering = true;
    ++m_recoveryCount;
    qWarning() << "Recovery triggered, attempt" << m_recoveryCount;
    emit recoveryStarted();

    stopHeartbeat();
    m_socket->abort();
    if (m_connected) {
        m_connected = false;
        emit disconnected();
    }
    rejectAll(QStringLiteral("WebSocket connection closed"));

    QPointer<Aria2RpcClient> self(this);
    m_daemon->restart([self](bool ok, const QString& error) {
        if (!self) return;
        if (!ok) {
            qCritical() << "Engine recovery failed:" << error;
            self->m_recovering = false;
            self->settleConnect(false, error);
            QTimer::singleShot(kRecoveryRetryMs, self, [self]() { if (self) self->attemptReconnect(); });
            return;
        }
        QTimer::singleShot(kRecoverySettleMs, self, [self]() {
            if (!self) return;
            self->m_recovering = false;
            self->ensureConnected([self](bool connected, const QString& err) {
                if (!self) return;
                if (connected) {
                    qInfo() << "Engine recovered and reconnected";
                    return;
                }
                qCritical() << "Engine recovery failed:" << err;
                QTimer::singleShot(kRecoveryRetryMs, self, [self]() { if (self) self->attemptReconnect(); });
            });
        });
    });
}

void Aria2RpcClient::startHeartbeat()
{
    m_pingTimer.start();
    m_versionTimer.start();
}

void Aria2RpcClient::stopHeartbeat()
{
    m_pingTimer.stop();
    m_versionTimer.stop();
}
