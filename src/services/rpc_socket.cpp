module;
#include <QAbstractSocket>
#include <QDebug>
#include <QString>
#include <QUrl>
#include <QWebSocket>
#include <QWebSocketProtocol>

module baran.services.rpc_socket;

WebSocketRpcSocket::WebSocketRpcSocket(QObject* parent)
    : RpcSocket(parent)
{
    connect(&m_socket, &QWebSocket::connected, this, &RpcSocket::opened);
    connect(&m_socket, &QWebSocket::disconnected, this, &RpcSocket::closed);
    connect(&m_socket, &QWebSocket::textMessageReceived, this, &RpcSocket::textReceived);
    connect(&m_socket, &QWebSocket::errorOccurred, this, [this](QAbstractSocket::SocketError) {
        emit errorOccurred(m_socket.errorString());
    });
}

void WebSocketRpcSocket::open(const QUrl& url)
{
    if (m_socket.state() != QAbstractSocket::UnconnectedState) m_socket.abort();
    m_socket.open(url);
}

void WebSocketRpcSocket::close()
{
    m_socket.close(QWebSocketProtocol::CloseCodeNormal);
}

void WebSocketRpcSocket::abort()
{
    m_socket.abort();
}

bool WebSocketRpcSocket::isOpen() const
{
    return m_socket.state() == QAbstractSocket::ConnectedState;
}

bool WebSocketRpcSocket::sendText(const QString& message)
{
    if (!isOpen()) return false;
    return m_socket.sendTextMessage(message) > 0;
}

void WebSocketRpcSocket::ping()
{
    if (isOpen()) m_socket.ping();
}
