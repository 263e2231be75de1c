module;
#include <QHostAddress>
#include <QPair>
#include <QString>
#include <QStringList>
#include <QUrl>

module baran.utils.network_utils;

import baran.utils.download_utils;

namespace baran::utils {

bool isPrivateAddress(const QHostAddress& address)
{
    if (address.isNull()) return false;
    if (address.isLoopback()) return true;

    QHostAddress candidate = address;
    bool isV4 = false;
    const quint32 mapped = address.toIPv4Address(&isV4);
    if (isV4) candidate = QHostAddress(mapped);

    if (candidate.protocol() == QAbstractSocket::IPv4Protocol) {
        static const QList<QPair<QHostAddress, int>> ranges = {
            QHostAddress::parseSubnet(QStringLiteral("0.0.0.0/8")),
            QHostAddress::parseSubnet(QStringLiteral("10.0.0.0/8")),
            QHostAddress::parseSubnet(QStringLiteral("127.0.0.0/8")),
            QHostAddress::parseSubnet(QStringLiteral("169.254.0.0/16")),
            QHostAddress::parseSubnet(QStringLiteral("172.16.0.0/12")),
            QHostAddress::parseSubnet(QStringLiteral("192.168.0.0/16")),
        };
        for (const auto& range : ranges) {
            if (candidate.isInSubnet(range)) return true;
        }
        return false;
    }

    static const QList<QPair<QHostAddress, int>> ranges6 = {
        QHostAddress::parseSubnet(QStringLiteral("::/128")),
        QHostAddress::parseSubnet(QStringLiteral("::1/128")),
        QHostAddress::parseSubnet(QStringLiteral("fe80::/10")),
        QHostAddress::parseSubnet(QStringLiteral("fc00::/7")),
    };
    for (const auto& range : ranges6) {
        if (candidate.isInSubnet(range)) return true;
    }
    return false;
}

bool isPrivateHostLiteral(const QString& host)
{
    QString h = host.trimmed().toLower();
    if (h.startsWith('[') && h.endsWith(']')) h = h.mid(1, h.length() - 2);
    if (h.isEmpty()) return false;
    if (h == QStringLiteral("localhost") || h.endsWith(QStringLiteral(".localhost"))) return true;

    QHostAddress address;
    if (!address.setAddress(h)) return false;
    return isPrivateAddress(address);
}

bool isHttpUrl(const QUrl& url)
{
    if (!url.isValid() || url.host().isEmpty()) return false;
    const QString scheme = url.scheme().toLower();
    return scheme == QStringLiteral("http") || scheme == QStringLiteral("https");
}

bool hostMatchesAny(const QString& host, const QStringList& domains)
{
    const QString h = normalizeHost(host);
    if (h.isEmpty()) return false;
    for (const QString& domain : domains) {
        if (h == domain || h.endsWith(QLatin1Char('.') + domain)) return true;
    }
    return false;
}

} // namespace baran::utils
