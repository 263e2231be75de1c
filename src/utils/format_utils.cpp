module;
#include <QRegularExpression>
#include <QString>
#include <QStringList>
#include <QtGlobal>

#include <cmath>
#include <optional>

module baran.utils.format_utils;

namespace baran::utils {

QString formatSpeed(qint64 bytesPerSecond)
{
    if (bytesPerSecond <= 0) return QStringLiteral("0 B/s");
    const QStringList units = { "B/s", "KB/s", "MB/s", "GB/s" };
    const int i = qMin(static_cast<int>(std::floor(std::log(static_cast<double>(bytesPerSecond)) / std::log(1024.0))),
                       static_cast<int>(units.size()) - 1);
    const double value = bytesPerSecond / std::pow(1024.0, i);
    return QStringLiteral("%1 %2").arg(QString::number(value, 'f', 2), units.at(i));
}

QString formatEta(qint64 seconds)
{
    if (seconds < 0) seconds = 0;
    if (seconds < 60) return QStringLiteral("%1s").arg(seconds);
    if (seconds < 3600) return QStringLiteral("%1m %2s").arg(seconds / 60).arg(seconds % 60);
    return QStringLiteral("%1h %2m").arg(seconds / 3600).arg((seconds % 3600) / 60);
}

QString formatBytes(qint64 bytes)
{
    if (bytes <= 0) return QStringLiteral("0 B");
    const QStringList units = { "B", "KB", "MB", "GB", "TB" };
    double value = static_cast<double>(bytes);
    int i = 0;
    while (value >= 1024.0 && i < units.size() - 1) {
        value /= 1024.0;
        ++i;
    }
    return QStringLiteral("%1 %2").arg(QString::number(value, 'f', i == 0 ? 0 : 2), units.at(i));
}

std::optional<qint64> parseBytes(const QString& text)
{
    static const QRegularExpression re(QStringLiteral("^~?\\s*([0-9]+(?:\\.[0-9]+)?)\\s*([KMGT]?i?B)$"),
                                       QRegularExpression::CaseInsensitiveOption);
    const auto match = re.match(text.trimmed());
    if (!match.hasMatch()) return std::nullopt;

    bool ok = false;
    const double value = match.captured(1).toDouble(&ok);
    if (!ok) return std::nullopt;

    const QString unit = match.captured(2).toUpper();
    const bool binary = unit.contains('I');
    const double base = binary ? 1024.0 : 1000.0;
    int power = 0;
    switch (unit.at(0).toLatin1()) {
    case 'K': power = 1; break;
    case 'M': power = 2; break;
    case 'G': power = 3; break;
    case 'T': power = 4; break;
    default: power = 0; break;
    }
    return static_cast<qint64>(std::llround(value * std::pow(base, power)));
}

std::optional<qint64> parseEta(const QString& text)
{
    const QStringList parts = text.trimmed().split(':');
    if (parts.isEmpty() || parts.size() > 3) return std::nullopt;
    qint64 total = 0;
    for (const QString& part : parts) {
        bool ok = false;
        const int value = part.toInt(&ok);
        if (!ok || value < 0) return std::nullopt;
        total = total * 60 + value;
    }
    return total;
}

std::optional<qint64> parseSpeed(const QString& text)
{
    QString trimmed = text.trimmed();
    if (!trimmed.endsWith(QStringLiteral("/s"))) return std::nullopt;
    trimmed.chop(2);
    return parseBytes(trimmed);
}

} // namespace baran::utils
