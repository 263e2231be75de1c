module;
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>
#include <QStorageInfo>
#include <QtGlobal>

#include <optional>

module baran.utils.download_utils;

namespace baran::utils {

QString normalizeFilePath(const QString& path)
{
    if (path.startsWith("file://")) {
        QUrl url(path);
        if (url.isValid() && url.isLocalFile()) {
            return url.toLocalFile();
        }
    }
    return path;
}

QString filenameFromDisposition(const QString& value)
{
    if (value.isEmpty()) return QString();

    static const QRegularExpression extended(QStringLiteral("filename\\*\\s*=\\s*UTF-8''([^;]+)"),
                                             QRegularExpression::CaseInsensitiveOption);
    auto match = extended.match(value);
    if (match.hasMatch()) {
        return QUrl::fromPercentEncoding(match.captured(1).trimmed().toUtf8());
    }

    static const QRegularExpression plain(QStringLiteral("filename\\s*=\\s*\"?([^\";]+)\"?"),
                                          QRegularExpression::CaseInsensitiveOption);
    match = plain.match(value);
    if (match.hasMatch()) return match.captured(1).trimmed();
    return QString();
}

QString fileNameFromUrl(const QUrl& url)
{
    if (!url.isValid()) return QString();
    const QString base = QFileInfo(url.path(QUrl::FullyDecoded)).fileName();
    if (base.contains('.') && base.length() > 3) return base;
    return QString();
}

QString extensionFromUrl(const QUrl& url)
{
    if (!url.isValid()) return QString();
    const QString base = QFileInfo(url.path(QUrl::FullyDecoded)).fileName().toLower();
    const int dot = base.lastIndexOf('.');
    if (dot <= 0 || dot == base.length() - 1) return QString();
    return base.mid(dot);
}

QString normalizeHost(const QString& host)
{
    QString h = host.trimmed().toLower();
    if (h.isEmpty()) return QString();
    if (h.contains("://")) {
        QUrl u(h);
        if (u.isValid()) h = u.host().toLower();
    }
    const int slash = h.indexOf('/');
    if (slash >= 0) h = h.left(slash);
    if (h.startsWith(QStringLiteral("www."))) h = h.mid(4);
    return h;
}

QString sanitizeFilename(const QString& name, int maxLength)
{
    static const QRegularExpression invalid(QStringLiteral("[<>:\"/\\\\|?*\\x00-\\x1F]"));
    QString out = name;
    out.replace(invalid, QStringLiteral("_"));
    out = out.trimmed();
    if (out.length() > maxLength) out = out.left(maxLength).trimmed();
    if (out.isEmpty()) return QStringLiteral("download");
    return out;
}

QString uniqueFilePath(const QString& path)
{
    const QString normalized = normalizeFilePath(path);
    if (normalized.isEmpty()) return normalized;
    QFileInfo info(normalized);
    const QString dirPath = info.absolutePath();
    const QString base = info.completeBaseName();
    const QString suffix = info.suffix();
    const auto existsCandidate = [](const QString& candidate) {
        return QFile::exists(candidate) || QFile::exists(candidate + ".aria2");
    };
    if (!existsCandidate(normalized)) return normalized;

    QDir dir(dirPath);
    for (int i = 1; i < 10000; ++i) {
        const QString name = suffix.isEmpty()
            ? QString("%1 (%2)").arg(base).arg(i)
            : QString("%1 (%2).%3").arg(base).arg(i).arg(suffix);
        const QString candidate = dir.filePath(name);
        if (!existsCandidate(candidate)) return candidate;
    }
    return normalized;
}

QString uniqueFileName(const QString& directory, const QString& fileName)
{
    return QFileInfo(uniqueFilePath(QDir(directory).filePath(fileName))).fileName();
}

bool fileExistsPath(const QString& path)
{
    const QString normalized = normalizeFilePath(path);
    if (normalized.isEmpty()) return false;
    QFileInfo info(normalized);
    return info.exists() && info.isFile();
}

std::optional<qint64> freeDiskSpace(const QString& path)
{
    QDir dir(normalizeFilePath(path));
    while (!dir.exists() && !dir.isRoot()) {
        if (!dir.cdUp()) break;
    }
    QStorageInfo storage(dir.absolutePath());
    if (!storage.isValid() || !storage.isReady()) return std::nullopt;
    return storage.bytesAvailable();
}

QString downloadSubPath(const QString& root, const QString& subDir)
{
    const QString path = QDir(root).filePath(subDir);
    if (!QDir().mkpath(path)) {
        qWarning() << "Failed to create download directory" << path;
    }
    return QDir::cleanPath(path);
}

} // namespace baran::utils
