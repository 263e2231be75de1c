module;
#include <QDateTime>
#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QString>
#include <QStringList>
#include <QTimer>

#include <functional>
#include <utility>

module baran.core.filereaper;

static constexpr int kDeferredIntervalMs = 30000;

FileReaper::FileReaper(QObject* parent)
    : QObject(parent)
{
    m_deferredTimer.setInterval(kDeferredIntervalMs);
    connect(&m_deferredTimer, &QTimer::timeout, this, &FileReaper::flushDeferred);
}

void FileReaper::removeWithRetry(const QString& path, int retries, int delayMs, Callback done)
{
    if (path.isEmpty()) {
        if (done) done(true);
        return;
    }

    QString target = path;
#ifdef Q_OS_WIN
    if (QFileInfo::exists(path)) {
        const QString renamed = renameForDeletion(path);
        if (!renamed.isEmpty()) target = renamed;
    }
#endif
    attempt(target, qMax(1, retries), qMax(0, delayMs), std::move(done));
}

void FileReaper::removeWithVariants(const QString& path, const QStringList& suffixes, int retries, int delayMs)
{
    if (path.isEmpty()) return;
    removeWithRetry(path, retries, delayMs);
    for (const QString& suffix : suffixes) {
        const QString variant = path + suffix;
        if (QFileInfo::exists(variant)) removeWithRetry(variant, retries, delayMs);
    }
}

QString FileReaper::renameForDeletion(const QString& path)
{
    const QString renamed = QStringLiteral("%1.deleting.%2").arg(path).arg(QDateTime::currentMSecsSinceEpoch());
    if (QFile::rename(path, renamed)) return renamed;
    return QString();
}

void FileReaper::flushDeferred()
{
    const QStringList files = std::exchange(m_deferred, {});
    for (const QString& file : files) {
        if (!QFileInfo::exists(file)) continue;
        if (QFile::remove(file)) {
            qInfo() << "Deferred deletion succeeded:" << file;
            continue;
        }
        m_deferred.append(file);
    }
    if (m_deferred.isEmpty()) m_deferredTimer.stop();
}

void FileReaper::attempt(const QString& path, int attemptsLeft, int delayMs, Callback done)
{
    if (!QFileInfo::exists(path) || QFile::remove(path)) {
        if (done) done(true);
        return;
    }

    if (attemptsLeft <= 1) {
        qWarning() << "Failed to delete file, deferring:" << path;
        defer(path);
        emit removalFailed(path);
        if (done) done(false);
        return;
    }

    qDebug() << "File is locked, retrying deletion:" << path << "attempts left:" << attemptsLeft - 1;
    QTimer::singleShot(delayMs, this, [this, path, attemptsLeft, delayMs, done = std::move(done)]() mutable {
        attempt(path, attemptsLeft - 1, delayMs, std::move(done));
    });
}

void FileReaper::defer(const QString& path)
{
    if (!m_deferred.contains(path)) m_deferred.append(path);
    if (!m_deferredTimer.isActive()) m_deferredTimer.start();
}
