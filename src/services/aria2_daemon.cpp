module;
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QHostAddress>
#include <QPointer>
#include <QProcess>
#include <QStandardPaths>
#include <QString>
#include <QStringList>
#include <QTcpSocket>
#include <QTimer>

#include <functional>
#include <memory>
#include <utility>

module baran.services.aria2_daemon;

import baran.services.engine_settings;

static constexpr int kPortPollMs = 200;
static constexpr int kPortPollAttempts = 25;     // 5 s
static constexpr int kKillGraceMs = 2000;
static constexpr int kRestartCooldownMs = 2500;
static constexpr int kPortBusyRetries = 3;
static constexpr int kPortBusyDelayMs = 2000;

Aria2Daemon::Aria2Daemon(EngineSettings* settings, QObject* parent)
    : DaemonControl(parent),
    m_settings(settings),
    m_restartCooldownMs(kRestartCooldownMs),
    m_portBusyDelayMs(kPortBusyDelayMs)
{
}

Aria2Daemon::~Aria2Daemon()
{
    if (m_process && m_process->state() != QProcess::NotRunning) {
        m_process->kill();
        m_process->waitForFinished(1000);
    }
}

QString Aria2Daemon::sessionPath()
{
    QString base = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (base.isEmpty()) base = QDir::tempPath();
    QDir().mkpath(base);
    return QDir(base).filePath(QStringLiteral("aria2.session"));
}

QStringList Aria2Daemon::daemonArguments(int port, const QString& secret, int maxConcurrent, const QString& session)
{
    return {
        QStringLiteral("--enable-rpc"),
        QStringLiteral("--rpc-listen-port=%1").arg(port),
        QStringLiteral("--rpc-secret=%1").arg(secret),
        QStringLiteral("--rpc-listen-all=false"),
        QStringLiteral("--rpc-allow-origin-all=false"),
        QStringLiteral("--rpc-max-request-size=10M"),
        QStringLiteral("--rpc-save-upload-metadata=true"),
        QStringLiteral("--input-file=%1").arg(session),
        QStringLiteral("--save-session=%1").arg(session),
        QStringLiteral("--save-session-interval=10"),
        QStringLiteral("--max-concurrent-downloads=%1").arg(qMax(1, maxConcurrent)),
        QStringLiteral("--max-connection-per-server=8"),
        QStringLiteral("--split=16"),
        QStringLiteral("--min-split-size=4M"),
        QStringLiteral("--continue=true"),
        QStringLiteral("--auto-file-renaming=true"),
        QStringLiteral("--allow-overwrite=true"),
        QStringLiteral("--file-allocation=falloc"),
        QStringLiteral("--connect-timeout=60"),
        QStringLiteral("--timeout=60"),
        QStringLiteral("--max-tries=0"),
        QStringLiteral("--retry-wait=5"),
        QStringLiteral("--max-resume-failure-tries=0"),
        QStringLiteral("--disk-cache=128M"),
        QStringLiteral("--check-certificate=false"),
        QStringLiteral("--enable-color=false"),
        QStringLiteral("--console-log-level=warn"),
        QStringLiteral("--summary-interval=0"),
        QStringLiteral("--async-dns=true"),
        QStringLiteral("--disable-ipv6=true"),
    };
}

bool Aria2Daemon::isRunning() const
{
    if (m_adopted) return true;
    return m_process && m_process->state() == QProcess::Running;
}

void Aria2Daemon::ensureRunning(Callback done)
{
    if (done) m_waiters.append(std::move(done));
    if (m_starting) return;

    if (isRunning()) {
        settleWaiters(true, QString());
        return;
    }

    m_starting = true;
    QPointer<Aria2Daemon> self(this);
    probePort([self](bool listening) {
        if (!self) return;
        if (listening) {
            qInfo() << "Adopting aria2 daemon already listening on port" << self->m_settings->rpcPort();
            self->m_adopted = true;
            self->settleWaiters(true, QString());
            return;
        }
        self->start();
    });
}

void Aria2Daemon::restart(Callback done)
{
    qInfo() << "Restarting aria2 daemon";
    const bool adopted = m_adopted;
    stop();
    // An adopted daemon has no process handle.
    if (adopted) killByName();

    QPointer<Aria2Daemon> self(this);
    QTimer::singleShot(m_restartCooldownMs, this, [self, done = std::move(done)]() mutable {
        if (!self) return;
        self->waitForPortRelease(kPortBusyRetries, [self, done = std::move(done)](bool released, const QString&) mutable {
            if (!self) return;
            if (released) {
                self->ensureRunning(std::move(done));
                return;
            }
            self->killByName();
            QTimer::singleShot(self->m_portBusyDelayMs, self, [self, done = std::move(done)]() mutable {
                if (!self) return;
                self->probePort([self, done = std::move(done)](bool busy) mutable {
                    if (!self) return;
                    if (!busy) {
                        self->ensureRunning(std::move(done));
                        return;
                    }
                    if (done) self->m_waiters.append(std::move(done));
                    self->fail(QStringLiteral("RPC port %1 is held by an unresponsive process")
                                   .arg(self->m_settings->rpcPort()));
                });
            });
        });
    });
}

void Aria2Daemon::setRestartDelays(int cooldownMs, int portBusyDelayMs)
{
    m_restartCooldownMs = qMax(0, cooldownMs);
    m_portBusyDelayMs = qMax(0, portBusyDelayMs);
}

void Aria2Daemon::killByName()
{
    const QString binary = EngineSettings::resolveExecutable(m_settings->aria2Path(), QStringLiteral("aria2c"));
#if defined(Q_OS_WIN)
    const QString name = binary.isEmpty() ? QStringLiteral("aria2c.exe") : QFileInfo(binary).fileName();
    const int code = QProcess::execute(QStringLiteral("taskkill"),
                                       {QStringLiteral("/F"), QStringLiteral("/IM"), name, QStringLiteral("/T")});
#else
    const QString name = binary.isEmpty() ? QStringLiteral("aria2c") : QFileInfo(binary).fileName();
    const int code = QProcess::execute(QStringLiteral("pkill"), {QStringLiteral("-x"), name});
#endif
    if (code < 0) {
        qWarning() << "Could not run the process killer for" << name;
        return;
    }
    qInfo() << "Killed stray" << name << "processes, exit code" << code;
}

void Aria2Daemon::stop()
{
    m_adopted = false;
    if (!m_process) return;

    QPointer<QProcess> proc = m_process;
    m_process = nullptr;
    if (proc->state() == QProcess::NotRunning) {
        proc->deleteLater();
        return;
    }

    qInfo() << "Stopping aria2 daemon";
    proc->terminate();
    QTimer::singleShot(kKillGraceMs, this, [proc]() {
        if (!proc) return;
        if (proc->state() != QProcess::NotRunning) {
            qWarning() << "aria2 daemon did not exit, killing";
            proc->kill();
        }
    });
}

void Aria2Daemon::start()
{
    const QString binary = EngineSettings::resolveExecutable(m_settings->aria2Path(), QStringLiteral("aria2c"));
    if (binary.isEmpty()) {
        fail(QStringLiteral("aria2 binary not found"));
        return;
    }

    const QString session = sessionPath();
    if (!QFile::exists(session)) {
        QFile file(session);
        if (!file.open(QIODevice::WriteOnly)) qWarning() << "Cannot create aria2 session file:" << session;
    }

    auto* proc = new QProcess(this);
    proc->setProgram(binary);
    proc->setArguments(daemonArguments(m_settings->rpcPort(), m_settings->rpcSecret(),
                                       m_settings->maxConcurrentDownloads(), session));
    proc->setProcessChannelMode(QProcess::SeparateChannels);

    connect(proc, &QProcess::readyReadStandardError, proc, [proc]() {
        const QString message = QString::fromUtf8(proc->readAllStandardError()).trimmed();
        if (!message.isEmpty()) qWarning().noquote() << "aria2:" << message;
    });
    connect(proc, &QProcess::readyReadStandardOutput, proc, [proc]() { proc->readAllStandardOutput(); });
    connect(proc, &QProcess::finished, this, [this, proc](int code, QProcess::ExitStatus status) {
        qInfo() << "aria2 exited with code" << code << (status == QProcess::CrashExit ? "(crash)" : "");
        if (m_process == proc) m_process = nullptr;
        proc->deleteLater();
    });

    m_process = proc;
    proc->start();
    if (!proc->waitForStarted(3000)) {
        const QString error = proc->errorString();
        m_process = nullptr;
        proc->deleteLater();
        fail(QStringLiteral("Failed to start aria2: %1").arg(error));
        return;
    }

    QPointer<Aria2Daemon> self(this);
    waitForPort(kPortPollAttempts, [self](bool ok, const QString& error) {
        if (!self) return;
        if (!ok) {
            self->fail(error);
            return;
        }
        qInfo() << "aria2 daemon started on port" << self->m_settings->rpcPort();
        self->settleWaiters(true, QString());
    });
}

void Aria2Daemon::probePort(PortCallback done)
{
    auto* socket = new QTcpSocket(this);
    auto settled = std::make_shared<bool>(false);
    auto finish = [socket, settled, done](bool listening) {
        if (*settled) return;
        *settled = true;
        socket->abort();
        socket->deleteLater();
        done(listening);
    };
    connect(socket, &QTcpSocket::connected, socket, [finish]() { finish(true); });
    connect(socket, &QTcpSocket::errorOccurred, socket, [finish](QAbstractSocket::SocketError) { finish(false); });
    QTimer::singleShot(kPortPollMs * 5, socket, [finish]() { finish(false); });
    socket->connectToHost(QHostAddress::LocalHost, quint16(m_settings->rpcPort()));
}

void Aria2Daemon::waitForPort(int attemptsLeft, Callback done)
{
    QPointer<Aria2Daemon> self(this);
    probePort([self, attemptsLeft, done = std::move(done)](bool listening) mutable {
        if (!self) return;
        if (listening) {
            done(true, QString());
            return;
        }
        if (!self->m_process || self->m_process->state() == QProcess::NotRunning) {
            done(false, QStringLiteral("aria2 process terminated unexpectedly"));
            return;
        }
        if (attemptsLeft <= 1) {
            done(false, QStringLiteral("Timeout waiting for aria2 RPC on port %1").arg(self->m_settings->rpcPort()));
            return;
        }
        QTimer::singleShot(kPortPollMs, self, [self, attemptsLeft, done = std::move(done)]() mutable {
            if (self) self->waitForPort(attemptsLeft - 1, std::move(done));
        });
    });
}

void Aria2Daemon::waitForPortRelease(int retriesLeft, Callback done)
{
    QPointer<Aria2Daemon> self(this);
    probePort([self, retriesLeft, done = std::move(done)](bool busy) mutable {
        if (!self) return;
        if (!busy || retriesLeft <= 0) {
            done(!busy, QString());
            return;
        }
        qWarning() << "RPC port" << self->m_settings->rpcPort() << "still busy, waiting";
        QTimer::singleShot(self->m_portBusyDelayMs, self, [self, retriesLeft, done = std::move(done)]() mutable {
            if (self) self->waitForPortRelease(retriesLeft - 1, std::move(done));
        });
    });
}

void Aria2Daemon::settleWaiters(bool ok, const QString& error)
{
    m_starting = false;
    const QVector<Callback> waiters = std::exchange(m_waiters, {});
    for (const Callback& cb : waiters) cb(ok, error);
}

void Aria2Daemon::fail(const QString& message)
{
    m_lastError = message;
    qCritical().noquote() << message;
    emit daemonError(message);
    settleWaiters(false, message);
}
