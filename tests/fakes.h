#ifndef BARAN_TESTS_FAKES_H
#define BARAN_TESTS_FAKES_H

#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <QObject>
#include <QPointer>
#include <QString>
#include <QStringList>
#include <QTimer>
#include <QUrl>
#include <QVector>

#include <functional>
#include <optional>

#ifndef Q_MOC_RUN
import baran.services.rpc_socket;
import baran.services.aria2_daemon;
#endif

/**
 * @brief In-memory aria2 endpoint.
 *
 * Every request is recorded. A message from failure is sent back as a JSON-RPC
 * error. Otherwise the handler decides the reply: a value is sent back as the
 * result, std::nullopt leaves the request unanswered until respond().
 */
class FakeRpcSocket : public RpcSocket {

    Q_OBJECT

public:
    struct Request {
        QString id;
        QString method;
        QJsonArray params;  //!< Without the secret token.
    };

    using Handler = std::function<std::optional<QJsonValue>(const QString& method, const QJsonArray& params)>;
    using Failure = std::function<std::optional<QString>(const QString& method, const QJsonArray& params)>;

    explicit FakeRpcSocket(QObject* parent = nullptr) : RpcSocket(parent) {}

    void open(const QUrl&) override
    {
        ++openCount;
        QPointer<FakeRpcSocket> self(this);
        QTimer::singleShot(0, this, [self]() {
            if (!self) return;
            self->m_open = true;
            emit self->opened();
        });
    }

    void close() override { drop(); }
    void abort() override { drop(); }
    bool isOpen() const override { return m_open; }
    void ping() override {}

    bool sendText(const QString& message) override
    {
        if (!m_open) return false;
        const QJsonObject obj = QJsonDocument::fromJson(message.toUtf8()).object();
        Request request;
        request.id = obj.value(QStringLiteral("id")).toString();
        request.method = obj.value(QStringLiteral("method")).toString();
        const QJsonArray params = obj.value(QStringLiteral("params")).toArray();
        for (qsizetype i = 1; i < params.size(); ++i) request.params.append(params.at(i));
        requests.append(request);

        if (failure) {
            if (const std::optional<QString> message = failure(request.method, request.params)) {
                QJsonObject error;
                error.insert(QStringLiteral("code"), 1);
                error.insert(QStringLiteral("message"), *message);
                QJsonObject reply;
                reply.insert(QStringLiteral("jsonrpc"), QStringLiteral("2.0"));
                reply.insert(QStringLiteral("id"), request.id);
                reply.insert(QStringLiteral("error"), error);
                deliver(reply);
                return true;
            }
        }

        std::optional<QJsonValue> result = handler ? handler(request.method, request.params) : defaultReply(request.method);
        if (result) respond(request.id, *result);
        return true;
    }

    //!< @brief Answer a request by id, typically one the handler left open.
    void respond(const QString& id, const QJsonValue& result)
    {
        QJsonObject reply;
        reply.insert(QStringLiteral("jsonrpc"), QStringLiteral("2.0"));
        reply.insert(QStringLiteral("id"), id);
        reply.insert(QStringLiteral("result"), result);
        deliver(reply);
    }

    //!< @brief Id of the latest recorded request for a method.
    QString lastId(const QString& method) const
    {
        for (auto it = requests.crbegin(); it != requests.crend(); ++it) {
            if (it->method == method) return it->id;
        }
        return QString();
    }

    //!< @brief Push a daemon notification for a gid.
    void notify(const QString& method, const QString& gid)
    {
        QJsonObject params;
        params.insert(QStringLiteral("gid"), gid);
        QJsonObject message;
        message.insert(QStringLiteral("jsonrpc"), QStringLiteral("2.0"));
        message.insert(QStringLiteral("method"), method);
        message.insert(QStringLiteral("params"), QJsonArray{params});
        deliver(message);
    }

    //!< @brief Number of recorded requests for a method.
    int count(const QString& method) const
    {
        int n = 0;
        for (const Request& r : requests) {
            if (r.method == method) ++n;
        }
        return n;
    }

    //!< @brief Replies used when no handler is installed.
    static std::optional<QJsonValue> defaultReply(const QString& method)
    {
        if (method == QStringLiteral("aria2.addUri")) return QJsonValue(QStringLiteral("gid-1"));
        if (method.startsWith(QStringLiteral("aria2.tell")) && method != QStringLiteral("aria2.tellStatus"))
            return QJsonValue(QJsonArray());
        if (method == QStringLiteral("aria2.tellStatus")) return QJsonValue(QJsonObject());
        if (method == QStringLiteral("aria2.getVersion")) {
            QJsonObject version;
            version.insert(QStringLiteral("version"), QStringLiteral("1.37.0"));
            return QJsonValue(version);
        }
        return QJsonValue(QStringLiteral("OK"));
    }

    Handler handler;
    Failure failure;
    QVector<Request> requests;
    int openCount = 0;

private:
    void deliver(const QJsonObject& message)
    {
        const QString text = QString::fromUtf8(QJsonDocument(message).toJson(QJsonDocument::Compact));
        QPointer<FakeRpcSocket> self(this);
        QTimer::singleShot(0, this, [self, text]() {
            if (self && self->m_open) emit self->textReceived(text);
        });
    }

    void drop()
    {
        if (!m_open) return;
        m_open = false;
        emit closed();
    }

    bool m_open = false;
};

//!< @brief Daemon supervisor that is always running and counts restarts.
class FakeDaemon : public DaemonControl {

    Q_OBJECT

public:
    explicit FakeDaemon(QObject* parent = nullptr) : DaemonControl(parent) {}

    void ensureRunning(Callback done) override
    {
        ++ensureCount;
        if (done) done(true, QString());
    }

    void restart(Callback done) override
    {
        ++restartCount;
        if (done) done(true, QString());
    }

    void stop() override { m_running = false; }
    bool isRunning() const override { return m_running; }
    QString lastError() const override { return QString(); }

    int ensureCount = 0;
    int restartCount = 0;

private:
    bool m_running = true;
};

/**
 * @brief Write a shell stand-in for yt-dlp into dir and return its path.
 *
 * Metadata mode prints a playlist for URLs with "list=", fails for URLs with
 * "fail" and prints a single video otherwise. Download mode fails for "fail",
 * keeps printing progress for "slow" and otherwise writes the -o target.
 * "merge" and "late" write the target and then exit non-zero, after a merge
 * line and after a 100% line respectively.
 */
inline QString writeFakeExtractor(const QString& dir)
{
    static const char* const script = R"SH(#!/bin/sh
META=0
OUT=""
PREV=""
LAST=""
for arg in "$@"; do
    [ "$PREV" = "-o" ] && OUT="$arg"
    [ "$arg" = "--dump-single-json" ] && META=1
    PREV="$arg"
    LAST="$arg"
done

if [ "$META" = "1" ]; then
    case "$1" in
        *fail*) echo "ERROR: [youtube] fail: Private video" >&2; exit 1 ;;
        *list=*) echo '{"_type":"playlist","id":"PL1","title":"Road trip","entries":[{"id":"v1","title":"First","url":"https://www.youtube.com/watch?v=v1"},{"id":"v2","title":"Second","url":"https://www.youtube.com/watch?v=v2"}]}' ;;
        *) echo '{"id":"v1","title":"First","duration":10,"webpage_url":"https://www.youtube.com/watch?v=v1","formats":[]}' ;;
    esac
    exit 0
fi

case "$LAST" in
    *fail*)
        echo "ERROR: [generic] fail: Video unavailable" >&2
        exit 1 ;;
    *merge*)
        echo "[download] Destination: $OUT"
        echo "[download]  50.0% of 10.00KiB at 1.00MiB/s ETA 00:01"
        sleep 0.2
        echo "[Merger] Merging formats into \"$OUT\""
        printf 'payload' > "$OUT"
        sleep 0.2
        echo "ERROR: Postprocessing: Conversion failed!" >&2
        exit 1 ;;
    *late*)
        echo "[download] Destination: $OUT"
        printf 'payload' > "$OUT"
        echo "[download] 100.0% of 10.00KiB at 1.00MiB/s ETA 00:00"
        exit 1 ;;
    *slow*)
        echo "[download] Destination: $OUT"
        i=0
        while [ $i -lt 300 ]; do
            echo "[download]   1.0% of 10.00MiB at 1.00MiB/s ETA 00:10"
            sleep 0.1
            i=$((i + 1))
        done
        exit 0 ;;
esac

echo "[download] Destination: $OUT"
printf 'payload' > "$OUT"
echo "[download] 100.0% of 10.00KiB at 1.00MiB/s ETA 00:00"
exit 0
)SH";

    const QString path = QDir(dir).filePath(QStringLiteral("yt-dlp"));
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) return QString();
    file.write(script);
    file.close();
    file.setPermissions(QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ExeOwner);
    return path;
}

#endif // BARAN_TESTS_FAKES_H
