#include <QDir>
#include <QJsonArray>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QTest>

#include <gtest/gtest.h>

#include <memory>
#include <optional>

#include "fakes.h"

import baran.services.engine_settings;
import baran.services.aria2_client;

class Aria2RpcClientTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ASSERT_TRUE(dir.isValid());
        settings = std::make_unique<EngineSettings>(QDir(dir.path()).filePath(QStringLiteral("engine.ini")));
        client = std::make_unique<Aria2RpcClient>(&socket, &daemon, settings.get());
    }

    void TearDown() override
    {
        client->shutdown();
    }

    bool connectClient()
    {
        std::optional<bool> result;
        client->ensureConnected([&result](bool ok, const QString&) { result = ok; });
        return QTest::qWaitFor([&result]() { return result.has_value(); }, 1000) && *result;
    }

    QTemporaryDir dir;
    FakeRpcSocket socket;
    FakeDaemon daemon;
    std::unique_ptr<EngineSettings> settings;
    std::unique_ptr<Aria2RpcClient> client;
};

TEST_F(Aria2RpcClientTest, ConnectStartsDaemonOnce)
{
    ASSERT_TRUE(connectClient());
    EXPECT_TRUE(client->isConnected());
    EXPECT_EQ(daemon.ensureCount, 1);
    EXPECT_EQ(socket.openCount, 1);

    ASSERT_TRUE(connectClient());
    EXPECT_EQ(socket.openCount, 1);
}

TEST_F(Aria2RpcClientTest, RequestsCarryTokenAndUniqueIds)
{
    ASSERT_TRUE(connectClient());

    std::optional<RpcReply> reply;
    client->call(QStringLiteral("aria2.getVersion"), {}, [&reply](const RpcReply& r) { reply = r; });
    ASSERT_TRUE(QTest::qWaitFor([&reply]() { return reply.has_value(); }, 1000));
    EXPECT_TRUE(reply->ok);
    EXPECT_EQ(reply->result.toObject().value(QStringLiteral("version")).toString(), QStringLiteral("1.37.0"));

    client->call(QStringLiteral("aria2.pause"), {QStringLiteral("gid-1")}, {});
    ASSERT_EQ(socket.requests.size(), 2);
    EXPECT_EQ(socket.requests.at(0).id, QStringLiteral("baran-1"));
    EXPECT_EQ(socket.requests.at(1).id, QStringLiteral("baran-2"));
    EXPECT_EQ(socket.requests.at(1).params, QJsonArray{QStringLiteral("gid-1")});
}

TEST_F(Aria2RpcClientTest, CallBeforeConnectConnectsFirst)
{
    std::optional<RpcReply> reply;
    client->call(QStringLiteral("aria2.tellActive"), {}, [&reply](const RpcReply& r) { reply = r; });
    ASSERT_TRUE(QTest::qWaitFor([&reply]() { return reply.has_value(); }, 1000));
    EXPECT_TRUE(reply->ok);
    EXPECT_TRUE(reply->result.isArray());
    EXPECT_EQ(daemon.ensureCount, 1);
}

TEST_F(Aria2RpcClientTest, NotificationsAreForwarded)
{
    ASSERT_TRUE(connectClient());
    QSignalSpy spy(client.get(), &Aria2RpcClient::notificationReceived);

    socket.notify(QStringLiteral("aria2.onDownloadComplete"), QStringLiteral("gid-7"));
    ASSERT_TRUE(spy.wait(1000));
    EXPECT_EQ(spy.at(0).at(0).toString(), QStringLiteral("aria2.onDownloadComplete"));
    EXPECT_EQ(spy.at(0).at(1).toString(), QStringLiteral("gid-7"));
}

TEST_F(Aria2RpcClientTest, PendingRequestsFailOnClose)
{
    ASSERT_TRUE(connectClient());
    socket.handler = [](const QString&, const QJsonArray&) -> std::optional<QJsonValue> { return std::nullopt; };

    std::optional<RpcReply> reply;
    client->call(QStringLiteral("aria2.remove"), {QStringLiteral("gid-1")}, [&reply](const RpcReply& r) { reply = r; });
    socket.close();

    ASSERT_TRUE(reply.has_value());
    EXPECT_FALSE(reply->ok);
    EXPECT_FALSE(reply->timedOut);
    EXPECT_EQ(reply->error, QStringLiteral("WebSocket connection closed"));
    EXPECT_EQ(client->pendingCount(), 0);
}

TEST_F(Aria2RpcClientTest, RepeatedTimeoutsTriggerOneRecovery)
{
    ASSERT_TRUE(connectClient());
    socket.handler = [](const QString&, const QJsonArray&) -> std::optional<QJsonValue> { return std::nullopt; };
    QSignalSpy recovery(client.get(), &Aria2RpcClient::recoveryStarted);

    QVector<RpcReply> replies;
    for (int i = 0; i < 3; ++i)
        client->call(QStringLiteral("aria2.tellStatus"), {QStringLiteral("gid-1")},
                     [&replies](const RpcReply& r) { replies.append(r); }, 50);

    ASSERT_TRUE(QTest::qWaitFor([&replies]() { return replies.size() == 3; }, 2000));
    EXPECT_EQ(daemon.restartCount, 1);
    EXPECT_EQ(client->recoveryCount(), 1);
    EXPECT_EQ(recovery.count(), 1);

    int timedOut = 0;
    for (const RpcReply& r : replies) {
        EXPECT_FALSE(r.ok);
        if (r.timedOut) ++timedOut;
    }
    EXPECT_EQ(timedOut, 2);
}

TEST_F(Aria2RpcClientTest, ShutdownRejectsFurtherConnects)
{
    ASSERT_TRUE(connectClient());
    client->shutdown();
    EXPECT_FALSE(socket.isOpen());

    std::optional<QString> error;
    client->ensureConnected([&error](bool, const QString& e) { error = e; });
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(*error, QStringLiteral("RPC client is shut down"));
}
