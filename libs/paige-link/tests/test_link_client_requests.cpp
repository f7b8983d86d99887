#include <QtTest/QtTest>
#include <QSignalSpy>
#include "ReplayHarness.hpp"

using plink::ConnectionStatus;

class TestLinkClientRequests : public QObject {
    Q_OBJECT
private slots:
    void testCorrelatedRequestResolvesOnResponse()
    {
        ReplayHarness harness;
        plink::LinkClient client(plink::ClientConfig(), harness.factory());
        client.connect();
        harness.last()->simulateOpen();

        QJsonObject request;
        request["path"] = "/a.ts";
        QFuture<plink::SendResult> future = client.send("file:open", request);

        QJsonObject sent = lastSentObject(harness.last());
        QCOMPARE(sent["type"].toString(), QString("file:open"));
        QCOMPARE(sent["payload"].toObject()["path"].toString(), QString("/a.ts"));
        QString id = sent["id"].toString();
        QVERIFY(!id.isEmpty());
        QVERIFY(sent["timestamp"].isDouble());
        QCOMPARE(client.pendingRequestCount(), 1);
        QVERIFY(!future.isFinished());

        QJsonObject content;
        content["text"] = "export {}";
        harness.last()->feedText(responseFor(id, "buffer:content", content));

        QVERIFY(future.isFinished());
        plink::SendResult result = future.result();
        QVERIFY(result.has_value());
        QCOMPARE(result->type, QString("buffer:content"));
        QCOMPARE(result->id, id);
        QCOMPARE(result->payload.toObject()["text"].toString(), QString("export {}"));
        QCOMPARE(client.pendingRequestCount(), 0);
    }

    void testCorrelationIdsAreUnique()
    {
        ReplayHarness harness;
        plink::LinkClient client(plink::ClientConfig(), harness.factory());
        client.connect();
        harness.last()->simulateOpen();

        client.send("file:open", QJsonObject());
        client.send("file:open", QJsonObject());
        client.send("file:save", QJsonObject());

        QSet<QString> ids;
        for (int i = 1; i <= 3; ++i)
            ids.insert(sentObject(harness.last(), i)["id"].toString());
        QCOMPARE(ids.size(), 3);
        QCOMPARE(client.pendingRequestCount(), 3);
    }

    void testResponsesResolveOutOfOrder()
    {
        ReplayHarness harness;
        plink::LinkClient client(plink::ClientConfig(), harness.factory());
        client.connect();
        harness.last()->simulateOpen();

        auto first = client.send("file:open", QJsonObject());
        QString firstId = lastSentObject(harness.last())["id"].toString();
        auto second = client.send("user:explain", QJsonObject());
        QString secondId = lastSentObject(harness.last())["id"].toString();

        harness.last()->feedText(responseFor(secondId, "coaching:message"));
        QVERIFY(second.isFinished());
        QVERIFY(!first.isFinished());
        QCOMPARE(second.result()->type, QString("coaching:message"));

        harness.last()->feedText(responseFor(firstId, "buffer:content"));
        QVERIFY(first.isFinished());
        QCOMPARE(first.result()->type, QString("buffer:content"));
    }

    void testFireAndForgetResolvesImmediately()
    {
        ReplayHarness harness;
        plink::LinkClient client(plink::ClientConfig(), harness.factory());
        client.connect();
        harness.last()->simulateOpen();

        for (const QString& type : plink::defaultFireAndForgetTypes()) {
            QFuture<plink::SendResult> future = client.send(type, QJsonObject());
            QVERIFY2(future.isFinished(), qPrintable(type));
            QVERIFY2(!future.result().has_value(), qPrintable(type));

            QJsonObject sent = lastSentObject(harness.last());
            QCOMPARE(sent["type"].toString(), type);
            QVERIFY(!sent.contains("id"));
        }
        QCOMPARE(client.pendingRequestCount(), 0);
    }

    void testFireAndForgetSetIsConfigurable()
    {
        ReplayHarness harness;
        plink::ClientConfig config;
        config.fireAndForgetTypes = {"telemetry:ping"};
        plink::LinkClient client(config, harness.factory());
        client.connect();
        harness.last()->simulateOpen();

        QVERIFY(client.send("telemetry:ping").isFinished());
        QVERIFY(!client.send("buffer:update", QJsonObject()).isFinished());
        QCOMPARE(client.pendingRequestCount(), 1);
    }

    void testRequestTimesOut()
    {
        ReplayHarness harness;
        plink::LinkClient client(fastConfig(), harness.factory());
        client.connect();
        harness.last()->simulateOpen();

        QJsonObject request;
        request["path"] = "/a.ts";
        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("Request timed out"));
        QFuture<plink::SendResult> future = client.send("file:open", request);
        QCOMPARE(client.pendingRequestCount(), 1);

        QTRY_VERIFY(future.isFinished());
        QCOMPARE(failureOf(future), QString("Request timed out after 50ms: file:open"));
        QCOMPARE(client.pendingRequestCount(), 0);

        try {
            future.waitForFinished();
            QFAIL("expected TimeoutError");
        } catch (const plink::TimeoutError& e) {
            QCOMPARE(e.messageType(), QString("file:open"));
            QCOMPARE(e.timeoutMs(), 50);
        }
    }

    // The expiry path runs in testRequestTimesOut with a 50 ms table; the
    // 30000 ms default is only checked through the config and the error text.
    void testDefaultTimeoutIsThirtySeconds()
    {
        QCOMPARE(plink::ClientConfig().correlationTimeout, 30000);
        QCOMPARE(plink::TimeoutError("file:open", 30000).message(),
                 QString("Request timed out after 30000ms: file:open"));
    }

    void testResponseBeforeTimeoutWins()
    {
        ReplayHarness harness;
        plink::LinkClient client(fastConfig(), harness.factory());
        client.connect();
        harness.last()->simulateOpen();

        QFuture<plink::SendResult> future = client.send("file:open", QJsonObject());
        QString id = lastSentObject(harness.last())["id"].toString();
        harness.last()->feedText(responseFor(id, "buffer:content"));

        QTest::qWait(150);
        QVERIFY(future.isFinished());
        QCOMPARE(failureOf(future), QString());
        QCOMPARE(future.result()->type, QString("buffer:content"));
    }

    void testQueuedWhileDisconnected()
    {
        ReplayHarness harness;
        plink::LinkClient client(plink::ClientConfig(), harness.factory());

        QFuture<plink::SendResult> future = client.send("file:open", QJsonObject());

        QVERIFY(!future.isFinished());
        QCOMPARE(client.queuedOperationCount(), 1);
        QCOMPARE(harness.created(), 0);
    }

    void testQueueFlushedAfterHandshakeInOrder()
    {
        ReplayHarness harness;
        plink::LinkClient client(plink::ClientConfig(), harness.factory());

        QJsonObject first;
        first["seq"] = 1;
        QJsonObject second;
        second["seq"] = 2;
        auto a = client.send("buffer:update", first);
        auto b = client.send("buffer:update", second);
        QVERIFY(!a.isFinished());
        QVERIFY(!b.isFinished());

        client.connect();
        QCOMPARE(client.queuedOperationCount(), 2);
        harness.last()->simulateOpen();

        QCOMPARE(sentTypes(harness.last()),
                 QStringList({"connection:hello", "buffer:update", "buffer:update"}));
        QCOMPARE(sentObject(harness.last(), 1)["payload"].toObject()["seq"].toInt(), 1);
        QCOMPARE(sentObject(harness.last(), 2)["payload"].toObject()["seq"].toInt(), 2);

        QVERIFY(a.isFinished());
        QVERIFY(b.isFinished());
        QVERIFY(!a.result().has_value());
        QVERIFY(!b.result().has_value());
        QCOMPARE(client.queuedOperationCount(), 0);
    }

    void testQueuedSentBeforeNewSends()
    {
        ReplayHarness harness;
        plink::LinkClient client(plink::ClientConfig(), harness.factory());
        client.onStatusChange([&](ConnectionStatus status, int) {
            if (status == ConnectionStatus::Connected)
                client.send("user:explain", QJsonObject());
        });

        client.send("file:open", QJsonObject());
        client.connect();
        harness.last()->simulateOpen();

        // The listener runs before the flush; its send is queued behind.
        QCOMPARE(sentTypes(harness.last()),
                 QStringList({"connection:hello", "file:open", "user:explain"}));

        client.send("file:save", QJsonObject());
        QCOMPARE(sentTypes(harness.last()).last(), QString("file:save"));
    }

    void testQueuedCorrelatedResolvesAfterFlush()
    {
        ReplayHarness harness;
        plink::LinkClient client(plink::ClientConfig(), harness.factory());

        QFuture<plink::SendResult> future = client.send("file:open", QJsonObject());
        client.connect();
        harness.last()->simulateOpen();

        QVERIFY(!future.isFinished());
        QCOMPARE(client.pendingRequestCount(), 1);
        QString id = lastSentObject(harness.last())["id"].toString();
        QVERIFY(!id.isEmpty());

        harness.last()->feedText(responseFor(id, "buffer:content"));
        QVERIFY(future.isFinished());
        QCOMPARE(future.result()->type, QString("buffer:content"));
    }

    void testSendDuringReconnectIsQueued()
    {
        ReplayHarness harness;
        plink::LinkClient client(plink::ClientConfig(), harness.factory());
        client.connect();
        harness.last()->simulateOpen();
        harness.last()->simulateClose();

        auto future = client.send("buffer:update", QJsonObject());
        QVERIFY(!future.isFinished());
        QCOMPARE(client.queuedOperationCount(), 1);

        client.connect();
        harness.last()->simulateOpen();
        QVERIFY(future.isFinished());
        QCOMPARE(sentTypes(harness.last()),
                 QStringList({"connection:hello", "buffer:update"}));
    }

    void testDisconnectRejectsPending()
    {
        ReplayHarness harness;
        plink::LinkClient client(plink::ClientConfig(), harness.factory());
        client.connect();
        harness.last()->simulateOpen();

        auto future = client.send("file:open", QJsonObject());
        QCOMPARE(client.pendingRequestCount(), 1);

        client.disconnect();

        QVERIFY(future.isFinished());
        QCOMPARE(failureOf(future), QString("WebSocket disconnected"));
        QCOMPARE(client.pendingRequestCount(), 0);
    }

    void testDisconnectRejectsQueued()
    {
        ReplayHarness harness;
        plink::LinkClient client(plink::ClientConfig(), harness.factory());

        auto correlated = client.send("file:open", QJsonObject());
        auto fireAndForget = client.send("buffer:update", QJsonObject());

        client.disconnect();

        QVERIFY(correlated.isFinished());
        QVERIFY(fireAndForget.isFinished());
        QCOMPARE(failureOf(correlated), QString("WebSocket disconnected"));
        QCOMPARE(failureOf(fireAndForget), QString("WebSocket disconnected"));
        QCOMPARE(client.queuedOperationCount(), 0);

        try {
            correlated.waitForFinished();
            QFAIL("expected DisconnectedError");
        } catch (const plink::DisconnectedError&) {
        }
    }

    void testDisconnectClearsQueue()
    {
        ReplayHarness harness;
        plink::LinkClient client(plink::ClientConfig(), harness.factory());

        client.send("file:open", QJsonObject());
        client.send("buffer:update", QJsonObject());
        client.disconnect();

        client.connect();
        harness.last()->simulateOpen();

        QCOMPARE(sentTypes(harness.last()), QStringList({"connection:hello"}));
    }

    void testNoTimeoutAfterDisconnect()
    {
        ReplayHarness harness;
        plink::LinkClient client(fastConfig(), harness.factory());
        client.connect();
        harness.last()->simulateOpen();

        auto future = client.send("file:open", QJsonObject());
        client.disconnect();
        QCOMPARE(failureOf(future), QString("WebSocket disconnected"));

        // The canceled timer must not fire against the cleared table.
        QTest::qWait(150);
        QCOMPARE(client.pendingRequestCount(), 0);
        QCOMPARE(client.status(), ConnectionStatus::Disconnected);
    }

    void testPendingSurvivesUnexpectedClose()
    {
        ReplayHarness harness;
        plink::LinkClient client(plink::ClientConfig(), harness.factory());
        client.connect();
        harness.last()->simulateOpen();

        auto future = client.send("file:open", QJsonObject());
        QString id = lastSentObject(harness.last())["id"].toString();
        harness.last()->simulateClose();

        QVERIFY(!future.isFinished());
        QCOMPARE(client.pendingRequestCount(), 1);

        // A response on the next connection still settles it.
        client.connect();
        harness.last()->simulateOpen();
        harness.last()->feedText(responseFor(id, "buffer:content"));
        QVERIFY(future.isFinished());
        QCOMPARE(future.result()->type, QString("buffer:content"));
    }

    void testDestroyingClientRejectsOutstanding()
    {
        ReplayHarness harness;
        QFuture<plink::SendResult> queued;
        QFuture<plink::SendResult> pending;
        {
            plink::LinkClient client(plink::ClientConfig(), harness.factory());
            queued = client.send("file:open", QJsonObject());
            client.connect();
            harness.last()->simulateOpen();
            pending = client.send("file:save", QJsonObject());
        }
        QVERIFY(queued.isFinished());
        QVERIFY(pending.isFinished());
        QCOMPARE(failureOf(pending), QString("WebSocket disconnected"));
    }

    void testMessageSentSignal()
    {
        ReplayHarness harness;
        plink::LinkClient client(plink::ClientConfig(), harness.factory());
        QSignalSpy sentSpy(&client, &plink::LinkClient::messageSent);

        client.connect();
        harness.last()->simulateOpen();
        client.send("editor:cursor", QJsonObject());

        QCOMPARE(sentSpy.count(), 2);
        QCOMPARE(sentSpy.at(0).at(0).value<plink::Message>().type, QString("connection:hello"));
        QCOMPARE(sentSpy.at(1).at(0).value<plink::Message>().type, QString("editor:cursor"));
    }
};

QTEST_MAIN(TestLinkClientRequests)
#include "test_link_client_requests.moc"
