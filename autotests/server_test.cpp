/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#include "test_observer.h"
#include "transfer_server.h"

#include <QElapsedTimer>
#include <QTcpServer>
#include <QTcpSocket>
#include <QTemporaryDir>

#include <gtest/gtest.h>

namespace {

class ServerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(m_dir.isValid());
        m_config.receivedDir = m_dir.filePath(QStringLiteral("inbox"));
        m_config.serverTimeoutMs = 200;
        m_config.ioTimeoutMs = 2000;
    }

    bool canConnect(quint16 port)
    {
        QTcpSocket socket;
        socket.connectToHost(QHostAddress::LocalHost, port);
        const bool connected = socket.waitForConnected(2000);
        socket.abort();
        return connected;
    }

    QTemporaryDir m_dir;
    TransferConfig m_config;
};

} // namespace

TEST_F(ServerTest, StartAcceptStop)
{
    TransferServer server(m_config);
    EXPECT_FALSE(server.isRunning());

    ASSERT_TRUE(server.start(QHostAddress::LocalHost, 0)) << server.lastError().detail.toStdString();
    EXPECT_TRUE(server.isRunning());
    const quint16 port = server.serverPort();
    ASSERT_NE(port, 0);
    EXPECT_TRUE(canConnect(port));

    QElapsedTimer timer;
    timer.start();
    server.stop();
    EXPECT_LT(timer.elapsed(), m_config.serverTimeoutMs + 2000);
    EXPECT_FALSE(server.isRunning());
    EXPECT_FALSE(canConnect(port));

    server.stop();
    EXPECT_FALSE(server.isRunning());
}

TEST_F(ServerTest, CanBeRestarted)
{
    TransferServer server(m_config);
    ASSERT_TRUE(server.start(QHostAddress::LocalHost, 0));
    server.stop();

    ASSERT_TRUE(server.start(QHostAddress::LocalHost, 0));
    EXPECT_TRUE(server.isRunning());
    EXPECT_TRUE(canConnect(server.serverPort()));
    server.stop();
}

TEST_F(ServerTest, SecondStartWhileRunningFails)
{
    TransferServer server(m_config);
    ASSERT_TRUE(server.start(QHostAddress::LocalHost, 0));
    const quint16 port = server.serverPort();
    EXPECT_FALSE(server.start(QHostAddress::LocalHost, 0));
    EXPECT_TRUE(server.isRunning());
    EXPECT_EQ(server.serverPort(), port);
    server.stop();
}

TEST_F(ServerTest, PortInUse)
{
    QTcpServer blocker;
    ASSERT_TRUE(blocker.listen(QHostAddress::LocalHost, 0));

    TransferServer server(m_config);
    EXPECT_FALSE(server.start(QHostAddress::LocalHost, blocker.serverPort()));
    EXPECT_FALSE(server.isRunning());
    EXPECT_EQ(server.lastError().kind, ErrorKind::AddressInUse);
    EXPECT_EQ(server.lastError().phase, TransferPhase::Bind);
}

TEST_F(ServerTest, AddressNotAvailable)
{
    // TEST-NET-3, never assigned to a local interface
    TransferServer server(m_config);
    EXPECT_FALSE(server.start(QHostAddress(QStringLiteral("203.0.113.1")), 0));
    EXPECT_FALSE(server.isRunning());
    EXPECT_EQ(server.lastError().kind, ErrorKind::AddressNotAvailable);
}

TEST_F(ServerTest, GarbageConnectionDoesNotStopServing)
{
    RecordingObserver observer;
    TransferServer server(m_config, &observer);
    ASSERT_TRUE(server.start(QHostAddress::LocalHost, 0));

    QTcpSocket client;
    client.connectToHost(QHostAddress::LocalHost, server.serverPort());
    ASSERT_TRUE(client.waitForConnected(2000));
    client.write(QByteArray("\xff\xff\xff\xff", 4));
    ASSERT_TRUE(client.waitForBytesWritten(2000));

    // The handler closes without replying
    EXPECT_TRUE(client.waitForDisconnected(5000) || client.state() == QAbstractSocket::UnconnectedState);
    EXPECT_EQ(client.bytesAvailable(), 0);

    ASSERT_TRUE(observer.waitForFinished(1));
    ASSERT_EQ(observer.failures().size(), 1);
    EXPECT_EQ(observer.failures().first().kind, ErrorKind::Protocol);

    EXPECT_TRUE(server.isRunning());
    EXPECT_TRUE(canConnect(server.serverPort()));
    server.stop();
    server.waitForHandlers();
}
