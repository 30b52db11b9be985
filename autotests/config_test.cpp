/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#include "lanxfer_config.h"

#include <QFile>
#include <QTemporaryDir>

#include <gtest/gtest.h>

namespace {

class ConfigTest : public ::testing::Test
{
protected:
    void SetUp() override { ASSERT_TRUE(m_dir.isValid()); }

    QString configFile(const QByteArray &json)
    {
        const QString path = m_dir.filePath(QStringLiteral("config.json"));
        QFile f(path);
        EXPECT_TRUE(f.open(QIODevice::WriteOnly | QIODevice::Truncate));
        f.write(json);
        return path;
    }

    QTemporaryDir m_dir;
};

} // namespace

TEST_F(ConfigTest, DefaultsAreValid)
{
    const TransferConfig config;
    QString error;
    EXPECT_TRUE(validateTransferConfig(config, error)) << error.toStdString();
    EXPECT_EQ(config.port, 5001);
    EXPECT_EQ(config.bufferSize, 65536);
    EXPECT_EQ(config.hashAlgorithm, QStringLiteral("sha256"));
    EXPECT_EQ(config.receivedDir, QStringLiteral("received_files"));
    EXPECT_EQ(config.maxConcurrentHandlers, 0);
}

TEST_F(ConfigTest, LoadsKnownKeysAndKeepsTheRest)
{
    TransferConfig config;
    QString error;
    ASSERT_TRUE(loadTransferConfig(configFile(R"({
        "PORT": 6000,
        "BUFFER_SIZE": 4096,
        "HASH_ALGORITHM": "md5",
        "SKIP_HASH_VERIFICATION": true,
        "RECEIVED_DIR": "/tmp/inbox",
        "SERVER_TIMEOUT": 0.5,
        "ENTRY_ACK_TIMEOUT": 120,
        "TRANSFER_TYPES": {"FILE": "f", "DIRECTORY": "d"},
        "SOMETHING_ELSE": [1, 2, 3]
    })"), config, error)) << error.toStdString();

    EXPECT_EQ(config.port, 6000);
    EXPECT_EQ(config.bufferSize, 4096);
    EXPECT_EQ(config.hashAlgorithm, QStringLiteral("md5"));
    EXPECT_TRUE(config.skipHashVerification);
    EXPECT_EQ(config.receivedDir, QStringLiteral("/tmp/inbox"));
    EXPECT_EQ(config.serverTimeoutMs, 500);
    EXPECT_EQ(config.entryAckTimeoutMs, 120000);
    EXPECT_EQ(config.transferTypes.file, QStringLiteral("f"));
    EXPECT_EQ(config.transferTypes.directory, QStringLiteral("d"));

    EXPECT_EQ(config.hashChunkSize, LANXFER_DEFAULT_HASH_CHUNK_SIZE);
    EXPECT_EQ(config.ackTimeoutMs, 30000);
}

TEST_F(ConfigTest, RejectsBadValuesAndLeavesConfigUntouched)
{
    const QList<QByteArray> bad = {
        R"({"PORT": "5001"})",
        R"({"PORT": 70000})",
        R"({"BUFFER_SIZE": 0})",
        R"({"HASH_ALGORITHM": "crc32"})",
        R"({"SKIP_HASH_VERIFICATION": "yes"})",
        R"({"TRANSFER_TYPES": {"FILE": "same", "DIRECTORY": "same"}})",
        R"({"IO_TIMEOUT": -1})",
        R"({"MAX_CONCURRENT_HANDLERS": -2})",
        R"([1, 2])",
        R"({broken)",
    };
    for (const QByteArray &json : bad) {
        TransferConfig config;
        QString error;
        EXPECT_FALSE(loadTransferConfig(configFile(json), config, error)) << json.constData();
        EXPECT_FALSE(error.isEmpty());
        EXPECT_EQ(config.port, LANXFER_DEFAULT_PORT);
        EXPECT_EQ(config.bufferSize, LANXFER_DEFAULT_BUFFER_SIZE);
    }
}

TEST_F(ConfigTest, MissingFileIsAnError)
{
    TransferConfig config;
    QString error;
    EXPECT_FALSE(loadTransferConfig(m_dir.filePath(QStringLiteral("absent.json")), config, error));
    EXPECT_FALSE(error.isEmpty());
}
