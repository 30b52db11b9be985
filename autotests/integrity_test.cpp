/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#include "integrity.h"
#include "lanxfer_config.h"
#include "transfer_receiver.h"

#include <QFile>
#include <QTemporaryDir>

#include <gtest/gtest.h>

#include <limits>

namespace {

const char ABC_SHA256[] = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
const char ABC_MD5[] = "900150983cd24fb0d6963f7d28e17f72";
const char EMPTY_SHA256[] = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

class IntegrityTest : public ::testing::Test
{
protected:
    void SetUp() override { ASSERT_TRUE(m_dir.isValid()); }

    QString write(const QString &name, const QByteArray &data)
    {
        const QString path = m_dir.filePath(name);
        QFile f(path);
        EXPECT_TRUE(f.open(QIODevice::WriteOnly));
        EXPECT_EQ(f.write(data), data.size());
        return path;
    }

    QTemporaryDir m_dir;
};

} // namespace

TEST(HashAlgorithmNames, CaseAndSeparatorInsensitive)
{
    QCryptographicHash::Algorithm algorithm;
    ASSERT_TRUE(hashAlgorithmFromName(QStringLiteral("SHA256"), algorithm));
    EXPECT_EQ(algorithm, QCryptographicHash::Sha256);
    ASSERT_TRUE(hashAlgorithmFromName(QStringLiteral("sha3-512"), algorithm));
    EXPECT_EQ(algorithm, QCryptographicHash::Sha3_512);

    EXPECT_FALSE(isSupportedHashAlgorithm(QStringLiteral("crc32")));
    EXPECT_TRUE(sameHashAlgorithm(QStringLiteral("sha256"), QStringLiteral("SHA256")));
    EXPECT_FALSE(sameHashAlgorithm(QStringLiteral("sha256"), QStringLiteral("md5")));
}

TEST_F(IntegrityTest, KnownDigests)
{
    const QString abc = write(QStringLiteral("abc"), "abc");
    QString digest;
    TransferError error;

    ASSERT_TRUE(hashFile(abc, QStringLiteral("sha256"), 1024, digest, error));
    EXPECT_EQ(digest, QLatin1String(ABC_SHA256));
    ASSERT_TRUE(hashFile(abc, QStringLiteral("md5"), 1024, digest, error));
    EXPECT_EQ(digest, QLatin1String(ABC_MD5));

    const QString empty = write(QStringLiteral("empty"), QByteArray());
    ASSERT_TRUE(hashFile(empty, QStringLiteral("sha256"), 1024, digest, error));
    EXPECT_EQ(digest, QLatin1String(EMPTY_SHA256));
}

TEST_F(IntegrityTest, ChunkSizeDoesNotChangeDigest)
{
    QByteArray data;
    for (int i = 0; i < 10000; ++i) {
        data.append(char(i * 31));
    }
    const QString path = write(QStringLiteral("data"), data);
    const QString expected = QString::fromLatin1(QCryptographicHash::hash(data, QCryptographicHash::Sha1).toHex());

    for (int chunk : {1, 7, 4096, 1 << 20}) {
        QString digest;
        TransferError error;
        ASSERT_TRUE(hashFile(path, QStringLiteral("sha1"), chunk, digest, error));
        EXPECT_EQ(digest, expected) << chunk;
    }
}

TEST_F(IntegrityTest, Failures)
{
    QString digest;
    TransferError error;
    EXPECT_FALSE(hashFile(write(QStringLiteral("x"), "x"), QStringLiteral("crc32"), 1024, digest, error));
    EXPECT_EQ(error.kind, ErrorKind::UnsupportedAlgorithm);

    EXPECT_FALSE(hashFile(m_dir.filePath(QStringLiteral("missing")), QStringLiteral("sha256"), 1024, digest, error));
    EXPECT_EQ(error.kind, ErrorKind::LocalIO);
}

TEST_F(IntegrityTest, VerifierReportsMismatchWithoutFailing)
{
    TransferConfig config;
    IntegrityVerifier verifier(config);
    const QString path = write(QStringLiteral("abc"), "abc");

    VerifyResult result = VerifyResult::Skipped;
    ASSERT_TRUE(verifier.verify(path, QString::fromLatin1(ABC_SHA256).toUpper(), result));
    EXPECT_EQ(result, VerifyResult::Verified);

    ASSERT_TRUE(verifier.verify(path, QString::fromLatin1(EMPTY_SHA256), result));
    EXPECT_EQ(result, VerifyResult::Mismatch);
    EXPECT_EQ(verifier.lastDigest(), QLatin1String(ABC_SHA256));

    EXPECT_FALSE(verifier.verify(m_dir.filePath(QStringLiteral("missing")), QString(), result));
}

TEST_F(IntegrityTest, SkipModeNeverReadsTheFile)
{
    TransferConfig config;
    config.skipHashVerification = true;
    IntegrityVerifier verifier(config);

    VerifyResult result = VerifyResult::Verified;
    ASSERT_TRUE(verifier.verify(m_dir.filePath(QStringLiteral("missing")), QStringLiteral("00"), result));
    EXPECT_EQ(result, VerifyResult::Skipped);
}

TEST(ValidationLog, DrainEmptiesTheLog)
{
    ValidationLog log;
    log.record({QStringLiteral("a"), QStringLiteral("1..."), QStringLiteral("2...")});
    log.record({QStringLiteral("b"), QStringLiteral("3..."), QStringLiteral("4...")});
    EXPECT_EQ(log.count(), 2);

    const QList<FailedValidation> drained = log.drain();
    ASSERT_EQ(drained.size(), 2);
    EXPECT_EQ(drained.at(1).file, QStringLiteral("b"));
    EXPECT_EQ(log.count(), 0);
}

TEST(DigestPrefix, SixteenDigitsAndEllipsis)
{
    EXPECT_EQ(digestPrefix(QLatin1String(ABC_SHA256)), QStringLiteral("ba7816bf8f01cfea..."));
}

TEST(DiskSpace, MarginBoundary)
{
    // 1000 bytes declared: exactly 1.1x is refused, one byte more is enough
    EXPECT_FALSE(hasSufficientSpace(1000, 1000));
    EXPECT_FALSE(hasSufficientSpace(1100, 1000));
    EXPECT_TRUE(hasSufficientSpace(1101, 1000));

    EXPECT_TRUE(hasSufficientSpace(1, 0));
    EXPECT_FALSE(hasSufficientSpace(0, 0));

    const qint64 large = 50LL * 1024 * 1024 * 1024;
    EXPECT_FALSE(hasSufficientSpace(large + large / 10, large));
    EXPECT_TRUE(hasSufficientSpace(large + large / 10 + 1, large));
}

TEST(DiskSpace, HugeDeclarationsNeverFit)
{
    const qint64 max = std::numeric_limits<qint64>::max();
    EXPECT_FALSE(hasSufficientSpace(max, max));
    EXPECT_FALSE(hasSufficientSpace(max, Q_INT64_C(9000000000000000000)));
    EXPECT_TRUE(hasSufficientSpace(max, max / 2));
}
