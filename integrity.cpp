/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#include "integrity.h"
#include "lanxfer_config.h"
#include "lanxfer_debug.h"

#include <QFile>
#include <QMutexLocker>

#include <vector>

// ---------------------------------------------------------------------------
// Algorithm names
// ---------------------------------------------------------------------------

bool hashAlgorithmFromName(const QString &name, QCryptographicHash::Algorithm &algorithm)
{
    QString key = name.trimmed().toLower();
    key.replace(QLatin1Char('-'), QLatin1Char('_'));

    static const struct {
        const char *name;
        QCryptographicHash::Algorithm algorithm;
    } table[] = {
        {"md4", QCryptographicHash::Md4},
        {"md5", QCryptographicHash::Md5},
        {"sha1", QCryptographicHash::Sha1},
        {"sha224", QCryptographicHash::Sha224},
        {"sha256", QCryptographicHash::Sha256},
        {"sha384", QCryptographicHash::Sha384},
        {"sha512", QCryptographicHash::Sha512},
        {"sha3_224", QCryptographicHash::Sha3_224},
        {"sha3_256", QCryptographicHash::Sha3_256},
        {"sha3_384", QCryptographicHash::Sha3_384},
        {"sha3_512", QCryptographicHash::Sha3_512},
        {"keccak_224", QCryptographicHash::Keccak_224},
        {"keccak_256", QCryptographicHash::Keccak_256},
        {"keccak_384", QCryptographicHash::Keccak_384},
        {"keccak_512", QCryptographicHash::Keccak_512},
    };

    for (const auto &entry : table) {
        if (key == QLatin1String(entry.name)) {
            algorithm = entry.algorithm;
            return true;
        }
    }
    return false;
}

bool isSupportedHashAlgorithm(const QString &name)
{
    QCryptographicHash::Algorithm algorithm;
    return hashAlgorithmFromName(name, algorithm);
}

bool sameHashAlgorithm(const QString &a, const QString &b)
{
    QCryptographicHash::Algorithm algoA;
    QCryptographicHash::Algorithm algoB;
    if (hashAlgorithmFromName(a, algoA) && hashAlgorithmFromName(b, algoB)) {
        return algoA == algoB;
    }
    return a.trimmed().compare(b.trimmed(), Qt::CaseInsensitive) == 0;
}

// ---------------------------------------------------------------------------
// Streaming file digest
// ---------------------------------------------------------------------------

bool hashFile(const QString &path, const QString &algorithm, int chunkSize,
              QString &hexDigest, TransferError &error)
{
    QCryptographicHash::Algorithm algo;
    if (!hashAlgorithmFromName(algorithm, algo)) {
        error = TransferError(ErrorKind::UnsupportedAlgorithm, TransferPhase::None, algorithm);
        return false;
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        error = TransferError(ErrorKind::LocalIO, TransferPhase::None,
                              QStringLiteral("%1: %2").arg(path, file.errorString()));
        return false;
    }

    QCryptographicHash hash(algo);
    std::vector<char> buffer(static_cast<size_t>(qMax(chunkSize, 1)));
    while (true) {
        const qint64 n = file.read(buffer.data(), static_cast<qint64>(buffer.size()));
        if (n < 0) {
            error = TransferError(ErrorKind::LocalIO, TransferPhase::None,
                                  QStringLiteral("%1: %2").arg(path, file.errorString()));
            return false;
        }
        if (n == 0) {
            break;
        }
        hash.addData(buffer.data(), static_cast<int>(n));
    }

    hexDigest = QString::fromLatin1(hash.result().toHex());
    return true;
}

QString digestPrefix(const QString &digest)
{
    return digest.left(16) + QStringLiteral("...");
}

// ---------------------------------------------------------------------------
// IntegrityVerifier
// ---------------------------------------------------------------------------

IntegrityVerifier::IntegrityVerifier(const TransferConfig &config)
    : m_algorithm(config.hashAlgorithm)
    , m_chunkSize(config.hashChunkSize)
    , m_skip(config.skipHashVerification)
{
}

bool IntegrityVerifier::verify(const QString &path, const QString &expectedHash, VerifyResult &result)
{
    m_lastDigest.clear();
    m_lastError = TransferError();

    if (m_skip) {
        qCDebug(LANXFER_LOG) << "Hash verification skipped for" << path;
        result = VerifyResult::Skipped;
        return true;
    }

    if (!hashFile(path, m_algorithm, m_chunkSize, m_lastDigest, m_lastError)) {
        m_lastError.phase = TransferPhase::Finalize;
        return false;
    }

    if (m_lastDigest.compare(expectedHash.trimmed(), Qt::CaseInsensitive) == 0) {
        result = VerifyResult::Verified;
    } else {
        qCWarning(LANXFER_LOG) << "Hash mismatch for" << path
                               << "expected:" << expectedHash
                               << "received:" << m_lastDigest;
        result = VerifyResult::Mismatch;
    }
    return true;
}

// ---------------------------------------------------------------------------
// ValidationLog
// ---------------------------------------------------------------------------

void ValidationLog::record(const FailedValidation &failure)
{
    QMutexLocker locker(&m_mutex);
    m_failures.append(failure);
}

QList<FailedValidation> ValidationLog::drain()
{
    QMutexLocker locker(&m_mutex);
    QList<FailedValidation> failures;
    failures.swap(m_failures);
    return failures;
}

int ValidationLog::count() const
{
    QMutexLocker locker(&m_mutex);
    return m_failures.size();
}
