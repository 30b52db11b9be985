/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#ifndef INTEGRITY_H
#define INTEGRITY_H

#include <QCryptographicHash>
#include <QList>
#include <QMutex>
#include <QString>

#include "transfer_error.h"

struct TransferConfig;

// Algorithm identifiers follow the usual lowercase names ("md5", "sha1",
// "sha256", "sha3_256", ...). Matching is case-insensitive and '-' is
// accepted in place of '_'.
bool hashAlgorithmFromName(const QString &name, QCryptographicHash::Algorithm &algorithm);
bool isSupportedHashAlgorithm(const QString &name);
bool sameHashAlgorithm(const QString &a, const QString &b);

// Streams the file through the digest `chunkSize` bytes at a time.
// Fails with UnsupportedAlgorithm or LocalIO.
bool hashFile(const QString &path, const QString &algorithm, int chunkSize,
              QString &hexDigest, TransferError &error);

// Shortened digest for reports: first 16 hex digits followed by "..."
QString digestPrefix(const QString &digest);

enum class VerifyResult {
    Verified,
    Mismatch,
    Skipped,
};

struct FailedValidation {
    QString file;
    QString expected;   // digest prefix
    QString received;   // digest prefix
};

class IntegrityVerifier
{
public:
    explicit IntegrityVerifier(const TransferConfig &config);

    // Hashes `path` and compares against `expectedHash`. Returns false only
    // when the file could not be hashed; a content mismatch is a successful
    // call with result == Mismatch.
    bool verify(const QString &path, const QString &expectedHash, VerifyResult &result);

    QString lastDigest() const { return m_lastDigest; }
    TransferError lastError() const { return m_lastError; }

private:
    QString m_algorithm;
    int m_chunkSize;
    bool m_skip;
    QString m_lastDigest;
    TransferError m_lastError;
};

// Integrity failures accumulated across concurrent connection handlers.
// Append-only while serving, drained once the accept loop has stopped.
class ValidationLog
{
public:
    void record(const FailedValidation &failure);
    QList<FailedValidation> drain();
    int count() const;

private:
    mutable QMutex m_mutex;
    QList<FailedValidation> m_failures;
};

#endif // INTEGRITY_H
