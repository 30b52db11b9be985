/*
 * SPDX-FileCopyrightText: 2026 Graham Morrison
 *
 * SPDX-License-Identifier: LGPL-2.0-or-later
 */

#include "manifest.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>
#include <QtEndian>

#include <gtest/gtest.h>

namespace {

TransferManifest sampleFile()
{
    TransferManifest m;
    m.kind = TransferKind::File;
    m.name = QStringLiteral("report.pdf");
    m.hashAlgorithm = QStringLiteral("sha256");
    m.timestamp = 1700000000.25;
    m.size = 123456789;
    m.hash = QStringLiteral("9f86d081884c7d659a2feaa0c55ad015a3bf4f1b2b0b822cd15d6c15b0f00a08");
    return m;
}

QByteArray prefixFor(quint32 length)
{
    QByteArray prefix(MANIFEST_PREFIX_SIZE, Qt::Uninitialized);
    qToBigEndian(length, reinterpret_cast<uchar *>(prefix.data()));
    return prefix;
}

bool decodeFrame(const QByteArray &frame, TransferManifest &out, QString &error)
{
    return decodeManifest(frame.left(MANIFEST_PREFIX_SIZE), frame.mid(MANIFEST_PREFIX_SIZE), out, error);
}

bool writeFile(const QString &path, const QByteArray &data)
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile f(path);
    return f.open(QIODevice::WriteOnly) && f.write(data) == data.size();
}

} // namespace

TEST(ManifestCodec, FileRoundTrip)
{
    const TransferManifest m = sampleFile();
    const QByteArray frame = encodeManifest(m);

    quint32 length = 0;
    QString error;
    ASSERT_TRUE(decodeManifestLength(frame.left(MANIFEST_PREFIX_SIZE), length, error));
    EXPECT_EQ(length, static_cast<quint32>(frame.size() - MANIFEST_PREFIX_SIZE));

    TransferManifest decoded;
    ASSERT_TRUE(decodeFrame(frame, decoded, error)) << error.toStdString();
    EXPECT_EQ(decoded, m);
}

TEST(ManifestCodec, DirectoryRoundTripKeepsEntryOrder)
{
    TransferManifest m;
    m.kind = TransferKind::Directory;
    m.name = QStringLiteral("photos");
    m.hashAlgorithm = QStringLiteral("md5");
    m.timestamp = 42;
    m.files = {
        {QStringLiteral("z.txt"), 3, QStringLiteral("aa")},
        {QStringLiteral("a/b.txt"), 0, QStringLiteral("bb")},
        {QStringLiteral("m.bin"), 5000000000LL, QString()},
    };
    m.totalFiles = m.files.size();
    m.totalSize = 3 + 5000000000LL;

    TransferManifest decoded;
    QString error;
    ASSERT_TRUE(decodeFrame(encodeManifest(m), decoded, error)) << error.toStdString();
    EXPECT_EQ(decoded, m);
    ASSERT_EQ(decoded.files.size(), 3);
    EXPECT_EQ(decoded.files.at(0).path, QStringLiteral("z.txt"));
    EXPECT_EQ(decoded.files.at(2).size, 5000000000LL);
    EXPECT_TRUE(decoded.files.at(2).hash.isEmpty());
}

TEST(ManifestCodec, EmptyDirectoryAndUnicodeNames)
{
    TransferManifest m;
    m.kind = TransferKind::Directory;
    m.name = QStringLiteral("répertoire_日本");
    m.hashAlgorithm = QStringLiteral("sha1");

    TransferManifest decoded;
    QString error;
    ASSERT_TRUE(decodeFrame(encodeManifest(m), decoded, error)) << error.toStdString();
    EXPECT_EQ(decoded, m);
    EXPECT_TRUE(decoded.files.isEmpty());

    m.files = {{QStringLiteral("süb/ファイル.txt"), 7, QStringLiteral("cc")}};
    m.totalFiles = 1;
    m.totalSize = 7;
    ASSERT_TRUE(decodeFrame(encodeManifest(m), decoded, error)) << error.toStdString();
    EXPECT_EQ(decoded.files.at(0).path, QStringLiteral("süb/ファイル.txt"));
}

TEST(ManifestCodec, CustomTypeTags)
{
    TransferTypeTags tags;
    tags.file = QStringLiteral("F");
    tags.directory = QStringLiteral("D");

    const QByteArray frame = encodeManifest(sampleFile(), tags);
    EXPECT_TRUE(frame.contains("\"type\":\"F\""));

    TransferManifest decoded;
    QString error;
    EXPECT_FALSE(decodeFrame(frame, decoded, error));
    EXPECT_TRUE(decodeManifest(frame.left(MANIFEST_PREFIX_SIZE), frame.mid(MANIFEST_PREFIX_SIZE),
                               decoded, error, tags));
}

TEST(ManifestCodec, RejectsOversizedLength)
{
    quint32 length = 0;
    QString error;
    EXPECT_TRUE(decodeManifestLength(prefixFor(LANXFER_MAX_MANIFEST_SIZE), length, error));
    EXPECT_FALSE(decodeManifestLength(prefixFor(LANXFER_MAX_MANIFEST_SIZE + 1), length, error));
    EXPECT_FALSE(decodeManifestLength(QByteArray("\0\0", 2), length, error));
}

TEST(ManifestCodec, RejectsMalformedBodies)
{
    TransferManifest out;
    QString error;

    const QByteArray notJson("{not json");
    EXPECT_FALSE(decodeManifest(prefixFor(notJson.size()), notJson, out, error));

    const QByteArray array("[1,2]");
    EXPECT_FALSE(decodeManifest(prefixFor(array.size()), array, out, error));

    const QByteArray body = encodeManifest(sampleFile()).mid(MANIFEST_PREFIX_SIZE);
    EXPECT_FALSE(decodeManifest(prefixFor(body.size() + 1), body, out, error));
}

TEST(ManifestCodec, RejectsMissingOrInvalidFields)
{
    const QList<QByteArray> bodies = {
        R"({"type":"file","hash_algorithm":"sha256","size":1,"hash":"aa"})",
        R"({"type":"file","name":"a","hash_algorithm":"sha256","hash":"aa"})",
        R"({"type":"file","name":"a","hash_algorithm":"sha256","size":-1,"hash":"aa"})",
        R"({"type":"file","name":"a","hash_algorithm":"sha256","size":1.5,"hash":"aa"})",
        R"({"type":"file","name":"a","size":1,"hash":"aa"})",
        R"({"type":"directory","name":"d","hash_algorithm":"sha256","total_files":0,"total_size":0})",
        R"({"type":"directory","name":"d","hash_algorithm":"sha256","total_files":1,"total_size":1,"files":[{"size":1}]})",
        R"({"type":"symlink","name":"a","hash_algorithm":"sha256"})",
    };
    for (const QByteArray &body : bodies) {
        TransferManifest out;
        QString error;
        EXPECT_FALSE(decodeManifest(prefixFor(body.size()), body, out, error)) << body.constData();
        EXPECT_FALSE(error.isEmpty());
    }
}

TEST(ManifestCodec, RejectsSizesOutsideQint64)
{
    const QList<QByteArray> bodies = {
        R"({"type":"file","name":"a","hash_algorithm":"sha256","size":1e300,"hash":"aa"})",
        R"({"type":"file","name":"a","hash_algorithm":"sha256","size":9223372036854775808,"hash":"aa"})",
        R"({"type":"directory","name":"d","hash_algorithm":"sha256","total_files":1,"total_size":1e19,)"
        R"("files":[{"path":"x","size":1}]})",
        R"({"type":"directory","name":"d","hash_algorithm":"sha256","total_files":1,"total_size":1,)"
        R"("files":[{"path":"x","size":1e300}]})",
    };
    for (const QByteArray &body : bodies) {
        TransferManifest out;
        QString error;
        EXPECT_FALSE(decodeManifest(prefixFor(body.size()), body, out, error)) << body.constData();
        EXPECT_FALSE(error.isEmpty());
    }

    // Largest sizes still in range decode; their sum is left to the receiver
    const QByteArray body =
        R"({"type":"directory","name":"d","hash_algorithm":"sha256","total_files":2,"total_size":9e18,)"
        R"("files":[{"path":"x","size":9e18},{"path":"y","size":9e18}]})";
    TransferManifest out;
    QString error;
    ASSERT_TRUE(decodeManifest(prefixFor(body.size()), body, out, error)) << error.toStdString();
    ASSERT_EQ(out.files.size(), 2);
    EXPECT_EQ(out.files.at(1).size, Q_INT64_C(9000000000000000000));
}

TEST(ManifestCodec, SafeRelativePaths)
{
    EXPECT_TRUE(isSafeRelativePath(QStringLiteral("a.txt")));
    EXPECT_TRUE(isSafeRelativePath(QStringLiteral("sub/dir/a.txt")));
    EXPECT_TRUE(isSafeRelativePath(QStringLiteral(".hidden")));

    EXPECT_FALSE(isSafeRelativePath(QString()));
    EXPECT_FALSE(isSafeRelativePath(QStringLiteral("/etc/passwd")));
    EXPECT_FALSE(isSafeRelativePath(QStringLiteral("../escape")));
    EXPECT_FALSE(isSafeRelativePath(QStringLiteral("a/../../b")));
    EXPECT_FALSE(isSafeRelativePath(QStringLiteral("a//b")));
    EXPECT_FALSE(isSafeRelativePath(QStringLiteral("a\\b")));
}

TEST(DirectoryScan, SortedRelativePathsWithHiddenFiles)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    ASSERT_TRUE(writeFile(dir.filePath(QStringLiteral("b.txt")), "bb"));
    ASSERT_TRUE(writeFile(dir.filePath(QStringLiteral("a/z.txt")), "zzz"));
    ASSERT_TRUE(writeFile(dir.filePath(QStringLiteral(".hidden")), "h"));
    ASSERT_TRUE(QDir().mkpath(dir.filePath(QStringLiteral("empty"))));

    QList<FileEntry> entries;
    qint64 total = 0;
    QString error;
    ASSERT_TRUE(collectDirectoryFiles(dir.path(), entries, total, error)) << error.toStdString();

    ASSERT_EQ(entries.size(), 3);
    EXPECT_EQ(entries.at(0).path, QStringLiteral(".hidden"));
    EXPECT_EQ(entries.at(1).path, QStringLiteral("a/z.txt"));
    EXPECT_EQ(entries.at(2).path, QStringLiteral("b.txt"));
    EXPECT_EQ(entries.at(1).size, 3);
    EXPECT_EQ(total, 6);
}

TEST(DirectoryScan, MissingDirectoryFails)
{
    QList<FileEntry> entries;
    qint64 total = 0;
    QString error;
    EXPECT_FALSE(collectDirectoryFiles(QStringLiteral("/nonexistent/lanxfer/scan"), entries, total, error));
    EXPECT_FALSE(error.isEmpty());
}
