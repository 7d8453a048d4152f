#include <QtTest/QtTest>

#include <QDir>
#include <QTemporaryDir>

#include <cstdint>
#include <filesystem>

#include <optional>

#include <sys/stat.h>

#include "common/errors.hpp"
#include "snapshot/snapshot_codec.hpp"
#include "snapshot/snapshot_entry.hpp"

namespace {

template <typename Fn>
std::optional<honeyforge::ErrorKind> errorKindOf(Fn &&fn)
{
    try {
        fn();
    } catch (const honeyforge::ForgeError &ex) {
        return ex.kind();
    }
    return std::nullopt;
}

honeyforge::SnapshotEntry leaf(const std::string &name, honeyforge::EntryType type,
                               uint32_t mode, uint64_t size)
{
    honeyforge::SnapshotEntry entry;
    entry.name = name;
    entry.type = type;
    entry.mode = mode;
    entry.size = size;
    entry.uid = 0;
    entry.gid = 0;
    entry.modTime = 1700000000;
    return entry;
}

honeyforge::SnapshotEntry sampleTree()
{
    auto root = honeyforge::makeRootEntry();

    auto bin = leaf("bin", honeyforge::EntryType::Directory, S_IFDIR | 0755, 4096);
    auto bash = leaf("bash", honeyforge::EntryType::RegularFile, S_IFREG | 0755, 1183448);
    auto sh = leaf("sh", honeyforge::EntryType::Symlink, S_IFLNK | 0777, 4);
    sh.payload = honeyforge::SymlinkPayload{"/bin/bash"};
    bin.payload = honeyforge::DirectoryPayload{{bash, sh}};

    auto dev = leaf("dev", honeyforge::EntryType::Directory, S_IFDIR | 0755, 4096);
    auto null = leaf("null", honeyforge::EntryType::CharDevice, S_IFCHR | 0666, 0);
    null.sourceRef = std::string("blob:null");
    dev.payload = honeyforge::DirectoryPayload{{null}};

    *honeyforge::childrenOf(root) = {bin, dev};
    return root;
}

} // namespace

class SnapshotCodecTests : public QObject
{
    Q_OBJECT
private slots:
    void testJsonPreservesEntries();
    void testCborPreservesEntries();
    void testRejectsWrongEnvelope();
    void testRejectsPayloadTypeMismatch();
    void testRejectsGarbage();
    void testWriteRefusesExistingFile();
    void testWriteLeavesNoStagingFiles();
    void testEncodeFailureIsTyped();
    void testReadMissingFile();
};

void SnapshotCodecTests::testJsonPreservesEntries()
{
    const QByteArray data = honeyforge::encodeSnapshot(sampleTree(), honeyforge::SnapshotEncoding::Json);
    QVERIFY(data.startsWith('{'));

    const auto decoded = honeyforge::decodeSnapshot(data);
    QCOMPARE(honeyforge::countEntries(decoded), static_cast<size_t>(6));

    const auto *sh = honeyforge::findEntry(decoded, "/bin/sh");
    QVERIFY(sh != nullptr);
    QCOMPARE(sh->type, honeyforge::EntryType::Symlink);
    QCOMPARE(QString::fromStdString(*honeyforge::linkTargetOf(*sh)), QStringLiteral("/bin/bash"));

    const auto *bash = honeyforge::findEntry(decoded, "/bin/bash");
    QVERIFY(bash != nullptr);
    QCOMPARE(bash->mode, static_cast<uint32_t>(S_IFREG | 0755));
    QCOMPARE(bash->size, static_cast<uint64_t>(1183448));
    QCOMPARE(bash->modTime, static_cast<int64_t>(1700000000));
    QVERIFY(!bash->sourceRef.has_value());
}

void SnapshotCodecTests::testCborPreservesEntries()
{
    const QByteArray data = honeyforge::encodeSnapshot(sampleTree(), honeyforge::SnapshotEncoding::Cbor);
    QVERIFY(!data.startsWith('{'));

    const auto decoded = honeyforge::decodeSnapshot(data);
    const auto *null = honeyforge::findEntry(decoded, "/dev/null");
    QVERIFY(null != nullptr);
    QCOMPARE(null->type, honeyforge::EntryType::CharDevice);
    QCOMPARE(null->mode, static_cast<uint32_t>(S_IFCHR | 0666));
    QCOMPARE(QString::fromStdString(null->sourceRef.value_or("")), QStringLiteral("blob:null"));
    QCOMPARE(QString::fromStdString(*honeyforge::linkTargetOf(*honeyforge::findEntry(decoded, "/bin/sh"))),
             QStringLiteral("/bin/bash"));
}

void SnapshotCodecTests::testRejectsWrongEnvelope()
{
    const auto parseError = std::optional<honeyforge::ErrorKind>(honeyforge::ErrorKind::ParseError);
    QCOMPARE(errorKindOf([] {
                 honeyforge::decodeSnapshot(R"({"format": "other", "version": 1, "root": {}})");
             }),
             parseError);
    QCOMPARE(errorKindOf([] {
                 honeyforge::decodeSnapshot(
                     R"({"format": "honeyforge-fs", "version": 2, "root": {}})");
             }),
             parseError);
    QCOMPARE(errorKindOf([] {
                 honeyforge::decodeSnapshot(R"({"format": "honeyforge-fs", "version": 1})");
             }),
             parseError);
    QCOMPARE(errorKindOf([] {
                 honeyforge::decodeSnapshot(R"({"format": "honeyforge-fs", "version": 1,
                     "root": {"name": "etc", "type": "directory", "uid": 0, "gid": 0,
                              "size": 0, "mode": 16877, "mtime": 0, "children": []}})");
             }),
             parseError);
}

void SnapshotCodecTests::testRejectsPayloadTypeMismatch()
{
    const auto parseError = std::optional<honeyforge::ErrorKind>(honeyforge::ErrorKind::ParseError);
    QCOMPARE(errorKindOf([] {
                 honeyforge::decodeSnapshot(R"({"format": "honeyforge-fs", "version": 1,
                     "root": {"name": "/", "type": "directory", "uid": 0, "gid": 0,
                              "size": 0, "mode": 16877, "mtime": 0, "children": [
                         {"name": "sh", "type": "symlink", "uid": 0, "gid": 0,
                          "size": 4, "mode": 41471, "mtime": 0}]}})");
             }),
             parseError);
    QCOMPARE(errorKindOf([] {
                 honeyforge::decodeSnapshot(R"({"format": "honeyforge-fs", "version": 1,
                     "root": {"name": "/", "type": "directory", "uid": 0, "gid": 0,
                              "size": 0, "mode": 16877, "mtime": 0, "target": "/etc"}})");
             }),
             parseError);
    QCOMPARE(errorKindOf([] {
                 honeyforge::decodeSnapshot(R"({"format": "honeyforge-fs", "version": 1,
                     "root": {"name": "/", "type": "directory", "uid": 0, "gid": 0,
                              "size": 0, "mode": 16877, "mtime": 0, "children": [
                         {"name": "x", "type": "teleporter", "uid": 0, "gid": 0,
                          "size": 0, "mode": 0, "mtime": 0}]}})");
             }),
             parseError);
}

void SnapshotCodecTests::testRejectsGarbage()
{
    const auto parseError = std::optional<honeyforge::ErrorKind>(honeyforge::ErrorKind::ParseError);
    QCOMPARE(errorKindOf([] { honeyforge::decodeSnapshot(QByteArray()); }), parseError);
    QCOMPARE(errorKindOf([] { honeyforge::decodeSnapshot("{ truncated"); }), parseError);
    QCOMPARE(errorKindOf([] { honeyforge::decodeSnapshot(QByteArray("\xff\x00\x13", 3)); }),
             parseError);
}

void SnapshotCodecTests::testWriteRefusesExistingFile()
{
    QTemporaryDir dir;
    const std::filesystem::path path = std::filesystem::path(dir.path().toStdString()) / "fs.hfsnap";
    const QByteArray data = honeyforge::encodeSnapshot(sampleTree(), honeyforge::SnapshotEncoding::Json);

    honeyforge::writeSnapshotFile(path, data);
    QCOMPARE(honeyforge::countEntries(honeyforge::readSnapshotFile(path)), static_cast<size_t>(6));
    QCOMPARE(errorKindOf([&] { honeyforge::writeSnapshotFile(path, QByteArray("{}")); }),
             std::optional<honeyforge::ErrorKind>(honeyforge::ErrorKind::AlreadyExists));
    QCOMPARE(honeyforge::countEntries(honeyforge::readSnapshotFile(path)), static_cast<size_t>(6));
}

void SnapshotCodecTests::testWriteLeavesNoStagingFiles()
{
    QTemporaryDir dir;
    const std::filesystem::path path = std::filesystem::path(dir.path().toStdString()) / "fs.hfsnap";
    const QByteArray data = honeyforge::encodeSnapshot(sampleTree(), honeyforge::SnapshotEncoding::Cbor);

    honeyforge::writeSnapshotFile(path, data);
    QCOMPARE(errorKindOf([&] { honeyforge::writeSnapshotFile(path, data); }),
             std::optional<honeyforge::ErrorKind>(honeyforge::ErrorKind::AlreadyExists));

    const QStringList entries = QDir(dir.path()).entryList(QDir::Files | QDir::Hidden);
    QCOMPARE(entries, QStringList{QStringLiteral("fs.hfsnap")});
    QCOMPARE(std::filesystem::hard_link_count(path), static_cast<std::uintmax_t>(1));
}

void SnapshotCodecTests::testEncodeFailureIsTyped()
{
    auto root = sampleTree();
    (*honeyforge::childrenOf(root))[0].name = std::string("caf\xe9");

    QCOMPARE(errorKindOf([&] { honeyforge::encodeSnapshot(root, honeyforge::SnapshotEncoding::Json); }),
             std::optional<honeyforge::ErrorKind>(honeyforge::ErrorKind::IOFailure));
}

void SnapshotCodecTests::testReadMissingFile()
{
    QTemporaryDir dir;
    QCOMPARE(errorKindOf([&] {
                 honeyforge::readSnapshotFile((dir.path() + "/absent.hfsnap").toStdString());
             }),
             std::optional<honeyforge::ErrorKind>(honeyforge::ErrorKind::SourceNotFound));
}

QTEST_MAIN(SnapshotCodecTests)
#include "test_snapshot_codec.moc"
