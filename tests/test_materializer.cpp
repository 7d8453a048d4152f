#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include <filesystem>
#include <optional>

#include "common/errors.hpp"
#include "forge/materializer.hpp"
#include "forge/template_loader.hpp"

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

QByteArray readAll(const std::filesystem::path &path)
{
    QFile file(QString::fromStdString(path.string()));
    if (!file.open(QIODevice::ReadOnly)) {
        return {};
    }
    return file.readAll();
}

honeyforge::TemplateDefinition sampleTemplate()
{
    return honeyforge::parseTemplate(R"({
        "metadata": {"name": "Staging DB"},
        "users": {
            "dba": {"password": "s3cret", "uid": 1500, "gecos": "Database Admin"},
            "backup": "b4ckup"
        },
        "filesystem": {"var": {"lib": {"postgresql": {"14": {}}}}, "srv": {}},
        "files": {
            "/etc/hostname": "db-stage-01\n",
            "/var/lib/postgresql/14/PG_VERSION": "14\n"
        },
        "custom_commands": {
            "pg-status": "#!/bin/sh\necho online\n",
            "backup-db": {"path": "/opt/tools/backup-db", "content": "#!/bin/sh\nexit 0\n"}
        }
    })");
}

} // namespace

class MaterializerTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testDirectoriesCreatedAndIdempotent();
    void testFilesWritten();
    void testPasswdIncludesImplicitRoot();
    void testPasswdKeepsDeclaredRoot();
    void testCommandsAreExecutable();
    void testEscapingFileWritesNothing();
    void testSymlinkEscapeRejectedAtWriteTime();
    void testUserDb();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void MaterializerTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void MaterializerTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void MaterializerTests::testDirectoriesCreatedAndIdempotent()
{
    QTemporaryDir dir;
    const std::filesystem::path root = std::filesystem::path(dir.path().toStdString()) / "fs";
    const auto definition = sampleTemplate();

    honeyforge::materializeDirectories(definition, root);
    for (const auto &baseline : honeyforge::baselineDirectories()) {
        QVERIFY2(std::filesystem::is_directory(root / baseline), baseline.c_str());
    }
    QVERIFY(std::filesystem::is_directory(root / "var/lib/postgresql/14"));
    QVERIFY(std::filesystem::is_directory(root / "srv"));
    QVERIFY(std::filesystem::is_directory(root / "home/dba/.ssh"));
    QVERIFY(std::filesystem::is_directory(root / "home/backup/.ssh"));

    honeyforge::materializeDirectories(definition, root);
    QVERIFY(std::filesystem::is_directory(root / "var/lib/postgresql/14"));
}

void MaterializerTests::testFilesWritten()
{
    QTemporaryDir dir;
    const std::filesystem::path root(dir.path().toStdString());
    const auto definition = sampleTemplate();

    honeyforge::materializeTemplate(definition, root);
    QCOMPARE(readAll(root / "etc/hostname"), QByteArray("db-stage-01\n"));
    QCOMPARE(readAll(root / "var/lib/postgresql/14/PG_VERSION"), QByteArray("14\n"));

    // Second run overwrites with the same bytes.
    honeyforge::materializeFiles(definition, root);
    QCOMPARE(readAll(root / "etc/hostname"), QByteArray("db-stage-01\n"));
}

void MaterializerTests::testPasswdIncludesImplicitRoot()
{
    QTemporaryDir dir;
    const std::filesystem::path root(dir.path().toStdString());
    honeyforge::materializeTemplate(sampleTemplate(), root);

    const QByteArray expected =
        "root:x:0:0:root:/root:/bin/bash\n"
        "dba:x:1500:1500:Database Admin:/home/dba:/bin/bash\n"
        "backup:x:1000:1000:backup:/home/backup:/bin/bash\n";
    QCOMPARE(readAll(root / "etc/passwd"), expected);
}

void MaterializerTests::testPasswdKeepsDeclaredRoot()
{
    const auto definition = honeyforge::parseTemplate(R"({
        "users": {"root": {"password": "toor", "uid": 0, "home": "/root"}}
    })");
    const std::string passwd = honeyforge::buildPasswd(definition);
    QCOMPARE(QString::fromStdString(passwd),
             QStringLiteral("root:x:0:0:root:/root:/bin/bash\n"));
}

void MaterializerTests::testCommandsAreExecutable()
{
    QTemporaryDir dir;
    const std::filesystem::path commandsRoot =
        std::filesystem::path(dir.path().toStdString()) / "txtcmds";
    honeyforge::materializeCommands(sampleTemplate(), commandsRoot);

    const auto status = commandsRoot / "usr/local/bin/pg-status";
    QCOMPARE(readAll(status), QByteArray("#!/bin/sh\necho online\n"));
    const auto perms = std::filesystem::status(status).permissions();
    QCOMPARE(perms & std::filesystem::perms::all,
             std::filesystem::perms::owner_all
                 | std::filesystem::perms::group_read | std::filesystem::perms::group_exec
                 | std::filesystem::perms::others_read | std::filesystem::perms::others_exec);
    QVERIFY(std::filesystem::is_regular_file(commandsRoot / "opt/tools/backup-db"));
}

void MaterializerTests::testEscapingFileWritesNothing()
{
    QTemporaryDir dir;
    const std::filesystem::path base(dir.path().toStdString());
    const std::filesystem::path root = base / "fs";
    const auto definition = honeyforge::parseTemplate(R"({
        "filesystem": {"opt": {"app": {}}},
        "files": {
            "/etc/issue": "Ubuntu\n",
            "/../../outside.txt": "gotcha"
        }
    })");

    QCOMPARE(errorKindOf([&] { honeyforge::materializeTemplate(definition, root); }),
             std::optional<honeyforge::ErrorKind>(honeyforge::ErrorKind::PathViolation));
    QVERIFY(!std::filesystem::exists(base / "outside.txt"));
    QVERIFY(!std::filesystem::exists(root / "etc/issue"));
    QVERIFY(!std::filesystem::exists(root / "opt/app"));
}

void MaterializerTests::testSymlinkEscapeRejectedAtWriteTime()
{
    QTemporaryDir dir;
    QTemporaryDir outside;
    const std::filesystem::path root(dir.path().toStdString());
    std::filesystem::create_directories(root / "var");
    std::filesystem::create_directory_symlink(outside.path().toStdString(), root / "var/www");

    const auto definition = honeyforge::parseTemplate(R"({
        "files": {"/var/www/index.html": "<h1>It works</h1>"}
    })");

    QCOMPARE(errorKindOf([&] { honeyforge::materializeFiles(definition, root); }),
             std::optional<honeyforge::ErrorKind>(honeyforge::ErrorKind::PathViolation));
    QVERIFY(!QFile::exists(outside.path() + "/index.html"));
}

void MaterializerTests::testUserDb()
{
    QTemporaryDir dir;
    const std::filesystem::path path =
        std::filesystem::path(dir.path().toStdString()) / "config/userdb.txt";
    honeyforge::writeUserDb(sampleTemplate(), path);
    QCOMPARE(readAll(path), QByteArray("dba:x:s3cret\nbackup:x:b4ckup\n"));
}

QTEST_MAIN(MaterializerTests)
#include "test_materializer.moc"
