#include <QtTest/QtTest>

#include <QTemporaryDir>
#include <QFile>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

class LoggingTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testLogEventWrites();
    void testDebugSuppressedWithoutTrace();
    void testTraceWrites();
    void testCorrelationScope();
    void testRotationKeepsGenerations();
    void testLogDirOverride();
    void testNonUtf8ContextIsWritten();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    QString logPath(const QString &suffix) const;
};

void LoggingTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void LoggingTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

QString LoggingTests::logPath(const QString &suffix) const
{
    return m_tempDir.path() + "/.local/share/honeyforge/logs/honeyforge-test" + suffix;
}

void LoggingTests::testLogEventWrites()
{
    honeyforge::logging::initLogging(QStringLiteral("honeyforge-test"), false);

    honeyforge::logging::logEvent(honeyforge::logging::LogLevel::Info,
                                  QStringLiteral("honeyforge-test"),
                                  QStringLiteral("Test"),
                                  QStringLiteral("testLogEventWrites"),
                                  QStringLiteral("test_log"),
                                  QStringLiteral("unit_test"),
                                  QStringLiteral("direct_call"),
                                  honeyforge::logging::defaultWho(),
                                  QStringLiteral("corr-1"),
                                  nlohmann::json{{"key", "value"}});

    QFile file(logPath(QStringLiteral(".log")));
    QVERIFY(file.exists());
    QVERIFY(file.open(QIODevice::ReadOnly));
    const QByteArray line = file.readLine();
    QVERIFY(!line.trimmed().isEmpty());

    const auto parsed = nlohmann::json::parse(line.toStdString());
    QCOMPARE(QString::fromStdString(parsed.value("what", "")), QStringLiteral("test_log"));
    QCOMPARE(QString::fromStdString(parsed.value("corr", "")), QStringLiteral("corr-1"));
    QCOMPARE(QString::fromStdString(parsed.value("level", "")), QStringLiteral("INFO"));
    QCOMPARE(QString::fromStdString(parsed["context"].value("key", "")),
             QStringLiteral("value"));
}

void LoggingTests::testDebugSuppressedWithoutTrace()
{
    honeyforge::logging::initLogging(QStringLiteral("honeyforge-test"), false);
    QFile::remove(logPath(QStringLiteral(".log")));

    HFLOG_DEBUG(QStringLiteral("Test"),
                QStringLiteral("testDebugSuppressedWithoutTrace"),
                QStringLiteral("debug_only"),
                QStringLiteral("unit_test"),
                QStringLiteral("macro"),
                honeyforge::logging::defaultWho(),
                QString(),
                nlohmann::json::object());

    QVERIFY(!QFile::exists(logPath(QStringLiteral(".log"))));
}

void LoggingTests::testTraceWrites()
{
    honeyforge::logging::initLogging(QStringLiteral("honeyforge-test"), true);
    QVERIFY(honeyforge::logging::isTraceEnabled());

    honeyforge::logging::logEvent(honeyforge::logging::LogLevel::Debug,
                                  QStringLiteral("honeyforge-test"),
                                  QStringLiteral("Test"),
                                  QStringLiteral("testTraceWrites"),
                                  QStringLiteral("test_trace"),
                                  QStringLiteral("unit_test"),
                                  QStringLiteral("direct_call"),
                                  honeyforge::logging::defaultWho(),
                                  QStringLiteral("corr-2"),
                                  nlohmann::json::object());

    QFile file(logPath(QStringLiteral("-trace.log")));
    QVERIFY(file.exists());
    QVERIFY(file.open(QIODevice::ReadOnly));
    const QByteArray line = file.readLine();
    QVERIFY(!line.trimmed().isEmpty());
    honeyforge::logging::initLogging(QStringLiteral("honeyforge-test"), false);
}

void LoggingTests::testCorrelationScope()
{
    honeyforge::logging::setCorrelationId(QStringLiteral("outer"));
    {
        honeyforge::logging::CorrelationScope scope(QStringLiteral("deploy-1"));
        QCOMPARE(honeyforge::logging::currentCorrelationId(), QStringLiteral("deploy-1"));
    }
    QCOMPARE(honeyforge::logging::currentCorrelationId(), QStringLiteral("outer"));
    honeyforge::logging::setCorrelationId(QString());
}

void LoggingTests::testRotationKeepsGenerations()
{
    honeyforge::logging::initLogging(QStringLiteral("honeyforge-rotate"), false);
    const QString path = honeyforge::logging::logFilePath(QStringLiteral("honeyforge-rotate"), false);
    QVERIFY(QDir().mkpath(honeyforge::logging::logsDirPath()));

    {
        QFile older(path + ".1");
        QVERIFY(older.open(QIODevice::WriteOnly));
        older.write("older\n");
    }
    {
        QFile full(path);
        QVERIFY(full.open(QIODevice::WriteOnly));
        QVERIFY(full.resize(6 * 1024 * 1024));
    }

    HFLOG_WARN(QStringLiteral("Test"),
               QStringLiteral("testRotationKeepsGenerations"),
               QStringLiteral("after_rotation"),
               QStringLiteral("unit_test"),
               QStringLiteral("macro"),
               honeyforge::logging::defaultWho(),
               QString(),
               nlohmann::json::object());

    QCOMPARE(QFileInfo(path + ".1").size(), static_cast<qint64>(6 * 1024 * 1024));
    QFile shifted(path + ".2");
    QVERIFY(shifted.open(QIODevice::ReadOnly));
    QCOMPARE(shifted.readAll(), QByteArray("older\n"));

    QFile current(path);
    QVERIFY(current.open(QIODevice::ReadOnly));
    const auto parsed = nlohmann::json::parse(current.readLine().toStdString());
    QCOMPARE(QString::fromStdString(parsed.value("what", "")), QStringLiteral("after_rotation"));
}

void LoggingTests::testLogDirOverride()
{
    QTemporaryDir other;
    qputenv("HONEYFORGE_LOG_DIR", other.path().toUtf8());
    honeyforge::logging::initLogging(QStringLiteral("honeyforge-test"), false);

    HFLOG_ERROR(QStringLiteral("Test"),
                QStringLiteral("testLogDirOverride"),
                QStringLiteral("redirected"),
                QStringLiteral("unit_test"),
                QStringLiteral("macro"),
                honeyforge::logging::defaultWho(),
                QString(),
                nlohmann::json::object());
    qunsetenv("HONEYFORGE_LOG_DIR");

    QVERIFY(QFile::exists(other.path() + "/honeyforge-test.log"));
}

void LoggingTests::testNonUtf8ContextIsWritten()
{
    honeyforge::logging::initLogging(QStringLiteral("honeyforge-bytes"), false);
    const QString path = honeyforge::logging::logFilePath(QStringLiteral("honeyforge-bytes"), false);
    QFile::remove(path);

    HFLOG_WARN(QStringLiteral("Test"),
               QStringLiteral("testNonUtf8ContextIsWritten"),
               QStringLiteral("raw_name"),
               QStringLiteral("unit_test"),
               QStringLiteral("macro"),
               honeyforge::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"path", std::string("/srv/caf\xe9")}}));

    QFile file(path);
    QVERIFY(file.open(QIODevice::ReadOnly));
    const auto parsed = nlohmann::json::parse(file.readLine().toStdString());
    QCOMPARE(QString::fromStdString(parsed["context"].value("path", "")),
             QStringLiteral("/srv/caf\uFFFD"));
}

QTEST_MAIN(LoggingTests)
#include "test_logging.moc"
