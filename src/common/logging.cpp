#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>

#include <unistd.h>

#include <cstdio>
#include <mutex>

namespace honeyforge::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;
constexpr int kRotatedGenerations = 3;

struct SinkState {
    std::mutex mutex;
    QString processName;
    bool traceEnabled = false;
};

SinkState &sink()
{
    static SinkState state;
    return state;
}

thread_local QString t_corrId;

const char *levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

QString rotatedName(const QString &path, int generation)
{
    return path + QLatin1Char('.') + QString::number(generation);
}

// <log>.1 is the newest rotated file; the oldest generation falls off.
void rotateIfNeeded(const QString &path)
{
    const QFileInfo info(path);
    if (!info.exists() || info.size() < kMaxLogSizeBytes) {
        return;
    }

    QFile::remove(rotatedName(path, kRotatedGenerations));
    for (int generation = kRotatedGenerations - 1; generation >= 1; --generation) {
        const QString from = rotatedName(path, generation);
        if (QFile::exists(from)) {
            QFile::rename(from, rotatedName(path, generation + 1));
        }
    }
    QFile::rename(path, rotatedName(path, 1));
}

// Caller holds the sink mutex.
void appendLine(const QString &path, const QByteArray &line)
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    rotateIfNeeded(path);

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append)) {
        std::fprintf(stderr, "%s\n", line.constData());
        return;
    }
    file.write(line);
    file.write("\n", 1);
}

std::string threadTag()
{
    return QStringLiteral("0x%1")
        .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16)
        .toStdString();
}

} // namespace

QString dataDirPath(const QString &leaf)
{
    const QString home = qEnvironmentVariable("HOME");
    const QString base = home.isEmpty()
        ? QStringLiteral(".local/share/honeyforge")
        : home + QStringLiteral("/.local/share/honeyforge");
    return leaf.isEmpty() ? base : base + QLatin1Char('/') + leaf;
}

QString logsDirPath()
{
    const QString fromEnv = qEnvironmentVariable("HONEYFORGE_LOG_DIR");
    return fromEnv.isEmpty() ? dataDirPath(QStringLiteral("logs")) : fromEnv;
}

QString logFilePath(const QString &processName, bool trace)
{
    const QString base = processName.isEmpty() ? QStringLiteral("honeyforge") : processName;
    return logsDirPath() + QLatin1Char('/') + base
        + (trace ? QStringLiteral("-trace.log") : QStringLiteral(".log"));
}

void initLogging(const QString &processName, bool traceEnabled)
{
    SinkState &state = sink();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.processName = processName;
    state.traceEnabled = traceEnabled;
}

bool isTraceEnabled()
{
    SinkState &state = sink();
    std::lock_guard<std::mutex> lock(state.mutex);
    return state.traceEnabled;
}

void setCorrelationId(const QString &corrId)
{
    t_corrId = corrId;
}

QString currentCorrelationId()
{
    return t_corrId;
}

CorrelationScope::CorrelationScope(const QString &corrId)
    : m_prev(t_corrId)
{
    t_corrId = corrId;
}

CorrelationScope::~CorrelationScope()
{
    t_corrId = m_prev;
}

QString defaultProcessName()
{
    {
        SinkState &state = sink();
        std::lock_guard<std::mutex> lock(state.mutex);
        if (!state.processName.isEmpty()) {
            return state.processName;
        }
    }
    if (QCoreApplication::instance() && !QCoreApplication::applicationName().isEmpty()) {
        return QCoreApplication::applicationName();
    }
    return QStringLiteral("honeyforge");
}

QString defaultWho()
{
    char hostname[256] = {};
    if (gethostname(hostname, sizeof(hostname) - 1) != 0) {
        hostname[0] = '\0';
    }
    return QStringLiteral("host:%1,uid:%2")
        .arg(QString::fromUtf8(hostname))
        .arg(static_cast<qulonglong>(getuid()));
}

void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context)
{
    if (level == LogLevel::Debug && !isTraceEnabled()) {
        return;
    }

    const QString process = processName.isEmpty() ? defaultProcessName() : processName;
    const QString corr = correlationId.isEmpty() ? currentCorrelationId() : correlationId;

    const nlohmann::json record = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelName(level)},
        {"process", process.toStdString()},
        {"pid", static_cast<long long>(getpid())},
        {"thread", threadTag()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", corr.toStdString()},
        {"context", context}
    };
    // Context may carry raw filesystem names; invalid UTF-8 becomes U+FFFD.
    const QByteArray line = QByteArray::fromStdString(
        record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));

    SinkState &state = sink();
    std::lock_guard<std::mutex> lock(state.mutex);
    if (level == LogLevel::Debug && !state.traceEnabled) {
        return;
    }
    appendLine(logFilePath(process, false), line);
    if (state.traceEnabled) {
        appendLine(logFilePath(process, true), line);
    }
}

} // namespace honeyforge::logging
