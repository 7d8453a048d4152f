#include <QCoreApplication>

#include <iostream>
#include <vector>

#include "cli/ForgeCli.hpp"
#include "common/honeyforge_version.hpp"
#include "common/logging.hpp"

#include <nlohmann/json.hpp>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("honeyforge"));
    QCoreApplication::setApplicationVersion(QStringLiteral(HONEYFORGE_VERSION));

    bool trace = qEnvironmentVariableIntValue("HONEYFORGE_TRACE") == 1;
    QStringList filteredArgs;
    filteredArgs.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg == QStringLiteral("--trace")) {
            trace = true;
            continue;
        }
        filteredArgs.push_back(arg);
    }
    if (filteredArgs.contains(QStringLiteral("--version"))) {
        std::cout << "honeyforge " << HONEYFORGE_VERSION << std::endl;
        return 0;
    }

    honeyforge::logging::initLogging(QStringLiteral("honeyforge"), trace);
    HFLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("cli_start"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               honeyforge::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"args", filteredArgs.size()},
                               {"version", HONEYFORGE_VERSION}}));

    honeyforge::ForgeCli cli;
    std::vector<QByteArray> localArgs;
    std::vector<char *> rawArgs;
    for (const QString &arg : filteredArgs) {
        localArgs.push_back(arg.toLocal8Bit());
    }
    for (auto &arg : localArgs) {
        rawArgs.push_back(arg.data());
    }
    return cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());
}
