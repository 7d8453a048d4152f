#include "cli/ForgeCli.hpp"

#include <iostream>
#include <string>
#include <vector>

#include <QCoreApplication>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "forge/deployment.hpp"
#include "forge/materializer.hpp"
#include "forge/template_library.hpp"
#include "forge/template_loader.hpp"
#include "snapshot/snapshot_codec.hpp"
#include "snapshot/snapshot_entry.hpp"
#include "snapshot/snapshot_serializer.hpp"

namespace honeyforge {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  honeyforge list [--templates DIR] [--category NAME] [--format text|json]\n"
        "  honeyforge materialize --template PATH --root DIR [--commands-root DIR]\n"
        "  honeyforge snapshot --source DIR --out PATH [--max-depth N] [--exclude GLOB]...\n"
        "                      [--no-default-excludes] [--encoding json|cbor]\n"
        "  honeyforge inspect --snapshot PATH [--format text|json]\n"
        "  honeyforge deploy --template-id ID --name NAME [--templates DIR] [--out DIR]\n"
        "  honeyforge export --template PATH --out PATH\n");
}

QString defaultTemplatesDir()
{
    const QString fromEnv = qEnvironmentVariable("HONEYFORGE_TEMPLATES_DIR");
    return fromEnv.isEmpty() ? logging::dataDirPath(QStringLiteral("templates")) : fromEnv;
}

QString defaultDeploymentsDir()
{
    const QString fromEnv = qEnvironmentVariable("HONEYFORGE_DEPLOY_DIR");
    return fromEnv.isEmpty() ? logging::dataDirPath(QStringLiteral("deployments")) : fromEnv;
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

QStringList getArgValues(const QStringList &args, const QString &key)
{
    QStringList values;
    for (int i = 0; i + 1 < args.size(); ++i) {
        if (args.at(i) == key) {
            values.push_back(args.at(i + 1));
        }
    }
    return values;
}

QString getFormat(const QStringList &args)
{
    const QString value = getArgValue(args, QStringLiteral("--format"));
    if (value.isEmpty()) {
        return QStringLiteral("text");
    }
    return value.toLower();
}

std::filesystem::path toPath(const QString &value)
{
    return std::filesystem::path(value.toStdString());
}

void reportFailure(const char *where, ErrorKind kind, const char *message)
{
    std::cerr << "Error (" << toErrorKindString(kind) << "): " << message << std::endl;
    HFLOG_ERROR(QStringLiteral("ForgeCli"),
                QString::fromLatin1(where),
                QStringLiteral("command_failed"),
                QString::fromStdString(toErrorKindString(kind)),
                QStringLiteral("cli"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"error", message}}));
}

void reportFailure(const char *where, const ForgeError &ex)
{
    reportFailure(where, ex.kind(), ex.what());
}

std::string typeMarker(const SnapshotEntry &entry)
{
    switch (entry.type) {
    case EntryType::Directory:
        return "d";
    case EntryType::Symlink:
        return "l";
    case EntryType::BlockDevice:
        return "b";
    case EntryType::CharDevice:
        return "c";
    case EntryType::Socket:
        return "s";
    case EntryType::Fifo:
        return "p";
    case EntryType::RegularFile:
        return "-";
    }
    return "-";
}

void renderTree(const SnapshotEntry &entry, int indent)
{
    std::cout << std::string(static_cast<size_t>(indent) * 2, ' ') << typeMarker(entry) << " "
              << entry.name;
    if (const auto *target = linkTargetOf(entry)) {
        std::cout << " -> " << *target;
    }
    std::cout << "  [" << entry.uid << ":" << entry.gid << " mode=" << std::oct
              << entry.mode << std::dec << " size=" << entry.size << "]\n";
    if (const auto *children = childrenOf(entry)) {
        for (const auto &child : *children) {
            renderTree(child, indent + 1);
        }
    }
}

} // namespace

int ForgeCli::run(int argc, char *argv[])
{
    // CLI entry: parse the subcommand and delegate to its handler.
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString command = args.at(1);
    HFLOG_INFO(QStringLiteral("ForgeCli"),
               QStringLiteral("run"),
               QStringLiteral("cli_command"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               logging::defaultWho(),
               QString(),
               nlohmann::json{{"command", command.toStdString()}});
    if (command == QStringLiteral("list")) {
        return runList(args);
    }
    if (command == QStringLiteral("materialize")) {
        return runMaterialize(args);
    }
    if (command == QStringLiteral("snapshot")) {
        return runSnapshot(args);
    }
    if (command == QStringLiteral("inspect")) {
        return runInspect(args);
    }
    if (command == QStringLiteral("deploy")) {
        return runDeploy(args);
    }
    if (command == QStringLiteral("export")) {
        return runExport(args);
    }

    std::cerr << usageText().toStdString();
    return 1;
}

int ForgeCli::runList(const QStringList &args)
{
    QString templatesDir = getArgValue(args, QStringLiteral("--templates"));
    if (templatesDir.isEmpty()) {
        templatesDir = defaultTemplatesDir();
    }
    const QString category = getArgValue(args, QStringLiteral("--category"));
    const QString format = getFormat(args);
    if (format != QStringLiteral("text") && format != QStringLiteral("json")) {
        std::cerr << "Invalid format. Use text or json." << std::endl;
        return 1;
    }

    TemplateLibrary library(toPath(templatesDir));
    const auto summaries = category.isEmpty()
        ? library.list()
        : library.byCategory(category.toStdString());

    if (format == QStringLiteral("json")) {
        nlohmann::json payload = nlohmann::json::array();
        for (const auto &summary : summaries) {
            payload.push_back(nlohmann::json{{"id", summary.id},
                                              {"name", summary.name},
                                              {"description", summary.description},
                                              {"category", summary.category},
                                              {"version", summary.version}});
        }
        std::cout << payload.dump(2) << std::endl;
        return 0;
    }

    if (summaries.empty()) {
        std::cout << "No templates in " << templatesDir.toStdString() << "\n";
        return 0;
    }
    for (const auto &summary : summaries) {
        std::cout << summary.id << "  " << summary.name << " (" << summary.category
                  << ", v" << summary.version << ")\n";
        if (!summary.description.empty()) {
            std::cout << "    " << summary.description << "\n";
        }
    }
    return 0;
}

int ForgeCli::runMaterialize(const QStringList &args)
{
    const QString templatePath = getArgValue(args, QStringLiteral("--template"));
    const QString rootValue = getArgValue(args, QStringLiteral("--root"));
    const QString commandsRoot = getArgValue(args, QStringLiteral("--commands-root"));

    if (templatePath.isEmpty() || rootValue.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    try {
        const TemplateDefinition definition = loadTemplate(templatePath.toStdString());
        validateTargets(definition, toPath(rootValue));
        if (!commandsRoot.isEmpty()) {
            validateCommandTargets(definition, toPath(commandsRoot));
        }

        materializeTemplate(definition, toPath(rootValue));
        if (!commandsRoot.isEmpty()) {
            materializeCommands(definition, toPath(commandsRoot));
        }

        std::cout << "Materialized '" << definition.metadata.name << "' into "
                  << rootValue.toStdString() << "\n";
    } catch (const ForgeError &ex) {
        reportFailure("runMaterialize", ex);
        return 1;
    } catch (const std::exception &ex) {
        reportFailure("runMaterialize", ErrorKind::IOFailure, ex.what());
        return 1;
    }
    return 0;
}

int ForgeCli::runSnapshot(const QStringList &args)
{
    const QString source = getArgValue(args, QStringLiteral("--source"));
    const QString outPath = getArgValue(args, QStringLiteral("--out"));

    if (source.isEmpty() || outPath.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    SnapshotOptions options;
    if (args.contains(QStringLiteral("--no-default-excludes"))) {
        options.exclusionPatterns.clear();
    }
    for (const QString &pattern : getArgValues(args, QStringLiteral("--exclude"))) {
        options.exclusionPatterns.push_back(pattern.toStdString());
    }

    const QString depthValue = getArgValue(args, QStringLiteral("--max-depth"));
    if (!depthValue.isEmpty()) {
        bool ok = false;
        const int depth = depthValue.toInt(&ok);
        if (!ok || depth < 0) {
            std::cerr << "Invalid --max-depth. Use a non-negative integer." << std::endl;
            return 1;
        }
        options.maxDepth = depth;
    }

    const QString encoding = getArgValue(args, QStringLiteral("--encoding")).toLower();
    if (encoding == QStringLiteral("cbor")) {
        options.encoding = SnapshotEncoding::Cbor;
    } else if (!encoding.isEmpty() && encoding != QStringLiteral("json")) {
        std::cerr << "Invalid encoding. Use json or cbor." << std::endl;
        return 1;
    }

    try {
        const SnapshotSerializer serializer(options);
        const SnapshotResult result = serializer.serialize(toPath(source), toPath(outPath));
        std::cout << "Wrote " << countEntries(result.root) << " entries to "
                  << outPath.toStdString() << " (" << result.skipped.size()
                  << " skipped)\n";
        for (const auto &skipped : result.skipped) {
            std::cout << "  skipped " << skipped.virtualPath << ": "
                      << toSkipReasonString(skipped.reason) << "\n";
        }
    } catch (const ForgeError &ex) {
        reportFailure("runSnapshot", ex);
        return 1;
    } catch (const std::exception &ex) {
        reportFailure("runSnapshot", ErrorKind::IOFailure, ex.what());
        return 1;
    }
    return 0;
}

int ForgeCli::runInspect(const QStringList &args)
{
    const QString snapshotPath = getArgValue(args, QStringLiteral("--snapshot"));
    if (snapshotPath.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    const QString format = getFormat(args);
    if (format != QStringLiteral("text") && format != QStringLiteral("json")) {
        std::cerr << "Invalid format. Use text or json." << std::endl;
        return 1;
    }

    try {
        const SnapshotEntry root = readSnapshotFile(toPath(snapshotPath));
        if (format == QStringLiteral("json")) {
            nlohmann::json payload;
            payload["entries"] = countEntries(root);
            payload["root"] = root;
            // Artifacts from other writers may hold names that are not UTF-8.
            std::cout << payload.dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
                      << std::endl;
        } else {
            renderTree(root, 0);
            std::cout << countEntries(root) << " entries\n";
        }
    } catch (const ForgeError &ex) {
        reportFailure("runInspect", ex);
        return 1;
    } catch (const std::exception &ex) {
        reportFailure("runInspect", ErrorKind::IOFailure, ex.what());
        return 1;
    }
    return 0;
}

int ForgeCli::runDeploy(const QStringList &args)
{
    const QString templateId = getArgValue(args, QStringLiteral("--template-id"));
    const QString name = getArgValue(args, QStringLiteral("--name"));
    if (templateId.isEmpty() || name.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    QString templatesDir = getArgValue(args, QStringLiteral("--templates"));
    if (templatesDir.isEmpty()) {
        templatesDir = defaultTemplatesDir();
    }
    QString outDir = getArgValue(args, QStringLiteral("--out"));
    if (outDir.isEmpty()) {
        outDir = defaultDeploymentsDir();
    }

    TemplateLibrary library(toPath(templatesDir));
    DeploymentBuilder builder(library, toPath(outDir));
    const DeploymentResult result = builder.build(templateId.toStdString(),
                                                  name.toStdString());
    if (!result.success) {
        std::cerr << "Deployment failed ("
                  << toErrorKindString(result.errorKind.value_or(ErrorKind::IOFailure))
                  << "): " << result.errorMessage << std::endl;
        return 1;
    }

    std::cout << "Deployment '" << result.deploymentName << "' ready in "
              << result.layout.root.string() << "\n"
              << "  snapshot: " << result.layout.snapshotPath.string() << " ("
              << result.snapshotEntries << " entries, " << result.skipped.size()
              << " skipped)\n";
    return 0;
}

int ForgeCli::runExport(const QStringList &args)
{
    const QString templatePath = getArgValue(args, QStringLiteral("--template"));
    const QString outPath = getArgValue(args, QStringLiteral("--out"));
    if (templatePath.isEmpty() || outPath.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    try {
        const TemplateDefinition definition = loadTemplate(templatePath.toStdString());
        exportTemplate(definition, toPath(outPath));
        std::cout << "Exported '" << definition.metadata.name << "' to "
                  << outPath.toStdString() << "\n";
    } catch (const ForgeError &ex) {
        reportFailure("runExport", ex);
        return 1;
    } catch (const std::exception &ex) {
        reportFailure("runExport", ErrorKind::IOFailure, ex.what());
        return 1;
    }
    return 0;
}

} // namespace honeyforge
