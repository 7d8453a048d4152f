#include "forge/deployment.hpp"

#include <chrono>
#include <system_error>

#include <QByteArray>
#include <QFile>
#include <QString>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "forge/materializer.hpp"
#include "snapshot/snapshot_entry.hpp"

namespace honeyforge {

namespace {

constexpr const char *kSnapshotFileName = "fs.hfsnap";

void requireDeploymentName(const std::string &name)
{
    if (name.empty() || name == "." || name == ".."
        || name.find('/') != std::string::npos) {
        throw ForgeError(ErrorKind::PathViolation,
                         "invalid deployment name: '" + name + "'");
    }
}

void makeDirectory(const std::filesystem::path &path)
{
    std::error_code error;
    std::filesystem::create_directories(path, error);
    if (error) {
        throw ForgeError(ErrorKind::IOFailure,
                         "cannot create " + path.string() + ": " + error.message());
    }
}

void writeJsonFile(const std::filesystem::path &path, const nlohmann::json &payload)
{
    QFile file(QString::fromStdString(path.string()));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        throw ForgeError(ErrorKind::IOFailure,
                         "cannot open " + path.string() + ": "
                             + file.errorString().toStdString());
    }
    const QByteArray data = QByteArray::fromStdString(payload.dump(2));
    if (file.write(data) != data.size()) {
        throw ForgeError(ErrorKind::IOFailure, "short write to " + path.string());
    }
}

nlohmann::json buildMetadata(const TemplateDefinition &definition,
                             const DeploymentResult &result)
{
    nlohmann::json users = nlohmann::json::object();
    for (const auto &user : definition.users) {
        users[user.username] = user.password;
    }
    return nlohmann::json{
        {"name", result.deploymentName},
        {"template", definition.metadata.name},
        {"template_id", result.templateId},
        {"hostname", definition.configuration.hostname},
        {"ssh_banner", definition.configuration.sshBanner},
        {"timezone", definition.configuration.timezone},
        {"category", definition.metadata.category},
        {"version", definition.metadata.version},
        {"users", users},
        {"snapshot", result.layout.snapshotPath.string()},
        {"snapshot_entries", result.snapshotEntries},
        {"skipped_entries", result.skipped.size()},
        {"created", toIso8601Utc(std::chrono::system_clock::now())}
    };
}

} // namespace

DeploymentLayout deploymentLayout(const std::filesystem::path &deploymentDir)
{
    DeploymentLayout layout;
    layout.root = deploymentDir;
    layout.honeyfs = deploymentDir / "honeyfs";
    layout.txtcmds = deploymentDir / "txtcmds";
    layout.share = deploymentDir / "share";
    layout.config = deploymentDir / "config";
    layout.logDir = deploymentDir / "log";
    layout.downloads = deploymentDir / "downloads";
    layout.snapshotPath = layout.share / kSnapshotFileName;
    layout.userDbPath = layout.config / "userdb.txt";
    layout.metadataPath = deploymentDir / "metadata.json";
    return layout;
}

DeploymentBuilder::DeploymentBuilder(const TemplateLibrary &library,
                                     std::filesystem::path deploymentsBase,
                                     SnapshotOptions snapshotOptions)
    : m_library(library)
    , m_base(std::move(deploymentsBase))
    , m_snapshotOptions(std::move(snapshotOptions))
{
}

DeploymentResult DeploymentBuilder::build(const std::string &templateId,
                                          const std::string &deploymentName) const
{
    logging::CorrelationScope scope(QString::fromStdString(deploymentName));

    DeploymentResult result;
    result.deploymentName = deploymentName;
    result.templateId = templateId;

    try {
        requireDeploymentName(deploymentName);
        result.layout = deploymentLayout(m_base / deploymentName);

        const TemplateDefinition *definition = m_library.get(templateId);
        if (!definition) {
            throw ForgeError(ErrorKind::SourceNotFound,
                             "template '" + templateId + "' not found in library");
        }
        buildInto(*definition, result);
        result.success = true;
    } catch (const ForgeError &ex) {
        result.errorKind = ex.kind();
        result.errorMessage = ex.what();
    } catch (const std::exception &ex) {
        result.errorKind = ErrorKind::IOFailure;
        result.errorMessage = ex.what();
    }

    if (!result.success) {
        HFLOG_ERROR(QStringLiteral("DeploymentBuilder"),
                    QStringLiteral("build"),
                    QStringLiteral("deployment_failed"),
                    QString::fromStdString(toErrorKindString(*result.errorKind)),
                    QStringLiteral("abort"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"template", templateId},
                                    {"error", result.errorMessage}}));
        return result;
    }

    HFLOG_INFO(QStringLiteral("DeploymentBuilder"),
               QStringLiteral("build"),
               QStringLiteral("deployment_built"),
               QStringLiteral("user_invocation"),
               QStringLiteral("materialize_then_snapshot"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"template", templateId},
                               {"dir", result.layout.root.string()},
                               {"entries", result.snapshotEntries},
                               {"skipped", result.skipped.size()}}));
    return result;
}

void DeploymentBuilder::buildInto(const TemplateDefinition &definition,
                                  DeploymentResult &result) const
{
    const DeploymentLayout &layout = result.layout;

    // Every declared path is checked before the first directory exists.
    validateTargets(definition, layout.honeyfs);
    validateCommandTargets(definition, layout.txtcmds);

    for (const auto &dir : {layout.honeyfs, layout.txtcmds, layout.share,
                            layout.config, layout.logDir / "tty", layout.downloads}) {
        makeDirectory(dir);
    }

    materializeTemplate(definition, layout.honeyfs);
    materializeCommands(definition, layout.txtcmds);
    writeUserDb(definition, layout.userDbPath);

    const SnapshotSerializer serializer(m_snapshotOptions);
    SnapshotResult snapshot = serializer.serialize(layout.honeyfs, layout.snapshotPath);
    result.snapshotEntries = countEntries(snapshot.root);
    result.skipped = std::move(snapshot.skipped);

    try {
        writeJsonFile(layout.metadataPath, buildMetadata(definition, result));
    } catch (const ForgeError &) {
        std::error_code error;
        std::filesystem::remove(layout.snapshotPath, error);
        throw;
    }
}

} // namespace honeyforge
