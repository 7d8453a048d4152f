#include "forge/materializer.hpp"

#include <system_error>

#include <QByteArray>
#include <QFile>
#include <QString>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "common/path_utils.hpp"

namespace honeyforge {

namespace {

constexpr const char *kPasswdPath = "/etc/passwd";

const QFileDevice::Permissions kExecutablePermissions =
    QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ExeOwner
    | QFileDevice::ReadGroup | QFileDevice::ExeGroup
    | QFileDevice::ReadOther | QFileDevice::ExeOther;

void collectTreeTargets(const std::vector<DirNode> &nodes,
                        const std::string &parent,
                        std::vector<std::string> &out)
{
    for (const auto &node : nodes) {
        const std::string path = joinVirtualPath(parent, node.name);
        out.push_back(path);
        collectTreeTargets(node.children, path, out);
    }
}

std::vector<std::string> directoryTargets(const TemplateDefinition &definition)
{
    std::vector<std::string> targets;
    for (const auto &dir : baselineDirectories()) {
        targets.push_back("/" + dir);
    }
    collectTreeTargets(definition.directoryTree, "/", targets);
    for (const auto &user : definition.users) {
        targets.push_back(user.home);
        targets.push_back(joinVirtualPath(user.home, ".ssh"));
    }
    return targets;
}

void createDirectory(const std::filesystem::path &root,
                     const std::filesystem::path &target)
{
    ensureInsideRoot(root, target);
    std::error_code error;
    std::filesystem::create_directories(target, error);
    if (error) {
        throw ForgeError(ErrorKind::IOFailure,
                         "cannot create directory " + target.string() + ": "
                             + error.message());
    }
}

void writeTextFile(const std::filesystem::path &root,
                   const std::filesystem::path &target,
                   const std::string &content)
{
    ensureInsideRoot(root, target);
    createDirectory(root, target.parent_path());

    QFile file(QString::fromStdString(target.string()));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        throw ForgeError(ErrorKind::IOFailure,
                         "cannot open " + target.string() + ": "
                             + file.errorString().toStdString());
    }
    const QByteArray data = QByteArray::fromStdString(content);
    if (file.write(data) != data.size()) {
        throw ForgeError(ErrorKind::IOFailure,
                         "short write to " + target.string() + ": "
                             + file.errorString().toStdString());
    }
}

void ensureRootExists(const std::filesystem::path &root)
{
    std::error_code error;
    std::filesystem::create_directories(root, error);
    if (error) {
        throw ForgeError(ErrorKind::IOFailure,
                         "cannot create root " + root.string() + ": " + error.message());
    }
}

bool declaresRootUser(const TemplateDefinition &definition)
{
    for (const auto &user : definition.users) {
        if (user.username == "root") {
            return true;
        }
    }
    return false;
}

} // namespace

const std::vector<std::string> &baselineDirectories()
{
    static const std::vector<std::string> dirs = {
        "proc", "sys", "dev", "run", "tmp",
        "usr/bin", "usr/sbin", "usr/local/bin",
        "sbin", "lib", "bin", "etc", "var/log",
        "opt", "home", "root",
    };
    return dirs;
}

void validateTargets(const TemplateDefinition &definition,
                     const std::filesystem::path &root)
{
    for (const auto &target : directoryTargets(definition)) {
        safeJoin(root, target);
    }
    safeJoin(root, kPasswdPath);
    for (const auto &file : definition.fileContents) {
        safeJoin(root, file.path);
    }
}

void validateCommandTargets(const TemplateDefinition &definition,
                            const std::filesystem::path &commandsRoot)
{
    for (const auto &command : definition.customCommands) {
        safeJoin(commandsRoot, command.path);
    }
}

void materializeDirectories(const TemplateDefinition &definition,
                            const std::filesystem::path &root)
{
    const auto targets = directoryTargets(definition);
    std::vector<std::filesystem::path> joined;
    joined.reserve(targets.size());
    for (const auto &target : targets) {
        joined.push_back(safeJoin(root, target));
    }

    ensureRootExists(root);
    for (const auto &path : joined) {
        createDirectory(root, path);
    }

    HFLOG_INFO(QStringLiteral("Materializer"),
               QStringLiteral("materializeDirectories"),
               QStringLiteral("directories_created"),
               QStringLiteral("template_materialization"),
               QStringLiteral("create_directories"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"root", root.string()},
                               {"directories", joined.size()}}));
}

void materializeFiles(const TemplateDefinition &definition,
                      const std::filesystem::path &root)
{
    const auto passwdPath = safeJoin(root, kPasswdPath);
    std::vector<std::filesystem::path> joined;
    joined.reserve(definition.fileContents.size());
    for (const auto &file : definition.fileContents) {
        joined.push_back(safeJoin(root, file.path));
    }

    ensureRootExists(root);
    writeTextFile(root, passwdPath, buildPasswd(definition));
    for (size_t i = 0; i < joined.size(); ++i) {
        writeTextFile(root, joined[i], definition.fileContents[i].content);
    }

    HFLOG_INFO(QStringLiteral("Materializer"),
               QStringLiteral("materializeFiles"),
               QStringLiteral("files_written"),
               QStringLiteral("template_materialization"),
               QStringLiteral("overwrite"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"root", root.string()},
                               {"files", joined.size() + 1},
                               {"users", definition.users.size()}}));
}

void materializeCommands(const TemplateDefinition &definition,
                         const std::filesystem::path &commandsRoot)
{
    std::vector<std::filesystem::path> joined;
    joined.reserve(definition.customCommands.size());
    for (const auto &command : definition.customCommands) {
        joined.push_back(safeJoin(commandsRoot, command.path));
    }

    ensureRootExists(commandsRoot);
    for (size_t i = 0; i < joined.size(); ++i) {
        writeTextFile(commandsRoot, joined[i], definition.customCommands[i].script);
        if (!QFile::setPermissions(QString::fromStdString(joined[i].string()),
                                   kExecutablePermissions)) {
            throw ForgeError(ErrorKind::IOFailure,
                             "cannot mark executable: " + joined[i].string());
        }
    }

    HFLOG_INFO(QStringLiteral("Materializer"),
               QStringLiteral("materializeCommands"),
               QStringLiteral("commands_written"),
               QStringLiteral("template_materialization"),
               QStringLiteral("chmod_0755"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"root", commandsRoot.string()},
                               {"commands", joined.size()}}));
}

void materializeTemplate(const TemplateDefinition &definition,
                         const std::filesystem::path &root)
{
    validateTargets(definition, root);
    materializeDirectories(definition, root);
    materializeFiles(definition, root);
}

std::string buildPasswd(const TemplateDefinition &definition)
{
    std::string passwd;
    if (!declaresRootUser(definition)) {
        passwd += "root:x:0:0:root:/root:/bin/bash\n";
    }
    for (const auto &user : definition.users) {
        passwd += user.username + ":x:" + std::to_string(user.uid) + ":"
            + std::to_string(user.gid) + ":" + user.gecos + ":" + user.home + ":"
            + user.shell + "\n";
    }
    return passwd;
}

std::string buildUserDb(const TemplateDefinition &definition)
{
    std::string userDb;
    for (const auto &user : definition.users) {
        userDb += user.username + ":x:" + user.password + "\n";
    }
    return userDb;
}

void writeUserDb(const TemplateDefinition &definition,
                 const std::filesystem::path &path)
{
    const auto parent = path.parent_path().empty()
        ? std::filesystem::path(".")
        : path.parent_path();
    ensureRootExists(parent);
    writeTextFile(parent, path, buildUserDb(definition));
}

} // namespace honeyforge
