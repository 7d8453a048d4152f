#include "forge/template_loader.hpp"

#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

#include "common/errors.hpp"

namespace honeyforge {

namespace {

// Deepest directory nesting accepted in a definition.
constexpr int kMaxTreeDepth = 64;
constexpr int kFirstAssignedId = 1000;

const char *kDefaultCommandScript = "#!/bin/bash\necho \"Command not implemented\"";

[[noreturn]] void parseFail(const std::string &message)
{
    throw ForgeError(ErrorKind::ParseError, message);
}

const nlohmann::ordered_json &sectionOrEmpty(const nlohmann::ordered_json &document,
                                             const char *key)
{
    static const nlohmann::ordered_json kEmpty = nlohmann::ordered_json::object();
    auto it = document.find(key);
    if (it == document.end() || it->is_null()) {
        return kEmpty;
    }
    if (!it->is_object()) {
        parseFail(std::string("section '") + key + "' must be an object");
    }
    return *it;
}

std::string stringField(const nlohmann::ordered_json &object,
                        const char *key,
                        const std::string &fallback,
                        const std::string &context)
{
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return fallback;
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    if (it->is_number()) {
        return it->dump();
    }
    parseFail(context + "." + key + " must be a string");
}

std::optional<int> intField(const nlohmann::ordered_json &object,
                            const char *key,
                            const std::string &context)
{
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_number_integer()) {
        parseFail(context + "." + key + " must be an integer");
    }
    const auto value = it->get<int64_t>();
    if (value < 0 || value > 0x7fffffff) {
        parseFail(context + "." + key + " is out of range");
    }
    return static_cast<int>(value);
}

void requireRooted(const std::string &path, const std::string &context)
{
    if (path.empty() || path.front() != '/') {
        parseFail(context + " path must start with '/': " + path);
    }
}

std::vector<DirNode> parseDirectoryTree(const nlohmann::ordered_json &node,
                                        const std::string &context,
                                        int depth)
{
    std::vector<DirNode> result;
    if (node.is_null()) {
        return result;
    }
    if (!node.is_object()) {
        parseFail(context + " must be a mapping of directory names");
    }
    if (depth > kMaxTreeDepth) {
        parseFail(context + " nests deeper than " + std::to_string(kMaxTreeDepth));
    }

    for (const auto &item : node.items()) {
        const std::string &name = item.key();
        if (name.empty() || name == "." || name == ".."
            || name.find('/') != std::string::npos) {
            parseFail(context + " has an invalid directory name '" + name + "'");
        }
        DirNode dir;
        dir.name = name;
        dir.children = parseDirectoryTree(item.value(), context + "/" + name, depth + 1);
        result.push_back(std::move(dir));
    }
    return result;
}

std::vector<UserAccount> parseUsers(const nlohmann::ordered_json &section)
{
    std::vector<UserAccount> users;
    int nextId = kFirstAssignedId;

    std::set<int64_t> declaredUids;
    for (const auto &item : section.items()) {
        const auto &value = item.value();
        if (value.is_object() && value.contains("uid") && value.at("uid").is_number_integer()) {
            declaredUids.insert(value.at("uid").get<int64_t>());
        }
    }

    for (const auto &item : section.items()) {
        const std::string context = "users." + item.key();
        if (item.key().empty() || item.key().find_first_of(":\n/") != std::string::npos) {
            parseFail(context + " is not a valid username");
        }

        UserAccount user;
        user.username = item.key();
        const auto &value = item.value();

        std::optional<int> uid;
        std::optional<int> gid;
        if (value.is_object()) {
            user.password = stringField(value, "password", "password123", context);
            uid = intField(value, "uid", context);
            gid = intField(value, "gid", context);
            user.home = stringField(value, "home", "/home/" + user.username, context);
            user.shell = stringField(value, "shell", "/bin/bash", context);
            user.gecos = stringField(value, "gecos",
                                     stringField(value, "description", user.username, context),
                                     context);
        } else if (value.is_string() || value.is_number()) {
            user.password = value.is_string() ? value.get<std::string>() : value.dump();
            user.home = "/home/" + user.username;
            user.shell = "/bin/bash";
            user.gecos = user.username;
        } else {
            parseFail(context + " must be a password or an object");
        }

        if (!uid.has_value()) {
            while (declaredUids.count(nextId) > 0) {
                ++nextId;
            }
            uid = nextId++;
        }
        user.uid = *uid;
        user.gid = gid.value_or(*uid);
        requireRooted(user.home, context + ".home");
        users.push_back(std::move(user));
    }
    return users;
}

std::vector<FileContent> parseFiles(const nlohmann::ordered_json &section)
{
    std::vector<FileContent> files;
    for (const auto &item : section.items()) {
        const std::string context = "files." + item.key();
        requireRooted(item.key(), context);

        FileContent file;
        file.path = item.key();
        const auto &value = item.value();
        if (value.is_object()) {
            file.content = stringField(value, "content", "", context);
        } else if (value.is_string()) {
            file.content = value.get<std::string>();
        } else if (value.is_null()) {
            file.content.clear();
        } else {
            parseFail(context + " must be text or an object with content");
        }
        files.push_back(std::move(file));
    }
    return files;
}

std::vector<CustomCommand> parseCommands(const nlohmann::ordered_json &section)
{
    std::vector<CustomCommand> commands;
    for (const auto &item : section.items()) {
        const std::string context = "custom_commands." + item.key();
        if (item.key().empty() || item.key().find('/') != std::string::npos) {
            parseFail(context + " is not a valid command name");
        }

        CustomCommand command;
        command.name = item.key();
        const std::string defaultPath = "/usr/local/bin/" + command.name;
        const auto &value = item.value();
        if (value.is_object()) {
            command.path = stringField(value, "path", defaultPath, context);
            command.script = stringField(value, "content", kDefaultCommandScript, context);
        } else if (value.is_string()) {
            command.path = defaultPath;
            command.script = value.get<std::string>();
        } else {
            parseFail(context + " must be a script or an object");
        }
        requireRooted(command.path, context);
        commands.push_back(std::move(command));
    }
    return commands;
}

} // namespace

TemplateDefinition parseTemplateDocument(const nlohmann::ordered_json &document)
{
    if (!document.is_object()) {
        parseFail("template document must be an object");
    }

    TemplateDefinition definition;

    const auto &metadata = sectionOrEmpty(document, "metadata");
    definition.metadata.name = stringField(metadata, "name", "Unknown", "metadata");
    if (definition.metadata.name.empty()) {
        parseFail("metadata.name must not be empty");
    }
    definition.metadata.description = stringField(metadata, "description", "", "metadata");
    definition.metadata.category = stringField(metadata, "category", "general", "metadata");
    definition.metadata.version = stringField(metadata, "version", "1.0", "metadata");
    definition.metadata.author = stringField(metadata, "author", "", "metadata");

    const auto &config = sectionOrEmpty(document, "configuration");
    definition.configuration.hostname =
        stringField(config, "hostname", "honeypot.local", "configuration");
    definition.configuration.sshBanner =
        stringField(config, "ssh_banner", "SSH-2.0-OpenSSH_8.4p1", "configuration");
    definition.configuration.timezone =
        stringField(config, "timezone", "US/Eastern", "configuration");

    definition.users = parseUsers(sectionOrEmpty(document, "users"));

    auto filesystem = document.find("filesystem");
    if (filesystem != document.end()) {
        definition.directoryTree = parseDirectoryTree(*filesystem, "filesystem", 1);
    }

    definition.fileContents = parseFiles(sectionOrEmpty(document, "files"));
    definition.customCommands = parseCommands(sectionOrEmpty(document, "custom_commands"));
    return definition;
}

TemplateDefinition parseTemplate(const std::string &text)
{
    nlohmann::ordered_json document;
    try {
        document = nlohmann::ordered_json::parse(text);
    } catch (const nlohmann::json::parse_error &ex) {
        parseFail(std::string("malformed template: ") + ex.what());
    }
    return parseTemplateDocument(document);
}

TemplateDefinition loadTemplate(const std::string &path)
{
    std::error_code error;
    if (!std::filesystem::is_regular_file(path, error)) {
        throw ForgeError(ErrorKind::SourceNotFound, "template not found: " + path);
    }

    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        throw ForgeError(ErrorKind::SourceNotFound, "cannot open template: " + path);
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();

    try {
        return parseTemplate(buffer.str());
    } catch (const ForgeError &ex) {
        throw ForgeError(ex.kind(), path + ": " + ex.what());
    }
}

} // namespace honeyforge
