#pragma once

#include <chrono>
#include <ctime>
#include <functional>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/models.hpp"

namespace honeyforge {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

inline std::string toEntryTypeString(EntryType type)
{
    switch (type) {
    case EntryType::Symlink:
        return "symlink";
    case EntryType::Directory:
        return "directory";
    case EntryType::RegularFile:
        return "file";
    case EntryType::BlockDevice:
        return "block_device";
    case EntryType::CharDevice:
        return "char_device";
    case EntryType::Socket:
        return "socket";
    case EntryType::Fifo:
        return "fifo";
    }
    return "file";
}

inline std::optional<EntryType> parseEntryTypeString(const std::string &value)
{
    if (value == "symlink") {
        return EntryType::Symlink;
    }
    if (value == "directory") {
        return EntryType::Directory;
    }
    if (value == "file") {
        return EntryType::RegularFile;
    }
    if (value == "block_device") {
        return EntryType::BlockDevice;
    }
    if (value == "char_device") {
        return EntryType::CharDevice;
    }
    if (value == "socket") {
        return EntryType::Socket;
    }
    if (value == "fifo") {
        return EntryType::Fifo;
    }
    return std::nullopt;
}

inline std::string toSkipReasonString(SkipReason reason)
{
    switch (reason) {
    case SkipReason::Excluded:
        return "excluded";
    case SkipReason::Unreadable:
        return "unreadable";
    case SkipReason::StatFailed:
        return "stat_failed";
    case SkipReason::SymlinkEscapesRoot:
        return "symlink_escapes_root";
    case SkipReason::DanglingSymlink:
        return "dangling_symlink";
    case SkipReason::UnknownType:
        return "unknown_type";
    case SkipReason::InvalidName:
        return "invalid_name";
    }
    return "unreadable";
}

inline void to_json(nlohmann::json &j, const EntryType &type)
{
    j = toEntryTypeString(type);
}

inline void from_json(const nlohmann::json &j, EntryType &type)
{
    const auto parsed = parseEntryTypeString(j.get<std::string>());
    if (!parsed.has_value()) {
        throw ForgeError(ErrorKind::ParseError,
                         "unknown entry type: " + j.get<std::string>());
    }
    type = *parsed;
}

inline void to_json(nlohmann::json &j, const SnapshotEntry &entry)
{
    j = nlohmann::json{
        {"name", entry.name},
        {"type", entry.type},
        {"uid", entry.uid},
        {"gid", entry.gid},
        {"size", entry.size},
        {"mode", entry.mode},
        {"mtime", entry.modTime},
        {"sourceRef", entry.sourceRef.has_value()
             ? nlohmann::json(*entry.sourceRef)
             : nlohmann::json(nullptr)}
    };
    if (const auto *dir = std::get_if<DirectoryPayload>(&entry.payload)) {
        j["children"] = dir->children;
    } else if (const auto *link = std::get_if<SymlinkPayload>(&entry.payload)) {
        j["target"] = link->target;
    }
}

// Strict: missing or mistyped fields throw, and the payload must match the
// entry type.
inline void from_json(const nlohmann::json &j, SnapshotEntry &entry)
{
    entry.name = j.at("name").get<std::string>();
    entry.type = j.at("type").get<EntryType>();
    entry.uid = j.at("uid").get<uint32_t>();
    entry.gid = j.at("gid").get<uint32_t>();
    entry.size = j.at("size").get<uint64_t>();
    entry.mode = j.at("mode").get<uint32_t>();
    entry.modTime = j.at("mtime").get<int64_t>();
    if (j.contains("sourceRef") && j.at("sourceRef").is_string()) {
        entry.sourceRef = j.at("sourceRef").get<std::string>();
    } else {
        entry.sourceRef.reset();
    }

    const bool hasChildren = j.contains("children");
    const bool hasTarget = j.contains("target");
    if (entry.type == EntryType::Directory) {
        if (hasTarget) {
            throw ForgeError(ErrorKind::ParseError,
                             "directory entry carries a link target: " + entry.name);
        }
        DirectoryPayload dir;
        if (hasChildren) {
            dir.children = j.at("children").get<std::vector<SnapshotEntry>>();
        }
        entry.payload = std::move(dir);
    } else if (entry.type == EntryType::Symlink) {
        if (hasChildren || !hasTarget) {
            throw ForgeError(ErrorKind::ParseError,
                             "symlink entry without a lone target: " + entry.name);
        }
        entry.payload = SymlinkPayload{j.at("target").get<std::string>()};
    } else {
        if (hasChildren || hasTarget) {
            throw ForgeError(ErrorKind::ParseError,
                             "leaf entry carries children or a target: " + entry.name);
        }
        entry.payload = std::monostate{};
    }
}

inline void to_json(nlohmann::json &j, const SkippedEntry &skipped)
{
    j = nlohmann::json{
        {"path", skipped.virtualPath},
        {"reason", toSkipReasonString(skipped.reason)},
        {"detail", skipped.detail}
    };
}

// Writes a definition in the same layout the template loader reads, so
// an exported template can be loaded again.
inline nlohmann::ordered_json templateToJson(const TemplateDefinition &definition)
{
    nlohmann::ordered_json j;
    j["metadata"] = {
        {"name", definition.metadata.name},
        {"description", definition.metadata.description},
        {"category", definition.metadata.category},
        {"version", definition.metadata.version},
        {"author", definition.metadata.author}
    };
    j["configuration"] = {
        {"hostname", definition.configuration.hostname},
        {"ssh_banner", definition.configuration.sshBanner},
        {"timezone", definition.configuration.timezone}
    };

    nlohmann::ordered_json users = nlohmann::ordered_json::object();
    for (const auto &user : definition.users) {
        users[user.username] = {
            {"password", user.password},
            {"uid", user.uid},
            {"gid", user.gid},
            {"home", user.home},
            {"shell", user.shell},
            {"gecos", user.gecos}
        };
    }
    j["users"] = users;

    std::function<nlohmann::ordered_json(const std::vector<DirNode> &)> dirs =
        [&dirs](const std::vector<DirNode> &nodes) {
            nlohmann::ordered_json out = nlohmann::ordered_json::object();
            for (const auto &node : nodes) {
                out[node.name] = dirs(node.children);
            }
            return out;
        };
    j["filesystem"] = dirs(definition.directoryTree);

    nlohmann::ordered_json files = nlohmann::ordered_json::object();
    for (const auto &file : definition.fileContents) {
        files[file.path] = {{"content", file.content}};
    }
    j["files"] = files;

    nlohmann::ordered_json commands = nlohmann::ordered_json::object();
    for (const auto &command : definition.customCommands) {
        commands[command.name] = {{"path", command.path}, {"content", command.script}};
    }
    j["custom_commands"] = commands;
    return j;
}

} // namespace honeyforge
