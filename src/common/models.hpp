#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "common/enums.hpp"

namespace honeyforge {

struct TemplateMetadata {
    std::string name;
    std::string description;
    std::string category;
    std::string version;
    std::string author;
};

struct TemplateConfiguration {
    std::string hostname;
    std::string sshBanner;
    std::string timezone;
};

struct UserAccount {
    std::string username;
    std::string password;
    int uid = 0;
    int gid = 0;
    std::string home;
    std::string shell;
    std::string gecos;
};

// One directory of the declared tree; an empty children list is a leaf.
struct DirNode {
    std::string name;
    std::vector<DirNode> children;
};

struct FileContent {
    std::string path;
    std::string content;
};

struct CustomCommand {
    std::string name;
    std::string path;
    std::string script;
};

struct TemplateDefinition {
    TemplateMetadata metadata;
    TemplateConfiguration configuration;
    std::vector<UserAccount> users;
    std::vector<DirNode> directoryTree;
    std::vector<FileContent> fileContents;
    std::vector<CustomCommand> customCommands;
};

struct SnapshotEntry;

struct DirectoryPayload {
    std::vector<SnapshotEntry> children;
};

struct SymlinkPayload {
    // Target path relative to the snapshot root, always "/"-prefixed.
    std::string target;
};

// Type-specific part of an entry: directories carry children, symlinks a
// target, every other type nothing.
using EntryPayload = std::variant<std::monostate, DirectoryPayload, SymlinkPayload>;

struct SnapshotEntry {
    std::string name;
    EntryType type = EntryType::RegularFile;
    uint32_t uid = 0;
    uint32_t gid = 0;
    uint64_t size = 0;
    uint32_t mode = 0;
    int64_t modTime = 0;
    EntryPayload payload;
    std::optional<std::string> sourceRef;
};

struct SkippedEntry {
    std::string virtualPath;
    SkipReason reason;
    std::string detail;
};

struct SnapshotResult {
    SnapshotEntry root;
    std::vector<SkippedEntry> skipped;
};

} // namespace honeyforge
