#include "snapshot/snapshot_entry.hpp"

#include <sstream>

#include <sys/stat.h>

namespace honeyforge {

std::optional<EntryType> classifyMode(mode_t mode)
{
    if (S_ISLNK(mode)) {
        return EntryType::Symlink;
    }
    if (S_ISDIR(mode)) {
        return EntryType::Directory;
    }
    if (S_ISREG(mode)) {
        return EntryType::RegularFile;
    }
    if (S_ISBLK(mode)) {
        return EntryType::BlockDevice;
    }
    if (S_ISCHR(mode)) {
        return EntryType::CharDevice;
    }
    if (S_ISSOCK(mode)) {
        return EntryType::Socket;
    }
    if (S_ISFIFO(mode)) {
        return EntryType::Fifo;
    }
    return std::nullopt;
}

SnapshotEntry makeRootEntry()
{
    SnapshotEntry root;
    root.name = "/";
    root.type = EntryType::Directory;
    root.payload = DirectoryPayload{};
    return root;
}

const std::vector<SnapshotEntry> *childrenOf(const SnapshotEntry &entry)
{
    if (const auto *dir = std::get_if<DirectoryPayload>(&entry.payload)) {
        return &dir->children;
    }
    return nullptr;
}

std::vector<SnapshotEntry> *childrenOf(SnapshotEntry &entry)
{
    if (auto *dir = std::get_if<DirectoryPayload>(&entry.payload)) {
        return &dir->children;
    }
    return nullptr;
}

const std::string *linkTargetOf(const SnapshotEntry &entry)
{
    if (const auto *link = std::get_if<SymlinkPayload>(&entry.payload)) {
        return &link->target;
    }
    return nullptr;
}

const SnapshotEntry *findEntry(const SnapshotEntry &root, const std::string &path)
{
    const SnapshotEntry *current = &root;
    std::istringstream segments(path);
    std::string segment;
    while (std::getline(segments, segment, '/')) {
        if (segment.empty()) {
            continue;
        }
        const auto *children = childrenOf(*current);
        if (!children) {
            return nullptr;
        }
        const SnapshotEntry *next = nullptr;
        for (const auto &child : *children) {
            if (child.name == segment) {
                next = &child;
                break;
            }
        }
        if (!next) {
            return nullptr;
        }
        current = next;
    }
    return current;
}

size_t countEntries(const SnapshotEntry &root)
{
    size_t count = 1;
    if (const auto *children = childrenOf(root)) {
        for (const auto &child : *children) {
            count += countEntries(child);
        }
    }
    return count;
}

} // namespace honeyforge
