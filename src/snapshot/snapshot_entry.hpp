#pragma once

#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

#include "common/models.hpp"

namespace honeyforge {

// Entry type from stat mode bits; nullopt for anything unclassifiable.
std::optional<EntryType> classifyMode(mode_t mode);

// The "/" directory every snapshot starts from; all metadata zeroed.
SnapshotEntry makeRootEntry();

// nullptr unless the entry is a directory / symlink respectively.
const std::vector<SnapshotEntry> *childrenOf(const SnapshotEntry &entry);
std::vector<SnapshotEntry> *childrenOf(SnapshotEntry &entry);
const std::string *linkTargetOf(const SnapshotEntry &entry);

// Resolve a "/"-rooted path against a decoded tree without following links.
const SnapshotEntry *findEntry(const SnapshotEntry &root, const std::string &path);

size_t countEntries(const SnapshotEntry &root);

} // namespace honeyforge
