#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace honeyforge {

constexpr int kDefaultMaxDepth = 15;

// Snapshot artifacts of earlier runs and the honeypot runtime's own files.
const std::vector<std::string> &defaultExclusionPatterns();

struct SnapshotOptions {
    int maxDepth = kDefaultMaxDepth;
    // fnmatch(3) globs matched against the "/"-rooted virtual path; "*"
    // also matches "/".
    std::vector<std::string> exclusionPatterns = defaultExclusionPatterns();
    SnapshotEncoding encoding = SnapshotEncoding::Json;
};

/**
 * Walks a real directory tree into a SnapshotEntry tree and writes it as a
 * single artifact for the honeypot's filesystem emulator.
 *
 * The walk is depth-first and best-effort: entries that cannot be listed or
 * stat'ed, symlinks that resolve outside the source root and excluded paths
 * are left out of the tree and reported in SnapshotResult::skipped instead
 * of failing the whole snapshot. Children of each directory are sorted by
 * name so identical trees produce identical artifacts.
 */
class SnapshotSerializer {
public:
    explicit SnapshotSerializer(SnapshotOptions options = {});

    // Throws ForgeError(SourceNotFound) when sourceRoot is not a directory.
    SnapshotResult walk(const std::filesystem::path &sourceRoot) const;

    // Walk, encode and write to outputPath. Throws ForgeError(SourceNotFound |
    // AlreadyExists | IOFailure); nothing is written on failure.
    SnapshotResult serialize(const std::filesystem::path &sourceRoot,
                             const std::filesystem::path &outputPath) const;

    const SnapshotOptions &options() const;

private:
    struct WalkState {
        std::filesystem::path root;
        std::vector<std::string> patterns;
        std::vector<SkippedEntry> skipped;
    };

    SnapshotResult walkWithPatterns(const std::filesystem::path &sourceRoot,
                                    std::vector<std::string> patterns) const;
    std::vector<SnapshotEntry> walkDirectory(WalkState &state,
                                             const std::string &virtualPath,
                                             int depth) const;
    void recordSkip(WalkState &state,
                    const std::string &virtualPath,
                    SkipReason reason,
                    const std::string &detail) const;

    SnapshotOptions m_options;
};

bool matchesExclusion(const std::vector<std::string> &patterns,
                      const std::string &virtualPath);

} // namespace honeyforge
