#include "snapshot/snapshot_serializer.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>

#include <fnmatch.h>
#include <sys/stat.h>

#include <QByteArray>
#include <QString>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/path_utils.hpp"
#include "snapshot/snapshot_codec.hpp"
#include "snapshot/snapshot_entry.hpp"

namespace honeyforge {

namespace {

std::filesystem::path localPathFor(const std::filesystem::path &root,
                                   const std::string &virtualPath)
{
    if (virtualPath == "/") {
        return root;
    }
    return root / virtualPath.substr(1);
}

// Path of a resolved location inside root, as seen from the snapshot's "/".
std::string relativizeToRoot(const std::filesystem::path &root,
                             const std::filesystem::path &resolved)
{
    const std::string rootPath = root.string();
    const std::string resolvedPath = resolved.string();
    if (rootPath == "/") {
        return resolvedPath;
    }
    const std::string rest = resolvedPath.substr(rootPath.size());
    return rest.empty() ? std::string("/") : rest;
}

bool isValidUtf8(const std::string &name)
{
    const QByteArray raw = QByteArray::fromStdString(name);
    return QString::fromUtf8(raw).toUtf8() == raw;
}

} // namespace

const std::vector<std::string> &defaultExclusionPatterns()
{
    static const std::vector<std::string> patterns = {
        "/root/fs.pickle",
        "/root/createfs",
        "*cowrie*",
        "*kippo*",
        "*.pickle",
        "*.hfsnap",
    };
    return patterns;
}

bool matchesExclusion(const std::vector<std::string> &patterns,
                      const std::string &virtualPath)
{
    for (const auto &pattern : patterns) {
        if (fnmatch(pattern.c_str(), virtualPath.c_str(), 0) == 0) {
            return true;
        }
    }
    return false;
}

SnapshotSerializer::SnapshotSerializer(SnapshotOptions options)
    : m_options(std::move(options))
{
}

const SnapshotOptions &SnapshotSerializer::options() const
{
    return m_options;
}

SnapshotResult SnapshotSerializer::walk(const std::filesystem::path &sourceRoot) const
{
    return walkWithPatterns(sourceRoot, m_options.exclusionPatterns);
}

SnapshotResult SnapshotSerializer::serialize(const std::filesystem::path &sourceRoot,
                                             const std::filesystem::path &outputPath) const
{
    std::error_code error;
    if (!std::filesystem::is_directory(sourceRoot, error)) {
        throw ForgeError(ErrorKind::SourceNotFound,
                         "source root is not a directory: " + sourceRoot.string());
    }
    if (std::filesystem::exists(std::filesystem::symlink_status(outputPath, error))) {
        throw ForgeError(ErrorKind::AlreadyExists,
                         "output already exists: " + outputPath.string());
    }

    // Never let the artifact describe itself.
    std::vector<std::string> patterns = m_options.exclusionPatterns;
    const auto canonicalRoot = std::filesystem::canonical(sourceRoot, error);
    const auto canonicalOutput = std::filesystem::weakly_canonical(outputPath, error);
    if (!canonicalRoot.empty() && !canonicalOutput.empty()
        && isWithin(canonicalRoot, canonicalOutput)) {
        patterns.push_back(relativizeToRoot(canonicalRoot, canonicalOutput));
    }

    SnapshotResult result = walkWithPatterns(sourceRoot, std::move(patterns));
    writeSnapshotFile(outputPath, encodeSnapshot(result.root, m_options.encoding));

    HFLOG_INFO(QStringLiteral("SnapshotSerializer"),
               QStringLiteral("serialize"),
               QStringLiteral("snapshot_written"),
               QStringLiteral("deployment_snapshot"),
               m_options.encoding == SnapshotEncoding::Cbor
                   ? QStringLiteral("cbor")
                   : QStringLiteral("json"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"source", sourceRoot.string()},
                               {"output", outputPath.string()},
                               {"entries", countEntries(result.root)},
                               {"skipped", result.skipped.size()},
                               {"maxDepth", m_options.maxDepth}}));
    return result;
}

SnapshotResult SnapshotSerializer::walkWithPatterns(
    const std::filesystem::path &sourceRoot,
    std::vector<std::string> patterns) const
{
    std::error_code error;
    if (!std::filesystem::is_directory(sourceRoot, error)) {
        throw ForgeError(ErrorKind::SourceNotFound,
                         "source root is not a directory: " + sourceRoot.string());
    }
    const auto canonicalRoot = std::filesystem::canonical(sourceRoot, error);
    if (error) {
        throw ForgeError(ErrorKind::SourceNotFound,
                         "cannot resolve source root " + sourceRoot.string() + ": "
                             + error.message());
    }

    WalkState state;
    state.root = canonicalRoot;
    state.patterns = std::move(patterns);

    SnapshotResult result;
    result.root = makeRootEntry();
    *childrenOf(result.root) = walkDirectory(state, "/", m_options.maxDepth);
    result.skipped = std::move(state.skipped);
    return result;
}

std::vector<SnapshotEntry> SnapshotSerializer::walkDirectory(WalkState &state,
                                                             const std::string &virtualPath,
                                                             int depth) const
{
    std::vector<SnapshotEntry> entries;
    if (depth <= 0) {
        return entries;
    }

    const auto localPath = localPathFor(state.root, virtualPath);

    std::vector<std::string> names;
    std::error_code error;
    std::filesystem::directory_iterator it(localPath, error);
    if (error) {
        recordSkip(state, virtualPath, SkipReason::Unreadable, error.message());
        return entries;
    }
    for (; it != std::filesystem::directory_iterator(); it.increment(error)) {
        if (error) {
            break;
        }
        names.push_back(it->path().filename().string());
    }
    if (error) {
        recordSkip(state, virtualPath, SkipReason::Unreadable, error.message());
        return entries;
    }
    std::sort(names.begin(), names.end());

    for (const auto &name : names) {
        const std::string childPath = joinVirtualPath(virtualPath, name);
        // Entry names are stored as JSON/CBOR text.
        if (!isValidUtf8(name)) {
            recordSkip(state, childPath, SkipReason::InvalidName, "name is not valid UTF-8");
            continue;
        }
        if (matchesExclusion(state.patterns, childPath)) {
            recordSkip(state, childPath, SkipReason::Excluded, "matches exclusion pattern");
            continue;
        }

        const auto fullPath = localPath / name;
        struct stat st {};
        if (::lstat(fullPath.c_str(), &st) != 0) {
            recordSkip(state, childPath, SkipReason::StatFailed, std::strerror(errno));
            continue;
        }

        SnapshotEntry entry;
        entry.name = name;
        entry.uid = static_cast<uint32_t>(st.st_uid);
        entry.gid = static_cast<uint32_t>(st.st_gid);
        entry.size = static_cast<uint64_t>(st.st_size);
        entry.mode = static_cast<uint32_t>(st.st_mode);
        entry.modTime = static_cast<int64_t>(st.st_mtime);

        const auto type = classifyMode(st.st_mode);
        if (!type.has_value()) {
            // Still emitted so the emulator sees the name; the caller learns
            // about the guess through the skip list.
            entry.type = EntryType::RegularFile;
            entry.size = 0;
            recordSkip(state, childPath, SkipReason::UnknownType,
                       "mode " + std::to_string(entry.mode));
            entries.push_back(std::move(entry));
            continue;
        }
        entry.type = *type;

        switch (*type) {
        case EntryType::Symlink: {
            std::error_code linkError;
            const auto resolved = std::filesystem::canonical(fullPath, linkError);
            if (linkError) {
                recordSkip(state, childPath, SkipReason::DanglingSymlink,
                           linkError.message());
                continue;
            }
            if (!isWithin(state.root, resolved)) {
                recordSkip(state, childPath, SkipReason::SymlinkEscapesRoot,
                           "resolves outside the source root");
                continue;
            }
            entry.payload = SymlinkPayload{relativizeToRoot(state.root, resolved)};
            break;
        }
        case EntryType::Directory:
            entry.payload = DirectoryPayload{walkDirectory(state, childPath, depth - 1)};
            break;
        case EntryType::RegularFile:
            entry.payload = std::monostate{};
            break;
        case EntryType::BlockDevice:
        case EntryType::CharDevice:
        case EntryType::Socket:
        case EntryType::Fifo:
            entry.size = 0;
            entry.payload = std::monostate{};
            break;
        }

        entries.push_back(std::move(entry));
    }
    return entries;
}

void SnapshotSerializer::recordSkip(WalkState &state,
                                    const std::string &virtualPath,
                                    SkipReason reason,
                                    const std::string &detail) const
{
    HFLOG_DEBUG(QStringLiteral("SnapshotSerializer"),
                QStringLiteral("walkDirectory"),
                QStringLiteral("entry_skipped"),
                QString::fromStdString(toSkipReasonString(reason)),
                QStringLiteral("best_effort_walk"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"path", virtualPath}, {"detail", detail}}));
    state.skipped.push_back(SkippedEntry{virtualPath, reason, detail});
}

} // namespace honeyforge
