#pragma once

#include <filesystem>
#include <string>

namespace honeyforge {

/**
 * Join a rooted target path ("/etc/passwd") onto a destination root.
 *
 * The leading "/" is stripped and the remainder is resolved lexically; a
 * path that is empty, contains NUL, names the root itself or climbs above
 * it with ".." throws ForgeError(PathViolation). No filesystem access.
 */
std::filesystem::path safeJoin(const std::filesystem::path &root,
                               const std::string &targetPath);

/**
 * Filesystem-aware check for a path produced by safeJoin: after resolving
 * every symlink that already exists along the way, target must still lie
 * inside root. Throws ForgeError(PathViolation) otherwise.
 */
void ensureInsideRoot(const std::filesystem::path &root,
                      const std::filesystem::path &target);

// Component-wise prefix test on normalized paths.
bool isWithin(const std::filesystem::path &base,
              const std::filesystem::path &candidate);

// "/" + "etc" -> "/etc", "/etc" + "passwd" -> "/etc/passwd"
std::string joinVirtualPath(const std::string &parent, const std::string &name);

} // namespace honeyforge
