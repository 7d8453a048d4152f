#include "common/path_utils.hpp"

#include <system_error>

#include "common/errors.hpp"

namespace honeyforge {

namespace {

std::string trimTrailingSeparators(std::string value)
{
    while (value.size() > 1 && value.back() == '/') {
        value.pop_back();
    }
    return value;
}

} // namespace

std::filesystem::path safeJoin(const std::filesystem::path &root,
                               const std::string &targetPath)
{
    if (targetPath.empty()) {
        throw ForgeError(ErrorKind::PathViolation, "empty target path");
    }
    if (targetPath.find('\0') != std::string::npos) {
        throw ForgeError(ErrorKind::PathViolation,
                         "target path contains NUL: " + targetPath);
    }

    // Every leading separator goes, so "//etc" cannot override the root.
    const size_t start = targetPath.find_first_not_of('/');
    if (start == std::string::npos) {
        throw ForgeError(ErrorKind::PathViolation,
                         "target path names the root itself: " + targetPath);
    }
    const std::filesystem::path relative(targetPath.substr(start));
    if (relative.has_root_name() || relative.has_root_directory()) {
        throw ForgeError(ErrorKind::PathViolation,
                         "target path overrides the root: " + targetPath);
    }

    int depth = 0;
    for (const auto &component : relative) {
        const std::string part = component.string();
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            --depth;
            if (depth < 0) {
                throw ForgeError(ErrorKind::PathViolation,
                                 "target path escapes the root: " + targetPath);
            }
            continue;
        }
        ++depth;
    }
    if (depth == 0) {
        throw ForgeError(ErrorKind::PathViolation,
                         "target path names the root itself: " + targetPath);
    }

    return (root / relative).lexically_normal();
}

void ensureInsideRoot(const std::filesystem::path &root,
                      const std::filesystem::path &target)
{
    std::error_code error;
    const auto canonicalRoot = std::filesystem::weakly_canonical(root, error);
    if (error) {
        throw ForgeError(ErrorKind::IOFailure,
                         "cannot resolve root " + root.string() + ": " + error.message());
    }
    const auto canonicalTarget = std::filesystem::weakly_canonical(target, error);
    if (error) {
        throw ForgeError(ErrorKind::IOFailure,
                         "cannot resolve " + target.string() + ": " + error.message());
    }
    if (!isWithin(canonicalRoot, canonicalTarget)) {
        throw ForgeError(ErrorKind::PathViolation,
                         target.string() + " resolves outside " + canonicalRoot.string());
    }
}

bool isWithin(const std::filesystem::path &base,
              const std::filesystem::path &candidate)
{
    const std::string basePath = trimTrailingSeparators(base.lexically_normal().string());
    const std::string candidatePath =
        trimTrailingSeparators(candidate.lexically_normal().string());

    if (basePath == "/") {
        return !candidatePath.empty() && candidatePath.front() == '/';
    }
    if (candidatePath == basePath) {
        return true;
    }
    return candidatePath.rfind(basePath + "/", 0) == 0;
}

std::string joinVirtualPath(const std::string &parent, const std::string &name)
{
    if (parent.empty() || parent == "/") {
        return "/" + name;
    }
    if (parent.back() == '/') {
        return parent + name;
    }
    return parent + "/" + name;
}

} // namespace honeyforge
