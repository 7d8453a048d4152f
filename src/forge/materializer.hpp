#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace honeyforge {

// Top-level directories every materialized root gets, relative to the root.
const std::vector<std::string> &baselineDirectories();

/**
 * Check every target the directory and file phases would touch (baseline
 * and declared directories, user homes, the credential database and every
 * declared file) against root without writing anything.
 * Throws ForgeError(PathViolation) on the first escaping path.
 */
void validateTargets(const TemplateDefinition &definition,
                     const std::filesystem::path &root);

// Same check for custom command targets under their own root.
void validateCommandTargets(const TemplateDefinition &definition,
                            const std::filesystem::path &commandsRoot);

/**
 * Create the baseline directories, the declared directory tree and a home
 * (with .ssh) for every user. Existing directories are not an error.
 * Throws ForgeError(PathViolation | IOFailure).
 */
void materializeDirectories(const TemplateDefinition &definition,
                            const std::filesystem::path &root);

/**
 * Write /etc/passwd derived from the users and every declared file,
 * creating parent directories. Existing files are overwritten.
 * Throws ForgeError(PathViolation | IOFailure).
 */
void materializeFiles(const TemplateDefinition &definition,
                      const std::filesystem::path &root);

/**
 * Write each custom command script to its path under commandsRoot and
 * mark it executable (0755).
 * Throws ForgeError(PathViolation | IOFailure).
 */
void materializeCommands(const TemplateDefinition &definition,
                         const std::filesystem::path &commandsRoot);

// validateTargets, then directories, then files.
void materializeTemplate(const TemplateDefinition &definition,
                         const std::filesystem::path &root);

// passwd(5) text: name:x:uid:gid:gecos:home:shell, one line per user.
std::string buildPasswd(const TemplateDefinition &definition);

// Authentication database text: name:x:password, one line per user.
std::string buildUserDb(const TemplateDefinition &definition);

void writeUserDb(const TemplateDefinition &definition,
                 const std::filesystem::path &path);

} // namespace honeyforge
