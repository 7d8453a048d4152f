#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "common/errors.hpp"
#include "common/models.hpp"
#include "forge/template_library.hpp"
#include "snapshot/snapshot_serializer.hpp"

namespace honeyforge {

// On-disk layout of one deployment directory.
struct DeploymentLayout {
    std::filesystem::path root;
    std::filesystem::path honeyfs;
    std::filesystem::path txtcmds;
    std::filesystem::path share;
    std::filesystem::path config;
    std::filesystem::path logDir;
    std::filesystem::path downloads;
    std::filesystem::path snapshotPath;
    std::filesystem::path userDbPath;
    std::filesystem::path metadataPath;
};

DeploymentLayout deploymentLayout(const std::filesystem::path &deploymentDir);

struct DeploymentResult {
    bool success = false;
    std::string deploymentName;
    std::string templateId;
    DeploymentLayout layout;
    size_t snapshotEntries = 0;
    std::vector<SkippedEntry> skipped;
    std::optional<ErrorKind> errorKind;
    std::string errorMessage;
};

/**
 * Turns a library template into a deployment directory: materialized
 * filesystem, custom command scripts, user database, snapshot artifact and
 * metadata.json. The whole build either succeeds or reports one failure;
 * a failed build never leaves a snapshot artifact behind.
 */
class DeploymentBuilder {
public:
    DeploymentBuilder(const TemplateLibrary &library,
                      std::filesystem::path deploymentsBase,
                      SnapshotOptions snapshotOptions = {});

    DeploymentResult build(const std::string &templateId,
                           const std::string &deploymentName) const;

private:
    void buildInto(const TemplateDefinition &definition,
                   DeploymentResult &result) const;

    const TemplateLibrary &m_library;
    std::filesystem::path m_base;
    SnapshotOptions m_snapshotOptions;
};

} // namespace honeyforge
