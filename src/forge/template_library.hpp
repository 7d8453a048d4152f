#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace honeyforge {

struct TemplateSummary {
    std::string id;
    std::string name;
    std::string description;
    std::string category;
    std::string version;
};

// TemplateLibrary loads every *.json definition in a directory once and
// keeps them keyed by file stem. Broken definitions are logged and skipped.
class TemplateLibrary {
public:
    explicit TemplateLibrary(std::filesystem::path templatesDir);

    const TemplateDefinition *get(const std::string &id) const;
    std::vector<TemplateSummary> list() const;
    std::vector<TemplateSummary> byCategory(const std::string &category) const;

    void reload();
    bool addFromFile(const std::filesystem::path &path);

    size_t size() const;
    const std::filesystem::path &directory() const;

private:
    void loadAll();

    std::filesystem::path m_dir;
    std::map<std::string, TemplateDefinition> m_templates;
};

// Write a definition as a loadable template. Throws ForgeError(IOFailure).
void exportTemplate(const TemplateDefinition &definition,
                    const std::filesystem::path &outputPath);

} // namespace honeyforge
