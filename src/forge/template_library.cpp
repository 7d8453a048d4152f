#include "forge/template_library.hpp"

#include <algorithm>
#include <system_error>

#include <QDir>
#include <QFile>
#include <QString>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "forge/template_loader.hpp"

namespace honeyforge {

namespace {

TemplateSummary summarize(const std::string &id, const TemplateDefinition &definition)
{
    return TemplateSummary{id,
                           definition.metadata.name,
                           definition.metadata.description,
                           definition.metadata.category,
                           definition.metadata.version};
}

} // namespace

TemplateLibrary::TemplateLibrary(std::filesystem::path templatesDir)
    : m_dir(std::move(templatesDir))
{
    if (!QDir().mkpath(QString::fromStdString(m_dir.string()))) {
        HFLOG_WARN(QStringLiteral("TemplateLibrary"),
                   QStringLiteral("TemplateLibrary"),
                   QStringLiteral("templates_dir_unavailable"),
                   QStringLiteral("mkpath_failed"),
                   QStringLiteral("qdir"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"dir", m_dir.string()}}));
    }
    loadAll();
}

const TemplateDefinition *TemplateLibrary::get(const std::string &id) const
{
    auto it = m_templates.find(id);
    if (it == m_templates.end()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<TemplateSummary> TemplateLibrary::list() const
{
    std::vector<TemplateSummary> summaries;
    summaries.reserve(m_templates.size());
    for (const auto &[id, definition] : m_templates) {
        summaries.push_back(summarize(id, definition));
    }
    return summaries;
}

std::vector<TemplateSummary> TemplateLibrary::byCategory(const std::string &category) const
{
    std::vector<TemplateSummary> summaries;
    for (const auto &[id, definition] : m_templates) {
        if (definition.metadata.category == category) {
            summaries.push_back(summarize(id, definition));
        }
    }
    return summaries;
}

void TemplateLibrary::reload()
{
    m_templates.clear();
    loadAll();
}

bool TemplateLibrary::addFromFile(const std::filesystem::path &path)
{
    try {
        m_templates[path.stem().string()] = loadTemplate(path.string());
        return true;
    } catch (const ForgeError &ex) {
        HFLOG_WARN(QStringLiteral("TemplateLibrary"),
                   QStringLiteral("addFromFile"),
                   QStringLiteral("template_rejected"),
                   QString::fromStdString(toErrorKindString(ex.kind())),
                   QStringLiteral("load_template"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"path", path.string()}, {"error", ex.what()}}));
        return false;
    }
}

size_t TemplateLibrary::size() const
{
    return m_templates.size();
}

const std::filesystem::path &TemplateLibrary::directory() const
{
    return m_dir;
}

void TemplateLibrary::loadAll()
{
    std::error_code error;
    std::filesystem::directory_iterator it(m_dir, error);
    if (error) {
        return;
    }

    std::vector<std::filesystem::path> candidates;
    for (; it != std::filesystem::directory_iterator(); it.increment(error)) {
        if (error) {
            break;
        }
        if (it->path().extension() == ".json" && it->is_regular_file(error)) {
            candidates.push_back(it->path());
        }
    }
    std::sort(candidates.begin(), candidates.end());

    size_t loaded = 0;
    for (const auto &path : candidates) {
        if (addFromFile(path)) {
            ++loaded;
        }
    }

    HFLOG_INFO(QStringLiteral("TemplateLibrary"),
               QStringLiteral("loadAll"),
               QStringLiteral("templates_loaded"),
               QStringLiteral("library_scan"),
               QStringLiteral("directory_glob"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"dir", m_dir.string()},
                               {"found", candidates.size()},
                               {"loaded", loaded}}));
}

void exportTemplate(const TemplateDefinition &definition,
                    const std::filesystem::path &outputPath)
{
    QFile file(QString::fromStdString(outputPath.string()));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        throw ForgeError(ErrorKind::IOFailure,
                         "cannot open " + outputPath.string() + ": "
                             + file.errorString().toStdString());
    }
    const QByteArray data = QByteArray::fromStdString(templateToJson(definition).dump(2));
    if (file.write(data) != data.size()) {
        throw ForgeError(ErrorKind::IOFailure,
                         "short write to " + outputPath.string());
    }
}

} // namespace honeyforge
