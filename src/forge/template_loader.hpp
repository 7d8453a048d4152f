#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace honeyforge {

/**
 * Load a template definition from a JSON file.
 *
 * Throws ForgeError(SourceNotFound) when the file is missing and
 * ForgeError(ParseError) when it is not a valid definition. Nothing on disk
 * is touched besides reading the file.
 */
TemplateDefinition loadTemplate(const std::string &path);

// Parse a definition from JSON text. Throws ForgeError(ParseError).
TemplateDefinition parseTemplate(const std::string &text);

TemplateDefinition parseTemplateDocument(const nlohmann::ordered_json &document);

} // namespace honeyforge
