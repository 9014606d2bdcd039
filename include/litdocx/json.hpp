/// @file json.hpp
/// @brief nlohmann/json interoperability for litdocx.
///
/// Provides ADL serialization (to_json) of the markup tree and of the
/// output document model, and loading of Options (from_json).

#pragma once

#include <litdocx/converter.hpp>
#include <litdocx/document.hpp>
#include <litdocx/markup.hpp>
#include <litdocx/numbering.hpp>
#include <litdocx/options.hpp>
#include <litdocx/run.hpp>

#include <nlohmann/json.hpp>

namespace litdocx {

// -- Markup tree --------------------------------------------------------------

void to_json(nlohmann::json& j, Tag tag);
void from_json(const nlohmann::json& j, Tag& tag);

/// Nodes serialize as {"tag", "text", "attributes", "children", "tail"},
/// omitting empty members.
void to_json(nlohmann::json& j, const MarkupNode& node);
void from_json(const nlohmann::json& j, MarkupNode& node);

// -- Document model -----------------------------------------------------------

void to_json(nlohmann::json& j, const RunAttributes& attrs);
void to_json(nlohmann::json& j, const Segment& segment);
void to_json(nlohmann::json& j, const Run& run);
void to_json(nlohmann::json& j, const NumberingRef& ref);
void to_json(nlohmann::json& j, const Paragraph& paragraph);
void to_json(nlohmann::json& j, const Document& doc);
void to_json(nlohmann::json& j, const NumberingPair& pair);
void to_json(nlohmann::json& j, const ConversionResult& result);

// -- Options ------------------------------------------------------------------

void to_json(nlohmann::json& j, const StyleNames& styles);
void from_json(const nlohmann::json& j, StyleNames& styles);

/// Missing keys keep their defaults.
/// @throws ConversionError (config_error) on values of the wrong type.
void to_json(nlohmann::json& j, const Options& options);
void from_json(const nlohmann::json& j, Options& options);

}  // namespace litdocx
