#include <litdocx/error.hpp>
#include <litdocx/json.hpp>

#include <string>
#include <utility>
#include <variant>

namespace litdocx {

namespace {

[[noreturn]] void config_error(std::string message) {
    throw ConversionError{ErrorKind::config_error, std::move(message)};
}

void require_object(const nlohmann::json& j, std::string_view what) {
    if (!j.is_object()) {
        config_error(std::string{what} + " must be a JSON object, got " + j.type_name());
    }
}

// Overwrite `out` with j[key] when present; nlohmann type errors surface as
// config errors naming the key.
template <typename T>
void read_field(const nlohmann::json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end()) return;
    try {
        out = it->template get<T>();
    } catch (const nlohmann::json::exception& e) {
        config_error("invalid value for \"" + std::string{key} + "\": " + e.what());
    }
}

}  // anonymous namespace

// =============================================================================
// Markup tree
// =============================================================================

void to_json(nlohmann::json& j, Tag tag) {
    j = std::string{to_string_view(tag)};
}

void from_json(const nlohmann::json& j, Tag& tag) {
    tag = parse_tag(j.get<std::string>());
}

void to_json(nlohmann::json& j, const MarkupNode& node) {
    j = nlohmann::json{{"tag", node.tag}};
    if (!node.attributes.empty()) j["attributes"] = node.attributes;
    if (!node.text.empty()) j["text"] = node.text;
    if (!node.children.empty()) j["children"] = node.children;
    if (!node.tail.empty()) j["tail"] = node.tail;
}

void from_json(const nlohmann::json& j, MarkupNode& node) {
    node = MarkupNode{};
    node.tag = j.at("tag").get<Tag>();
    if (j.contains("attributes")) {
        node.attributes = j["attributes"].get<std::map<std::string, std::string>>();
    }
    if (j.contains("text")) node.text = j["text"].get<std::string>();
    if (j.contains("children")) node.children = j["children"].get<std::vector<MarkupNode>>();
    if (j.contains("tail")) node.tail = j["tail"].get<std::string>();
}

// =============================================================================
// Document model
// =============================================================================

void to_json(nlohmann::json& j, const RunAttributes& attrs) {
    j = nlohmann::json::object();
    if (attrs.emphasis) j["emphasis"] = true;
    if (attrs.strong) j["strong"] = true;
    if (attrs.code) j["code"] = true;
}

void to_json(nlohmann::json& j, const Segment& segment) {
    std::visit(overload{
        [&](const TextSegment& t) { j = t.text; },
        [&](LineBreak) { j = nlohmann::json{{"type", "line_break"}}; },
        [&](PageBreak) { j = nlohmann::json{{"type", "page_break"}}; },
        [&](Tab) { j = nlohmann::json{{"type", "tab"}}; },
    }, segment);
}

void to_json(nlohmann::json& j, const Run& run) {
    auto segments = nlohmann::json::array();
    for (const auto& segment : run.segments) {
        auto s = nlohmann::json{};
        to_json(s, segment);
        segments.push_back(std::move(s));
    }
    j = nlohmann::json{{"segments", std::move(segments)}};
    if (run.attributes != RunAttributes{}) j["attributes"] = run.attributes;
}

void to_json(nlohmann::json& j, const NumberingRef& ref) {
    j = nlohmann::json{{"num_id", ref.num_id}, {"level", ref.level}};
}

void to_json(nlohmann::json& j, const Paragraph& paragraph) {
    j = nlohmann::json::object();
    if (paragraph.style) j["style"] = *paragraph.style;
    if (paragraph.numbering) j["numbering"] = *paragraph.numbering;
    j["runs"] = paragraph.runs;
}

void to_json(nlohmann::json& j, const Document& doc) {
    j = nlohmann::json{{"paragraphs", doc.paragraphs}};
}

void to_json(nlohmann::json& j, const NumberingPair& pair) {
    j = nlohmann::json{{"num_id", pair.num_id}, {"abstract_num_id", pair.abstract_num_id}};
    if (pair.start != 1) j["start"] = pair.start;
}

void to_json(nlohmann::json& j, const ConversionResult& result) {
    j = nlohmann::json{
        {"document", result.document},
        {"numbering", result.numbering},
    };
}

// =============================================================================
// Options
// =============================================================================

void to_json(nlohmann::json& j, const StyleNames& styles) {
    j = nlohmann::json{
        {"heading_prefix", styles.heading_prefix},
        {"note", styles.note},
        {"bullet_list", styles.bullet_list},
        {"ordered_list", styles.ordered_list},
        {"code_block", styles.code_block},
    };
}

void from_json(const nlohmann::json& j, StyleNames& styles) {
    require_object(j, "styles");
    read_field(j, "heading_prefix", styles.heading_prefix);
    read_field(j, "note", styles.note);
    read_field(j, "bullet_list", styles.bullet_list);
    read_field(j, "ordered_list", styles.ordered_list);
    read_field(j, "code_block", styles.code_block);
}

void to_json(nlohmann::json& j, const Options& options) {
    j = nlohmann::json{
        {"marker", options.marker},
        {"styles", options.styles},
        {"bullet_abstract_num_id", options.bullet_abstract_num_id},
        {"ordered_template_abstract_num_id", nullptr},
        {"code_font", options.code_font},
        {"emphasize_terms", options.emphasize_terms},
    };
    if (options.ordered_template_abstract_num_id) {
        j["ordered_template_abstract_num_id"] = *options.ordered_template_abstract_num_id;
    }
}

void from_json(const nlohmann::json& j, Options& options) {
    require_object(j, "options");
    read_field(j, "marker", options.marker);
    read_field(j, "bullet_abstract_num_id", options.bullet_abstract_num_id);
    read_field(j, "code_font", options.code_font);
    read_field(j, "emphasize_terms", options.emphasize_terms);

    if (auto it = j.find("styles"); it != j.end()) from_json(*it, options.styles);

    if (auto it = j.find("ordered_template_abstract_num_id"); it != j.end()) {
        if (it->is_null()) {
            options.ordered_template_abstract_num_id.reset();
        } else {
            auto id = std::int64_t{0};
            read_field(j, "ordered_template_abstract_num_id", id);
            options.ordered_template_abstract_num_id = id;
        }
    }

    if (options.marker.empty()) config_error("\"marker\" must not be empty");
    if (options.bullet_abstract_num_id < 0) {
        config_error("\"bullet_abstract_num_id\" must not be negative");
    }
}

}  // namespace litdocx
