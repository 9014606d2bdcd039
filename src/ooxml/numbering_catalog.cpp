#include <litdocx/ooxml.hpp>

#include "xml.hpp"

#include <algorithm>
#include <cstdio>
#include <string>
#include <utility>

namespace litdocx {

namespace detail {

struct CatalogState {
    ooxml::DocPtr doc;
    xmlNode* root{nullptr};
    xmlNs* ns{nullptr};
};

}  // namespace detail

namespace {

using ooxml::add_w;
using ooxml::set_w;
using ooxml::xml_chars;

[[noreturn]] void catalog_error(std::string message) {
    throw ConversionError{ErrorKind::catalog_error, std::move(message)};
}

// The id held by an element's w:<attribute>, or nullopt if absent.
auto element_id(const xmlNode* node, const char* attribute) -> std::optional<std::int64_t> {
    auto text = ooxml::w_attribute(node, attribute);
    if (!text) return std::nullopt;
    auto id = ooxml::parse_id(*text);
    if (!id) {
        catalog_error("invalid w:" + std::string{attribute} + " value \"" + *text + "\"");
    }
    return id;
}

template <typename F>
void for_each_w(xmlNode* root, std::string_view name, F&& f) {
    for (auto* child = ooxml::first_element(root->children); child;
         child = ooxml::next_element(child)) {
        if (ooxml::is_w(child, name)) f(child);
    }
}

auto find_abstract(xmlNode* root, std::int64_t id) -> xmlNode* {
    auto* found = static_cast<xmlNode*>(nullptr);
    for_each_w(root, "abstractNum", [&](xmlNode* node) {
        if (!found && element_id(node, "abstractNumId") == id) found = node;
    });
    return found;
}

auto last_w(xmlNode* root, std::string_view name) -> xmlNode* {
    auto* last = static_cast<xmlNode*>(nullptr);
    for_each_w(root, name, [&](xmlNode* node) { last = node; });
    return last;
}

// An eight-digit hex list signature, distinct for every abstract id.
auto nsid_for(std::int64_t abstract_num_id) -> std::string {
    char buffer[9];
    std::snprintf(buffer, sizeof buffer, "%08X",
                  static_cast<unsigned>(0x4C440000u + static_cast<std::uint32_t>(abstract_num_id)));
    return buffer;
}

// A nine-level decimal outline: 1. / 1.1. indented half an inch per level.
auto make_decimal_definition(xmlDoc* doc, xmlNs* ns, std::int64_t id) -> xmlNode* {
    auto* node = xmlNewDocNode(doc, ns, xml_chars("abstractNum"), nullptr);
    set_w(node, ns, "abstractNumId", std::to_string(id));
    add_w(node, ns, "nsid", nsid_for(id));
    add_w(node, ns, "multiLevelType", "hybridMultilevel");
    for (auto level = 0; level < 9; ++level) {
        auto* lvl = add_w(node, ns, "lvl");
        set_w(lvl, ns, "ilvl", std::to_string(level));
        add_w(lvl, ns, "start", "1");
        add_w(lvl, ns, "numFmt", "decimal");
        add_w(lvl, ns, "lvlText", "%" + std::to_string(level + 1) + ".");
        add_w(lvl, ns, "lvlJc", "left");
        auto* properties = add_w(lvl, ns, "pPr");
        auto* indent = add_w(properties, ns, "ind");
        set_w(indent, ns, "left", std::to_string(720 * (level + 1)));
        set_w(indent, ns, "hanging", "360");
    }
    return node;
}

// A copy of an existing definition under a new id and list signature.
auto clone_definition(xmlDoc* doc, xmlNs* ns, xmlNode* source, std::int64_t id) -> xmlNode* {
    auto copy = ooxml::NodePtr{xmlDocCopyNode(source, doc, 1)};
    if (!copy) catalog_error("failed to copy w:abstractNum");
    set_w(copy.get(), ns, "abstractNumId", std::to_string(id));
    if (auto* nsid = ooxml::find_w_child(copy.get(), "nsid")) {
        set_w(nsid, ns, "val", nsid_for(id));
    }
    // A numStyleLink would make the clone share the template's counters.
    if (auto* link = ooxml::find_w_child(copy.get(), "numStyleLink")) {
        xmlUnlinkNode(link);
        xmlFreeNode(link);
    }
    return copy.release();
}

}  // anonymous namespace

// -- NumberingCatalog ----------------------------------------------------------

NumberingCatalog::NumberingCatalog(std::unique_ptr<detail::CatalogState> state)
    : state_{std::move(state)} {}

NumberingCatalog::~NumberingCatalog() = default;
NumberingCatalog::NumberingCatalog(NumberingCatalog&&) noexcept = default;
auto NumberingCatalog::operator=(NumberingCatalog&&) noexcept -> NumberingCatalog& = default;

auto NumberingCatalog::parse(std::string_view xml) -> NumberingCatalog {
    auto state = std::make_unique<detail::CatalogState>();
    state->doc = ooxml::parse(xml, ErrorKind::catalog_error, numbering_part);
    state->root = xmlDocGetRootElement(state->doc.get());
    if (!ooxml::is_w(state->root, "numbering")) {
        catalog_error(std::string{numbering_part} + " is not a w:numbering");
    }
    state->ns = xmlSearchNsByHref(state->doc.get(), state->root,
                                  xml_chars(ooxml::w_namespace()));

    auto catalog = NumberingCatalog{std::move(state)};
    // Validate every id up front so later queries cannot fail.
    catalog.max_num_id();
    catalog.max_abstract_num_id();
    return catalog;
}

auto NumberingCatalog::empty() -> NumberingCatalog {
    auto state = std::make_unique<detail::CatalogState>();
    state->doc = ooxml::DocPtr{xmlNewDoc(xml_chars("1.0"))};
    state->doc->standalone = 1;
    state->root = xmlNewDocNode(state->doc.get(), nullptr, xml_chars("numbering"), nullptr);
    xmlDocSetRootElement(state->doc.get(), state->root);
    state->ns = xmlNewNs(state->root, xml_chars(ooxml::w_namespace()), xml_chars("w"));
    xmlSetNs(state->root, state->ns);
    return NumberingCatalog{std::move(state)};
}

auto NumberingCatalog::max_num_id() const -> std::int64_t {
    auto max = std::int64_t{0};
    for_each_w(state_->root, "num", [&](xmlNode* node) {
        max = std::max(max, element_id(node, "numId").value_or(0));
    });
    return max;
}

auto NumberingCatalog::max_abstract_num_id() const -> std::int64_t {
    auto max = std::int64_t{0};
    for_each_w(state_->root, "abstractNum", [&](xmlNode* node) {
        max = std::max(max, element_id(node, "abstractNumId").value_or(0));
    });
    return max;
}

auto NumberingCatalog::has_num(std::int64_t num_id) const -> bool {
    auto found = false;
    for_each_w(state_->root, "num", [&](xmlNode* node) {
        if (element_id(node, "numId") == num_id) found = true;
    });
    return found;
}

auto NumberingCatalog::has_abstract_num(std::int64_t abstract_num_id) const -> bool {
    return find_abstract(state_->root, abstract_num_id) != nullptr;
}

void NumberingCatalog::merge(const std::vector<NumberingPair>& pairs, const Options& options) {
    auto* doc = state_->doc.get();
    auto* root = state_->root;
    auto* ns = state_->ns;

    for (const auto& pair : pairs) {
        if (has_num(pair.num_id)) {
            catalog_error("w:num " + std::to_string(pair.num_id) + " is already registered");
        }

        if (!has_abstract_num(pair.abstract_num_id)) {
            if (pair.abstract_num_id == options.bullet_abstract_num_id) {
                catalog_error("bullet list definition w:abstractNum " +
                              std::to_string(pair.abstract_num_id) + " is missing");
            }
            auto* source = options.ordered_template_abstract_num_id
                               ? find_abstract(root, *options.ordered_template_abstract_num_id)
                               : nullptr;
            auto* definition = source ? clone_definition(doc, ns, source, pair.abstract_num_id)
                                      : make_decimal_definition(doc, ns, pair.abstract_num_id);

            // Every w:abstractNum precedes the first w:num.
            if (auto* last = last_w(root, "abstractNum")) {
                xmlAddNextSibling(last, definition);
            } else if (auto* first = ooxml::find_w_child(root, "num")) {
                xmlAddPrevSibling(first, definition);
            } else {
                xmlAddChild(root, definition);
            }
        }

        auto* num = xmlNewDocNode(doc, ns, xml_chars("num"), nullptr);
        set_w(num, ns, "numId", std::to_string(pair.num_id));
        add_w(num, ns, "abstractNumId", std::to_string(pair.abstract_num_id));
        if (pair.start != 1) {
            auto* override_node = add_w(num, ns, "lvlOverride");
            set_w(override_node, ns, "ilvl", "0");
            add_w(override_node, ns, "startOverride", std::to_string(pair.start));
        }
        if (auto* last = last_w(root, "num")) {
            xmlAddNextSibling(last, num);
        } else {
            xmlAddChild(root, num);
        }
    }
}

auto NumberingCatalog::to_xml() const -> std::string {
    return ooxml::serialize(state_->doc.get());
}

}  // namespace litdocx
