#pragma once

// Thin RAII and query helpers over the libxml2 tree API, specialised for
// WordprocessingML parts.
//
// Internal header — not installed.

#include <litdocx/error.hpp>
#include <litdocx/ooxml.hpp>

#include <libxml/parser.h>
#include <libxml/tree.h>

#include <charconv>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace litdocx::ooxml {

struct DocDeleter {
    void operator()(xmlDoc* doc) const noexcept { xmlFreeDoc(doc); }
};

struct NodeDeleter {
    void operator()(xmlNode* node) const noexcept { xmlFreeNode(node); }
};

struct XmlCharDeleter {
    void operator()(xmlChar* p) const noexcept { xmlFree(p); }
};

using DocPtr = std::unique_ptr<xmlDoc, DocDeleter>;
using NodePtr = std::unique_ptr<xmlNode, NodeDeleter>;
using XmlString = std::unique_ptr<xmlChar, XmlCharDeleter>;

inline auto xml_chars(const char* s) -> const xmlChar* {
    return reinterpret_cast<const xmlChar*>(s);
}

inline auto xml_chars(const std::string& s) -> const xmlChar* {
    return xml_chars(s.c_str());
}

inline auto w_namespace() -> std::string {
    return std::string{wordml_namespace};
}

// Parse a part. Network access and entity expansion are disabled.
inline auto parse(std::string_view xml, ErrorKind kind, std::string_view part) -> DocPtr {
    auto doc = DocPtr{xmlReadMemory(xml.data(), static_cast<int>(xml.size()),
                                    std::string{part}.c_str(), nullptr,
                                    XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING)};
    if (!doc) {
        throw ConversionError{kind, std::string{part} + " is not well-formed XML"};
    }
    return doc;
}

inline auto serialize(xmlDoc* doc) -> std::string {
    auto* buffer = static_cast<xmlChar*>(nullptr);
    auto size = 0;
    xmlDocDumpMemoryEnc(doc, &buffer, &size, "UTF-8");
    auto owned = XmlString{buffer};
    if (!owned) return {};
    return std::string{reinterpret_cast<const char*>(owned.get()), static_cast<std::size_t>(size)};
}

// True for an element in the WordprocessingML namespace with the given
// local name.
inline auto is_w(const xmlNode* node, std::string_view name) -> bool {
    if (node == nullptr || node->type != XML_ELEMENT_NODE) return false;
    if (node->ns == nullptr || node->ns->href == nullptr) return false;
    return std::string_view{reinterpret_cast<const char*>(node->ns->href)} == wordml_namespace &&
           std::string_view{reinterpret_cast<const char*>(node->name)} == name;
}

inline auto first_element(xmlNode* node) -> xmlNode* {
    while (node != nullptr && node->type != XML_ELEMENT_NODE) node = node->next;
    return node;
}

inline auto next_element(xmlNode* node) -> xmlNode* {
    return first_element(node->next);
}

// The first child element in the w namespace with the given name.
inline auto find_w_child(xmlNode* parent, std::string_view name) -> xmlNode* {
    for (auto* child = first_element(parent->children); child; child = next_element(child)) {
        if (is_w(child, name)) return child;
    }
    return nullptr;
}

// A namespaced w:<name> attribute.
inline auto w_attribute(const xmlNode* node, const char* name) -> std::optional<std::string> {
    auto value = XmlString{xmlGetNsProp(node, xml_chars(name), xml_chars(w_namespace()))};
    if (!value) return std::nullopt;
    return std::string{reinterpret_cast<const char*>(value.get())};
}

inline auto parse_id(const std::string& text) -> std::optional<std::int64_t> {
    auto value = std::int64_t{0};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

// Add a w:<name> child with optional w:val.
inline auto add_w(xmlNode* parent, xmlNs* ns, const char* name) -> xmlNode* {
    return xmlNewChild(parent, ns, xml_chars(name), nullptr);
}

inline auto add_w(xmlNode* parent, xmlNs* ns, const char* name, const std::string& val)
    -> xmlNode* {
    auto* node = add_w(parent, ns, name);
    xmlSetNsProp(node, ns, xml_chars("val"), xml_chars(val));
    return node;
}

inline void set_w(xmlNode* node, xmlNs* ns, const char* name, const std::string& value) {
    xmlSetNsProp(node, ns, xml_chars(name), xml_chars(value));
}

}  // namespace litdocx::ooxml
