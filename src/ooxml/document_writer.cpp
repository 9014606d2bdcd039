#include <litdocx/ooxml.hpp>

#include "xml.hpp"

#include <string>
#include <variant>

namespace litdocx {

namespace {

using ooxml::add_w;
using ooxml::set_w;
using ooxml::xml_chars;

void write_run_properties(xmlNode* run, xmlNs* ns, const RunAttributes& attrs,
                          const Options& options) {
    if (!attrs.emphasis && !attrs.strong && !attrs.code) return;

    // Schema order: rFonts, b, i.
    auto* properties = add_w(run, ns, "rPr");
    if (attrs.code) {
        auto* fonts = add_w(properties, ns, "rFonts");
        set_w(fonts, ns, "ascii", options.code_font);
        set_w(fonts, ns, "hAnsi", options.code_font);
    }
    if (attrs.strong || attrs.code) add_w(properties, ns, "b");
    if (attrs.emphasis) add_w(properties, ns, "i");
}

void write_run(xmlNode* paragraph, xmlNs* ns, const Run& run, const Options& options) {
    auto* node = add_w(paragraph, ns, "r");
    write_run_properties(node, ns, run.attributes, options);
    for (const auto& segment : run.segments) {
        std::visit(overload{
            [&](const TextSegment& t) {
                auto* text = xmlNewTextChild(node, ns, xml_chars("t"), xml_chars(t.text));
                if (t.preserve_space()) xmlNodeSetSpacePreserve(text, 1);
            },
            [&](LineBreak) { add_w(node, ns, "br"); },
            [&](PageBreak) { set_w(add_w(node, ns, "br"), ns, "type", "page"); },
            [&](Tab) { add_w(node, ns, "tab"); },
        }, segment);
    }
}

void write_paragraph(xmlNode* node, xmlNs* ns, const Paragraph& paragraph,
                     const Options& options) {
    if (paragraph.style || paragraph.numbering) {
        auto* properties = add_w(node, ns, "pPr");
        if (paragraph.style) add_w(properties, ns, "pStyle", *paragraph.style);
        if (paragraph.numbering) {
            auto* numbering = add_w(properties, ns, "numPr");
            add_w(numbering, ns, "ilvl", std::to_string(paragraph.numbering->level));
            add_w(numbering, ns, "numId", std::to_string(paragraph.numbering->num_id));
        }
    }
    for (const auto& run : paragraph.runs) write_run(node, ns, run, options);
}

// Fill `body` with the document's paragraphs, ahead of `section` (the
// body's final w:sectPr) when there is one.
void write_body(xmlDoc* doc, xmlNode* body, xmlNode* section, xmlNs* ns, const Document& document,
                const Options& options) {
    for (const auto& paragraph : document.paragraphs) {
        auto* node = xmlNewDocNode(doc, ns, xml_chars("p"), nullptr);
        if (section) {
            xmlAddPrevSibling(section, node);
        } else {
            xmlAddChild(body, node);
        }
        write_paragraph(node, ns, paragraph, options);
    }
}

}  // anonymous namespace

auto write_document_xml(const Document& doc, const Options& options) -> std::string {
    auto xml = ooxml::DocPtr{xmlNewDoc(xml_chars("1.0"))};
    xml->standalone = 1;
    auto* root = xmlNewDocNode(xml.get(), nullptr, xml_chars("document"), nullptr);
    xmlDocSetRootElement(xml.get(), root);
    auto* ns = xmlNewNs(root, xml_chars(ooxml::w_namespace()), xml_chars("w"));
    xmlSetNs(root, ns);

    auto* body = add_w(root, ns, "body");
    write_body(xml.get(), body, nullptr, ns, doc, options);
    return ooxml::serialize(xml.get());
}

auto write_document_xml(const Document& doc, std::string_view template_xml,
                        const Options& options) -> std::string {
    auto xml = ooxml::parse(template_xml, ErrorKind::archive_error, document_part);

    auto* root = xmlDocGetRootElement(xml.get());
    if (!ooxml::is_w(root, "document")) {
        throw ConversionError{ErrorKind::archive_error,
                              std::string{document_part} + " is not a w:document"};
    }
    auto* body = ooxml::find_w_child(root, "body");
    if (!body) {
        throw ConversionError{ErrorKind::archive_error,
                              std::string{document_part} + " has no w:body"};
    }
    auto* ns = xmlSearchNsByHref(xml.get(), root, xml_chars(ooxml::w_namespace()));

    // Keep only the final section properties.
    auto* section = static_cast<xmlNode*>(nullptr);
    for (auto* child = body->last; child; child = child->prev) {
        if (child->type != XML_ELEMENT_NODE) continue;
        if (ooxml::is_w(child, "sectPr")) section = child;
        break;
    }
    for (auto* child = body->children; child;) {
        auto* next = child->next;
        if (child != section) {
            xmlUnlinkNode(child);
            xmlFreeNode(child);
        }
        child = next;
    }

    write_body(xml.get(), body, section, ns, doc, options);
    return ooxml::serialize(xml.get());
}

}  // namespace litdocx
