// basic_usage - demonstrates the core litdocx API
//
// Walks one annotated source through every stage: extraction, the term
// pass, markdown parsing, conversion, and serialization of the document
// and numbering parts.
//
// Build: cmake --build build
// Run:   ./build/examples/basic_usage

#include <litdocx/litdocx.hpp>

#include <cstdio>
#include <string>
#include <variant>

int main() {
    const auto source = std::string{
        "// Ordinary comments are ignored.\n"
        "//> # Resolve (specifier, base)\n"
        "//>\n"
        "//> Let url be the result of parsing specifier against base.\n"
        "//>\n"
        "//> 1. If url is failure, throw.\n"
        "//> 2. Return url.\n"
        "//>\n"
        "//> NOTE The **`this`** value is unused.\n"
        "function resolve(specifier, base) { return new URL(specifier, base); }\n"};

    // -- Extraction and term pass ---------------------------------------------
    auto options = litdocx::Options{};
    auto markdown = litdocx::prepare_markup(source, options);
    std::printf("markdown:\n%s\n", markdown.c_str());

    // -- Markup tree ----------------------------------------------------------
    auto tree = litdocx::parse_markdown(markdown);
    std::printf("top-level blocks: %zu\n", tree.children.size());
    for (const auto& block : tree.children) {
        auto tag = litdocx::to_string_view(block.tag);
        std::printf("  <%.*s>\n", static_cast<int>(tag.size()), tag.data());
    }

    // -- Conversion -----------------------------------------------------------
    // A template whose numbering part already uses ids up to 4 and 2.
    auto allocator = litdocx::NumberingAllocator{4, 2, options.bullet_abstract_num_id};
    auto result = litdocx::convert_document(tree, allocator, options.styles);

    std::printf("\nparagraphs: %zu\n", result.document.size());
    for (const auto& paragraph : result.document.paragraphs) {
        std::printf("  [%s]", paragraph.style.value_or("-").c_str());
        if (paragraph.numbering) {
            std::printf(" num=%lld level=%d", static_cast<long long>(paragraph.numbering->num_id),
                        paragraph.numbering->level);
        }
        std::printf(" %s\n", paragraph.text().c_str());
    }
    for (const auto& pair : result.numbering) {
        std::printf("minted numId %lld -> abstractNumId %lld\n",
                    static_cast<long long>(pair.num_id),
                    static_cast<long long>(pair.abstract_num_id));
    }

    // -- Runs -----------------------------------------------------------------
    const auto& note = result.document.paragraphs.back();
    for (const auto& run : note.runs) {
        for (const auto& segment : run.segments) {
            std::visit(litdocx::overload{
                [&](const litdocx::TextSegment& t) {
                    std::printf("%s%s%s", run.attributes.code ? "`" : "", t.text.c_str(),
                                run.attributes.code ? "`" : "");
                },
                [](litdocx::Tab) { std::printf("<tab>"); },
                [](auto&&) {},
            }, segment);
        }
    }
    std::printf("\n");

    // -- WordprocessingML -----------------------------------------------------
    auto document_xml = litdocx::write_document_xml(result.document, options);
    std::printf("\nword/document.xml: %zu bytes\n", document_xml.size());

    auto catalog = litdocx::NumberingCatalog::empty();
    options.bullet_abstract_num_id = 0;  // no bullet lists in this document
    catalog.merge(result.numbering, options);
    std::printf("word/numbering.xml:\n%s\n", catalog.to_xml().c_str());

    return 0;
}
