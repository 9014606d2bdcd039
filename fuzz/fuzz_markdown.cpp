// Fuzz target for the markdown front end: extraction, the term pass, the
// parser and the converter. Only ConversionError may escape the library.

#include <litdocx/litdocx.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};

    try {
        auto markdown = litdocx::emphasize_terms(text);
        auto tree = litdocx::parse_markdown(markdown);
        auto allocator = litdocx::NumberingAllocator{0, 0, 1};
        auto result = litdocx::convert_document(tree, allocator);
        // A converted document must always serialize
        auto xml = litdocx::write_document_xml(result.document);
        (void)xml;
    } catch (const litdocx::ConversionError&) {
        // Rejected input
    }

    auto extracted = litdocx::extract_annotated_lines(text);
    (void)extracted;
    return 0;
}
