// json_interop_demo - litdocx and nlohmann/json
//
// Shows options loaded from JSON, the markup tree and the converted
// document dumped as JSON, and a markup tree built from JSON by hand.
//
// Build: cmake --build build
// Run:   ./build/examples/json_interop_demo

#include <litdocx/json.hpp>
#include <litdocx/litdocx.hpp>

#include <nlohmann/json.hpp>

#include <cstdio>
#include <string>

using json = nlohmann::json;

int main() {
    // -- Options from JSON ----------------------------------------------------
    auto options = json::parse(R"({
        "code_font": "Consolas",
        "ordered_template_abstract_num_id": 7,
        "styles": {"ordered_list": "Steps"}
    })").get<litdocx::Options>();
    std::printf("options:\n%s\n\n", json(options).dump(2).c_str());

    // -- Markup tree as JSON --------------------------------------------------
    auto tree = litdocx::parse_markdown("# Title\n\n1. one `x`\n2. two\n");
    std::printf("tree:\n%s\n\n", json(tree).dump(2).c_str());

    // -- Conversion result as JSON --------------------------------------------
    auto allocator = litdocx::NumberingAllocator{0, 0, options.bullet_abstract_num_id};
    auto result = litdocx::convert_document(tree, allocator, options.styles);
    std::printf("result:\n%s\n\n", json(result).dump(2).c_str());

    // -- Markup tree from JSON ------------------------------------------------
    auto handmade = json::parse(R"({
        "tag": "body",
        "children": [
            {"tag": "p", "text": "Press ", "children": [
                {"tag": "strong", "text": "Enter", "tail": " twice."}
            ]}
        ]
    })").get<litdocx::MarkupNode>();
    auto fresh = litdocx::NumberingAllocator{0, 0, 1};
    auto converted = litdocx::convert_document(handmade, fresh);
    std::printf("handmade: %s\n", converted.document.paragraphs.front().text().c_str());

    return 0;
}
