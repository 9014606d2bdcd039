// litdocx benchmarks - measures throughput of each conversion stage.

#include <litdocx/litdocx.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>

using namespace litdocx;

// An annotated source of `sections` algorithm sections, each with a
// paragraph, a nested ordered list and a code sample.
static auto make_source(std::int64_t sections) -> std::string {
    auto source = std::string{};
    for (std::int64_t i = 0; i < sections; ++i) {
        auto n = std::to_string(i);
        source += "//> ## Step" + n + " (input, options)\n";
        source += "//>\n";
        source += "//> Let result be a new record. Apply *options* to input.\n";
        source += "//>\n";
        source += "//> 1. If input is `null`, return **failure**.\n";
        source += "//>    - note the first case\n";
        source += "//>    - note the second case\n";
        source += "//> 2. Return result.\n";
        source += "//>\n";
        source += "//>     const x = step" + n + "(input);\n";
        source += "//>\n";
        source += "function step" + n + "(input) { return input; }\n";
    }
    return source;
}

static auto make_template() -> Bytes {
    const auto ns = std::string{"http://schemas.openxmlformats.org/wordprocessingml/2006/main"};
    auto archive = Archive{};
    archive.put_text("[Content_Types].xml", "<Types/>");
    archive.put_text(document_part,
                     R"(<w:document xmlns:w=")" + ns + R"("><w:body><w:sectPr/></w:body></w:document>)");
    archive.put_text(numbering_part,
                     R"(<w:numbering xmlns:w=")" + ns +
                         R"("><w:abstractNum w:abstractNumId="1"/></w:numbering>)");
    return archive.save();
}

// =============================================================================
// Stages
// =============================================================================

static void bm_prepare_markup(benchmark::State& state) {
    const auto source = make_source(state.range(0));
    for (auto _ : state) {
        auto markdown = prepare_markup(source);
        benchmark::DoNotOptimize(markdown);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<std::int64_t>(source.size()));
}
BENCHMARK(bm_prepare_markup)->Arg(10)->Arg(100);

static void bm_parse_markdown(benchmark::State& state) {
    const auto markdown = prepare_markup(make_source(state.range(0)));
    for (auto _ : state) {
        auto tree = parse_markdown(markdown);
        benchmark::DoNotOptimize(tree);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<std::int64_t>(markdown.size()));
}
BENCHMARK(bm_parse_markdown)->Arg(10)->Arg(100);

static void bm_convert_document(benchmark::State& state) {
    const auto tree = parse_markdown(prepare_markup(make_source(state.range(0))));
    for (auto _ : state) {
        auto allocator = NumberingAllocator{0, 0, 1};
        auto result = convert_document(tree, allocator);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_convert_document)->Arg(10)->Arg(100);

static void bm_write_document_xml(benchmark::State& state) {
    const auto tree = parse_markdown(prepare_markup(make_source(state.range(0))));
    auto allocator = NumberingAllocator{0, 0, 1};
    const auto result = convert_document(tree, allocator);
    for (auto _ : state) {
        auto xml = write_document_xml(result.document);
        benchmark::DoNotOptimize(xml);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(result.document.size()));
}
BENCHMARK(bm_write_document_xml)->Arg(10)->Arg(100);

// =============================================================================
// End to end
// =============================================================================

static void bm_render_docx(benchmark::State& state) {
    const auto source = make_source(state.range(0));
    const auto docx = make_template();
    for (auto _ : state) {
        auto output = render_docx(source, docx);
        benchmark::DoNotOptimize(output);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_render_docx)->Arg(10)->Arg(100);

static void bm_archive_save_load(benchmark::State& state) {
    auto archive = Archive{};
    archive.put_text(document_part, std::string(static_cast<std::size_t>(state.range(0)), 'x'));
    for (auto _ : state) {
        auto loaded = Archive::load(archive.save());
        benchmark::DoNotOptimize(loaded);
    }
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_archive_save_load)->Arg(1 << 10)->Arg(1 << 20);
