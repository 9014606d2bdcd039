#include <litdocx/error.hpp>
#include <litdocx/markdown.hpp>
#include <litdocx/ooxml.hpp>
#include <litdocx/pipeline.hpp>
#include <litdocx/term_emphasis.hpp>

#include <plog/Log.h>

#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

namespace litdocx {

namespace {

[[noreturn]] void archive_error(std::string message) {
    throw ConversionError{ErrorKind::archive_error, std::move(message)};
}

auto load_template(std::span<const std::byte> template_docx) -> Archive {
    auto archive = Archive::load(template_docx);
    if (!archive) archive_error("template is not a readable ZIP archive");
    return std::move(*archive);
}

}  // anonymous namespace

auto prepare_markup(std::string_view source, const Options& options) -> std::string {
    auto markdown = extract_annotated_lines(source, options.marker);
    PLOG_DEBUG << "extracted " << markdown.size() << " bytes of annotated prose";
    if (!options.emphasize_terms) return markdown;
    return emphasize_terms(markdown);
}

auto convert_markdown(std::string_view markdown, NumberingAllocator& allocator,
                      const Options& options) -> ConversionResult {
    auto root = parse_markdown(markdown);
    PLOG_DEBUG << "parsed " << root.children.size() << " top-level blocks";
    return convert_document(root, allocator, options.styles);
}

auto render_docx(std::string_view source, std::span<const std::byte> template_docx,
                 const Options& options) -> Bytes {
    auto archive = load_template(template_docx);

    auto document_xml = archive.read_text(document_part);
    if (!document_xml) archive_error("template has no " + std::string{document_part});

    auto catalog = std::optional<NumberingCatalog>{};
    if (auto numbering_xml = archive.read_text(numbering_part)) {
        catalog = NumberingCatalog::parse(*numbering_xml);
    }

    auto allocator = catalog ? NumberingAllocator{catalog->max_num_id(),
                                                  catalog->max_abstract_num_id(),
                                                  options.bullet_abstract_num_id}
                             : NumberingAllocator{0, 0, options.bullet_abstract_num_id};

    auto result = convert_markdown(prepare_markup(source, options), allocator, options);
    PLOG_INFO << "converted " << result.document.size() << " paragraphs, "
              << result.numbering.size() << " lists";

    if (!result.numbering.empty()) {
        if (!catalog) {
            throw ConversionError{ErrorKind::catalog_error,
                                  "template has no " + std::string{numbering_part} +
                                      " but the document contains lists"};
        }
        catalog->merge(result.numbering, options);
        archive.put_text(numbering_part, catalog->to_xml());
    }
    archive.put_text(document_part, write_document_xml(result.document, *document_xml, options));
    return archive.save();
}

void render_docx_file(const std::filesystem::path& source_path,
                      const std::filesystem::path& template_path,
                      const std::filesystem::path& output_path,
                      const Options& options) {
    auto source = read_file(source_path);
    auto template_docx = read_file(template_path);
    PLOG_INFO << "rendering " << source_path.string() << " with template "
              << template_path.string();

    auto output = render_docx(to_string(source), template_docx, options);
    write_file(output_path, output);
    PLOG_INFO << "wrote " << output.size() << " bytes to " << output_path.string();
}

auto read_file(const std::filesystem::path& path) -> Bytes {
    auto in = std::ifstream{path, std::ios::binary};
    if (!in) throw ConversionError{ErrorKind::io_error, "cannot open " + path.string()};

    auto text = std::string{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    if (in.bad()) throw ConversionError{ErrorKind::io_error, "cannot read " + path.string()};
    return to_bytes(text);
}

// The data lands in a sibling temporary file first, so an existing output
// is never left truncated.
void write_file(const std::filesystem::path& path, std::span<const std::byte> data) {
    auto temporary = path;
    temporary += ".tmp";
    {
        auto out = std::ofstream{temporary, std::ios::binary | std::ios::trunc};
        if (!out) throw ConversionError{ErrorKind::io_error, "cannot create " + temporary.string()};
        out.write(reinterpret_cast<const char*>(data.data()),
                  static_cast<std::streamsize>(data.size()));
        out.close();
        if (!out) {
            auto ec = std::error_code{};
            std::filesystem::remove(temporary, ec);
            throw ConversionError{ErrorKind::io_error, "cannot write " + temporary.string()};
        }
    }

    auto ec = std::error_code{};
    std::filesystem::rename(temporary, path, ec);
    if (ec) {
        auto ignored = std::error_code{};
        std::filesystem::remove(temporary, ignored);
        throw ConversionError{ErrorKind::io_error,
                              "cannot replace " + path.string() + ": " + ec.message()};
    }
}

}  // namespace litdocx
