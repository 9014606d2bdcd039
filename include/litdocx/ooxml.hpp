/// @file ooxml.hpp
/// @brief WordprocessingML serialization and numbering catalog patching.

#pragma once

#include <litdocx/document.hpp>
#include <litdocx/numbering.hpp>
#include <litdocx/options.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace litdocx {

/// The WordprocessingML main namespace, bound to the `w` prefix.
inline constexpr std::string_view wordml_namespace =
    "http://schemas.openxmlformats.org/wordprocessingml/2006/main";

/// Archive member names inside a .docx package.
inline constexpr std::string_view document_part = "word/document.xml";
inline constexpr std::string_view numbering_part = "word/numbering.xml";

/// Serialize a document as a standalone word/document.xml.
auto write_document_xml(const Document& doc, const Options& options = {}) -> std::string;

/// Serialize a document into the body of an existing word/document.xml.
///
/// The template's root element, namespace declarations and final section
/// properties (w:sectPr) are kept; every other body child is replaced.
/// @throws ConversionError (archive_error) if the template is not a
///   WordprocessingML document.
auto write_document_xml(const Document& doc, std::string_view template_xml,
                        const Options& options) -> std::string;

namespace detail {
struct CatalogState;
}  // namespace detail

/// The numbering definitions of a document (word/numbering.xml).
///
/// Reports the largest identifiers in use, which seed the
/// NumberingAllocator, and registers the pairs a conversion minted.
class NumberingCatalog {
public:
    /// Parse a numbering part.
    /// @throws ConversionError (catalog_error) if the XML is malformed or is
    ///   not a w:numbering element.
    static auto parse(std::string_view xml) -> NumberingCatalog;

    /// An empty w:numbering catalog.
    static auto empty() -> NumberingCatalog;

    ~NumberingCatalog();
    NumberingCatalog(NumberingCatalog&&) noexcept;
    auto operator=(NumberingCatalog&&) noexcept -> NumberingCatalog&;
    NumberingCatalog(const NumberingCatalog&) = delete;
    auto operator=(const NumberingCatalog&) -> NumberingCatalog& = delete;

    /// Largest w:numId in the catalog, 0 when there is none.
    auto max_num_id() const -> std::int64_t;

    /// Largest w:abstractNumId in the catalog, 0 when there is none.
    auto max_abstract_num_id() const -> std::int64_t;

    auto has_num(std::int64_t num_id) const -> bool;
    auto has_abstract_num(std::int64_t abstract_num_id) const -> bool;

    /// Register minted pairs.
    ///
    /// Each pair becomes a w:num. An abstract id the catalog lacks becomes a
    /// new w:abstractNum, cloned from options.ordered_template_abstract_num_id
    /// when that is set and present, otherwise generated as a decimal list.
    /// The bullet definition is never created: it must already exist.
    /// @throws ConversionError (catalog_error) if a pair refers to a missing
    ///   bullet definition or an id is already registered.
    void merge(const std::vector<NumberingPair>& pairs, const Options& options);

    /// Serialize the catalog back to XML.
    auto to_xml() const -> std::string;

private:
    explicit NumberingCatalog(std::unique_ptr<detail::CatalogState> state);

    std::unique_ptr<detail::CatalogState> state_;
};

}  // namespace litdocx
