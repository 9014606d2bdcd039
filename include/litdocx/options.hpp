/// @file options.hpp
/// @brief Rendering options: style names, numbering constants, markers.

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace litdocx {

/// Paragraph style ids used by the converter.
///
/// The defaults name styles that must exist in the template document.
struct StyleNames {
    std::string heading_prefix{"Heading"};  ///< Heading level n uses prefix + n.
    std::string note{"Note"};
    std::string bullet_list{"BulletNotlast"};
    std::string ordered_list{"Alg4"};
    std::string code_block{"CodeSample3"};

    auto operator==(const StyleNames&) const -> bool = default;
};

/// Everything the pipeline can be configured with.
struct Options {
    /// Prefix of the comment lines that carry the document prose.
    std::string marker{"//>"};

    StyleNames styles{};

    /// The existing w:abstractNum shared by every unordered list.
    std::int64_t bullet_abstract_num_id{1};

    /// An existing w:abstractNum cloned for each ordered list. When unset,
    /// a plain decimal definition is generated instead.
    std::optional<std::int64_t> ordered_template_abstract_num_id{};

    /// Font applied to code runs.
    std::string code_font{"Courier New"};

    /// Run the term-emphasis pass before parsing.
    bool emphasize_terms{true};

    auto operator==(const Options&) const -> bool = default;
};

/// Load options from a JSON file. Missing keys keep their defaults.
/// @throws ConversionError (io_error) if the file cannot be read,
///   (config_error) if it is not valid JSON or a value has the wrong type.
auto load_options(const std::filesystem::path& path) -> Options;

}  // namespace litdocx
