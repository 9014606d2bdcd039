/// @file pipeline.hpp
/// @brief End-to-end rendering: annotated source to .docx package.

#pragma once

#include <litdocx/archive.hpp>
#include <litdocx/converter.hpp>
#include <litdocx/numbering.hpp>
#include <litdocx/options.hpp>

#include <filesystem>
#include <span>
#include <string>
#include <string_view>

namespace litdocx {

/// Extract the annotated prose of a source file and, if enabled, apply the
/// term-emphasis pass. The result is markdown.
auto prepare_markup(std::string_view source, const Options& options = {}) -> std::string;

/// Parse markdown and convert it.
/// @throws ConversionError on markup or structural errors.
auto convert_markdown(std::string_view markdown, NumberingAllocator& allocator,
                      const Options& options = {}) -> ConversionResult;

/// Render an annotated source file into a copy of a template package.
///
/// The template's numbering catalog seeds the allocator; the converted
/// document replaces word/document.xml and the minted lists are registered
/// in word/numbering.xml. Every other entry is copied untouched.
/// @param source The annotated source text.
/// @param template_docx The template package bytes.
/// @return The new package bytes.
/// @throws ConversionError on any failure; nothing partial is returned.
auto render_docx(std::string_view source, std::span<const std::byte> template_docx,
                 const Options& options = {}) -> Bytes;

/// File-based render_docx. The output file is written only after the whole
/// conversion succeeded.
/// @throws ConversionError (io_error) if a file cannot be read or written,
///   or any error of render_docx().
void render_docx_file(const std::filesystem::path& source_path,
                      const std::filesystem::path& template_path,
                      const std::filesystem::path& output_path,
                      const Options& options = {});

/// Read a whole file.
/// @throws ConversionError (io_error) on failure.
auto read_file(const std::filesystem::path& path) -> Bytes;

/// Write a whole file, replacing any existing one.
/// @throws ConversionError (io_error) on failure.
void write_file(const std::filesystem::path& path, std::span<const std::byte> data);

}  // namespace litdocx
