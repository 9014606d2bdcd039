/// @file archive.hpp
/// @brief A minimal ZIP container for .docx packages.

#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace litdocx {

/// Raw bytes.
using Bytes = std::vector<std::byte>;

/// An in-memory ZIP archive.
///
/// Entries keep the order they had in the loaded archive; replacing an
/// entry keeps its position, new entries are appended. Reading and writing
/// go through miniz; encrypted entries are rejected.
class Archive {
public:
    struct Entry {
        std::string name;
        Bytes data;

        auto operator==(const Entry&) const -> bool = default;
    };

    Archive() = default;

    /// Parse an archive. Returns nullopt if the data is not a readable ZIP
    /// or an entry fails its CRC-32 check.
    static auto load(std::span<const std::byte> data) -> std::optional<Archive>;

    /// Serialize the archive. Output is deterministic: every entry carries
    /// the same DOS timestamp.
    /// @throws ConversionError (archive_error) if miniz fails to write it.
    auto save() const -> Bytes;

    auto contains(std::string_view name) const -> bool;

    /// The contents of an entry, or nullopt if absent.
    auto read(std::string_view name) const -> std::optional<Bytes>;

    /// The contents of an entry as text, or nullopt if absent.
    auto read_text(std::string_view name) const -> std::optional<std::string>;

    /// Replace an entry in place, or append it if absent.
    void put(std::string_view name, Bytes data);

    /// Replace or append an entry holding text.
    void put_text(std::string_view name, std::string_view text);

    /// Entry names in archive order.
    auto names() const -> std::vector<std::string>;

    auto entries() const -> const std::vector<Entry>& { return entries_; }
    auto size() const -> std::size_t { return entries_.size(); }

private:
    std::vector<Entry> entries_;
};

/// View text as bytes.
auto to_bytes(std::string_view text) -> Bytes;

/// View bytes as text.
auto to_string(std::span<const std::byte> data) -> std::string;

}  // namespace litdocx
