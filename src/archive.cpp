#include <litdocx/archive.hpp>

#include <litdocx/error.hpp>

extern "C" {
#include <miniz.h>
}

#include <algorithm>
#include <cstring>
#include <memory>
#include <set>
#include <utility>

namespace litdocx {

namespace {

// Noon on 1980-01-01 UTC: every entry's timestamp, a valid DOS date in any
// time zone.
constexpr MZ_TIME_T entry_timestamp = 315576000;

struct HeapDeleter {
    void operator()(void* p) const noexcept { mz_free(p); }
};

using HeapPtr = std::unique_ptr<void, HeapDeleter>;

// An initialized mz_zip_archive, reader or writer, ended on scope exit.
class ZipHandle {
public:
    ZipHandle() { std::memset(&zip_, 0, sizeof(zip_)); }
    ~ZipHandle() {
        if (reading_) mz_zip_reader_end(&zip_);
        if (writing_) mz_zip_writer_end(&zip_);
    }

    ZipHandle(const ZipHandle&) = delete;
    auto operator=(const ZipHandle&) -> ZipHandle& = delete;

    auto open_reader(std::span<const std::byte> data) -> bool {
        reading_ = mz_zip_reader_init_mem(&zip_, data.data(), data.size(), 0);
        return reading_;
    }

    auto open_writer() -> bool {
        writing_ = mz_zip_writer_init_heap(&zip_, 0, 0);
        return writing_;
    }

    auto get() -> mz_zip_archive* { return &zip_; }

    auto last_error() -> std::string {
        return mz_zip_get_error_string(mz_zip_get_last_error(&zip_));
    }

private:
    mz_zip_archive zip_;
    bool reading_{false};
    bool writing_{false};
};

[[noreturn]] void archive_error(std::string message) {
    throw ConversionError{ErrorKind::archive_error, std::move(message)};
}

auto read_entry(mz_zip_archive* zip, mz_uint index, const mz_zip_archive_file_stat& stat)
    -> std::optional<Bytes> {
    if (stat.m_is_encrypted || !stat.m_is_supported) return std::nullopt;
    if (stat.m_uncomp_size == 0) {
        // Nothing to inflate; the CRC-32 of no bytes is 0.
        if (stat.m_crc32 != 0) return std::nullopt;
        return Bytes{};
    }

    auto size = std::size_t{0};
    auto contents = HeapPtr{mz_zip_reader_extract_to_heap(zip, index, &size, 0)};
    if (!contents) return std::nullopt;
    const auto* first = static_cast<const std::byte*>(contents.get());
    return Bytes(first, first + size);
}

}  // anonymous namespace

// -- Archive -------------------------------------------------------------------

auto Archive::load(std::span<const std::byte> data) -> std::optional<Archive> {
    auto zip = ZipHandle{};
    if (!zip.open_reader(data)) return std::nullopt;

    auto result = Archive{};
    auto seen = std::set<std::string, std::less<>>{};
    auto count = mz_zip_reader_get_num_files(zip.get());
    for (auto index = mz_uint{0}; index < count; ++index) {
        auto stat = mz_zip_archive_file_stat{};
        if (!mz_zip_reader_file_stat(zip.get(), index, &stat)) return std::nullopt;

        auto name = std::string{stat.m_filename};
        if (!seen.insert(name).second) return std::nullopt;

        auto contents = read_entry(zip.get(), index, stat);
        if (!contents) return std::nullopt;
        result.entries_.push_back(Entry{std::move(name), std::move(*contents)});
    }
    return result;
}

auto Archive::save() const -> Bytes {
    auto zip = ZipHandle{};
    if (!zip.open_writer()) archive_error("cannot start a zip archive: " + zip.last_error());

    auto timestamp = entry_timestamp;
    for (const auto& entry : entries_) {
        auto ok = mz_zip_writer_add_mem_ex_v2(zip.get(), entry.name.c_str(), entry.data.data(),
                                              entry.data.size(), nullptr, 0, MZ_DEFAULT_LEVEL,
                                              0, 0, &timestamp, nullptr, 0, nullptr, 0);
        if (!ok) archive_error("cannot add \"" + entry.name + "\": " + zip.last_error());
    }

    void* buffer = nullptr;
    auto size = std::size_t{0};
    if (!mz_zip_writer_finalize_heap_archive(zip.get(), &buffer, &size)) {
        archive_error("cannot finish the zip archive: " + zip.last_error());
    }
    auto owned = HeapPtr{buffer};
    const auto* first = static_cast<const std::byte*>(owned.get());
    return Bytes(first, first + size);
}

auto Archive::contains(std::string_view name) const -> bool {
    return std::ranges::any_of(entries_, [&](const Entry& e) { return e.name == name; });
}

auto Archive::read(std::string_view name) const -> std::optional<Bytes> {
    auto it = std::ranges::find(entries_, name, &Entry::name);
    if (it == entries_.end()) return std::nullopt;
    return it->data;
}

auto Archive::read_text(std::string_view name) const -> std::optional<std::string> {
    auto it = std::ranges::find(entries_, name, &Entry::name);
    if (it == entries_.end()) return std::nullopt;
    return to_string(it->data);
}

void Archive::put(std::string_view name, Bytes data) {
    auto it = std::ranges::find(entries_, name, &Entry::name);
    if (it != entries_.end()) {
        it->data = std::move(data);
    } else {
        entries_.push_back(Entry{std::string{name}, std::move(data)});
    }
}

void Archive::put_text(std::string_view name, std::string_view text) {
    put(name, to_bytes(text));
}

auto Archive::names() const -> std::vector<std::string> {
    auto result = std::vector<std::string>{};
    result.reserve(entries_.size());
    for (const auto& entry : entries_) result.push_back(entry.name);
    return result;
}

auto to_bytes(std::string_view text) -> Bytes {
    auto result = Bytes(text.size());
    std::ranges::transform(text, result.begin(), [](char c) { return static_cast<std::byte>(c); });
    return result;
}

auto to_string(std::span<const std::byte> data) -> std::string {
    return std::string{reinterpret_cast<const char*>(data.data()), data.size()};
}

}  // namespace litdocx
