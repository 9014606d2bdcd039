// Fuzz target for Archive::load() - exercises the miniz reader and inflate.
// Any archive that loads is round-tripped through save().

#include <litdocx/archive.hpp>
#include <litdocx/error.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto span = std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), size);

    auto archive = litdocx::Archive::load(span);
    if (!archive) return 0;

    auto bytes = litdocx::Bytes{};
    try {
        bytes = archive->save();
    } catch (const litdocx::ConversionError&) {
        return 0;  // the writer refused an entry the reader accepted
    }
    auto reloaded = litdocx::Archive::load(bytes);
    if (!reloaded || reloaded->entries() != archive->entries()) std::abort();
    return 0;
}
