#include <litdocx/archive.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace litdocx;

namespace {

auto sample_archive() -> Archive {
    auto archive = Archive{};
    archive.put_text("[Content_Types].xml", "<Types/>");
    archive.put_text("word/document.xml", "<w:document/>");
    archive.put_text("docProps/app.xml", "<Properties/>");
    return archive;
}

}  // anonymous namespace

TEST(Archive, empty_archive_round_trips) {
    auto loaded = Archive::load(Archive{}.save());
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->size(), 0u);
}

TEST(Archive, save_load_preserves_entries_and_order) {
    auto archive = sample_archive();
    auto loaded = Archive::load(archive.save());
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->entries(), archive.entries());
    EXPECT_EQ(loaded->names(), (std::vector<std::string>{
        "[Content_Types].xml", "word/document.xml", "docProps/app.xml"}));
}

TEST(Archive, large_compressible_entry_is_deflated) {
    auto archive = Archive{};
    archive.put_text("big.txt", std::string(10000, 'a'));
    auto bytes = archive.save();
    EXPECT_LT(bytes.size(), 1000u);

    auto loaded = Archive::load(bytes);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->read_text("big.txt"), std::string(10000, 'a'));
}

TEST(Archive, save_is_deterministic) {
    EXPECT_EQ(sample_archive().save(), sample_archive().save());
}

TEST(Archive, put_replaces_in_place) {
    auto archive = sample_archive();
    archive.put_text("word/document.xml", "<new/>");
    EXPECT_EQ(archive.size(), 3u);
    EXPECT_EQ(archive.names()[1], "word/document.xml");
    EXPECT_EQ(archive.read_text("word/document.xml"), "<new/>");
}

TEST(Archive, put_appends_new_entries) {
    auto archive = sample_archive();
    archive.put_text("word/numbering.xml", "<w:numbering/>");
    EXPECT_EQ(archive.size(), 4u);
    EXPECT_EQ(archive.names().back(), "word/numbering.xml");
}

TEST(Archive, read_missing_entry) {
    auto archive = sample_archive();
    EXPECT_FALSE(archive.contains("word/numbering.xml"));
    EXPECT_FALSE(archive.read("word/numbering.xml").has_value());
    EXPECT_FALSE(archive.read_text("word/numbering.xml").has_value());
}

TEST(Archive, non_ascii_names_round_trip) {
    auto archive = Archive{};
    archive.put_text("media/b\xc3\xa4r.txt", "x");
    auto loaded = Archive::load(archive.save());
    ASSERT_TRUE(loaded.has_value());
    EXPECT_TRUE(loaded->contains("media/b\xc3\xa4r.txt"));
}

TEST(Archive, rejects_non_zip_data) {
    EXPECT_FALSE(Archive::load(to_bytes("")).has_value());
    EXPECT_FALSE(Archive::load(to_bytes("definitely not a zip archive")).has_value());
}

TEST(Archive, rejects_truncated_data) {
    auto bytes = sample_archive().save();
    bytes.resize(bytes.size() / 2);
    EXPECT_FALSE(Archive::load(bytes).has_value());
}

TEST(Archive, rejects_crc_mismatch) {
    auto archive = Archive{};
    archive.put_text("a.txt", "hello");
    auto bytes = archive.save();

    // Entry data follows the 30-byte local header and the name.
    bytes[30 + 5] ^= std::byte{0x01};
    EXPECT_FALSE(Archive::load(bytes).has_value());
}

TEST(Archive, empty_entry_round_trips) {
    auto archive = Archive{};
    archive.put("empty", Bytes{});
    archive.put_text("after", "x");
    auto loaded = Archive::load(archive.save());
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->read("empty"), Bytes{});
    EXPECT_EQ(loaded->read_text("after"), "x");
}

TEST(Archive, text_byte_conversion) {
    auto bytes = to_bytes("a\0b");
    EXPECT_EQ(to_string(to_bytes(std::string_view{"a\0b", 3})), std::string("a\0b", 3));
    EXPECT_EQ(bytes.size(), 1u);
}
