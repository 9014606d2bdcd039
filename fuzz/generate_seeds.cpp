// Helper to generate seed corpus files for fuzz testing.
// Build and run once: ./generate_seeds
// Not a fuzz target itself - just a corpus generator.

#include <litdocx/litdocx.hpp>

#include <filesystem>
#include <string>

static void write_seed(const std::filesystem::path& path, const std::string& text) {
    litdocx::write_file(path, litdocx::to_bytes(text));
}

int main() {
    namespace fs = std::filesystem;
    const auto markdown_dir = fs::path{"fuzz/corpus/markdown"};
    const auto archive_dir = fs::path{"fuzz/corpus/archive"};
    fs::create_directories(markdown_dir);
    fs::create_directories(archive_dir);

    // Markdown seeds: one per block construct
    write_seed(markdown_dir / "heading.md", "# Title (a, b)\n\nLet x be a.\n");
    write_seed(markdown_dir / "lists.md", "- a\n  - b\n\n3. c\n4. d\n   more\n");
    write_seed(markdown_dir / "code.md", "```\nfenced\n```\n\n    indented\n");
    write_seed(markdown_dir / "quote.md", "> NOTE quoted *em* **strong**\n> `code`\n");
    write_seed(markdown_dir / "annotated.js", "//> # Doc\n//> text\nint x;\n");

    // Archive seeds: empty, stored, and deflated entries
    write_seed(archive_dir / "empty.zip", litdocx::to_string(litdocx::Archive{}.save()));
    {
        auto archive = litdocx::Archive{};
        archive.put_text("a.txt", "stored");
        archive.put_text("word/document.xml", std::string(4096, 'w'));
        write_seed(archive_dir / "mixed.zip", litdocx::to_string(archive.save()));
    }
    return 0;
}
