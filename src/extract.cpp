#include <litdocx/markdown.hpp>

#include <string>

namespace litdocx {

namespace {

auto trim(std::string_view line) -> std::string_view {
    constexpr std::string_view space = " \t\r\n\v\f";
    auto begin = line.find_first_not_of(space);
    if (begin == std::string_view::npos) return {};
    auto end = line.find_last_not_of(space);
    return line.substr(begin, end - begin + 1);
}

}  // anonymous namespace

auto extract_annotated_lines(std::string_view source, std::string_view marker) -> std::string {
    auto result = std::string{};
    auto pos = std::size_t{0};
    while (pos < source.size()) {
        auto eol = source.find('\n', pos);
        if (eol == std::string_view::npos) eol = source.size();
        auto line = trim(source.substr(pos, eol - pos));
        pos = eol + 1;

        if (marker.empty() || !line.starts_with(marker)) continue;
        line.remove_prefix(marker.size());
        if (line.starts_with(' ')) line.remove_prefix(1);
        result += line;
        result.push_back('\n');
    }
    return result;
}

}  // namespace litdocx
