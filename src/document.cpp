#include <litdocx/document.hpp>

namespace litdocx {

auto Paragraph::text() const -> std::string {
    auto result = std::string{};
    for (const auto& run : runs) result += run.text();
    return result;
}

}  // namespace litdocx
