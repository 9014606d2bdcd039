#include <litdocx/error.hpp>
#include <litdocx/json.hpp>
#include <litdocx/options.hpp>

#include <fstream>
#include <sstream>
#include <string>

namespace litdocx {

auto load_options(const std::filesystem::path& path) -> Options {
    auto in = std::ifstream{path, std::ios::binary};
    if (!in) {
        throw ConversionError{ErrorKind::io_error, "cannot open " + path.string()};
    }
    auto buffer = std::stringstream{};
    buffer << in.rdbuf();
    if (in.bad()) {
        throw ConversionError{ErrorKind::io_error, "cannot read " + path.string()};
    }

    auto j = nlohmann::json{};
    try {
        j = nlohmann::json::parse(buffer.str());
    } catch (const nlohmann::json::parse_error& e) {
        throw ConversionError{ErrorKind::config_error, path.string() + ": " + e.what()};
    }

    auto options = Options{};
    from_json(j, options);
    return options;
}

}  // namespace litdocx
