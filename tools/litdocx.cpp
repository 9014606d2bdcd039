// litdocx - render the annotated prose of a source file into a .docx
//
// Usage: litdocx [-o OUT] [-t TEMPLATE] [-c CONFIG] [--dump-markdown]
//                [--dump-json] [-v] SOURCE

#include <litdocx/json.hpp>
#include <litdocx/litdocx.hpp>

#include <boost/program_options.hpp>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>

#include <filesystem>
#include <iostream>
#include <string>

namespace po = boost::program_options;

namespace {

constexpr int exit_conversion_error = 1;
constexpr int exit_usage_error = 2;

void init_logging(bool verbose) {
    static auto appender = plog::ConsoleAppender<plog::TxtFormatter>{plog::streamStdErr};
    plog::init(verbose ? plog::debug : plog::warning, &appender);
}

}  // anonymous namespace

int main(int argc, char** argv) {
    auto source = std::string{};
    auto output = std::string{};
    auto template_path = std::string{};
    auto config = std::string{};

    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "produce this help message")
        ("output,o", po::value<std::string>(&output),
         "output .docx file (default: SOURCE with a .docx extension)")
        ("template,t", po::value<std::string>(&template_path),
         "template .docx providing styles and numbering definitions")
        ("config,c", po::value<std::string>(&config), "JSON options file")
        ("dump-markdown", "print the extracted markdown and exit")
        ("dump-json", "print the converted document as JSON and exit")
        ("verbose,v", "log progress and debug output");

    po::options_description all("All options");
    all.add(desc).add_options()
        ("source", po::value<std::string>(&source), "annotated source file");

    po::positional_options_description positional;
    positional.add("source", 1);

    auto vm = po::variables_map{};
    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(all)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "litdocx: " << e.what() << "\n" << desc;
        return exit_usage_error;
    }

    if (vm.count("help")) {
        std::cout << "Usage: litdocx [OPTION]... SOURCE\n" << desc;
        return 0;
    }
    if (source.empty()) {
        std::cerr << "litdocx: no source file given\n" << desc;
        return exit_usage_error;
    }

    init_logging(vm.count("verbose") > 0);

    try {
        auto options = config.empty() ? litdocx::Options{} : litdocx::load_options(config);
        PLOG_DEBUG << "options: " << nlohmann::json(options).dump();

        if (vm.count("dump-markdown") || vm.count("dump-json")) {
            auto text = litdocx::to_string(litdocx::read_file(source));
            auto markdown = litdocx::prepare_markup(text, options);
            if (vm.count("dump-markdown")) {
                std::cout << markdown;
            } else {
                auto allocator = litdocx::NumberingAllocator{0, 0, options.bullet_abstract_num_id};
                auto result = litdocx::convert_markdown(markdown, allocator, options);
                std::cout << nlohmann::json(result).dump(2) << "\n";
            }
            return 0;
        }

        if (template_path.empty()) {
            std::cerr << "litdocx: a template (-t) is required to write a .docx\n";
            return exit_usage_error;
        }
        if (output.empty()) {
            output = std::filesystem::path{source}.replace_extension(".docx").string();
        }
        litdocx::render_docx_file(source, template_path, output, options);
    } catch (const litdocx::ConversionError& e) {
        PLOG_ERROR << litdocx::to_string_view(e.kind()) << ": " << e.what();
        return exit_conversion_error;
    }
    return 0;
}
