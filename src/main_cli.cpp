#include <iostream>
#include <string>
#include <vector>
#include <cstring>

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "ptt/parser.h"
#include "app/handler_rules.h"
#include "app/result_json.h"
#include "util/file_loading.h"

void print_usage(const char* name);

// Parses release names using a handler catalog and prints the results as json
int main(int argc, char** argv) {
    // Argument parser
    if (argc <= 1) {
        print_usage(argv[0]);
        return 1;
    }

    const char* catalog_path = argv[1];
    const char* log_path = nullptr;
    bool is_verbose = false;
    std::vector<std::string> titles;

    for (int i = 2; i < argc; i++) {
        const char* arg = argv[i];
        if (std::strcmp(arg, "--verbose") == 0) {
            is_verbose = true;
        } else if (std::strcmp(arg, "--log") == 0) {
            if (i+1 >= argc) {
                std::cerr << "Missing filepath after --log" << std::endl;
                print_usage(argv[0]);
                return 1;
            }
            log_path = argv[++i];
        } else if (std::strcmp(arg, "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else {
            titles.push_back(arg);
        }
    }

    auto logger = (log_path != nullptr) ?
        spdlog::basic_logger_mt("root", log_path) :
        spdlog::stderr_color_mt("root");
    spdlog::set_default_logger(logger);
    spdlog::set_level(is_verbose ? spdlog::level::debug : spdlog::level::info);

    // Load handlers from the catalog
    auto rules_opt = app::load_handler_rules_from_filepath(catalog_path);
    if (!rules_opt) {
        std::cerr << rules_opt.error() << std::endl;
        return 1;
    }

    auto parser = ptt::Parser();
    auto register_res = app::register_handler_rules(parser, rules_opt.value());
    if (!register_res) {
        std::cerr << register_res.error() << std::endl;
        return 1;
    }
    spdlog::info(fmt::format("Loaded {} handlers from {}", parser.GetHandlers().size(), catalog_path));

    auto parse_title = [&parser](const std::string& title) {
        const auto res = parser.Parse(title);
        const auto doc = app::parse_result_to_document(title, res);
        util::write_json_to_stream(doc, std::cout);
    };

    if (!titles.empty()) {
        for (auto& title: titles) {
            parse_title(title);
        }
        return 0;
    }

    // read release names from stdin if none were given
    std::string line;
    while (std::getline(std::cin, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }
        parse_title(line);
    }

    return 0;
}

void print_usage(const char* name) {
    std::cout << "Usage: " << name << " (handlers.json) [--verbose] [--log (filepath)] [title ...]" << std::endl;
    std::cout << "Reads titles from stdin if none are given" << std::endl;
}
