#include "ydispatch/schema.hpp"
#include "ydispatch/version.hpp"
#include <iostream>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);

    std::filesystem::path schema_file;
    std::string class_name;
    std::string log_level;
    int depth = -1;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-s" || arg == "--schema") {
            if (i + 1 < argc) {
                schema_file = argv[++i];
            }
        } else if (arg == "-c" || arg == "--class") {
            if (i + 1 < argc) {
                class_name = argv[++i];
            }
        } else if (arg == "-d" || arg == "--depth") {
            if (i + 1 < argc) {
                try {
                    depth = std::stoi(argv[++i]);
                } catch (const std::exception&) {
                    std::cerr << "Error: invalid depth: " << argv[i] << std::endl;
                    return 1;
                }
            }
        } else if (arg == "-l" || arg == "--log-level") {
            if (i + 1 < argc) {
                log_level = argv[++i];
            }
        } else if (arg == "-v" || arg == "--version") {
            std::cout << "ydispatch-inspect " << ydispatch::version() << "\n";
            return 0;
        } else if (arg == "-h" || arg == "--help") {
            std::cout << "Usage: ydispatch-inspect [options]\n"
                      << "Options:\n"
                      << "  -s, --schema <file>     Schema file (default: schema.yaml)\n"
                      << "  -c, --class <name>      Only print this class\n"
                      << "  -d, --depth <n>         Limit tree depth (default: unlimited)\n"
                      << "  -l, --log-level <lvl>   Override settings.log-level\n"
                      << "  -v, --version           Show version\n"
                      << "  -h, --help              Show this help\n"
                      << "\nExamples:\n"
                      << "  ydispatch-inspect -s widgets.yaml\n"
                      << "  ydispatch-inspect -s widgets.yaml -c Counter -d 1\n";
            return 0;
        } else {
            schema_file = arg;
        }
    }

    if (schema_file.empty()) {
        schema_file = "schema.yaml";
    }
    if (!std::filesystem::exists(schema_file)) {
        std::cerr << "Error: Schema file not found: " << schema_file << std::endl;
        return 1;
    }

    auto schema_res = ydispatch::Schema::create(schema_file);
    if (!schema_res) {
        std::cerr << "Failed to load schema: " << ydispatch::error_msg(schema_res) << std::endl;
        return 1;
    }
    auto schema = *schema_res;

    if (auto res = schema->apply_settings(); !res) {
        std::cerr << "Invalid settings: " << ydispatch::error_msg(res) << std::endl;
        return 1;
    }
    if (!log_level.empty()) {
        spdlog::set_level(spdlog::level::from_str(log_level));
    }

    spdlog::info("Schema file: {}", schema_file.string());
    spdlog::info("Classes: {}", schema->class_names().size());

    auto tree_res = schema->tree();
    if (!tree_res) {
        std::cerr << "Failed to build tree: " << ydispatch::error_msg(tree_res) << std::endl;
        return 1;
    }

    auto path = class_name.empty() ? ydispatch::DataPath::root() : ydispatch::DataPath::root() / class_name;
    auto text = (*tree_res)->as_tree(path, depth);
    if (!text) {
        std::cerr << "Error: " << ydispatch::error_msg(text) << std::endl;
        return 1;
    }
    std::cout << *text;
    return 0;
}
