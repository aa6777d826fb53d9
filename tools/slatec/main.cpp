/// @file main.cpp
/// @brief slatec - presentation content compiler command line
///
/// Usage:
///   slatec [--log-level <level>] [--log-dir <dir>] load <dir>
///   slatec [--log-level <level>] [--log-dir <dir>] check <dir>
///   slatec [--log-level <level>] [--log-dir <dir>] resave <dir>
///   slatec [--log-level <level>] [--log-dir <dir>] save <dir> <payload.json>

#include <slate/content/content.hpp>
#include <slate/core/log.hpp>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace {

void print_usage() {
    std::cerr << "usage: slatec [--log-level <level>] [--log-dir <dir>] <command> <dir> [payload.json]\n"
              << "commands:\n"
              << "  load <dir>                 compile and print the JSON payload\n"
              << "  check <dir>                compile and print a summary\n"
              << "  resave <dir>               compile and write back in canonical form\n"
              << "  save <dir> <payload.json>  import an editor payload and write it\n";
}

/// Log a failed step with its full error chain
int fail(const std::string& what, const slate_core::Error& error) {
    SLATE_LOG_ERROR("{} failed: {}", what, slate_core::build_error_chain(error));
    slate_core::flush_logging();
    return EXIT_FAILURE;
}

int run_load(const std::filesystem::path& dir) {
    auto graph = slate_content::load(dir);
    if (!graph) {
        return fail("load", graph.error());
    }
    std::cout << slate_content::to_json(*graph).dump(2) << std::endl;
    return EXIT_SUCCESS;
}

int run_check(const std::filesystem::path& dir) {
    auto graph = slate_content::load(dir);
    if (!graph) {
        return fail("check", graph.error());
    }
    std::cout << dir.string() << ": ok (" << graph->views.size() << " views, "
              << graph->nodes.size() << " nodes, "
              << graph->animation_cues.size() << " cues)" << std::endl;
    return EXIT_SUCCESS;
}

int run_resave(const std::filesystem::path& dir) {
    auto graph = slate_content::load(dir);
    if (!graph) {
        return fail("resave", graph.error());
    }
    auto saved = slate_content::save(*graph, dir);
    if (!saved) {
        return fail("resave", saved.error());
    }
    SLATE_LOG_INFO("rewrote {}", dir.string());
    return EXIT_SUCCESS;
}

int run_save(const std::filesystem::path& dir, const std::filesystem::path& payload_path) {
    auto text = slate_content::read_text_file(payload_path);
    if (!text) {
        return fail("save", text.error());
    }
    auto graph = slate_content::presentation_from_json_string(*text);
    if (!graph) {
        return fail("save", graph.error());
    }

    slate_content::SaveOptions options;
    options.write_defaults = true;
    auto saved = slate_content::save(*graph, dir, options);
    if (!saved) {
        return fail("save", saved.error());
    }
    SLATE_LOG_INFO("saved {} nodes into {}", graph->nodes.size(), dir.string());
    return EXIT_SUCCESS;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    slate_core::LogConfig log_config;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--log-level" && i + 1 < argc) {
            auto level = slate_core::parse_log_level(argv[++i]);
            if (!level) {
                std::cerr << "slatec: unknown log level '" << argv[i] << "'\n";
                return EXIT_FAILURE;
            }
            log_config.level = *level;
        } else if (arg == "--log-dir" && i + 1 < argc) {
            log_config.log_directory = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            print_usage();
            return EXIT_SUCCESS;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() < 2) {
        print_usage();
        return EXIT_FAILURE;
    }

    slate_core::configure_logging(log_config);

    const std::string& command = positional[0];
    std::filesystem::path dir = positional[1];

    int exit_code = EXIT_FAILURE;
    try {
        if (command == "load") {
            exit_code = run_load(dir);
        } else if (command == "check") {
            exit_code = run_check(dir);
        } else if (command == "resave") {
            exit_code = run_resave(dir);
        } else if (command == "save" && positional.size() >= 3) {
            exit_code = run_save(dir, positional[2]);
        } else {
            print_usage();
        }
    } catch (const std::exception& e) {
        SLATE_LOG_ERROR("FATAL EXCEPTION: {}", e.what());
        exit_code = EXIT_FAILURE;
    }

    slate_core::shutdown_logging();
    return exit_code;
}
