#include "agents/filesystem.hpp"
#include "config.hpp"
#include "log.hpp"
#include "sandbox.hpp"
#include "server.hpp"
#include <csignal>
#include <cstring>
#include <iostream>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

static void print_usage() {
    std::cout << "Usage: toolbelt-fs <allowed-directory> [additional-directories...]\n"
              << "\n"
              << "Serves filesystem tools over line-delimited JSON-RPC on stdin/stdout.\n"
              << "Every path argument must resolve inside one of the allowed directories.\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  TOOLBELT_LOG_DIR     Log directory (default: ~/.toolbelt/logs)\n"
              << "  TOOLBELT_LOG_LEVEL   trace, debug, info, warn, error or off\n"
              << "  TOOLBELT_CONFIG      Config file (default: ~/.toolbelt/config.json)\n";
}

int main(int argc, char* argv[]) try {
    std::vector<std::string> dirs;
    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        }
        dirs.emplace_back(argv[i]);
    }
    if (dirs.empty()) {
        std::cerr << "Error: at least one allowed directory is required\n\n";
        print_usage();
        return 1;
    }

    auto config = toolbelt::Config::load();
    auto log = toolbelt::make_logger("toolbelt-fs", config.resolved_log_dir(), config.log_level);

    std::vector<std::string> skipped;
    auto roots = toolbelt::PathSandbox::canonical_roots(dirs, &skipped);
    for (const auto& s : skipped) {
        log->warn("Skipping allowed directory {}: not an existing directory", s);
    }
    if (roots.empty()) {
        log->error("No usable allowed directories");
        std::cerr << "Error: none of the given directories exist\n";
        return 1;
    }

    toolbelt::PathSandbox sandbox(roots);
    log->info("Starting toolbelt-fs server");
    for (const auto& root : sandbox.roots()) {
        log->info("Allowed directory: {}", root);
    }

    // A closed stdout must surface as a write error, not kill the process
    std::signal(SIGPIPE, SIG_IGN);

    toolbelt::FilesystemBackend backend(sandbox);
    return toolbelt::serve(toolbelt::ServerInfo{"toolbelt-fs"}, toolbelt::filesystem_tools(),
                           backend, sandbox, *log);
} catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 1;
}
