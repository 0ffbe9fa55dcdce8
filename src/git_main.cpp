#include "agents/git.hpp"
#include "config.hpp"
#include "log.hpp"
#include "sandbox.hpp"
#include "server.hpp"
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

static void print_usage() {
    std::cout << "Usage: toolbelt-git\n"
              << "\n"
              << "Serves git tools over line-delimited JSON-RPC on stdin/stdout.\n"
              << "Repository and file paths must resolve inside the allowed directories.\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help              Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  TOOLBELT_ALLOWED_PATHS  Comma-separated allowed directories (default: $HOME)\n"
              << "  TOOLBELT_LOG_DIR        Log directory (default: ~/.toolbelt/logs)\n"
              << "  TOOLBELT_LOG_LEVEL      trace, debug, info, warn, error or off\n"
              << "  TOOLBELT_CONFIG         Config file (default: ~/.toolbelt/config.json)\n";
}

int main(int argc, char* argv[]) try {
    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        }
        std::cerr << "Unknown option: " << argv[i] << "\n";
        print_usage();
        return 1;
    }

    auto config = toolbelt::Config::load();
    auto log = toolbelt::make_logger("toolbelt-git", config.resolved_log_dir(), config.log_level);

    std::vector<std::string> skipped;
    auto roots = toolbelt::PathSandbox::canonical_roots(config.allowed_paths, &skipped);
    for (const auto& s : skipped) {
        log->warn("Skipping allowed path {}: not an existing directory", s);
    }
    if (roots.empty()) {
        const char* home = std::getenv("HOME");
        if (home && *home) {
            roots = toolbelt::PathSandbox::canonical_roots({home});
        }
    }
    if (roots.empty()) {
        log->error("No usable allowed paths and $HOME is not a directory");
        std::cerr << "Error: no allowed paths; set TOOLBELT_ALLOWED_PATHS\n";
        return 1;
    }

    toolbelt::PathSandbox sandbox(roots);
    log->info("Starting toolbelt-git server");
    for (const auto& root : sandbox.roots()) {
        log->info("Allowed path: {}", root);
    }

    std::signal(SIGPIPE, SIG_IGN);

    toolbelt::GitBackend backend(*log);
    return toolbelt::serve(toolbelt::ServerInfo{"toolbelt-git"}, toolbelt::git_tools(),
                           backend, sandbox, *log);
} catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 1;
}
