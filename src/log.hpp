#pragma once
#include <memory>
#include <string>

namespace spdlog { class logger; }

namespace toolbelt {

// Build the agent's logger: an append-only file sink at <log_dir>/<name>.log
// mirrored to stderr. When the directory or file cannot be opened the logger
// keeps only the stderr sink and says so once. The logger is not registered
// globally; callers pass it down explicitly.
std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                            const std::string& log_dir,
                                            const std::string& level = "info");

// Logger that discards everything (tests, embedding)
std::shared_ptr<spdlog::logger> make_null_logger(const std::string& name = "null");

} // namespace toolbelt
