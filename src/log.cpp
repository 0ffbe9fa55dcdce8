#include "log.hpp"

#include <filesystem>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <system_error>
#include <vector>

namespace toolbelt {

std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                            const std::string& log_dir,
                                            const std::string& level) {
    std::vector<spdlog::sink_ptr> sinks;
    std::string file_error;

    if (!log_dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(log_dir, ec);
        if (ec) {
            file_error = "cannot create " + log_dir + ": " + ec.message();
        } else {
            auto path = (std::filesystem::path(log_dir) / (name + ".log")).string();
            try {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path));
            } catch (const spdlog::spdlog_ex& e) {
                file_error = e.what();
            }
        }
    }
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_sink_mt>());

    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S] [%n] [%l] %v");
    logger->set_level(spdlog::level::from_str(level));
    logger->flush_on(spdlog::level::trace);

    if (!file_error.empty()) {
        logger->warn("Log file unavailable, logging to stderr only: {}", file_error);
    }
    return logger;
}

std::shared_ptr<spdlog::logger> make_null_logger(const std::string& name) {
    return std::make_shared<spdlog::logger>(name,
                                            std::make_shared<spdlog::sinks::null_sink_mt>());
}

} // namespace toolbelt
