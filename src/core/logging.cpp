#include "core/logging.hpp"
#include "core/config.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <vector>

void init_logging(const LogSettings& settings) {
    std::vector<spdlog::sink_ptr> sinks;

    if (settings.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    if (!settings.file.empty()) {
        std::string path = Config::expand_home(settings.file);
        std::error_code ec;
        std::filesystem::create_directories(std::filesystem::path(path).parent_path(), ec);
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                path, 5 * 1024 * 1024, 3));
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::warn("[Logging] Cannot open log file {}: {}", path, e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("svcwatch", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::from_str(settings.level));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    spdlog::set_default_logger(logger);
    spdlog::flush_on(spdlog::level::warn);
}
