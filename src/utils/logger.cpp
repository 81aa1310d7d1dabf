#include "utils/logger.hpp"

#include <cstdio>
#include <vector>

namespace prudp::utils {

std::shared_ptr<spdlog::logger> Logger::s_logger;

void Logger::init(const std::string& logFile, spdlog::level::level_enum level) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(spdlog::level::trace);
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console_sink);

        if (!logFile.empty()) {
            // 5MB, 3 files
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFile, 1024 * 1024 * 5, 3);
            file_sink->set_level(spdlog::level::trace);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(file_sink);
        }

        if (s_logger) {
            spdlog::drop(s_logger->name());
        }

        s_logger = std::make_shared<spdlog::logger>("prudp", sinks.begin(), sinks.end());
        s_logger->set_level(level);
        s_logger->flush_on(spdlog::level::warn);

        spdlog::register_logger(s_logger);
        spdlog::set_default_logger(s_logger);

        s_logger->debug("Logger initialized");
    }
    catch (const spdlog::spdlog_ex& ex) {
        fprintf(stderr, "Logger init failed: %s\n", ex.what());
    }
}

void Logger::shutdown() {
    if (s_logger) {
        s_logger->debug("Logger shutting down");
        s_logger->flush();
        s_logger.reset();
    }
    spdlog::shutdown();
}

void Logger::setLevel(spdlog::level::level_enum level) {
    get()->set_level(level);
}

} // namespace prudp::utils
