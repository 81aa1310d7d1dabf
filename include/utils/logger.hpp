#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <string>

namespace prudp::utils {

/**
 * Logger utility
 *
 * Central logging interface for the codec, backed by spdlog.
 * Until init() is called every call goes to spdlog's default logger,
 * so the codec can be embedded without any logging setup.
 */
class Logger {
public:
    /**
     * Create the "prudp" logger with a colored console sink and,
     * when logFile is not empty, a rotating file sink.
     */
    static void init(const std::string& logFile = "prudp.log",
                     spdlog::level::level_enum level = spdlog::level::info);
    static void shutdown();

    static void setLevel(spdlog::level::level_enum level);

    static std::shared_ptr<spdlog::logger> get() {
        return s_logger ? s_logger : spdlog::default_logger();
    }

    // Convenience logging functions
    template<typename... Args>
    static void trace(fmt::format_string<Args...> fmt, Args&&... args) {
        get()->trace(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void debug(fmt::format_string<Args...> fmt, Args&&... args) {
        get()->debug(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void info(fmt::format_string<Args...> fmt, Args&&... args) {
        get()->info(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void warn(fmt::format_string<Args...> fmt, Args&&... args) {
        get()->warn(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void error(fmt::format_string<Args...> fmt, Args&&... args) {
        get()->error(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void critical(fmt::format_string<Args...> fmt, Args&&... args) {
        get()->critical(fmt, std::forward<Args>(args)...);
    }

private:
    static std::shared_ptr<spdlog::logger> s_logger;
};

#define LOG_TRACE(...) prudp::utils::Logger::trace(__VA_ARGS__)
#define LOG_DEBUG(...) prudp::utils::Logger::debug(__VA_ARGS__)
#define LOG_INFO(...)  prudp::utils::Logger::info(__VA_ARGS__)
#define LOG_WARN(...)  prudp::utils::Logger::warn(__VA_ARGS__)
#define LOG_ERROR(...) prudp::utils::Logger::error(__VA_ARGS__)
#define LOG_CRITICAL(...) prudp::utils::Logger::critical(__VA_ARGS__)

} // namespace prudp::utils
