#pragma once

#include "prudp/types.hpp"
#include <spdlog/common.h>
#include <string>

namespace prudp::utils {

/**
 * Configuration manager
 *
 * Loads codec and logging settings from a "key = value" file.
 * Unknown keys are ignored; malformed values throw std::invalid_argument.
 */
class Config {
public:
    static Config& instance();

    // Load config from file, returns false if the file cannot be opened
    bool loadFromFile(const std::string& path);

    // Save config to file
    bool saveToFile(const std::string& path) const;

    // Restore defaults
    void reset();

    // Codec settings used to build connections
    const CodecConfig& getCodecConfig() const { return m_codec; }
    CodecConfig& getCodecConfig() { return m_codec; }

    // Logging
    const std::string& getLogFile() const { return m_logFile; }
    void setLogFile(const std::string& path) { m_logFile = path; }

    spdlog::level::level_enum getLogLevel() const { return m_logLevel; }
    void setLogLevel(spdlog::level::level_enum level) { m_logLevel = level; }

private:
    Config() = default;

    void setValue(const std::string& key, const std::string& value);

    CodecConfig m_codec;
    std::string m_logFile = "prudp.log";
    spdlog::level::level_enum m_logLevel = spdlog::level::info;
};

} // namespace prudp::utils
