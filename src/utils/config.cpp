#include "utils/config.hpp"
#include <fstream>
#include <stdexcept>

namespace prudp::utils {

namespace {

uint8_t parseVersion(const std::string& key, const std::string& value) {
    if (value == "0") return 0;
    if (value == "1") return 1;
    throw std::invalid_argument("Config: " + key + " must be 0 or 1, got '" + value + "'");
}

bool parseBool(const std::string& key, const std::string& value) {
    if (value == "true" || value == "1" || value == "yes") return true;
    if (value == "false" || value == "0" || value == "no") return false;
    throw std::invalid_argument("Config: " + key + " must be a boolean, got '" + value + "'");
}

} // namespace

Config& Config::instance() {
    static Config config;
    return config;
}

void Config::reset() {
    m_codec = CodecConfig{};
    m_logFile = "prudp.log";
    m_logLevel = spdlog::level::info;
}

bool Config::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t eqPos = line.find('=');
        if (eqPos == std::string::npos) {
            continue;
        }

        std::string key = line.substr(0, eqPos);
        std::string value = line.substr(eqPos + 1);

        // Trim whitespace
        auto trim = [](std::string& s) {
            s.erase(0, s.find_first_not_of(" \t\r"));
            s.erase(s.find_last_not_of(" \t\r") + 1);
        };
        trim(key);
        trim(value);

        setValue(key, value);
    }

    return true;
}

void Config::setValue(const std::string& key, const std::string& value) {
    if (key == "access_key") {
        m_codec.access_key = value;
    }
    else if (key == "checksum_version") {
        m_codec.checksum_version = parseVersion(key, value);
    }
    else if (key == "flags_version") {
        m_codec.flags_version = parseVersion(key, value);
    }
    else if (key == "strict_checksum") {
        m_codec.checksum_policy = parseBool(key, value)
            ? ChecksumPolicy::Strict : ChecksumPolicy::Permissive;
    }
    else if (key == "rc4_key") {
        if (value.empty()) {
            throw std::invalid_argument("Config: rc4_key must not be empty");
        }
        m_codec.rc4_key = value;
    }
    else if (key == "log_file") {
        m_logFile = value;
    }
    else if (key == "log_level") {
        auto level = spdlog::level::from_str(value);
        if (level == spdlog::level::off && value != "off") {
            throw std::invalid_argument("Config: unknown log_level '" + value + "'");
        }
        m_logLevel = level;
    }
}

bool Config::saveToFile(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        return false;
    }

    file << "# PRUDP codec configuration\n\n";

    file << "# Service access key (checksum seed and signature key)\n";
    file << "access_key = " << m_codec.access_key << "\n\n";

    file << "# 0 = 4 byte checksum, 1 = 1 byte checksum\n";
    file << "checksum_version = " << static_cast<int>(m_codec.checksum_version) << "\n\n";

    file << "# 0 = 3 bit type / 13 bit flags, 1 = 4 bit type / 12 bit flags\n";
    file << "flags_version = " << static_cast<int>(m_codec.flags_version) << "\n\n";

    file << "# Reject packets whose checksum does not match\n";
    file << "strict_checksum = "
         << (m_codec.checksum_policy == ChecksumPolicy::Strict ? "true" : "false") << "\n\n";

    file << "rc4_key = " << m_codec.rc4_key << "\n\n";

    file << "# Logging\n";
    file << "log_file = " << m_logFile << "\n";
    auto levelName = spdlog::level::to_string_view(m_logLevel);
    file << "log_level = " << std::string(levelName.data(), levelName.size()) << "\n";

    return true;
}

} // namespace prudp::utils
