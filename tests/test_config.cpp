#include "test_framework.hpp"
#include "utils/config.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace prudp;
using namespace prudp::utils;
using namespace prudp::test;

static std::string writeConfigFile(const std::string& name, const std::string& contents) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream file(path);
    file << contents;
    return path.string();
}

// =============================================================================
// Config Tests
// =============================================================================

TEST(Config_Defaults) {
    Config& config = Config::instance();
    config.reset();

    const CodecConfig& codec = config.getCodecConfig();
    ASSERT_TRUE(codec.access_key.empty());
    ASSERT_EQ(codec.checksum_version, 1);
    ASSERT_EQ(codec.flags_version, 1);
    ASSERT_TRUE(codec.checksum_policy == ChecksumPolicy::Permissive);
    ASSERT_STREQ(codec.rc4_key, DEFAULT_RC4_KEY);
    ASSERT_STREQ(config.getLogFile(), "prudp.log");
    ASSERT_TRUE(config.getLogLevel() == spdlog::level::info);
    PASS();
}

TEST(Config_LoadFromFile) {
    Config& config = Config::instance();
    config.reset();

    auto path = writeConfigFile("prudp_test_load.conf",
        "# comment\n"
        "\n"
        "access_key = ridfebb9\n"
        "checksum_version=0\n"
        "  flags_version = 0  \n"
        "strict_checksum = true\n"
        "rc4_key = secret\n"
        "log_level = debug\n"
        "unknown_key = ignored\n"
        "not a setting\n");

    ASSERT_TRUE(config.loadFromFile(path));
    std::remove(path.c_str());

    const CodecConfig& codec = config.getCodecConfig();
    ASSERT_STREQ(codec.access_key, FRIENDS_ACCESS_KEY);
    ASSERT_EQ(codec.checksum_version, 0);
    ASSERT_EQ(codec.flags_version, 0);
    ASSERT_TRUE(codec.checksum_policy == ChecksumPolicy::Strict);
    ASSERT_STREQ(codec.rc4_key, "secret");
    ASSERT_TRUE(config.getLogLevel() == spdlog::level::debug);

    config.reset();
    PASS();
}

TEST(Config_MissingFile) {
    Config& config = Config::instance();
    config.reset();
    ASSERT_FALSE(config.loadFromFile("/nonexistent/prudp.conf"));
    ASSERT_EQ(config.getCodecConfig().checksum_version, 1);
    PASS();
}

TEST(Config_RejectsMalformedValues) {
    Config& config = Config::instance();

    const char* bad[] = {
        "checksum_version = 2\n",
        "flags_version = yes\n",
        "strict_checksum = maybe\n",
        "rc4_key =\n",
        "log_level = loud\n",
    };

    for (const char* contents : bad) {
        config.reset();
        auto path = writeConfigFile("prudp_test_bad.conf", contents);
        bool threw = false;
        try {
            config.loadFromFile(path);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        std::remove(path.c_str());

        if (!threw) {
            _msg = std::string("Expected invalid_argument for: ") + contents;
            return false;
        }
    }

    config.reset();
    PASS();
}

TEST(Config_SaveAndReload) {
    Config& config = Config::instance();
    config.reset();

    CodecConfig& codec = config.getCodecConfig();
    codec.access_key = "6f599f81";
    codec.checksum_version = 0;
    codec.checksum_policy = ChecksumPolicy::Strict;
    config.setLogLevel(spdlog::level::warn);

    auto path = (std::filesystem::temp_directory_path() / "prudp_test_save.conf").string();
    ASSERT_TRUE(config.saveToFile(path));

    config.reset();
    ASSERT_TRUE(config.loadFromFile(path));
    std::remove(path.c_str());

    ASSERT_STREQ(config.getCodecConfig().access_key, "6f599f81");
    ASSERT_EQ(config.getCodecConfig().checksum_version, 0);
    ASSERT_EQ(config.getCodecConfig().flags_version, 1);
    ASSERT_TRUE(config.getCodecConfig().checksum_policy == ChecksumPolicy::Strict);
    ASSERT_TRUE(config.getLogLevel() == spdlog::level::warn);

    config.reset();
    PASS();
}
