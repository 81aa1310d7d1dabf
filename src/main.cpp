/**
 * prudp-inspect
 *
 * Decodes PRUDPv0 packet dumps (hex) against a connection built from the
 * codec configuration and prints the decoded headers.
 */

#include "prudp/connection.hpp"
#include "prudp/packet_error.hpp"
#include "prudp/packet_v0.hpp"
#include "utils/config.hpp"
#include "utils/crypto.hpp"
#include "utils/logger.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

void printUsage(const char* program) {
    std::cout << "PRUDPv0 packet inspector\n";
    std::cout << "Usage: " << program << " [options] [hex-packet...]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config <file>   Load configuration from file\n";
    std::cout << "  -s, --strict          Reject packets with a bad checksum\n";
    std::cout << "  -p, --encode-ping     Print an encoded PING packet and exit\n";
    std::cout << "  -h, --help            Show this help message\n";
    std::cout << "\n";
    std::cout << "Without hex arguments, packets are read from stdin, one per line.\n";
}

static bool inspect(prudp::PacketV0Codec& codec, prudp::Connection& connection,
                    const std::string& hex) {
    std::vector<uint8_t> data;
    try {
        data = prudp::utils::Crypto::fromHex(hex);
    }
    catch (const std::invalid_argument& e) {
        LOG_ERROR("Bad input: {}", e.what());
        return false;
    }

    try {
        prudp::Packet packet = codec.decode(data, connection);
        std::cout << packet.toString() << "\n";
        if (!packet.payload().empty()) {
            std::cout << "  payload: " << prudp::utils::Crypto::toHex(packet.payload()) << "\n";
        }
        return true;
    }
    catch (const prudp::PacketError& e) {
        LOG_ERROR("{} ({} bytes): {}", prudp::decodeErrorName(e.code()), data.size(), e.what());
        return false;
    }
}

int main(int argc, char* argv[]) {
    std::string configFile;
    std::vector<std::string> packets;
    bool strict = false;
    bool encodePing = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        else if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) {
                configFile = argv[++i];
            }
            else {
                std::cerr << "Error: --config requires a filename\n";
                return 1;
            }
        }
        else if (arg == "-s" || arg == "--strict") {
            strict = true;
        }
        else if (arg == "-p" || arg == "--encode-ping") {
            encodePing = true;
        }
        else {
            packets.push_back(arg);
        }
    }

    auto& config = prudp::utils::Config::instance();

    if (!configFile.empty()) {
        try {
            if (!config.loadFromFile(configFile)) {
                std::cerr << "Error: cannot open config file " << configFile << "\n";
                return 1;
            }
        }
        catch (const std::invalid_argument& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
    }

    prudp::utils::Logger::init(config.getLogFile(), config.getLogLevel());

    if (!configFile.empty()) {
        LOG_DEBUG("Loaded configuration from {}", configFile);
    }

    if (strict) {
        config.getCodecConfig().checksum_policy = prudp::ChecksumPolicy::Strict;
    }

    prudp::Connection connection(config.getCodecConfig());
    prudp::PacketV0Codec codec;

    LOG_DEBUG("Connection: checksum_version={} flags_version={} access_key='{}'",
              connection.getChecksumVersion(), connection.getFlagsVersion(),
              connection.getAccessKey());

    if (encodePing) {
        prudp::Packet ping(prudp::PacketType::Ping, prudp::PacketFlag::NeedAck);
        std::cout << prudp::utils::Crypto::toHex(codec.encode(ping, connection)) << "\n";
        prudp::utils::Logger::shutdown();
        return 0;
    }

    int failures = 0;

    if (packets.empty()) {
        std::string line;
        while (std::getline(std::cin, line)) {
            if (line.empty() || line[0] == '#') {
                continue;
            }
            if (!inspect(codec, connection, line)) {
                failures++;
            }
        }
    }
    else {
        for (const auto& hex : packets) {
            if (!inspect(codec, connection, hex)) {
                failures++;
            }
        }
    }

    if (failures > 0) {
        LOG_WARN("{} packet(s) failed to decode", failures);
    }

    prudp::utils::Logger::shutdown();
    return failures > 0 ? 1 : 0;
}
