/**
 * PRUDP Codec - Test Runner
 *
 * Runs all unit tests for the PRUDPv0 codec
 */

#include "test_framework.hpp"
#include "utils/logger.hpp"

// Include test files
#include "test_checksum.cpp"
#include "test_crypto.cpp"
#include "test_connection.cpp"
#include "test_signature.cpp"
#include "test_rmc.cpp"
#include "test_packet_v0.cpp"
#include "test_config.cpp"

int main(int argc, char** argv) {
    (void)argc;
    (void)argv;

    std::cout << "╔══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║       PRUDP Codec - Unit Test Suite                          ║\n";
    std::cout << "╚══════════════════════════════════════════════════════════════╝\n\n";

    // Console only; checksum warnings from negative tests stay quiet
    prudp::utils::Logger::init("", spdlog::level::err);

    int result = prudp::test::TestRunner::getInstance().run();

    prudp::utils::Logger::shutdown();
    return result;
}
