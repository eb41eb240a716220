#include <catch2/catch_test_macros.hpp>

#include <log/log_manager.h>
#include <string>

TEST_CASE("LogManager: level names", "[log]") {
    REQUIRE(LogManager::parseLogLevel("trace") == LogManager::LogLevel::Trace);
    REQUIRE(LogManager::parseLogLevel("Debug") == LogManager::LogLevel::Debug);
    REQUIRE(LogManager::parseLogLevel("WARNING") == LogManager::LogLevel::Warn);
    REQUIRE(LogManager::parseLogLevel("critical") == LogManager::LogLevel::Critical);

    SECTION("unknown names fall back to info") {
        REQUIRE(LogManager::parseLogLevel("chatty") == LogManager::LogLevel::Info);
        REQUIRE(LogManager::parseLogLevel("") == LogManager::LogLevel::Info);
    }

    SECTION("bytes outside ASCII are handled") {
        REQUIRE(LogManager::parseLogLevel("w\xC3\xA4rn") == LogManager::LogLevel::Info);
        REQUIRE(LogManager::parseLogLevel(std::string("\xFF\x80")) == LogManager::LogLevel::Info);
    }
}
