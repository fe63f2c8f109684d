/// @file test_logger.cpp
/// @brief Tests for facility levels, filtering and duplicate suppression

#include <catch2/catch_test_macros.hpp>

#include "core/Logger.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

using namespace kmd;

namespace {

/// Redirects std::cerr for the lifetime of the object
class CerrCapture {
public:
    CerrCapture() : previous_(std::cerr.rdbuf(buffer_.rdbuf())) {}
    ~CerrCapture() { std::cerr.rdbuf(previous_); }

    std::string str() const { return buffer_.str(); }

private:
    std::ostringstream buffer_;
    std::streambuf* previous_;
};

size_t count_of(const std::string& haystack, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

void reset_registry() {
    Logger::clearFacilityLevels();
    Logger::setDefaultLevel(LogLevel::WARNING);
    Logger::setSharedLogFile(std::nullopt);
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

TEST_CASE("Log configuration strings set default and facility levels", "[logger]") {
    reset_registry();

    Logger::parseLogConfig("5");
    CHECK(Logger::getFacilityLevel("Anything") == LogLevel::DEBUG);

    Logger::parseLogConfig("KeymapSVGRenderer=6, default=3");
    CHECK(Logger::getFacilityLevel("KeymapSVGRenderer") == LogLevel::TRACE);
    CHECK(Logger::getFacilityLevel("KeymapLoader") == LogLevel::INFO);

    // Out of range values are clamped
    Logger::parseLogConfig("KeymapLoader=9");
    CHECK(Logger::getFacilityLevel("KeymapLoader") == LogLevel::TRACE);

    reset_registry();
}

TEST_CASE("Invalid log levels are skipped", "[logger]") {
    reset_registry();
    CerrCapture capture;

    Logger::parseLogConfig("loud,KeymapLoader=4");
    CHECK(Logger::getFacilityLevel("KeymapLoader") == LogLevel::DETAILED);
    CHECK(Logger::getFacilityLevel("other") == LogLevel::WARNING);
    CHECK(capture.str().find("Invalid log level 'loud'") != std::string::npos);

    reset_registry();
}

TEST_CASE("Messages below the effective level are dropped", "[logger]") {
    reset_registry();
    CerrCapture capture;

    {
        Logger logger("Component");
        logger.info("hidden info");
        logger.warning("visible warning");
        logger.error("visible error");
    }

    const std::string out = capture.str();
    CHECK(out.find("hidden info") == std::string::npos);
    CHECK(out.find("WARN  Component: visible warning") != std::string::npos);
    CHECK(out.find("ERROR Component: visible error") != std::string::npos);
}

TEST_CASE("Facility level overrides the instance level", "[logger]") {
    reset_registry();
    CerrCapture capture;

    Logger::setFacilityLevel("Chatty", LogLevel::DEBUG);
    {
        Logger logger("Chatty");
        CHECK(logger.shouldOutput(LogLevel::DEBUG));
        CHECK_FALSE(logger.shouldOutput(LogLevel::TRACE));
        logger.debug("debug detail");
    }
    CHECK(capture.str().find("DEBUG Chatty: debug detail") != std::string::npos);

    reset_registry();
}

TEST_CASE("Repeated messages collapse into a count", "[logger]") {
    reset_registry();
    CerrCapture capture;

    {
        Logger logger("Repeater");
        for (int i = 0; i < 3; ++i) {
            logger.warning("same thing");
        }
        logger.warning("something else");
    }

    const std::string out = capture.str();
    CHECK(count_of(out, "same thing") == 1);
    CHECK(out.find("The previous message occurred 3 times.") != std::string::npos);
    CHECK(out.find("something else") != std::string::npos);
}

TEST_CASE("Instance and shared log files receive messages", "[logger]") {
    reset_registry();
    CerrCapture capture;

    const auto own_path = std::filesystem::temp_directory_path() / "kmd_logger_own.log";
    const auto shared_path = std::filesystem::temp_directory_path() / "kmd_logger_shared.log";
    std::filesystem::remove(own_path);
    std::filesystem::remove(shared_path);

    {
        Logger own(LogLevel::INFO, own_path.string());
        own.info("to own file");
    }

    Logger::setSharedLogFile(shared_path.string());
    {
        Logger component("Shared");
        component.warning("to shared file");
    }
    Logger::setSharedLogFile(std::nullopt);

    CHECK(read_file(own_path).find("to own file") != std::string::npos);
    CHECK(read_file(shared_path).find("Shared: to shared file") != std::string::npos);

    std::filesystem::remove(own_path);
    std::filesystem::remove(shared_path);
    reset_registry();
}
