/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger
 */

#include <catch2/catch_test_macros.hpp>
#include "../src/logger.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace quorum;
using json = nlohmann::json;

namespace {

std::string temp_log_path(const std::string& name) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove(path);
    return path.string();
}

// Routes the logger to a file, runs the body, then returns the lines written
template <typename Body>
std::vector<std::string> capture_log(const std::string& name, LoggerConfig config, Body body) {
    Logger& logger = Logger::get_instance();

    config.enable_console = false;
    config.enable_file = true;
    config.log_file_path = temp_log_path(name);
    logger.configure(config);

    body(logger);

    logger.flush();
    logger.configure(LoggerConfig());   // Closes the file

    std::vector<std::string> lines;
    std::ifstream in(config.log_file_path);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    in.close();
    std::filesystem::remove(config.log_file_path);
    return lines;
}

} // namespace

TEST_CASE("Logger: configuration", "[logger]") {
    SECTION("Default configuration") {
        LoggerConfig config;

        REQUIRE(config.min_level == LogLevel::INFO);
        REQUIRE(config.enable_console == true);
        REQUIRE(config.enable_file == false);
        REQUIRE(config.enable_json == true);
        REQUIRE(config.max_query_preview == 120);
    }

    SECTION("Level round trip through names") {
        REQUIRE(string_to_level("DEBUG") == LogLevel::DEBUG);
        REQUIRE(string_to_level("WARN") == LogLevel::WARN);
        REQUIRE(string_to_level("ERROR") == LogLevel::ERROR);
        REQUIRE(string_to_level("nonsense") == LogLevel::INFO);
        REQUIRE(level_to_string(LogLevel::WARN) == "WARN");
    }

    SECTION("Minimum level can be changed at runtime") {
        Logger& logger = Logger::get_instance();
        LoggerConfig config;
        config.enable_console = false;
        logger.configure(config);

        logger.set_min_level(LogLevel::ERROR);
        REQUIRE(logger.get_min_level() == LogLevel::ERROR);

        logger.configure(LoggerConfig());
        REQUIRE(logger.get_min_level() == LogLevel::INFO);
    }
}

TEST_CASE("Logger: JSON records carry structured fields", "[logger]") {
    auto lines = capture_log("quorum_test_json.log", LoggerConfig(), [](Logger& logger) {
        BackendConfig config("analyst", "reference");
        config.params["response_pattern"] = "analytical";
        logger.log_backend_registered(config);
        logger.log_outcome(Outcome::success("analyst", "use an index", 0.9, 0.25));
    });

    REQUIRE(lines.size() == 2);

    json registered = json::parse(lines[0]);
    REQUIRE(registered["level"].get<std::string>() == "INFO");
    REQUIRE(registered["event"].get<std::string>() == "backend_registered");
    REQUIRE(registered["backend_id"].get<std::string>() == "analyst");
    REQUIRE(registered["param.response_pattern"].get<std::string>() == "analytical");
    REQUIRE(registered.contains("timestamp"));

    json outcome = json::parse(lines[1]);
    REQUIRE(outcome["event"].get<std::string>() == "outcome");
    REQUIRE(outcome["status"].get<std::string>() == "success");
    REQUIRE(outcome["execution_time_s"].get<std::string>() == "0.250");
    REQUIRE(outcome["content_length"].get<std::string>() == "12");
}

TEST_CASE("Logger: outcome severity follows status", "[logger]") {
    auto lines = capture_log("quorum_test_levels.log", LoggerConfig(), [](Logger& logger) {
        logger.log_outcome(Outcome::timeout("slow", 2.0));
        logger.log_outcome(Outcome::error("broken", "connection refused", 0.1));
    });

    REQUIRE(lines.size() == 2);

    json timeout = json::parse(lines[0]);
    REQUIRE(timeout["level"].get<std::string>() == "WARN");
    REQUIRE(timeout["status"].get<std::string>() == "timeout");

    json error = json::parse(lines[1]);
    REQUIRE(error["level"].get<std::string>() == "ERROR");
    REQUIRE(error["error"].get<std::string>() == "connection refused");
}

TEST_CASE("Logger: messages below the minimum level are dropped", "[logger]") {
    LoggerConfig config;
    config.min_level = LogLevel::WARN;

    auto lines = capture_log("quorum_test_filter.log", config, [](Logger& logger) {
        logger.log_isolation("analyst", true, 500, 70);     // DEBUG
        logger.log_dispatch_complete(3, 0.5);               // INFO
        logger.log_circuit_opened("broken", 5);             // WARN
    });

    REQUIRE(lines.size() == 1);
    json record = json::parse(lines[0]);
    REQUIRE(record["event"].get<std::string>() == "circuit_opened");
    REQUIRE(record["failure_count"].get<std::string>() == "5");
}

TEST_CASE("Logger: long queries are truncated in dispatch events", "[logger]") {
    LoggerConfig config;
    config.max_query_preview = 10;

    auto lines = capture_log("quorum_test_preview.log", config, [](Logger& logger) {
        logger.log_dispatch_start(std::string(500, 'q'), {"a", "b"});
    });

    REQUIRE(lines.size() == 1);
    json record = json::parse(lines[0]);
    REQUIRE(record["candidates"].get<std::string>() == "a,b");
    REQUIRE(record["candidate_count"].get<std::string>() == "2");
    REQUIRE(record["query"].get<std::string>().size() < 500);
}

TEST_CASE("Logger: plain text output", "[logger]") {
    LoggerConfig config;
    config.enable_json = false;

    auto lines = capture_log("quorum_test_text.log", config, [](Logger& logger) {
        logger.log_warning("analyst", "slow response");
    });

    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].find("[WARN] slow response") != std::string::npos);
    REQUIRE(lines[0].find("backend_id=analyst") != std::string::npos);
}
