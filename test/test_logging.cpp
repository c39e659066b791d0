// test/test_logging.cpp
/**
 * Unit Test: Logging
 *
 * Test Coverage:
 *   1. Level threshold filtering
 *   2. Level names and aliases
 *   3. Mirror file receives emitted lines only
 *   4. Failed open leaves file mirroring off
 */

#include "utils/logging.hpp"
#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

// ANSI color codes
#define COLOR_GREEN  "\033[32m"
#define COLOR_RED    "\033[31m"
#define COLOR_YELLOW "\033[33m"
#define COLOR_RESET  "\033[0m"

struct TestResult {
    int passed = 0;
    int failed = 0;

    void pass(const std::string& msg) {
        std::cout << COLOR_GREEN << "  ✓ " << msg << COLOR_RESET << "\n";
        ++passed;
    }

    void fail(const std::string& msg) {
        std::cout << COLOR_RED << "  ✗ " << msg << COLOR_RESET << "\n";
        ++failed;
    }

    void summary() {
        std::cout << "\n========================================\n";
        if (failed == 0) {
            std::cout << COLOR_GREEN << "ALL TESTS PASSED" << COLOR_RESET;
        } else {
            std::cout << COLOR_RED << "SOME TESTS FAILED" << COLOR_RESET;
        }
        std::cout << " (" << passed << " passed, " << failed << " failed)\n";
        std::cout << "========================================\n";
    }
};

std::vector<std::string> read_lines(const std::string& path) {
    std::vector<std::string> lines;
    std::ifstream f(path);
    std::string line;
    while (std::getline(f, line)) {
        lines.push_back(line);
    }
    return lines;
}

// Test 1
void test_threshold(TestResult& result) {
    std::cout << "\n=== Test 1: Level Threshold ===\n";

    utils::set_level(utils::LogLevel::Warn);
    if (utils::current_level() == utils::LogLevel::Warn) {
        result.pass("Threshold set to WARN");
    } else {
        result.fail("Threshold not stored");
    }

    if (!utils::level_enabled(utils::LogLevel::Info) &&
        utils::level_enabled(utils::LogLevel::Warn) &&
        utils::level_enabled(utils::LogLevel::Error)) {
        result.pass("INFO filtered, WARN and ERROR pass");
    } else {
        result.fail("WARN threshold filters wrongly");
    }

    utils::set_level(utils::LogLevel::Trace);
    if (utils::level_enabled(utils::LogLevel::Trace)) {
        result.pass("TRACE threshold lets everything through");
    } else {
        result.fail("TRACE filtered at TRACE threshold");
    }

    utils::set_level(utils::LogLevel::Off);
    if (!utils::level_enabled(utils::LogLevel::Error)) {
        result.pass("OFF silences ERROR");
    } else {
        result.fail("ERROR emitted with logging off");
    }

    utils::set_level(utils::LogLevel::Info);
}

// Test 2
void test_level_names(TestResult& result) {
    std::cout << "\n=== Test 2: Level Names ===\n";

    if (utils::parse_level("debug") == utils::LogLevel::Debug &&
        utils::parse_level("Info") == utils::LogLevel::Info &&
        utils::parse_level("WARNING") == utils::LogLevel::Warn &&
        utils::parse_level("none") == utils::LogLevel::Off) {
        result.pass("Names and aliases parsed");
    } else {
        result.fail("Level name misparsed");
    }

    if (std::string(utils::to_string(utils::LogLevel::Warn)) == "WARN" &&
        std::string(utils::to_string(utils::LogLevel::Off)) == "OFF") {
        result.pass("Printed names use the canonical spelling");
    } else {
        result.fail("Printed name is an alias");
    }

    try {
        utils::parse_level("");
        result.fail("Empty level name accepted");
    } catch (const std::invalid_argument&) {
        result.pass("Empty level name rejected");
    }
}

// Test 3
void test_mirror_file(TestResult& result) {
    std::cout << "\n=== Test 3: Mirror File ===\n";

    const std::string path = "/tmp/test_logging_mirror.log";
    utils::set_level(utils::LogLevel::Warn);

    if (!utils::open_log_file(path)) {
        result.fail("Could not open " + path);
        utils::set_level(utils::LogLevel::Info);
        return;
    }
    if (utils::log_file_path() == path) {
        result.pass("Mirror path recorded");
    } else {
        result.fail("Mirror path not recorded");
    }

    LOG_INFO("filtered %d", 1);
    LOG_WARN("kept %d", 2);
    LOG_ERROR("kept %s", "three");
    utils::close_log_file();
    LOG_ERROR("after close");

    const auto lines = read_lines(path);
    if (lines.size() == 2) {
        result.pass("Two lines mirrored");
    } else {
        result.fail("Mirrored " + std::to_string(lines.size()) + " lines");
    }

    if (lines.size() == 2 &&
        lines[0].find("WARN: kept 2") != std::string::npos &&
        lines[1].find("ERROR: kept three") != std::string::npos) {
        result.pass("Level and formatted message written");
    } else {
        result.fail("Mirrored line content wrong");
    }

    // "[HH:MM:SS.mmm] "
    if (!lines.empty() && lines[0].size() > 15 && lines[0][0] == '[' &&
        lines[0][9] == '.' && lines[0][13] == ']') {
        result.pass("Millisecond timestamp prefix");
    } else {
        result.fail("Timestamp prefix malformed");
    }

    if (utils::log_file_path().empty()) {
        result.pass("Path cleared on close");
    } else {
        result.fail("Path kept after close");
    }

    utils::set_level(utils::LogLevel::Info);
    std::remove(path.c_str());
}

// Test 4
void test_failed_open(TestResult& result) {
    std::cout << "\n=== Test 4: Failed Open ===\n";

    const std::string good = "/tmp/test_logging_first.log";
    if (!utils::open_log_file(good)) {
        result.fail("Could not open " + good);
        return;
    }

    if (!utils::open_log_file("/nonexistent_dir/test_logging.log")) {
        result.pass("Unwritable path rejected");
    } else {
        result.fail("Unwritable path accepted");
    }

    if (utils::log_file_path().empty()) {
        result.pass("Previous mirror closed, none active");
    } else {
        result.fail("Stale mirror path " + utils::log_file_path());
    }

    utils::set_level(utils::LogLevel::Error);
    LOG_ERROR("stderr only");
    utils::set_level(utils::LogLevel::Info);

    if (read_lines(good).empty()) {
        result.pass("Nothing written to the closed mirror");
    } else {
        result.fail("Closed mirror still receives lines");
    }

    utils::close_log_file();
    std::remove(good.c_str());
}

int main() {
    std::cout << "\n";
    std::cout << "╔══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║            Logging Unit Tests                                ║\n";
    std::cout << "╚══════════════════════════════════════════════════════════════╝\n";

    TestResult result;

    test_threshold(result);
    test_level_names(result);
    test_mirror_file(result);
    test_failed_open(result);

    result.summary();

    return (result.failed == 0) ? 0 : 1;
}
