// test/test_steering_config.cpp
/**
 * Unit Test: SteeringConfig
 *
 * Tests YAML loading, validation, and default configuration.
 *
 * Test Coverage:
 *   1. Default configuration
 *   2. Valid YAML loading (every field)
 *   3. Partial YAML keeps defaults
 *   4. Invalid values rejected
 *   5. Malformed YAML / missing section
 *   6. Missing file fallback to defaults
 *   7. Compensator factory
 *   8. Log level names
 */

#include "config/steering_config.hpp"
#include "utils/logging.hpp"
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

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

// Helper: Check if value is close to expected
bool is_close(double actual, double expected, double tolerance = 0.0001) {
    if (std::abs(expected) < 1e-9) {
        return std::abs(actual) < tolerance;
    }
    return std::abs(actual - expected) / std::abs(expected) < tolerance;
}

void write_file(const std::string& path, const std::string& content) {
    std::ofstream f(path);
    f << content;
}

// Returns true if load() threw; the message is printed for inspection
bool load_throws(const std::string& yaml, const std::string& path) {
    write_file(path, yaml);
    bool threw = false;
    try {
        config::SteeringConfig::load(path);
    } catch (const std::runtime_error& e) {
        std::cout << COLOR_YELLOW << "    (" << e.what() << ")" << COLOR_RESET << "\n";
        threw = true;
    }
    std::remove(path.c_str());
    return threw;
}

// Test 1: Default configuration
void test_default_config(TestResult& result) {
    std::cout << "\n=== Test 1: Default Configuration ===\n";

    config::SteeringConfig cfg = config::SteeringConfig::get_default();

    try {
        cfg.validate();
        result.pass("Default configuration validates");
    } catch (const std::exception& e) {
        result.fail(std::string("Default configuration invalid: ") + e.what());
    }

    if (cfg.params.steering_limit > 0.0 && cfg.params.proportional_gain > 0.0) {
        result.pass("Default limit and Kp are positive");
    } else {
        result.fail("Default limit or Kp not positive");
    }

    if (cfg.params.line_fit == fit::LineFitMethod::LeastSquares && cfg.log_level == "info") {
        result.pass("Default line fit is least_squares, log level info");
    } else {
        result.fail("Unexpected default line fit or log level");
    }
}

// Test 2: Valid YAML
void test_valid_yaml(TestResult& result) {
    std::cout << "\n=== Test 2: Valid YAML Loading ===\n";

    const std::string path = "/tmp/test_steering_full.yaml";
    write_file(path,
        "steering:\n"
        "  name: \"Track A\"\n"
        "  description: \"Indoor track\"\n"
        "  gains:\n"
        "    proportional: 0.02\n"
        "    derivative: 0.75\n"
        "  geometry:\n"
        "    ideal_center_x: 320.0\n"
        "    center_y: 240.0\n"
        "  outliers:\n"
        "    max_distance_from_line: 8.5\n"
        "    line_fit: \"repeated_median\"\n"
        "  limits:\n"
        "    steering_limit: 0.45\n"
        "  backlash:\n"
        "    enabled: false\n"
        "    width: 0.03\n"
        "    direction_threshold: 0.001\n"
        "logging:\n"
        "  level: \"debug\"\n");

    try {
        config::SteeringConfig cfg = config::SteeringConfig::load(path);

        if (cfg.name == "Track A" && cfg.description == "Indoor track") {
            result.pass("Name and description loaded");
        } else {
            result.fail("Name/description mismatch: " + cfg.name);
        }

        const auto& p = cfg.params;
        if (is_close(p.proportional_gain, 0.02) && is_close(p.derivative_gain, 0.75)) {
            result.pass("Gains loaded");
        } else {
            result.fail("Gains mismatch");
        }

        if (is_close(p.ideal_center_x, 320.0) && is_close(p.center_y, 240.0)) {
            result.pass("Geometry loaded");
        } else {
            result.fail("Geometry mismatch");
        }

        if (is_close(p.max_distance_from_line, 8.5) && p.line_fit == fit::LineFitMethod::RepeatedMedian) {
            result.pass("Outlier threshold and line fit loaded");
        } else {
            result.fail("Outlier settings mismatch");
        }

        if (is_close(p.steering_limit, 0.45)) {
            result.pass("Steering limit loaded");
        } else {
            result.fail("Steering limit mismatch");
        }

        if (!cfg.backlash_enabled && is_close(cfg.backlash.width, 0.03) &&
            is_close(cfg.backlash.direction_threshold, 0.001)) {
            result.pass("Backlash loaded");
        } else {
            result.fail("Backlash mismatch");
        }

        if (cfg.log_level == "debug") {
            result.pass("Log level loaded");
        } else {
            result.fail("Log level mismatch: " + cfg.log_level);
        }
    } catch (const std::exception& e) {
        result.fail(std::string("Load threw: ") + e.what());
    }

    std::remove(path.c_str());
}

// Test 3: Partial YAML
void test_partial_yaml(TestResult& result) {
    std::cout << "\n=== Test 3: Partial YAML ===\n";

    const std::string path = "/tmp/test_steering_partial.yaml";
    write_file(path,
        "steering:\n"
        "  gains:\n"
        "    proportional: 0.05\n");

    const config::SteeringConfig def = config::SteeringConfig::get_default();

    try {
        config::SteeringConfig cfg = config::SteeringConfig::load(path);

        if (is_close(cfg.params.proportional_gain, 0.05) &&
            is_close(cfg.params.derivative_gain, def.params.derivative_gain) &&
            is_close(cfg.params.steering_limit, def.params.steering_limit) &&
            cfg.backlash_enabled == def.backlash_enabled &&
            cfg.name == def.name) {
            result.pass("Given key applied, others keep defaults");
        } else {
            result.fail("Partial YAML did not merge with defaults");
        }
    } catch (const std::exception& e) {
        result.fail(std::string("Load threw: ") + e.what());
    }

    std::remove(path.c_str());
}

// Test 4: Invalid values
void test_invalid_values(TestResult& result) {
    std::cout << "\n=== Test 4: Invalid Values ===\n";

    const std::string path = "/tmp/test_steering_invalid.yaml";

    if (load_throws("steering:\n  gains:\n    proportional: -0.1\n", path)) {
        result.pass("Negative proportional gain rejected");
    } else {
        result.fail("Negative proportional gain accepted");
    }

    if (load_throws("steering:\n  limits:\n    steering_limit: -1.0\n", path)) {
        result.pass("Negative steering limit rejected");
    } else {
        result.fail("Negative steering limit accepted");
    }

    if (load_throws("steering:\n  outliers:\n    max_distance_from_line: -3\n", path)) {
        result.pass("Negative outlier distance rejected");
    } else {
        result.fail("Negative outlier distance accepted");
    }

    if (load_throws("steering:\n  outliers:\n    line_fit: \"hough\"\n", path)) {
        result.pass("Unknown line_fit rejected");
    } else {
        result.fail("Unknown line_fit accepted");
    }

    if (load_throws("steering:\n  backlash:\n    width: -0.01\n", path)) {
        result.pass("Negative backlash width rejected");
    } else {
        result.fail("Negative backlash width accepted");
    }

    if (load_throws("steering:\n  name: x\nlogging:\n  level: \"verbose\"\n", path)) {
        result.pass("Unknown log level rejected");
    } else {
        result.fail("Unknown log level accepted");
    }

    if (load_throws("steering:\n  gains:\n    proportional: \"fast\"\n", path)) {
        result.pass("Non-numeric gain rejected");
    } else {
        result.fail("Non-numeric gain accepted");
    }
}

// Test 5: Malformed YAML
void test_malformed_yaml(TestResult& result) {
    std::cout << "\n=== Test 5: Malformed YAML ===\n";

    const std::string path = "/tmp/test_steering_malformed.yaml";

    if (load_throws("steering: [unclosed\n", path)) {
        result.pass("Syntax error reported");
    } else {
        result.fail("Syntax error not reported");
    }

    if (load_throws("vehicle:\n  name: nope\n", path)) {
        result.pass("Missing 'steering' section reported");
    } else {
        result.fail("Missing 'steering' section accepted");
    }
}

// Test 6: Missing file
void test_missing_file(TestResult& result) {
    std::cout << "\n=== Test 6: Missing File Fallback ===\n";

    try {
        config::SteeringConfig cfg = config::SteeringConfig::load("/tmp/does_not_exist_steering.yaml");
        const config::SteeringConfig def = config::SteeringConfig::get_default();

        if (cfg.name == def.name && is_close(cfg.params.proportional_gain, def.params.proportional_gain)) {
            result.pass("Missing file returns defaults");
        } else {
            result.fail("Missing file did not return defaults");
        }
    } catch (const std::exception& e) {
        result.fail(std::string("Missing file threw: ") + e.what());
    }
}

// Test 7: Compensator factory
void test_make_compensator(TestResult& result) {
    std::cout << "\n=== Test 7: Compensator Factory ===\n";

    config::SteeringConfig cfg = config::SteeringConfig::get_default();

    cfg.backlash_enabled = true;
    auto on = cfg.make_compensator();
    if (on && std::string(on->name()) == "Backlash") {
        result.pass("Enabled backlash gives BacklashCompensator");
    } else {
        result.fail("Enabled backlash gave wrong compensator");
    }

    cfg.backlash_enabled = false;
    auto off = cfg.make_compensator();
    if (off && std::string(off->name()) == "Identity" && off->process(0.123) == 0.123) {
        result.pass("Disabled backlash gives IdentityCompensator");
    } else {
        result.fail("Disabled backlash gave wrong compensator");
    }

    // Each call yields an independent instance
    cfg.backlash_enabled = true;
    auto a = cfg.make_compensator();
    auto b = cfg.make_compensator();
    a->process(0.0);
    a->process(0.5);
    if (b->process(0.5) == 0.5) {
        result.pass("Compensators do not share state");
    } else {
        result.fail("Compensators share state");
    }
}

// Test 8: Log level names
void test_log_levels(TestResult& result) {
    std::cout << "\n=== Test 8: Log Level Names ===\n";

    if (utils::parse_level("TRACE") == utils::LogLevel::Trace &&
        utils::parse_level("warning") == utils::LogLevel::Warn &&
        utils::parse_level("off") == utils::LogLevel::Off) {
        result.pass("Level names parsed case-insensitively");
    } else {
        result.fail("Level names misparsed");
    }

    try {
        utils::parse_level("loud");
        result.fail("Unknown level accepted");
    } catch (const std::invalid_argument&) {
        result.pass("Unknown level rejected");
    }
}

int main() {
    std::cout << "\n";
    std::cout << "╔══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║            SteeringConfig Unit Tests                        ║\n";
    std::cout << "╚══════════════════════════════════════════════════════════════╝\n";

    TestResult result;

    test_default_config(result);
    test_valid_yaml(result);
    test_partial_yaml(result);
    test_invalid_values(result);
    test_malformed_yaml(result);
    test_missing_file(result);
    test_make_compensator(result);
    test_log_levels(result);

    result.summary();

    return (result.failed == 0) ? 0 : 1;
}
