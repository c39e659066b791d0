// src/config/steering_config.hpp
#pragma once

#include <memory>
#include <string>

#include "control/backlash_compensator.hpp"
#include "control/pd_steering_engine.hpp"
#include "control/steering_compensator.hpp"

namespace config {

/**
 * SteeringConfig - Loads PD steering tuning from YAML files
 *
 * Usage:
 *   auto cfg = SteeringConfig::load("config/steering/default.yaml");
 *   control::PdSteeringEngine engine(cfg.params, cfg.make_compensator());
 *
 * Falls back to built-in defaults if the file is not found.
 */
class SteeringConfig {
public:
    std::string name;
    std::string description;

    // Engine tuning loaded from YAML
    control::SteeringParams params;

    // Linkage compensation
    bool backlash_enabled = true;
    control::BacklashParams backlash;

    // Log level name, applied by the caller (see utils::parse_level)
    std::string log_level = "info";

    /**
     * Load steering config from YAML file
     * @param yaml_path Path to YAML file (e.g., "config/steering/default.yaml")
     * @return SteeringConfig with loaded parameters
     * @throws std::runtime_error if file exists but is invalid
     *
     * If file doesn't exist, returns default configuration with warning.
     */
    static SteeringConfig load(const std::string& yaml_path);

    /**
     * Built-in tuning for a 320x240 center-line image
     */
    static SteeringConfig get_default();

    /**
     * @throws std::invalid_argument if any parameter is invalid
     */
    void validate() const;

    void print_summary() const;

    /**
     * Fresh compensator for a new engine: Backlash when enabled, else Identity
     */
    std::unique_ptr<control::SteeringCompensator> make_compensator() const;

    SteeringConfig() = default;
};

} // namespace config
