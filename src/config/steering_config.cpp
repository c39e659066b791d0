// src/config/steering_config.cpp
#include "config/steering_config.hpp"
#include "utils/logging.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <stdexcept>

namespace config {

SteeringConfig SteeringConfig::load(const std::string& yaml_path) {
    std::ifstream file_check(yaml_path);
    if (!file_check.good()) {
        LOG_WARN("[SteeringConfig] File not found: %s", yaml_path.c_str());
        LOG_WARN("[SteeringConfig] Using default configuration");
        return get_default();
    }
    file_check.close();

    LOG_INFO("[SteeringConfig] Loading steering config from: %s", yaml_path.c_str());

    try {
        YAML::Node root = YAML::LoadFile(yaml_path);

        // Missing keys keep the built-in defaults
        SteeringConfig cfg = get_default();

        const YAML::Node s = root["steering"];
        if (!s) {
            throw std::runtime_error("missing top-level 'steering' section");
        }

        cfg.name = s["name"].as<std::string>(cfg.name);
        cfg.description = s["description"].as<std::string>("");

        // ====================================================================
        // Gains
        // ====================================================================
        if (s["gains"]) {
            auto g = s["gains"];
            cfg.params.proportional_gain = g["proportional"].as<double>(cfg.params.proportional_gain);
            cfg.params.derivative_gain = g["derivative"].as<double>(cfg.params.derivative_gain);
        }

        // ====================================================================
        // Image geometry
        // ====================================================================
        if (s["geometry"]) {
            auto geo = s["geometry"];
            cfg.params.ideal_center_x = geo["ideal_center_x"].as<double>(cfg.params.ideal_center_x);
            cfg.params.center_y = geo["center_y"].as<double>(cfg.params.center_y);
        }

        // ====================================================================
        // Outlier rejection
        // ====================================================================
        if (s["outliers"]) {
            auto o = s["outliers"];
            cfg.params.max_distance_from_line =
                o["max_distance_from_line"].as<double>(cfg.params.max_distance_from_line);
            if (o["line_fit"]) {
                cfg.params.line_fit = fit::parse_line_fit_method(o["line_fit"].as<std::string>());
            }
        }

        // ====================================================================
        // Limits
        // ====================================================================
        if (s["limits"]) {
            cfg.params.steering_limit = s["limits"]["steering_limit"].as<double>(cfg.params.steering_limit);
        }

        // ====================================================================
        // Backlash
        // ====================================================================
        if (s["backlash"]) {
            auto b = s["backlash"];
            cfg.backlash_enabled = b["enabled"].as<bool>(cfg.backlash_enabled);
            cfg.backlash.width = b["width"].as<double>(cfg.backlash.width);
            cfg.backlash.direction_threshold =
                b["direction_threshold"].as<double>(cfg.backlash.direction_threshold);
        }

        if (root["logging"]) {
            cfg.log_level = root["logging"]["level"].as<std::string>(cfg.log_level);
        }

        cfg.validate();

        LOG_INFO("[SteeringConfig] Successfully loaded: %s", cfg.name.c_str());

        return cfg;

    } catch (const YAML::Exception& e) {
        throw std::runtime_error(
            std::string("[SteeringConfig] YAML parse error: ") + e.what()
        );
    } catch (const std::exception& e) {
        throw std::runtime_error(
            std::string("[SteeringConfig] Load error: ") + e.what()
        );
    }
}

SteeringConfig SteeringConfig::get_default() {
    SteeringConfig cfg;

    cfg.name = "Default (320x240 center line)";
    cfg.description = "Built-in tuning";

    cfg.params.proportional_gain = 0.01;
    cfg.params.derivative_gain = 0.5;
    cfg.params.max_distance_from_line = 12.0;
    cfg.params.ideal_center_x = 160.0;
    cfg.params.center_y = 120.0;
    cfg.params.steering_limit = 0.6;
    cfg.params.line_fit = fit::LineFitMethod::LeastSquares;

    cfg.backlash_enabled = true;
    cfg.backlash.width = 0.02;
    cfg.backlash.direction_threshold = 0.0;

    cfg.log_level = "info";

    return cfg;
}

void SteeringConfig::validate() const {
    params.validate();
    backlash.validate();
    utils::parse_level(log_level);

    LOG_DEBUG("[SteeringConfig] Validation passed");
}

void SteeringConfig::print_summary() const {
    LOG_INFO("========================================");
    LOG_INFO("Steering Configuration Summary");
    LOG_INFO("========================================");
    LOG_INFO("Name: %s", name.c_str());
    if (!description.empty()) {
        LOG_INFO("Description: %s", description.c_str());
    }
    LOG_INFO("----------------------------------------");
    LOG_INFO("Gains: Kp=%.4f, Kd=%.4f", params.proportional_gain, params.derivative_gain);
    LOG_INFO("Ideal center x: %.1f (evaluated at row %.1f)", params.ideal_center_x, params.center_y);
    LOG_INFO("Outlier distance: %.2f (%s fit)", params.max_distance_from_line, fit::to_string(params.line_fit));
    LOG_INFO("Steering limit: +/-%.3f", params.steering_limit);
    if (backlash_enabled) {
        LOG_INFO("Backlash: width=%.4f, threshold=%.4f", backlash.width, backlash.direction_threshold);
    } else {
        LOG_INFO("Backlash: disabled");
    }
    LOG_INFO("========================================");
}

std::unique_ptr<control::SteeringCompensator> SteeringConfig::make_compensator() const {
    if (backlash_enabled) {
        return std::make_unique<control::BacklashCompensator>(backlash);
    }
    return std::make_unique<control::IdentityCompensator>();
}

} // namespace config
