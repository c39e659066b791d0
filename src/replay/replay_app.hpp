// src/replay/replay_app.hpp
#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "config/steering_config.hpp"
#include "replay/point_source.hpp"
#include "replay/synthetic_point_source.hpp"

namespace replay {

enum class SourceKind {
    Csv,       // recorded frames (frames_csv_path)
    Lua,       // scripted frames (lua_script_path)
    Synthetic  // built-in generator
};

struct ReplayConfig {
    static constexpr double MAX_RATE_HZ = 10000.0;
    static constexpr double MAX_DURATION_S = 1.0e6;

    SourceKind source = SourceKind::Synthetic;

    std::string frames_csv_path;
    std::string lua_script_path;     // e.g. "config/lua/scenario.lua"
    std::string scenario_path;       // handed to scenario_init()
    SyntheticParams synthetic;

    // Control loop
    double rate_hz = 30.0;
    double duration_s = 10.0;        // 0 = until the source is exhausted
    bool real_time_mode = false;

    // > 0 runs the benchmark instead of the replay loop
    size_t benchmark_iterations = 0;

    // Output files
    std::string csv_out_path = "steer_out.csv";
    std::string debug_log_path = "steer_debug.log";
    bool enable_debug_log_file = false;
};

/**
 * ReplayApp - Drives a PdSteeringEngine from a PointSource
 *
 * run():       one engine cycle per frame, CSV row per cycle, timing stats
 * run_benchmark(): the first frame repeated N times, elapsed time reported
 */
class ReplayApp {
public:
    ReplayApp(ReplayConfig cfg, config::SteeringConfig steering);

    int run();
    int run_benchmark();

private:
    ReplayConfig cfg_;
    config::SteeringConfig steering_;

    std::unique_ptr<PointSource> make_source();
};

} // namespace replay
