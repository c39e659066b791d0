// src/replay/replay_app.cpp
#include "replay/replay_app.hpp"
#include "replay/csv_point_source.hpp"
#include "replay/lua_point_source.hpp"
#include "replay/timing_controller.hpp"
#include "control/pd_steering_engine.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <utility>
#include <vector>

namespace replay {

ReplayApp::ReplayApp(ReplayConfig cfg, config::SteeringConfig steering)
    : cfg_(std::move(cfg)), steering_(std::move(steering))
{
    if (cfg_.enable_debug_log_file) {
        utils::open_log_file(cfg_.debug_log_path);
    }
}

std::unique_ptr<PointSource> ReplayApp::make_source() {
    switch (cfg_.source) {
    case SourceKind::Csv: {
        auto src = std::make_unique<CsvPointSource>();
        if (!src->load(cfg_.frames_csv_path)) {
            return nullptr;
        }
        return src;
    }
    case SourceKind::Lua: {
        auto src = std::make_unique<LuaPointSource>();
        if (src->init(cfg_.lua_script_path, cfg_.scenario_path)) {
            LOG_INFO("[Replay] Lua scenario loaded: %s", cfg_.lua_script_path.c_str());
            return src;
        }
        LOG_WARN("[Replay] Failed to init Lua scenario: %s", cfg_.lua_script_path.c_str());
        LOG_INFO("[Replay] Falling back to synthetic frames");
        return std::make_unique<SyntheticPointSource>(cfg_.synthetic);
    }
    case SourceKind::Synthetic:
    default:
        return std::make_unique<SyntheticPointSource>(cfg_.synthetic);
    }
}

int ReplayApp::run() {
    if (!(cfg_.rate_hz > 0.0 && cfg_.rate_hz <= ReplayConfig::MAX_RATE_HZ)) {
        LOG_ERROR("[Replay] Invalid control rate: %.3f Hz (must be 0 < rate <= %.0f)",
                  cfg_.rate_hz, ReplayConfig::MAX_RATE_HZ);
        return 1;
    }
    // Keeps duration_s * rate_hz representable as a cycle count
    if (!(cfg_.duration_s >= 0.0 && cfg_.duration_s <= ReplayConfig::MAX_DURATION_S)) {
        LOG_ERROR("[Replay] Invalid duration: %g s (must be 0 <= duration <= %.0f)",
                  cfg_.duration_s, ReplayConfig::MAX_DURATION_S);
        return 1;
    }
    const double dt = 1.0 / cfg_.rate_hz;

    auto source = make_source();
    if (!source) {
        return 1;
    }

    control::PdSteeringEngine engine(steering_.params, steering_.make_compensator());

    TimingController timer(dt);
    double spin_threshold_us = (dt * 1e6) * 0.05;
    spin_threshold_us = std::max(20.0, std::min(100.0, spin_threshold_us));
    timer.set_spin_threshold_us(spin_threshold_us);

    // ---- CSV output ----
    std::ofstream csv(cfg_.csv_out_path);
    if (!csv) {
        LOG_ERROR("[Replay] Failed to open CSV: %s", cfg_.csv_out_path.c_str());
        return 1;
    }

    csv << "cycle,t_s,n_points,n_inliers,status,"
        << "steering_angle,proportional_error,slope,intercept,"
        << "loop_time_us\n";
    csv << std::fixed << std::setprecision(6);

    const size_t max_cycles = (cfg_.duration_s > 0.0) ?
        static_cast<size_t>(cfg_.duration_s * cfg_.rate_hz) : 0;

    LOG_INFO("[Replay] Source=%s, rate=%.1f Hz, duration=%.1fs, real_time=%s",
             source->name(), cfg_.rate_hz, cfg_.duration_s,
             cfg_.real_time_mode ? "true" : "false");

    std::vector<fit::Point> points;
    double held_angle = 0.0;
    size_t insufficient = 0;
    size_t cycle = 0;

    timer.reset();

    for (; (max_cycles == 0) || (cycle < max_cycles); ++cycle) {
        const double t = cfg_.real_time_mode ? timer.get_cycle_time() : (cycle * dt);

        if (!source->next_frame(t, points)) {
            LOG_INFO("[Replay] [t=%.2f] Source exhausted after %zu cycle(s)", t, cycle);
            break;
        }

        timer.mark_cycle_start();
        const auto result = engine.compute_steering_angle(points);
        const double loop_us = timer.mark_cycle_end();

        csv << cycle << "," << t << "," << points.size() << ",";

        if (result) {
            held_angle = result->steering_angle;
            const fit::Line& line = *engine.last_fitted_line();

            csv << engine.last_inlier_count() << ",ok,"
                << result->steering_angle << ","
                << result->proportional_error << ","
                << result->slope << ","
                << line.intercept << ",";
        } else {
            // Hold the previous command; error columns stay empty
            ++insufficient;
            csv << "0,insufficient," << held_angle << ",,,,";
        }
        csv << loop_us << "\n";

        if (cfg_.real_time_mode) {
            bool on_time = timer.wait_for_next_cycle();
            if (!on_time && (cycle % 100 == 0)) {
                auto stats = timer.get_stats();
                LOG_WARN("[Replay] [t=%.2f] Deadline miss! Total misses: %zu, Max lateness: %.1f us",
                         t, stats.deadline_misses, stats.max_lateness_us);
            }
        }
    }

    // ---- Final statistics ----
    auto stats = timer.get_stats();

    LOG_INFO("========================================");
    LOG_INFO("Replay Statistics");
    LOG_INFO("========================================");
    LOG_INFO("Cycles: %zu (%zu with insufficient data)", cycle, insufficient);
    LOG_INFO("Engine cycles: %zu", engine.cycle_count());
    LOG_INFO("Max compute time: %.1f us (%.2f%% of period)",
             stats.max_cycle_time_us,
             100.0 * stats.max_cycle_time_us / (dt * 1e6));
    LOG_INFO("Avg compute time: %.1f us", stats.avg_cycle_time_us);
    if (cfg_.real_time_mode) {
        LOG_INFO("Deadline misses: %zu", stats.deadline_misses);
        if (stats.deadline_misses > 0) {
            LOG_INFO("Max lateness: %.1f us, avg %.1f us", stats.max_lateness_us, stats.avg_lateness_us);
        }
    }
    LOG_INFO("========================================");

    LOG_INFO("[Replay] CSV written to: %s", cfg_.csv_out_path.c_str());
    csv.close();
    return 0;
}

int ReplayApp::run_benchmark() {
    auto source = make_source();
    if (!source) {
        return 1;
    }

    // First frame with enough points to fit
    std::vector<fit::Point> points;
    const double dt = (cfg_.rate_hz > 0.0) ? 1.0 / cfg_.rate_hz : 0.0;
    for (size_t k = 0; points.size() < 2; ++k) {
        if (k >= 100 || !source->next_frame(k * dt, points)) {
            LOG_ERROR("[Replay] Source produced no frame with at least 2 points to benchmark");
            return 1;
        }
    }

    control::PdSteeringEngine engine(steering_.params, steering_.make_compensator());

    const size_t n = cfg_.benchmark_iterations;
    LOG_INFO("[Replay] Benchmarking %zu iteration(s) on a %zu-point frame", n, points.size());

    const auto start = std::chrono::steady_clock::now();

    for (size_t i = 0; i < n; ++i) {
        if (!engine.compute_steering_angle(points)) {
            LOG_ERROR("[Replay] Engine rejected the benchmark frame at iteration %zu", i);
            return 1;
        }
        if (i % 10 == 0) {
            LOG_INFO("Completed iteration %zu of %zu", i, n);
        }
    }

    const auto end = std::chrono::steady_clock::now();
    const double elapsed_s = std::chrono::duration<double>(end - start).count();

    LOG_INFO("Time elapsed: %.6f seconds", elapsed_s);
    if (n > 0) {
        LOG_INFO("Per cycle: %.3f us", elapsed_s * 1e6 / static_cast<double>(n));
    }
    return 0;
}

} // namespace replay
