// src/replay/timing_controller.hpp
#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <thread>

namespace replay {

/**
 * TimingController - Control-cycle pacing and compute-time statistics
 *
 * - Absolute deadlines (epoch + n * period), so jitter does not accumulate
 * - Deadline miss detection
 * - Per-cycle compute time (mark_cycle_start .. mark_cycle_end)
 * - Coarse sleep, then spin the last few microseconds
 */
class TimingController {
public:
    struct Stats {
        size_t total_cycles = 0;
        size_t deadline_misses = 0;
        double max_lateness_us = 0.0;
        double avg_lateness_us = 0.0;
        double max_cycle_time_us = 0.0;
        double avg_cycle_time_us = 0.0;
    };

    explicit TimingController(double period_s)
        : period_ns_(static_cast<int64_t>(period_s * 1e9)),
          spin_threshold_ns_(50000)
    {
        reset();
    }

    void reset() {
        cycle_count_ = 0;
        total_lateness_us_ = 0.0;
        total_cycle_time_us_ = 0.0;
        last_cycle_time_us_ = 0.0;
        stats_ = Stats{};
        epoch_ = std::chrono::steady_clock::now();
        cycle_start_ = epoch_;
    }

    void mark_cycle_start() {
        cycle_start_ = std::chrono::steady_clock::now();
    }

    /**
     * Close the compute section opened by mark_cycle_start()
     * @return compute time of this cycle in microseconds
     */
    double mark_cycle_end() {
        auto now = std::chrono::steady_clock::now();
        last_cycle_time_us_ = std::chrono::duration<double, std::micro>(now - cycle_start_).count();

        stats_.total_cycles++;
        total_cycle_time_us_ += last_cycle_time_us_;
        stats_.max_cycle_time_us = std::max(stats_.max_cycle_time_us, last_cycle_time_us_);
        stats_.avg_cycle_time_us = total_cycle_time_us_ / stats_.total_cycles;
        return last_cycle_time_us_;
    }

    /**
     * Sleep until the next cycle deadline
     *
     * Returns false if the deadline had already passed
     */
    bool wait_for_next_cycle() {
        using namespace std::chrono;

        auto now = steady_clock::now();
        cycle_count_++;

        auto deadline = epoch_ + nanoseconds(static_cast<int64_t>(cycle_count_) * period_ns_);
        int64_t remaining_ns = duration_cast<nanoseconds>(deadline - now).count();

        bool missed_deadline = false;
        if (remaining_ns < 0) {
            missed_deadline = true;
            stats_.deadline_misses++;

            double lateness_us = -remaining_ns / 1000.0;
            stats_.max_lateness_us = std::max(stats_.max_lateness_us, lateness_us);
            total_lateness_us_ += lateness_us;
            stats_.avg_lateness_us = total_lateness_us_ / stats_.deadline_misses;
        }

        if (remaining_ns > spin_threshold_ns_) {
            std::this_thread::sleep_until(deadline - nanoseconds(spin_threshold_ns_));
        }

        while (steady_clock::now() < deadline) {
            std::this_thread::yield();
        }

        return !missed_deadline;
    }

    /**
     * Scheduled time of the current cycle (seconds since reset)
     */
    double get_cycle_time() const {
        return cycle_count_ * (period_ns_ / 1e9);
    }

    const Stats& get_stats() const { return stats_; }

    /**
     * Microseconds before the deadline at which sleeping turns into spinning
     */
    void set_spin_threshold_us(double us) {
        spin_threshold_ns_ = static_cast<int64_t>(us * 1000.0);
    }

private:
    int64_t period_ns_;
    int64_t spin_threshold_ns_;

    size_t cycle_count_ = 0;
    double total_lateness_us_ = 0.0;
    double total_cycle_time_us_ = 0.0;
    double last_cycle_time_us_ = 0.0;

    std::chrono::steady_clock::time_point epoch_;
    std::chrono::steady_clock::time_point cycle_start_;

    Stats stats_;
};

} // namespace replay
