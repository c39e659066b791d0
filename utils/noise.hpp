// utils/noise.hpp
#pragma once

#include <cmath>
#include <cstdint>
#include <random>

namespace utils {

/**
 * NoiseGenerator - Stateful random source for synthetic perception noise
 *
 * Each point source owns its own generator. A non-zero seed gives a
 * reproducible sequence; seed 0 draws from std::random_device.
 */
class NoiseGenerator {
public:
    explicit NoiseGenerator(uint64_t seed = 0)
        : gen_(seed == 0 ? std::random_device{}() : seed),
          normal_(0.0, 1.0),
          unit_(0.0, 1.0)
    {}

    /**
     * Gaussian white noise: N(0, stddev)
     */
    double gaussian(double stddev) {
        if (stddev <= 0.0) return 0.0;
        return normal_(gen_) * stddev;
    }

    /**
     * Uniform random in [-range, +range]
     */
    double uniform(double range) {
        if (range <= 0.0) return 0.0;
        return (unit_(gen_) - 0.5) * 2.0 * range;
    }

    /**
     * True with probability p (clamped to [0, 1])
     */
    bool chance(double p) {
        if (p <= 0.0) return false;
        if (p >= 1.0) return true;
        return unit_(gen_) < p;
    }

private:
    std::mt19937_64 gen_;
    std::normal_distribution<double> normal_;
    std::uniform_real_distribution<double> unit_;
};

/**
 * Quantizer - Snaps values to the perception grid (e.g. window stride in px)
 */
class Quantizer {
public:
    explicit Quantizer(double resolution = 0.0)
        : resolution_(resolution)
    {}

    double quantize(double value) const {
        if (resolution_ <= 0.0) return value;
        return std::round(value / resolution_) * resolution_;
    }

private:
    double resolution_;
};

} // namespace utils
