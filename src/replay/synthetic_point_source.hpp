// src/replay/synthetic_point_source.hpp
#pragma once

#include <cstdint>
#include <vector>

#include "replay/point_source.hpp"
#include "utils/noise.hpp"

namespace replay {

struct SyntheticParams {
    // Scan rows: `rows` rows evenly spaced in [row_top, row_bottom]
    int rows = 12;
    double row_top = 20.0;
    double row_bottom = 220.0;

    // Centerline: x(y, t) = center_x + offset(t) + heading(t) * (y - reference_row)
    double center_x = 160.0;
    double reference_row = 120.0;
    double offset_amplitude = 25.0;   // px
    double heading_amplitude = 0.15;  // px per row
    double period_s = 8.0;

    // Perception imperfections
    double noise_stddev = 1.5;         // px, per point
    double outlier_probability = 0.08; // per point
    double outlier_offset = 60.0;      // px, magnitude of a bad detection
    double drop_probability = 0.02;    // per frame, road not found
    double quantization = 0.0;         // px grid (e.g. window stride), 0 = off

    uint64_t seed = 1;                 // 0 = nondeterministic
};

/**
 * SyntheticPointSource - Built-in generator used when no recording or script
 * is given
 *
 * The road center sways sinusoidally with time. Points carry Gaussian noise;
 * some are replaced by far outliers and some frames come back empty. Never
 * exhausts.
 */
class SyntheticPointSource : public PointSource {
public:
    explicit SyntheticPointSource(const SyntheticParams& p = {});

    bool next_frame(double t_s, std::vector<fit::Point>& out) override;
    const char* name() const override { return "Synthetic"; }

    /**
     * Noise-free center x at row y and time t
     */
    double true_center_x(double y, double t_s) const;

    const SyntheticParams& params() const { return p_; }

private:
    SyntheticParams p_;
    utils::NoiseGenerator noise_;
    utils::Quantizer quantizer_;
};

} // namespace replay
