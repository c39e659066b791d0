// src/control/pd_steering_engine.hpp
#pragma once

#include <algorithm>
#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

#include "control/steering_compensator.hpp"
#include "fit/line_fit.hpp"
#include "fit/line_types.hpp"
#include "fit/robust_line_fitter.hpp"

namespace control {

struct SteeringParams {
    double proportional_gain = 0.0;      // per unit of horizontal error
    double derivative_gain = 0.0;        // per unit of centerline slope
    double max_distance_from_line = 0.0; // outlier threshold (horizontal)
    double ideal_center_x = 0.0;         // where the road center should be
    double center_y = 0.0;               // row at which the error is measured
    double steering_limit = 0.0;         // |output| <= steering_limit

    fit::LineFitMethod line_fit = fit::LineFitMethod::LeastSquares;

    /**
     * @throws std::invalid_argument if a gain, the threshold or the limit is
     *         negative, or any value is not finite
     */
    void validate() const;
};

struct SteeringErrors {
    double proportional = 0.0; // ideal_center_x - center_x
    double slope = 0.0;        // centerline slope, used as the derivative term
};

struct SteeringResult {
    double steering_angle = 0.0;     // compensated and clamped
    double proportional_error = 0.0;
    double slope = 0.0;
};

/**
 * PdSteeringEngine - Road-center points to one bounded steering command
 *
 * Per cycle:
 *   1. Robust line fit through the points (outliers trimmed one at a time)
 *   2. center_x = slope * center_y + intercept
 *   3. error = ideal_center_x - center_x
 *   4. raw = error * Kp + slope * Kd
 *   5. compensator.process(raw), then clamp to +/- steering_limit
 *
 * The slope stands in for the derivative term; nothing is differentiated
 * over time.
 *
 * Not thread-safe. One engine per control loop.
 */
class PdSteeringEngine {
public:
    /**
     * @param params      Tuning constants, fixed for the engine's lifetime
     * @param compensator Owned compensator; nullptr installs a
     *                    BacklashCompensator with zero width
     * @throws std::invalid_argument if params fail validation
     */
    explicit PdSteeringEngine(const SteeringParams& params,
                              std::unique_ptr<SteeringCompensator> compensator = nullptr);

    PdSteeringEngine(const PdSteeringEngine&) = delete;
    PdSteeringEngine& operator=(const PdSteeringEngine&) = delete;

    /**
     * compute_steering_angle() - Run one control cycle
     *
     * Points with a NaN or infinite coordinate are dropped first. Returns
     * std::nullopt when fewer than 2 points remain; in that case no state
     * (diagnostics or compensator) is touched.
     */
    std::optional<SteeringResult> compute_steering_angle(const std::vector<fit::Point>& input);

    /**
     * reset() - Forget diagnostics and reset the compensator
     */
    void reset();

    // ========================================================================
    // Diagnostics (empty until the first successful cycle)
    // ========================================================================

    const std::optional<fit::Line>& last_fitted_line() const { return last_line_; }
    const std::optional<SteeringErrors>& last_errors() const { return last_errors_; }
    std::size_t last_inlier_count() const { return last_inliers_; }
    std::size_t cycle_count() const { return cycles_; }

    const SteeringParams& params() const { return p_; }
    const SteeringCompensator& compensator() const { return *compensator_; }

private:
    SteeringParams p_;
    fit::RobustLineFitter fitter_;
    std::unique_ptr<SteeringCompensator> compensator_;

    std::optional<fit::Line> last_line_;
    std::optional<SteeringErrors> last_errors_;
    std::size_t last_inliers_ = 0;
    std::size_t cycles_ = 0;

    static double clamp(double v, double lo, double hi) {
        return std::max(lo, std::min(hi, v));
    }
};

} // namespace control
