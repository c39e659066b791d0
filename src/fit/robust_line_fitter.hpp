// src/fit/robust_line_fitter.hpp
#pragma once

#include <cstddef>
#include <vector>

#include "fit/line_fit.hpp"
#include "fit/line_types.hpp"

namespace fit {

struct FitResult {
    Line line;                  // fit over `inliers`
    std::vector<Point> inliers; // retained points, input order preserved
    std::size_t removed = 0;    // points trimmed as outliers
    std::size_t passes = 0;     // line fits performed
    bool floor_reached = false; // trimming stopped by the 2-point minimum
};

/**
 * RobustLineFitter - Iterative single-outlier trimming around a line fit
 *
 * Each pass fits the working set, finds the point with the greatest
 * horizontal residual (first one wins on ties) and drops it if the residual
 * is strictly above max_distance. Stops when the worst residual is within
 * the threshold. At most one point is removed per pass.
 *
 * The working set never drops below MIN_POINTS.
 */
class RobustLineFitter {
public:
    static constexpr std::size_t MIN_POINTS = 2;

    /**
     * @param max_distance Horizontal distance from the line beyond which a
     *                     point counts as an outlier (>= 0)
     * @param method       Line fit used on every pass
     * @throws std::invalid_argument if max_distance is negative or not finite
     */
    explicit RobustLineFitter(double max_distance,
                              LineFitMethod method = LineFitMethod::LeastSquares);

    /**
     * @throws std::invalid_argument if fewer than MIN_POINTS points are given
     *         or any coordinate is NaN or infinite
     */
    FitResult fit(const std::vector<Point>& points) const;

    double max_distance() const { return max_distance_; }
    LineFitMethod method() const { return method_; }

private:
    double max_distance_;
    LineFitMethod method_;
};

} // namespace fit
