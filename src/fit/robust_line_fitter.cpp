// src/fit/robust_line_fitter.cpp
#include "fit/robust_line_fitter.hpp"
#include "utils/logging.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace fit {

RobustLineFitter::RobustLineFitter(double max_distance, LineFitMethod method)
    : max_distance_(max_distance), method_(method)
{
    if (!std::isfinite(max_distance_) || max_distance_ < 0.0) {
        throw std::invalid_argument("Invalid max_distance_from_line: must be finite and >= 0");
    }
}

FitResult RobustLineFitter::fit(const std::vector<Point>& points) const {
    if (points.size() < MIN_POINTS) {
        throw std::invalid_argument(
            "RobustLineFitter needs at least " + std::to_string(MIN_POINTS) +
            " points, got " + std::to_string(points.size()));
    }

    for (const Point& p : points) {
        if (!std::isfinite(p.y) || !std::isfinite(p.x)) {
            throw std::invalid_argument("RobustLineFitter: non-finite point coordinate");
        }
    }

    FitResult result;
    result.inliers = points;

    for (;;) {
        result.line = fit_line(result.inliers, method_);
        ++result.passes;

        // Strict '>' keeps the first point among equal residuals
        std::size_t worst_idx = 0;
        double worst_dist = -1.0;
        for (std::size_t i = 0; i < result.inliers.size(); ++i) {
            const Point& p = result.inliers[i];
            const double dist = std::abs(result.line.x_at(p.y) - p.x);
            if (dist > worst_dist) {
                worst_dist = dist;
                worst_idx = i;
            }
        }

        if (!(worst_dist > max_distance_)) {
            break;
        }

        if (result.inliers.size() <= MIN_POINTS) {
            result.floor_reached = true;
            LOG_WARN("[RobustLineFitter] Residual %.3f above %.3f with only %zu points left, keeping them",
                     worst_dist, max_distance_, result.inliers.size());
            break;
        }

        LOG_TRACE("[RobustLineFitter] Pass %zu: dropping (y=%.2f, x=%.2f), residual=%.3f",
                  result.passes,
                  result.inliers[worst_idx].y,
                  result.inliers[worst_idx].x,
                  worst_dist);

        result.inliers.erase(result.inliers.begin() + static_cast<std::ptrdiff_t>(worst_idx));
        ++result.removed;
    }

    return result;
}

} // namespace fit
