// src/control/pd_steering_engine.cpp
#include "control/pd_steering_engine.hpp"
#include "control/backlash_compensator.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>

namespace control {

namespace {

const SteeringParams& checked(const SteeringParams& p) {
    p.validate();
    return p;
}

void require_finite(double v, const char* field) {
    if (!std::isfinite(v)) {
        throw std::invalid_argument(std::string("Invalid ") + field + ": must be finite");
    }
}

void require_non_negative(double v, const char* field) {
    require_finite(v, field);
    if (v < 0.0) {
        throw std::invalid_argument(std::string("Invalid ") + field + ": must be >= 0");
    }
}

bool is_finite(const fit::Point& p) {
    return std::isfinite(p.y) && std::isfinite(p.x);
}

} // namespace

void SteeringParams::validate() const {
    require_non_negative(proportional_gain, "proportional_gain");
    require_non_negative(derivative_gain, "derivative_gain");
    require_non_negative(max_distance_from_line, "max_distance_from_line");
    require_non_negative(steering_limit, "steering_limit");
    require_finite(ideal_center_x, "ideal_center_x");
    require_finite(center_y, "center_y");
}

PdSteeringEngine::PdSteeringEngine(const SteeringParams& params,
                                   std::unique_ptr<SteeringCompensator> compensator)
    : p_(checked(params)),
      fitter_(params.max_distance_from_line, params.line_fit),
      compensator_(std::move(compensator))
{
    if (!compensator_) {
        compensator_ = std::make_unique<BacklashCompensator>();
    }

    LOG_INFO("[PdSteeringEngine] Kp=%.4f, Kd=%.4f, max_dist=%.2f (%s), ideal_x=%.2f, center_y=%.2f, limit=%.3f, compensator=%s",
             p_.proportional_gain,
             p_.derivative_gain,
             p_.max_distance_from_line,
             fit::to_string(p_.line_fit),
             p_.ideal_center_x,
             p_.center_y,
             p_.steering_limit,
             compensator_->name());
}

std::optional<SteeringResult> PdSteeringEngine::compute_steering_angle(
    const std::vector<fit::Point>& input)
{
    // Non-finite detections never reach the fit
    std::vector<fit::Point> finite;
    const bool has_bad = std::any_of(input.begin(), input.end(),
                                     [](const fit::Point& p) { return !is_finite(p); });
    if (has_bad) {
        finite.reserve(input.size());
        std::copy_if(input.begin(), input.end(), std::back_inserter(finite), is_finite);
        LOG_WARN("[PdSteeringEngine] Dropped %zu non-finite point(s)", input.size() - finite.size());
    }
    const std::vector<fit::Point>& points = has_bad ? finite : input;

    if (points.size() < fit::RobustLineFitter::MIN_POINTS) {
        LOG_DEBUG("[PdSteeringEngine] Insufficient data: %zu point(s)", points.size());
        return std::nullopt;
    }

    const fit::FitResult fr = fitter_.fit(points);
    const fit::Line& line = fr.line;

    const double center_x = line.x_at(p_.center_y);
    const double error = p_.ideal_center_x - center_x;

    const double raw = error * p_.proportional_gain + line.slope * p_.derivative_gain;
    const double compensated = compensator_->process(raw);
    const double angle = clamp(compensated, -p_.steering_limit, p_.steering_limit);

    last_line_ = line;
    last_errors_ = SteeringErrors{error, line.slope};
    last_inliers_ = fr.inliers.size();
    ++cycles_;

    LOG_TRACE("[PdSteeringEngine] line=(%.3f, %.5f), kept %zu/%zu, center_x=%.2f, err=%.3f, raw=%.4f, comp=%.4f, out=%.4f",
              line.intercept, line.slope,
              fr.inliers.size(), points.size(),
              center_x, error, raw, compensated, angle);

    SteeringResult result;
    result.steering_angle = angle;
    result.proportional_error = error;
    result.slope = line.slope;
    return result;
}

void PdSteeringEngine::reset() {
    LOG_DEBUG("[PdSteeringEngine] Reset");
    compensator_->reset();
    last_line_.reset();
    last_errors_.reset();
    last_inliers_ = 0;
    cycles_ = 0;
}

} // namespace control
