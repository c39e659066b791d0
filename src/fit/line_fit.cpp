// src/fit/line_fit.cpp
#include "fit/line_fit.hpp"

#include <algorithm>
#include <cstddef>
#include <stdexcept>

#include <Eigen/Dense>

namespace fit {

namespace {

void require_two(const std::vector<Point>& points) {
    if (points.size() < 2) {
        throw std::invalid_argument(
            "Line fit requires at least 2 points, got " + std::to_string(points.size()));
    }
}

// Median of a non-empty vector; reorders v
double median(std::vector<double>& v) {
    const size_t n = v.size();
    const auto mid = v.begin() + static_cast<std::ptrdiff_t>(n / 2);
    std::nth_element(v.begin(), mid, v.end());
    const double upper = *mid;
    if (n % 2 == 1) {
        return upper;
    }
    const double lower = *std::max_element(v.begin(), mid);
    return 0.5 * (lower + upper);
}

} // namespace

const char* to_string(LineFitMethod m) {
    switch (m) {
    case LineFitMethod::LeastSquares:
        return "least_squares";
    case LineFitMethod::RepeatedMedian:
        return "repeated_median";
    }
    return "unknown";
}

LineFitMethod parse_line_fit_method(const std::string& name) {
    if (name == "least_squares") return LineFitMethod::LeastSquares;
    if (name == "repeated_median") return LineFitMethod::RepeatedMedian;
    throw std::invalid_argument("Unknown line fit method: " + name);
}

Line fit_line(const std::vector<Point>& points) {
    require_two(points);

    const double y0 = points.front().y;
    const bool single_row = std::all_of(points.begin(), points.end(),
                                        [y0](const Point& p) { return p.y == y0; });

    const Eigen::Index n = static_cast<Eigen::Index>(points.size());

    double mean_y = 0.0;
    for (const auto& p : points) {
        mean_y += p.y;
    }
    mean_y /= static_cast<double>(n);

    // Design matrix [1, y - mean_y]. Centering keeps the normal equations
    // well conditioned for pixel-sized rows.
    Eigen::MatrixXd A(n, 2);
    Eigen::VectorXd X(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        const Point& p = points[static_cast<size_t>(i)];
        A(i, 0) = 1.0;
        A(i, 1) = p.y - mean_y;
        X(i) = p.x;
    }

    if (single_row) {
        return Line(X.mean(), 0.0);
    }

    const Eigen::Matrix2d AtA = A.transpose() * A;
    const Eigen::Vector2d AtX = A.transpose() * X;
    const Eigen::Vector2d c = AtA.ldlt().solve(AtX);

    const double slope = c(1);
    return Line(c(0) - slope * mean_y, slope);
}

Line fit_line_repeated_median(const std::vector<Point>& points) {
    require_two(points);

    const size_t n = points.size();

    std::vector<double> point_slopes;
    point_slopes.reserve(n);

    std::vector<double> pair_slopes;
    pair_slopes.reserve(n - 1);

    for (size_t i = 0; i < n; ++i) {
        pair_slopes.clear();
        for (size_t j = 0; j < n; ++j) {
            const double dy = points[j].y - points[i].y;
            if (j == i || dy == 0.0) continue;
            pair_slopes.push_back((points[j].x - points[i].x) / dy);
        }
        if (!pair_slopes.empty()) {
            point_slopes.push_back(median(pair_slopes));
        }
    }

    const double slope = point_slopes.empty() ? 0.0 : median(point_slopes);

    std::vector<double> intercepts;
    intercepts.reserve(n);
    for (const auto& p : points) {
        intercepts.push_back(p.x - slope * p.y);
    }

    return Line(median(intercepts), slope);
}

Line fit_line(const std::vector<Point>& points, LineFitMethod method) {
    switch (method) {
    case LineFitMethod::RepeatedMedian:
        return fit_line_repeated_median(points);
    case LineFitMethod::LeastSquares:
    default:
        return fit_line(points);
    }
}

} // namespace fit
