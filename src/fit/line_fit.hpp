// src/fit/line_fit.hpp
#pragma once

#include <string>
#include <vector>

#include "fit/line_types.hpp"

namespace fit {

enum class LineFitMethod {
    LeastSquares,   // ordinary least squares of x on y
    RepeatedMedian  // Siegel repeated-median slope, median intercept
};

const char* to_string(LineFitMethod m);

/**
 * Parse "least_squares" / "repeated_median"
 * @throws std::invalid_argument on any other name
 */
LineFitMethod parse_line_fit_method(const std::string& name);

/**
 * fit_line() - Ordinary least squares of x on y
 *
 * Returns the line x = slope * y + intercept minimizing the summed squared
 * horizontal residuals.
 *
 * If every point shares the same y the slope is undefined; the result is
 * slope = 0 and intercept = mean(x).
 *
 * @throws std::invalid_argument if fewer than 2 points are supplied
 */
Line fit_line(const std::vector<Point>& points);

/**
 * fit_line_repeated_median() - Siegel repeated-median line
 *
 * slope     = median over i of (median over j != i of pairwise slope(i, j))
 * intercept = median over i of (x_i - slope * y_i)
 *
 * Pairs with equal y carry no slope and are skipped. Medians of an even
 * count average the two middle values. If no pair has distinct y the slope
 * is 0 and the intercept is median(x).
 *
 * Tolerates up to half the points being outliers, so a single far point in
 * a small set does not drag the line toward itself.
 *
 * @throws std::invalid_argument if fewer than 2 points are supplied
 */
Line fit_line_repeated_median(const std::vector<Point>& points);

Line fit_line(const std::vector<Point>& points, LineFitMethod method);

} // namespace fit
