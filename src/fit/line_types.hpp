// src/fit/line_types.hpp
#pragma once

namespace fit {

/**
 * Point - One perceived road-center sample
 *
 * Ordered vertical-then-horizontal: perception scans fixed rows (y) and
 * reports the horizontal offset (x) of the road center on each row.
 */
struct Point {
    double y = 0.0;  // vertical position (scan row)
    double x = 0.0;  // horizontal position

    Point() = default;
    Point(double y_, double x_) : y(y_), x(x_) {}
};

inline bool operator==(const Point& a, const Point& b) {
    return a.y == b.y && a.x == b.x;
}

inline bool operator!=(const Point& a, const Point& b) {
    return !(a == b);
}

/**
 * Line - x = slope * y + intercept
 *
 * Parameterized over the vertical axis because the centerline is sampled
 * row by row.
 */
struct Line {
    double intercept = 0.0;
    double slope = 0.0;

    Line() = default;
    Line(double intercept_, double slope_) : intercept(intercept_), slope(slope_) {}

    double x_at(double y) const { return slope * y + intercept; }
};

} // namespace fit
