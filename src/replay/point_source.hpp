// src/replay/point_source.hpp
#pragma once

#include <vector>

#include "fit/line_types.hpp"

namespace replay {

/**
 * PointSource - Stand-in for the perception stage
 *
 * Produces one frame of road-center points per control cycle.
 */
class PointSource {
public:
    virtual ~PointSource() = default;

    /**
     * next_frame() - Fill `out` with the points for cycle time t_s
     *
     * A frame may legitimately hold fewer than 2 points (road lost).
     * Returns false once the source is exhausted or has failed.
     */
    virtual bool next_frame(double t_s, std::vector<fit::Point>& out) = 0;

    virtual const char* name() const = 0;
};

} // namespace replay
