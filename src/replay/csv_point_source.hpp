// src/replay/csv_point_source.hpp
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "replay/point_source.hpp"

namespace replay {

/**
 * CsvPointSource - Replays recorded frames from a CSV file
 *
 * Expected header: frame,y,x
 *
 *   # comment lines and blank lines are skipped
 *   frame,y,x
 *   0,40,158.5
 *   0,80,160.0
 *   1,,          <- frame 1 recorded with no points
 *
 * Consecutive rows sharing a frame id form one frame. A row whose y and x
 * are both empty adds an empty frame.
 */
class CsvPointSource : public PointSource {
public:
    CsvPointSource() = default;

    /**
     * Load the whole file into memory
     * @return false (with an error logged) if the file is missing or malformed
     */
    bool load(const std::string& path);

    bool next_frame(double t_s, std::vector<fit::Point>& out) override;
    const char* name() const override { return "CSV"; }

    std::size_t frame_count() const { return frames_.size(); }
    const std::vector<fit::Point>& frame(std::size_t i) const { return frames_.at(i); }

    // Restart from the first frame
    void rewind() { cursor_ = 0; }

    // Wrap around instead of reporting exhaustion
    void set_loop(bool loop) { loop_ = loop; }

private:
    std::vector<std::vector<fit::Point>> frames_;
    std::size_t cursor_ = 0;
    bool loop_ = false;
};

} // namespace replay
