// src/replay/csv_point_source.cpp
#include "replay/csv_point_source.hpp"
#include "utils/csv.hpp"
#include "utils/logging.hpp"

#include <cmath>
#include <stdexcept>

namespace replay {

bool CsvPointSource::load(const std::string& path) {
    frames_.clear();
    cursor_ = 0;

    utils::CsvReader reader;
    if (!reader.open(path)) {
        LOG_ERROR("[CsvPointSource] Cannot open frames file: %s", path.c_str());
        return false;
    }

    const auto missing = reader.missing_columns({"frame", "y", "x"});
    if (!missing.empty()) {
        LOG_ERROR("[CsvPointSource] %s: missing column '%s'", path.c_str(), missing.front().c_str());
        return false;
    }

    std::vector<std::string> row;
    bool have_frame = false;
    int current_id = 0;

    while (reader.read_row(row)) {
        try {
            const std::string frame_str = reader.get(row, "frame");
            if (frame_str.empty()) {
                LOG_ERROR("[CsvPointSource] %s:%zu: empty frame id", path.c_str(), reader.line_number());
                return false;
            }
            const int id = utils::CsvReader::to_int(frame_str);

            if (!have_frame || id != current_id) {
                frames_.emplace_back();
                current_id = id;
                have_frame = true;
            }

            const std::string y_str = reader.get(row, "y");
            const std::string x_str = reader.get(row, "x");
            if (y_str.empty() && x_str.empty()) {
                continue;
            }
            if (y_str.empty() || x_str.empty()) {
                LOG_ERROR("[CsvPointSource] %s:%zu: point needs both y and x", path.c_str(), reader.line_number());
                return false;
            }

            const double y = utils::CsvReader::to_double(y_str);
            const double x = utils::CsvReader::to_double(x_str);
            if (!std::isfinite(y) || !std::isfinite(x)) {
                LOG_ERROR("[CsvPointSource] %s:%zu: non-finite coordinate", path.c_str(), reader.line_number());
                return false;
            }

            frames_.back().emplace_back(y, x);

        } catch (const std::exception& e) {
            LOG_ERROR("[CsvPointSource] %s:%zu: %s", path.c_str(), reader.line_number(), e.what());
            return false;
        }
    }

    LOG_INFO("[CsvPointSource] Loaded %zu frame(s) from %s", frames_.size(), path.c_str());
    return true;
}

bool CsvPointSource::next_frame(double t_s, std::vector<fit::Point>& out) {
    (void)t_s;

    if (frames_.empty()) {
        return false;
    }
    if (cursor_ >= frames_.size()) {
        if (!loop_) {
            return false;
        }
        cursor_ = 0;
    }

    out = frames_[cursor_++];
    return true;
}

} // namespace replay
