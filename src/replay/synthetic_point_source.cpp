// src/replay/synthetic_point_source.cpp
#include "replay/synthetic_point_source.hpp"

#include <algorithm>
#include <cmath>

namespace replay {

SyntheticPointSource::SyntheticPointSource(const SyntheticParams& p)
    : p_(p),
      noise_(p.seed),
      quantizer_(p.quantization)
{
}

double SyntheticPointSource::true_center_x(double y, double t_s) const {
    const double w = (p_.period_s > 0.0) ? 2.0 * M_PI / p_.period_s : 0.0;
    const double offset = p_.offset_amplitude * std::sin(w * t_s);
    const double heading = p_.heading_amplitude * std::cos(w * t_s);
    return p_.center_x + offset + heading * (y - p_.reference_row);
}

bool SyntheticPointSource::next_frame(double t_s, std::vector<fit::Point>& out) {
    out.clear();

    if (noise_.chance(p_.drop_probability)) {
        return true;
    }

    const int n = std::max(p_.rows, 0);
    out.reserve(static_cast<size_t>(n));

    for (int i = 0; i < n; ++i) {
        const double y = (n == 1) ? p_.row_top
                                  : p_.row_top + (p_.row_bottom - p_.row_top) * i / (n - 1);

        double x = true_center_x(y, t_s) + noise_.gaussian(p_.noise_stddev);
        if (noise_.chance(p_.outlier_probability)) {
            x += (noise_.uniform(1.0) < 0.0 ? -1.0 : 1.0) * p_.outlier_offset;
        }

        out.emplace_back(y, quantizer_.quantize(x));
    }

    return true;
}

} // namespace replay
