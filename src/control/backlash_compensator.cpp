// src/control/backlash_compensator.cpp
#include "control/backlash_compensator.hpp"

#include <cmath>
#include <stdexcept>

namespace control {

void BacklashParams::validate() const {
    if (!std::isfinite(width) || width < 0.0) {
        throw std::invalid_argument("Invalid backlash width: must be finite and >= 0");
    }
    if (!std::isfinite(direction_threshold) || direction_threshold < 0.0) {
        throw std::invalid_argument("Invalid backlash direction_threshold: must be finite and >= 0");
    }
}

BacklashCompensator::BacklashCompensator(BacklashParams p)
    : p_(p)
{
    p_.validate();
}

double BacklashCompensator::process(double value) {
    if (has_previous_) {
        const double delta = value - previous_;
        if (delta > p_.direction_threshold) {
            direction_ = 1;
        } else if (delta < -p_.direction_threshold) {
            direction_ = -1;
        }
    }

    previous_ = value;
    has_previous_ = true;

    return value + direction_ * (p_.width * 0.5);
}

void BacklashCompensator::reset() {
    has_previous_ = false;
    previous_ = 0.0;
    direction_ = 0;
}

} // namespace control
