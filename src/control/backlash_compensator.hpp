// src/control/backlash_compensator.hpp
#pragma once

#include "control/steering_compensator.hpp"

namespace control {

struct BacklashParams {
    double width = 0.0;               // total linkage play, in steering units
    double direction_threshold = 0.0; // min command change that counts as a reversal

    /**
     * @throws std::invalid_argument if either value is negative or not finite
     */
    void validate() const;
};

/**
 * BacklashCompensator - Inverse dead-band model of a steering linkage
 *
 * The linkage has `width` of play. While the command moves in one direction
 * the far side of the gap is engaged, so the command is pushed by width/2
 * in the direction of travel. Direction only changes when the command moves
 * by more than direction_threshold; smaller moves keep the last direction.
 *
 * Before any movement has been seen the direction is 0 and the command passes
 * through unchanged. With width == 0 the compensator is the identity.
 */
class BacklashCompensator : public SteeringCompensator {
public:
    explicit BacklashCompensator(BacklashParams p = {});

    double process(double value) override;
    void reset() override;
    const char* name() const override { return "Backlash"; }

    const BacklashParams& params() const { return p_; }

    // -1, 0 or +1
    int direction() const { return direction_; }

private:
    BacklashParams p_;

    bool has_previous_ = false;
    double previous_ = 0.0;
    int direction_ = 0;
};

} // namespace control
