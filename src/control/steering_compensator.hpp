// src/control/steering_compensator.hpp
#pragma once

namespace control {

/**
 * SteeringCompensator - Stateful transform between the PD law and the
 * steering actuator
 *
 * One instance is owned by one PdSteeringEngine and persists across control
 * cycles. process() is called exactly once per successful cycle.
 */
class SteeringCompensator {
public:
    virtual ~SteeringCompensator() = default;

    /**
     * process() - Map a raw steering command to the compensated command
     */
    virtual double process(double value) = 0;

    /**
     * reset() - Return to the state right after construction
     */
    virtual void reset() {}

    virtual const char* name() const = 0;
};

/**
 * IdentityCompensator - Passes commands through unchanged
 */
class IdentityCompensator : public SteeringCompensator {
public:
    double process(double value) override { return value; }
    const char* name() const override { return "Identity"; }
};

} // namespace control
