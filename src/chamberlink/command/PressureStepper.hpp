#pragma once

namespace CL {

struct PressureLimits {
    double floor{1.00};
    double ceiling{1.99};
    double step{0.10};
};

/*
 * Setpoint stepping in whole hundredths. Incrementing snaps to the ceiling
 * instead of overshooting it; decrementing from the ceiling lands on the
 * highest point of the floor-anchored step grid below it, so 1.90 -> 1.99 -> 1.90.
 */
class PressureStepper {
public:
    PressureStepper() = default;
    explicit PressureStepper(PressureLimits limits)
        : limits_(limits) {}

    [[nodiscard]] auto increment(double value) const -> double;
    [[nodiscard]] auto decrement(double value) const -> double;
    [[nodiscard]] auto clamp(double value) const -> double;

    [[nodiscard]] auto limits() const -> PressureLimits const& { return limits_; }

private:
    PressureLimits limits_{};
};

} // namespace CL
