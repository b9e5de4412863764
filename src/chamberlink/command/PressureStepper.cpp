#include "command/PressureStepper.hpp"

#include <algorithm>
#include <cmath>

namespace CL {

namespace {

auto to_centi(double value) -> long {
    return std::lround(value * 100.0);
}

auto from_centi(long centi) -> double {
    return static_cast<double>(centi) / 100.0;
}

} // namespace

auto PressureStepper::increment(double value) const -> double {
    auto const floor   = to_centi(limits_.floor);
    auto const ceiling = to_centi(limits_.ceiling);
    auto const step    = to_centi(limits_.step);
    auto const current = std::max(to_centi(value), floor);
    if (current >= ceiling) {
        return from_centi(ceiling);
    }
    return from_centi(std::min(current + step, ceiling));
}

auto PressureStepper::decrement(double value) const -> double {
    auto const floor   = to_centi(limits_.floor);
    auto const ceiling = to_centi(limits_.ceiling);
    auto const step    = to_centi(limits_.step);
    auto const current = to_centi(value);
    if (current > ceiling) {
        return from_centi(ceiling);
    }
    if (current == ceiling && step > 0) {
        auto const below = floor + ((ceiling - floor - 1) / step) * step;
        return from_centi(std::max(below, floor));
    }
    return from_centi(std::max(current - step, floor));
}

auto PressureStepper::clamp(double value) const -> double {
    auto const centi = std::clamp(to_centi(value), to_centi(limits_.floor), to_centi(limits_.ceiling));
    return from_centi(centi);
}

} // namespace CL
