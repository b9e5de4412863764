#pragma once

#include "command/CommandSynchronizer.hpp"
#include "command/PressureStepper.hpp"

#include <string>
#include <string_view>

namespace CL {

namespace Api {
inline constexpr std::string_view kHealth{"/health"};
inline constexpr std::string_view kSystemStatus{"/api/status/system"};
inline constexpr std::string_view kControlStatus{"/api/control/status"};
inline constexpr std::string_view kToggleAc{"/api/control/ac/toggle"};
inline constexpr std::string_view kToggleCeilingLights{"/api/control/lights/ceiling/toggle"};
inline constexpr std::string_view kToggleReadingLights{"/api/control/lights/reading/toggle"};
inline constexpr std::string_view kToggleDoorLights{"/api/control/lights/door/toggle"};
inline constexpr std::string_view kToggleIntercom{"/api/control/intercom/toggle"};
inline constexpr std::string_view kPressureAdd{"/api/pressure/add"};
inline constexpr std::string_view kPressureSubtract{"/api/pressure/subtract"};
inline constexpr std::string_view kPressureSetpoint{"/api/pressure/setpoint"};
inline constexpr std::string_view kSessionStart{"/api/session/start"};
inline constexpr std::string_view kSessionEnd{"/api/session/end"};
} // namespace Api

class ChamberCommands {
public:
    explicit ChamberCommands(CommandSynchronizer& synchronizer, PressureStepper stepper = PressureStepper{});

    auto toggleCeilingLights() -> Expected<CommandResult>;
    auto toggleReadingLights() -> Expected<CommandResult>;
    auto toggleDoorLights() -> Expected<CommandResult>;
    auto toggleAc() -> Expected<CommandResult>;
    auto toggleIntercom() -> Expected<CommandResult>;
    // Dispatches on the control key used by the toggles above.
    auto toggle(std::string_view control_key) -> Expected<CommandResult>;

    auto startSession() -> Expected<CommandResult>;
    auto endSession() -> Expected<CommandResult>;

    auto increasePressure() -> Expected<CommandResult>;
    auto decreasePressure() -> Expected<CommandResult>;
    auto setPressureSetpoint(double setpoint) -> Expected<CommandResult>;

    [[nodiscard]] auto stepper() const -> PressureStepper const& { return stepper_; }

private:
    auto toggleControl(std::string const& control_key, std::string_view path) -> Expected<CommandResult>;
    auto currentSetpoint() const -> double;

    CommandSynchronizer& synchronizer_;
    PressureStepper      stepper_;
};

} // namespace CL
