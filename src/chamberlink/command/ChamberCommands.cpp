#include "command/ChamberCommands.hpp"

namespace CL {

namespace {
constexpr char const* kPressureKey = "pressure_setpoint";
constexpr char const* kSessionKey  = "session_running";
} // namespace

ChamberCommands::ChamberCommands(CommandSynchronizer& synchronizer, PressureStepper stepper)
    : synchronizer_(synchronizer)
    , stepper_(stepper) {}

auto ChamberCommands::toggleControl(std::string const& control_key, std::string_view path) -> Expected<CommandResult> {
    auto current = synchronizer_.read(control_key);
    bool on      = current && current->is_boolean() && current->get<bool>();
    return synchronizer_.execute(CommandRequest{std::string{path}, control_key, !on, std::nullopt});
}

auto ChamberCommands::toggleCeilingLights() -> Expected<CommandResult> {
    return toggleControl("ceiling_lights", Api::kToggleCeilingLights);
}

auto ChamberCommands::toggleReadingLights() -> Expected<CommandResult> {
    return toggleControl("reading_lights", Api::kToggleReadingLights);
}

auto ChamberCommands::toggleDoorLights() -> Expected<CommandResult> {
    return toggleControl("door_lights", Api::kToggleDoorLights);
}

auto ChamberCommands::toggleAc() -> Expected<CommandResult> {
    return toggleControl("ac", Api::kToggleAc);
}

auto ChamberCommands::toggleIntercom() -> Expected<CommandResult> {
    return toggleControl("intercom", Api::kToggleIntercom);
}

auto ChamberCommands::toggle(std::string_view control_key) -> Expected<CommandResult> {
    if (control_key == "ceiling_lights") {
        return toggleCeilingLights();
    }
    if (control_key == "reading_lights") {
        return toggleReadingLights();
    }
    if (control_key == "door_lights") {
        return toggleDoorLights();
    }
    if (control_key == "ac") {
        return toggleAc();
    }
    if (control_key == "intercom") {
        return toggleIntercom();
    }
    return std::unexpected(Error{Error::Code::InvalidConfiguration, "no toggle for " + std::string{control_key}});
}

auto ChamberCommands::startSession() -> Expected<CommandResult> {
    return synchronizer_.execute(CommandRequest{std::string{Api::kSessionStart}, kSessionKey, true, std::nullopt});
}

auto ChamberCommands::endSession() -> Expected<CommandResult> {
    return synchronizer_.execute(CommandRequest{std::string{Api::kSessionEnd}, kSessionKey, false, std::nullopt});
}

auto ChamberCommands::currentSetpoint() const -> double {
    auto current = synchronizer_.read(kPressureKey);
    if (current && current->is_number()) {
        return current->get<double>();
    }
    return stepper_.limits().floor;
}

auto ChamberCommands::increasePressure() -> Expected<CommandResult> {
    auto proposed = stepper_.increment(currentSetpoint());
    return synchronizer_.execute(CommandRequest{std::string{Api::kPressureAdd}, kPressureKey, proposed, std::nullopt});
}

auto ChamberCommands::decreasePressure() -> Expected<CommandResult> {
    auto proposed = stepper_.decrement(currentSetpoint());
    return synchronizer_.execute(
        CommandRequest{std::string{Api::kPressureSubtract}, kPressureKey, proposed, std::nullopt});
}

auto ChamberCommands::setPressureSetpoint(double setpoint) -> Expected<CommandResult> {
    auto proposed = stepper_.clamp(setpoint);
    return synchronizer_.execute(CommandRequest{std::string{Api::kPressureSetpoint}, kPressureKey, proposed,
                                                nlohmann::json{{"setpoint", setpoint}}});
}

} // namespace CL
