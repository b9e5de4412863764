#pragma once

#include "core/Error.hpp"
#include "core/Snapshot.hpp"
#include "core/Types.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

namespace CL {

struct ConnectionStateChanged {
    ConnectionState previous{ConnectionState::Idle};
    ConnectionState current{ConnectionState::Idle};
};

struct DiscoveryComplete {
    DiscoveryResult result;
};

struct DiscoveryFailed {
    std::size_t candidates_tried{0};
};

struct SnapshotReceived {
    std::shared_ptr<Snapshot const> snapshot;
};

struct StreamError {
    Error error;
};

struct ReconnectScheduled {
    int  attempt{0};
    int  max_attempts{0};
    bool reset_discovery{false};
};

struct MaxReconnectsReached {
    int   attempts{0};
    Error error{Error::Code::MaxReconnectsExceeded, "reconnect attempts exhausted"};
};

struct OptimisticUpdate {
    std::string    control_key;
    nlohmann::json value;
    std::string    command_id;
};

// Emitted whenever the consumer-visible value of a control changes without a snapshot.
struct ControlsUpdated {
    std::string    control_key;
    nlohmann::json value;
};

struct CommandSucceeded {
    std::string    control_key;
    std::string    command_id;
    nlohmann::json value;
};

struct CommandFailed {
    std::string control_key;
    std::string command_id;
    Error       error;
};

using Event = std::variant<ConnectionStateChanged,
                           DiscoveryComplete,
                           DiscoveryFailed,
                           SnapshotReceived,
                           StreamError,
                           ReconnectScheduled,
                           MaxReconnectsReached,
                           OptimisticUpdate,
                           ControlsUpdated,
                           CommandSucceeded,
                           CommandFailed>;

enum class EventKind {
    ConnectionState,
    DiscoveryComplete,
    DiscoveryFailed,
    StatusUpdate,
    StreamError,
    ReconnectScheduled,
    MaxReconnectsReached,
    OptimisticUpdate,
    ControlsUpdate,
    CommandSuccess,
    CommandError
};

[[nodiscard]] auto eventKind(Event const& event) -> EventKind;
[[nodiscard]] auto eventName(EventKind kind) -> std::string_view;

} // namespace CL
