#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace CL {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        Timeout,
        MalformedInput,
        TransportFailure,
        Cancelled,
        VerificationFailed,
        NoBackendFound,
        StreamClosed,
        MaxReconnectsExceeded,
        CommandRejected,
        ConfirmationTimeout,
        Superseded,
        NotConnected,
        InvalidConfiguration
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::InvalidError:
        return "invalid_error";
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::Timeout:
        return "timeout";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::TransportFailure:
        return "transport_failure";
    case Error::Code::Cancelled:
        return "cancelled";
    case Error::Code::VerificationFailed:
        return "verification_failed";
    case Error::Code::NoBackendFound:
        return "no_backend_found";
    case Error::Code::StreamClosed:
        return "stream_closed";
    case Error::Code::MaxReconnectsExceeded:
        return "max_reconnects_exceeded";
    case Error::Code::CommandRejected:
        return "command_rejected";
    case Error::Code::ConfirmationTimeout:
        return "confirmation_timeout";
    case Error::Code::Superseded:
        return "superseded";
    case Error::Code::NotConnected:
        return "not_connected";
    case Error::Code::InvalidConfiguration:
        return "invalid_configuration";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

} // namespace CL
