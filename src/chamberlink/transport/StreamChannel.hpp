#pragma once

#include "core/Error.hpp"
#include "core/Types.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace CL {

// Inbound-only message stream. close() is safe from any thread and makes a
// blocked receive() return StreamClosed promptly.
class StreamChannel {
public:
    virtual ~StreamChannel() = default;

    virtual auto connect(Endpoint const& endpoint, std::string const& path, std::chrono::milliseconds timeout)
        -> Expected<void> = 0;
    // nullopt when nothing arrived within timeout.
    virtual auto receive(std::chrono::milliseconds timeout) -> Expected<std::optional<std::string>> = 0;
    virtual void close()                                                                              = 0;
};

class StreamChannelFactory {
public:
    virtual ~StreamChannelFactory() = default;
    virtual auto create() -> std::unique_ptr<StreamChannel> = 0;
};

} // namespace CL
