#pragma once

#include "transport/StreamChannel.hpp"

namespace CL {

// libwebsockets client. Each channel owns its lws context and a service thread;
// https endpoints connect with TLS and accept self-signed certificates.
class WebSocketChannelFactory final : public StreamChannelFactory {
public:
    auto create() -> std::unique_ptr<StreamChannel> override;
};

} // namespace CL
