#include <chamberlink/ChamberClient.hpp>

#include "log/TaggedLogger.hpp"
#include "transport/HttplibTransport.hpp"
#include "transport/WebSocketChannel.hpp"

namespace CL {

auto makeNetworkTransports() -> Transports {
    return Transports{std::make_shared<HttplibClientFactory>(), std::make_shared<WebSocketChannelFactory>()};
}

ChamberClient::ChamberClient(ClientOptions options, Transports transports)
    : context_(ClientContext::create(std::move(options)))
    , discovery_(*context_, hub_, transports.http)
    , session_(*context_, hub_, discovery_, transports.stream)
    , synchronizer_(*context_, hub_, transports.http,
                    [this]() -> Expected<Endpoint> {
                        if (auto current = context_->discoveryCache().current()) {
                            return current->endpoint;
                        }
                        return std::unexpected(Error{Error::Code::NotConnected, "no backend discovered"});
                    })
    , commands_(synchronizer_) {}

ChamberClient::~ChamberClient() {
    stop();
    context_->teardown();
}

void ChamberClient::start() {
    cl_log("Starting client", "Session");
    session_.start();
}

void ChamberClient::stop() {
    session_.disconnect();
}

void ChamberClient::reconnect() {
    session_.reconnect();
}

void ChamberClient::forgetBackend() {
    discovery_.forget();
}

auto ChamberClient::state() const -> ConnectionState {
    return context_->connectionState();
}

auto ChamberClient::read(std::string const& control_key) const -> std::optional<nlohmann::json> {
    return synchronizer_.read(control_key);
}

bool ChamberClient::isPending(std::string const& control_key) const {
    return synchronizer_.isPending(control_key);
}

auto ChamberClient::latestSnapshot() const -> std::shared_ptr<Snapshot const> {
    return context_->snapshots().latest();
}

} // namespace CL
