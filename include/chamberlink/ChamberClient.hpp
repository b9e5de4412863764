#pragma once

#include <chamberlink/ClientOptions.hpp>

#include "command/ChamberCommands.hpp"
#include "command/CommandSynchronizer.hpp"
#include "discovery/DiscoveryCoordinator.hpp"
#include "events/EventHub.hpp"
#include "runtime/ClientContext.hpp"
#include "session/ConnectionSession.hpp"
#include "transport/HttpTransport.hpp"
#include "transport/StreamChannel.hpp"

#include <memory>
#include <optional>
#include <string>

namespace CL {

struct Transports {
    std::shared_ptr<HttpClientFactory>    http;
    std::shared_ptr<StreamChannelFactory> stream;
};

// cpp-httplib for requests, libwebsockets for the stream.
[[nodiscard]] auto makeNetworkTransports() -> Transports;

/*
 * Wires the discovery, session and command layers around one context and one
 * event hub. Commands resolve their backend through the discovery cache.
 */
class ChamberClient {
public:
    ChamberClient(ClientOptions options, Transports transports);
    ~ChamberClient();

    ChamberClient(ChamberClient const&)            = delete;
    ChamberClient& operator=(ChamberClient const&) = delete;

    void start();
    void stop();
    void reconnect();
    // Drops every cached backend address, including the persisted hint.
    void forgetBackend();

    [[nodiscard]] auto state() const -> ConnectionState;
    [[nodiscard]] auto read(std::string const& control_key) const -> std::optional<nlohmann::json>;
    [[nodiscard]] bool isPending(std::string const& control_key) const;
    [[nodiscard]] auto latestSnapshot() const -> std::shared_ptr<Snapshot const>;

    [[nodiscard]] auto events() -> EventBus& { return hub_; }
    [[nodiscard]] auto commands() -> ChamberCommands& { return commands_; }
    [[nodiscard]] auto synchronizer() -> CommandSynchronizer& { return synchronizer_; }
    [[nodiscard]] auto discovery() -> DiscoveryCoordinator& { return discovery_; }
    [[nodiscard]] auto session() -> ConnectionSession& { return session_; }
    [[nodiscard]] auto context() -> ClientContext& { return *context_; }

private:
    std::unique_ptr<ClientContext> context_;
    EventHub                       hub_;
    DiscoveryCoordinator           discovery_;
    ConnectionSession              session_;
    CommandSynchronizer            synchronizer_;
    ChamberCommands                commands_;
};

} // namespace CL
