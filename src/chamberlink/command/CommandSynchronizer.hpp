#pragma once

#include "command/OptimisticTable.hpp"
#include "core/ControlMap.hpp"
#include "events/EventHub.hpp"
#include "runtime/ClientContext.hpp"
#include "transport/HttpTransport.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace CL {

struct CommandRequest {
    std::string                   path;
    std::string                   control_key;
    nlohmann::json                proposed_value;
    std::optional<nlohmann::json> body;
};

struct CommandResult {
    std::string    command_id;
    nlohmann::json confirmed_value;
    nlohmann::json response;
};

/*
 * Optimistic command execution. The proposed value is visible through read()
 * before the request leaves; it is rolled back on rejection and retired once a
 * snapshot received after the write shows it. Errors go to the caller only:
 * CommandRejected, ConfirmationTimeout, or Superseded when a newer command for
 * the same key took over.
 */
class CommandSynchronizer {
public:
    using EndpointResolver = std::function<Expected<Endpoint>()>;

    CommandSynchronizer(ClientContext& context, EventBus& events, std::shared_ptr<HttpClientFactory> http,
                        EndpointResolver resolver, ControlMap controls = ControlMap::defaults());

    CommandSynchronizer(CommandSynchronizer const&)            = delete;
    CommandSynchronizer& operator=(CommandSynchronizer const&) = delete;

    [[nodiscard]] auto execute(CommandRequest const& request) -> Expected<CommandResult>;
    [[nodiscard]] auto execute(Endpoint const& endpoint, CommandRequest const& request) -> Expected<CommandResult>;

    // Optimistic value if one is showing, else the latest snapshot's value.
    [[nodiscard]] auto read(std::string const& control_key) const -> std::optional<nlohmann::json>;
    [[nodiscard]] bool isPending(std::string const& control_key) const;
    [[nodiscard]] auto pendingCommands() const -> std::vector<OptimisticEntry>;
    [[nodiscard]] auto controls() const -> ControlMap const& { return controls_; }

private:
    auto run(std::optional<Endpoint> endpoint, CommandRequest const& request) -> Expected<CommandResult>;
    auto admit() -> Expected<void>;
    auto reconcile(CommandRequest const& request, std::string const& command_id, std::uint64_t generation,
                   std::uint64_t baseline, nlohmann::json const& target, nlohmann::json response)
        -> Expected<CommandResult>;
    auto reject(CommandRequest const& request, std::string const& command_id, std::uint64_t generation,
                std::string message) -> Error;
    void publishVisible(std::string const& control_key);

    ClientContext&                     context_;
    EventBus&                          events_;
    std::shared_ptr<HttpClientFactory> http_;
    EndpointResolver                   resolver_;
    ControlMap                         controls_;
    CommandOptions                     options_;
    OptimisticTable                    table_;

    std::mutex                                        rateMutex_;
    std::deque<std::chrono::steady_clock::time_point> recent_;
    std::atomic<std::uint64_t>                        nextCommand_{1};
};

} // namespace CL
