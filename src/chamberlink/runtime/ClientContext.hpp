#pragma once

#include <chamberlink/ClientOptions.hpp>

#include "core/Error.hpp"
#include "core/Snapshot.hpp"
#include "core/Types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace CL {

class ClientContext;
class DiscoveryCoordinator;
class ConnectionSession;

// Verified backend plus the last endpoint that ever verified. Only the
// discovery coordinator writes it.
class DiscoveryCache {
public:
    [[nodiscard]] auto current() const -> std::optional<DiscoveryResult>;
    [[nodiscard]] auto lastKnown() const -> std::optional<Endpoint>;

private:
    friend class ClientContext;
    friend class DiscoveryCoordinator;

    void store(DiscoveryResult result);
    void clearCurrent();
    void clearAll();
    void setLastKnown(Endpoint endpoint);

    mutable std::mutex             mutex_;
    std::optional<DiscoveryResult> current_;
    std::optional<Endpoint>        lastKnown_;
    std::string                    persistPath_;
};

class ConnectionStateCell {
public:
    [[nodiscard]] auto get() const -> ConnectionState;

private:
    friend class ClientContext;
    friend class ConnectionSession;

    // Returns the previous state.
    auto set(ConnectionState state) -> ConnectionState;

    mutable std::mutex mutex_;
    ConnectionState    state_{ConnectionState::Idle};
};

class SnapshotStore {
public:
    // Stamps the next sequence number and makes the snapshot current.
    auto push(Snapshot snapshot) -> std::shared_ptr<Snapshot const>;

    [[nodiscard]] auto latest() const -> std::shared_ptr<Snapshot const>;
    [[nodiscard]] auto sequence() const -> std::uint64_t;

    // Blocks until a snapshot with sequence > after exists, the timeout passes
    // or the store is closed. Returns nullptr when none arrived.
    [[nodiscard]] auto waitNewer(std::uint64_t after, std::chrono::milliseconds timeout) const
        -> std::shared_ptr<Snapshot const>;

    void clear();
    void close();

private:
    friend class ClientContext;

    mutable std::mutex                      mutex_;
    mutable std::condition_variable         cv_;
    std::shared_ptr<Snapshot const>         latest_;
    std::uint64_t                           sequence_{0};
    bool                                    closed_{false};
};

/*
 * Process-wide state shared by the discovery, session and command layers.
 * Components take it by reference; its lifetime brackets theirs.
 */
class ClientContext {
public:
    [[nodiscard]] static auto create(ClientOptions options) -> std::unique_ptr<ClientContext>;

    ClientContext(ClientContext const&)            = delete;
    ClientContext& operator=(ClientContext const&) = delete;

    // Clears discovery results, connection state and snapshots.
    void reset();
    // Wakes every waiter; the context is unusable for new work afterwards.
    void teardown();

    [[nodiscard]] auto options() const -> ClientOptions const& { return options_; }
    [[nodiscard]] auto discoveryCache() -> DiscoveryCache& { return discovery_; }
    [[nodiscard]] auto discoveryCache() const -> DiscoveryCache const& { return discovery_; }
    [[nodiscard]] auto connectionState() const -> ConnectionState { return state_.get(); }
    [[nodiscard]] auto connectionCell() -> ConnectionStateCell& { return state_; }
    [[nodiscard]] auto snapshots() -> SnapshotStore& { return snapshots_; }
    [[nodiscard]] auto snapshots() const -> SnapshotStore const& { return snapshots_; }

private:
    explicit ClientContext(ClientOptions options);

    ClientOptions       options_;
    DiscoveryCache      discovery_;
    ConnectionStateCell state_;
    SnapshotStore       snapshots_;
};

[[nodiscard]] auto loadEndpointHint(std::string const& path) -> Expected<Endpoint>;
[[nodiscard]] auto saveEndpointHint(std::string const& path, DiscoveryResult const& result) -> Expected<void>;

} // namespace CL
