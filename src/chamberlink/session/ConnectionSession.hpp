#pragma once

#include "discovery/DiscoveryCoordinator.hpp"
#include "events/EventHub.hpp"
#include "runtime/ClientContext.hpp"
#include "session/ReconnectPolicy.hpp"
#include "transport/StreamChannel.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>

namespace CL {

/*
 * Owns the single streaming connection. A worker thread runs
 * Discovering -> Connected -> Disconnected -> (Discovering | stop), storing each
 * inbound snapshot in the context before publishing it.
 */
class ConnectionSession {
public:
    ConnectionSession(ClientContext& context, EventBus& events, DiscoveryCoordinator& discovery,
                      std::shared_ptr<StreamChannelFactory> streams);
    ~ConnectionSession();

    ConnectionSession(ConnectionSession const&)            = delete;
    ConnectionSession& operator=(ConnectionSession const&) = delete;
    ConnectionSession(ConnectionSession&&)                 = delete;
    ConnectionSession& operator=(ConnectionSession&&)      = delete;

    // Idle -> Discovering. No-op while the worker is already running.
    void start();
    // Closes the stream, suppresses reconnects and returns to Idle.
    void disconnect();
    // Resets the attempt counter and the discovery cache, then starts over.
    void reconnect();

    [[nodiscard]] auto state() const -> ConnectionState { return context_.connectionState(); }
    [[nodiscard]] bool running() const;
    [[nodiscard]] bool exhausted() const { return exhausted_.load(); }
    [[nodiscard]] auto attempts() const -> int;

private:
    void run(std::stop_token stop);
    void readLoop(StreamChannel& channel);
    void transition(ConnectionState next);
    bool sleepFor(std::chrono::milliseconds delay);
    void stopWorker();

    ClientContext&                        context_;
    EventBus&                             events_;
    DiscoveryCoordinator&                 discovery_;
    std::shared_ptr<StreamChannelFactory> streams_;
    SessionOptions                        options_;

    mutable std::mutex                    mutex_;
    std::condition_variable               wake_;
    std::shared_ptr<StreamChannel>        channel_;
    ReconnectPolicy                       policy_;
    std::thread                           worker_;
    std::atomic<bool>                     stop_{false};
    std::stop_source                      stopSource_;
    std::atomic<bool>                     exhausted_{false};
};

} // namespace CL
