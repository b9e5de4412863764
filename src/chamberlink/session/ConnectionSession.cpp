#include "session/ConnectionSession.hpp"

#include "log/TaggedLogger.hpp"

namespace CL {

ConnectionSession::ConnectionSession(ClientContext& context, EventBus& events, DiscoveryCoordinator& discovery,
                                     std::shared_ptr<StreamChannelFactory> streams)
    : context_(context)
    , events_(events)
    , discovery_(discovery)
    , streams_(std::move(streams))
    , options_(context.options().session)
    , policy_(options_) {}

ConnectionSession::~ConnectionSession() {
    stopWorker();
}

void ConnectionSession::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (worker_.joinable()) {
        if (!exhausted_) {
            return;
        }
        // A worker that gave up has already left run(); reap it before restarting.
        worker_.join();
    }
    stop_       = false;
    exhausted_  = false;
    stopSource_ = std::stop_source{};
    worker_     = std::thread([this, stop = stopSource_.get_token()] { run(stop); });
}

void ConnectionSession::stopWorker() {
    std::shared_ptr<StreamChannel> channel;
    std::thread                    worker;
    std::stop_source               stopSource;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_      = true;
        channel    = channel_;
        worker     = std::move(worker_);
        stopSource = stopSource_;
    }
    wake_.notify_all();
    // Reaches a discover() the worker is about to enter as well as one in progress.
    stopSource.request_stop();
    if (channel) {
        channel->close();
    }
    if (worker.joinable()) {
        worker.join();
    }
}

void ConnectionSession::disconnect() {
    stopWorker();
    transition(ConnectionState::Idle);
    cl_log("Session disconnected on request", "Session");
}

void ConnectionSession::reconnect() {
    stopWorker();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        policy_.reset();
    }
    discovery_.reset();
    cl_log("Manual reconnect requested", "Session");
    start();
}

bool ConnectionSession::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return worker_.joinable() && !exhausted_;
}

auto ConnectionSession::attempts() const -> int {
    std::lock_guard<std::mutex> lock(mutex_);
    return policy_.attempts();
}

void ConnectionSession::transition(ConnectionState next) {
    auto previous = context_.connectionCell().set(next);
    if (previous != next) {
        cl_log(std::string{"State "} + std::string{toString(previous)} + " -> " + std::string{toString(next)},
               "Session");
        events_.publish(ConnectionStateChanged{previous, next});
    }
}

bool ConnectionSession::sleepFor(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(mutex_);
    return !wake_.wait_for(lock, delay, [this] { return stop_.load(); });
}

void ConnectionSession::run(std::stop_token stop) {
#ifdef CL_LOG_DEBUG
    set_thread_name("Session");
#endif
    while (!stop_) {
        transition(ConnectionState::Discovering);
        auto found = discovery_.discover(stop);
        if (stop_) {
            break;
        }

        if (found) {
            std::shared_ptr<StreamChannel> channel = streams_->create();
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (stop_) {
                    break;
                }
                channel_ = channel;
            }
            auto opened = channel->connect(found->endpoint, options_.stream_path, options_.connect_timeout);
            if (opened && !stop_) {
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    policy_.reset();
                }
                transition(ConnectionState::Connected);
                readLoop(*channel);
            } else if (!opened) {
                cl_log("Stream handshake with " + found->endpoint.toUrl() + " failed: "
                           + describeError(opened.error()),
                       "Session");
            }
            channel->close();
            {
                std::lock_guard<std::mutex> lock(mutex_);
                channel_.reset();
            }
        } else {
            cl_log("Discovery failed: " + describeError(found.error()), "Session");
        }
        if (stop_) {
            break;
        }

        transition(ConnectionState::Disconnected);
        ReconnectDecision decision;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            decision = policy_.next();
        }
        if (decision.exhausted) {
            auto const attempts = decision.attempt - 1;
            cl_log("Giving up after " + std::to_string(attempts) + " reconnect attempt(s)", "Session");
            exhausted_ = true;
            events_.publish(MaxReconnectsReached{
                attempts, Error{Error::Code::MaxReconnectsExceeded,
                                "gave up after " + std::to_string(attempts) + " reconnect attempt(s)"}});
            return;
        }

        cl_log("Reconnect attempt " + std::to_string(decision.attempt) + " in "
                   + std::to_string(decision.delay.count()) + "ms"
                   + (decision.reset_discovery ? " with rediscovery" : ""),
               "Session");
        events_.publish(ReconnectScheduled{decision.attempt, policy_.maxAttempts(), decision.reset_discovery});
        if (!sleepFor(decision.delay)) {
            break;
        }
        if (decision.reset_discovery) {
            discovery_.reset();
        }
    }
}

void ConnectionSession::readLoop(StreamChannel& channel) {
    while (!stop_) {
        auto frame = channel.receive(options_.idle_timeout);
        if (!frame) {
            cl_log("Stream ended: " + describeError(frame.error()), "Session");
            return;
        }
        if (!frame->has_value()) {
            cl_log("No frame within " + std::to_string(options_.idle_timeout.count()) + "ms, closing stream",
                   "Session");
            return;
        }
        auto snapshot = parseSnapshot(**frame);
        if (!snapshot) {
            cl_log("Discarding frame: " + describeError(snapshot.error()), "Session");
            events_.publish(StreamError{snapshot.error()});
            continue;
        }
        auto stored = context_.snapshots().push(std::move(*snapshot));
        events_.publish(SnapshotReceived{stored});
    }
}

} // namespace CL
