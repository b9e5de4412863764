#include "loopback/LoopbackNetwork.hpp"

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <utility>

#include <parallel_hashmap/phmap.h>

namespace CL::Loopback {

void Stream::push(std::string frame) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        frames_.push_back(std::move(frame));
    }
    cv_.notify_all();
}

void Stream::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool Stream::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

auto Stream::receive(std::chrono::milliseconds timeout) -> Expected<std::optional<std::string>> {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return closed_ || !frames_.empty(); });
    if (!frames_.empty()) {
        auto frame = std::move(frames_.front());
        frames_.pop_front();
        return std::optional<std::string>{std::move(frame)};
    }
    if (closed_) {
        return std::unexpected(Error{Error::Code::StreamClosed, "loopback stream closed"});
    }
    return std::optional<std::string>{};
}

struct Network::State {
    struct Slot {
        std::shared_ptr<Host>     host;
        bool                      online{true};
        std::chrono::milliseconds latency{0};
        std::size_t               requests{0};
        std::size_t               streams{0};
    };

    mutable std::mutex                      mutex;
    phmap::flat_hash_map<std::string, Slot> slots;
    phmap::flat_hash_map<std::string, std::size_t> unknownRequests;
    std::size_t                             total{0};
    std::size_t                             cancelled{0};

    // Host and latency for a reachable endpoint, counting the attempt either way.
    auto reach(Endpoint const& endpoint, bool stream)
        -> Expected<std::pair<std::shared_ptr<Host>, std::chrono::milliseconds>> {
        std::lock_guard<std::mutex> lock(mutex);
        auto key = endpoint.key();
        auto it  = slots.find(key);
        if (!stream) {
            ++total;
        }
        if (it == slots.end()) {
            if (!stream) {
                ++unknownRequests[key];
            }
            return std::unexpected(Error{Error::Code::TransportFailure, "connection refused: " + key});
        }
        if (stream) {
            ++it->second.streams;
        } else {
            ++it->second.requests;
        }
        if (!it->second.online || !it->second.host) {
            return std::unexpected(Error{Error::Code::TransportFailure, "connection refused: " + key});
        }
        return std::make_pair(it->second.host, it->second.latency);
    }
};

namespace {

class Client final : public HttpClient {
public:
    Client(std::shared_ptr<Network::State> state, Endpoint endpoint, std::chrono::milliseconds timeout)
        : state_(std::move(state))
        , endpoint_(std::move(endpoint))
        , timeout_(timeout) {}

    auto get(std::string const& path) -> Expected<HttpReply> override { return send(Request{"GET", path, {}}); }

    auto post(std::string const& path, std::string const& body) -> Expected<HttpReply> override {
        return send(Request{"POST", path, body});
    }

    void cancel() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

private:
    auto send(Request const& request) -> Expected<HttpReply> {
        if (isCancelled()) {
            return cancelledError();
        }
        auto reached = state_->reach(endpoint_, false);
        if (!reached) {
            return std::unexpected(reached.error());
        }
        auto [host, latency] = std::move(*reached);
        auto const wait      = std::min(latency, timeout_);
        if (wait.count() > 0) {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, wait, [this] { return cancelled_; });
        }
        if (isCancelled()) {
            return cancelledError();
        }
        if (latency > timeout_) {
            return std::unexpected(Error{Error::Code::Timeout, request.method + " " + request.path + " timed out"});
        }
        return host->handle(request);
    }

    bool isCancelled() {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }

    auto cancelledError() -> Expected<HttpReply> {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            ++state_->cancelled;
        }
        return std::unexpected(Error{Error::Code::Cancelled, "request cancelled"});
    }

    std::shared_ptr<Network::State> state_;
    Endpoint                        endpoint_;
    std::chrono::milliseconds       timeout_;
    std::mutex                      mutex_;
    std::condition_variable         cv_;
    bool                            cancelled_{false};
};

class ClientFactory final : public HttpClientFactory {
public:
    explicit ClientFactory(std::shared_ptr<Network::State> state)
        : state_(std::move(state)) {}

    auto create(Endpoint const& endpoint, std::chrono::milliseconds timeout) -> std::unique_ptr<HttpClient> override {
        return std::make_unique<Client>(state_, endpoint, timeout);
    }

private:
    std::shared_ptr<Network::State> state_;
};

class Channel final : public StreamChannel {
public:
    explicit Channel(std::shared_ptr<Network::State> state)
        : state_(std::move(state)) {}

    ~Channel() override { close(); }

    auto connect(Endpoint const& endpoint, std::string const& path, std::chrono::milliseconds)
        -> Expected<void> override {
        auto reached = state_->reach(endpoint, true);
        if (!reached) {
            return std::unexpected(reached.error());
        }
        auto opened = reached->first->openStream(path);
        if (!opened) {
            return std::unexpected(opened.error());
        }
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            (*opened)->close();
            return std::unexpected(Error{Error::Code::StreamClosed, "channel closed during connect"});
        }
        stream_ = std::move(*opened);
        return {};
    }

    auto receive(std::chrono::milliseconds timeout) -> Expected<std::optional<std::string>> override {
        std::shared_ptr<Stream> stream;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stream = stream_;
        }
        if (!stream) {
            return std::unexpected(Error{Error::Code::StreamClosed, "stream not open"});
        }
        return stream->receive(timeout);
    }

    void close() override {
        std::shared_ptr<Stream> stream;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
            stream  = stream_;
        }
        if (stream) {
            stream->close();
        }
    }

private:
    std::shared_ptr<Network::State> state_;
    std::mutex                      mutex_;
    std::shared_ptr<Stream>         stream_;
    bool                            closed_{false};
};

class ChannelFactory final : public StreamChannelFactory {
public:
    explicit ChannelFactory(std::shared_ptr<Network::State> state)
        : state_(std::move(state)) {}

    auto create() -> std::unique_ptr<StreamChannel> override { return std::make_unique<Channel>(state_); }

private:
    std::shared_ptr<Network::State> state_;
};

} // namespace

Network::Network()
    : state_(std::make_shared<State>()) {}

void Network::attach(Endpoint const& endpoint, std::shared_ptr<Host> host) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto& slot = state_->slots[endpoint.key()];
    slot.host  = std::move(host);
    cl_log("Attached loopback host " + endpoint.key(), "Loopback");
}

void Network::detach(Endpoint const& endpoint) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->slots.erase(endpoint.key());
}

void Network::setOnline(Endpoint const& endpoint, bool online) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (auto it = state_->slots.find(endpoint.key()); it != state_->slots.end()) {
        it->second.online = online;
    }
}

void Network::setLatency(Endpoint const& endpoint, std::chrono::milliseconds latency) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (auto it = state_->slots.find(endpoint.key()); it != state_->slots.end()) {
        it->second.latency = latency;
    }
}

auto Network::requestCount(Endpoint const& endpoint) const -> std::size_t {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto key = endpoint.key();
    if (auto it = state_->slots.find(key); it != state_->slots.end()) {
        return it->second.requests;
    }
    if (auto it = state_->unknownRequests.find(key); it != state_->unknownRequests.end()) {
        return it->second;
    }
    return 0;
}

auto Network::totalRequests() const -> std::size_t {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->total;
}

auto Network::cancelledRequests() const -> std::size_t {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

auto Network::streamConnects(Endpoint const& endpoint) const -> std::size_t {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (auto it = state_->slots.find(endpoint.key()); it != state_->slots.end()) {
        return it->second.streams;
    }
    return 0;
}

void Network::resetCounters() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    for (auto& [key, slot] : state_->slots) {
        slot.requests = 0;
        slot.streams  = 0;
    }
    state_->unknownRequests.clear();
    state_->total     = 0;
    state_->cancelled = 0;
}

auto Network::httpFactory() const -> std::shared_ptr<HttpClientFactory> {
    return std::make_shared<ClientFactory>(state_);
}

auto Network::streamFactory() const -> std::shared_ptr<StreamChannelFactory> {
    return std::make_shared<ChannelFactory>(state_);
}

} // namespace CL::Loopback
