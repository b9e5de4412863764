#pragma once

#include "core/Error.hpp"
#include "core/Types.hpp"
#include "transport/HttpTransport.hpp"
#include "transport/StreamChannel.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace CL::Loopback {

struct Request {
    std::string method;
    std::string path;
    std::string body;
};

// One in-process stream. The host pushes frames, the client receives them;
// either side may close it.
class Stream {
public:
    void push(std::string frame);
    void close();
    [[nodiscard]] bool closed() const;
    [[nodiscard]] auto receive(std::chrono::milliseconds timeout) -> Expected<std::optional<std::string>>;

private:
    mutable std::mutex      mutex_;
    std::condition_variable cv_;
    std::deque<std::string> frames_;
    bool                    closed_{false};
};

class Host {
public:
    virtual ~Host() = default;

    virtual auto handle(Request const& request) -> HttpReply = 0;
    virtual auto openStream(std::string const& path) -> Expected<std::shared_ptr<Stream>> {
        return std::unexpected(Error{Error::Code::TransportFailure, "no stream at " + path});
    }
};

class LambdaHost final : public Host {
public:
    using Handler = std::function<HttpReply(Request const&)>;

    explicit LambdaHost(Handler handler)
        : handler_(std::move(handler)) {}

    auto handle(Request const& request) -> HttpReply override { return handler_(request); }

private:
    Handler handler_;
};

/*
 * Endpoint table standing in for the local network. Requests to unknown or
 * offline endpoints fail like a refused connection; per-endpoint latency is
 * interruptible by HttpClient::cancel().
 */
class Network {
public:
    Network();

    void attach(Endpoint const& endpoint, std::shared_ptr<Host> host);
    void detach(Endpoint const& endpoint);
    void setOnline(Endpoint const& endpoint, bool online);
    void setLatency(Endpoint const& endpoint, std::chrono::milliseconds latency);

    [[nodiscard]] auto requestCount(Endpoint const& endpoint) const -> std::size_t;
    [[nodiscard]] auto totalRequests() const -> std::size_t;
    [[nodiscard]] auto cancelledRequests() const -> std::size_t;
    [[nodiscard]] auto streamConnects(Endpoint const& endpoint) const -> std::size_t;
    void resetCounters();

    [[nodiscard]] auto httpFactory() const -> std::shared_ptr<HttpClientFactory>;
    [[nodiscard]] auto streamFactory() const -> std::shared_ptr<StreamChannelFactory>;

    struct State;

private:
    std::shared_ptr<State> state_;
};

} // namespace CL::Loopback
