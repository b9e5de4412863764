#include "transport/WebSocketChannel.hpp"

#include "log/TaggedLogger.hpp"

#include <libwebsockets.h>

#include <condition_variable>
#include <deque>
#include <mutex>
#include <string_view>
#include <thread>
#include <utility>

namespace CL {

namespace {

constexpr std::size_t kMaxMessageBytes{4 * 1024 * 1024};

void forward_lws_log(int level, char const* line) {
    std::string_view text{line != nullptr ? line : ""};
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.remove_suffix(1);
    }
    cl_log(std::string{text}, "lws", (level & LLL_ERR) != 0 ? "ERROR" : "WARNING");
}

void route_lws_logging() {
    static std::once_flag once;
    std::call_once(once, [] { lws_set_log_level(LLL_ERR | LLL_WARN, forward_lws_log); });
}

/*
 * One status stream. libwebsockets callbacks run on the service thread and
 * hand completed messages to receive() through a queue. Fragmented messages
 * are reassembled before they are queued; pings and the close handshake are
 * answered by the library.
 *
 * close() may be called from any thread. It marks the channel closing and
 * wakes both the service loop (lws_cancel_service) and any blocked caller.
 */
class WebSocketChannel final : public StreamChannel {
public:
    WebSocketChannel() = default;
    WebSocketChannel(WebSocketChannel const&)            = delete;
    WebSocketChannel& operator=(WebSocketChannel const&) = delete;

    ~WebSocketChannel() override {
        close();
        if (service_.joinable()) {
            service_.join();
        }
        if (context_ != nullptr) {
            lws_context_destroy(context_);
        }
    }

    auto connect(Endpoint const& endpoint, std::string const& path, std::chrono::milliseconds timeout)
        -> Expected<void> override {
        route_lws_logging();
        host_ = endpoint.host;
        path_ = path.empty() ? std::string{"/"} : path;

        lws_context_creation_info info{};
        info.port      = CONTEXT_PORT_NO_LISTEN;
        info.protocols = kProtocols;
        info.gid       = -1;
        info.uid       = -1;
        info.user      = this;
        info.options   = LWS_SERVER_OPTION_DO_SSL_GLOBAL_INIT;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closing_) {
                return std::unexpected(Error{Error::Code::StreamClosed, "stream closed"});
            }
            context_ = lws_create_context(&info);
        }
        if (context_ == nullptr) {
            return std::unexpected(Error{Error::Code::TransportFailure, "lws context creation failed"});
        }

        lws_client_connect_info request{};
        request.context             = context_;
        request.address             = host_.c_str();
        request.port                = endpoint.port;
        request.path                = path_.c_str();
        request.host                = host_.c_str();
        request.origin              = host_.c_str();
        request.local_protocol_name = kProtocols[0].name;
        if (endpoint.secure()) {
            request.ssl_connection =
                LCCSCF_USE_SSL | LCCSCF_ALLOW_SELFSIGNED | LCCSCF_SKIP_SERVER_CERT_HOSTNAME_CHECK | LCCSCF_ALLOW_INSECURE;
        }
        if (lws_client_connect_via_info(&request) == nullptr) {
            return std::unexpected(Error{Error::Code::TransportFailure, "connect to " + endpoint.toUrl() + " failed"});
        }
        service_ = std::thread([this] { serviceLoop(); });

        std::unique_lock<std::mutex> lock(mutex_);
        bool const settled = signal_.wait_for(lock, timeout, [this] { return phase_ != Phase::Connecting || closing_; });
        if (closing_) {
            return std::unexpected(Error{Error::Code::StreamClosed, "stream closed"});
        }
        if (!settled) {
            return std::unexpected(Error{Error::Code::Timeout, "stream connect timed out"});
        }
        if (phase_ != Phase::Open) {
            return std::unexpected(failure_.value_or(Error{Error::Code::TransportFailure, "stream handshake failed"}));
        }
        cl_log("Stream open to " + endpoint.toUrl() + path_, "WebSocket");
        return {};
    }

    auto receive(std::chrono::milliseconds timeout) -> Expected<std::optional<std::string>> override {
        std::unique_lock<std::mutex> lock(mutex_);
        signal_.wait_for(lock, timeout, [this] { return !inbox_.empty() || phase_ != Phase::Open || closing_; });
        if (closing_) {
            return std::unexpected(Error{Error::Code::StreamClosed, "stream closed"});
        }
        if (!inbox_.empty()) {
            auto message = std::move(inbox_.front());
            inbox_.pop_front();
            return std::optional<std::string>{std::move(message)};
        }
        switch (phase_) {
        case Phase::Open:
            return std::optional<std::string>{};
        case Phase::Failed:
            return std::unexpected(failure_.value_or(Error{Error::Code::TransportFailure, "stream failed"}));
        default:
            return std::unexpected(Error{Error::Code::StreamClosed, "server closed the stream"});
        }
    }

    void close() override {
        lws_context* context = nullptr;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closing_ = true;
            context  = context_;
        }
        signal_.notify_all();
        if (context != nullptr) {
            lws_cancel_service(context);
        }
    }

private:
    enum class Phase {
        Connecting,
        Open,
        Failed,
        Closed
    };

    static int onEvent(lws* wsi, lws_callback_reasons reason, void* user, void* in, size_t len) {
        auto* self = static_cast<WebSocketChannel*>(lws_context_user(lws_get_context(wsi)));
        if (self == nullptr) {
            return lws_callback_http_dummy(wsi, reason, user, in, len);
        }
        switch (reason) {
        case LWS_CALLBACK_CLIENT_ESTABLISHED:
            self->settle(Phase::Open, std::nullopt);
            return 0;
        case LWS_CALLBACK_CLIENT_CONNECTION_ERROR:
            self->settle(Phase::Failed,
                         Error{Error::Code::TransportFailure,
                               in != nullptr ? std::string{static_cast<char const*>(in)} : "connection failed"});
            return 0;
        case LWS_CALLBACK_CLIENT_RECEIVE:
            return self->collect(wsi, static_cast<char const*>(in), len);
        case LWS_CALLBACK_CLIENT_CLOSED:
            self->settle(Phase::Closed, std::nullopt);
            return 0;
        default:
            return lws_callback_http_dummy(wsi, reason, user, in, len);
        }
    }

    void serviceLoop() {
        set_thread_name("WebSocket " + host_);
        while (true) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (closing_ || phase_ == Phase::Failed || phase_ == Phase::Closed) {
                    return;
                }
            }
            if (lws_service(context_, 0) < 0) {
                settle(Phase::Failed, Error{Error::Code::TransportFailure, "lws service failed"});
                return;
            }
        }
    }

    void settle(Phase phase, std::optional<Error> failure) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (phase_ == Phase::Failed || phase_ == Phase::Closed) {
                return;
            }
            phase_   = phase;
            failure_ = std::move(failure);
        }
        signal_.notify_all();
    }

    // Returns non-zero to make libwebsockets drop the connection.
    int collect(lws* wsi, char const* data, std::size_t len) {
        fragments_.append(data, len);
        if (fragments_.size() > kMaxMessageBytes) {
            settle(Phase::Failed, Error{Error::Code::MalformedInput, "stream message too large"});
            return -1;
        }
        if (!lws_is_final_fragment(wsi) || lws_remaining_packet_payload(wsi) != 0) {
            return 0;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            inbox_.push_back(std::exchange(fragments_, std::string{}));
        }
        signal_.notify_all();
        return 0;
    }

    static constexpr lws_protocols kProtocols[] = {
        {"chamberlink-status", &WebSocketChannel::onEvent, 0, 0},
        LWS_PROTOCOL_LIST_TERM,
    };

    lws_context*            context_{nullptr};
    std::thread             service_;
    std::string             host_;
    std::string             path_;
    std::mutex              mutex_;
    std::condition_variable signal_;
    Phase                   phase_{Phase::Connecting};
    std::optional<Error>    failure_;
    std::deque<std::string> inbox_;
    std::string             fragments_;
    bool                    closing_{false};
};

} // namespace

auto WebSocketChannelFactory::create() -> std::unique_ptr<StreamChannel> {
    return std::make_unique<WebSocketChannel>();
}

} // namespace CL
