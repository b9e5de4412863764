#ifndef CPPHTTPLIB_NO_EXCEPTIONS
#define CPPHTTPLIB_NO_EXCEPTIONS
#endif
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
#define CPPHTTPLIB_OPENSSL_SUPPORT
#endif

#include <httplib.h>

#include "transport/HttplibTransport.hpp"

#include "log/TaggedLogger.hpp"

#include <atomic>

namespace CL {

namespace {

auto make_client(Endpoint const& endpoint, std::chrono::milliseconds timeout) -> std::unique_ptr<httplib::ClientImpl> {
    std::unique_ptr<httplib::ClientImpl> client;
    if (endpoint.secure()) {
        auto ssl_client = std::make_unique<httplib::SSLClient>(endpoint.host, endpoint.port);
        // Controllers on a local network present self-signed certificates.
        ssl_client->enable_server_certificate_verification(false);
        client = std::unique_ptr<httplib::ClientImpl>(std::move(ssl_client));
    } else {
        client = std::make_unique<httplib::ClientImpl>(endpoint.host, endpoint.port);
    }
    client->set_connection_timeout(timeout);
    client->set_read_timeout(timeout);
    client->set_write_timeout(timeout);
    client->set_follow_location(false);
    client->set_keep_alive(false);
    return client;
}

class HttplibClient final : public HttpClient {
public:
    HttplibClient(Endpoint endpoint, std::chrono::milliseconds timeout)
        : endpoint_(std::move(endpoint))
        , client_(make_client(endpoint_, timeout)) {}

    auto get(std::string const& path) -> Expected<HttpReply> override {
        if (cancelled_) {
            return std::unexpected(Error{Error::Code::Cancelled, "request cancelled"});
        }
        auto result = client_->Get(path);
        return translate(result, "GET", path);
    }

    auto post(std::string const& path, std::string const& body) -> Expected<HttpReply> override {
        if (cancelled_) {
            return std::unexpected(Error{Error::Code::Cancelled, "request cancelled"});
        }
        httplib::Headers headers{{"Accept", "application/json"}};
        auto result = client_->Post(path, headers, body.empty() ? std::string{"{}"} : body, "application/json");
        return translate(result, "POST", path);
    }

    void cancel() override {
        cancelled_ = true;
        client_->stop();
    }

private:
    auto translate(httplib::Result const& result, char const* method, std::string const& path) -> Expected<HttpReply> {
        if (result) {
            return HttpReply{result->status, result->body};
        }
        if (cancelled_) {
            return std::unexpected(Error{Error::Code::Cancelled, "request cancelled"});
        }
        auto const error = result.error();
        auto message = std::string{method} + " " + endpoint_.toUrl() + path + " failed: " + httplib::to_string(error);
        cl_log(message, "Transport", "INFO");
        if (error == httplib::Error::ConnectionTimeout || error == httplib::Error::Read
            || error == httplib::Error::Write) {
            return std::unexpected(Error{Error::Code::Timeout, std::move(message)});
        }
        return std::unexpected(Error{Error::Code::TransportFailure, std::move(message)});
    }

    Endpoint                             endpoint_;
    std::unique_ptr<httplib::ClientImpl> client_;
    std::atomic<bool>                    cancelled_{false};
};

} // namespace

auto HttplibClientFactory::create(Endpoint const& endpoint, std::chrono::milliseconds timeout)
    -> std::unique_ptr<HttpClient> {
    return std::make_unique<HttplibClient>(endpoint, timeout);
}

} // namespace CL
