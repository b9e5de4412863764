#pragma once

#include "core/Error.hpp"
#include "core/Types.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace CL {

struct HttpReply {
    int         status{0};
    std::string body;

    [[nodiscard]] bool ok() const { return status >= 200 && status < 300; }
};

// A client bound to one endpoint. cancel() may be called from any thread and
// aborts the request currently in flight with Error::Code::Cancelled.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual auto get(std::string const& path) -> Expected<HttpReply>                                = 0;
    virtual auto post(std::string const& path, std::string const& body) -> Expected<HttpReply>      = 0;
    virtual void cancel()                                                                          = 0;
};

class HttpClientFactory {
public:
    virtual ~HttpClientFactory() = default;
    virtual auto create(Endpoint const& endpoint, std::chrono::milliseconds timeout)
        -> std::unique_ptr<HttpClient> = 0;
};

} // namespace CL
