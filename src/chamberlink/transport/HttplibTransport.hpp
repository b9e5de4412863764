#pragma once

#include "transport/HttpTransport.hpp"

namespace CL {

class HttplibClientFactory final : public HttpClientFactory {
public:
    auto create(Endpoint const& endpoint, std::chrono::milliseconds timeout) -> std::unique_ptr<HttpClient> override;
};

} // namespace CL
