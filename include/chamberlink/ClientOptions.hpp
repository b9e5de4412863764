#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace CL {

struct DiscoveryOptions {
    std::string                override_url;
    std::vector<std::string>   subnets{"192.168.1", "192.168.0", "10.0.0", "172.16.0"};
    int                        backend_port{8000};
    int                        quick_scan_host{100};
    bool                       full_scan{false};
    int                        scan_range_start{1};
    int                        scan_range_end{254};
    int                        max_concurrency{16};
    std::chrono::milliseconds  probe_timeout{2000};
    std::string                scheme{"http"};
    std::string                health_path{"/health"};
    std::string                expected_service{"elixir-backend"};
    std::string                version_pattern{R"(^1\.\d+(\.\d+)?)"};
    std::vector<std::string>   verify_endpoints{"/api/status/system"};
    std::string                cache_file;
};

struct SessionOptions {
    std::string               stream_path{"/ws/system-status"};
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds idle_timeout{30000};
    int                       max_reconnect_attempts{5};
    std::chrono::milliseconds reconnect_interval{1000};
    int                       discovery_reset_every{3};
};

struct CommandOptions {
    std::chrono::milliseconds request_timeout{5000};
    std::chrono::milliseconds confirmation_timeout{3000};
    std::chrono::milliseconds poll_interval{100};
    int                       rate_limit_max_commands{5};
    std::chrono::milliseconds rate_limit_window{1000};
};

struct ClientOptions {
    DiscoveryOptions          discovery;
    SessionOptions            session;
    CommandOptions            commands;
    bool                      offline{false};
    bool                      show_help{false};
    std::chrono::milliseconds duration{0};
    std::vector<std::string>  toggles;
    std::optional<std::string> pressure_step;
};

auto ParseClientArguments(int argc, char** argv) -> std::optional<ClientOptions>;

void PrintClientUsage();

bool ApplyClientEnvOverrides(ClientOptions& options);

auto ValidateClientOptions(ClientOptions const& options) -> std::optional<std::string>;

bool IsValidSubnetPrefix(std::string_view prefix);

} // namespace CL
