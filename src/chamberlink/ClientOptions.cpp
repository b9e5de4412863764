#include <chamberlink/ClientOptions.hpp>

#include "core/Types.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <limits>
#include <regex>

namespace CL {

namespace {

template <typename T>
bool parse_integer(std::string_view text, T& out) {
    T    value{};
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return false;
    }
    out = value;
    return true;
}

template <typename T>
bool parse_integer_in_range(std::string_view text, T min, T max, T& out) {
    T value{};
    if (!parse_integer(text, value)) {
        return false;
    }
    if (value < min || value > max) {
        return false;
    }
    out = value;
    return true;
}

std::optional<bool> parse_bool(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::string normalized;
    normalized.reserve(text.size());
    std::transform(text.begin(), text.end(), std::back_inserter(normalized), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off") {
        return false;
    }
    return std::nullopt;
}

auto split_list(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> items;
    while (!text.empty()) {
        auto comma = text.find(',');
        auto token = text.substr(0, comma);
        while (!token.empty() && std::isspace(static_cast<unsigned char>(token.front()))) {
            token.remove_prefix(1);
        }
        while (!token.empty() && std::isspace(static_cast<unsigned char>(token.back()))) {
            token.remove_suffix(1);
        }
        if (!token.empty()) {
            items.emplace_back(token);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        text.remove_prefix(comma + 1);
    }
    return items;
}

bool parse_range(std::string_view text, int& start, int& end) {
    auto dash = text.find('-');
    if (dash == std::string_view::npos) {
        return false;
    }
    int first  = 0;
    int second = 0;
    if (!parse_integer_in_range<int>(text.substr(0, dash), 1, 254, first)
        || !parse_integer_in_range<int>(text.substr(dash + 1), 1, 254, second) || first > second) {
        return false;
    }
    start = first;
    end   = second;
    return true;
}

bool parse_duration_ms(std::string_view text, std::chrono::milliseconds& out) {
    std::int64_t parsed = 0;
    if (!parse_integer_in_range<std::int64_t>(text, 1, std::numeric_limits<int>::max(), parsed)) {
        return false;
    }
    out = std::chrono::milliseconds{parsed};
    return true;
}

bool is_valid_regex(std::string const& pattern) {
    try {
        std::regex compiled{pattern};
        (void)compiled;
        return true;
    } catch (std::regex_error const&) {
        return false;
    }
}

template <typename Setter>
bool apply_env(char const* key, Setter&& setter) {
    if (const char* raw = std::getenv(key)) {
        return setter(std::string_view{raw});
    }
    return true;
}

} // namespace

bool IsValidSubnetPrefix(std::string_view prefix) {
    int octets = 0;
    while (true) {
        auto dot   = prefix.find('.');
        auto token = prefix.substr(0, dot);
        int  value = 0;
        if (token.empty() || !parse_integer_in_range<int>(token, 0, 255, value)) {
            return false;
        }
        ++octets;
        if (dot == std::string_view::npos) {
            break;
        }
        prefix.remove_prefix(dot + 1);
    }
    return octets == 3;
}

auto ValidateClientOptions(ClientOptions const& options) -> std::optional<std::string> {
    auto const& discovery = options.discovery;
    if (!discovery.override_url.empty()) {
        if (auto parsed = parseEndpointUrl(discovery.override_url); !parsed) {
            return "--backend-url is invalid: " + describeError(parsed.error());
        }
    }
    if (discovery.override_url.empty() && discovery.subnets.empty() && !options.offline) {
        return std::string{"--subnets must name at least one subnet when no --backend-url is set"};
    }
    for (auto const& subnet : discovery.subnets) {
        if (!IsValidSubnetPrefix(subnet)) {
            return "Invalid subnet prefix '" + subnet + "' (expected three octets, e.g. 192.168.1)";
        }
    }
    if (discovery.backend_port <= 0 || discovery.backend_port > 65535) {
        return std::string{"--port must be within 1-65535"};
    }
    if (discovery.quick_scan_host < 1 || discovery.quick_scan_host > 254) {
        return std::string{"--quick-host must be within 1-254"};
    }
    if (discovery.scan_range_start < 1 || discovery.scan_range_end > 254
        || discovery.scan_range_start > discovery.scan_range_end) {
        return std::string{"--scan-range must be start-end within 1-254"};
    }
    if (discovery.max_concurrency < 1) {
        return std::string{"--max-concurrency must be >= 1"};
    }
    if (discovery.probe_timeout.count() <= 0) {
        return std::string{"--probe-timeout-ms must be > 0"};
    }
    if (discovery.scheme != "http" && discovery.scheme != "https") {
        return std::string{"scheme must be http or https"};
    }
    if (discovery.health_path.empty() || discovery.health_path.front() != '/') {
        return std::string{"health path must start with '/'"};
    }
    if (discovery.expected_service.empty()) {
        return std::string{"--expected-service must not be empty"};
    }
    if (!is_valid_regex(discovery.version_pattern)) {
        return std::string{"--version-pattern is not a valid regular expression"};
    }
    if (options.session.stream_path.empty() || options.session.stream_path.front() != '/') {
        return std::string{"stream path must start with '/'"};
    }
    if (options.session.connect_timeout.count() <= 0 || options.session.idle_timeout.count() <= 0) {
        return std::string{"stream timeouts must be > 0"};
    }
    if (options.session.max_reconnect_attempts < 0) {
        return std::string{"--max-reconnect-attempts must be >= 0"};
    }
    if (options.session.reconnect_interval.count() < 0) {
        return std::string{"--reconnect-interval-ms must be >= 0"};
    }
    if (options.session.discovery_reset_every < 1) {
        return std::string{"--discovery-reset-every must be >= 1"};
    }
    if (options.commands.request_timeout.count() <= 0 || options.commands.confirmation_timeout.count() <= 0
        || options.commands.poll_interval.count() <= 0) {
        return std::string{"command timeouts must be > 0"};
    }
    if (options.commands.rate_limit_max_commands < 1 || options.commands.rate_limit_window.count() <= 0) {
        return std::string{"rate limit must allow at least one command per positive window"};
    }
    if (options.pressure_step && *options.pressure_step != "up" && *options.pressure_step != "down") {
        return std::string{"--pressure must be 'up' or 'down'"};
    }
    return std::nullopt;
}

bool ApplyClientEnvOverrides(ClientOptions& options) {
    auto apply_int_env = [&](char const* key, int& target, int min, int max) {
        return apply_env(key, [&](std::string_view value) {
            int parsed = target;
            if (!parse_integer_in_range<int>(value, min, max, parsed)) {
                std::cerr << key << " must be within " << min << "-" << max << "\n";
                return false;
            }
            target = parsed;
            return true;
        });
    };
    auto apply_ms_env = [&](char const* key, std::chrono::milliseconds& target) {
        return apply_env(key, [&](std::string_view value) {
            if (!parse_duration_ms(value, target)) {
                std::cerr << key << " must be a positive number of milliseconds\n";
                return false;
            }
            return true;
        });
    };
    auto apply_bool_env = [&](char const* key, bool& target) {
        return apply_env(key, [&](std::string_view value) {
            auto parsed = parse_bool(value);
            if (!parsed.has_value()) {
                std::cerr << key << " must be a boolean (true/false, 1/0, yes/no)\n";
                return false;
            }
            target = *parsed;
            return true;
        });
    };
    auto apply_string_env = [&](char const* key, std::string& target) {
        return apply_env(key, [&](std::string_view value) {
            if (value.empty()) {
                std::cerr << key << " must not be empty\n";
                return false;
            }
            target = std::string{value};
            return true;
        });
    };

    auto& discovery = options.discovery;
    if (!apply_string_env("CHAMBERLINK_BACKEND_URL", discovery.override_url)) {
        return false;
    }
    if (!apply_env("CHAMBERLINK_SUBNETS", [&](std::string_view value) {
            auto subnets = split_list(value);
            for (auto const& subnet : subnets) {
                if (!IsValidSubnetPrefix(subnet)) {
                    std::cerr << "CHAMBERLINK_SUBNETS contains invalid prefix '" << subnet << "'\n";
                    return false;
                }
            }
            discovery.subnets = std::move(subnets);
            return true;
        })) {
        return false;
    }
    if (!apply_int_env("CHAMBERLINK_BACKEND_PORT", discovery.backend_port, 1, 65535)) {
        return false;
    }
    if (!apply_int_env("CHAMBERLINK_QUICK_SCAN_HOST", discovery.quick_scan_host, 1, 254)) {
        return false;
    }
    if (!apply_bool_env("CHAMBERLINK_FULL_SCAN", discovery.full_scan)) {
        return false;
    }
    if (!apply_env("CHAMBERLINK_SCAN_RANGE", [&](std::string_view value) {
            if (!parse_range(value, discovery.scan_range_start, discovery.scan_range_end)) {
                std::cerr << "CHAMBERLINK_SCAN_RANGE must be start-end within 1-254\n";
                return false;
            }
            return true;
        })) {
        return false;
    }
    if (!apply_int_env("CHAMBERLINK_MAX_CONCURRENCY", discovery.max_concurrency, 1, 1024)) {
        return false;
    }
    if (!apply_ms_env("CHAMBERLINK_PROBE_TIMEOUT_MS", discovery.probe_timeout)) {
        return false;
    }
    if (!apply_string_env("CHAMBERLINK_EXPECTED_SERVICE", discovery.expected_service)) {
        return false;
    }
    if (!apply_string_env("CHAMBERLINK_VERSION_PATTERN", discovery.version_pattern)) {
        return false;
    }
    if (!apply_string_env("CHAMBERLINK_CACHE_FILE", discovery.cache_file)) {
        return false;
    }

    auto& session = options.session;
    if (!apply_ms_env("CHAMBERLINK_STREAM_CONNECT_TIMEOUT_MS", session.connect_timeout)) {
        return false;
    }
    if (!apply_ms_env("CHAMBERLINK_STREAM_IDLE_TIMEOUT_MS", session.idle_timeout)) {
        return false;
    }
    if (!apply_int_env("CHAMBERLINK_MAX_RECONNECT_ATTEMPTS", session.max_reconnect_attempts, 0, 1000)) {
        return false;
    }
    if (!apply_ms_env("CHAMBERLINK_RECONNECT_INTERVAL_MS", session.reconnect_interval)) {
        return false;
    }
    if (!apply_int_env("CHAMBERLINK_DISCOVERY_RESET_EVERY", session.discovery_reset_every, 1, 1000)) {
        return false;
    }

    auto& commands = options.commands;
    if (!apply_ms_env("CHAMBERLINK_COMMAND_TIMEOUT_MS", commands.request_timeout)) {
        return false;
    }
    if (!apply_ms_env("CHAMBERLINK_CONFIRMATION_TIMEOUT_MS", commands.confirmation_timeout)) {
        return false;
    }
    if (!apply_int_env("CHAMBERLINK_RATE_LIMIT_MAX_COMMANDS", commands.rate_limit_max_commands, 1, 10000)) {
        return false;
    }
    if (!apply_ms_env("CHAMBERLINK_RATE_LIMIT_WINDOW_MS", commands.rate_limit_window)) {
        return false;
    }

    if (!apply_bool_env("CHAMBERLINK_OFFLINE", options.offline)) {
        return false;
    }
    return true;
}

void PrintClientUsage() {
    std::cout << "Usage: chamberlink_monitor [options]\n"
              << "  --backend-url <url>        Use this backend only, skipping the network scan\n"
              << "  --subnets <a.b.c,...>      Subnet prefixes to scan (default 192.168.1,192.168.0,10.0.0,172.16.0)\n"
              << "  --port <port>              Backend port (default 8000)\n"
              << "  --quick-host <n>           Host probed per subnet in the quick scan (default 100)\n"
              << "  --full-scan                Scan every host in --scan-range when the quick scan fails\n"
              << "  --scan-range <start-end>   Host range for the full scan (default 1-254)\n"
              << "  --max-concurrency <n>      Parallel probes per batch (default 16)\n"
              << "  --probe-timeout-ms <ms>    Health probe timeout (default 2000)\n"
              << "  --expected-service <name>  Service name reported by /health (default elixir-backend)\n"
              << "  --version-pattern <regex>  Accepted backend versions (default ^1\\.\\d+(\\.\\d+)?)\n"
              << "  --cache-file <path>        Persist the last discovered backend to this JSON file\n"
              << "  --stream-connect-timeout-ms <ms> Stream handshake timeout (default 10000)\n"
              << "  --stream-idle-timeout-ms <ms>    Close the stream after this long without frames (default 30000)\n"
              << "  --max-reconnect-attempts <n>     Automatic reconnect attempts (default 5)\n"
              << "  --reconnect-interval-ms <ms>     Delay between reconnect attempts (default 1000)\n"
              << "  --discovery-reset-every <n>      Rediscover on every nth reconnect attempt (default 3)\n"
              << "  --command-timeout-ms <ms>        Command request timeout (default 5000)\n"
              << "  --confirmation-timeout-ms <ms>   Wait this long for a confirming snapshot (default 3000)\n"
              << "  --rate-limit-max-commands <n>    Commands allowed per rate window (default 5)\n"
              << "  --rate-limit-window-ms <ms>      Rate window length (default 1000)\n"
              << "  --offline                  Run against the built-in synthetic backend\n"
              << "  --duration-ms <ms>         Exit after this long (default: run until interrupted)\n"
              << "  --toggle <control>         Toggle a control once connected (repeatable)\n"
              << "  --pressure <up|down>       Step the pressure setpoint once connected\n"
              << "  --help                     Show this help\n";
}

std::optional<ClientOptions> ParseClientArguments(int argc, char** argv) {
    ClientOptions options{};
    if (!ApplyClientEnvOverrides(options)) {
        return std::nullopt;
    }

    auto require_value = [&](int& index, std::string_view flag) -> std::optional<std::string_view> {
        if (index + 1 >= argc) {
            std::cerr << flag << " requires a value\n";
            return std::nullopt;
        }
        return std::string_view{argv[++index]};
    };
    auto int_flag = [&](int& index, std::string_view flag, int min, int max, int& target) {
        auto value = require_value(index, flag);
        if (!value) {
            return false;
        }
        if (!parse_integer_in_range<int>(*value, min, max, target)) {
            std::cerr << flag << " must be within " << min << "-" << max << "\n";
            return false;
        }
        return true;
    };
    auto ms_flag = [&](int& index, std::string_view flag, std::chrono::milliseconds& target) {
        auto value = require_value(index, flag);
        if (!value) {
            return false;
        }
        if (!parse_duration_ms(*value, target)) {
            std::cerr << flag << " must be a positive number of milliseconds\n";
            return false;
        }
        return true;
    };
    auto string_flag = [&](int& index, std::string_view flag, std::string& target) {
        auto value = require_value(index, flag);
        if (!value) {
            return false;
        }
        if (value->empty()) {
            std::cerr << flag << " must not be empty\n";
            return false;
        }
        target = std::string{*value};
        return true;
    };

    auto& discovery = options.discovery;
    auto& session   = options.session;
    auto& commands  = options.commands;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        bool             ok = true;
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
        } else if (arg == "--backend-url") {
            ok = string_flag(i, arg, discovery.override_url);
        } else if (arg == "--subnets") {
            auto value = require_value(i, arg);
            ok         = value.has_value();
            if (ok) {
                discovery.subnets = split_list(*value);
            }
        } else if (arg == "--port") {
            ok = int_flag(i, arg, 1, 65535, discovery.backend_port);
        } else if (arg == "--quick-host") {
            ok = int_flag(i, arg, 1, 254, discovery.quick_scan_host);
        } else if (arg == "--full-scan") {
            discovery.full_scan = true;
        } else if (arg == "--scan-range") {
            auto value = require_value(i, arg);
            ok         = value && parse_range(*value, discovery.scan_range_start, discovery.scan_range_end);
            if (!ok && value) {
                std::cerr << "--scan-range must be start-end within 1-254\n";
            }
        } else if (arg == "--max-concurrency") {
            ok = int_flag(i, arg, 1, 1024, discovery.max_concurrency);
        } else if (arg == "--probe-timeout-ms") {
            ok = ms_flag(i, arg, discovery.probe_timeout);
        } else if (arg == "--expected-service") {
            ok = string_flag(i, arg, discovery.expected_service);
        } else if (arg == "--version-pattern") {
            ok = string_flag(i, arg, discovery.version_pattern);
        } else if (arg == "--cache-file") {
            ok = string_flag(i, arg, discovery.cache_file);
        } else if (arg == "--stream-connect-timeout-ms") {
            ok = ms_flag(i, arg, session.connect_timeout);
        } else if (arg == "--stream-idle-timeout-ms") {
            ok = ms_flag(i, arg, session.idle_timeout);
        } else if (arg == "--max-reconnect-attempts") {
            ok = int_flag(i, arg, 0, 1000, session.max_reconnect_attempts);
        } else if (arg == "--reconnect-interval-ms") {
            ok = ms_flag(i, arg, session.reconnect_interval);
        } else if (arg == "--discovery-reset-every") {
            ok = int_flag(i, arg, 1, 1000, session.discovery_reset_every);
        } else if (arg == "--command-timeout-ms") {
            ok = ms_flag(i, arg, commands.request_timeout);
        } else if (arg == "--confirmation-timeout-ms") {
            ok = ms_flag(i, arg, commands.confirmation_timeout);
        } else if (arg == "--rate-limit-max-commands") {
            ok = int_flag(i, arg, 1, 10000, commands.rate_limit_max_commands);
        } else if (arg == "--rate-limit-window-ms") {
            ok = ms_flag(i, arg, commands.rate_limit_window);
        } else if (arg == "--offline") {
            options.offline = true;
        } else if (arg == "--duration-ms") {
            ok = ms_flag(i, arg, options.duration);
        } else if (arg == "--toggle") {
            std::string control;
            ok = string_flag(i, arg, control);
            if (ok) {
                options.toggles.push_back(std::move(control));
            }
        } else if (arg == "--pressure") {
            std::string direction;
            ok = string_flag(i, arg, direction);
            if (ok) {
                options.pressure_step = std::move(direction);
            }
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            ok = false;
        }
        if (!ok) {
            return std::nullopt;
        }
    }

    if (options.show_help) {
        return options;
    }
    if (auto error = ValidateClientOptions(options)) {
        std::cerr << *error << "\n";
        return std::nullopt;
    }
    return options;
}

} // namespace CL
