#include <chamberlink/ChamberClient.hpp>

#include "log/TaggedLogger.hpp"
#include "loopback/LoopbackNetwork.hpp"
#include "loopback/SyntheticBackend.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <type_traits>
#include <variant>

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void handle_signal(int) {
    g_stop_requested = 1;
}

constexpr char const* kOfflineBackendUrl = "http://synthetic.local:8000";

void print_event(CL::Event const& event) {
    auto const name = CL::eventName(CL::eventKind(event));
    std::cout << '[' << name << "] ";
    std::visit(
        [](auto const& payload) {
            using T = std::decay_t<decltype(payload)>;
            if constexpr (std::is_same_v<T, CL::ConnectionStateChanged>) {
                std::cout << CL::toString(payload.previous) << " -> " << CL::toString(payload.current);
            } else if constexpr (std::is_same_v<T, CL::DiscoveryComplete>) {
                std::cout << payload.result.endpoint.toUrl() << " (" << payload.result.service_name << ' '
                          << payload.result.service_version << ')';
            } else if constexpr (std::is_same_v<T, CL::DiscoveryFailed>) {
                std::cout << payload.candidates_tried << " candidate(s) tried";
            } else if constexpr (std::is_same_v<T, CL::SnapshotReceived>) {
                std::cout << "#" << payload.snapshot->sequence << ' ' << payload.snapshot->state.dump();
            } else if constexpr (std::is_same_v<T, CL::StreamError>) {
                std::cout << CL::describeError(payload.error);
            } else if constexpr (std::is_same_v<T, CL::ReconnectScheduled>) {
                std::cout << "attempt " << payload.attempt << '/' << payload.max_attempts
                          << (payload.reset_discovery ? " (rediscovering)" : "");
            } else if constexpr (std::is_same_v<T, CL::MaxReconnectsReached>) {
                std::cout << CL::describeError(payload.error);
            } else if constexpr (std::is_same_v<T, CL::OptimisticUpdate>) {
                std::cout << payload.control_key << " = " << payload.value.dump() << " (" << payload.command_id << ')';
            } else if constexpr (std::is_same_v<T, CL::ControlsUpdated>) {
                std::cout << payload.control_key << " = " << payload.value.dump();
            } else if constexpr (std::is_same_v<T, CL::CommandSucceeded>) {
                std::cout << payload.command_id << " confirmed " << payload.value.dump();
            } else if constexpr (std::is_same_v<T, CL::CommandFailed>) {
                std::cout << payload.command_id << ' ' << CL::describeError(payload.error);
            }
        },
        event);
    std::cout << std::endl;
}

void report(std::string const& label, CL::Expected<CL::CommandResult> const& result) {
    if (result) {
        std::cout << label << ": ok " << result->confirmed_value.dump() << std::endl;
    } else {
        std::cout << label << ": " << CL::describeError(result.error()) << std::endl;
    }
}

} // namespace

int main(int argc, char** argv) {
    auto options_opt = CL::ParseClientArguments(argc, argv);
    if (!options_opt) {
        return EXIT_FAILURE;
    }

    auto options = *options_opt;
    if (options.show_help) {
        CL::PrintClientUsage();
        return EXIT_SUCCESS;
    }

#ifdef CL_LOG_DEBUG
    CL::set_thread_name("Monitor");
#endif

    CL::Transports                                 transports;
    std::shared_ptr<CL::Loopback::Network>          network;
    std::shared_ptr<CL::Loopback::SyntheticBackend> backend;
    if (options.offline) {
        if (options.discovery.override_url.empty()) {
            options.discovery.override_url = kOfflineBackendUrl;
        }
        auto endpoint = CL::parseEndpointUrl(options.discovery.override_url);
        if (!endpoint) {
            std::cerr << CL::describeError(endpoint.error()) << "\n";
            return EXIT_FAILURE;
        }
        network = std::make_shared<CL::Loopback::Network>();
        backend = std::make_shared<CL::Loopback::SyntheticBackend>();
        network->attach(*endpoint, backend);
        backend->startTicker(std::chrono::milliseconds{1000});
        transports = CL::Transports{network->httpFactory(), network->streamFactory()};
    } else {
        transports = CL::makeNetworkTransports();
    }

    CL::ChamberClient client{options, transports};
    client.events().subscribeAll(print_event);

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    client.start();

    auto const started      = std::chrono::steady_clock::now();
    bool       commandsSent = options.toggles.empty() && !options.pressure_step;
    while (g_stop_requested == 0) {
        if (options.duration.count() > 0 && std::chrono::steady_clock::now() - started >= options.duration) {
            break;
        }
        if (!commandsSent && client.state() == CL::ConnectionState::Connected) {
            commandsSent = true;
            for (auto const& control : options.toggles) {
                report("toggle " + control, client.commands().toggle(control));
            }
            if (options.pressure_step) {
                auto result = *options.pressure_step == "up" ? client.commands().increasePressure()
                                                              : client.commands().decreasePressure();
                report("pressure " + *options.pressure_step, result);
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{100});
    }

    client.stop();
    if (backend) {
        backend->stopTicker();
    }
    return EXIT_SUCCESS;
}
