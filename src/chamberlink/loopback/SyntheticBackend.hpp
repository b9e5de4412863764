#pragma once

#include "command/PressureStepper.hpp"
#include "loopback/LoopbackNetwork.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace CL::Loopback {

struct SyntheticBackendOptions {
    std::string     service{"elixir-backend"};
    std::string     version{"1.2.0"};
    std::string     stream_path{"/ws/system-status"};
    PressureLimits  pressure{};
    double          initial_setpoint{1.50};
};

/*
 * In-process chamber controller with the same health, command and stream
 * surface as the device. Every state change is streamed to attached clients
 * as {timestamp, type: "status_update", data}.
 */
class SyntheticBackend final : public Host {
public:
    explicit SyntheticBackend(SyntheticBackendOptions options = SyntheticBackendOptions{});
    ~SyntheticBackend() override;

    SyntheticBackend(SyntheticBackend const&)            = delete;
    SyntheticBackend& operator=(SyntheticBackend const&) = delete;

    auto handle(Request const& request) -> HttpReply override;
    auto openStream(std::string const& path) -> Expected<std::shared_ptr<Stream>> override;

    // Stops streaming; commands still change state silently.
    void pauseStreaming(bool paused);
    // The next command answers {success: false, message}.
    void rejectNextCommand(std::string message);
    void dropStreams();
    // Writes a value at a dotted path and streams the new state.
    void setValue(std::string const& path, nlohmann::json value);
    void broadcast();

    void startTicker(std::chrono::milliseconds interval);
    void stopTicker();

    [[nodiscard]] auto state() const -> nlohmann::json;
    [[nodiscard]] auto commandCount() const -> std::size_t;
    [[nodiscard]] auto liveStreams() const -> std::size_t;

private:
    auto respond(int status, bool success, nlohmann::json data, std::string message) const -> HttpReply;
    auto handleCommand(Request const& request) -> HttpReply;
    auto toggle(std::string const& field) -> HttpReply;
    auto frameLocked() const -> std::string;
    void broadcastLocked();

    SyntheticBackendOptions              options_;
    PressureStepper                      stepper_;
    mutable std::mutex                   mutex_;
    nlohmann::json                       state_;
    std::vector<std::shared_ptr<Stream>> streams_;
    std::optional<std::string>           rejectNext_;
    bool                                 paused_{false};
    std::size_t                          commands_{0};

    std::thread                          ticker_;
    std::condition_variable              tickerCv_;
    bool                                 tickerStop_{false};
};

} // namespace CL::Loopback
