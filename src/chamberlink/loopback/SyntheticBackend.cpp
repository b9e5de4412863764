#include "loopback/SyntheticBackend.hpp"

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace CL::Loopback {

namespace {

using json = nlohmann::json;

auto iso_timestamp() -> std::string {
    auto const now    = std::chrono::system_clock::now();
    auto const millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    auto const time   = std::chrono::system_clock::to_time_t(now);
    std::tm    utc{};
    gmtime_r(&time, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << millis.count()
        << 'Z';
    return oss.str();
}

void assign_path(json& root, std::string const& path, json value) {
    json*       node   = &root;
    std::size_t cursor = 0;
    while (true) {
        auto dot     = path.find('.', cursor);
        auto segment = path.substr(cursor, dot == std::string::npos ? std::string::npos : dot - cursor);
        if (dot == std::string::npos) {
            (*node)[segment] = std::move(value);
            return;
        }
        node   = &(*node)[segment];
        cursor = dot + 1;
    }
}

} // namespace

SyntheticBackend::SyntheticBackend(SyntheticBackendOptions options)
    : options_(std::move(options))
    , stepper_(options_.pressure) {
    state_ = json{
        {"control_panel",
         {{"ceiling_lights_state", false},
          {"reading_lights_state", false},
          {"door_lights_state", false},
          {"ac_state", false},
          {"intercom_state", false}}},
        {"pressure", {{"setpoint", stepper_.clamp(options_.initial_setpoint)}, {"current", 1.0}}},
        {"session", {{"running_state", false}, {"elapsed_seconds", 0}}},
        {"system", {{"plc_connected", true}, {"mode", "rest"}}},
    };
}

SyntheticBackend::~SyntheticBackend() {
    stopTicker();
    dropStreams();
}

auto SyntheticBackend::respond(int status, bool success, json data, std::string message) const -> HttpReply {
    json body{{"success", success}, {"message", std::move(message)}, {"timestamp", iso_timestamp()}};
    if (!data.is_null()) {
        body["data"] = std::move(data);
    }
    return HttpReply{status, body.dump()};
}

auto SyntheticBackend::handle(Request const& request) -> HttpReply {
    if (request.method == "GET") {
        if (request.path == "/health") {
            json body{{"status", "healthy"},
                      {"service", options_.service},
                      {"version", options_.version},
                      {"timestamp", iso_timestamp()}};
            return HttpReply{200, body.dump()};
        }
        std::lock_guard<std::mutex> lock(mutex_);
        if (request.path == "/api/status/system") {
            return respond(200, true, state_, "ok");
        }
        if (request.path == "/api/control/status") {
            return respond(200, true, state_["control_panel"], "ok");
        }
        return respond(404, false, nullptr, "not found: " + request.path);
    }
    if (request.method == "POST") {
        return handleCommand(request);
    }
    return respond(405, false, nullptr, "method not allowed");
}

auto SyntheticBackend::toggle(std::string const& field) -> HttpReply {
    auto& slot = state_["control_panel"][field];
    slot       = !(slot.is_boolean() && slot.get<bool>());
    broadcastLocked();
    return respond(200, true, json{{field, slot}}, field + " toggled");
}

auto SyntheticBackend::handleCommand(Request const& request) -> HttpReply {
    std::lock_guard<std::mutex> lock(mutex_);
    ++commands_;
    if (rejectNext_) {
        auto message = std::move(*rejectNext_);
        rejectNext_.reset();
        return respond(200, false, nullptr, std::move(message));
    }

    auto const& path = request.path;
    if (path == "/api/control/ac/toggle") {
        return toggle("ac_state");
    }
    if (path == "/api/control/lights/ceiling/toggle") {
        return toggle("ceiling_lights_state");
    }
    if (path == "/api/control/lights/reading/toggle") {
        return toggle("reading_lights_state");
    }
    if (path == "/api/control/lights/door/toggle") {
        return toggle("door_lights_state");
    }
    if (path == "/api/control/intercom/toggle") {
        return toggle("intercom_state");
    }
    if (path == "/api/session/start" || path == "/api/session/end") {
        bool running                       = path == "/api/session/start";
        state_["session"]["running_state"] = running;
        broadcastLocked();
        return respond(200, true, json{{"running_state", running}}, running ? "session started" : "session ended");
    }
    if (path == "/api/pressure/add" || path == "/api/pressure/subtract") {
        auto current  = state_["pressure"]["setpoint"].get<double>();
        auto next     = path == "/api/pressure/add" ? stepper_.increment(current) : stepper_.decrement(current);
        state_["pressure"]["setpoint"] = next;
        broadcastLocked();
        return respond(200, true, json{{"setpoint", next}}, "setpoint updated");
    }
    if (path == "/api/pressure/setpoint") {
        json body;
        try {
            body = json::parse(request.body);
        } catch (json::parse_error const&) {
            return respond(400, false, nullptr, "body is not JSON");
        }
        auto it = body.find("setpoint");
        if (!body.is_object() || it == body.end() || !it->is_number()) {
            return respond(400, false, nullptr, "setpoint must be a number");
        }
        auto next                      = stepper_.clamp(it->get<double>());
        state_["pressure"]["setpoint"] = next;
        broadcastLocked();
        return respond(200, true, json{{"setpoint", next}}, "setpoint updated");
    }
    return respond(404, false, nullptr, "not found: " + path);
}

auto SyntheticBackend::openStream(std::string const& path) -> Expected<std::shared_ptr<Stream>> {
    if (path != options_.stream_path) {
        return std::unexpected(Error{Error::Code::TransportFailure, "no stream at " + path});
    }
    auto stream = std::make_shared<Stream>();
    std::lock_guard<std::mutex> lock(mutex_);
    streams_.push_back(stream);
    if (!paused_) {
        stream->push(frameLocked());
    }
    return stream;
}

auto SyntheticBackend::frameLocked() const -> std::string {
    json frame{{"timestamp", iso_timestamp()}, {"type", "status_update"}, {"data", state_}};
    return frame.dump();
}

void SyntheticBackend::broadcastLocked() {
    std::erase_if(streams_, [](auto const& stream) { return stream->closed(); });
    if (paused_ || streams_.empty()) {
        return;
    }
    auto frame = frameLocked();
    for (auto& stream : streams_) {
        stream->push(frame);
    }
}

void SyntheticBackend::broadcast() {
    std::lock_guard<std::mutex> lock(mutex_);
    broadcastLocked();
}

void SyntheticBackend::pauseStreaming(bool paused) {
    std::lock_guard<std::mutex> lock(mutex_);
    paused_ = paused;
}

void SyntheticBackend::rejectNextCommand(std::string message) {
    std::lock_guard<std::mutex> lock(mutex_);
    rejectNext_ = std::move(message);
}

void SyntheticBackend::dropStreams() {
    std::vector<std::shared_ptr<Stream>> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dropped.swap(streams_);
    }
    for (auto& stream : dropped) {
        stream->close();
    }
    if (!dropped.empty()) {
        cl_log("Dropped " + std::to_string(dropped.size()) + " stream(s)", "Loopback");
    }
}

void SyntheticBackend::setValue(std::string const& path, json value) {
    std::lock_guard<std::mutex> lock(mutex_);
    assign_path(state_, path, std::move(value));
    broadcastLocked();
}

void SyntheticBackend::startTicker(std::chrono::milliseconds interval) {
    stopTicker();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tickerStop_ = false;
    }
    ticker_ = std::thread([this, interval] {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!tickerCv_.wait_for(lock, interval, [this] { return tickerStop_; })) {
            if (state_["session"]["running_state"].get<bool>()) {
                auto elapsed                         = state_["session"]["elapsed_seconds"].get<std::int64_t>();
                state_["session"]["elapsed_seconds"] = elapsed + 1;
            }
            broadcastLocked();
        }
    });
}

void SyntheticBackend::stopTicker() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tickerStop_ = true;
    }
    tickerCv_.notify_all();
    if (ticker_.joinable()) {
        ticker_.join();
    }
}

auto SyntheticBackend::state() const -> json {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

auto SyntheticBackend::commandCount() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return commands_;
}

auto SyntheticBackend::liveStreams() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(
        std::count_if(streams_.begin(), streams_.end(), [](auto const& stream) { return !stream->closed(); }));
}

} // namespace CL::Loopback
