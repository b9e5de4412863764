#include "runtime/ClientContext.hpp"

#include "log/TaggedLogger.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <utility>

namespace CL {

namespace {
using json = nlohmann::json;
}

auto loadEndpointHint(std::string const& path) -> Expected<Endpoint> {
    std::ifstream input(path);
    if (!input) {
        return std::unexpected(Error{Error::Code::UnknownError, "cannot open " + path});
    }
    try {
        auto document = json::parse(input);
        Endpoint endpoint;
        endpoint.scheme = document.value("scheme", std::string{"http"});
        endpoint.host   = document.at("host").get<std::string>();
        endpoint.port   = document.at("port").get<std::uint16_t>();
        if (endpoint.host.empty() || endpoint.port == 0) {
            return std::unexpected(Error{Error::Code::MalformedInput, "incomplete endpoint in " + path});
        }
        return endpoint;
    } catch (json::exception const& error) {
        return std::unexpected(Error{Error::Code::MalformedInput, path + ": " + error.what()});
    }
}

auto saveEndpointHint(std::string const& path, DiscoveryResult const& result) -> Expected<void> {
    json document{
        {"scheme", result.endpoint.scheme},
        {"host", result.endpoint.host},
        {"port", result.endpoint.port},
        {"service", result.service_name},
        {"version", result.service_version},
        {"verified_at",
         std::chrono::duration_cast<std::chrono::milliseconds>(result.verified_at.time_since_epoch()).count()},
    };
    auto temp = path + ".tmp";
    {
        std::ofstream output(temp, std::ios::trunc);
        if (!output) {
            return std::unexpected(Error{Error::Code::UnknownError, "cannot write " + temp});
        }
        output << document.dump(2) << '\n';
        if (!output) {
            return std::unexpected(Error{Error::Code::UnknownError, "short write to " + temp});
        }
    }
    std::error_code ec;
    std::filesystem::rename(temp, path, ec);
    if (ec) {
        return std::unexpected(Error{Error::Code::UnknownError, "rename " + temp + ": " + ec.message()});
    }
    return {};
}

auto DiscoveryCache::current() const -> std::optional<DiscoveryResult> {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

auto DiscoveryCache::lastKnown() const -> std::optional<Endpoint> {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastKnown_;
}

void DiscoveryCache::store(DiscoveryResult result) {
    std::string path;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        lastKnown_ = result.endpoint;
        current_   = result;
        path       = persistPath_;
    }
    if (!path.empty()) {
        if (auto saved = saveEndpointHint(path, result); !saved) {
            cl_log("Discovery cache not persisted: " + describeError(saved.error()), "Discovery", "ERROR");
        }
    }
}

void DiscoveryCache::clearCurrent() {
    std::lock_guard<std::mutex> lock(mutex_);
    current_.reset();
}

void DiscoveryCache::clearAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    current_.reset();
    lastKnown_.reset();
}

void DiscoveryCache::setLastKnown(Endpoint endpoint) {
    std::lock_guard<std::mutex> lock(mutex_);
    lastKnown_ = std::move(endpoint);
}

auto ConnectionStateCell::get() const -> ConnectionState {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

auto ConnectionStateCell::set(ConnectionState state) -> ConnectionState {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::exchange(state_, state);
}

auto SnapshotStore::push(Snapshot snapshot) -> std::shared_ptr<Snapshot const> {
    std::shared_ptr<Snapshot const> stored;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot.sequence    = ++sequence_;
        snapshot.received_at = std::chrono::steady_clock::now();
        stored               = std::make_shared<Snapshot const>(std::move(snapshot));
        latest_              = stored;
    }
    cv_.notify_all();
    return stored;
}

auto SnapshotStore::latest() const -> std::shared_ptr<Snapshot const> {
    std::lock_guard<std::mutex> lock(mutex_);
    return latest_;
}

auto SnapshotStore::sequence() const -> std::uint64_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return sequence_;
}

auto SnapshotStore::waitNewer(std::uint64_t after, std::chrono::milliseconds timeout) const
    -> std::shared_ptr<Snapshot const> {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [&] { return closed_ || (latest_ && latest_->sequence > after); });
    if (latest_ && latest_->sequence > after) {
        return latest_;
    }
    return nullptr;
}

void SnapshotStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    latest_.reset();
}

void SnapshotStore::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

ClientContext::ClientContext(ClientOptions options)
    : options_(std::move(options)) {
    discovery_.persistPath_ = options_.discovery.cache_file;
}

auto ClientContext::create(ClientOptions options) -> std::unique_ptr<ClientContext> {
    std::unique_ptr<ClientContext> context{new ClientContext(std::move(options))};
    auto const& path = context->options_.discovery.cache_file;
    std::error_code ec;
    if (!path.empty() && std::filesystem::exists(path, ec)) {
        if (auto hint = loadEndpointHint(path)) {
            cl_log("Loaded last known backend " + hint->toUrl(), "Discovery");
            context->discovery_.setLastKnown(std::move(*hint));
        } else {
            cl_log("Ignoring discovery cache: " + describeError(hint.error()), "Discovery", "ERROR");
        }
    }
    return context;
}

void ClientContext::reset() {
    discovery_.clearAll();
    state_.set(ConnectionState::Idle);
    snapshots_.clear();
    {
        std::lock_guard<std::mutex> lock(snapshots_.mutex_);
        snapshots_.closed_ = false;
    }
}

void ClientContext::teardown() {
    snapshots_.close();
    state_.set(ConnectionState::Idle);
}

} // namespace CL
