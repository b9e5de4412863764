#ifdef CL_LOG_DEBUG
#include "TaggedLogger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace CL {

namespace {

bool env_flag(char const* key) {
    const char* raw = std::getenv(key);
    if (raw == nullptr) {
        return false;
    }
    std::string value{raw};
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return !(value.empty() || value == "0" || value == "false" || value == "off" || value == "no");
}

auto trim(std::string_view token) -> std::string_view {
    while (!token.empty() && std::isspace(static_cast<unsigned char>(token.front()))) {
        token.remove_prefix(1);
    }
    while (!token.empty() && std::isspace(static_cast<unsigned char>(token.back()))) {
        token.remove_suffix(1);
    }
    return token;
}

// "src/chamberlink/session/ConnectionSession.cpp" -> "session/ConnectionSession.cpp"
auto short_path(char const* file) -> std::string {
    std::filesystem::path path{file};
    if (!path.has_parent_path()) {
        return path.filename().string();
    }
    return (path.parent_path().filename() / path.filename()).string();
}

} // namespace

auto LogFilter::parseTagList(std::string_view text) -> std::set<std::string, std::less<>> {
    std::set<std::string, std::less<>> tags;
    while (!text.empty()) {
        auto comma = text.find(',');
        auto token = trim(text.substr(0, comma));
        if (!token.empty()) {
            tags.emplace(token);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        text.remove_prefix(comma + 1);
    }
    return tags;
}

auto LogFilter::fromEnvironment() -> LogFilter {
    LogFilter filter;
    if (env_flag("CHAMBERLINK_LOG_CLEAR_DEFAULT_SKIPS")) {
        filter.skip.clear();
    }
    if (auto const* raw = std::getenv("CHAMBERLINK_LOG_SKIP_TAGS")) {
        filter.skip.merge(parseTagList(raw));
    }
    if (auto const* raw = std::getenv("CHAMBERLINK_LOG_ENABLE_TAGS")) {
        filter.only = parseTagList(raw);
    }
    return filter;
}

bool LogFilter::admits(std::set<std::string, std::less<>> const& tags) const {
    return std::ranges::none_of(tags, [this](auto const& tag) {
        return skip.contains(tag) || (!only.empty() && !only.contains(tag));
    });
}

std::mutex TaggedLogger::coutMutex;

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger()
    : filter_(LogFilter::fromEnvironment()),
      enabled_(env_flag("CHAMBERLINK_LOG_ENABLED") || env_flag("CHAMBERLINK_LOG")) {
    worker_ = std::thread(&TaggedLogger::drain, this);
}

TaggedLogger::~TaggedLogger() {
    {
        std::lock_guard<std::mutex> lock(pendingMutex_);
        running_ = false;
    }
    wake_.notify_one();
    if (worker_.joinable()) {
        worker_.join();
    }
}

auto TaggedLogger::submit(std::string message, std::source_location const& location,
                          std::initializer_list<std::string_view> tags) -> void {
    Record record{.timestamp   = std::chrono::system_clock::now(),
                  .tags        = std::set<std::string, std::less<>>(tags.begin(), tags.end()),
                  .message     = std::move(message),
                  .thread_name = threadName(std::this_thread::get_id()),
                  .location    = location};
    if (!filter_.admits(record.tags)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(pendingMutex_);
        pending_.push_back(std::move(record));
    }
    wake_.notify_one();
}

auto TaggedLogger::setThreadName(const std::string& name) -> void {
    std::lock_guard<std::mutex> lock(threadNamesMutex_);
    threadNames_[std::this_thread::get_id()] = name;
}

auto TaggedLogger::setLoggingEnabled(bool enabled) -> void {
    enabled_.store(enabled, std::memory_order_relaxed);
}

auto TaggedLogger::drain() -> void {
    std::unique_lock<std::mutex> lock(pendingMutex_);
    while (true) {
        wake_.wait(lock, [this] { return !pending_.empty() || !running_; });
        if (pending_.empty()) {
            return;
        }
        auto batch = std::exchange(pending_, {});
        lock.unlock();
        for (auto const& record : batch) {
            write(record);
        }
        lock.lock();
    }
}

auto TaggedLogger::write(Record const& record) const -> void {
    auto const millis = std::chrono::duration_cast<std::chrono::milliseconds>(record.timestamp.time_since_epoch()) % 1000;
    auto const when   = std::chrono::system_clock::to_time_t(record.timestamp);

    std::ostringstream line;
    line << std::put_time(std::localtime(&when), "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
         << millis.count() << " [";
    for (auto it = record.tags.begin(); it != record.tags.end(); ++it) {
        line << (it == record.tags.begin() ? "" : "][") << *it;
    }
    line << "] [" << record.thread_name << "] [" << short_path(record.location.file_name()) << ':'
         << record.location.line() << "] " << record.message << '\n';

    std::lock_guard<std::mutex> lock(coutMutex);
    std::cerr << line.str() << std::flush;
}

auto TaggedLogger::threadName(std::thread::id id) -> std::string {
    std::lock_guard<std::mutex> lock(threadNamesMutex_);
    auto [it, inserted] = threadNames_.try_emplace(id);
    if (inserted) {
        it->second = "Thread " + std::to_string(nextThreadNumber_++);
    }
    return it->second;
}

void set_thread_name(const std::string& name) {
    logger().setThreadName(name);
}

void set_logging_enabled(bool enabled) {
    logger().setLoggingEnabled(enabled);
}

} // namespace CL
#endif // CL_LOG_DEBUG
