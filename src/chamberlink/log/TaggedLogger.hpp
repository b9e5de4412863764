#pragma once
#include <string>

#ifdef CL_LOG_DEBUG
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <initializer_list>
#include <mutex>
#include <set>
#include <source_location>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>

namespace CL {

/*
 * Tag filter for log records. A record is dropped when any of its tags is
 * skipped, or when an allow-list is set and one of its tags is missing from it.
 *
 * CHAMBERLINK_LOG_SKIP_TAGS adds to the default skips, CHAMBERLINK_LOG_CLEAR_DEFAULT_SKIPS
 * removes them, and CHAMBERLINK_LOG_ENABLE_TAGS sets the allow-list. Lists are
 * comma separated; blanks around entries are ignored.
 */
struct LogFilter {
    std::set<std::string, std::less<>> skip{"INFO", "Probe"};
    std::set<std::string, std::less<>> only;

    [[nodiscard]] static auto fromEnvironment() -> LogFilter;
    [[nodiscard]] static auto parseTagList(std::string_view text) -> std::set<std::string, std::less<>>;

    [[nodiscard]] bool admits(std::set<std::string, std::less<>> const& tags) const;
};

class TaggedLogger {
public:
    struct Record {
        std::chrono::system_clock::time_point timestamp;
        std::set<std::string, std::less<>>    tags;
        std::string                           message;
        std::string                           thread_name;
        std::source_location                  location;
    };

    // Output is off unless CHAMBERLINK_LOG or CHAMBERLINK_LOG_ENABLED is set.
    TaggedLogger();
    ~TaggedLogger();

    TaggedLogger(const TaggedLogger&)            = delete;
    TaggedLogger& operator=(const TaggedLogger&) = delete;

    template <typename... Tags>
    auto log_impl(std::string message, std::source_location const& location, Tags&&... tags) -> void {
        if (!enabled_.load(std::memory_order_relaxed))
            return;
        submit(std::move(message), location, {std::string_view(tags)...});
    }

    auto setThreadName(const std::string& name) -> void;
    auto setLoggingEnabled(bool enabled) -> void;
    [[nodiscard]] auto filter() const -> LogFilter const& { return filter_; }

    static std::mutex coutMutex;

private:
    auto submit(std::string message, std::source_location const& location, std::initializer_list<std::string_view> tags)
        -> void;
    auto drain() -> void;
    auto write(Record const& record) const -> void;
    auto threadName(std::thread::id id) -> std::string;

    LogFilter const         filter_;
    std::deque<Record>      pending_;
    mutable std::mutex      pendingMutex_;
    std::condition_variable wake_;
    std::atomic<bool>       running_{true};
    std::atomic<bool>       enabled_{false};

    std::unordered_map<std::thread::id, std::string> threadNames_;
    std::mutex                                       threadNamesMutex_;
    int                                              nextThreadNumber_{0};

    std::thread worker_;
};

TaggedLogger& logger();

#define cl_log(message, ...) ::CL::logger().log_impl(message, std::source_location::current(), ##__VA_ARGS__)

void set_thread_name(const std::string& name);
void set_logging_enabled(bool enabled);

} // namespace CL

#else
#define cl_log(message, ...) ((void)0)

namespace CL {
inline void set_thread_name(const std::string&) {}
inline void set_logging_enabled(bool) {}
} // namespace CL
#endif // CL_LOG_DEBUG
