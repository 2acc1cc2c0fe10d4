#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <iosfwd>
#include <mutex>
#include <queue>
#include <set>
#include <source_location>
#include <string>
#include <thread>
#include <unordered_map>

namespace DK {

/**
 * Which tag sets reach the output. With an enable list, a line needs at least one
 * listed tag. A line carrying a skipped tag is dropped unless that tag is also
 * enabled, so DOCKET_LOG_ENABLE_TAGS=DEBUG turns request tracing on.
 */
struct LogFilter {
    std::set<std::string> enabled;
    std::set<std::string> skipped{"DEBUG"};

    // DOCKET_LOG_ENABLE_TAGS and DOCKET_LOG_SKIP_TAGS, comma separated.
    static auto fromEnvironment() -> LogFilter;

    auto admits(std::set<std::string> const& tags) const -> bool;
};

class TaggedLogger {
public:
    struct LogMessage {
        std::chrono::system_clock::time_point timestamp;
        std::set<std::string>                 tags;
        std::string                           message;
        std::string                           threadName;
        std::source_location                  location;
    };

    // Enabled by DOCKET_LOG_ENABLED or DOCKET_LOG, filtered per LogFilter::fromEnvironment, writing to stderr.
    TaggedLogger();
    TaggedLogger(bool enabled, LogFilter filter, std::ostream& sink);
    ~TaggedLogger();

    TaggedLogger(const TaggedLogger&)            = delete;
    TaggedLogger& operator=(const TaggedLogger&) = delete;

    template <typename... Tags>
    auto log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void;

    auto setThreadName(const std::string& name) -> void;
    auto setLoggingEnabled(bool enabled) -> void;

    // Blocks until every queued line has been written.
    auto flush() -> void;

    // timestamp [tag][tag] [thread] [dir/file:line] message
    static auto formatLine(const LogMessage& msg) -> std::string;

    static std::mutex coutMutex;

private:
    auto enqueue(LogMessage msg) -> void;
    auto processQueue() -> void;
    auto threadName(const std::thread::id& id) -> std::string;

    LogFilter     filter;
    std::ostream& sink;

    std::queue<LogMessage>  messageQueue;
    std::size_t             inFlight{0};
    std::mutex              queueMutex;
    std::condition_variable cv;
    std::condition_variable drained;
    std::atomic<bool>       running{true};
    std::atomic<bool>       loggingEnabled;

    std::unordered_map<std::thread::id, std::string> threadNames;
    std::mutex                                       threadNamesMutex;
    int                                              nextThreadNumber{0};

    std::thread workerThread;
};

TaggedLogger& logger();

template <typename... Tags>
auto TaggedLogger::log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void {
    if (!loggingEnabled)
        return;
    std::set<std::string> tagSet{std::string(std::forward<Tags>(tags))...};
    if (!filter.admits(tagSet))
        return;
    enqueue(LogMessage{.timestamp  = std::chrono::system_clock::now(),
                       .tags       = std::move(tagSet),
                       .message    = message,
                       .threadName = threadName(std::this_thread::get_id()),
                       .location   = location});
}

#define dk_log(message, ...) ::DK::logger().log_impl(message, std::source_location::current(), ##__VA_ARGS__)

void set_thread_name(const std::string& name);
void set_logging_enabled(bool enabled);

} // namespace DK
