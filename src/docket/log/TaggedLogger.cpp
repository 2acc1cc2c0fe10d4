#include "TaggedLogger.hpp"

#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string_view>
#include <utility>

namespace DK {

namespace {

auto env_flag(char const* key) -> bool {
    const char* raw = std::getenv(key);
    if (raw == nullptr || *raw == '\0') {
        return false;
    }
    std::string_view value{raw};
    return value != "0" && value != "false" && value != "off" && value != "no";
}

auto split_tags(char const* raw) -> std::set<std::string> {
    std::set<std::string> tags;
    if (raw == nullptr) {
        return tags;
    }
    std::string_view rest{raw};
    while (!rest.empty()) {
        auto comma = rest.find(',');
        auto tag   = rest.substr(0, comma);
        while (!tag.empty() && tag.front() == ' ')
            tag.remove_prefix(1);
        while (!tag.empty() && tag.back() == ' ')
            tag.remove_suffix(1);
        if (!tag.empty())
            tags.emplace(tag);
        if (comma == std::string_view::npos)
            break;
        rest.remove_prefix(comma + 1);
    }
    return tags;
}

auto short_path(const char* filepath) -> std::string {
    std::filesystem::path p{filepath};
    if (p.has_parent_path()) {
        return (p.parent_path().filename() / p.filename()).string();
    }
    return p.filename().string();
}

} // namespace

std::mutex TaggedLogger::coutMutex;

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

auto LogFilter::fromEnvironment() -> LogFilter {
    LogFilter filter{};
    filter.enabled = split_tags(std::getenv("DOCKET_LOG_ENABLE_TAGS"));
    filter.skipped.merge(split_tags(std::getenv("DOCKET_LOG_SKIP_TAGS")));
    return filter;
}

auto LogFilter::admits(std::set<std::string> const& tags) const -> bool {
    bool listed = enabled.empty();
    for (auto const& tag : tags) {
        if (enabled.contains(tag)) {
            listed = true;
        } else if (skipped.contains(tag)) {
            return false;
        }
    }
    return listed;
}

TaggedLogger::TaggedLogger()
    : TaggedLogger(env_flag("DOCKET_LOG_ENABLED") || env_flag("DOCKET_LOG"), LogFilter::fromEnvironment(), std::cerr) {}

TaggedLogger::TaggedLogger(bool enabled, LogFilter filter, std::ostream& sink)
    : filter(std::move(filter)), sink(sink), loggingEnabled(enabled) {
    this->workerThread = std::thread(&TaggedLogger::processQueue, this);
}

TaggedLogger::~TaggedLogger() {
    {
        std::unique_lock<std::mutex> lock(this->queueMutex);
        this->running = false;
        this->cv.notify_one();
    }
    if (this->workerThread.joinable()) {
        this->workerThread.join();
    }
}

auto TaggedLogger::setThreadName(const std::string& name) -> void {
    std::lock_guard<std::mutex> lock(threadNamesMutex);
    threadNames[std::this_thread::get_id()] = name;
}

auto TaggedLogger::setLoggingEnabled(bool enabled) -> void {
    loggingEnabled.store(enabled, std::memory_order_relaxed);
}

auto TaggedLogger::flush() -> void {
    std::unique_lock<std::mutex> lock(this->queueMutex);
    this->drained.wait(lock, [this] { return this->messageQueue.empty() && this->inFlight == 0; });
}

auto TaggedLogger::enqueue(LogMessage msg) -> void {
    std::lock_guard<std::mutex> lock(this->queueMutex);
    this->messageQueue.push(std::move(msg));
    this->cv.notify_one();
}

auto TaggedLogger::processQueue() -> void {
    std::unique_lock<std::mutex> lock(this->queueMutex);
    while (true) {
        this->cv.wait(lock, [this] { return !this->messageQueue.empty() || !this->running; });
        if (!this->running && this->messageQueue.empty()) {
            return;
        }
        while (!this->messageQueue.empty()) {
            auto msg = std::move(this->messageQueue.front());
            this->messageQueue.pop();
            ++this->inFlight;
            lock.unlock();
            auto line = formatLine(msg);
            {
                std::lock_guard<std::mutex> out(coutMutex);
                this->sink << line << std::flush;
            }
            lock.lock();
            --this->inFlight;
        }
        this->drained.notify_all();
    }
}

auto TaggedLogger::formatLine(const LogMessage& msg) -> std::string {
    const auto nowMs    = std::chrono::duration_cast<std::chrono::milliseconds>(msg.timestamp.time_since_epoch()) % 1000;
    const auto nowTimeT = std::chrono::system_clock::to_time_t(msg.timestamp);
    std::tm    nowTm{};
    localtime_r(&nowTimeT, &nowTm);

    std::ostringstream oss;
    oss << std::put_time(&nowTm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << nowMs.count() << ' ';
    for (auto const& tag : msg.tags)
        oss << '[' << tag << ']';
    oss << " [" << msg.threadName << "] ";
    oss << "[" << short_path(msg.location.file_name()) << ":" << msg.location.line() << "] ";
    oss << msg.message << '\n';
    return oss.str();
}

auto TaggedLogger::threadName(const std::thread::id& id) -> std::string {
    std::lock_guard<std::mutex> lock(threadNamesMutex);
    auto [it, inserted] = threadNames.try_emplace(id);
    if (inserted) {
        it->second = "Thread " + std::to_string(nextThreadNumber++);
    }
    return it->second;
}

void set_thread_name(const std::string& name) {
    logger().setThreadName(name);
}

void set_logging_enabled(bool enabled) {
    logger().setLoggingEnabled(enabled);
}

} // namespace DK
