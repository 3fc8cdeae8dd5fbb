#ifdef TP_LOG_DEBUG
#include "TaggedLogger.hpp"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string_view>

namespace TP {

namespace {

auto env_value(char const* name) -> char const* {
    return std::getenv(name);
}

auto env_flag(char const* name) -> bool {
    auto const* value = env_value(name);
    return value != nullptr && std::strcmp(value, "0") != 0;
}

auto trim(std::string_view token) -> std::string_view {
    auto const first = token.find_first_not_of(" \t");
    if (first == std::string_view::npos)
        return {};
    auto const last = token.find_last_not_of(" \t");
    return token.substr(first, last - first + 1);
}

auto split_tags(char const* raw) -> std::set<std::string> {
    std::set<std::string> tags;
    if (raw == nullptr)
        return tags;
    std::string_view rest{raw};
    while (!rest.empty()) {
        auto const comma = rest.find(',');
        auto const token = trim(rest.substr(0, comma));
        if (!token.empty())
            tags.emplace(token);
        if (comma == std::string_view::npos)
            break;
        rest.remove_prefix(comma + 1);
    }
    return tags;
}

} // namespace

std::mutex TaggedLogger::coutMutex;

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger() : running(true), loggingEnabled(false), nextThreadNumber(0) {
    this->applyEnvironment();
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

auto TaggedLogger::applyEnvironment() -> void {
    if (env_flag("TREEPATH_LOG_ENABLED") || env_flag("TREEPATH_LOG"))
        this->loggingEnabled = true;
    if (env_flag("TREEPATH_LOG_CLEAR_DEFAULT_SKIPS"))
        this->skipTags.clear();
    this->enabledTags = split_tags(env_value("TREEPATH_LOG_ENABLE_TAGS"));
    this->skipTags.merge(split_tags(env_value("TREEPATH_LOG_SKIP_TAGS")));
}

auto TaggedLogger::setThreadName(const std::string& name) -> void {
    const auto                  threadId = std::this_thread::get_id();
    std::lock_guard<std::mutex> lock(threadNamesMutex);
    threadNames[threadId] = name;
}

auto TaggedLogger::setLoggingEnabled(bool enabled) -> void {
    loggingEnabled.store(enabled, std::memory_order_relaxed);
}

auto TaggedLogger::processQueue() -> void {
    std::unique_lock<std::mutex> lock(this->queueMutex);
    while (this->running || !this->messageQueue.empty()) {
        this->cv.wait(lock, [this] { return !this->messageQueue.empty() || !this->running; });

        std::queue<LogMessage> pending;
        pending.swap(this->messageQueue);
        lock.unlock();
        for (; !pending.empty(); pending.pop()) {
            if (!this->accepts(pending.front().tags))
                continue;
            auto const line = format(pending.front());
            std::lock_guard<std::mutex> out(coutMutex);
            std::cerr << line << std::flush;
        }
        lock.lock();
    }
}

// Every tag must be allowed when an allow-list is set; any skipped tag drops the message.
auto TaggedLogger::accepts(const std::set<std::string>& tags) const -> bool {
    auto const allowed = [this](std::string const& tag) { return this->enabledTags.contains(tag); };
    auto const skipped = [this](std::string const& tag) { return this->skipTags.contains(tag); };
    if (!this->enabledTags.empty() && !std::ranges::all_of(tags, allowed))
        return false;
    return std::ranges::none_of(tags, skipped);
}

// "<date time.ms> [tag][tag] [thread] [dir/file.cpp:line] message"
auto TaggedLogger::format(const LogMessage& msg) -> std::string {
    auto const millis = std::chrono::duration_cast<std::chrono::milliseconds>(msg.timestamp.time_since_epoch()) % 1000;
    auto const time   = std::chrono::system_clock::to_time_t(msg.timestamp);
    std::tm    local{};
    localtime_r(&time, &local);

    std::filesystem::path const source{msg.location.file_name()};
    auto const                  shortSource = (source.parent_path().filename() / source.filename()).string();

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << millis.count() << " ";
    for (auto const& tag : msg.tags)
        oss << '[' << tag << ']';
    oss << " [" << msg.threadName << "] [" << shortSource << ':' << msg.location.line() << "] " << msg.message << '\n';
    return oss.str();
}

auto TaggedLogger::getThreadName(const std::thread::id& id) -> std::string {
    std::lock_guard<std::mutex> lock(threadNamesMutex);
    auto [it, inserted] = threadNames.try_emplace(id);
    if (inserted)
        it->second = "Thread " + std::to_string(nextThreadNumber++);
    return it->second;
}

void set_thread_name(const std::string& name) {
    logger().setThreadName(name);
}

void set_logging_enabled(bool enabled) {
    logger().setLoggingEnabled(enabled);
}

} // namespace TP
#endif // TP_LOG_DEBUG
