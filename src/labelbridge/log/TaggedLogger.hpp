#pragma once
#include <set>
#include <string>
#include <string_view>

namespace LB {

// Runtime log selection as given by LABELBRIDGE_LOG or --log-tags:
// "" / "0" / "off" disable, "1" / "on" / "all" enable every tag, anything else is
// a comma separated tag list ("Zpl,Raster") that enables logging for those tags.
struct LogSetting {
    bool                  enabled = false;
    std::set<std::string> tags; // empty: every tag
};

[[nodiscard]] auto parseLogSetting(std::string_view value) -> LogSetting;

} // namespace LB

#ifdef LB_LOG_DEBUG
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <ostream>
#include <queue>
#include <source_location>
#include <thread>
#include <unordered_map>
#include <vector>

namespace LB {

// Asynchronous tagged logger. Producers only enqueue; a worker thread formats
// and writes. A message is written when logging is enabled and, with a tag
// selection active, when any of its tags is selected.
class TaggedLogger {
public:
    struct Entry {
        std::chrono::system_clock::time_point timestamp;
        std::vector<std::string>              tags;
        std::string                           message;
        std::string                           thread;
        std::source_location                  location;
    };

    explicit TaggedLogger(std::ostream* sink = nullptr); // nullptr writes to std::cerr
    ~TaggedLogger();

    TaggedLogger(const TaggedLogger&)            = delete;
    TaggedLogger& operator=(const TaggedLogger&) = delete;

    template <typename... Tags>
    void log(std::string message, std::source_location location, Tags&&... tags);

    void apply(LogSetting const& setting);
    void setEnabled(bool enabled);
    void setEnabledTags(std::set<std::string> tags);
    void setThreadName(std::string name);

    [[nodiscard]] auto enabled() const -> bool;
    [[nodiscard]] auto accepts(std::vector<std::string> const& tags) const -> bool;

    // Returns once every message queued so far has been written.
    void flush();

private:
    void run();
    void write(Entry const& entry);
    auto threadName() -> std::string;

    std::ostream*           sink;
    mutable std::mutex      mutex;
    std::condition_variable wake;
    std::condition_variable drained;
    std::queue<Entry>       pending;
    std::size_t             inFlight = 0;
    bool                    stopping = false;
    bool                    enabledFlag = false;
    std::set<std::string>   enabledTags;

    std::mutex                                       namesMutex;
    std::unordered_map<std::thread::id, std::string> names;
    int                                              nextThreadNumber = 0;

    std::thread worker; // last: started after every other member exists
};

TaggedLogger& logger();

template <typename... Tags>
void TaggedLogger::log(std::string message, std::source_location location, Tags&&... tags) {
    std::vector<std::string> tagList{std::string(std::forward<Tags>(tags))...};
    if (!this->enabled() || !this->accepts(tagList))
        return;

    Entry entry{.timestamp = std::chrono::system_clock::now(),
                .tags      = std::move(tagList),
                .message   = std::move(message),
                .thread    = this->threadName(),
                .location  = location};
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->pending.push(std::move(entry));
        ++this->inFlight;
    }
    this->wake.notify_one();
}

#define lb_log(message, ...) ::LB::logger().log(message, std::source_location::current(), ##__VA_ARGS__)

void set_thread_name(const std::string& name);
void configure_logging(LogSetting const& setting);

} // namespace LB

#else
#define lb_log(message, ...) ((void)0)
#endif // LB_LOG_DEBUG
