#include "TaggedLogger.hpp"

#include <algorithm>
#include <array>
#include <cctype>

#ifdef LB_LOG_DEBUG
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#endif

namespace LB {

namespace {

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
        text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
        text.remove_suffix(1);
    return text;
}

auto lowered(std::string_view text) -> std::string {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

auto parseLogSetting(std::string_view value) -> LogSetting {
    value = trim(value);
    auto const word = lowered(value);
    if (word.empty() || word == "0" || word == "off")
        return {};
    if (word == "1" || word == "on" || word == "all")
        return LogSetting{.enabled = true};

    LogSetting setting{.enabled = true};
    while (!value.empty()) {
        auto const comma = value.find(',');
        auto const tag   = trim(value.substr(0, comma));
        if (!tag.empty())
            setting.tags.emplace(tag);
        if (comma == std::string_view::npos)
            break;
        value.remove_prefix(comma + 1);
    }
    return setting;
}

#ifdef LB_LOG_DEBUG

namespace {

// "src/labelbridge/zpl/ZplParser.cpp" -> "zpl/ZplParser.cpp"
auto shortSource(char const* file) -> std::string {
    std::filesystem::path path{file};
    if (!path.has_parent_path())
        return path.filename().string();
    return (path.parent_path().filename() / path.filename()).string();
}

auto formatEntry(TaggedLogger::Entry const& entry) -> std::string {
    auto const seconds = std::chrono::system_clock::to_time_t(entry.timestamp);
    auto const millis  = std::chrono::duration_cast<std::chrono::milliseconds>(entry.timestamp.time_since_epoch()) % 1000;
    std::tm    local{};
    localtime_r(&seconds, &local);

    std::ostringstream line;
    line << std::put_time(&local, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << millis.count() << ' ';
    for (auto const& tag : entry.tags)
        line << '[' << tag << ']';
    if (!entry.tags.empty())
        line << ' ';
    line << '[' << entry.thread << "] [" << shortSource(entry.location.file_name()) << ':' << entry.location.line() << "] "
         << entry.message << '\n';
    return line.str();
}

} // namespace

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger(std::ostream* sink) : sink(sink != nullptr ? sink : &std::cerr) {
    this->worker = std::thread(&TaggedLogger::run, this);
}

TaggedLogger::~TaggedLogger() {
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->stopping = true;
    }
    this->wake.notify_one();
    if (this->worker.joinable())
        this->worker.join();
}

void TaggedLogger::apply(LogSetting const& setting) {
    std::lock_guard<std::mutex> lock(this->mutex);
    this->enabledFlag = setting.enabled;
    this->enabledTags = setting.tags;
}

void TaggedLogger::setEnabled(bool enabled) {
    std::lock_guard<std::mutex> lock(this->mutex);
    this->enabledFlag = enabled;
}

void TaggedLogger::setEnabledTags(std::set<std::string> tags) {
    std::lock_guard<std::mutex> lock(this->mutex);
    this->enabledTags = std::move(tags);
}

auto TaggedLogger::enabled() const -> bool {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->enabledFlag;
}

auto TaggedLogger::accepts(std::vector<std::string> const& tags) const -> bool {
    std::lock_guard<std::mutex> lock(this->mutex);
    if (this->enabledTags.empty())
        return true;
    return std::any_of(tags.begin(), tags.end(), [this](std::string const& tag) { return this->enabledTags.contains(tag); });
}

void TaggedLogger::setThreadName(std::string name) {
    std::lock_guard<std::mutex> lock(this->namesMutex);
    this->names[std::this_thread::get_id()] = std::move(name);
}

auto TaggedLogger::threadName() -> std::string {
    std::lock_guard<std::mutex> lock(this->namesMutex);
    auto [it, inserted] = this->names.try_emplace(std::this_thread::get_id());
    if (inserted)
        it->second = "Thread " + std::to_string(this->nextThreadNumber++);
    return it->second;
}

void TaggedLogger::flush() {
    std::unique_lock<std::mutex> lock(this->mutex);
    this->drained.wait(lock, [this] { return this->inFlight == 0; });
}

void TaggedLogger::run() {
    std::unique_lock<std::mutex> lock(this->mutex);
    while (true) {
        this->wake.wait(lock, [this] { return !this->pending.empty() || this->stopping; });
        if (this->pending.empty())
            return; // stopping with nothing left

        auto entry = std::move(this->pending.front());
        this->pending.pop();
        lock.unlock();
        this->write(entry);
        lock.lock();
        if (--this->inFlight == 0)
            this->drained.notify_all();
    }
}

void TaggedLogger::write(Entry const& entry) {
    *this->sink << formatEntry(entry) << std::flush;
}

void set_thread_name(const std::string& name) {
    logger().setThreadName(name);
}

void configure_logging(LogSetting const& setting) {
    logger().apply(setting);
}

#endif // LB_LOG_DEBUG

} // namespace LB
