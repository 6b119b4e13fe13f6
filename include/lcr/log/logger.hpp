#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <initializer_list>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

namespace lcr {
namespace log {

// ---------------------------------------------------------
// Log level
// ---------------------------------------------------------
enum class Level : uint8_t {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

[[nodiscard]] inline constexpr std::string_view to_string(Level lvl) noexcept {
    switch (lvl) {
        case Level::Trace: return "trace";
        case Level::Debug: return "debug";
        case Level::Info:  return "info";
        case Level::Warn:  return "warn";
        case Level::Error: return "error";
        case Level::Fatal: return "fatal";
    }
    return "unknown";
}

// Strict: `out` is only written when `name` is one of the to_string() names.
[[nodiscard]] inline bool parse_level(std::string_view name, Level& out) noexcept {
    for (auto lvl : {Level::Trace, Level::Debug, Level::Info, Level::Warn, Level::Error, Level::Fatal}) {
        if (name == to_string(lvl)) {
            out = lvl;
            return true;
        }
    }
    return false;
}

/*
===============================================================================
Logger
===============================================================================

Process-wide line logger shared by the decoder and its worker threads.

  • The level is atomic: any thread may test it without locking
  • One mutex serialises writes, so lines from different workers never
    interleave
  • A thread may set a short tag (e.g. "w3") that prefixes its lines

Defaults: stderr, Info, no color, timestamps on.
===============================================================================
*/

class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    void set_level(Level lvl) noexcept { level_.store(lvl, std::memory_order_relaxed); }

    [[nodiscard]] Level level() const noexcept { return level_.load(std::memory_order_relaxed); }

    [[nodiscard]] bool enabled(Level lvl) const noexcept { return lvl >= level(); }

    void enable_color(bool on) noexcept { color_enabled_.store(on, std::memory_order_relaxed); }

    void enable_timestamps(bool on) noexcept { timestamps_enabled_.store(on, std::memory_order_relaxed); }

    void set_output(std::ostream* os) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = os;
    }

    // Tag for lines written by the calling thread; empty clears it.
    static void set_thread_tag(std::string_view tag) {
        thread_tag_().assign(tag);
    }

    void write(Level lvl, const std::string& msg) {
        if (!enabled(lvl)) return;

        const bool color = color_enabled_.load(std::memory_order_relaxed);
        std::ostringstream line;
        if (color) line << color_code_(lvl);
        if (timestamps_enabled_.load(std::memory_order_relaxed)) {
            line << timestamp_() << ' ';
        }
        line << '[' << level_label_(lvl) << ']';
        if (const auto& tag = thread_tag_(); !tag.empty()) {
            line << '[' << tag << ']';
        }
        line << ' ' << msg;
        if (color) line << "\033[0m";
        line << '\n';

        std::lock_guard<std::mutex> lock(mutex_);
        if (out_) {
            *out_ << line.str();
            if (lvl >= Level::Error) out_->flush();
        }
    }

private:
    Logger() = default;

    static std::string& thread_tag_() {
        thread_local std::string tag;
        return tag;
    }

    static const char* level_label_(Level lvl) {
        switch (lvl) {
            case Level::Trace: return "TRACE";
            case Level::Debug: return "DEBUG";
            case Level::Info:  return "INFO";
            case Level::Warn:  return "WARN";
            case Level::Error: return "ERROR";
            case Level::Fatal: return "FATAL";
        }
        return "?????";
    }

    // ANSI colors
    static constexpr const char* color_code_(Level lvl) {
        switch (lvl) {
            case Level::Trace: return "\033[37m";
            case Level::Debug: return "\033[36m";
            case Level::Info:  return "\033[32m";
            case Level::Warn:  return "\033[33m";
            case Level::Error: return "\033[31m";
            case Level::Fatal: return "\033[1;31m";
        }
        return "\033[0m";
    }

    // Local time with milliseconds
    static std::string timestamp_() {
        using namespace std::chrono;
        const auto now = system_clock::now();
        const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
        const auto t = system_clock::to_time_t(now);
        std::tm tm{};
    #ifdef _WIN32
        localtime_s(&tm, &t);
    #else
        localtime_r(&t, &tm);
    #endif
        char buf[32];
        const auto n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
        std::snprintf(buf + n, sizeof(buf) - n, ".%03d", static_cast<int>(ms));
        return buf;
    }

    std::ostream* out_{&std::cerr};
    std::atomic<Level> level_{Level::Info};
    std::atomic<bool> color_enabled_{false};
    std::atomic<bool> timestamps_enabled_{true};
    std::mutex mutex_;
};

// ---------------------------------------------------------
// One log line, written when the statement ends
// ---------------------------------------------------------
class LogLine {
public:
    explicit LogLine(Level lvl) : lvl_(lvl) {}

    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    template<typename T>
    LogLine& operator<<(const T& v) {
        ss_ << v;
        return *this;
    }

    ~LogLine() {
        Logger::instance().write(lvl_, ss_.str());
    }

private:
    Level lvl_;
    std::ostringstream ss_;
};

} // namespace log
} // namespace lcr


// ---------------------------------------------------------
// Logging macros
// Messages below the active level are never formatted.
// ---------------------------------------------------------
#define RC_LOG_LEVEL(lvl) \
    if (!::lcr::log::Logger::instance().enabled((lvl))) {} else ::lcr::log::LogLine((lvl))

#define RC_TRACE(msg)  RC_LOG_LEVEL(::lcr::log::Level::Trace) << msg
#define RC_DEBUG(msg)  RC_LOG_LEVEL(::lcr::log::Level::Debug) << msg
#define RC_INFO(msg)   RC_LOG_LEVEL(::lcr::log::Level::Info)  << msg
#define RC_WARN(msg)   RC_LOG_LEVEL(::lcr::log::Level::Warn)  << msg
#define RC_ERROR(msg)  RC_LOG_LEVEL(::lcr::log::Level::Error) << msg
#define RC_FATAL(msg)  RC_LOG_LEVEL(::lcr::log::Level::Fatal) << msg
