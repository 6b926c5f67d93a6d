#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <iosfwd>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <vector>

namespace hotline
{

enum class LogLevel : int
{
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5
};

// Process-wide logger shared by the agent and the desktop client.
// The level check is lock-free so disabled calls from session threads cost
// one atomic load. Sinks run under the sink mutex, in registration order.
class Logger
{
   public:
    struct LogEntry
    {
        std::chrono::system_clock::time_point timestamp;
        LogLevel                              level;
        std::string                           category;
        std::string                           message;
        std::thread::id                       thread;
    };

    using LogSink = std::function<void(const LogEntry&)>;

    static Logger& instance();

    void     set_level(LogLevel level);
    LogLevel get_level() const;
    bool     is_enabled(LogLevel level) const;

    void add_sink(LogSink sink);
    void clear_sinks();

    void log(LogLevel level, std::string_view category, std::string_view message);

    // "{}" placeholders are filled left to right. Surplus arguments are
    // dropped and unmatched placeholders are kept verbatim.
    template <typename... Args>
    void log_formatted(LogLevel         level,
                       std::string_view category,
                       std::string_view format,
                       Args&&... args)
    {
        if (!is_enabled(level))
            return;
        if constexpr (sizeof...(Args) == 0)
            log(level, category, format);
        else
            log(level, category, substitute(format, {stringify(std::forward<Args>(args))...}));
    }

    // Thread that first touched the logger; entries from any other thread
    // carry their thread id in rendered output.
    std::thread::id owner_thread() const { return owner_thread_; }

    static std::string level_to_string(LogLevel level);
    static std::string timestamp_to_string(const std::chrono::system_clock::time_point& tp);

   private:
    Logger();
    ~Logger()                        = default;
    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    template <typename T>
    static std::string stringify(T&& v)
    {
        using D = std::decay_t<T>;
        if constexpr (std::is_same_v<D, bool>)
            return v ? "true" : "false";
        else if constexpr (std::is_same_v<D, const char*> || std::is_same_v<D, char*>)
            return v ? std::string(v) : std::string("(null)");
        else if constexpr (std::is_convertible_v<const D&, std::string_view>)
            return std::string(std::string_view(v));
        else
            return std::to_string(v);
    }

    static std::string substitute(std::string_view format, const std::vector<std::string>& values)
    {
        std::string out;
        out.reserve(format.size());
        size_t next = 0;
        while (!format.empty())
        {
            auto pos = format.find("{}");
            if (pos == std::string_view::npos || next == values.size())
                break;
            out.append(format.substr(0, pos));
            out.append(values[next++]);
            format.remove_prefix(pos + 2);
        }
        out.append(format);
        return out;
    }

    const std::thread::id owner_thread_;
    std::atomic<LogLevel> min_level_{LogLevel::Info};
    std::mutex            sinks_mutex_;
    std::vector<LogSink>  sinks_;
};

namespace sinks
{
// Writes to stderr, colored when stderr is a terminal. The agent runs
// inside a host process that may own stdout.
Logger::LogSink console_sink();
// The stream must outlive every entry written through the sink.
Logger::LogSink stream_sink(std::ostream& out);
Logger::LogSink file_sink(const std::string& filename);
Logger::LogSink null_sink();
}   // namespace sinks

#define HOTLINE_LOG_AT(lvl, category, ...)                                            \
    do                                                                                \
    {                                                                                 \
        if (::hotline::Logger::instance().is_enabled(lvl))                            \
            ::hotline::Logger::instance().log_formatted(lvl, category, __VA_ARGS__); \
    } while (0)

#define HOTLINE_LOG_TRACE(category, ...) \
    HOTLINE_LOG_AT(::hotline::LogLevel::Trace, category, __VA_ARGS__)
#define HOTLINE_LOG_DEBUG(category, ...) \
    HOTLINE_LOG_AT(::hotline::LogLevel::Debug, category, __VA_ARGS__)
#define HOTLINE_LOG_INFO(category, ...) \
    HOTLINE_LOG_AT(::hotline::LogLevel::Info, category, __VA_ARGS__)
#define HOTLINE_LOG_WARN(category, ...) \
    HOTLINE_LOG_AT(::hotline::LogLevel::Warning, category, __VA_ARGS__)
#define HOTLINE_LOG_ERROR(category, ...) \
    HOTLINE_LOG_AT(::hotline::LogLevel::Error, category, __VA_ARGS__)
#define HOTLINE_LOG_CRITICAL(category, ...) \
    HOTLINE_LOG_AT(::hotline::LogLevel::Critical, category, __VA_ARGS__)

}   // namespace hotline
