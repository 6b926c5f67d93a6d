#include <array>
#include <ctime>
#include <fstream>
#include <hotline/logger.hpp>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <unistd.h>

namespace hotline
{

namespace
{

constexpr std::array<const char*, 6> LEVEL_NAMES{"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "CRITICAL"};
constexpr std::array<const char*, 6> LEVEL_COLORS{
    "\033[37m", "\033[36m", "\033[32m", "\033[33m", "\033[31m", "\033[35m"};

size_t level_index(LogLevel level)
{
    return static_cast<size_t>(level);
}

// "<timestamp> <LEVEL> [<category>] <message>", with the worker thread
// appended when the entry came from a session thread.
std::string render_line(const Logger::LogEntry& entry)
{
    std::ostringstream line;
    line << Logger::timestamp_to_string(entry.timestamp) << ' '
         << Logger::level_to_string(entry.level) << " [" << entry.category << "] "
         << entry.message;
    if (entry.thread != Logger::instance().owner_thread())
        line << " (tid " << entry.thread << ')';
    return line.str();
}

}   // namespace

Logger::Logger() : owner_thread_(std::this_thread::get_id()) {}

Logger& Logger::instance()
{
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level)
{
    min_level_.store(level, std::memory_order_relaxed);
}

LogLevel Logger::get_level() const
{
    return min_level_.load(std::memory_order_relaxed);
}

bool Logger::is_enabled(LogLevel level) const
{
    return level >= get_level();
}

void Logger::add_sink(LogSink sink)
{
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks()
{
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    sinks_.clear();
}

void Logger::log(LogLevel level, std::string_view category, std::string_view message)
{
    if (!is_enabled(level))
        return;

    const LogEntry entry{.timestamp = std::chrono::system_clock::now(),
                         .level     = level,
                         .category  = std::string(category),
                         .message   = std::string(message),
                         .thread    = std::this_thread::get_id()};

    std::lock_guard<std::mutex> lock(sinks_mutex_);
    for (const auto& sink : sinks_)
        sink(entry);
}

std::string Logger::level_to_string(LogLevel level)
{
    auto i = level_index(level);
    return i < LEVEL_NAMES.size() ? LEVEL_NAMES[i] : "UNKNOWN";
}

std::string Logger::timestamp_to_string(const std::chrono::system_clock::time_point& tp)
{
    using namespace std::chrono;
    const std::time_t secs   = system_clock::to_time_t(tp);
    const auto        millis = duration_cast<milliseconds>(tp.time_since_epoch()).count() % 1000;

    std::tm local{};
    ::localtime_r(&secs, &local);

    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local);

    std::ostringstream out;
    out << stamp << '.' << std::setfill('0') << std::setw(3) << millis;
    return out.str();
}

namespace sinks
{

Logger::LogSink console_sink()
{
    const bool colored = ::isatty(STDERR_FILENO) != 0;
    return [colored](const Logger::LogEntry& entry)
    {
        auto i = level_index(entry.level);
        if (colored && i < LEVEL_COLORS.size())
            std::cerr << LEVEL_COLORS[i] << render_line(entry) << "\033[0m\n";
        else
            std::cerr << render_line(entry) << '\n';
    };
}

Logger::LogSink stream_sink(std::ostream& out)
{
    return [&out](const Logger::LogEntry& entry) { out << render_line(entry) << '\n'; };
}

Logger::LogSink file_sink(const std::string& filename)
{
    auto file = std::make_shared<std::ofstream>(filename, std::ios::app);
    if (!file->is_open())
    {
        std::cerr << "hotline: cannot open log file " << filename << '\n';
        return null_sink();
    }
    return [file](const Logger::LogEntry& entry) { *file << render_line(entry) << std::endl; };
}

Logger::LogSink null_sink()
{
    return [](const Logger::LogEntry&) {};
}

}   // namespace sinks

}   // namespace hotline
