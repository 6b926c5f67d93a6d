#pragma once

// In-memory stand-ins for the host runtime, shared by the agent and
// end-to-end tests.
//
// Usage:
//   hotline::test::FakeHost host;
//   host.set_foreground({.id = 1, .name = "MainActivity"});
//   hotline::Agent agent(config, host);
//   ...
//   EXPECT_EQ(host.restart_count(), 1u);

#include <hotline/host.hpp>
#include <hotline/logger.hpp>

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

namespace hotline::test
{

class FakeHost : public HostSurfaceProvider
{
   public:
    void set_foreground(std::optional<SurfaceHandle> surface)
    {
        std::lock_guard lock(mutex_);
        foreground_ = std::move(surface);
    }

    // Makes every host call throw, to exercise per-connection isolation.
    void set_failing(bool failing) { failing_.store(failing); }

    std::optional<SurfaceHandle> current_foreground_surface() override
    {
        if (failing_.load())
            throw std::runtime_error("host unavailable");
        std::lock_guard lock(mutex_);
        return foreground_;
    }

    void restart(const SurfaceHandle& surface) override
    {
        std::lock_guard lock(mutex_);
        restarted_.push_back(surface);
    }

    void show_message(const SurfaceHandle& surface, const std::string& text) override
    {
        std::lock_guard lock(mutex_);
        messages_.emplace_back(surface, text);
    }

    size_t restart_count() const
    {
        std::lock_guard lock(mutex_);
        return restarted_.size();
    }

    std::vector<SurfaceHandle> restarted() const
    {
        std::lock_guard lock(mutex_);
        return restarted_;
    }

    std::vector<std::pair<SurfaceHandle, std::string>> messages() const
    {
        std::lock_guard lock(mutex_);
        return messages_;
    }

   private:
    mutable std::mutex                                 mutex_;
    std::optional<SurfaceHandle>                       foreground_;
    std::atomic<bool>                                  failing_{false};
    std::vector<SurfaceHandle>                         restarted_;
    std::vector<std::pair<SurfaceHandle, std::string>> messages_;
};

class FakeResources : public ResourceFileManager
{
   public:
    explicit FakeResources(bool enabled = true) : enabled_(enabled) {}

    void add_file(const std::string& path, int64_t size, std::vector<uint8_t> checksum)
    {
        std::lock_guard lock(mutex_);
        files_[path] = Entry{size, std::move(checksum)};
    }

    bool extracted_resources_enabled() const override { return enabled_; }

    int64_t file_size(const std::string& path) override
    {
        std::lock_guard lock(mutex_);
        auto            it = files_.find(path);
        return it == files_.end() ? -1 : it->second.size;
    }

    std::optional<std::vector<uint8_t>> checksum(const std::string& path) override
    {
        std::lock_guard lock(mutex_);
        auto            it = files_.find(path);
        if (it == files_.end())
            return std::nullopt;
        return it->second.checksum;
    }

   private:
    struct Entry
    {
        int64_t              size = 0;
        std::vector<uint8_t> checksum;
    };

    bool                            enabled_;
    std::mutex                      mutex_;
    std::map<std::string, Entry>    files_;
};

// Abstract socket name unique to this process and call.
inline std::string unique_socket_name(const std::string& prefix)
{
    static std::atomic<uint32_t> counter{0};
    return "hotline-test-" + prefix + "-" + std::to_string(::getpid()) + "-"
           + std::to_string(counter.fetch_add(1));
}

// Collects log entries for the lifetime of the object. Restores an empty sink
// list and the previous level on destruction.
class LogCapture
{
   public:
    explicit LogCapture(LogLevel level = LogLevel::Trace)
        : previous_level_(Logger::instance().get_level())
    {
        Logger::instance().clear_sinks();
        Logger::instance().set_level(level);
        Logger::instance().add_sink(
            [this](const Logger::LogEntry& entry)
            {
                std::lock_guard lock(mutex_);
                entries_.push_back(entry);
            });
    }

    ~LogCapture()
    {
        Logger::instance().clear_sinks();
        Logger::instance().set_level(previous_level_);
    }

    LogCapture(const LogCapture&)            = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    std::vector<Logger::LogEntry> entries() const
    {
        std::lock_guard lock(mutex_);
        return entries_;
    }

    bool contains(LogLevel level, const std::string& needle) const
    {
        std::lock_guard lock(mutex_);
        for (const auto& e : entries_)
            if (e.level == level && e.message.find(needle) != std::string::npos)
                return true;
        return false;
    }

   private:
    LogLevel                      previous_level_;
    mutable std::mutex            mutex_;
    std::vector<Logger::LogEntry> entries_;
};

}   // namespace hotline::test
