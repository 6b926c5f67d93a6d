#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hotline
{

// Opaque reference to a UI surface (an activity) of the hosting process.
struct SurfaceHandle
{
    uint64_t    id = 0;
    std::string name;

    bool operator==(const SurfaceHandle&) const = default;
};

// Host-runtime capabilities the agent acts on. Every method may be called
// concurrently from different connection workers.
class HostSurfaceProvider
{
   public:
    virtual ~HostSurfaceProvider() = default;

    // The surface currently in the foreground, if the process has one.
    virtual std::optional<SurfaceHandle> current_foreground_surface() = 0;

    // Restart the given surface (schedules onto the UI thread as needed).
    virtual void restart(const SurfaceHandle& surface) = 0;

    // Show a short transient message on the given surface.
    virtual void show_message(const SurfaceHandle& surface, const std::string& text) = 0;
};

// On-device resource file queries. Only consulted when extracted-resources
// mode is enabled.
class ResourceFileManager
{
   public:
    virtual ~ResourceFileManager() = default;

    virtual bool extracted_resources_enabled() const = 0;

    // Size in bytes of the file at `path`; zero or negative when absent.
    virtual int64_t file_size(const std::string& path) = 0;

    // Checksum bytes of the file at `path`, std::nullopt when absent.
    virtual std::optional<std::vector<uint8_t>> checksum(const std::string& path) = 0;
};

}   // namespace hotline
