#pragma once

#include <hotline/config.hpp>
#include <hotline/device.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hotline
{

enum class AppState
{
    Foreground,   // agent reachable and a surface is in the foreground
    Background,   // agent reachable, nothing in the foreground
};

const char* to_string(AppState state);

// Desktop-side entry point. Each call opens its own connection to the agent
// and throws TransportError / ProtocolError on failure.
class InstantClient
{
   public:
    // `transport` must outlive the client.
    InstantClient(DeviceTransport& transport, InvokerConfig config);

    AppState get_app_state();

    void show_toast(const std::string& message);

    // Pings first; sends the token-bearing restart only if the agent answered.
    void restart_activity();

    // Size of the file behind `path` on the device; zero or negative when
    // absent. Only served by agents running with extracted resources.
    int64_t path_exists(const std::string& path);

    // std::nullopt when the device has no such file.
    std::optional<std::vector<uint8_t>> path_checksum(const std::string& path);

    const InvokerConfig& config() const { return config_; }

   private:
    DeviceTransport& transport_;
    InvokerConfig    config_;
};

}   // namespace hotline
