#pragma once

#include <filesystem>
#include <string>

namespace hotline
{

// ─── DeviceChannel ───────────────────────────────────────────────────────────
// A connected stream socket to an agent, as produced by a DeviceTransport.
// Owns the fd: move-only, closed on destruction unless released. A transport
// that tunnels to a real device builds one from whatever socket its
// forwarding layer hands out.

class DeviceChannel
{
   public:
    DeviceChannel() = default;
    explicit DeviceChannel(int fd) : fd_(fd) {}
    ~DeviceChannel();

    DeviceChannel(const DeviceChannel&)            = delete;
    DeviceChannel& operator=(const DeviceChannel&) = delete;
    DeviceChannel(DeviceChannel&& other) noexcept;
    DeviceChannel& operator=(DeviceChannel&& other) noexcept;

    bool is_open() const { return fd_ >= 0; }
    int  fd() const { return fd_; }

    // Hands the fd to the caller; the channel is left closed.
    int release();

   private:
    int fd_ = -1;
};

// The desktop's view of a device: a way to reach the agent's command channel
// and to move files on and off the device. Every operation throws
// TransportError on failure.
class DeviceTransport
{
   public:
    virtual ~DeviceTransport() = default;

    // Open a stream to the agent listening under `app_id`. Returning a
    // closed channel is treated as TransportFailure::Unreachable.
    virtual DeviceChannel open_channel(const std::string& app_id) = 0;

    virtual void push_file(const std::filesystem::path& local, const std::string& remote) = 0;

    // A remote file that does not exist fails with TransportFailure::Sync.
    virtual void pull_file(const std::string& remote, const std::filesystem::path& local) = 0;
};

// ─── LocalDeviceTransport ────────────────────────────────────────────────────
// "Device" is this machine. Channels go straight to the abstract local socket
// named by the application id; device paths are resolved under `device_root`,
// so "/data/local/tmp/x" lands at "<device_root>/data/local/tmp/x".

class LocalDeviceTransport : public DeviceTransport
{
   public:
    explicit LocalDeviceTransport(std::filesystem::path device_root);

    DeviceChannel open_channel(const std::string& app_id) override;
    void push_file(const std::filesystem::path& local, const std::string& remote) override;
    void pull_file(const std::string& remote, const std::filesystem::path& local) override;

    // Host location backing a device path.
    std::filesystem::path resolve(const std::string& remote) const;

    const std::filesystem::path& device_root() const { return root_; }

   private:
    std::filesystem::path root_;
};

}   // namespace hotline
