#include <hotline/device.hpp>
#include <hotline/error.hpp>
#include <hotline/logger.hpp>

#include "../ipc/transport.hpp"

#include <cerrno>
#include <cstring>
#include <system_error>

#include <unistd.h>

namespace hotline
{

namespace fs = std::filesystem;

// ─── DeviceChannel ───────────────────────────────────────────────────────────

DeviceChannel::~DeviceChannel()
{
    if (fd_ >= 0)
        ::close(fd_);
}

DeviceChannel::DeviceChannel(DeviceChannel&& other) noexcept : fd_(other.release()) {}

DeviceChannel& DeviceChannel::operator=(DeviceChannel&& other) noexcept
{
    if (this != &other)
    {
        if (fd_ >= 0)
            ::close(fd_);
        fd_ = other.release();
    }
    return *this;
}

int DeviceChannel::release()
{
    int fd = fd_;
    fd_    = -1;
    return fd;
}

// ─── LocalDeviceTransport ────────────────────────────────────────────────────

LocalDeviceTransport::LocalDeviceTransport(fs::path device_root) : root_(std::move(device_root))
{
}

fs::path LocalDeviceTransport::resolve(const std::string& remote) const
{
    return root_ / fs::path(remote).relative_path();
}

DeviceChannel LocalDeviceTransport::open_channel(const std::string& app_id)
{
    int  error = 0;
    auto conn  = ipc::Client::connect(app_id, ipc::SocketNamespace::Abstract, &error);
    if (conn)
        return DeviceChannel(conn->release());

    HOTLINE_LOG_DEBUG("transport", "connect(@{}) failed: {}", app_id, std::strerror(error));
    switch (error)
    {
        case EAGAIN:
            throw TransportError(TransportFailure::Rejected,
                                 "agent @" + app_id + " is not accepting connections");
        case ETIMEDOUT:
            throw TransportError(TransportFailure::Timeout, "connecting to @" + app_id);
        default:
            throw TransportError(TransportFailure::Unreachable,
                                 "no agent listening at @" + app_id + " (" + std::strerror(error)
                                     + ")");
    }
}

void LocalDeviceTransport::push_file(const fs::path& local, const std::string& remote)
{
    auto            target = resolve(remote);
    std::error_code ec;

    fs::create_directories(target.parent_path(), ec);
    if (ec)
        throw TransportError(TransportFailure::Sync,
                             "cannot create " + target.parent_path().string() + ": "
                                 + ec.message());

    fs::copy_file(local, target, fs::copy_options::overwrite_existing, ec);
    if (ec)
        throw TransportError(TransportFailure::Sync,
                             "push " + local.string() + " -> " + remote + ": " + ec.message());

    HOTLINE_LOG_DEBUG("transport", "pushed {} -> {}", local.string(), remote);
}

void LocalDeviceTransport::pull_file(const std::string& remote, const fs::path& local)
{
    auto            source = resolve(remote);
    std::error_code ec;

    if (!fs::is_regular_file(source, ec))
        throw TransportError(TransportFailure::Sync, "remote object '" + remote + "' does not exist");

    fs::copy_file(source, local, fs::copy_options::overwrite_existing, ec);
    if (ec)
        throw TransportError(TransportFailure::Sync,
                             "pull " + remote + " -> " + local.string() + ": " + ec.message());

    HOTLINE_LOG_DEBUG("transport", "pulled {} -> {}", remote, local.string());
}

}   // namespace hotline
