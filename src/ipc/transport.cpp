#include "transport.hpp"

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <string>

#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

namespace hotline::ipc
{

namespace
{

// Fills `addr` for `name`; returns the address length to pass to bind/connect,
// or 0 if the name does not fit.
socklen_t make_address(const std::string& name, SocketNamespace ns, struct sockaddr_un& addr)
{
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;

    if (ns == SocketNamespace::Abstract)
    {
        // Leading NUL byte, then the name without terminator.
        if (name.empty() || name.size() + 1 > sizeof(addr.sun_path))
            return 0;
        std::memcpy(addr.sun_path + 1, name.data(), name.size());
        return static_cast<socklen_t>(offsetof(struct sockaddr_un, sun_path) + 1 + name.size());
    }

    if (name.empty() || name.size() >= sizeof(addr.sun_path))
        return 0;
    std::memcpy(addr.sun_path, name.data(), name.size());
    return static_cast<socklen_t>(sizeof(addr));
}

}   // namespace

// ─── Connection ──────────────────────────────────────────────────────────────

Connection::Connection(int fd) : fd_(fd) {}

Connection::~Connection()
{
    close();
}

Connection::Connection(Connection&& other) noexcept : fd_(other.fd_)
{
    other.fd_ = -1;
}

Connection& Connection::operator=(Connection&& other) noexcept
{
    if (this != &other)
    {
        close();
        fd_       = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

std::pair<std::unique_ptr<Connection>, std::unique_ptr<Connection>> Connection::pair()
{
    int fds[2] = {-1, -1};
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) < 0)
        return {nullptr, nullptr};
    return {std::make_unique<Connection>(fds[0]), std::make_unique<Connection>(fds[1])};
}

ReadStatus Connection::read_exact(uint8_t* buf, size_t len)
{
    if (fd_ < 0)
        return ReadStatus::IoError;

    size_t total = 0;
    while (total < len)
    {
        auto n = ::recv(fd_, buf + total, len - total, 0);
        if (n == 0)
            return total == 0 ? ReadStatus::Closed : ReadStatus::Truncated;
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK)
                return ReadStatus::TimedOut;
            return ReadStatus::IoError;
        }
        total += static_cast<size_t>(n);
    }
    return ReadStatus::Ok;
}

bool Connection::write_all(std::span<const uint8_t> bytes)
{
    if (fd_ < 0)
        return false;

    size_t total = 0;
    while (total < bytes.size())
    {
        auto n = ::send(fd_, bytes.data() + total, bytes.size() - total, MSG_NOSIGNAL);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            return false;
        }
        if (n == 0)
            return false;
        total += static_cast<size_t>(n);
    }
    return true;
}

bool Connection::set_receive_timeout(std::chrono::milliseconds timeout)
{
    if (fd_ < 0)
        return false;

    struct timeval tv
    {
    };
    tv.tv_sec  = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    return ::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0;
}

size_t Connection::discard_pending()
{
    if (fd_ < 0)
        return 0;

    size_t  discarded = 0;
    uint8_t scratch[256];
    for (;;)
    {
        auto n = ::recv(fd_, scratch, sizeof(scratch), MSG_DONTWAIT);
        if (n > 0)
        {
            discarded += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR)
            continue;
        return discarded;
    }
}

int Connection::release()
{
    int fd = fd_;
    fd_    = -1;
    return fd;
}

void Connection::shutdown_write()
{
    if (fd_ >= 0)
        ::shutdown(fd_, SHUT_WR);
}

void Connection::shutdown()
{
    if (fd_ >= 0)
        ::shutdown(fd_, SHUT_RDWR);
}

void Connection::close()
{
    if (fd_ >= 0)
    {
        ::close(fd_);
        fd_ = -1;
    }
}

// ─── Server ──────────────────────────────────────────────────────────────────

Server::Server() = default;

Server::~Server()
{
    close();
}

bool Server::listen(const std::string& name, SocketNamespace ns, int backlog)
{
    struct sockaddr_un addr;
    socklen_t          addr_len = make_address(name, ns, addr);
    if (addr_len == 0)
    {
        errno = ENAMETOOLONG;
        return false;
    }

    if (ns == SocketNamespace::Filesystem)
        ::unlink(name.c_str());

    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0)
        return false;

    if (::bind(fd, reinterpret_cast<struct sockaddr*>(&addr), addr_len) < 0)
    {
        int saved = errno;
        ::close(fd);
        errno = saved;
        return false;
    }

    if (ns == SocketNamespace::Filesystem)
        ::chmod(name.c_str(), 0700);

    if (::listen(fd, backlog) < 0)
    {
        int saved = errno;
        ::close(fd);
        if (ns == SocketNamespace::Filesystem)
            ::unlink(name.c_str());
        errno = saved;
        return false;
    }

    listen_fd_ = fd;
    name_      = name;
    ns_        = ns;
    shut_down_.store(false);
    return true;
}

std::unique_ptr<Connection> Server::accept()
{
    while (listen_fd_ >= 0 && !shut_down_.load())
    {
        int client_fd = ::accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (client_fd >= 0)
        {
            if (shut_down_.load())
            {
                ::close(client_fd);
                return nullptr;
            }
            return std::make_unique<Connection>(client_fd);
        }
        if (errno != EINTR && errno != ECONNABORTED)
            return nullptr;
    }
    return nullptr;
}

void Server::shutdown()
{
    if (shut_down_.exchange(true))
        return;
    if (listen_fd_ >= 0)
        ::shutdown(listen_fd_, SHUT_RDWR);
}

void Server::close()
{
    shut_down_.store(true);
    if (listen_fd_ >= 0)
    {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
    if (ns_ == SocketNamespace::Filesystem && !name_.empty())
        ::unlink(name_.c_str());
    name_.clear();
}

// ─── Client ──────────────────────────────────────────────────────────────────

std::unique_ptr<Connection> Client::connect(const std::string& name, SocketNamespace ns, int* error)
{
    struct sockaddr_un addr;
    socklen_t          addr_len = make_address(name, ns, addr);
    if (addr_len == 0)
    {
        if (error)
            *error = ENAMETOOLONG;
        return nullptr;
    }

    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0)
    {
        if (error)
            *error = errno;
        return nullptr;
    }

    if (::connect(fd, reinterpret_cast<struct sockaddr*>(&addr), addr_len) < 0)
    {
        if (error)
            *error = errno;
        ::close(fd);
        return nullptr;
    }

    return std::make_unique<Connection>(fd);
}

}   // namespace hotline::ipc
