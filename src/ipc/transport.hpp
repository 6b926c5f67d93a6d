#pragma once

#include "wire.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <utility>

namespace hotline::ipc
{

// Where a local socket name lives. The hosting runtime's local server sockets
// use the Linux abstract namespace, so that is the default.
enum class SocketNamespace
{
    Abstract,     // "@name", no filesystem entry
    Filesystem,   // a socket file at a path
};

// ─── Connection ──────────────────────────────────────────────────────────────
// Owns a connected stream socket. Move-only; the fd is closed on destruction.
// Driven by one thread at a time; shutdown() may be called from another.

class Connection : public ByteSource
{
   public:
    explicit Connection(int fd);
    ~Connection() override;

    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;
    Connection(Connection&& other) noexcept;
    Connection& operator=(Connection&& other) noexcept;

    // Two connected ends of an anonymous socketpair. Both null on failure.
    static std::pair<std::unique_ptr<Connection>, std::unique_ptr<Connection>> pair();

    bool is_open() const { return fd_ >= 0; }
    int  fd() const { return fd_; }

    // Blocking read of exactly `len` bytes.
    ReadStatus read_exact(uint8_t* buf, size_t len) override;

    // Blocking write of all bytes. Returns false on error or closed peer.
    bool write_all(std::span<const uint8_t> bytes);
    bool send(const WireWriter& writer) { return write_all(writer.data()); }

    // Receive timeout for subsequent reads; zero means block forever.
    bool set_receive_timeout(std::chrono::milliseconds timeout);

    // Drops whatever the peer has already queued, without blocking. Closing
    // with unread bytes makes the peer's next read fail with ECONNRESET
    // instead of seeing a clean end-of-stream.
    size_t discard_pending();

    // Gives up ownership of the fd.
    int release();

    // Half-close: the peer sees end-of-stream, reads stay possible.
    void shutdown_write();

    // Both directions. Wakes a thread blocked reading this connection; the
    // fd stays allocated until close().
    void shutdown();

    void close();

   private:
    int fd_ = -1;
};

// ─── Server ──────────────────────────────────────────────────────────────────
// Listens on a local stream socket and hands out accepted connections.

class Server
{
   public:
    Server();
    ~Server();

    Server(const Server&)            = delete;
    Server& operator=(const Server&) = delete;

    // Bind and listen. In the filesystem namespace a stale socket file is
    // removed first. Returns false on failure (errno preserved).
    bool listen(const std::string& name,
                SocketNamespace    ns      = SocketNamespace::Abstract,
                int                backlog = 8);

    // Accept a new connection (blocking). Returns nullptr once the server is
    // shut down or closed, or on an accept error.
    std::unique_ptr<Connection> accept();

    // Wake any thread blocked in accept() and refuse further connections.
    // Safe to call from another thread and more than once; the fd stays
    // allocated until close().
    void shutdown();

    // Close the listening socket (and remove the socket file, if any).
    void close();

    bool is_listening() const { return listen_fd_ >= 0 && !shut_down_.load(); }
    int                listen_fd() const { return listen_fd_; }
    const std::string& name() const { return name_; }

   private:
    int               listen_fd_ = -1;
    std::atomic<bool> shut_down_{false};
    std::string     name_;
    SocketNamespace ns_ = SocketNamespace::Abstract;
};

// ─── Client ──────────────────────────────────────────────────────────────────

class Client
{
   public:
    // Connect to a local server. Returns nullptr on failure; the errno of the
    // failing call is stored in `error` when given.
    static std::unique_ptr<Connection> connect(const std::string& name,
                                               SocketNamespace    ns    = SocketNamespace::Abstract,
                                               int*               error = nullptr);
};

}   // namespace hotline::ipc
