#pragma once

#include "../ipc/protocol.hpp"
#include "../ipc/transport.hpp"
#include "../ipc/wire.hpp"

#include <hotline/config.hpp>
#include <hotline/device.hpp>
#include <hotline/error.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace hotline::client
{

// ─── Channel ─────────────────────────────────────────────────────────────────
// A handshaken connection handed to a communicator. Every read and write
// either succeeds or throws; a communicator never sees a partial value.
// When the agent announced a different version, a failure is reported as
// ProtocolMismatch: a skewed agent closes right after the handshake.

class Channel
{
   public:
    Channel(ipc::Connection& conn, int32_t agent_version, int32_t client_version);

    Channel(const Channel&)            = delete;
    Channel& operator=(const Channel&) = delete;

    void send(const ipc::WireWriter& writer);

    bool                 read_bool();
    int32_t              read_i32();
    int64_t              read_i64();
    std::string          read_utf();
    std::vector<uint8_t> read_block();

    // Version the agent announced during the handshake.
    int32_t agent_version() const { return agent_version_; }
    bool    skewed() const { return agent_version_ != client_version_; }

    void set_receive_timeout(std::chrono::milliseconds timeout);

   private:
    template <typename T>
    T require(std::optional<T> value, const char* what);

    [[noreturn]] void fail_read(const char* what) const;
    [[noreturn]] void throw_skew(const std::string& during) const;

    ipc::Connection& conn_;
    ipc::WireReader  reader_;
    int32_t          agent_version_;
    int32_t          client_version_;
};

// Converts a failed read into the exception the desktop API documents.
[[noreturn]] void throw_read_failure(ipc::ReadStatus status, const std::string& what);

template <typename T>
T Channel::require(std::optional<T> value, const char* what)
{
    if (!value)
        fail_read(what);
    return std::move(*value);
}

// ─── Invoker ─────────────────────────────────────────────────────────────────
// One operation per connection: open, handshake, run the communicator, send
// the EOF marker, close. No retries, no state carried between calls.

class Invoker
{
   public:
    Invoker(DeviceTransport& transport, InvokerConfig config);

    // Runs `communicator(Channel&)` on a fresh connection and returns its
    // result. Throws TransportError or ProtocolError; the connection is
    // closed on every path.
    template <typename Communicator>
    auto invoke(Communicator&& communicator) -> std::invoke_result_t<Communicator, Channel&>;

    const InvokerConfig& config() const { return config_; }

   private:
    // Opens the channel and completes the handshake, applying the
    // configured VersionPolicy. Returns the agent's version.
    int32_t connect(std::unique_ptr<ipc::Connection>& out);

    // Best effort: the command has already been delivered.
    void finish(ipc::Connection& conn);

    DeviceTransport& transport_;
    InvokerConfig    config_;
};

template <typename Communicator>
auto Invoker::invoke(Communicator&& communicator) -> std::invoke_result_t<Communicator, Channel&>
{
    std::unique_ptr<ipc::Connection> conn;
    int32_t                          agent_version = connect(conn);

    Channel channel(*conn, agent_version, config_.protocol_version);
    channel.set_receive_timeout(config_.command_timeout);

    if constexpr (std::is_void_v<std::invoke_result_t<Communicator, Channel&>>)
    {
        std::forward<Communicator>(communicator)(channel);
        finish(*conn);
    }
    else
    {
        auto result = std::forward<Communicator>(communicator)(channel);
        finish(*conn);
        return result;
    }
}

}   // namespace hotline::client
