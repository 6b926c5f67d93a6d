#include "invoker.hpp"

#include "../ipc/handshake.hpp"

#include <hotline/logger.hpp>

namespace hotline::client
{

void throw_read_failure(ipc::ReadStatus status, const std::string& what)
{
    switch (status)
    {
        case ipc::ReadStatus::TimedOut:
            throw TransportError(TransportFailure::Timeout, "timed out waiting for " + what);
        case ipc::ReadStatus::IoError:
            throw TransportError(TransportFailure::Rejected, "I/O error reading " + what);
        case ipc::ReadStatus::Ok:
        case ipc::ReadStatus::Closed:
        case ipc::ReadStatus::Truncated:
        case ipc::ReadStatus::Malformed:
            break;
    }
    throw ProtocolError(ErrorCode::TruncatedStream,
                        "reading " + what + ": " + ipc::to_string(status));
}

// ─── Channel ─────────────────────────────────────────────────────────────────

Channel::Channel(ipc::Connection& conn, int32_t agent_version, int32_t client_version)
    : conn_(conn), reader_(conn), agent_version_(agent_version), client_version_(client_version)
{
}

void Channel::send(const ipc::WireWriter& writer)
{
    if (conn_.send(writer))
        return;
    if (skewed())
        throw_skew("sending the command");
    throw TransportError(TransportFailure::Rejected, "agent closed the command channel");
}

bool Channel::read_bool()
{
    return require(reader_.read_bool(), "bool");
}

int32_t Channel::read_i32()
{
    return require(reader_.read_i32(), "int32");
}

int64_t Channel::read_i64()
{
    return require(reader_.read_i64(), "int64");
}

std::string Channel::read_utf()
{
    return require(reader_.read_utf(), "utf string");
}

std::vector<uint8_t> Channel::read_block()
{
    return require(reader_.read_block(), "byte block");
}

void Channel::set_receive_timeout(std::chrono::milliseconds timeout)
{
    if (!conn_.set_receive_timeout(timeout))
        HOTLINE_LOG_WARN("invoker", "Could not set receive timeout of {}ms", timeout.count());
}

void Channel::fail_read(const char* what) const
{
    if (skewed())
        throw_skew(std::string("reading ") + what);
    throw_read_failure(reader_.status(), what);
}

void Channel::throw_skew(const std::string& during) const
{
    throw ProtocolError(ErrorCode::ProtocolMismatch,
                        "agent speaks protocol " + std::to_string(agent_version_)
                            + ", client speaks " + std::to_string(client_version_)
                            + "; connection lost while " + during);
}

// ─── Invoker ─────────────────────────────────────────────────────────────────

Invoker::Invoker(DeviceTransport& transport, InvokerConfig config)
    : transport_(transport), config_(std::move(config))
{
    if (config_.protocol_version == 0)
        config_.protocol_version = ipc::PROTOCOL_VERSION;
}

int32_t Invoker::connect(std::unique_ptr<ipc::Connection>& out)
{
    DeviceChannel channel = transport_.open_channel(config_.app_id);
    if (!channel.is_open())
        throw TransportError(TransportFailure::Unreachable,
                             "no command channel for " + config_.app_id);
    out = std::make_unique<ipc::Connection>(channel.release());

    if (!out->set_receive_timeout(config_.handshake_timeout))
        HOTLINE_LOG_WARN("invoker", "Could not set handshake timeout");

    ipc::WireReader reader(*out);
    auto            hs = ipc::initiate_handshake(*out, reader, config_.protocol_version);
    if (!hs.sent)
        throw TransportError(TransportFailure::Rejected,
                             "agent for " + config_.app_id + " refused the protocol header");
    if (!hs.agent_version)
    {
        if (hs.read_status == ipc::ReadStatus::TimedOut)
            throw_read_failure(hs.read_status, "protocol version from " + config_.app_id);
        // The agent reached us and then hung up, cleanly or with a reset:
        // it did not accept our header.
        throw ProtocolError(ErrorCode::TruncatedStream,
                            "agent for " + config_.app_id + " closed during the handshake ("
                                + ipc::to_string(hs.read_status) + ")");
    }

    int32_t agent_version = *hs.agent_version;
    if (agent_version != config_.protocol_version)
    {
        if (config_.version_policy == VersionPolicy::Strict)
        {
            throw ProtocolError(ErrorCode::ProtocolMismatch,
                                "agent speaks protocol " + std::to_string(agent_version)
                                    + ", client speaks " + std::to_string(config_.protocol_version));
        }
        HOTLINE_LOG_WARN("invoker",
                         "Agent protocol version {} differs from ours ({}); sending anyway",
                         agent_version,
                         config_.protocol_version);
    }
    return agent_version;
}

void Invoker::finish(ipc::Connection& conn)
{
    ipc::WireWriter eof;
    eof.put_i32(static_cast<int32_t>(ipc::CommandCode::Eof));
    if (!conn.send(eof))
        HOTLINE_LOG_DEBUG("invoker", "Agent closed before the EOF marker");
    conn.close();
}

}   // namespace hotline::client
