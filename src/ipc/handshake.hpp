#pragma once

#include "protocol.hpp"
#include "transport.hpp"

#include <cstdint>
#include <optional>

namespace hotline::ipc
{

// ─── Agent side ──────────────────────────────────────────────────────────────

enum class HandshakeStatus
{
    Accepted,          // versions match, command loop may start
    BadMagic,          // not a protocol peer; nothing was written back
    VersionMismatch,   // our version was written back, connection must close
    StreamError,       // read or write failed
};

struct AgentHandshakeResult
{
    HandshakeStatus status         = HandshakeStatus::StreamError;
    int64_t         magic          = 0;
    int32_t         client_version = 0;
    ReadStatus      read_status    = ReadStatus::Ok;
};

// Reads {magic, client version}. On a good magic the agent's version is
// always written back, even when it differs from the client's.
AgentHandshakeResult accept_handshake(Connection& conn,
                                      WireReader& reader,
                                      int32_t     agent_version = PROTOCOL_VERSION);

// ─── Desktop side ────────────────────────────────────────────────────────────

struct ClientHandshakeResult
{
    bool                   sent = false;     // header reached the socket
    std::optional<int32_t> agent_version;    // set when the reply decoded
    ReadStatus             read_status = ReadStatus::Ok;

    bool ok() const { return sent && agent_version.has_value(); }
};

// Writes {magic, client version} and reads the version the agent replies with.
ClientHandshakeResult initiate_handshake(Connection& conn,
                                         WireReader& reader,
                                         int32_t     client_version = PROTOCOL_VERSION);

}   // namespace hotline::ipc
