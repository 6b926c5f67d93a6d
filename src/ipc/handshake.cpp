#include "handshake.hpp"

namespace hotline::ipc
{

AgentHandshakeResult accept_handshake(Connection& conn, WireReader& reader, int32_t agent_version)
{
    AgentHandshakeResult result;

    auto magic = reader.read_i64();
    if (!magic)
    {
        result.read_status = reader.status();
        return result;
    }
    result.magic = *magic;
    if (*magic != PROTOCOL_IDENTIFIER)
    {
        // No reply. The rest of the stray header is dropped so the peer
        // sees a clean close rather than a reset.
        conn.discard_pending();
        result.status = HandshakeStatus::BadMagic;
        return result;
    }

    auto version = reader.read_i32();
    if (!version)
    {
        result.read_status = reader.status();
        return result;
    }
    result.client_version = *version;

    // Reply before judging, so an older or newer client can see the skew.
    WireWriter reply;
    reply.put_i32(agent_version);
    if (!conn.send(reply))
        return result;

    result.status = (*version == agent_version) ? HandshakeStatus::Accepted
                                                : HandshakeStatus::VersionMismatch;
    return result;
}

ClientHandshakeResult initiate_handshake(Connection& conn, WireReader& reader, int32_t client_version)
{
    ClientHandshakeResult result;

    WireWriter header;
    header.put_i64(PROTOCOL_IDENTIFIER);
    header.put_i32(client_version);
    result.sent = conn.send(header);
    if (!result.sent)
        return result;

    result.agent_version = reader.read_i32();
    result.read_status   = reader.status();
    return result;
}

}   // namespace hotline::ipc
