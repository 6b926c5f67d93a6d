#pragma once

#include "../ipc/protocol.hpp"
#include "../ipc/transport.hpp"
#include "authenticator.hpp"

#include <hotline/host.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>

namespace hotline::agent
{

// AwaitingHeader → Handshaking → CommandLoop → Closed
enum class SessionState
{
    AwaitingHeader,
    Handshaking,
    CommandLoop,
    Closed,
};

// Why a session reached Closed.
enum class SessionOutcome
{
    EndOfStream,            // client sent the EOF command
    PeerClosed,             // stream ended cleanly between commands
    BadMagic,               // not a protocol peer, nothing written back
    VersionMismatch,        // our version was written back, then closed
    StreamError,            // truncated or malformed input
    AuthenticationFailed,   // wrong token on a privileged command
    UnknownCommand,         // unrecognized command code
    UnexpectedCommand,      // recognized but not served in this configuration
    WriteFailed,            // response could not be written
    HostError,              // a host capability threw
};

const char* to_string(SessionOutcome outcome);

struct SessionContext
{
    HostSurfaceProvider& host;
    ResourceFileManager* resources = nullptr;   // null: extracted-resources mode off
    Authenticator&       auth;
    int32_t              protocol_version = ipc::PROTOCOL_VERSION;
};

// Serves one accepted connection: handshake, then one command at a time
// until EOF, end of stream, or an input it cannot safely skip. Never throws.
class CommandSession
{
   public:
    CommandSession(ipc::Connection& conn, SessionContext ctx);

    CommandSession(const CommandSession&)            = delete;
    CommandSession& operator=(const CommandSession&) = delete;

    SessionOutcome run();

    SessionState state() const { return state_; }
    size_t       commands_handled() const { return commands_handled_; }

   private:
    // std::nullopt keeps the loop going; a value ends the session.
    using Step = std::optional<SessionOutcome>;

    SessionOutcome loop();
    Step           dispatch(ipc::CommandCode code);

    Step on_ping();
    Step on_path_exists();
    Step on_path_checksum();
    Step on_restart_activity();
    Step on_show_toast();

    bool           resources_enabled() const;
    Step           reply(const ipc::WireWriter& writer);
    SessionOutcome stream_failure() const;

    ipc::Connection& conn_;
    SessionContext   ctx_;
    ipc::WireReader  reader_;
    SessionState     state_            = SessionState::AwaitingHeader;
    size_t           commands_handled_ = 0;
};

}   // namespace hotline::agent
