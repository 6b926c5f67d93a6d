#include "command_session.hpp"

#include "../ipc/handshake.hpp"

#include <hotline/logger.hpp>

#include <chrono>
#include <exception>
#include <iomanip>
#include <sstream>

namespace hotline::agent
{

namespace
{

std::string to_hex(const std::vector<uint8_t>& bytes)
{
    std::ostringstream os;
    os << std::hex << std::setfill('0');
    for (auto b : bytes)
        os << std::setw(2) << static_cast<int>(b);
    return os.str();
}

}   // namespace

const char* to_string(SessionOutcome outcome)
{
    switch (outcome)
    {
        case SessionOutcome::EndOfStream:
            return "end of stream";
        case SessionOutcome::PeerClosed:
            return "peer closed";
        case SessionOutcome::BadMagic:
            return "bad magic";
        case SessionOutcome::VersionMismatch:
            return "version mismatch";
        case SessionOutcome::StreamError:
            return "stream error";
        case SessionOutcome::AuthenticationFailed:
            return "authentication failed";
        case SessionOutcome::UnknownCommand:
            return "unknown command";
        case SessionOutcome::UnexpectedCommand:
            return "unexpected command";
        case SessionOutcome::WriteFailed:
            return "write failed";
        case SessionOutcome::HostError:
            return "host error";
    }
    return "unknown";
}

CommandSession::CommandSession(ipc::Connection& conn, SessionContext ctx)
    : conn_(conn), ctx_(ctx), reader_(conn)
{
}

SessionOutcome CommandSession::run()
{
    state_ = SessionState::Handshaking;
    auto hs = ipc::accept_handshake(conn_, reader_, ctx_.protocol_version);

    switch (hs.status)
    {
        case ipc::HandshakeStatus::Accepted:
            break;
        case ipc::HandshakeStatus::BadMagic:
            HOTLINE_LOG_WARN("session", "Unrecognized header format {}", hs.magic);
            state_ = SessionState::Closed;
            return SessionOutcome::BadMagic;
        case ipc::HandshakeStatus::VersionMismatch:
            HOTLINE_LOG_WARN("session",
                             "Mismatched protocol versions; agent is using version {} and "
                             "tool is using version {}",
                             ctx_.protocol_version,
                             hs.client_version);
            state_ = SessionState::Closed;
            return SessionOutcome::VersionMismatch;
        case ipc::HandshakeStatus::StreamError:
            HOTLINE_LOG_DEBUG("session", "Handshake failed: {}", ipc::to_string(hs.read_status));
            state_ = SessionState::Closed;
            return hs.read_status == ipc::ReadStatus::Ok ? SessionOutcome::WriteFailed
                                                         : SessionOutcome::StreamError;
    }

    state_       = SessionState::CommandLoop;
    auto outcome = loop();
    state_       = SessionState::Closed;
    return outcome;
}

SessionOutcome CommandSession::loop()
{
    while (true)
    {
        auto raw = reader_.read_i32();
        if (!raw)
        {
            if (reader_.status() == ipc::ReadStatus::Closed)
                return SessionOutcome::PeerClosed;
            return stream_failure();
        }

        auto code = ipc::decode_command(*raw);
        if (!code)
        {
            // The payload length of an unknown command cannot be known;
            // reading on would misread its bytes as further commands.
            HOTLINE_LOG_ERROR("session", "Unexpected message type: {}", *raw);
            return SessionOutcome::UnknownCommand;
        }

        Step step;
        try
        {
            step = dispatch(*code);
        }
        catch (const std::exception& e)
        {
            HOTLINE_LOG_ERROR(
                "session", "Host failed while handling {}: {}", ipc::command_name(*code), e.what());
            return SessionOutcome::HostError;
        }

        if (step)
            return *step;
        ++commands_handled_;
    }
}

CommandSession::Step CommandSession::dispatch(ipc::CommandCode code)
{
    switch (code)
    {
        case ipc::CommandCode::Eof:
            HOTLINE_LOG_DEBUG("session", "Received EOF from the tool");
            return SessionOutcome::EndOfStream;
        case ipc::CommandCode::Ping:
            return on_ping();
        case ipc::CommandCode::PathExists:
            return on_path_exists();
        case ipc::CommandCode::PathChecksum:
            return on_path_checksum();
        case ipc::CommandCode::RestartActivity:
            return on_restart_activity();
        case ipc::CommandCode::ShowToast:
            return on_show_toast();
    }
    return SessionOutcome::UnknownCommand;
}

// ─── Handlers ────────────────────────────────────────────────────────────────

CommandSession::Step CommandSession::on_ping()
{
    bool active = ctx_.host.current_foreground_surface().has_value();

    ipc::WireWriter out;
    out.put_bool(active);
    HOTLINE_LOG_DEBUG("session", "Received ping; returned active = {}", active);
    return reply(out);
}

CommandSession::Step CommandSession::on_path_exists()
{
    if (!resources_enabled())
    {
        HOTLINE_LOG_ERROR("session", "Unexpected message type: {}",
                          static_cast<int32_t>(ipc::CommandCode::PathExists));
        return SessionOutcome::UnexpectedCommand;
    }

    auto path = reader_.read_utf();
    if (!path)
        return stream_failure();

    int64_t size = ctx_.resources->file_size(*path);

    ipc::WireWriter out;
    out.put_i64(size);
    HOTLINE_LOG_DEBUG("session", "Received path-exists({}); returned size={}", *path, size);
    return reply(out);
}

CommandSession::Step CommandSession::on_path_checksum()
{
    if (!resources_enabled())
    {
        HOTLINE_LOG_ERROR("session", "Unexpected message type: {}",
                          static_cast<int32_t>(ipc::CommandCode::PathChecksum));
        return SessionOutcome::UnexpectedCommand;
    }

    auto begin = std::chrono::steady_clock::now();
    auto path  = reader_.read_utf();
    if (!path)
        return stream_failure();

    auto checksum = ctx_.resources->checksum(*path);

    ipc::WireWriter out;
    if (checksum && !checksum->empty())
    {
        out.put_block(*checksum);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::steady_clock::now() - begin)
                      .count();
        HOTLINE_LOG_DEBUG(
            "session", "Checksum of {} took {}ms to compute: {}", *path, ms, to_hex(*checksum));
    }
    else
    {
        out.put_i32(0);
        HOTLINE_LOG_DEBUG("session", "Checksum of {}: not found", *path);
    }
    return reply(out);
}

CommandSession::Step CommandSession::on_restart_activity()
{
    switch (ctx_.auth.authenticate(reader_))
    {
        case AuthResult::Granted:
            break;
        case AuthResult::Denied:
            return SessionOutcome::AuthenticationFailed;
        case AuthResult::StreamError:
            return stream_failure();
    }

    if (auto surface = ctx_.host.current_foreground_surface())
    {
        HOTLINE_LOG_DEBUG("session", "Restarting {} per user request", surface->name);
        ctx_.host.restart(*surface);
    }
    else
    {
        HOTLINE_LOG_DEBUG("session", "No foreground surface to restart");
    }
    return std::nullopt;
}

CommandSession::Step CommandSession::on_show_toast()
{
    auto text = reader_.read_utf();
    if (!text)
        return stream_failure();

    if (auto surface = ctx_.host.current_foreground_surface())
        ctx_.host.show_message(*surface, *text);
    else
        HOTLINE_LOG_DEBUG("session", "Couldn't show toast (no activity): {}", *text);
    return std::nullopt;
}

// ─── Helpers ─────────────────────────────────────────────────────────────────

bool CommandSession::resources_enabled() const
{
    return ctx_.resources != nullptr && ctx_.resources->extracted_resources_enabled();
}

CommandSession::Step CommandSession::reply(const ipc::WireWriter& writer)
{
    if (conn_.send(writer))
        return std::nullopt;
    HOTLINE_LOG_DEBUG("session", "Failed to write response");
    return SessionOutcome::WriteFailed;
}

SessionOutcome CommandSession::stream_failure() const
{
    HOTLINE_LOG_WARN("session", "Dropping connection: {}", ipc::to_string(reader_.status()));
    return SessionOutcome::StreamError;
}

}   // namespace hotline::agent
