#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace hotline::ipc
{

// ─── Handshake ───────────────────────────────────────────────────────────────
// Wire layout (big-endian):
//   client -> agent: int64 magic, int32 client_version
//   agent  -> client: int32 agent_version     (sent even on mismatch)

static constexpr int64_t PROTOCOL_IDENTIFIER = 0x35107124LL;
static constexpr int32_t PROTOCOL_VERSION    = 4;

// ─── Command codes ───────────────────────────────────────────────────────────
// Each command is an int32 code followed by its own payload:
//   PING              : -                 -> bool foreground
//   PATH_EXISTS       : utf path          -> int64 size
//   PATH_CHECKSUM     : utf path          -> int32 len, bytes[len]  (len 0 = absent)
//   RESTART_ACTIVITY  : int64 token       -> -
//   SHOW_TOAST        : utf message       -> -
//   EOF               : -                 -> -

static constexpr int32_t MESSAGE_PATCHES = 1;   // reserved, never served

enum class CommandCode : int32_t
{
    Ping            = 2,
    PathExists      = 3,
    PathChecksum    = 4,
    RestartActivity = 5,
    ShowToast       = 6,
    Eof             = 7,
};

// Closed decode of a raw code. std::nullopt is the "unknown command" branch:
// its payload length cannot be known, so the connection has to be dropped.
inline std::optional<CommandCode> decode_command(int32_t code)
{
    switch (code)
    {
        case static_cast<int32_t>(CommandCode::Ping):
        case static_cast<int32_t>(CommandCode::PathExists):
        case static_cast<int32_t>(CommandCode::PathChecksum):
        case static_cast<int32_t>(CommandCode::RestartActivity):
        case static_cast<int32_t>(CommandCode::ShowToast):
        case static_cast<int32_t>(CommandCode::Eof):
            return static_cast<CommandCode>(code);
        default:
            return std::nullopt;
    }
}

inline const char* command_name(CommandCode code)
{
    switch (code)
    {
        case CommandCode::Ping:
            return "PING";
        case CommandCode::PathExists:
            return "PATH_EXISTS";
        case CommandCode::PathChecksum:
            return "PATH_CHECKSUM";
        case CommandCode::RestartActivity:
            return "RESTART_ACTIVITY";
        case CommandCode::ShowToast:
            return "SHOW_TOAST";
        case CommandCode::Eof:
            return "EOF";
    }
    return "UNKNOWN";
}

// ─── Out-of-band build identifier ────────────────────────────────────────────

static constexpr const char* DEVICE_TEMP_DIR = "/data/local/tmp";
static constexpr const char* BUILD_ID_TXT    = "build-id.txt";

// Device-side path of the build-id file for an application, e.g.
//   /data/local/tmp/com.example.app-build-id.txt
inline std::string build_id_device_path(const std::string& app_id)
{
    return std::string(DEVICE_TEMP_DIR) + "/" + app_id + "-" + BUILD_ID_TXT;
}

}   // namespace hotline::ipc
