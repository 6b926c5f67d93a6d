#pragma once

#include <hotline/logger.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace hotline
{

inline constexpr uint32_t DEFAULT_MAX_AUTH_FAILURES = 50;

// What the desktop does when the agent replies with a different version.
enum class VersionPolicy
{
    Lenient,   // log the skew and still send the command
    Strict,    // refuse with ProtocolError(ProtocolMismatch)
};

struct AgentConfig
{
    std::string app_id;                       // names the local socket
    int64_t     token = 0;                    // shared secret for privileged commands
    int32_t     protocol_version  = 0;        // 0 = built-in protocol version
    uint32_t    max_auth_failures = DEFAULT_MAX_AUTH_FAILURES;
    int         listen_backlog    = 8;
};

struct InvokerConfig
{
    std::string               app_id;
    int64_t                   token            = 0;
    int32_t                   protocol_version = 0;   // 0 = built-in protocol version
    VersionPolicy             version_policy   = VersionPolicy::Lenient;
    std::chrono::milliseconds handshake_timeout{8000};
    std::chrono::milliseconds command_timeout{2000};
};

// Environment overlay:
//   HOTLINE_APP_ID          application identifier
//   HOTLINE_TOKEN           decimal or 0x-prefixed hex token
//   HOTLINE_STRICT_VERSION  "1"/"true" selects VersionPolicy::Strict (invoker only)
//   HOTLINE_LOG_LEVEL       trace|debug|info|warn|error|critical, applied to Logger
// Unset variables leave fields alone; invalid ones are logged and ignored.
void apply_env(AgentConfig& config);
void apply_env(InvokerConfig& config);

std::optional<LogLevel> parse_log_level(std::string_view text);
std::optional<int64_t>  parse_token(std::string_view text);

// Random non-zero token for provisioning a new agent.
int64_t generate_token();

}   // namespace hotline
