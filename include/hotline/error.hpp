#pragma once

#include <stdexcept>
#include <string>

namespace hotline
{

enum class ErrorCode : int
{
    ProtocolMismatch,        // bad magic or protocol version
    AuthenticationFailure,   // wrong token for a privileged command
    TruncatedStream,         // stream ended or held bytes that do not decode
    TransportFailure,        // external transport layer failed
};

enum class TransportFailure : int
{
    Unreachable,   // device or process not reachable
    Rejected,      // command channel refused
    Timeout,
    Sync,          // file transfer failed, including "remote file absent"
};

const char* to_string(ErrorCode code);
const char* to_string(TransportFailure kind);

// Thrown by the desktop side. The agent never throws across a session.
class ProtocolError : public std::runtime_error
{
   public:
    ProtocolError(ErrorCode code, const std::string& what);

    ErrorCode code() const noexcept { return code_; }

   private:
    ErrorCode code_;
};

class TransportError : public ProtocolError
{
   public:
    TransportError(TransportFailure kind, const std::string& what);

    TransportFailure kind() const noexcept { return kind_; }

   private:
    TransportFailure kind_;
};

}   // namespace hotline
