#include <hotline/error.hpp>

namespace hotline
{

const char* to_string(ErrorCode code)
{
    switch (code)
    {
        case ErrorCode::ProtocolMismatch:
            return "protocol mismatch";
        case ErrorCode::AuthenticationFailure:
            return "authentication failure";
        case ErrorCode::TruncatedStream:
            return "truncated or malformed stream";
        case ErrorCode::TransportFailure:
            return "transport failure";
    }
    return "unknown error";
}

const char* to_string(TransportFailure kind)
{
    switch (kind)
    {
        case TransportFailure::Unreachable:
            return "unreachable";
        case TransportFailure::Rejected:
            return "rejected";
        case TransportFailure::Timeout:
            return "timeout";
        case TransportFailure::Sync:
            return "sync";
    }
    return "unknown";
}

ProtocolError::ProtocolError(ErrorCode code, const std::string& what)
    : std::runtime_error(what), code_(code)
{
}

TransportError::TransportError(TransportFailure kind, const std::string& what)
    : ProtocolError(ErrorCode::TransportFailure,
                    std::string(to_string(kind)) + ": " + what),
      kind_(kind)
{
}

}   // namespace hotline
