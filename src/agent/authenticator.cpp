#include "authenticator.hpp"

#include <hotline/logger.hpp>

namespace hotline::agent
{

AuthResult Authenticator::authenticate(ipc::WireReader& reader)
{
    auto presented = reader.read_i64();
    if (!presented)
    {
        HOTLINE_LOG_WARN("auth", "Could not read token: {}", ipc::to_string(reader.status()));
        return AuthResult::StreamError;
    }
    return check(*presented);
}

AuthResult Authenticator::check(int64_t presented)
{
    if (presented == token_)
        return AuthResult::Granted;

    auto count = failures_.fetch_add(1, std::memory_order_acq_rel) + 1;
    HOTLINE_LOG_WARN("auth",
                     "Mismatched identity token from client ({} rejected so far, limit {})",
                     count,
                     max_failures_);
    if (count == static_cast<uint64_t>(max_failures_) + 1)
        HOTLINE_LOG_ERROR("auth", "Too many wrong tokens; agent will stop accepting connections");
    return AuthResult::Denied;
}

}   // namespace hotline::agent
