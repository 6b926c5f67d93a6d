#pragma once

#include "../ipc/wire.hpp"

#include <hotline/config.hpp>

#include <atomic>
#include <cstdint>

namespace hotline::agent
{

enum class AuthResult
{
    Granted,
    Denied,        // wrong token, counted as a failed attempt
    StreamError,   // token could not be read, not counted
};

// Checks privileged-command tokens against the process secret and counts
// rejected attempts. One instance is shared by every connection worker of an
// agent; the counter only grows.
class Authenticator
{
   public:
    explicit Authenticator(int64_t token, uint32_t max_failures = DEFAULT_MAX_AUTH_FAILURES)
        : token_(token), max_failures_(max_failures)
    {
    }

    Authenticator(const Authenticator&)            = delete;
    Authenticator& operator=(const Authenticator&) = delete;

    // Reads one int64 token from `reader` and compares it with the secret.
    AuthResult authenticate(ipc::WireReader& reader);

    // Compares an already decoded token. Same counting rules.
    AuthResult check(int64_t presented);

    uint64_t failure_count() const { return failures_.load(std::memory_order_acquire); }
    uint32_t max_failures() const { return max_failures_; }

    // True once more than max_failures() attempts have been rejected.
    bool tripped() const { return failure_count() > max_failures_; }

   private:
    const int64_t         token_;
    const uint32_t        max_failures_;
    std::atomic<uint64_t> failures_{0};
};

}   // namespace hotline::agent
