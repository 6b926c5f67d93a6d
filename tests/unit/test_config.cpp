#include <gtest/gtest.h>

#include <hotline/config.hpp>

#include "util/fakes.hpp"

#include <cstdlib>

using namespace hotline;

namespace
{

// Sets an environment variable for the lifetime of the object.
class ScopedEnv
{
   public:
    ScopedEnv(const char* name, const char* value) : name_(name)
    {
        ::setenv(name, value, 1);
    }
    ~ScopedEnv() { ::unsetenv(name_); }

    ScopedEnv(const ScopedEnv&)            = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

   private:
    const char* name_;
};

}   // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Defaults
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Config, AgentDefaults)
{
    AgentConfig cfg;
    EXPECT_EQ(cfg.max_auth_failures, 50u);
    EXPECT_EQ(cfg.protocol_version, 0);
    EXPECT_EQ(cfg.token, 0);
}

TEST(Config, InvokerDefaults)
{
    InvokerConfig cfg;
    EXPECT_EQ(cfg.version_policy, VersionPolicy::Lenient);
    EXPECT_EQ(cfg.handshake_timeout.count(), 8000);
    EXPECT_EQ(cfg.command_timeout.count(), 2000);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Parsing
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Config, ParseDecimalToken)
{
    EXPECT_EQ(parse_token("123456789"), 123456789);
    EXPECT_EQ(parse_token("-42"), -42);
}

TEST(Config, ParseHexToken)
{
    EXPECT_EQ(parse_token("0x1F"), 31);
    EXPECT_EQ(parse_token("0XfF"), 255);
    EXPECT_EQ(parse_token("0xFFFFFFFFFFFFFFFF"), -1);
}

TEST(Config, RejectMalformedToken)
{
    EXPECT_FALSE(parse_token("").has_value());
    EXPECT_FALSE(parse_token("12ab").has_value());
    EXPECT_FALSE(parse_token("0x").has_value());
    EXPECT_FALSE(parse_token("0x1G").has_value());
    EXPECT_FALSE(parse_token("99999999999999999999").has_value());
}

TEST(Config, ParseLogLevel)
{
    EXPECT_EQ(parse_log_level("trace"), LogLevel::Trace);
    EXPECT_EQ(parse_log_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("Warn"), LogLevel::Warning);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::Warning);
    EXPECT_EQ(parse_log_level("critical"), LogLevel::Critical);
    EXPECT_FALSE(parse_log_level("loud").has_value());
}

TEST(Config, GeneratedTokensAreNonZeroAndVary)
{
    auto a = generate_token();
    auto b = generate_token();
    EXPECT_NE(a, 0);
    EXPECT_NE(b, 0);
    EXPECT_NE(a, b);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Environment overlay
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Config, EnvOverridesAgentFields)
{
    ScopedEnv id("HOTLINE_APP_ID", "com.example.env");
    ScopedEnv token("HOTLINE_TOKEN", "0x10");

    AgentConfig cfg;
    cfg.app_id = "com.example.code";
    apply_env(cfg);
    EXPECT_EQ(cfg.app_id, "com.example.env");
    EXPECT_EQ(cfg.token, 16);
}

TEST(Config, UnsetEnvLeavesFieldsAlone)
{
    ::unsetenv("HOTLINE_APP_ID");
    ::unsetenv("HOTLINE_TOKEN");

    AgentConfig cfg;
    cfg.app_id = "kept";
    cfg.token  = 7;
    apply_env(cfg);
    EXPECT_EQ(cfg.app_id, "kept");
    EXPECT_EQ(cfg.token, 7);
}

TEST(Config, MalformedTokenIgnoredWithWarning)
{
    test::LogCapture logs;
    ScopedEnv        token("HOTLINE_TOKEN", "not-a-number");

    InvokerConfig cfg;
    cfg.token = 5;
    apply_env(cfg);
    EXPECT_EQ(cfg.token, 5);
    EXPECT_TRUE(logs.contains(LogLevel::Warning, "HOTLINE_TOKEN"));
}

TEST(Config, StrictVersionFromEnv)
{
    ScopedEnv strict("HOTLINE_STRICT_VERSION", "true");

    InvokerConfig cfg;
    apply_env(cfg);
    EXPECT_EQ(cfg.version_policy, VersionPolicy::Strict);
}

TEST(Config, LenientVersionFromEnv)
{
    ScopedEnv strict("HOTLINE_STRICT_VERSION", "0");

    InvokerConfig cfg;
    cfg.version_policy = VersionPolicy::Strict;
    apply_env(cfg);
    EXPECT_EQ(cfg.version_policy, VersionPolicy::Lenient);
}

TEST(Config, LogLevelFromEnvAppliedToLogger)
{
    test::LogCapture logs(LogLevel::Info);
    ScopedEnv        level("HOTLINE_LOG_LEVEL", "error");

    AgentConfig cfg;
    apply_env(cfg);
    EXPECT_EQ(Logger::instance().get_level(), LogLevel::Error);
}
