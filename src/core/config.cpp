#include <hotline/config.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <random>

namespace hotline
{

namespace
{

std::string lowercase(std::string_view text)
{
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

const char* env(const char* name)
{
    const char* value = std::getenv(name);
    return (value && value[0] != '\0') ? value : nullptr;
}

void apply_common_env(std::string& app_id, int64_t& token)
{
    if (const char* id = env("HOTLINE_APP_ID"))
        app_id = id;

    if (const char* text = env("HOTLINE_TOKEN"))
    {
        if (auto parsed = parse_token(text))
            token = *parsed;
        else
            HOTLINE_LOG_WARN("config", "Ignoring malformed HOTLINE_TOKEN");
    }

    if (const char* text = env("HOTLINE_LOG_LEVEL"))
    {
        if (auto level = parse_log_level(text))
            Logger::instance().set_level(*level);
        else
            HOTLINE_LOG_WARN("config", "Ignoring unknown HOTLINE_LOG_LEVEL '{}'", text);
    }
}

}   // namespace

std::optional<LogLevel> parse_log_level(std::string_view text)
{
    auto name = lowercase(text);
    if (name == "trace")
        return LogLevel::Trace;
    if (name == "debug")
        return LogLevel::Debug;
    if (name == "info")
        return LogLevel::Info;
    if (name == "warn" || name == "warning")
        return LogLevel::Warning;
    if (name == "error")
        return LogLevel::Error;
    if (name == "critical")
        return LogLevel::Critical;
    return std::nullopt;
}

std::optional<int64_t> parse_token(std::string_view text)
{
    if (text.empty())
        return std::nullopt;

    const char* first = text.data();
    const char* last  = text.data() + text.size();

    // Hex tokens cover the full 64-bit range, sign bit included.
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X'))
    {
        uint64_t value = 0;
        auto [ptr, ec] = std::from_chars(first + 2, last, value, 16);
        if (ec != std::errc() || ptr != last)
            return std::nullopt;
        return static_cast<int64_t>(value);
    }

    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(first, last, value, 10);
    if (ec != std::errc() || ptr != last)
        return std::nullopt;
    return value;
}

int64_t generate_token()
{
    std::random_device                     rd;
    std::mt19937_64                        gen((static_cast<uint64_t>(rd()) << 32) ^ rd());
    std::uniform_int_distribution<int64_t> dist;

    int64_t token = 0;
    while (token == 0)
        token = dist(gen);
    return token;
}

void apply_env(AgentConfig& config)
{
    apply_common_env(config.app_id, config.token);
}

void apply_env(InvokerConfig& config)
{
    apply_common_env(config.app_id, config.token);

    if (const char* text = env("HOTLINE_STRICT_VERSION"))
    {
        auto value = lowercase(text);
        if (value == "1" || value == "true")
            config.version_policy = VersionPolicy::Strict;
        else if (value == "0" || value == "false")
            config.version_policy = VersionPolicy::Lenient;
        else
            HOTLINE_LOG_WARN("config", "Ignoring unknown HOTLINE_STRICT_VERSION '{}'", text);
    }
}

}   // namespace hotline
