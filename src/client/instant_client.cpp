#include <hotline/client.hpp>
#include <hotline/logger.hpp>

#include "invoker.hpp"

#include <stdexcept>

namespace hotline
{

const char* to_string(AppState state)
{
    switch (state)
    {
        case AppState::Foreground:
            return "foreground";
        case AppState::Background:
            return "background";
    }
    return "unknown";
}

namespace
{

ipc::WireWriter command(ipc::CommandCode code)
{
    ipc::WireWriter out;
    out.put_i32(static_cast<int32_t>(code));
    return out;
}

ipc::WireWriter command_with_text(ipc::CommandCode code, const std::string& text)
{
    auto out = command(code);
    if (!out.put_utf(text))
        throw std::invalid_argument(std::string(ipc::command_name(code))
                                    + ": text is not valid UTF-8 or exceeds 65535 encoded bytes");
    return out;
}

}   // namespace

InstantClient::InstantClient(DeviceTransport& transport, InvokerConfig config)
    : transport_(transport), config_(std::move(config))
{
}

AppState InstantClient::get_app_state()
{
    client::Invoker invoker(transport_, config_);
    return invoker.invoke(
        [](client::Channel& ch)
        {
            ch.send(command(ipc::CommandCode::Ping));
            bool foreground = ch.read_bool();
            HOTLINE_LOG_INFO("invoker",
                             "Ping sent and replied successfully, application seems to be "
                             "running. Foreground={}",
                             foreground);
            return foreground ? AppState::Foreground : AppState::Background;
        });
}

void InstantClient::show_toast(const std::string& message)
{
    // Encode before connecting so a bad message never reaches the agent.
    auto out = command_with_text(ipc::CommandCode::ShowToast, message);

    client::Invoker invoker(transport_, config_);
    invoker.invoke([&out](client::Channel& ch) { ch.send(out); });
}

void InstantClient::restart_activity()
{
    AppState state = get_app_state();
    HOTLINE_LOG_DEBUG("invoker", "Restarting activity ({})", to_string(state));

    auto out = command(ipc::CommandCode::RestartActivity);
    out.put_i64(config_.token);

    client::Invoker invoker(transport_, config_);
    invoker.invoke([&out](client::Channel& ch) { ch.send(out); });
}

int64_t InstantClient::path_exists(const std::string& path)
{
    auto out = command_with_text(ipc::CommandCode::PathExists, path);

    client::Invoker invoker(transport_, config_);
    return invoker.invoke(
        [&out](client::Channel& ch)
        {
            ch.send(out);
            return ch.read_i64();
        });
}

std::optional<std::vector<uint8_t>> InstantClient::path_checksum(const std::string& path)
{
    auto out = command_with_text(ipc::CommandCode::PathChecksum, path);

    client::Invoker invoker(transport_, config_);
    return invoker.invoke(
        [&out](client::Channel& ch) -> std::optional<std::vector<uint8_t>>
        {
            ch.send(out);
            auto bytes = ch.read_block();
            if (bytes.empty())
                return std::nullopt;
            return bytes;
        });
}

}   // namespace hotline
