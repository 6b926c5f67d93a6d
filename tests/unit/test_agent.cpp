#include <gtest/gtest.h>

#include <hotline/agent.hpp>
#include <hotline/client.hpp>
#include <hotline/error.hpp>

#include "ipc/handshake.hpp"
#include "util/fakes.hpp"

#include <cerrno>
#include <chrono>
#include <filesystem>
#include <future>
#include <thread>
#include <vector>

using namespace hotline;
using hotline::test::FakeHost;
using hotline::test::unique_socket_name;

namespace
{

constexpr int64_t TOKEN = 0x1122334455667788LL;

AgentConfig agent_config(const std::string& app_id)
{
    AgentConfig cfg;
    cfg.app_id = app_id;
    cfg.token  = TOKEN;
    return cfg;
}

InvokerConfig invoker_config(const std::string& app_id, int64_t token = TOKEN)
{
    InvokerConfig cfg;
    cfg.app_id = app_id;
    cfg.token  = token;
    return cfg;
}

// Raw connection that has completed the handshake.
std::unique_ptr<ipc::Connection> open_session(const std::string& app_id)
{
    auto conn = ipc::Client::connect(app_id);
    if (!conn)
        return nullptr;
    ipc::WireReader r(*conn);
    auto            hs = ipc::initiate_handshake(*conn, r);
    if (!hs.ok() || *hs.agent_version != ipc::PROTOCOL_VERSION)
        return nullptr;
    return conn;
}

// Sends RESTART_ACTIVITY with a wrong token and waits for the agent to hang up.
bool send_bad_restart(const std::string& app_id)
{
    auto conn = open_session(app_id);
    if (!conn)
        return false;

    ipc::WireWriter w;
    w.put_i32(static_cast<int32_t>(ipc::CommandCode::RestartActivity));
    w.put_i64(TOKEN ^ 1);
    if (!conn->send(w))
        return false;

    ipc::WireReader r(*conn);
    return !r.read_i32().has_value() && r.status() == ipc::ReadStatus::Closed;
}

bool connect_refused(const std::string& app_id)
{
    int  error = 0;
    auto conn  = ipc::Client::connect(app_id, ipc::SocketNamespace::Abstract, &error);
    return conn == nullptr && error == ECONNREFUSED;
}

}   // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Agent, StartAndStop)
{
    FakeHost host;
    auto     name = unique_socket_name("agent-life");
    Agent    agent(agent_config(name), host);

    ASSERT_TRUE(agent.start());
    EXPECT_TRUE(agent.is_accepting());
    EXPECT_FALSE(agent.start());

    agent.stop();
    EXPECT_FALSE(agent.is_accepting());
    EXPECT_TRUE(connect_refused(name));

    agent.stop();
}

TEST(Agent, DefaultsToBuiltInProtocolVersion)
{
    FakeHost host;
    Agent    agent(agent_config(unique_socket_name("agent-ver")), host);
    EXPECT_EQ(agent.config().protocol_version, ipc::PROTOCOL_VERSION);
    EXPECT_EQ(agent.config().max_auth_failures, 50u);
}

TEST(Agent, NameInUseFailsToStart)
{
    FakeHost host;
    auto     name = unique_socket_name("agent-dup");
    Agent    first(agent_config(name), host);
    Agent    second(agent_config(name), host);

    ASSERT_TRUE(first.start());
    EXPECT_FALSE(second.start());
}

TEST(Agent, StopWakesIdleConnections)
{
    FakeHost host;
    auto     name = unique_socket_name("agent-idle");
    Agent    agent(agent_config(name), host);
    ASSERT_TRUE(agent.start());

    auto idle = open_session(name);
    ASSERT_NE(idle, nullptr);

    agent.stop();

    ipc::WireReader r(*idle);
    EXPECT_FALSE(r.read_i32().has_value());
}

// ═══════════════════════════════════════════════════════════════════════════════
// Serving
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Agent, AnswersPingThroughClient)
{
    FakeHost host;
    host.set_foreground(SurfaceHandle{1, "MainActivity"});
    auto  name = unique_socket_name("agent-ping");
    Agent agent(agent_config(name), host);
    ASSERT_TRUE(agent.start());

    LocalDeviceTransport device(std::filesystem::temp_directory_path());
    InstantClient        client(device, invoker_config(name));
    EXPECT_EQ(client.get_app_state(), AppState::Foreground);

    host.set_foreground(std::nullopt);
    EXPECT_EQ(client.get_app_state(), AppState::Background);
}

TEST(Agent, IdleConnectionDoesNotBlockOthers)
{
    FakeHost host;
    host.set_foreground(SurfaceHandle{1, "Main"});
    auto  name = unique_socket_name("agent-par");
    Agent agent(agent_config(name), host);
    ASSERT_TRUE(agent.start());

    auto idle = open_session(name);
    ASSERT_NE(idle, nullptr);

    LocalDeviceTransport device(std::filesystem::temp_directory_path());
    InstantClient        client(device, invoker_config(name));
    EXPECT_EQ(client.get_app_state(), AppState::Foreground);

    idle->close();
}

TEST(Agent, ConcurrentClientsAllServed)
{
    FakeHost host;
    host.set_foreground(SurfaceHandle{1, "Main"});
    auto  name = unique_socket_name("agent-conc");
    Agent agent(agent_config(name), host);
    ASSERT_TRUE(agent.start());

    constexpr int                  CLIENTS = 8;
    std::vector<std::future<bool>> results;
    for (int i = 0; i < CLIENTS; ++i)
    {
        results.push_back(std::async(std::launch::async,
                                     [&name]
                                     {
                                         LocalDeviceTransport device(
                                             std::filesystem::temp_directory_path());
                                         InstantClient client(device, invoker_config(name));
                                         return client.get_app_state() == AppState::Foreground;
                                     }));
    }
    for (auto& r : results)
        EXPECT_TRUE(r.get());

    agent.stop();
    EXPECT_EQ(agent.connections_served(), static_cast<size_t>(CLIENTS));
}

TEST(Agent, RestartThroughClient)
{
    FakeHost host;
    host.set_foreground(SurfaceHandle{9, "Main"});
    auto  name = unique_socket_name("agent-restart");
    Agent agent(agent_config(name), host);
    ASSERT_TRUE(agent.start());

    LocalDeviceTransport device(std::filesystem::temp_directory_path());
    InstantClient        client(device, invoker_config(name));
    client.restart_activity();

    // The restart has no reply; stopping waits for the worker.
    agent.stop();
    EXPECT_EQ(host.restart_count(), 1u);
    EXPECT_EQ(agent.auth_failures(), 0u);
}

TEST(Agent, HostFailureKeepsAgentRunning)
{
    FakeHost host;
    host.set_failing(true);
    auto  name = unique_socket_name("agent-fail");
    Agent agent(agent_config(name), host);
    ASSERT_TRUE(agent.start());

    LocalDeviceTransport device(std::filesystem::temp_directory_path());
    InstantClient        client(device, invoker_config(name));
    EXPECT_THROW(client.get_app_state(), ProtocolError);

    host.set_failing(false);
    EXPECT_EQ(client.get_app_state(), AppState::Background);
    EXPECT_TRUE(agent.is_accepting());
}

// ═══════════════════════════════════════════════════════════════════════════════
// Circuit breaker
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Agent, FiftiethBadTokenStillServed)
{
    FakeHost host;
    auto     name = unique_socket_name("agent-50");
    Agent    agent(agent_config(name), host);
    ASSERT_TRUE(agent.start());

    for (int i = 0; i < 50; ++i)
        ASSERT_TRUE(send_bad_restart(name)) << "attempt " << i + 1;

    EXPECT_EQ(agent.auth_failures(), 50u);
    EXPECT_FALSE(agent.breaker_tripped());
    EXPECT_TRUE(agent.is_accepting());

    auto conn = open_session(name);
    EXPECT_NE(conn, nullptr);
}

TEST(Agent, FiftyFirstBadTokenStopsAccepting)
{
    test::LogCapture logs(LogLevel::Warning);

    FakeHost host;
    auto     name = unique_socket_name("agent-51");
    Agent    agent(agent_config(name), host);
    ASSERT_TRUE(agent.start());

    for (int i = 0; i < 51; ++i)
        ASSERT_TRUE(send_bad_restart(name)) << "attempt " << i + 1;

    EXPECT_TRUE(agent.breaker_tripped());
    EXPECT_TRUE(connect_refused(name));

    agent.wait_until_stopped();
    EXPECT_FALSE(agent.is_accepting());
    EXPECT_TRUE(logs.contains(LogLevel::Warning, "too many wrong token connections"));

    // A correct token cannot bring it back.
    LocalDeviceTransport device(std::filesystem::temp_directory_path());
    InstantClient        client(device, invoker_config(name));
    EXPECT_THROW(client.get_app_state(), TransportError);
}

TEST(Agent, CustomBreakerLimit)
{
    FakeHost    host;
    auto        name = unique_socket_name("agent-limit");
    AgentConfig cfg  = agent_config(name);
    cfg.max_auth_failures = 2;
    Agent agent(cfg, host);
    ASSERT_TRUE(agent.start());

    ASSERT_TRUE(send_bad_restart(name));
    ASSERT_TRUE(send_bad_restart(name));
    EXPECT_TRUE(agent.is_accepting());

    ASSERT_TRUE(send_bad_restart(name));
    agent.wait_until_stopped();
    EXPECT_TRUE(connect_refused(name));
}

TEST(Agent, WrongTokenFromClientDoesNotRestart)
{
    FakeHost host;
    host.set_foreground(SurfaceHandle{4, "Main"});
    auto  name = unique_socket_name("agent-badclient");
    Agent agent(agent_config(name), host);
    ASSERT_TRUE(agent.start());

    LocalDeviceTransport device(std::filesystem::temp_directory_path());
    InstantClient        client(device, invoker_config(name, TOKEN + 1));
    client.restart_activity();

    agent.stop();
    EXPECT_EQ(host.restart_count(), 0u);
    EXPECT_EQ(agent.auth_failures(), 1u);
}
