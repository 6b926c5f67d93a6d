#include <hotline/agent.hpp>
#include <hotline/logger.hpp>

#include "../ipc/protocol.hpp"
#include "../ipc/transport.hpp"
#include "authenticator.hpp"
#include "command_session.hpp"
#include "worker_set.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <mutex>
#include <set>
#include <thread>

#include <cerrno>

namespace hotline
{

struct Agent::Impl
{
    Impl(AgentConfig cfg, HostSurfaceProvider& h, ResourceFileManager* r)
        : config(std::move(cfg)),
          host(h),
          resources(r),
          auth(config.token, config.max_auth_failures)
    {
        if (config.protocol_version == 0)
            config.protocol_version = ipc::PROTOCOL_VERSION;
    }

    AgentConfig          config;
    HostSurfaceProvider& host;
    ResourceFileManager* resources;
    agent::Authenticator auth;
    ipc::Server          server;

    std::thread       accept_thread;
    std::atomic<bool> started{false};
    std::atomic<bool> accepting{false};
    std::atomic<size_t> served{0};

    std::mutex              loop_mu;
    std::condition_variable loop_cv;
    bool                    loop_exited = false;

    // One worker per accepted connection; finished ones are reaped on the
    // next accept.
    agent::WorkerSet workers;

    // Connections currently inside a session, so stop() can wake them.
    std::mutex                 active_mu;
    std::set<ipc::Connection*> active;
    bool                       stopping = false;

    void accept_loop();
    void serve(std::unique_ptr<ipc::Connection> conn);
    void interrupt_active();
};

// ─── Accept loop ─────────────────────────────────────────────────────────────

void Agent::Impl::accept_loop()
{
    while (!auth.tripped())
    {
        auto conn = server.accept();
        if (!conn)
        {
            if (!server.is_listening())
                break;
            HOTLINE_LOG_ERROR("agent", "Error accepting connection on local socket: {}",
                              std::strerror(errno));
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            continue;
        }

        HOTLINE_LOG_DEBUG("agent", "Received connection from tool (fd={})", conn->fd());
        workers.reap();

        // On failure the connection is closed unserved; the agent keeps
        // accepting.
        if (!workers.spawn([this, c = std::move(conn)]() mutable { serve(std::move(c)); }))
            HOTLINE_LOG_DEBUG("agent", "{} worker(s) still running", workers.size());
    }

    if (auth.tripped())
    {
        HOTLINE_LOG_WARN("agent", "Stopping server: too many wrong token connections");
        server.shutdown();
    }

    accepting.store(false);
    {
        std::lock_guard lock(loop_mu);
        loop_exited = true;
    }
    loop_cv.notify_all();
    HOTLINE_LOG_INFO("agent", "Agent for {} no longer accepting connections", config.app_id);
}

void Agent::Impl::serve(std::unique_ptr<ipc::Connection> conn)
{
    {
        std::lock_guard lock(active_mu);
        if (stopping)
            return;
        active.insert(conn.get());
    }

    agent::SessionContext ctx{
        .host             = host,
        .resources        = resources,
        .auth             = auth,
        .protocol_version = config.protocol_version,
    };
    agent::CommandSession session(*conn, ctx);
    auto                  outcome = session.run();
    HOTLINE_LOG_DEBUG("agent",
                      "Connection closed: {} after {} command(s)",
                      agent::to_string(outcome),
                      session.commands_handled());

    served.fetch_add(1);

    // Trip before the peer sees the close, so nothing can slip in between.
    if (auth.tripped())
        server.shutdown();

    std::lock_guard lock(active_mu);
    active.erase(conn.get());
    conn->close();
}

void Agent::Impl::interrupt_active()
{
    std::lock_guard lock(active_mu);
    stopping = true;
    for (auto* conn : active)
        conn->shutdown();
}

// ─── Agent ───────────────────────────────────────────────────────────────────

Agent::Agent(AgentConfig config, HostSurfaceProvider& host, ResourceFileManager* resources)
    : impl_(std::make_unique<Impl>(std::move(config), host, resources))
{
}

Agent::~Agent()
{
    stop();
}

bool Agent::start()
{
    if (impl_->started.exchange(true))
        return false;

    if (!impl_->server.listen(impl_->config.app_id,
                              ipc::SocketNamespace::Abstract,
                              impl_->config.listen_backlog))
    {
        HOTLINE_LOG_ERROR("agent",
                          "IO error creating local socket at {}: {}",
                          impl_->config.app_id,
                          std::strerror(errno));
        impl_->started.store(false);
        return false;
    }

    HOTLINE_LOG_DEBUG("agent", "Starting server socket listening for {}", impl_->config.app_id);
    impl_->accepting.store(true);
    impl_->accept_thread = std::thread([this] { impl_->accept_loop(); });
    return true;
}

void Agent::stop()
{
    if (!impl_->started.load())
        return;

    impl_->server.shutdown();
    if (impl_->accept_thread.joinable())
        impl_->accept_thread.join();
    impl_->interrupt_active();
    impl_->workers.wait_all();
    impl_->server.close();
}

void Agent::wait_until_stopped()
{
    if (!impl_->started.load())
        return;
    std::unique_lock lock(impl_->loop_mu);
    impl_->loop_cv.wait(lock, [this] { return impl_->loop_exited; });
}

bool Agent::is_accepting() const
{
    return impl_->accepting.load();
}

bool Agent::breaker_tripped() const
{
    return impl_->auth.tripped();
}

uint64_t Agent::auth_failures() const
{
    return impl_->auth.failure_count();
}

size_t Agent::connections_served() const
{
    return impl_->served.load();
}

const AgentConfig& Agent::config() const
{
    return impl_->config;
}

}   // namespace hotline
