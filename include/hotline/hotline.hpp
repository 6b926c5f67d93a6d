#pragma once

#include <hotline/agent.hpp>
#include <hotline/build_id.hpp>
#include <hotline/client.hpp>
#include <hotline/config.hpp>
#include <hotline/device.hpp>
#include <hotline/error.hpp>
#include <hotline/host.hpp>
#include <hotline/logger.hpp>

// ─── Usage ───────────────────────────────────────────────────────────────────
// In the application process:
//
//   hotline::AgentConfig cfg{.app_id = "com.example.app", .token = token};
//   hotline::Agent agent(cfg, my_host_surfaces);
//   agent.start();
//
// On the desktop:
//
//   hotline::LocalDeviceTransport device("/tmp/device-root");
//   hotline::InstantClient client(device, {.app_id = "com.example.app", .token = token});
//   if (client.get_app_state() == hotline::AppState::Foreground)
//       client.restart_activity();
