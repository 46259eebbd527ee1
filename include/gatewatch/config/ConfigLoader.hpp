#pragma once

#include "gatewatch/config/WatchdogConfig.hpp"
#include <string>

namespace gatewatch {

struct HostConfig {
    WatchdogConfig          watchdog;
    RocketChatChannelConfig rocketchat;
};

// ---------------------------------------------------------------------------
// Host configuration boundary.
//
// Reads the host JSON document:
//   plugins.entries.watchdog.config  → WatchdogConfig
//   channels.rocketchat              → RocketChatChannelConfig
//
// Absent fields keep their struct defaults. A field present with the wrong
// JSON type throws ConfigError — the core never sees a half-typed config.
// ---------------------------------------------------------------------------
HostConfig parse_host_config(const std::string& text);
HostConfig load_host_config(const std::string& path);

} // namespace gatewatch
