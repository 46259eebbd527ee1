#pragma once

#include <optional>
#include <string>

namespace gatewatch {

// Defaults mirror the documented host defaults. The host validates ranges
// before the core ever sees a config.
struct AlertConfig {
    std::string channel = "rocketchat";
    std::string to;                      // "" = log only. "#name" or a roomId.
};

struct RecoverConfig {
    bool        enabled = false;
    std::string action  = "gateway-restart";
};

struct WatchdogConfig {
    bool          enabled          = true;
    double        interval_sec     = 60.0;
    int           failure_threshold = 3;
    double        cooldown_sec     = 600.0;
    AlertConfig   alert;
    RecoverConfig recover;
};

struct RocketChatAccount {
    std::string base_url;
    std::string user_id;
    std::string auth_token;

    bool complete() const {
        return !base_url.empty() && !user_id.empty() && !auth_token.empty();
    }
};

// channels.rocketchat in the host config. Either shape may be filled in.
struct RocketChatChannelConfig {
    RocketChatAccount                flat;
    std::optional<RocketChatAccount> default_account;  // accounts.default
};

// Flat record wins when complete, then accounts.default, else nothing.
std::optional<RocketChatAccount> resolve_rocketchat_account(const RocketChatChannelConfig& rc);

} // namespace gatewatch
