#include "gatewatch/config/ConfigLoader.hpp"
#include "gatewatch/core/Errors.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <cstdint>
#include <limits>
#include <sstream>

using namespace gatewatch;
using json = nlohmann::json;

namespace {

const json* child_object(const json& parent, const char* key) {
    auto it = parent.find(key);
    if (it == parent.end() || it->is_null()) return nullptr;
    if (!it->is_object()) {
        throw ConfigError(std::string("expected object at '") + key + "'");
    }
    return &*it;
}

void read_bool(const json& obj, const char* key, bool& out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return;
    if (!it->is_boolean()) throw ConfigError(std::string(key) + " must be a boolean");
    out = it->get<bool>();
}

void read_number(const json& obj, const char* key, double& out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return;
    if (!it->is_number()) throw ConfigError(std::string(key) + " must be a number");
    out = it->get<double>();
}

void read_int(const json& obj, const char* key, int& out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return;
    if (!it->is_number_integer()) throw ConfigError(std::string(key) + " must be an integer");

    // Unsigned and signed 64-bit storage both have to fit in int.
    if (it->is_number_unsigned()) {
        const auto v = it->get<uint64_t>();
        if (v > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
            throw ConfigError(std::string(key) + " is out of range");
        }
        out = static_cast<int>(v);
        return;
    }
    const auto v = it->get<int64_t>();
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
        throw ConfigError(std::string(key) + " is out of range");
    }
    out = static_cast<int>(v);
}

void read_string(const json& obj, const char* key, std::string& out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return;
    if (!it->is_string()) throw ConfigError(std::string(key) + " must be a string");
    out = it->get<std::string>();
}

RocketChatAccount read_account(const json& obj) {
    RocketChatAccount a;
    read_string(obj, "baseUrl", a.base_url);
    read_string(obj, "userId", a.user_id);
    read_string(obj, "authToken", a.auth_token);
    return a;
}

WatchdogConfig read_watchdog(const json& obj) {
    WatchdogConfig cfg;
    read_bool(obj, "enabled", cfg.enabled);
    read_number(obj, "intervalSec", cfg.interval_sec);
    read_int(obj, "failureThreshold", cfg.failure_threshold);
    read_number(obj, "cooldownSec", cfg.cooldown_sec);

    if (const json* alert = child_object(obj, "alert")) {
        read_string(*alert, "channel", cfg.alert.channel);
        read_string(*alert, "to", cfg.alert.to);
    }
    if (const json* recover = child_object(obj, "recover")) {
        read_bool(*recover, "enabled", cfg.recover.enabled);
        read_string(*recover, "action", cfg.recover.action);
    }
    return cfg;
}

} // namespace

std::optional<RocketChatAccount> gatewatch::resolve_rocketchat_account(const RocketChatChannelConfig& rc) {
    if (rc.flat.complete()) return rc.flat;
    if (rc.default_account && rc.default_account->complete()) return rc.default_account;
    return std::nullopt;
}

HostConfig gatewatch::parse_host_config(const std::string& text) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("config is not valid JSON: ") + e.what());
    }
    if (!root.is_object()) throw ConfigError("expected config object");

    HostConfig host;

    // plugins.entries.watchdog.config. An unconfigured watchdog never runs.
    host.watchdog.enabled = false;
    if (const json* plugins = child_object(root, "plugins")) {
        if (const json* entries = child_object(*plugins, "entries")) {
            if (const json* wd = child_object(*entries, "watchdog")) {
                if (const json* cfg = child_object(*wd, "config")) {
                    host.watchdog = read_watchdog(*cfg);
                }
            }
        }
    }

    // channels.rocketchat — flat record and/or accounts.default
    if (const json* channels = child_object(root, "channels")) {
        if (const json* rc = child_object(*channels, "rocketchat")) {
            host.rocketchat.flat = read_account(*rc);
            if (const json* accounts = child_object(*rc, "accounts")) {
                if (const json* def = child_object(*accounts, "default")) {
                    host.rocketchat.default_account = read_account(*def);
                }
            }
        }
    }

    return host;
}

HostConfig gatewatch::load_host_config(const std::string& path) {
    std::ifstream f(path);
    if (!f.good()) throw ConfigError("cannot open config file: " + path);

    std::ostringstream ss;
    ss << f.rdbuf();
    return parse_host_config(ss.str());
}
