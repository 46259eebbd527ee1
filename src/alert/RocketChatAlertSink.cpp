#include "gatewatch/alert/AlertSink.hpp"
#include "gatewatch/alert/ChatTransport.hpp"
#include "gatewatch/core/Errors.hpp"
#include "gatewatch/core/Logger.hpp"
#include <nlohmann/json.hpp>
#include <utility>
#include <vector>

using namespace gatewatch;
using json = nlohmann::json;

std::string gatewatch::url_origin(const std::string& base_url) {
    auto scheme = base_url.find("://");
    size_t host_start = scheme == std::string::npos ? 0 : scheme + 3;
    auto path = base_url.find('/', host_start);
    return path == std::string::npos ? base_url : base_url.substr(0, path);
}

RocketChatAlertSink::RocketChatAlertSink(AlertConfig alert, RocketChatChannelConfig channel,
                                         ChatTransport& transport, Logger& log)
    : alert_(std::move(alert)), channel_(std::move(channel)),
      transport_(transport), log_(log) {}

void RocketChatAlertSink::send(const std::string& text) {
    if (alert_.to.empty()) {
        log_.info(text);
        return;
    }
    if (alert_.channel != CHANNEL_NAME) {
        log_.warn("watchdog: unsupported alert.channel=" + alert_.channel + "; logging only");
        log_.info(text);
        return;
    }

    auto acct = resolve_rocketchat_account(channel_);
    if (!acct) throw AlertError("watchdog: Rocket.Chat not configured (channels.rocketchat.*)");

    json payload = {{"text", text}};
    if (alert_.to[0] == '#') payload["channel"] = alert_.to;
    else                     payload["roomId"]  = alert_.to;

    const std::vector<std::string> headers = {
        "X-User-Id: " + acct->user_id,
        "X-Auth-Token: " + acct->auth_token,
        "Content-Type: application/json",
        "Accept: application/json"
    };

    HttpResponse res = transport_.post_json(url_origin(acct->base_url) + POST_PATH,
                                            headers, payload.dump());
    if (!res.ok()) {
        throw AlertError("watchdog: Rocket.Chat send failed " + std::to_string(res.status) +
                         ": " + res.body);
    }
    log_.info("watchdog: alert sent to " + alert_.to + ": " + text);
}
