#include "fakes.hpp"
#include "gatewatch/alert/AlertSink.hpp"
#include "gatewatch/core/CancelToken.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <cassert>
#include <cstdio>

using namespace gatewatch;
using namespace gatewatch::test;
using json = nlohmann::json;

namespace {

RocketChatChannelConfig flat_account() {
    RocketChatChannelConfig rc;
    rc.flat = {"https://chat.example.com/", "u1", "t1"};
    return rc;
}

bool has_header(const RecordingTransport& t, const std::string& h) {
    return std::find(t.last_headers.begin(), t.last_headers.end(), h) != t.last_headers.end();
}

void test_empty_destination_logs_only() {
    RecordingTransport transport;
    RecordingLogger log;
    AlertConfig alert;   // to == ""

    RocketChatAlertSink sink(alert, flat_account(), transport, log);
    sink.send("watchdog: gateway DOWN (failures=1) @ t");
    assert(transport.posts == 0);
    assert(log.infos.size() == 1);
    assert(log.infos[0] == "watchdog: gateway DOWN (failures=1) @ t");
}

void test_empty_destination_without_account_still_succeeds() {
    RecordingTransport transport;
    RecordingLogger log;
    RocketChatAlertSink sink(AlertConfig{}, RocketChatChannelConfig{}, transport, log);
    sink.send("hello");
    assert(transport.posts == 0);
}

void test_unsupported_channel_degrades_to_log() {
    RecordingTransport transport;
    RecordingLogger log;
    AlertConfig alert{"slack", "#ops"};

    RocketChatAlertSink sink(alert, flat_account(), transport, log);
    sink.send("hello");
    assert(transport.posts == 0);
    assert(log.warns.size() == 1);
    assert(log.warns[0] == "watchdog: unsupported alert.channel=slack; logging only");
    assert(log.infos.size() == 1 && log.infos[0] == "hello");
}

void test_named_channel_post() {
    RecordingTransport transport;
    RecordingLogger log;
    AlertConfig alert{"rocketchat", "#ops"};

    RocketChatAlertSink sink(alert, flat_account(), transport, log);
    sink.send("down");
    assert(transport.posts == 1);
    assert(transport.last_url == "https://chat.example.com/api/v1/chat.postMessage");
    assert(has_header(transport, "X-User-Id: u1"));
    assert(has_header(transport, "X-Auth-Token: t1"));
    assert(has_header(transport, "Content-Type: application/json"));

    json body = json::parse(transport.last_body);
    assert(body["text"] == "down");
    assert(body["channel"] == "#ops");
    assert(!body.contains("roomId"));
    assert(log.any_info_contains("alert sent to #ops"));
}

void test_room_id_post() {
    RecordingTransport transport;
    RecordingLogger log;
    AlertConfig alert{"rocketchat", "GENERAL42"};

    RocketChatAlertSink sink(alert, flat_account(), transport, log);
    sink.send("up");
    json body = json::parse(transport.last_body);
    assert(body["roomId"] == "GENERAL42");
    assert(!body.contains("channel"));
}

void test_non_2xx_is_alert_error() {
    RecordingTransport transport;
    RecordingLogger log;
    transport.response = HttpResponse{401, "{\"status\":\"error\"}"};

    RocketChatAlertSink sink(AlertConfig{"rocketchat", "#ops"}, flat_account(), transport, log);
    std::string msg;
    try {
        sink.send("x");
    } catch (const AlertError& e) {
        msg = e.what();
    }
    assert(msg == "watchdog: Rocket.Chat send failed 401: {\"status\":\"error\"}");
}

void test_network_error_is_alert_error() {
    RecordingTransport transport;
    RecordingLogger log;
    transport.throw_network = true;

    RocketChatAlertSink sink(AlertConfig{"rocketchat", "#ops"}, flat_account(), transport, log);
    bool threw = false;
    try {
        sink.send("x");
    } catch (const AlertError&) {
        threw = true;
    }
    assert(threw);
}

void test_missing_account_is_alert_error() {
    RecordingTransport transport;
    RecordingLogger log;
    RocketChatChannelConfig rc;
    rc.flat = {"https://chat.example.com", "u1", ""};   // incomplete

    RocketChatAlertSink sink(AlertConfig{"rocketchat", "#ops"}, rc, transport, log);
    std::string msg;
    try {
        sink.send("x");
    } catch (const AlertError& e) {
        msg = e.what();
    }
    assert(msg == "watchdog: Rocket.Chat not configured (channels.rocketchat.*)");
    assert(transport.posts == 0);
}

void test_account_resolution() {
    RocketChatChannelConfig rc;
    assert(!resolve_rocketchat_account(rc));

    rc.default_account = RocketChatAccount{"https://b.example.com", "u2", "t2"};
    assert(resolve_rocketchat_account(rc)->user_id == "u2");

    // Flat wins when both are complete.
    rc.flat = {"https://a.example.com", "u1", "t1"};
    assert(resolve_rocketchat_account(rc)->user_id == "u1");

    rc.default_account = RocketChatAccount{"https://b.example.com", "", "t2"};
    assert(resolve_rocketchat_account(rc)->user_id == "u1");
}

void test_url_origin() {
    assert(url_origin("https://chat.example.com") == "https://chat.example.com");
    assert(url_origin("https://chat.example.com:3000/sub/path/") == "https://chat.example.com:3000");
    assert(url_origin("http://10.0.0.5/") == "http://10.0.0.5");
}

void test_cancelled_transport_fails_without_network() {
    CancelToken token;
    token.cancel();
    CurlChatTransport transport(std::chrono::seconds(10), std::chrono::seconds(5), &token);

    std::string msg;
    try {
        transport.post_json("http://192.0.2.1/api/v1/chat.postMessage", {}, "{}");
    } catch (const AlertError& e) {
        msg = e.what();
    }
    assert(msg == "watchdog: Rocket.Chat send cancelled");
}

} // namespace

int main() {
    test_empty_destination_logs_only();
    test_empty_destination_without_account_still_succeeds();
    test_unsupported_channel_degrades_to_log();
    test_named_channel_post();
    test_room_id_post();
    test_non_2xx_is_alert_error();
    test_network_error_is_alert_error();
    test_missing_account_is_alert_error();
    test_account_resolution();
    test_url_origin();
    test_cancelled_transport_fails_without_network();

    std::printf("test_alert_sink: OK\n");
    return 0;
}
