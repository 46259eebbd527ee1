#pragma once

#include "gatewatch/config/WatchdogConfig.hpp"
#include <string>

namespace gatewatch {

class ChatTransport;
class Logger;

// Delivers one human-readable status line. Throws AlertError when the
// configured destination could not be reached.
class AlertSink {
public:
    virtual ~AlertSink() = default;
    virtual void send(const std::string& text) = 0;
};

// ---------------------------------------------------------------------------
// Rocket.Chat sink with log-only degrade.
//
//   alert.to == ""            → logged at info, never posted
//   alert.channel unsupported → warning + logged, never posted
//   otherwise                 → POST {origin}/api/v1/chat.postMessage
//
// Destination "#name" posts to a named channel, anything else is a roomId.
// ---------------------------------------------------------------------------
class RocketChatAlertSink : public AlertSink {
public:
    static constexpr const char* CHANNEL_NAME = "rocketchat";
    static constexpr const char* POST_PATH    = "/api/v1/chat.postMessage";

    RocketChatAlertSink(AlertConfig alert, RocketChatChannelConfig channel,
                        ChatTransport& transport, Logger& log);

    void send(const std::string& text) override;

private:
    AlertConfig             alert_;
    RocketChatChannelConfig channel_;
    ChatTransport&          transport_;
    Logger&                 log_;
};

// Scheme + authority of a base URL: "https://chat.example.com/sub/" →
// "https://chat.example.com". The post path is absolute.
std::string url_origin(const std::string& base_url);

} // namespace gatewatch
