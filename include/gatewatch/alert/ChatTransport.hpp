#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace gatewatch {

class CancelToken;

struct HttpResponse {
    long        status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

// Minimal HTTP seam for the chat channel. Network failures throw AlertError;
// any HTTP status is returned to the caller.
class ChatTransport {
public:
    virtual ~ChatTransport() = default;

    virtual HttpResponse post_json(const std::string& url,
                                   const std::vector<std::string>& headers,
                                   const std::string& body) = 0;
};

// A tripped cancel token aborts a transfer in progress and fails any later
// post before it touches the network.
class CurlChatTransport : public ChatTransport {
public:
    explicit CurlChatTransport(std::chrono::seconds timeout = std::chrono::seconds(10),
                               std::chrono::seconds connect_timeout = std::chrono::seconds(5),
                               const CancelToken* cancel = nullptr);
    ~CurlChatTransport() override;

    CurlChatTransport(const CurlChatTransport&) = delete;
    CurlChatTransport& operator=(const CurlChatTransport&) = delete;

    HttpResponse post_json(const std::string& url,
                           const std::vector<std::string>& headers,
                           const std::string& body) override;

private:
    static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata);

    void*                curl_{nullptr};   // CURL*; kept opaque to keep curl.h out of the header
    std::chrono::seconds timeout_;
    std::chrono::seconds connect_timeout_;
    const CancelToken*   cancel_;
};

} // namespace gatewatch
