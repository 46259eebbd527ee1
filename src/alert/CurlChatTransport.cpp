#include "gatewatch/alert/ChatTransport.hpp"
#include "gatewatch/core/CancelToken.hpp"
#include "gatewatch/core/Errors.hpp"
#include <curl/curl.h>

using namespace gatewatch;

namespace {

// Non-zero return makes curl abort with CURLE_ABORTED_BY_CALLBACK.
int xferinfo_cb(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const CancelToken* cancel = static_cast<const CancelToken*>(clientp);
    return cancel->cancelled() ? 1 : 0;
}

} // namespace

// Persistent easy handle. Only the timer thread posts, so no locking.
CurlChatTransport::CurlChatTransport(std::chrono::seconds timeout,
                                     std::chrono::seconds connect_timeout,
                                     const CancelToken* cancel)
    : timeout_(timeout), connect_timeout_(connect_timeout), cancel_(cancel) {
    curl_ = curl_easy_init();
    if (!curl_) throw AlertError("curl_easy_init failed");
}

CurlChatTransport::~CurlChatTransport() {
    if (curl_) {
        curl_easy_cleanup(static_cast<CURL*>(curl_));
        curl_ = nullptr;
    }
}

size_t CurlChatTransport::write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    std::string* out = reinterpret_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

HttpResponse CurlChatTransport::post_json(const std::string& url,
                                          const std::vector<std::string>& headers,
                                          const std::string& body) {
    if (cancel_ && cancel_->cancelled()) {
        throw AlertError("watchdog: Rocket.Chat send cancelled");
    }

    CURL* c = static_cast<CURL*>(curl_);
    curl_easy_reset(c);

    struct curl_slist* hdrs = nullptr;
    for (const auto& h : headers) hdrs = curl_slist_append(hdrs, h.c_str());

    HttpResponse res;
    curl_easy_setopt(c, CURLOPT_URL,            url.c_str());
    curl_easy_setopt(c, CURLOPT_HTTPHEADER,     hdrs);
    curl_easy_setopt(c, CURLOPT_POST,           1L);
    curl_easy_setopt(c, CURLOPT_POSTFIELDS,     body.c_str());
    curl_easy_setopt(c, CURLOPT_POSTFIELDSIZE,  static_cast<long>(body.size()));
    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION,  write_cb);
    curl_easy_setopt(c, CURLOPT_WRITEDATA,      &res.body);
    curl_easy_setopt(c, CURLOPT_TIMEOUT,        static_cast<long>(timeout_.count()));
    curl_easy_setopt(c, CURLOPT_CONNECTTIMEOUT, static_cast<long>(connect_timeout_.count()));
    curl_easy_setopt(c, CURLOPT_NOSIGNAL,       1L);   // timer thread; no SIGALRM for DNS timeouts
    if (cancel_) {
        curl_easy_setopt(c, CURLOPT_XFERINFOFUNCTION, xferinfo_cb);
        curl_easy_setopt(c, CURLOPT_XFERINFODATA,     const_cast<CancelToken*>(cancel_));
        curl_easy_setopt(c, CURLOPT_NOPROGRESS,       0L);
    }

    CURLcode rc = curl_easy_perform(c);
    curl_slist_free_all(hdrs);

    if (rc != CURLE_OK) {
        throw AlertError(std::string("watchdog: Rocket.Chat send failed: ") + curl_easy_strerror(rc));
    }

    curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &res.status);
    return res;
}
