#include "exchange/HttpTransport.hpp"
#include "core/StrikeError.hpp"
#include <stdexcept>

using namespace strikebox;

CurlTransport::CurlTransport(long timeout_sec, long connect_timeout_sec)
    : timeout_sec_(timeout_sec), connect_timeout_sec_(connect_timeout_sec) {
    curl_ = curl_easy_init();
    if (!curl_) throw std::runtime_error("[HTTP] curl_easy_init failed");
}

CurlTransport::~CurlTransport() {
    if (curl_) {
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
    }
    // curl_global_cleanup() belongs to main(), after every handle is gone.
}

size_t CurlTransport::write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    std::string* out = reinterpret_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

HttpResponse CurlTransport::post(const std::string& url,
                                 const std::vector<std::string>& headers,
                                 const std::string& body) {
    struct curl_slist* hdrs = nullptr;
    for (const auto& h : headers)
        hdrs = curl_slist_append(hdrs, h.c_str());

    HttpResponse resp;

    curl_easy_setopt(curl_, CURLOPT_URL,            url.c_str());
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER,     hdrs);
    curl_easy_setopt(curl_, CURLOPT_POST,           1L);
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDS,     body.c_str());
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE,  static_cast<long>(body.size()));
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION,  write_cb);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA,      &resp.body);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT,        timeout_sec_);
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, connect_timeout_sec_);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL,       1L);

    CURLcode res = curl_easy_perform(curl_);

    // Handle keeps a pointer to the list; detach before freeing it.
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, nullptr);
    curl_slist_free_all(hdrs);

    if (res != CURLE_OK)
        throw StrikeError(ErrorCode::TransportError,
                          std::string("curl: ") + curl_easy_strerror(res));

    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &resp.status);
    return resp;
}
