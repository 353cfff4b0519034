#pragma once
#include <string>
#include <vector>
#include <curl/curl.h>

namespace strikebox {

struct HttpResponse {
    long        status{0};
    std::string body;
};

// POST transport seam. Throws StrikeError(TransportError) when the request
// never produced an HTTP response.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse post(const std::string& url,
                              const std::vector<std::string>& headers,
                              const std::string& body) = 0;
};

// libcurl transport. Persistent easy handle, reused across calls so the TLS
// connection stays warm. curl_global_init() must already have run.
class CurlTransport : public HttpTransport {
public:
    CurlTransport(long timeout_sec = 10, long connect_timeout_sec = 5);
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    HttpResponse post(const std::string& url,
                      const std::vector<std::string>& headers,
                      const std::string& body) override;

private:
    static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata);

    CURL* curl_{nullptr};
    long  timeout_sec_;
    long  connect_timeout_sec_;
};

} // namespace strikebox
