#pragma once

#include "network/IHttpClient.h"
#include "network/RateLimiter.h"
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace emis {
namespace network {

class CurlHttpClient : public IHttpClient {
public:
    CurlHttpClient(const std::string& base_url, int max_requests_per_second, long timeout_seconds);
    ~CurlHttpClient();

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResponse get(
        const std::string& endpoint,
        const std::map<std::string, std::string>& query_params = {}
    ) override;

private:
    std::string base_url_;
    long timeout_seconds_;
    CURL* curl_;
    std::mutex mutex_;
    std::shared_ptr<RateLimiter> rate_limiter_;

    HttpResponse performRequest(const std::string& url,
                                const std::map<std::string, std::string>& headers);

    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata);

    std::string buildQueryString(const std::map<std::string, std::string>& params);
};

} // namespace network
} // namespace emis
