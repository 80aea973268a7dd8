#pragma once

#include <string>
#include <map>
#include <nlohmann/json.hpp>

namespace emis {
namespace network {

struct HttpResponse {
    int status_code = 0;
    std::string body;
    std::map<std::string, std::string> headers;

    bool isSuccess() const { return status_code >= 200 && status_code < 300; }
    bool isRateLimited() const { return status_code == 429; }
    bool isNotFound() const { return status_code == 404; }
    // 5xx and 429 are worth retrying; other 4xx are not
    bool isTransient() const { return status_code >= 500 || status_code == 429; }

    nlohmann::json json() const {
        return nlohmann::json::parse(body);
    }
};

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    // Throws std::runtime_error on transport failure (DNS, TLS, timeout)
    virtual HttpResponse get(
        const std::string& endpoint,
        const std::map<std::string, std::string>& query_params = {}
    ) = 0;
};

} // namespace network
} // namespace emis
