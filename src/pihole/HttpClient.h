#pragma once
#include "../core/Url.h"
#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace netscene {

enum class HttpMethod { Get, Post };

struct HttpRequest {
    HttpMethod method = HttpMethod::Get;
    Url url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body; // sent as application/json when non-empty
};

struct HttpResponse {
    int status = 0;
    std::string body;
    bool success() const { return status >= 200 && status < 300; }
};

struct ClientOptions {
    std::chrono::seconds timeout{10};
    std::string user_agent = "NetScene/1.0";
    bool verify_tls = true;
};

// One blocking request/response exchange. Any transport failure, including the
// timeout, throws PiholeError(NetworkError); HTTP error statuses are returned.
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse send(const HttpRequest& request) = 0;
};

using HttpClientPtr = std::unique_ptr<HttpClient>;

}
