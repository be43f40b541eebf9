#pragma once
#include "HttpClient.h"

namespace netscene {

// HTTP/1.1 client over Boost.Beast. Each send() builds its own io_context (and TLS
// context for https) so no connection state outlives the call.
class BeastHttpClient : public HttpClient {
public:
    explicit BeastHttpClient(ClientOptions options = {}) : options_(std::move(options)) {}
    HttpResponse send(const HttpRequest& request) override;
    const ClientOptions& options() const { return options_; }
private:
    ClientOptions options_;
};

}
