#pragma once
#include "../core/Task.h"
#include "HttpClient.h"
#include <functional>

namespace netscene {

struct Config;

class PiholeStatsTask : public Task {
public:
    using ClientFactory = std::function<HttpClientPtr(const ClientOptions&)>;
    PiholeStatsTask();
    explicit PiholeStatsTask(ClientFactory factory) : make_client_(std::move(factory)) {}

    std::string name() const override { return "pihole"; }
    std::string description() const override { return "Fetches ad-blocking summary statistics from a Pi-hole"; }
    void run(TaskContext& context) override;
private:
    ClientFactory make_client_;
};

ClientOptions client_options(const Config& cfg);

}
