#include "PiholeStatsTask.h"
#include "BeastHttpClient.h"
#include "StatsFetcher.h"
#include "../core/TaskContext.h"

namespace netscene {

PiholeStatsTask::PiholeStatsTask()
    : make_client_([](const ClientOptions& o){ return std::make_unique<BeastHttpClient>(o); }) {}

ClientOptions client_options(const Config& cfg){
    ClientOptions o;
    o.timeout = std::chrono::seconds(cfg.timeout_seconds);
    o.user_agent = cfg.user_agent;
    o.verify_tls = !cfg.insecure;
    return o;
}

void PiholeStatsTask::run(TaskContext& context){
    const Config& cfg = context.config;
    // fresh client per call, nothing carried over between fetches
    auto client = make_client_(client_options(cfg));
    FetchOptions fetch_opts;
    fetch_opts.session_header = cfg.session_header;
    context.report.set_stats(get_stats(cfg.host, cfg.password, *client, fetch_opts));
}

}
