#include "StatsFetcher.h"
#include "BeastHttpClient.h"
#include "StatsValidator.h"
#include "../core/Errors.h"
#include "../core/Logging.h"
#include <array>

namespace netscene {

namespace {

constexpr const char* EXHAUSTED_MESSAGE =
    "Failed to get valid response from any Pi-hole API endpoint. Check if Pi-hole is running and accessible, or if authentication is required.";

void transition(FetchState from, FetchState to){
    Logger::instance().trace(std::string("stats fetch: ") + to_string(from) + " -> " + to_string(to));
}

}

std::string body_preview(const std::string& body, size_t limit){
    if(body.size() <= limit) return body;
    size_t cut = limit;
    while(cut > 0 && (static_cast<unsigned char>(body[cut]) & 0xC0) == 0x80) --cut;
    return body.substr(0, cut) + "...";
}

const char* to_string(FetchState state){
    switch(state){
        case FetchState::Authenticating: return "Authenticating";
        case FetchState::ProbingModern: return "ProbingModern";
        case FetchState::ProbingLegacy: return "ProbingLegacy";
        case FetchState::Succeeded: return "Succeeded";
        case FetchState::Exhausted: return "Exhausted";
    }
    return "Unknown";
}

bool looks_like_html(const std::string& body){
    size_t i = body.find_first_not_of(" \t\r\n\f\v");
    if(i == std::string::npos) return false;
    return body.compare(i, 9, "<!DOCTYPE") == 0 || body.compare(i, 5, "<html") == 0;
}

ProbeOutcome StatsFetcher::probe(const EndpointCandidate& candidate, const std::optional<SessionCredential>& credential){
    auto& log = Logger::instance();
    log.debug("Trying " + candidate.label + " endpoint: " + candidate.url.to_string());

    HttpRequest req;
    req.method = HttpMethod::Get;
    req.url = candidate.url;
    if(credential) req.headers.emplace_back(options_.session_header, credential->session_id);

    HttpResponse res;
    try {
        res = client_.send(req);
    } catch(const PiholeError& ex) {
        return ProbeOutcome::skipped(candidate.label + " request failed: " + ex.what());
    }
    log.debug(candidate.label + " response status: " + std::to_string(res.status));
    if(!res.success())
        return ProbeOutcome::skipped(candidate.label + " " + PiholeError::server_status(res.status).what());

    log.debug(candidate.label + " response body length: " + std::to_string(res.body.size()) + " bytes");
    if(res.body.empty())
        return ProbeOutcome::skipped(candidate.label + " returned empty response");
    log.debug(candidate.label + " response preview: " + body_preview(res.body));

    if(looks_like_html(res.body))
        return ProbeOutcome::skipped(candidate.label + " returned HTML response (likely login page)");

    Stats stats;
    try {
        stats = parse_stats_json(res.body);
    } catch(const PiholeError& ex) {
        return ProbeOutcome::skipped(candidate.label + " " + ex.what());
    }
    try {
        validate_stats(stats);
    } catch(const PiholeError& ex) {
        return ProbeOutcome::rejected(ex.detail());
    }
    return ProbeOutcome::accepted(std::move(stats));
}

Stats StatsFetcher::fetch(const std::string& host, const std::optional<std::string>& password){
    auto& log = Logger::instance();
    log.info("Requesting Pi-hole stats from host: " + host);

    EndpointPair endpoints = resolve_endpoints(host);

    FetchState state = FetchState::Authenticating;
    std::optional<SessionCredential> credential;
    if(password) credential = SessionAuthenticator(client_).authenticate(host, password);

    const std::array<std::pair<FetchState, const EndpointCandidate*>, 2> order{{
        {FetchState::ProbingModern, &endpoints.modern},
        {FetchState::ProbingLegacy, &endpoints.legacy}
    }};
    for(const auto& step : order){
        transition(state, step.first);
        state = step.first;
        ProbeOutcome outcome = probe(*step.second, credential);
        switch(outcome.kind){
            case ProbeOutcome::Kind::Accepted: {
                transition(state, FetchState::Succeeded);
                const Stats& s = *outcome.stats;
                log.info("Successfully retrieved Pi-hole stats using " + step.second->label + ": status=" + s.status
                         + ", blocked_today=" + std::to_string(s.ads_blocked_today));
                return std::move(*outcome.stats);
            }
            case ProbeOutcome::Kind::Rejected:
                throw PiholeError(ErrorKind::ValidationError, outcome.reason);
            case ProbeOutcome::Kind::Skipped:
                log.debug(outcome.reason + ", trying next endpoint");
                break;
        }
    }
    transition(state, FetchState::Exhausted);
    throw PiholeError(ErrorKind::JsonError, EXHAUSTED_MESSAGE);
}

Stats get_stats(const std::string& host, const std::optional<std::string>& password,
                HttpClient& client, const FetchOptions& options){
    return StatsFetcher(client, options).fetch(host, password);
}

Stats get_stats(const std::string& host, const std::optional<std::string>& password){
    BeastHttpClient client;
    return get_stats(host, password, client);
}

}
