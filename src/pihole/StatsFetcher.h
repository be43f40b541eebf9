#pragma once
#include "HostResolver.h"
#include "HttpClient.h"
#include "SessionAuthenticator.h"
#include "Stats.h"
#include <optional>
#include <string>

namespace netscene {

enum class FetchState { Authenticating, ProbingModern, ProbingLegacy, Succeeded, Exhausted };
const char* to_string(FetchState state);

// Classification of one endpoint attempt. Skipped moves on to the next candidate,
// Rejected (validation failure) ends the scan.
struct ProbeOutcome {
    enum class Kind { Accepted, Skipped, Rejected };
    Kind kind = Kind::Skipped;
    std::optional<Stats> stats;
    std::string reason;

    static ProbeOutcome accepted(Stats s){ return {Kind::Accepted, std::move(s), {}}; }
    static ProbeOutcome skipped(std::string why){ return {Kind::Skipped, std::nullopt, std::move(why)}; }
    static ProbeOutcome rejected(std::string why){ return {Kind::Rejected, std::nullopt, std::move(why)}; }
};

struct FetchOptions {
    std::string session_header = "X-Session-Credential";
};

// First `limit` bytes of body plus "..." when longer, never splitting a UTF-8 sequence.
std::string body_preview(const std::string& body, size_t limit = 200);

// True when the body (after leading whitespace) starts with "<!DOCTYPE" or "<html".
bool looks_like_html(const std::string& body);

// Probes the modern endpoint, then the legacy one, optionally after a best-effort
// login. Holds no state between fetch() calls.
class StatsFetcher {
public:
    explicit StatsFetcher(HttpClient& client, FetchOptions options = {})
        : client_(client), options_(std::move(options)) {}

    // Throws PiholeError: InvalidHost/InvalidUrl for a bad host, ValidationError when a
    // well-formed summary fails validation, JsonError when no endpoint produced one.
    Stats fetch(const std::string& host, const std::optional<std::string>& password);

    ProbeOutcome probe(const EndpointCandidate& candidate, const std::optional<SessionCredential>& credential);
private:
    HttpClient& client_;
    FetchOptions options_;
};

Stats get_stats(const std::string& host, const std::optional<std::string>& password,
                HttpClient& client, const FetchOptions& options = {});

// Uses a BeastHttpClient built with default ClientOptions (10 s timeout).
Stats get_stats(const std::string& host, const std::optional<std::string>& password);

}
