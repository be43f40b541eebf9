#pragma once
#include "../core/Url.h"
#include <string>

namespace netscene {

constexpr const char* MODERN_STATS_PATH = "/api/stats/summary";
constexpr const char* LEGACY_STATS_PATH = "/admin/api.php";
constexpr const char* LEGACY_STATS_QUERY = "summaryRaw";
constexpr const char* AUTH_PATH = "/api/auth";

struct EndpointCandidate {
    std::string label; // diagnostic name
    Url url;
};

struct EndpointPair {
    EndpointCandidate legacy;
    EndpointCandidate modern;
};

// Trims the host, defaults the scheme to http:// when none of http:// or https:// is
// present and parses the result. Throws PiholeError(InvalidHost) for blank input and
// PiholeError(InvalidUrl) for malformed input.
Url normalize_base_url(const std::string& host);

// Both candidates share the base scheme and authority and differ only in path/query.
EndpointPair resolve_endpoints(const std::string& host);

Url auth_url(const std::string& host);

}
