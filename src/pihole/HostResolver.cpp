#include "HostResolver.h"
#include "../core/Errors.h"
#include "../core/Logging.h"
#include "../core/Utils.h"

namespace netscene {

namespace {

Url with_path(const Url& base, const char* path, std::optional<std::string> query){
    Url u = base;
    u.set_path(path);
    u.set_query(std::move(query));
    u.set_fragment(std::nullopt);
    return u;
}

}

Url normalize_base_url(const std::string& host){
    std::string trimmed = utils::trim(host);
    if(trimmed.empty()) throw PiholeError(ErrorKind::InvalidHost, "Host cannot be empty");
    std::string url_string = (utils::starts_with(trimmed, "http://") || utils::starts_with(trimmed, "https://"))
        ? trimmed : "http://" + trimmed;
    return Url::parse(url_string);
}

EndpointPair resolve_endpoints(const std::string& host){
    Url base = normalize_base_url(host);
    EndpointPair pair{
        {"legacy API", with_path(base, LEGACY_STATS_PATH, std::string(LEGACY_STATS_QUERY))},
        {"modern API", with_path(base, MODERN_STATS_PATH, std::nullopt)}
    };
    Logger::instance().debug("Legacy Pi-hole URL: " + pair.legacy.url.to_string());
    Logger::instance().debug("Modern Pi-hole URL: " + pair.modern.url.to_string());
    return pair;
}

Url auth_url(const std::string& host){
    return with_path(normalize_base_url(host), AUTH_PATH, std::nullopt);
}

}
