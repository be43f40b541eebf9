#include "SessionAuthenticator.h"
#include "HostResolver.h"
#include "../core/Errors.h"
#include "../core/Logging.h"
#include <nlohmann/json.hpp>

namespace netscene {

SessionCredential parse_auth_response(const std::string& body){
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(body);
    } catch(const nlohmann::json::parse_error& ex) {
        throw PiholeError(ErrorKind::JsonError, ex.what());
    }
    if(!doc.is_object() || !doc.contains("session") || !doc["session"].is_object())
        throw PiholeError(ErrorKind::JsonError, "missing field `session`");
    const auto& session = doc["session"];
    auto sid = session.find("sid");
    if(sid == session.end() || !sid->is_string())
        throw PiholeError(ErrorKind::JsonError, "missing field `sid`");
    if(auto valid = session.find("valid"); valid != session.end() && valid->is_boolean() && !valid->get<bool>())
        Logger::instance().debug("Auth response reports session as not valid");
    return SessionCredential{sid->get<std::string>()};
}

std::optional<SessionCredential> SessionAuthenticator::authenticate(const std::string& host, const std::optional<std::string>& password){
    if(!password) return std::nullopt;
    try {
        HttpRequest req;
        req.method = HttpMethod::Post;
        req.url = auth_url(host);
        req.body = nlohmann::json{{"password", *password}}.dump();
        Logger::instance().debug("Attempting authentication with: " + req.url.to_string());

        HttpResponse res = client_.send(req);
        if(!res.success()){
            Logger::instance().debug("Authentication failed with status: " + std::to_string(res.status));
            return std::nullopt;
        }
        auto credential = parse_auth_response(res.body);
        Logger::instance().debug("Authentication successful, SID obtained");
        return credential;
    } catch(const PiholeError& ex) {
        Logger::instance().debug(std::string("Authentication failed, continuing without auth: ") + ex.what());
        return std::nullopt;
    } catch(const nlohmann::json::exception& ex) {
        Logger::instance().debug(std::string("Authentication request could not be encoded: ") + ex.what());
        return std::nullopt;
    }
}

}
