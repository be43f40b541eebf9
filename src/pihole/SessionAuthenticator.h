#pragma once
#include "HttpClient.h"
#include <optional>
#include <string>

namespace netscene {

struct SessionCredential {
    std::string session_id;
    bool operator==(const SessionCredential& o) const { return session_id == o.session_id; }
};

// Best-effort password exchange against /api/auth. No password means no request.
// Every failure (bad host, transport, non-2xx, unexpected body) is logged and
// reported as std::nullopt, never thrown.
class SessionAuthenticator {
public:
    explicit SessionAuthenticator(HttpClient& client) : client_(client) {}
    std::optional<SessionCredential> authenticate(const std::string& host, const std::optional<std::string>& password);
private:
    HttpClient& client_;
};

// Extracts session.sid from an auth response body. Throws PiholeError(JsonError).
SessionCredential parse_auth_response(const std::string& body);

}
