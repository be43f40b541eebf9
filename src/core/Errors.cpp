#include "Errors.h"

namespace netscene {

const char* to_string(ErrorKind kind){
    switch(kind){
        case ErrorKind::InvalidHost: return "InvalidHost";
        case ErrorKind::InvalidUrl: return "InvalidUrl";
        case ErrorKind::NetworkError: return "NetworkError";
        case ErrorKind::ServerError: return "ServerError";
        case ErrorKind::ValidationError: return "ValidationError";
        case ErrorKind::JsonError: return "JsonError";
    }
    return "Unknown";
}

namespace {
std::string render(ErrorKind kind, const std::string& detail){
    switch(kind){
        case ErrorKind::InvalidHost: return "Invalid host format: " + detail;
        case ErrorKind::InvalidUrl: return "Invalid URL: " + detail;
        case ErrorKind::NetworkError: return "Network request failed: " + detail;
        case ErrorKind::ServerError: return "Server returned non-success status: " + detail;
        case ErrorKind::ValidationError: return "Response validation failed: " + detail;
        case ErrorKind::JsonError: return "JSON parsing failed: " + detail;
    }
    return detail;
}
}

PiholeError::PiholeError(ErrorKind kind, const std::string& detail)
    : PiholeError(kind, detail, 0) {}

PiholeError::PiholeError(ErrorKind kind, const std::string& detail, int status)
    : std::runtime_error(render(kind, detail)), kind_(kind), detail_(detail), status_(status) {}

PiholeError PiholeError::server_status(int status){
    return PiholeError(ErrorKind::ServerError, std::to_string(status), status);
}

}
