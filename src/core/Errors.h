#pragma once
#include <stdexcept>
#include <string>

namespace netscene {

enum class ErrorKind {
    InvalidHost,
    InvalidUrl,
    NetworkError,
    ServerError,
    ValidationError,
    JsonError
};

const char* to_string(ErrorKind kind);

// Failure of the Pi-hole retrieval protocol. what() carries the rendered message.
class PiholeError : public std::runtime_error {
public:
    PiholeError(ErrorKind kind, const std::string& detail);
    static PiholeError server_status(int status);

    ErrorKind kind() const noexcept { return kind_; }
    const std::string& detail() const noexcept { return detail_; }
    int status() const noexcept { return status_; } // ServerError only, 0 otherwise
private:
    PiholeError(ErrorKind kind, const std::string& detail, int status);
    ErrorKind kind_;
    std::string detail_;
    int status_ = 0;
};

class DiscoveryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}
