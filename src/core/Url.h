#pragma once
#include <string>
#include <optional>
#include <cstdint>

namespace netscene {

// Absolute http(s) URL. Hosts are stored lowercased; a port equal to the scheme
// default is dropped on parse.
class Url {
public:
    // Throws PiholeError(InvalidUrl) with a structural message on malformed input.
    static Url parse(const std::string& input);

    const std::string& scheme() const { return scheme_; }
    const std::string& userinfo() const { return userinfo_; }
    const std::string& host() const { return host_; }
    std::optional<uint16_t> port() const { return port_; }
    uint16_t port_or_default() const;
    const std::string& path() const { return path_; }
    const std::optional<std::string>& query() const { return query_; }
    const std::optional<std::string>& fragment() const { return fragment_; }

    void set_path(const std::string& path);
    void set_query(std::optional<std::string> query){ query_ = std::move(query); }
    void set_fragment(std::optional<std::string> fragment){ fragment_ = std::move(fragment); }

    // Resolves a reference (absolute, scheme-relative, absolute-path or relative-path,
    // as found in a Location header) against this URL. Throws like parse().
    Url resolve(const std::string& reference) const;

    // Host without IPv6 brackets, as handed to the resolver.
    std::string host_for_connect() const;
    // "host[:port]" for the Host header.
    std::string authority() const;
    // "path[?query]" for the request line.
    std::string target() const;
    std::string to_string() const;

    bool operator==(const Url& o) const { return to_string() == o.to_string(); }
    bool operator!=(const Url& o) const { return !(*this == o); }
private:
    std::string scheme_;
    std::string userinfo_;
    std::string host_;
    std::optional<uint16_t> port_;
    std::string path_ = "/";
    std::optional<std::string> query_;
    std::optional<std::string> fragment_;
};

uint16_t default_port(const std::string& scheme);

}
