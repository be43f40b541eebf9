#include "BeastHttpClient.h"
#include "../core/Errors.h"
#include "../core/Logging.h"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <type_traits>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = net::ip::tcp;

namespace netscene {

namespace {

constexpr std::uint64_t BODY_LIMIT = 8 * 1024 * 1024;
constexpr int MAX_REDIRECTS = 10;

struct ExchangeResult {
    bool done = false;
    beast::error_code ec;
    std::string stage;
    HttpResponse response;
    std::string location;
};

bool is_ip_literal(const std::string& host){
    beast::error_code ec;
    net::ip::make_address(host, ec);
    return !ec;
}

// resolve -> connect -> [handshake] -> write -> read, completing into an ExchangeResult.
template <class Stream>
class Exchange : public std::enable_shared_from_this<Exchange<Stream>> {
    static constexpr bool is_tls = !std::is_same<Stream, beast::tcp_stream>::value;
public:
    template <class... Args>
    Exchange(net::io_context& ioc, ExchangeResult& result, std::chrono::steady_clock::time_point deadline, Args&&... args)
        : resolver_(ioc), stream_(std::forward<Args>(args)...), result_(result), deadline_(deadline) {
        parser_.body_limit(BODY_LIMIT);
    }

    void start(const Url& url, http::request<http::string_body> req, bool verify_host){
        req_ = std::move(req);
        host_ = url.host_for_connect();
        if constexpr (is_tls) {
            if(!is_ip_literal(host_) && !SSL_set_tlsext_host_name(stream_.native_handle(), host_.c_str())){
                return fail(beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()), "sni");
            }
            if(verify_host) stream_.set_verify_callback(ssl::host_name_verification(host_));
        }
        resolver_.async_resolve(host_, std::to_string(url.port_or_default()),
            [self = this->shared_from_this()](beast::error_code ec, tcp::resolver::results_type results){
                self->on_resolve(ec, results);
            });
    }

private:
    void fail(beast::error_code ec, const char* stage){
        if(result_.done) return;
        result_.ec = ec; result_.stage = stage; result_.done = true;
    }

    void on_resolve(beast::error_code ec, const tcp::resolver::results_type& results){
        if(ec) return fail(ec, "resolve");
        beast::get_lowest_layer(stream_).expires_at(deadline_);
        beast::get_lowest_layer(stream_).async_connect(results,
            [self = this->shared_from_this()](beast::error_code ec, const tcp::endpoint&){ self->on_connect(ec); });
    }

    void on_connect(beast::error_code ec){
        if(ec) return fail(ec, "connect");
        if constexpr (is_tls) {
            stream_.async_handshake(ssl::stream_base::client,
                [self = this->shared_from_this()](beast::error_code ec){ self->on_handshake(ec); });
        } else {
            write();
        }
    }

    void on_handshake(beast::error_code ec){
        if(ec) return fail(ec, "handshake");
        write();
    }

    void write(){
        http::async_write(stream_, req_,
            [self = this->shared_from_this()](beast::error_code ec, std::size_t){ self->on_write(ec); });
    }

    void on_write(beast::error_code ec){
        if(ec) return fail(ec, "write");
        http::async_read(stream_, buffer_, parser_,
            [self = this->shared_from_this()](beast::error_code ec, std::size_t){ self->on_read(ec); });
    }

    void on_read(beast::error_code ec){
        if(ec) return fail(ec, "read");
        auto res = parser_.release();
        result_.response.status = static_cast<int>(res.result_int());
        result_.response.body = std::move(res.body());
        auto location = res[http::field::location];
        result_.location.assign(location.data(), location.size());
        result_.done = true;
        beast::error_code ignored;
        beast::get_lowest_layer(stream_).socket().shutdown(tcp::socket::shutdown_both, ignored);
    }

    tcp::resolver resolver_;
    Stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    http::response_parser<http::string_body> parser_;
    ExchangeResult& result_;
    std::chrono::steady_clock::time_point deadline_;
    std::string host_;
};

http::request<http::string_body> build_request(const HttpRequest& request, const std::string& user_agent){
    const Url& url = request.url;
    http::request<http::string_body> req{
        request.method == HttpMethod::Post ? http::verb::post : http::verb::get, url.target(), 11};
    req.set(http::field::host, url.authority());
    req.set(http::field::user_agent, user_agent);
    req.set(http::field::accept, "application/json");
    for(const auto& h : request.headers) req.set(h.first, h.second);
    if(!request.body.empty()){
        req.set(http::field::content_type, "application/json");
        req.body() = request.body;
    }
    req.prepare_payload();
    return req;
}

bool is_redirect(int status){
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

ExchangeResult exchange(const HttpRequest& request, const ClientOptions& options,
                        std::chrono::steady_clock::time_point deadline){
    const Url& url = request.url;
    Logger::instance().trace(std::string(request.method == HttpMethod::Post ? "POST " : "GET ") + url.to_string());

    ExchangeResult result;
    try {
        ssl::context tls_ctx{ssl::context::tls_client};
        if(url.scheme() == "https"){
            if(options.verify_tls){
                tls_ctx.set_default_verify_paths();
                tls_ctx.set_verify_mode(ssl::verify_peer);
            } else {
                tls_ctx.set_verify_mode(ssl::verify_none);
            }
        }
        net::io_context ioc;
        auto req = build_request(request, options.user_agent);
        if(url.scheme() == "https"){
            std::make_shared<Exchange<beast::ssl_stream<beast::tcp_stream>>>(ioc, result, deadline, ioc, tls_ctx)
                ->start(url, std::move(req), options.verify_tls);
        } else {
            std::make_shared<Exchange<beast::tcp_stream>>(ioc, result, deadline, ioc)
                ->start(url, std::move(req), false);
        }
        while(!result.done){
            if(ioc.run_one_until(deadline) == 0) break;
        }
    } catch(const boost::system::system_error& ex) {
        throw PiholeError(ErrorKind::NetworkError, url.to_string() + ": " + ex.what());
    }

    if(!result.done)
        throw PiholeError(ErrorKind::NetworkError, url.to_string() + ": timed out after " + std::to_string(options.timeout.count()) + "s");
    if(result.ec)
        throw PiholeError(ErrorKind::NetworkError, url.to_string() + ": " + result.stage + ": " + result.ec.message());
    return result;
}

}

HttpResponse BeastHttpClient::send(const HttpRequest& request){
    auto deadline = std::chrono::steady_clock::now() + options_.timeout;
    HttpRequest current = request;
    for(int hop = 0;; ++hop){
        ExchangeResult result = exchange(current, options_, deadline);
        int status = result.response.status;
        if(!is_redirect(status) || result.location.empty()) return std::move(result.response);
        if(hop == MAX_REDIRECTS)
            throw PiholeError(ErrorKind::NetworkError, request.url.to_string() + ": too many redirects");

        Url next;
        try {
            next = current.url.resolve(result.location);
        } catch(const PiholeError& ex) {
            Logger::instance().debug("Ignoring redirect to '" + result.location + "': " + ex.what());
            return std::move(result.response);
        }
        Logger::instance().debug("Following " + std::to_string(status) + " redirect to " + next.to_string());
        // 303, and 301/302 after a POST, continue as a GET without a body
        if(status == 303 || ((status == 301 || status == 302) && current.method == HttpMethod::Post)){
            current.method = HttpMethod::Get;
            current.body.clear();
        }
        current.url = std::move(next);
    }
}

}
