#include "chanarc/https_transport.h"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <utility>

namespace chanarc {

namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = net::ip::tcp;

HttpsTransport::HttpsTransport(const HttpsTransportConfig& config)
    : config_(config),
      ssl_ctx_(ssl::context::tls_client) {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(ssl::verify_peer);
}

HttpsTransport::~HttpsTransport() = default;

TransportResult HttpsTransport::get(const std::string& target, HttpResponse& response) {
    response = HttpResponse();
    beast::error_code ec;

    tcp::resolver resolver(ioc_);
    beast::ssl_stream<beast::tcp_stream> stream(ioc_, ssl_ctx_);

    // SNI is required by most TLS front ends
    if (!SSL_set_tlsext_host_name(stream.native_handle(), config_.host.c_str())) {
        ec.assign(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
        last_error_ = "Failed to set SNI host name: " + ec.message();
        return TransportResult::ERR_NETWORK;
    }
    stream.set_verify_callback(ssl::host_name_verification(config_.host));

    auto const results = resolver.resolve(config_.host, config_.port, ec);
    if (ec) {
        last_error_ = "Resolve " + config_.host + " failed: " + ec.message();
        return TransportResult::ERR_NETWORK;
    }

    beast::get_lowest_layer(stream).expires_after(config_.timeout);
    beast::get_lowest_layer(stream).connect(results, ec);
    if (ec) {
        last_error_ = "Connect failed: " + ec.message();
        return ec == beast::error::timeout ? TransportResult::ERR_TIMEOUT
                                           : TransportResult::ERR_NETWORK;
    }

    stream.handshake(ssl::stream_base::client, ec);
    if (ec) {
        last_error_ = "TLS handshake failed: " + ec.message();
        return ec == beast::error::timeout ? TransportResult::ERR_TIMEOUT
                                           : TransportResult::ERR_NETWORK;
    }

    http::request<http::empty_body> req{http::verb::get, target, 11};
    req.set(http::field::host, config_.host);
    req.set(http::field::user_agent, config_.user_agent);
    req.set(http::field::authorization, config_.authorization);
    req.set(http::field::accept, "application/json");

    http::write(stream, req, ec);
    if (ec) {
        last_error_ = "Request write failed: " + ec.message();
        return ec == beast::error::timeout ? TransportResult::ERR_TIMEOUT
                                           : TransportResult::ERR_NETWORK;
    }

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(stream, buffer, res, ec);
    if (ec) {
        last_error_ = "Response read failed: " + ec.message();
        return ec == beast::error::timeout ? TransportResult::ERR_TIMEOUT
                                           : TransportResult::ERR_NETWORK;
    }

    response.status_code = static_cast<int>(res.result_int());
    response.body = std::move(res.body());
    auto retry_after = res.find(http::field::retry_after);
    if (retry_after != res.end()) {
        response.retry_after = std::string(retry_after->value());
    }

    // Servers commonly drop the connection without close_notify
    stream.shutdown(ec);
    if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
        // The response is complete; a dirty shutdown does not invalidate it
        last_error_ = "TLS shutdown: " + ec.message();
    }

    return TransportResult::SUCCESS;
}

}  // namespace chanarc
