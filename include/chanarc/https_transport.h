#ifndef CHANARC_HTTPS_TRANSPORT_H_
#define CHANARC_HTTPS_TRANSPORT_H_

#include "transport.h"
#include <chrono>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

namespace chanarc {

/// HTTPS transport settings
struct HttpsTransportConfig {
    std::string host = "discord.com";
    std::string port = "443";
    std::string authorization;                      // sent verbatim as Authorization
    std::string user_agent = "chanarc (https://github.com/chanarc/chanarc, 1.0)";
    std::chrono::seconds timeout{30};
};

/// Blocking HTTPS client over Boost.Beast + OpenSSL, one connection per request
class HttpsTransport : public ITransport {
public:
    explicit HttpsTransport(const HttpsTransportConfig& config);
    ~HttpsTransport() override;

    HttpsTransport(const HttpsTransport&) = delete;
    HttpsTransport& operator=(const HttpsTransport&) = delete;

    TransportResult get(const std::string& target, HttpResponse& response) override;

    std::string getLastError() const override { return last_error_; }

private:
    HttpsTransportConfig config_;
    boost::asio::io_context ioc_;
    boost::asio::ssl::context ssl_ctx_;
    std::string last_error_;
};

}  // namespace chanarc

#endif  // CHANARC_HTTPS_TRANSPORT_H_
