#pragma once

#include "wopan/transport/gateway.hpp"

#include <boost/asio/ssl/context.hpp>

#include <string>

namespace wopan::transport {

struct ParsedUrl {
    bool tls = true;
    std::string host;
    std::string port;
    std::string target;

    /// Host header value; the port is kept unless it is the scheme default
    std::string authority() const;
};

/**
 * @brief Split an absolute http(s) URL into host, port and request target
 */
Expected<ParsedUrl> parse_url(const std::string& url);

/**
 * @brief TransportGateway over Boost.Beast, one connection per request
 *
 * Every call owns its own io_context, so one gateway may be shared by
 * concurrent sessions. The request timeout covers connect, TLS handshake,
 * write and read separately.
 */
class BeastTransportGateway final : public TransportGateway {
public:
    explicit BeastTransportGateway(bool verify_peer = true);

    Expected<TransportResponse> post(const ChunkRequest& request) override;

private:
    boost::asio::ssl::context ssl_context_;
};

} // namespace wopan::transport
