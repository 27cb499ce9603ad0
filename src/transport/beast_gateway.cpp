#include "wopan/transport/beast_gateway.hpp"

#include "wopan/network/multipart.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/ssl.h>

namespace wopan::transport {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace {

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

/**
 * Start one async operation and drive the io_context until it completes.
 * Beast's stream timeouts only apply to async operations.
 */
template<typename Initiator>
beast::error_code run_until_complete(asio::io_context& ioc, Initiator&& initiate) {
    beast::error_code result = asio::error::would_block;
    initiate([&result](beast::error_code ec, auto&&...) { result = ec; });
    ioc.restart();
    ioc.run();
    return result;
}

Expected<TransportResponse> transport_error(const std::string& stage, const beast::error_code& ec) {
    return Err<TransportResponse>(make_error(ErrorKind::TransientTransport, stage + " failed: " + ec.message()));
}

template<typename Stream>
Expected<TransportResponse> exchange(asio::io_context& ioc,
                                     Stream& stream,
                                     HttpRequest& request,
                                     std::chrono::seconds timeout) {
    beast::get_lowest_layer(stream).expires_after(timeout);
    auto ec = run_until_complete(ioc, [&](auto handler) {
        http::async_write(stream, request, std::move(handler));
    });
    if (ec) {
        return transport_error("Write", ec);
    }

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(16 * 1024 * 1024);

    beast::get_lowest_layer(stream).expires_after(timeout);
    ec = run_until_complete(ioc, [&](auto handler) {
        http::async_read(stream, buffer, parser, std::move(handler));
    });
    if (ec) {
        return transport_error("Read", ec);
    }

    HttpResponse response = parser.release();
    TransportResponse out;
    out.status_code = static_cast<int>(response.result_int());
    out.body = std::move(response.body());
    return Ok<TransportResponse, Error>(std::move(out));
}

HttpRequest build_request(const ChunkRequest& request, const ParsedUrl& url) {
    network::MultipartWriter writer;
    for (const auto& [name, value] : request.fields) {
        writer.add_field(name, value);
    }
    static const std::vector<std::uint8_t> kEmpty;
    writer.add_file(request.file_field, request.file_name, request.file_content_type,
                    request.file_data ? *request.file_data : kEmpty);

    HttpRequest req{http::verb::post, url.target, 11};
    req.set(http::field::host, url.authority());
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    req.set(http::field::content_type, writer.content_type());
    req.body() = writer.finish();
    req.prepare_payload();
    return req;
}

} // namespace

std::string ParsedUrl::authority() const {
    const char* default_port = tls ? "443" : "80";
    return port == default_port ? host : host + ":" + port;
}

Expected<ParsedUrl> parse_url(const std::string& url) {
    ParsedUrl parsed;
    std::string rest;
    if (url.rfind("https://", 0) == 0) {
        parsed.tls = true;
        rest = url.substr(8);
    } else if (url.rfind("http://", 0) == 0) {
        parsed.tls = false;
        rest = url.substr(7);
    } else {
        return Err<ParsedUrl>(make_error(ErrorKind::Validation, "Unsupported URL scheme: " + url));
    }

    const auto slash = rest.find('/');
    const std::string authority = rest.substr(0, slash);
    parsed.target = slash == std::string::npos ? "/" : rest.substr(slash);

    const auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        parsed.host = authority.substr(0, colon);
        parsed.port = authority.substr(colon + 1);
    } else {
        parsed.host = authority;
        parsed.port = parsed.tls ? "443" : "80";
    }

    if (parsed.host.empty() || parsed.port.empty()) {
        return Err<ParsedUrl>(make_error(ErrorKind::Validation, "Malformed URL: " + url));
    }
    return Ok<ParsedUrl, Error>(std::move(parsed));
}

BeastTransportGateway::BeastTransportGateway(bool verify_peer)
    : ssl_context_(ssl::context::tls_client) {
    ssl_context_.set_default_verify_paths();
    ssl_context_.set_verify_mode(verify_peer ? ssl::verify_peer : ssl::verify_none);
}

Expected<TransportResponse> BeastTransportGateway::post(const ChunkRequest& request) {
    auto url = parse_url(request.url);
    if (url.is_error()) {
        return Err<TransportResponse>(url.error());
    }
    const auto& target = url.value();
    auto http_request = build_request(request, target);

    asio::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::error_code ec;
    const auto endpoints = resolver.resolve(target.host, target.port, ec);
    if (ec) {
        return transport_error("Resolve " + target.host, ec);
    }

    if (!target.tls) {
        beast::tcp_stream stream(ioc);
        stream.expires_after(request.timeout);
        ec = run_until_complete(ioc, [&](auto handler) {
            stream.async_connect(endpoints, std::move(handler));
        });
        if (ec) {
            return transport_error("Connect", ec);
        }

        auto result = exchange(ioc, stream, http_request, request.timeout);
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        return result;
    }

    beast::ssl_stream<beast::tcp_stream> stream(ioc, ssl_context_);
    if (!SSL_set_tlsext_host_name(stream.native_handle(), target.host.c_str())) {
        return Err<TransportResponse>(make_error(ErrorKind::TransientTransport,
                                                 "Failed to set SNI host name " + target.host));
    }
    stream.set_verify_callback(ssl::host_name_verification(target.host));

    beast::get_lowest_layer(stream).expires_after(request.timeout);
    ec = run_until_complete(ioc, [&](auto handler) {
        beast::get_lowest_layer(stream).async_connect(endpoints, std::move(handler));
    });
    if (ec) {
        return transport_error("Connect", ec);
    }

    beast::get_lowest_layer(stream).expires_after(request.timeout);
    ec = run_until_complete(ioc, [&](auto handler) {
        stream.async_handshake(ssl::stream_base::client, std::move(handler));
    });
    if (ec) {
        return transport_error("TLS handshake", ec);
    }

    auto result = exchange(ioc, stream, http_request, request.timeout);

    // Many servers close without close_notify; the response is already complete
    beast::get_lowest_layer(stream).expires_after(std::chrono::seconds(5));
    run_until_complete(ioc, [&](auto handler) {
        stream.async_shutdown(std::move(handler));
    });
    return result;
}

} // namespace wopan::transport
