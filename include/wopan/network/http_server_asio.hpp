#pragma once

#include "wopan/network/http_parser.hpp"
#include "wopan/network/http_types.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <array>
#include <functional>
#include <memory>

namespace wopan {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

using HttpRequestHandler = std::function<HttpResponse(const HttpRequest&)>;

/**
 * @brief One accepted client: read a request, run the handler, write, close
 *
 * Kept alive by the shared_ptr captured in each pending async operation.
 * The handler runs on the io_context thread that completed the read, so a
 * long upload occupies that thread until it finishes.
 */
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    HttpConnection(tcp::socket socket, HttpRequestHandler handler, std::size_t max_body_size);

    void start();

private:
    void do_read();
    void handle_request();
    void do_write(const HttpResponse& response);
    void handle_error(HttpStatus status, const std::string& message);

    tcp::socket socket_;
    HttpRequestHandler handler_;
    HttpParser parser_;
    std::array<char, 64 * 1024> buffer_;
};

/**
 * @brief Asynchronous HTTP/1.1 listener on Boost.Asio
 *
 * Run the io_context from as many threads as there should be concurrent
 * requests in flight.
 *
 * Usage:
 * ```cpp
 * asio::io_context io_context;
 * HttpServerAsio server(io_context, 8000, 1ULL << 30);
 * server.set_handler([&router](const HttpRequest& req) {
 *     return router.handle_request(req);
 * });
 * io_context.run();
 * ```
 */
class HttpServerAsio {
public:
    HttpServerAsio(asio::io_context& io_context, uint16_t port, std::size_t max_body_size);

    void set_handler(HttpRequestHandler handler);

    /// Stop accepting; connections already accepted finish normally
    void stop();

    uint16_t get_port() const { return port_; }

private:
    void do_accept();

    tcp::acceptor acceptor_;
    HttpRequestHandler handler_;
    std::size_t max_body_size_;
    uint16_t port_;
};

} // namespace network
} // namespace wopan
