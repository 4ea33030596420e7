#pragma once

#include "vigil/dashboard/DashboardServer.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <deque>
#include <memory>
#include <string>

namespace vigil::dashboard {

namespace beast = boost::beast;
namespace http  = beast::http;
namespace ws    = beast::websocket;

// Plain HTTP connection. Hands itself off to a WsSession on an /ws upgrade.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket&& socket, DashboardServer& server);

    void run();

private:
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes);
    void on_write(bool close, beast::error_code ec, std::size_t bytes);
    void do_close();

    http::response<http::string_body> handle(const http::request<http::string_body>& req) const;

    beast::tcp_stream                  stream_;
    beast::flat_buffer                 buffer_;
    http::request<http::string_body>   req_;
    std::shared_ptr<void>              res_;
    DashboardServer&                   server_;
};

// One WebSocket viewer. Writes go through a queue of shared immutable
// payloads so one broadcast string serves every client.
class WsSession : public std::enable_shared_from_this<WsSession> {
public:
    static constexpr size_t kMaxPendingWrites = 64;

    WsSession(tcp::socket&& socket, DashboardServer& server);

    void run(http::request<http::string_body> req);

    // Queues a frame. Drops the client if it has fallen too far behind.
    void send(std::shared_ptr<const std::string> payload);

    // Starts the close handshake.
    void close();

    uint64_t id() const noexcept { return id_; }

private:
    void on_accept(beast::error_code ec);
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes);
    void do_write();
    void on_write(beast::error_code ec, std::size_t bytes);
    void fail(beast::error_code ec, const char* what);

    ws::stream<beast::tcp_stream>                   ws_;
    beast::flat_buffer                              buffer_;
    std::deque<std::shared_ptr<const std::string>>  queue_;
    DashboardServer&                                server_;
    uint64_t                                        id_;
    bool                                            open_    = false;
    bool                                            closing_ = false;
    bool                                            done_    = false;
};

} // namespace vigil::dashboard
