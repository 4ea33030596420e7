#include "Sessions.hpp"

#include <atomic>
#include <chrono>
#include <iostream>

namespace vigil::dashboard {

namespace {

std::atomic<uint64_t> g_next_session_id{1};

bool is_disconnect(beast::error_code ec) {
    return ec == ws::error::closed
        || ec == net::error::operation_aborted
        || ec == net::error::eof
        || ec == net::error::connection_reset
        || ec == beast::error::timeout;
}

} // namespace

// ---------------------------------------------------------------------------
// HttpSession
// ---------------------------------------------------------------------------

HttpSession::HttpSession(tcp::socket&& socket, DashboardServer& server)
    : stream_(std::move(socket)), server_(server) {}

void HttpSession::run() {
    do_read();
}

void HttpSession::do_read() {
    req_ = {};
    stream_.expires_after(std::chrono::seconds(30));
    http::async_read(stream_, buffer_, req_,
        beast::bind_front_handler(&HttpSession::on_read, shared_from_this()));
}

void HttpSession::on_read(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
        do_close();
        return;
    }
    if (ec) {
        if (!is_disconnect(ec))
            std::cerr << "[DASHBOARD] http read: " << ec.message() << std::endl;
        return;
    }

    if (ws::is_upgrade(req_) && req_.target() == "/ws") {
        beast::get_lowest_layer(stream_).expires_never();
        std::make_shared<WsSession>(stream_.release_socket(), server_)->run(std::move(req_));
        return;
    }

    auto sp = std::make_shared<http::response<http::string_body>>(handle(req_));
    res_ = sp;
    http::async_write(stream_, *sp,
        beast::bind_front_handler(&HttpSession::on_write, shared_from_this(), sp->need_eof()));
}

http::response<http::string_body>
HttpSession::handle(const http::request<http::string_body>& req) const {
    http::response<http::string_body> res;
    res.version(req.version());
    res.keep_alive(req.keep_alive());
    res.set(http::field::server, "vigil");

    if (req.method() != http::verb::get) {
        res.result(http::status::method_not_allowed);
        res.set(http::field::allow, "GET");
        res.set(http::field::content_type, "text/plain");
        res.body() = "method not allowed\n";
    } else if (req.target() == "/metrics") {
        res.result(http::status::ok);
        res.set(http::field::content_type, "application/json");
        res.body() = server_.metrics_body();
    } else {
        res.result(http::status::ok);
        res.set(http::field::content_type, "text/html; charset=utf-8");
        res.body() = server_.page_body();
    }

    res.prepare_payload();
    return res;
}

void HttpSession::on_write(bool close, beast::error_code ec, std::size_t) {
    if (ec) {
        if (!is_disconnect(ec))
            std::cerr << "[DASHBOARD] http write: " << ec.message() << std::endl;
        return;
    }
    if (close) {
        do_close();
        return;
    }
    res_ = nullptr;
    do_read();
}

void HttpSession::do_close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
}

// ---------------------------------------------------------------------------
// WsSession
// ---------------------------------------------------------------------------

WsSession::WsSession(tcp::socket&& socket, DashboardServer& server)
    : ws_(std::move(socket)), server_(server), id_(g_next_session_id.fetch_add(1)) {}

void WsSession::run(http::request<http::string_body> req) {
    ws_.set_option(ws::stream_base::timeout::suggested(beast::role_type::server));
    ws_.set_option(ws::stream_base::decorator(
        [](ws::response_type& res) {
            res.set(http::field::server, "vigil");
        }));
    ws_.async_accept(req,
        beast::bind_front_handler(&WsSession::on_accept, shared_from_this()));
}

void WsSession::on_accept(beast::error_code ec) {
    if (ec) {
        std::cerr << "[DASHBOARD] handshake failed: " << ec.message() << std::endl;
        return;
    }
    open_ = true;
    ws_.text(true);
    server_.on_client_open(shared_from_this());
    do_read();
}

void WsSession::do_read() {
    ws_.async_read(buffer_,
        beast::bind_front_handler(&WsSession::on_read, shared_from_this()));
}

void WsSession::on_read(beast::error_code ec, std::size_t) {
    if (ec) {
        fail(ec, "read");
        return;
    }

    std::string text = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());
    server_.on_client_message(shared_from_this(), text);
    do_read();
}

void WsSession::send(std::shared_ptr<const std::string> payload) {
    if (!open_ || closing_ || done_) return;

    if (queue_.size() >= kMaxPendingWrites) {
        fail(net::error::no_buffer_space, "send queue full");
        return;
    }

    queue_.push_back(std::move(payload));
    if (queue_.size() > 1) return;   // write already in flight
    do_write();
}

void WsSession::do_write() {
    ws_.async_write(net::buffer(*queue_.front()),
        beast::bind_front_handler(&WsSession::on_write, shared_from_this()));
}

void WsSession::on_write(beast::error_code ec, std::size_t) {
    if (ec) {
        fail(ec, "write");
        return;
    }
    if (done_) return;
    queue_.pop_front();
    if (!queue_.empty() && !closing_) do_write();
}

void WsSession::close() {
    if (!open_ || closing_ || done_) return;
    closing_ = true;

    auto self = shared_from_this();
    ws_.async_close(ws::close_code::going_away,
        [self](beast::error_code ec) {
            if (ec && !is_disconnect(ec))
                std::cerr << "[DASHBOARD] close: " << ec.message() << std::endl;
        });
}

void WsSession::fail(beast::error_code ec, const char* what) {
    if (done_) return;
    done_ = true;

    if (!is_disconnect(ec))
        std::cerr << "[DASHBOARD] client " << id_ << " " << what << ": " << ec.message() << std::endl;

    if (!closing_) {
        // Force the socket shut so any outstanding operation completes.
        beast::error_code ignored;
        beast::get_lowest_layer(ws_).socket().shutdown(tcp::socket::shutdown_both, ignored);
        beast::get_lowest_layer(ws_).socket().close(ignored);
    }
    queue_.clear();
    if (open_) server_.on_client_closed(shared_from_this());
}

} // namespace vigil::dashboard
