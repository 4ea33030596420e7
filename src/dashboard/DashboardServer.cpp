#include "vigil/dashboard/DashboardServer.hpp"
#include "vigil/dashboard/Protocol.hpp"
#include "Sessions.hpp"

#include <chrono>
#include <fstream>
#include <future>
#include <iostream>
#include <sstream>
#include <vector>

namespace vigil::dashboard {

extern const char* g_dashboard_html;

namespace {

net::steady_timer::duration to_duration(double seconds) {
    return std::chrono::duration_cast<net::steady_timer::duration>(infra::Seconds(seconds));
}

} // namespace

DashboardServer::DashboardServer(DashboardConfig cfg, std::shared_ptr<metrics::MetricsSampler> sampler)
    : cfg_(std::move(cfg)),
      sampler_(std::move(sampler)),
      acceptor_(ioc_),
      broadcast_timer_(ioc_),
      shutdown_timer_(ioc_) {
    if (!sampler_)
        throw std::invalid_argument("DashboardServer requires a sampler");
    if (!infra::is_valid_interval(cfg_.broadcast_interval))
        throw std::invalid_argument("broadcast_interval must be in (0, 86400] seconds");
}

DashboardServer::~DashboardServer() {
    stop();
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

void DashboardServer::start() {
    if (started_.exchange(true)) return;

    sampler_->start();
    schedule_broadcast();

    try {
        tcp::resolver resolver(ioc_);
        auto results = resolver.resolve(cfg_.host, std::to_string(cfg_.port));
        tcp::endpoint ep = results.begin()->endpoint();

        acceptor_.open(ep.protocol());
        acceptor_.set_option(net::socket_base::reuse_address(true));
        acceptor_.bind(ep);
        acceptor_.listen(net::socket_base::max_listen_connections);
        bound_port_ = acceptor_.local_endpoint().port();
    } catch (const boost::system::system_error& e) {
        std::cerr << "[DASHBOARD] cannot listen on " << cfg_.host << ":" << cfg_.port
                  << ": " << e.what() << std::endl;
        broadcast_timer_.cancel();
        boost::system::error_code ignored;
        acceptor_.close(ignored);
        sampler_->stop();
        started_ = false;
        throw;
    }

    do_accept();
    running_ = true;
    loop_ = std::thread([this]() { run_loop(); });

    std::cout << "[DASHBOARD] listening on http://" << cfg_.host << ":" << port()
              << " (ws path /ws)" << std::endl;
}

void DashboardServer::run_loop() {
    for (;;) {
        try {
            ioc_.run();
            break;
        } catch (const std::exception& e) {
            std::cerr << "[DASHBOARD] event loop error: " << e.what() << std::endl;
        }
    }
}

void DashboardServer::stop() {
    if (!running_.exchange(false)) return;

    // 1 + 2: broadcast timer and clients, on the loop.
    std::promise<void> closed;
    auto closed_f = closed.get_future();
    net::post(ioc_, [this, &closed]() {
        stopping_ = true;
        broadcast_timer_.cancel();
        close_all_clients();
        closed.set_value();
    });
    closed_f.wait();

    // 3: sampler.
    sampler_->stop();

    // 4: listening socket. The loop exits once the last client finishes
    // its close handshake, or after a grace period, never before the
    // acceptor is closed.
    net::post(ioc_, [this]() {
        boost::system::error_code ec;
        acceptor_.close(ec);
        listener_closed_ = true;
        if (clients_.empty()) {
            ioc_.stop();
            return;
        }
        shutdown_timer_.expires_after(std::chrono::seconds(2));
        shutdown_timer_.async_wait([this](boost::system::error_code) { ioc_.stop(); });
    });

    if (loop_.joinable()) loop_.join();

    // The loop may have exited without running step 4.
    boost::system::error_code ec;
    acceptor_.close(ec);
    clients_.clear();
    std::cout << "[DASHBOARD] stopped" << std::endl;
}

size_t DashboardServer::client_count() {
    if (!running_.load()) return 0;

    std::promise<size_t> p;
    auto f = p.get_future();
    net::post(ioc_, [this, &p]() { p.set_value(clients_.size()); });
    if (f.wait_for(std::chrono::seconds(5)) != std::future_status::ready) {
        std::cerr << "[DASHBOARD] client_count: event loop not responding" << std::endl;
        return 0;
    }
    return f.get();
}

// ---------------------------------------------------------------------------
// Accept
// ---------------------------------------------------------------------------

void DashboardServer::do_accept() {
    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            on_accept(ec, std::move(socket));
        });
}

void DashboardServer::on_accept(boost::system::error_code ec, tcp::socket socket) {
    if (ec == net::error::operation_aborted || stopping_) return;

    if (ec) {
        std::cerr << "[DASHBOARD] accept: " << ec.message() << std::endl;
    } else {
        std::make_shared<HttpSession>(std::move(socket), *this)->run();
    }
    do_accept();
}

// ---------------------------------------------------------------------------
// Broadcast
// ---------------------------------------------------------------------------

void DashboardServer::schedule_broadcast() {
    broadcast_timer_.expires_after(to_duration(cfg_.broadcast_interval));
    broadcast_timer_.async_wait([this](boost::system::error_code ec) { on_broadcast(ec); });
}

void DashboardServer::on_broadcast(boost::system::error_code ec) {
    if (ec == net::error::operation_aborted || stopping_) return;

    if (!clients_.empty()) {
        // One serialization per tick, shared by every client.
        auto payload = snapshot_payload();

        // send() may drop a client, which edits the registry.
        std::vector<std::shared_ptr<WsSession>> targets(clients_.begin(), clients_.end());
        for (auto& c : targets) c->send(payload);
        ++broadcasts_;
    }
    schedule_broadcast();
}

// ---------------------------------------------------------------------------
// Clients
// ---------------------------------------------------------------------------

void DashboardServer::on_client_open(const std::shared_ptr<WsSession>& s) {
    if (stopping_) {
        s->close();
        return;
    }
    clients_.insert(s);
    std::cout << "[DASHBOARD] client " << s->id() << " connected ("
              << clients_.size() << " total)" << std::endl;

    s->send(snapshot_payload());
}

void DashboardServer::on_client_closed(const std::shared_ptr<WsSession>& s) {
    if (clients_.erase(s) == 0) return;
    std::cout << "[DASHBOARD] client " << s->id() << " disconnected ("
              << clients_.size() << " total)" << std::endl;

    if (stopping_ && listener_closed_ && clients_.empty()) ioc_.stop();
}

void DashboardServer::on_client_message(const std::shared_ptr<WsSession>& s, const std::string& text) {
    ClientMessage msg = parse_client_message(text);
    switch (msg.type) {
        case MessageType::Ping:
            s->send(std::make_shared<const std::string>(make_pong(msg.timestamp)));
            break;
        case MessageType::RequestMetrics:
            s->send(snapshot_payload());
            break;
        case MessageType::Unknown:
            std::cout << "[DASHBOARD] ignoring " << to_string(msg.type) << " message '"
                      << msg.type_name << "' from client " << s->id() << std::endl;
            break;
        case MessageType::Invalid:
            std::cerr << "[DASHBOARD] " << to_string(msg.type) << " message from client "
                      << s->id() << ": " << msg.error << std::endl;
            break;
    }
}

void DashboardServer::close_all_clients() {
    for (auto& c : clients_) c->close();
}

// ---------------------------------------------------------------------------
// Payloads
// ---------------------------------------------------------------------------

std::shared_ptr<const std::string> DashboardServer::snapshot_payload() const {
    return std::make_shared<const std::string>(metrics::to_json(sampler_->latest())
        .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

std::string DashboardServer::metrics_body() const {
    return metrics::to_json(sampler_->latest())
        .dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string DashboardServer::page_body() const {
    if (!cfg_.dashboard_html_path.empty()) {
        std::ifstream f(cfg_.dashboard_html_path, std::ios::binary);
        if (f) {
            std::ostringstream ss;
            ss << f.rdbuf();
            return ss.str();
        }
        std::cerr << "[DASHBOARD] cannot read " << cfg_.dashboard_html_path
                  << ", serving embedded page" << std::endl;
    }
    return g_dashboard_html;
}

} // namespace vigil::dashboard
