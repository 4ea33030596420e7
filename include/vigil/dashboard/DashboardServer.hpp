#pragma once

#include "vigil/metrics/MetricsSampler.hpp"

#include <boost/asio.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <unordered_set>

namespace vigil::dashboard {

namespace net = boost::asio;
using tcp = net::ip::tcp;

class HttpSession;
class WsSession;

struct DashboardConfig {
    std::string host = "localhost";
    uint16_t    port = 8765;           // 0 binds an ephemeral port
    double      broadcast_interval = 1.0;   // seconds
    std::string dashboard_html_path;   // empty serves the embedded page
};

// HTTP + WebSocket metrics server.
//
// One io_context thread owns the acceptor, every session, the client
// registry and the broadcast timer. Nothing else touches them; public
// methods post onto that thread.
//
//   GET /ws (upgrade)   live snapshot stream
//   GET /metrics        latest snapshot as JSON
//   GET anything else   dashboard page
class DashboardServer {
public:
    DashboardServer(DashboardConfig cfg, std::shared_ptr<metrics::MetricsSampler> sampler);
    ~DashboardServer();

    DashboardServer(const DashboardServer&) = delete;
    DashboardServer& operator=(const DashboardServer&) = delete;

    // Starts the sampler, arms the broadcast timer, binds and listens.
    // Throws boost::system::system_error if the address cannot be bound.
    void start();

    // Cancels the broadcast timer, closes every client, stops the sampler,
    // then releases the listening socket. Idempotent.
    void stop();

    bool running() const noexcept { return running_.load(); }

    // Bound port, valid after start().
    uint16_t port() const noexcept { return bound_port_.load(); }

    // Registry size, read on the event loop.
    size_t client_count();

    uint64_t broadcasts() const noexcept { return broadcasts_.load(); }

    const DashboardConfig& config() const noexcept { return cfg_; }

private:
    friend class HttpSession;
    friend class WsSession;

    // ---- event loop only ----
    void do_accept();
    void on_accept(boost::system::error_code ec, tcp::socket socket);
    void schedule_broadcast();
    void on_broadcast(boost::system::error_code ec);
    void on_client_open(const std::shared_ptr<WsSession>& s);
    void on_client_closed(const std::shared_ptr<WsSession>& s);
    void on_client_message(const std::shared_ptr<WsSession>& s, const std::string& text);
    void close_all_clients();

    std::shared_ptr<const std::string> snapshot_payload() const;
    std::string metrics_body() const;
    std::string page_body() const;

    void run_loop();

    DashboardConfig                          cfg_;
    std::shared_ptr<metrics::MetricsSampler> sampler_;

    net::io_context   ioc_;
    tcp::acceptor     acceptor_;
    net::steady_timer broadcast_timer_;
    net::steady_timer shutdown_timer_;
    std::thread       loop_;

    std::unordered_set<std::shared_ptr<WsSession>> clients_;
    bool stopping_ = false;
    bool listener_closed_ = false;

    std::atomic<bool>     running_{false};
    std::atomic<bool>     started_{false};
    std::atomic<uint16_t> bound_port_{0};
    std::atomic<uint64_t> broadcasts_{0};
};

} // namespace vigil::dashboard
