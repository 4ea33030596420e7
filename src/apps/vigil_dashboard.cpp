#include "vigil/config/Config.hpp"
#include "vigil/dashboard/DashboardServer.hpp"
#include "vigil/metrics/MetricsSampler.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <thread>

using namespace vigil;

static std::atomic<bool> g_running{true};

static void handle_signal(int) {
    g_running.store(false);
}

static void usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [--config <file.json>] [--demo]\n"
              << "  --config   JSON configuration (env overrides still apply)\n"
              << "  --demo     feed synthetic actions and events into the sampler\n";
}

// Synthetic workload so the page has something to show.
static void demo_feed(metrics::MetricsSampler& sampler) {
    static const char* kActions[] = {"click", "type_text", "find_image", "drag", "wait_vanish"};

    std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<int> pick(0, 4);
    std::uniform_real_distribution<double> dur(0.02, 0.40);
    std::uniform_real_distribution<double> coin(0.0, 1.0);
    std::uniform_int_distribution<int> depth(0, 6);

    while (g_running.load()) {
        const char* name = kActions[pick(rng)];
        const double d = dur(rng);

        sampler.set_current_action(std::string(name));
        sampler.set_action_queue_depth(depth(rng));
        std::this_thread::sleep_for(std::chrono::duration<double>(d));
        sampler.record_action(name, d, coin(rng) > 0.05);
        sampler.set_current_action(std::nullopt);

        sampler.record_event(d / 10.0, coin(rng) > 0.02);
        sampler.set_event_queue_depth(depth(rng));
    }
}

int main(int argc, char** argv) {
    std::string config_path;
    bool demo = false;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--demo") == 0) {
            demo = true;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            usage(argv[0]);
            return 0;
        } else {
            usage(argv[0]);
            return 2;
        }
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    try {
        config::Config cfg = config::load_config(config_path);

        auto sampler = std::make_shared<metrics::MetricsSampler>(cfg.sampler);
        dashboard::DashboardServer server(cfg.dashboard, sampler);
        server.start();

        std::thread feeder;
        if (demo) {
            std::cout << "[VIGIL] demo workload enabled" << std::endl;
            feeder = std::thread([&]() { demo_feed(*sampler); });
        }

        auto last_status = std::chrono::steady_clock::now();
        while (g_running.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));

            auto now = std::chrono::steady_clock::now();
            if (now - last_status >= std::chrono::seconds(30)) {
                last_status = now;
                std::cout << "[VIGIL] clients=" << server.client_count()
                          << " broadcasts=" << server.broadcasts()
                          << " queued=" << sampler->queued() << std::endl;
            }
        }

        std::cout << "[VIGIL] shutting down" << std::endl;
        if (feeder.joinable()) feeder.join();
        server.stop();
    } catch (const config::ConfigError& e) {
        std::cerr << "[VIGIL] config error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[VIGIL] fatal: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
