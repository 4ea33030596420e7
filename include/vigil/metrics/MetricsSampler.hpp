#pragma once

#include "vigil/infra/BoundedQueue.hpp"
#include "vigil/infra/Clock.hpp"
#include "vigil/infra/RingWindow.hpp"
#include "vigil/metrics/MetricsTypes.hpp"
#include "vigil/metrics/SystemProbe.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace vigil::metrics {

struct SamplerConfig {
    double sample_interval = 1.0;    // seconds
    size_t history_size    = 300;    // action and event-duration windows
    size_t queue_capacity  = 1000;   // hand-off queue, drop-oldest
    double action_window   = 60.0;   // seconds, for rate and success figures

    infra::ClockFn               clock = infra::default_clock();
    std::shared_ptr<SystemProbe> probe;   // null selects ProcSystemProbe
};

// Background sampler. One thread reads the OS at a fixed interval, caches
// the system figures and publishes full snapshots into a bounded queue.
// Producers record into two independently locked rolling windows.
class MetricsSampler {
public:
    explicit MetricsSampler(SamplerConfig cfg = {});
    ~MetricsSampler();

    MetricsSampler(const MetricsSampler&) = delete;
    MetricsSampler& operator=(const MetricsSampler&) = delete;

    // start() takes one sample synchronously so latest() is populated on
    // return. Both are idempotent.
    void start();
    void stop();
    bool running() const noexcept { return running_.load(); }

    // ---- producers (any thread) ----
    void record_action(const std::string& name, double duration, bool success = true);
    void set_current_action(std::optional<std::string> name);
    void set_action_queue_depth(int64_t depth);
    void record_event(double processing_time, bool success = true);
    void set_event_queue_depth(int64_t depth);

    // ---- snapshots ----
    // Reads the OS. Never throws on probe failure; last known values are
    // substituted.
    SystemMetrics collect_system_metrics();
    ActionMetrics collect_action_metrics() const;
    EventMetrics  collect_event_metrics() const;

    // Fresh system read combined with the current windows.
    MetricsSnapshot get_latest_metrics();

    // Cached system figures plus the current windows. No OS calls.
    MetricsSnapshot latest() const;

    // One loop iteration: sample, cache, publish.
    void sample_once();

    // Consumer side of the hand-off queue.
    std::optional<MetricsSnapshot> poll(double timeout_s = 0.1);
    size_t queued() const { return queue_.size(); }
    uint64_t dropped() const { return queue_.dropped(); }

    const SamplerConfig& config() const noexcept { return cfg_; }

private:
    void run();

    SamplerConfig cfg_;

    // actions
    mutable std::mutex              action_mtx_;
    infra::RingWindow<ActionRecord> actions_;
    std::optional<std::string>      current_action_;
    int64_t                         action_queue_depth_ = 0;

    // events
    mutable std::mutex        event_mtx_;
    uint64_t                  events_queued_    = 0;
    uint64_t                  events_processed_ = 0;
    uint64_t                  events_failed_    = 0;
    infra::RingWindow<double> event_durations_;
    int64_t                   event_queue_depth_ = 0;

    // system probe state, touched by whoever samples
    std::mutex    probe_mtx_;
    ProbeReading  prev_reading_;
    double        prev_reading_t_ = 0.0;
    bool          have_prev_      = false;
    double        last_cpu_       = 0.0;
    SystemMetrics last_system_;

    mutable std::mutex cache_mtx_;
    SystemMetrics      cached_system_;

    infra::BoundedQueue<MetricsSnapshot> queue_;

    std::atomic<bool>       running_{false};
    std::mutex              run_mtx_;
    std::condition_variable run_cv_;
    std::thread             worker_;
};

} // namespace vigil::metrics
