#include "vigil/metrics/MetricsSampler.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>

namespace vigil::metrics {

MetricsSampler::MetricsSampler(SamplerConfig cfg)
    : cfg_(std::move(cfg)),
      actions_(cfg_.history_size),
      event_durations_(cfg_.history_size),
      queue_(cfg_.queue_capacity) {
    if (!infra::is_valid_interval(cfg_.sample_interval))
        throw std::invalid_argument("sample_interval must be in (0, 86400] seconds");
    if (!infra::is_valid_interval(cfg_.action_window))
        throw std::invalid_argument("action_window must be in (0, 86400] seconds");
    if (!cfg_.clock)
        cfg_.clock = infra::default_clock();
    if (!cfg_.probe)
        cfg_.probe = std::make_shared<ProcSystemProbe>();
}

MetricsSampler::~MetricsSampler() {
    stop();
}

void MetricsSampler::start() {
    if (running_.exchange(true)) return;

    try {
        sample_once();
    } catch (const std::exception& e) {
        std::cerr << "[SAMPLER] initial sample failed: " << e.what() << std::endl;
    }
    worker_ = std::thread([this]() { run(); });
    std::cout << "[SAMPLER] started (interval " << cfg_.sample_interval << "s)" << std::endl;
}

void MetricsSampler::stop() {
    if (!running_.exchange(false)) return;

    {
        std::lock_guard<std::mutex> lk(run_mtx_);
    }
    run_cv_.notify_all();
    if (worker_.joinable()) worker_.join();
    std::cout << "[SAMPLER] stopped" << std::endl;
}

void MetricsSampler::run() {
    const auto interval = std::chrono::duration_cast<infra::MonoDur>(
        infra::Seconds(cfg_.sample_interval));

    while (running_.load()) {
        {
            std::unique_lock<std::mutex> lk(run_mtx_);
            run_cv_.wait_for(lk, interval, [this]() { return !running_.load(); });
        }
        if (!running_.load()) break;

        try {
            sample_once();
        } catch (const std::exception& e) {
            std::cerr << "[SAMPLER] sample failed: " << e.what() << std::endl;
        }
    }
}

void MetricsSampler::sample_once() {
    MetricsSnapshot s = get_latest_metrics();
    {
        std::lock_guard<std::mutex> lk(cache_mtx_);
        cached_system_ = s.system;
    }
    queue_.push(std::move(s));
}

// ---------------------------------------------------------------------------
// Producers
// ---------------------------------------------------------------------------

void MetricsSampler::record_action(const std::string& name, double duration, bool success) {
    ActionRecord r;
    r.timestamp = cfg_.clock();
    r.name = name;
    r.duration = duration;
    r.success = success;

    std::lock_guard<std::mutex> lk(action_mtx_);
    actions_.push(std::move(r));
}

void MetricsSampler::set_current_action(std::optional<std::string> name) {
    std::lock_guard<std::mutex> lk(action_mtx_);
    current_action_ = std::move(name);
}

void MetricsSampler::set_action_queue_depth(int64_t depth) {
    std::lock_guard<std::mutex> lk(action_mtx_);
    action_queue_depth_ = depth;
}

void MetricsSampler::record_event(double processing_time, bool success) {
    std::lock_guard<std::mutex> lk(event_mtx_);
    ++events_queued_;
    if (success) {
        ++events_processed_;
        event_durations_.push(processing_time);
    } else {
        ++events_failed_;
    }
}

void MetricsSampler::set_event_queue_depth(int64_t depth) {
    std::lock_guard<std::mutex> lk(event_mtx_);
    event_queue_depth_ = depth;
}

// ---------------------------------------------------------------------------
// Snapshots
// ---------------------------------------------------------------------------

SystemMetrics MetricsSampler::collect_system_metrics() {
    const double t = cfg_.clock();

    std::lock_guard<std::mutex> lk(probe_mtx_);

    ProbeReading r;
    if (!cfg_.probe->read(r)) {
        SystemMetrics m = last_system_;
        m.timestamp = t;
        m.cpu_percent = last_cpu_;
        last_system_ = m;
        return m;
    }

    double cpu = 0.0;
    if (have_prev_) {
        const double wall = t - prev_reading_t_;
        const double used = r.cpu_seconds - prev_reading_.cpu_seconds;
        if (wall > 0.0 && used >= 0.0) cpu = used / wall * 100.0;
    }
    prev_reading_ = r;
    prev_reading_t_ = t;
    have_prev_ = true;

    if (cpu > 0.0) last_cpu_ = cpu;
    else cpu = last_cpu_;

    SystemMetrics m;
    m.timestamp = t;
    m.cpu_percent = cpu;
    m.memory_bytes = r.rss_bytes;
    m.memory_percent = r.mem_total_bytes > 0
        ? static_cast<double>(r.rss_bytes) / static_cast<double>(r.mem_total_bytes) * 100.0
        : 0.0;
    m.thread_count = r.thread_count;
    m.process_count = r.process_count;
    last_system_ = m;
    return m;
}

ActionMetrics MetricsSampler::collect_action_metrics() const {
    ActionMetrics m;
    m.timestamp = cfg_.clock();
    const double window_start = m.timestamp - cfg_.action_window;

    std::lock_guard<std::mutex> lk(action_mtx_);

    size_t recent = 0;
    size_t recent_ok = 0;
    double recent_dur = 0.0;
    for (const auto& a : actions_) {
        if (!a.success) ++m.error_count;
        if (a.timestamp < window_start) continue;
        ++recent;
        recent_dur += a.duration;
        if (a.success) ++recent_ok;
    }

    m.total_actions = actions_.size();
    m.actions_per_minute = static_cast<double>(recent) * 60.0 / cfg_.action_window;
    if (recent > 0) {
        m.avg_duration = recent_dur / static_cast<double>(recent);
        m.success_rate = static_cast<double>(recent_ok) / static_cast<double>(recent) * 100.0;
    }
    m.current_action = current_action_;
    m.queue_depth = action_queue_depth_;
    return m;
}

EventMetrics MetricsSampler::collect_event_metrics() const {
    EventMetrics m;
    m.timestamp = cfg_.clock();

    std::lock_guard<std::mutex> lk(event_mtx_);
    m.events_queued = events_queued_;
    m.events_processed = events_processed_;
    m.events_failed = events_failed_;
    if (!event_durations_.empty()) {
        double sum = 0.0;
        for (double d : event_durations_) sum += d;
        m.avg_processing_time = sum / static_cast<double>(event_durations_.size());
    }
    m.queue_depth = event_queue_depth_;
    return m;
}

MetricsSnapshot MetricsSampler::get_latest_metrics() {
    MetricsSnapshot s;
    s.system = collect_system_metrics();
    s.actions = collect_action_metrics();
    s.events = collect_event_metrics();
    return s;
}

MetricsSnapshot MetricsSampler::latest() const {
    MetricsSnapshot s;
    {
        std::lock_guard<std::mutex> lk(cache_mtx_);
        s.system = cached_system_;
    }
    s.actions = collect_action_metrics();
    s.events = collect_event_metrics();
    return s;
}

std::optional<MetricsSnapshot> MetricsSampler::poll(double timeout_s) {
    if (timeout_s <= 0.0) return queue_.try_pop();
    return queue_.pop_for(infra::Seconds(timeout_s));
}

} // namespace vigil::metrics
