#pragma once

#include <sys/types.h>

#include <cstdint>

namespace vigil::metrics {

// Raw process counters. CPU is cumulative; the sampler turns deltas into a
// percentage.
struct ProbeReading {
    double   cpu_seconds     = 0.0;   // user + system
    uint64_t rss_bytes       = 0;
    uint64_t mem_total_bytes = 0;
    uint32_t thread_count    = 0;
    uint32_t process_count   = 1;
};

class SystemProbe {
public:
    virtual ~SystemProbe() = default;

    // false on any read failure; out is left unspecified.
    virtual bool read(ProbeReading& out) = 0;
};

// Linux /proc reader.
class ProcSystemProbe : public SystemProbe {
public:
    ProcSystemProbe();
    explicit ProcSystemProbe(pid_t pid);

    bool read(ProbeReading& out) override;

private:
    pid_t  pid_;
    double ticks_per_sec_;
};

} // namespace vigil::metrics
