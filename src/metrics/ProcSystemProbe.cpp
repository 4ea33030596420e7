#include "vigil/metrics/SystemProbe.hpp"

#include <dirent.h>
#include <unistd.h>

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

namespace vigil::metrics {

namespace {

// Fields after the ")" that closes comm. comm may itself contain spaces
// and parentheses.
bool read_stat_fields(pid_t pid, std::vector<std::string>& out) {
    std::ifstream f("/proc/" + std::to_string(pid) + "/stat");
    if (!f) return false;

    std::string line;
    if (!std::getline(f, line)) return false;

    const size_t close = line.rfind(')');
    if (close == std::string::npos) return false;

    std::istringstream is(line.substr(close + 1));
    out.clear();
    std::string tok;
    while (is >> tok) out.push_back(tok);
    return out.size() >= 18;
}

// "<Key>:   <value> kB" from a /proc status-style file, in bytes.
bool read_kb_field(const std::string& path, const std::string& key, uint64_t& bytes) {
    std::ifstream f(path);
    if (!f) return false;

    std::string line;
    while (std::getline(f, line)) {
        if (line.compare(0, key.size(), key) != 0) continue;
        if (line.size() <= key.size() || line[key.size()] != ':') continue;
        std::istringstream is(line.substr(key.size() + 1));
        uint64_t kb = 0;
        if (!(is >> kb)) return false;
        bytes = kb * 1024;
        return true;
    }
    return false;
}

bool is_pid_name(const char* s) {
    if (!*s) return false;
    for (; *s; ++s)
        if (!std::isdigit(static_cast<unsigned char>(*s))) return false;
    return true;
}

// pid itself plus every descendant.
bool count_tree(pid_t root, uint32_t& count) {
    DIR* d = opendir("/proc");
    if (!d) return false;

    std::unordered_map<pid_t, std::vector<pid_t>> children;
    std::vector<std::string> fields;
    while (dirent* e = readdir(d)) {
        if (!is_pid_name(e->d_name)) continue;
        const pid_t pid = static_cast<pid_t>(std::atol(e->d_name));
        // Processes exit while we scan; skip what vanished.
        if (!read_stat_fields(pid, fields)) continue;
        const pid_t ppid = static_cast<pid_t>(std::atol(fields[1].c_str()));
        children[ppid].push_back(pid);
    }
    closedir(d);

    count = 1;
    std::vector<pid_t> stack{root};
    while (!stack.empty()) {
        pid_t p = stack.back();
        stack.pop_back();
        auto it = children.find(p);
        if (it == children.end()) continue;
        for (pid_t c : it->second) {
            ++count;
            stack.push_back(c);
        }
    }
    return true;
}

} // namespace

ProcSystemProbe::ProcSystemProbe()
    : ProcSystemProbe(getpid()) {}

ProcSystemProbe::ProcSystemProbe(pid_t pid)
    : pid_(pid) {
    long t = sysconf(_SC_CLK_TCK);
    ticks_per_sec_ = t > 0 ? static_cast<double>(t) : 100.0;
}

bool ProcSystemProbe::read(ProbeReading& out) {
    std::vector<std::string> fields;
    if (!read_stat_fields(pid_, fields)) return false;

    // Indices are relative to the state field (stat field 3).
    const double utime = std::strtod(fields[11].c_str(), nullptr);
    const double stime = std::strtod(fields[12].c_str(), nullptr);
    out.cpu_seconds = (utime + stime) / ticks_per_sec_;
    out.thread_count = static_cast<uint32_t>(std::strtoul(fields[17].c_str(), nullptr, 10));

    if (!read_kb_field("/proc/" + std::to_string(pid_) + "/status", "VmRSS", out.rss_bytes))
        return false;
    if (!read_kb_field("/proc/meminfo", "MemTotal", out.mem_total_bytes))
        return false;

    return count_tree(pid_, out.process_count);
}

} // namespace vigil::metrics
