#pragma once

#include "vigil/trace/EventTrace.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace vigil::timeline {

inline constexpr const char* kFormatVersion = "vigil-1.0";

// Chrome / Perfetto trace-event document. Per trace: one global instant
// event (cat "metadata"), one "X" event per consecutive checkpoint pair and
// one thread-scoped instant event per checkpoint. Timestamps in
// microseconds.
nlohmann::json to_chrome_trace(const std::vector<trace::EventTrace>& traces);
void write_chrome_trace(const std::vector<trace::EventTrace>& traces, const std::string& path);

// Lossless trace snapshot, also the data embedded in the HTML timeline.
nlohmann::json traces_to_json(const std::vector<trace::EventTrace>& traces);

// Accepts {"traces":[...]} or a bare array. Throws std::runtime_error on a
// malformed document.
std::vector<trace::EventTrace> traces_from_json(const nlohmann::json& j);

void write_trace_snapshot(const std::vector<trace::EventTrace>& traces, const std::string& path);
std::vector<trace::EventTrace> read_trace_snapshot(const std::string& path);

// Self-contained page, no external scripts.
std::string render_timeline_html(const std::vector<trace::EventTrace>& traces);
void write_timeline_html(const std::vector<trace::EventTrace>& traces, const std::string& path);

} // namespace vigil::timeline
