#include "vigil/timeline/TimelineExporter.hpp"

#include <cstdint>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace vigil::timeline {

using json = nlohmann::json;
using trace::Checkpoint;
using trace::EventTrace;

namespace {

int64_t to_us(double seconds) {
    return static_cast<int64_t>(seconds * 1000000.0);
}

json metadata_json(const trace::Metadata& md) {
    json j = json::object();
    for (const auto& kv : md) j[kv.first] = kv.second;
    return j;
}

std::string dump(const json& j, int indent) {
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

void write_file(const std::string& path, const std::string& body) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f)
        throw std::runtime_error("cannot open " + path + " for writing");
    f << body;
    f.flush();
    if (!f)
        throw std::runtime_error("write failed: " + path);
}

const char* kTimelinePage = R"HTMLDELIM(<!DOCTYPE html>
<html>
<head>
<meta charset="utf-8"/>
<title>vigil - event timeline</title>
<style>
body { font-family: 'SF Mono', 'Consolas', monospace; font-size: 12px; margin: 0; padding: 20px; background: #0a0e14; color: #8fa1b3; }
h1 { color: #c0c5ce; font-size: 16px; margin: 0 0 12px 0; }
.stats { display: flex; gap: 24px; margin-bottom: 16px; }
.stats b { color: #c0c5ce; }
.row { fill: #5294e2; }
.row.incomplete { fill: #f87171; }
.marker { fill: #fbbf24; stroke: #0a0e14; }
.label { fill: #8fa1b3; }
.axis { stroke: #1f2933; }
#tip { position: absolute; pointer-events: none; background: #14181f; border: 1px solid #1f2933; padding: 6px 8px; opacity: 0; }
</style>
</head>
<body>
<h1>EVENT TIMELINE</h1>
<div class="stats">
  <div>events <b id="n"></b></div>
  <div>completed <b id="done"></b></div>
  <div>span <b id="span"></b></div>
</div>
<svg id="timeline"></svg>
<div id="tip"></div>
<script>
const traces = TRACES_DATA;
const NS = 'http://www.w3.org/2000/svg';
const left = 180, right = 20, rowH = 24, width = 1200;

function el(tag, attrs) {
  const e = document.createElementNS(NS, tag);
  for (const k in attrs) e.setAttribute(k, attrs[k]);
  return e;
}

function esc(s) {
  return String(s).replace(/[&<>"]/g, c => ({'&':'&amp;','<':'&lt;','>':'&gt;','"':'&quot;'}[c]));
}

const tip = document.getElementById('tip');
function hover(node, html) {
  node.addEventListener('mousemove', e => {
    tip.innerHTML = html;
    tip.style.left = (e.pageX + 10) + 'px';
    tip.style.top = (e.pageY - 10) + 'px';
    tip.style.opacity = 1;
  });
  node.addEventListener('mouseout', () => { tip.style.opacity = 0; });
}

const stamps = traces.flatMap(t => t.checkpoints.map(c => c.timestamp));
const t0 = stamps.length ? Math.min(...stamps) : 0;
const t1 = stamps.length ? Math.max(...stamps) : 1;
const spanMs = Math.max((t1 - t0) * 1000, 1e-3);
const x = t => left + (t - t0) * 1000 / spanMs * (width - left - right);

document.getElementById('n').textContent = traces.length;
document.getElementById('done').textContent = traces.filter(t => t.completed).length;
document.getElementById('span').textContent = spanMs.toFixed(2) + 'ms';

const svg = document.getElementById('timeline');
svg.setAttribute('width', width);
svg.setAttribute('height', Math.max(100, traces.length * rowH + 40));

for (let i = 0; i <= 10; i++) {
  const px = left + i * (width - left - right) / 10;
  svg.appendChild(el('line', {x1: px, x2: px, y1: 0, y2: traces.length * rowH, class: 'axis'}));
  const lbl = el('text', {x: px, y: traces.length * rowH + 16, class: 'label', 'text-anchor': 'middle'});
  lbl.textContent = (spanMs * i / 10).toFixed(1) + 'ms';
  svg.appendChild(lbl);
}

traces.forEach((t, i) => {
  const y = i * rowH;
  const name = el('text', {x: 4, y: y + rowH * 0.65, class: 'label'});
  name.textContent = t.event_id;
  svg.appendChild(name);
  if (t.checkpoints.length === 0) return;

  const start = t.checkpoints[0].timestamp;
  const end = t.checkpoints[t.checkpoints.length - 1].timestamp;
  const bar = el('rect', {x: x(start), y: y + 4, width: Math.max(x(end) - x(start), 1), height: rowH - 8,
                          class: 'row' + (t.completed ? '' : ' incomplete')});
  hover(bar, '<b>' + esc(t.event_id) + '</b><br>type: ' + esc(t.event_type) +
             '<br>latency: ' + (t.total_latency * 1000).toFixed(2) + 'ms<br>' +
             (t.completed ? 'completed' : 'incomplete'));
  svg.appendChild(bar);

  t.checkpoints.forEach(c => {
    const m = el('circle', {cx: x(c.timestamp), cy: y + rowH / 2, r: 4, class: 'marker'});
    let html = '<b>' + esc(c.name) + '</b><br>+' + ((c.timestamp - start) * 1000).toFixed(2) +
               'ms<br>thread ' + c.thread_id;
    for (const k in c.metadata) html += '<br>' + esc(k) + ': ' + esc(c.metadata[k]);
    hover(m, html);
    svg.appendChild(m);
  });
});
</script>
</body>
</html>
)HTMLDELIM";

} // namespace

// ---------------------------------------------------------------------------
// Chrome trace
// ---------------------------------------------------------------------------

json to_chrome_trace(const std::vector<EventTrace>& traces) {
    json events = json::array();

    for (const auto& t : traces) {
        events.push_back({
            {"name", t.event_type + ":" + t.event_id},
            {"cat", "metadata"},
            {"ph", "i"},
            {"ts", to_us(t.created_at)},
            {"pid", 0},
            {"tid", 0},
            {"s", "g"},
            {"args", {
                {"event_id", t.event_id},
                {"event_type", t.event_type},
                {"completed", t.completed},
                {"total_latency", t.total_latency}
            }}
        });

        for (size_t i = 0; i < t.checkpoints.size(); ++i) {
            const Checkpoint& cp = t.checkpoints[i];

            if (i + 1 < t.checkpoints.size()) {
                const Checkpoint& next = t.checkpoints[i + 1];
                events.push_back({
                    {"name", cp.name},
                    {"cat", t.event_type},
                    {"ph", "X"},
                    {"ts", to_us(cp.timestamp)},
                    {"dur", to_us(next.timestamp - cp.timestamp)},
                    {"pid", 0},
                    {"tid", cp.owner},
                    {"args", metadata_json(cp.metadata)}
                });
            }

            events.push_back({
                {"name", "checkpoint:" + cp.name},
                {"cat", t.event_type},
                {"ph", "i"},
                {"ts", to_us(cp.timestamp)},
                {"pid", 0},
                {"tid", cp.owner},
                {"s", "t"},
                {"args", metadata_json(cp.metadata)}
            });
        }
    }

    json doc;
    doc["traceEvents"] = std::move(events);
    doc["displayTimeUnit"] = "ms";
    doc["otherData"] = {
        {"version", kFormatVersion},
        {"trace_count", traces.size()}
    };
    return doc;
}

void write_chrome_trace(const std::vector<EventTrace>& traces, const std::string& path) {
    json doc = to_chrome_trace(traces);
    write_file(path, dump(doc, 2));
    std::cout << "[TIMELINE] wrote " << doc["traceEvents"].size() << " trace events ("
              << traces.size() << " traces) to " << path << std::endl;
}

// ---------------------------------------------------------------------------
// Snapshots
// ---------------------------------------------------------------------------

json traces_to_json(const std::vector<EventTrace>& traces) {
    json arr = json::array();
    for (const auto& t : traces) {
        json cps = json::array();
        for (const auto& cp : t.checkpoints) {
            cps.push_back({
                {"name", cp.name},
                {"timestamp", cp.timestamp},
                {"thread_id", cp.owner},
                {"metadata", metadata_json(cp.metadata)}
            });
        }
        arr.push_back({
            {"event_id", t.event_id},
            {"event_type", t.event_type},
            {"created_at", t.created_at},
            {"completed", t.completed},
            {"total_latency", t.total_latency},
            {"checkpoints", std::move(cps)}
        });
    }
    return arr;
}

std::vector<EventTrace> traces_from_json(const json& j) {
    const json* arr = &j;
    if (j.is_object()) {
        auto it = j.find("traces");
        if (it == j.end())
            throw std::runtime_error("invalid trace snapshot: missing \"traces\"");
        arr = &*it;
    }
    if (!arr->is_array())
        throw std::runtime_error("invalid trace snapshot: expected an array of traces");

    std::vector<EventTrace> out;
    out.reserve(arr->size());
    try {
        for (const auto& jt : *arr) {
            EventTrace t;
            t.event_id = jt.at("event_id").get<std::string>();
            t.event_type = jt.value("event_type", std::string("unknown"));
            t.created_at = jt.at("created_at").get<double>();
            t.completed = jt.value("completed", false);
            t.total_latency = jt.value("total_latency", 0.0);

            for (const auto& jc : jt.value("checkpoints", json::array())) {
                Checkpoint cp;
                cp.name = jc.at("name").get<std::string>();
                cp.timestamp = jc.at("timestamp").get<double>();
                cp.owner = jc.value("thread_id", uint64_t{0});
                auto md = jc.find("metadata");
                if (md != jc.end() && md->is_object()) {
                    for (auto it = md->begin(); it != md->end(); ++it)
                        cp.metadata[it.key()] = it->is_string() ? it->get<std::string>() : it->dump();
                }
                t.checkpoints.push_back(std::move(cp));
            }
            out.push_back(std::move(t));
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("invalid trace snapshot: ") + e.what());
    }
    return out;
}

void write_trace_snapshot(const std::vector<EventTrace>& traces, const std::string& path) {
    json doc;
    doc["version"] = kFormatVersion;
    doc["traces"] = traces_to_json(traces);
    write_file(path, dump(doc, 2));
    std::cout << "[TIMELINE] wrote snapshot of " << traces.size() << " traces to " << path << std::endl;
}

std::vector<EventTrace> read_trace_snapshot(const std::string& path) {
    std::ifstream f(path);
    if (!f)
        throw std::runtime_error("cannot open " + path);

    json j;
    try {
        f >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error(path + ": " + e.what());
    }
    return traces_from_json(j);
}

// ---------------------------------------------------------------------------
// HTML
// ---------------------------------------------------------------------------

std::string render_timeline_html(const std::vector<EventTrace>& traces) {
    std::string data = dump(traces_to_json(traces), -1);

    // Metadata must not be able to close the script element.
    std::string safe;
    safe.reserve(data.size());
    for (size_t i = 0; i < data.size(); ++i) {
        if (data[i] == '<' && i + 1 < data.size() && data[i + 1] == '/') {
            safe += "<\\/";
            ++i;
        } else {
            safe += data[i];
        }
    }

    std::string page = kTimelinePage;
    const std::string marker = "TRACES_DATA";
    const size_t pos = page.find(marker);
    page.replace(pos, marker.size(), safe);
    return page;
}

void write_timeline_html(const std::vector<EventTrace>& traces, const std::string& path) {
    write_file(path, render_timeline_html(traces));
    std::cout << "[TIMELINE] wrote timeline of " << traces.size() << " traces to " << path << std::endl;
}

} // namespace vigil::timeline
