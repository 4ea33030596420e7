// Embedded dashboard page, served on GET / when no html path is configured.
namespace vigil::dashboard {
const char* g_dashboard_html = R"HTMLDELIM(<!DOCTYPE html>
<html>
<head>
<meta charset="utf-8"/>
<title>vigil - runtime dashboard</title>
<style>
* { box-sizing: border-box; margin: 0; padding: 0; }

body {
    background: #0a0e14;
    color: #8fa1b3;
    font-family: 'SF Mono', 'Consolas', 'Monaco', monospace;
    font-size: 13px;
    padding: 20px;
}

header { display: flex; justify-content: space-between; margin-bottom: 16px; }
h1 { color: #c0c5ce; font-size: 16px; }

.grid {
    display: grid;
    grid-template-columns: repeat(4, 1fr);
    gap: 16px;
    margin-bottom: 16px;
}

.panel {
    background: #14181f;
    border: 1px solid #1f2933;
    border-radius: 8px;
    padding: 16px;
}

.panel-title {
    font-size: 11px;
    font-weight: 600;
    color: #5294e2;
    text-transform: uppercase;
    letter-spacing: 1px;
    margin-bottom: 12px;
}

.value { font-size: 24px; color: #c0c5ce; }
.good  { color: #4ade80; }
.warn  { color: #fbbf24; }
.bad   { color: #f87171; }

.dot { display: inline-block; width: 10px; height: 10px; border-radius: 50%; margin-right: 6px; }
.dot.up   { background: #4ade80; }
.dot.down { background: #f87171; }

canvas { width: 100%; height: 120px; }
</style>
</head>
<body>
<header>
  <h1>VIGIL RUNTIME DASHBOARD</h1>
  <div><span id="dot" class="dot down"></span><span id="conn">connecting</span></div>
</header>

<div class="grid">
  <div class="panel"><div class="panel-title">CPU</div><div id="cpu" class="value">-</div></div>
  <div class="panel"><div class="panel-title">Memory</div><div id="mem" class="value">-</div></div>
  <div class="panel"><div class="panel-title">Actions / min</div><div id="apm" class="value">-</div></div>
  <div class="panel"><div class="panel-title">Success rate</div><div id="sr" class="value good">-</div></div>
</div>

<div class="grid">
  <div class="panel"><div class="panel-title">Threads</div><div id="threads" class="value">-</div></div>
  <div class="panel"><div class="panel-title">Action queue</div><div id="aq" class="value">-</div></div>
  <div class="panel"><div class="panel-title">Event queue</div><div id="eq" class="value">-</div></div>
  <div class="panel"><div class="panel-title">Errors</div><div id="errs" class="value">-</div></div>
</div>

<div class="grid">
  <div class="panel"><div class="panel-title">Current action</div><div id="cur" class="value">-</div></div>
  <div class="panel"><div class="panel-title">Avg action (ms)</div><div id="adur" class="value">-</div></div>
  <div class="panel"><div class="panel-title">Events ok / failed</div><div id="ev" class="value">-</div></div>
  <div class="panel"><div class="panel-title">Avg event (ms)</div><div id="edur" class="value">-</div></div>
</div>

<div class="panel">
  <div class="panel-title">CPU % (last 120 samples)</div>
  <canvas id="cpuChart" width="1200" height="120"></canvas>
</div>

<script>
const history = [];
let ws = null;
let attempts = 0;

function setText(id, v) { document.getElementById(id).textContent = v; }

function draw() {
  const c = document.getElementById('cpuChart');
  const g = c.getContext('2d');
  g.clearRect(0, 0, c.width, c.height);
  if (history.length < 2) return;
  const max = Math.max(100, ...history);
  g.strokeStyle = '#5294e2';
  g.beginPath();
  history.forEach((v, i) => {
    const x = i * c.width / 119;
    const y = c.height - v / max * c.height;
    if (i === 0) g.moveTo(x, y); else g.lineTo(x, y);
  });
  g.stroke();
}

function render(d) {
  if (!d.system) return;
  setText('cpu', d.system.cpu_percent.toFixed(1) + '%');
  setText('mem', d.system.memory_mb + ' MB (' + d.system.memory_percent.toFixed(1) + '%)');
  setText('threads', d.system.thread_count + ' / ' + d.system.process_count + ' proc');
  setText('apm', d.actions.actions_per_minute.toFixed(0));
  const sr = document.getElementById('sr');
  sr.textContent = d.actions.success_rate.toFixed(1) + '%';
  sr.className = 'value ' + (d.actions.success_rate >= 95 ? 'good' : d.actions.success_rate >= 80 ? 'warn' : 'bad');
  setText('aq', d.actions.queue_depth);
  setText('eq', d.events.queue_depth);
  setText('errs', d.actions.error_count);
  setText('cur', d.actions.current_action === null ? 'idle' : d.actions.current_action);
  setText('adur', (d.actions.avg_duration * 1000).toFixed(2));
  setText('ev', d.events.events_processed + ' / ' + d.events.events_failed);
  setText('edur', (d.events.avg_processing_time * 1000).toFixed(2));
  history.push(d.system.cpu_percent);
  if (history.length > 120) history.shift();
  draw();
}

function status(up) {
  document.getElementById('dot').className = 'dot ' + (up ? 'up' : 'down');
  setText('conn', up ? 'connected' : 'disconnected');
}

function connect() {
  const proto = location.protocol === 'https:' ? 'wss:' : 'ws:';
  ws = new WebSocket(proto + '//' + location.host + '/ws');
  ws.onopen = () => { attempts = 0; status(true); };
  ws.onclose = () => {
    status(false);
    if (attempts < 10) { attempts++; setTimeout(connect, 2000 * attempts); }
  };
  ws.onmessage = (e) => {
    const d = JSON.parse(e.data);
    if (d.type === 'pong') return;
    render(d);
  };
}

connect();
setInterval(() => {
  if (ws && ws.readyState === 1) ws.send(JSON.stringify({type: 'ping', timestamp: Date.now() / 1000}));
}, 15000);
</script>
</body>
</html>
)HTMLDELIM";
} // namespace vigil::dashboard
