#include "remotegate/gateway/pages.hpp"

#include "remotegate/common/strings.hpp"

#include <fstream>
#include <sstream>
#include <unordered_map>

namespace remotegate::gateway {

namespace {

constexpr const char *kControlPage = R"HTML(<!DOCTYPE html>
<html lang="en">
<head>
  <meta charset="UTF-8">
  <meta name="viewport" content="width=device-width, initial-scale=1.0">
  <title>{{TITLE}}</title>
  <style>
    body { font-family: -apple-system, sans-serif; background: #0d1117; color: #e6edf3;
           margin: 0; padding: 24px; }
    .card { max-width: 480px; margin: 0 auto; background: #161b22; border-radius: 12px;
            padding: 24px; border: 1px solid #30363d; }
    .icon { font-size: 40px; }
    .meta { color: #8b949e; font-size: 13px; margin: 4px 0 16px; }
    .message { white-space: pre-wrap; background: #0d1117; padding: 12px; border-radius: 8px;
               font-size: 14px; }
    .actions { display: flex; gap: 12px; margin-top: 20px; }
    button { flex: 1; padding: 14px; font-size: 16px; border: 0; border-radius: 8px;
             color: #fff; cursor: pointer; }
    .approve { background: #238636; }
    .deny { background: #da3633; }
    .send { background: #1f6feb; margin-top: 8px; width: 100%; }
    textarea { width: 100%; box-sizing: border-box; margin-top: 20px; min-height: 80px;
               background: #0d1117; color: #e6edf3; border: 1px solid #30363d;
               border-radius: 8px; padding: 8px; font-size: 14px; }
    #status { margin-top: 16px; color: #8b949e; min-height: 1em; }
  </style>
</head>
<body>
  <div class="card" data-token="{{TOKEN}}" data-created-at="{{CREATED_AT}}">
    <div class="icon">{{ICON}}</div>
    <h1>{{TITLE}}</h1>
    <div class="meta">{{PROJECT}} &middot; {{EVENT_TYPE}} &middot; <span id="age"></span></div>
    <div class="message">{{MESSAGE}}</div>
    <div class="actions">
      <button class="approve" onclick="resolve('approve')">Approve</button>
      <button class="deny" onclick="resolve('deny')">Deny</button>
    </div>
    <textarea id="text" placeholder="Type a reply for the terminal"></textarea>
    <button class="send" onclick="sendText()">Send</button>
    <div id="status"></div>
  </div>
  <script>
    const card = document.querySelector('.card');
    const token = card.dataset.token;
    const createdAt = Number(card.dataset.createdAt);
    const status = document.getElementById('status');
    function tick() {
      const minutes = Math.floor((Date.now() - createdAt) / 60000);
      document.getElementById('age').textContent = minutes < 1 ? 'just now' : minutes + ' min ago';
    }
    function done(body) {
      if (!body.ok) { status.textContent = body.error || 'Request failed'; return; }
      document.querySelectorAll('button, textarea').forEach(el => el.disabled = true);
      if (body.already_decided) { status.textContent = 'Already decided: ' + body.decision; return; }
      status.textContent = body.dispatched ? 'Sent to terminal' : 'Recorded (' + body.dispatch + ')';
    }
    function resolve(action) {
      fetch('/' + action + '/' + encodeURIComponent(token)).then(r => r.json()).then(done)
        .catch(() => { status.textContent = 'Network error'; });
    }
    function sendText() {
      const text = document.getElementById('text').value;
      fetch('/control/' + encodeURIComponent(token), {
        method: 'POST', headers: {'Content-Type': 'application/json'},
        body: JSON.stringify({text: text})
      }).then(r => r.json()).then(done).catch(() => { status.textContent = 'Network error'; });
    }
    tick();
    setInterval(tick, 30000);
  </script>
</body>
</html>
)HTML";

constexpr const char *kExpiredPage = R"HTML(<!DOCTYPE html>
<html lang="en">
<head>
  <meta charset="UTF-8">
  <meta name="viewport" content="width=device-width, initial-scale=1.0">
  <title>Expired</title>
  <style>
    body { font-family: -apple-system, sans-serif; background: #0d1117; color: #8b949e;
           display: flex; justify-content: center; align-items: center; height: 100vh; }
    .msg { text-align: center; }
    .msg .icon { font-size: 48px; margin-bottom: 16px; }
    .msg h1 { color: #e6edf3; font-size: 20px; margin-bottom: 8px; }
  </style>
</head>
<body>
  <div class="msg">
    <div class="icon">&#x23F0;</div>
    <h1>Link Expired</h1>
    <p>This action link has expired or was already used.</p>
  </div>
</body>
</html>
)HTML";

// Placeholders are resolved against the template only, never inside a value
// that was already substituted.
std::string substitute_placeholders(
    const std::string &page_template,
    const std::unordered_map<std::string, std::string> &values) {
  std::string out;
  out.reserve(page_template.size() + 512);
  std::size_t pos = 0;
  while (pos < page_template.size()) {
    const auto open = page_template.find("{{", pos);
    if (open == std::string::npos) {
      break;
    }
    const auto close = page_template.find("}}", open + 2);
    if (close == std::string::npos) {
      break;
    }
    out.append(page_template, pos, open - pos);
    const auto it = values.find(page_template.substr(open + 2, close - open - 2));
    if (it == values.end()) {
      out.append(page_template, open, 2);
      pos = open + 2;
      continue;
    }
    out += it->second;
    pos = close + 2;
  }
  out.append(page_template, pos, std::string::npos);
  return out;
}

} // namespace

const std::string &default_control_page_template() {
  static const std::string page(kControlPage);
  return page;
}

common::Result<std::string> load_page_template(const std::string &path) {
  if (common::trim(path).empty()) {
    return common::Result<std::string>::success(default_control_page_template());
  }
  const std::string expanded = common::expand_path(common::trim(path));
  std::ifstream in(expanded);
  if (!in) {
    return common::Result<std::string>::failure("cannot read page template: " + expanded);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return common::Result<std::string>::success(buffer.str());
}

std::string render_control_page(const std::string &page_template, const PageFields &fields) {
  return substitute_placeholders(page_template,
                                 {
                                     {"TOKEN", common::html_escape(fields.token)},
                                     {"CREATED_AT", std::to_string(fields.created_at_ms)},
                                     {"ICON", common::html_escape(fields.icon)},
                                     {"TITLE", common::html_escape(fields.title)},
                                     {"PROJECT", common::html_escape(fields.project)},
                                     {"EVENT_TYPE", common::html_escape(fields.event_type)},
                                     {"MESSAGE", common::html_escape(fields.message)},
                                 });
}

std::string render_expired_page() { return kExpiredPage; }

std::string action_icon(const control::ActionKind kind) {
  switch (kind) {
  case control::ActionKind::Permission:
    return "\xF0\x9F\x94\x92";
  case control::ActionKind::Idle:
    return "\xE2\x8C\x9B";
  case control::ActionKind::Elicitation:
    return "\xE2\x9D\x93";
  case control::ActionKind::Completion:
    return "\xE2\x9C\x85";
  case control::ActionKind::Unspecified:
    break;
  }
  return "\xF0\x9F\x94\x94";
}

std::string action_title(const control::ActionKind kind) {
  switch (kind) {
  case control::ActionKind::Permission:
    return "Permission Required";
  case control::ActionKind::Idle:
    return "Agent is Idle";
  case control::ActionKind::Elicitation:
    return "Agent has a Question";
  case control::ActionKind::Completion:
    return "Task Complete";
  case control::ActionKind::Unspecified:
    break;
  }
  return "Agent Notification";
}

} // namespace remotegate::gateway
