#include "remotegate/dispatch/iterm_dispatcher.hpp"

#include "remotegate/common/strings.hpp"

namespace remotegate::dispatch {

namespace {

std::string applescript_escape(const std::string &value) {
  std::string out;
  out.reserve(value.size());
  for (const char ch : value) {
    if (ch == '\\' || ch == '"') {
      out.push_back('\\');
    }
    out.push_back(ch);
  }
  return out;
}

std::string unique_id_from_handle(const std::string &handle) {
  const auto colon = handle.find(':');
  if (colon == std::string::npos) {
    return handle;
  }
  return handle.substr(colon + 1);
}

} // namespace

ItermDispatcher::ItermDispatcher(const std::chrono::milliseconds timeout, ProcessRunner runner)
    : timeout_(timeout), runner_(std::move(runner)) {}

std::string ItermDispatcher::build_script(const std::string &session_id, const std::string &text) {
  std::string script;
  script += "tell application \"iTerm2\"\n";
  script += "  repeat with w in windows\n";
  script += "    repeat with t in tabs of w\n";
  script += "      repeat with s in sessions of t\n";
  script += "        if unique ID of s is \"" + applescript_escape(session_id) + "\" then\n";
  script += "          tell s to write text \"" + applescript_escape(text) + "\"\n";
  script += "          return \"sent\"\n";
  script += "        end if\n";
  script += "      end repeat\n";
  script += "    end repeat\n";
  script += "  end repeat\n";
  script += "  return \"session_not_found\"\n";
  script += "end tell\n";
  return script;
}

DispatchOutcome ItermDispatcher::send(const std::string &terminal_handle, const std::string &text) {
  const std::string session_id = unique_id_from_handle(common::trim(terminal_handle));
  if (session_id.empty()) {
    return DispatchOutcome::not_found("no terminal handle");
  }

  auto result = runner_({"osascript", "-e", build_script(session_id, text)}, timeout_);
  if (!result.ok()) {
    return DispatchOutcome::failed(result.error());
  }
  const auto &output = result.value();
  if (output.timed_out) {
    return DispatchOutcome::failed("osascript timed out");
  }
  const std::string reply = common::trim(output.output);
  if (output.exit_code != 0) {
    return DispatchOutcome::failed(reply.empty() ? "osascript exited with code " +
                                                       std::to_string(output.exit_code)
                                                 : reply);
  }
  if (reply == "session_not_found") {
    return DispatchOutcome::not_found("iTerm2 session not found: " + session_id);
  }
  return DispatchOutcome::ok();
}

} // namespace remotegate::dispatch
