#include "mfg/replay.h"

#include "mfg/log.h"

#include <algorithm>
#include <utility>

namespace mfg::replay {

namespace {
bool optional_string(const nlohmann::json& node, const char* key, std::string& out, std::string& error) {
  if (!node.contains(key)) return true;
  if (!node[key].is_string()) {
    error = std::string(key) + " must be a string";
    return false;
  }
  out = node[key].get<std::string>();
  return true;
}
} // namespace

bool parse_step(const nlohmann::json& node, ReplayStep& out, std::string& error) {
  if (!node.is_object()) {
    error = "step is not an object";
    return false;
  }
  out = {};
  if (node.contains("at_ms")) {
    if (!node["at_ms"].is_number_integer()) {
      error = "at_ms must be an integer";
      return false;
    }
    out.at_ms = node["at_ms"].get<int64_t>();
  }

  if (node.contains("connection")) {
    if (!node["connection"].is_string()) {
      error = "connection must be a string";
      return false;
    }
    out.connection = parse_connection_state(node["connection"].get<std::string>());
    if (!out.connection) {
      error = "unknown connection state " + node["connection"].dump();
      return false;
    }
    return true;
  }

  if (!node.contains("send")) {
    error = "step has neither send nor connection";
    return false;
  }
  if (!node["send"].is_string()) {
    error = "send must be a string";
    return false;
  }
  out.kind = parse_command_kind(node["send"].get<std::string>());
  if (!out.kind) {
    error = "unknown command type " + node["send"].dump();
    return false;
  }
  out.channel = channel_for(*out.kind);
  if (!optional_string(node, "channel", out.channel, error)) return false;
  if (!optional_string(node, "label", out.label, error)) return false;
  if (node.contains("data")) out.data = node["data"];
  return true;
}

ReplayResult run(const nlohmann::json& script, std::chrono::milliseconds debounce, CommandQueue::Sink sink) {
  ReplayResult result;
  if (!script.is_array()) {
    log::warn("replay: script is not an array");
    return result;
  }

  std::chrono::milliseconds now{0};
  CommandQueue queue(std::move(sink), [&now]() { return now; }, debounce);

  size_t index = 0;
  for (const auto& node : script) {
    ReplayStep step;
    std::string error;
    if (!parse_step(node, step, error)) {
      log::warn("replay: skipping step " + std::to_string(index) + ": " + error);
      ++result.skipped;
      ++index;
      continue;
    }
    ++index;

    const auto at = step.at_ms ? std::chrono::milliseconds(*step.at_ms) : now;
    while (true) {
      const auto due = queue.next_deadline();
      if (!due || *due > at) break;
      now = std::max(now, *due);
      queue.poll();
    }
    now = std::max(now, at);

    if (step.connection) {
      queue.set_connection_state(*step.connection);
    } else {
      queue.send(step.channel, *step.kind, std::move(step.data), step.label);
    }
    queue.poll();
  }

  while (const auto due = queue.next_deadline()) {
    now = std::max(now, *due);
    queue.poll();
  }

  result.stats = queue.stats();
  result.pending = queue.pending_count();
  return result;
}

} // namespace mfg::replay
