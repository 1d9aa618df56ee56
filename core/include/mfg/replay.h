#pragma once

#include "mfg/command_queue.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace mfg::replay {

// One scripted step: {"at_ms": n} plus either
//   {"send": "<commandKind>", "channel": "...", "data": {...}, "label": "..."}
// or {"connection": "connected|connecting|disconnected"}.
struct ReplayStep {
  std::optional<int64_t> at_ms;
  std::optional<ConnectionState> connection;
  std::optional<CommandKind> kind;
  std::string channel;
  std::string label = "update";
  nlohmann::json data = nlohmann::json::object();
};

bool parse_step(const nlohmann::json& node, ReplayStep& out, std::string& error);

struct ReplayResult {
  CommandQueue::Stats stats;
  size_t pending = 0;
  size_t skipped = 0;
};

// Drives a queue on a manual clock: pending deadlines up to each step's
// at_ms fire before the step applies, and all remaining deadlines fire at
// the end. Invalid steps are logged and skipped.
ReplayResult run(const nlohmann::json& script, std::chrono::milliseconds debounce, CommandQueue::Sink sink);

} // namespace mfg::replay
