#include "mfg/command_queue.h"

#include "mfg/log.h"

#include <algorithm>
#include <array>
#include <exception>
#include <iterator>
#include <utility>

namespace mfg {

namespace {
constexpr std::array<std::pair<CommandKind, const char*>, 11> kKindNames = {{
    {CommandKind::UpdateMorph, "updateMorph"},
    {CommandKind::UpdateMorphs, "updateMorphs"},
    {CommandKind::ConfigureAvatar, "configureAvatar"},
    {CommandKind::UpdateHair, "updateHair"},
    {CommandKind::UpdateClothing, "updateClothing"},
    {CommandKind::UpdateSkin, "updateSkin"},
    {CommandKind::RotateCamera, "rotateCamera"},
    {CommandKind::ZoomCamera, "zoomCamera"},
    {CommandKind::MoveCamera, "moveCamera"},
    {CommandKind::ResetAvatar, "resetAvatar"},
    {CommandKind::SaveLook, "saveLook"},
}};
} // namespace

const char* to_string(ConnectionState state) {
  switch (state) {
    case ConnectionState::Disconnected: return "disconnected";
    case ConnectionState::Connecting: return "connecting";
    case ConnectionState::Connected: return "connected";
  }
  return "disconnected";
}

std::optional<ConnectionState> parse_connection_state(std::string_view name) {
  if (name == "disconnected") return ConnectionState::Disconnected;
  if (name == "connecting") return ConnectionState::Connecting;
  if (name == "connected") return ConnectionState::Connected;
  return std::nullopt;
}

const char* to_string(CommandKind kind) {
  for (const auto& entry : kKindNames) {
    if (entry.first == kind) return entry.second;
  }
  return "updateMorph";
}

std::optional<CommandKind> parse_command_kind(std::string_view name) {
  for (const auto& entry : kKindNames) {
    if (name == entry.second) return entry.first;
  }
  return std::nullopt;
}

nlohmann::json to_envelope(const QueuedCommand& command) {
  nlohmann::json envelope;
  envelope["type"] = to_string(command.kind);
  envelope["data"] = command.payload;
  return envelope;
}

std::string channel_for(CommandKind kind) {
  return to_string(kind);
}

std::string morph_channel(int morph_id) {
  return std::string(to_string(CommandKind::UpdateMorph)) + ":" + std::to_string(morph_id);
}

std::chrono::milliseconds steady_now() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now().time_since_epoch());
}

CommandQueue::CommandQueue(Sink sink, Clock clock, std::chrono::milliseconds debounce)
    : sink_(std::move(sink)), clock_(std::move(clock)), debounce_(debounce) {
  if (debounce_.count() < 0) {
    debounce_ = std::chrono::milliseconds(0);
  }
}

CommandQueue::Slot* CommandQueue::find_slot(const std::string& channel) {
  auto it = std::find_if(slots_.begin(), slots_.end(), [&channel](const Slot& s) { return s.channel == channel; });
  return it == slots_.end() ? nullptr : &*it;
}

bool CommandQueue::has_pending(const std::string& channel) const {
  return std::any_of(slots_.begin(), slots_.end(), [&channel](const Slot& s) { return s.channel == channel; });
}

void CommandQueue::send(const std::string& channel, CommandKind kind, nlohmann::json payload, std::string label) {
  ++stats_.sent;
  QueuedCommand command{kind, std::move(payload), std::move(label)};
  const bool connected = state_ == ConnectionState::Connected;

  std::optional<std::chrono::milliseconds> deadline;
  if (connected) {
    deadline = clock_() + debounce_;
  }

  if (Slot* slot = find_slot(channel)) {
    ++stats_.coalesced;
    slot->command = std::move(command);
    slot->deadline = deadline;
  } else {
    slots_.push_back(Slot{channel, std::move(command), deadline, next_arrival_++});
  }

  if (!connected) {
    const auto& queued = find_slot(channel)->command;
    log::info("queued " + queued.label + " until connection resumes (channel " + channel + ", " +
              to_string(state_) + ")");
  }
}

std::optional<std::chrono::milliseconds> CommandQueue::next_deadline() const {
  std::optional<std::chrono::milliseconds> next;
  for (const auto& slot : slots_) {
    if (!slot.deadline) continue;
    if (!next || *slot.deadline < *next) next = slot.deadline;
  }
  return next;
}

bool CommandQueue::deliver(const Slot& slot) {
  if (!sink_) {
    ++stats_.failed;
    log::error("no command sink; dropped " + slot.command.label + " on " + slot.channel);
    return false;
  }
  try {
    sink_(slot.command);
  } catch (const std::exception& e) {
    ++stats_.failed;
    log::error("command sink failed for " + slot.command.label + " on " + slot.channel + ": " + e.what());
    return false;
  } catch (...) {
    ++stats_.failed;
    log::error("command sink failed for " + slot.command.label + " on " + slot.channel + ": unknown exception");
    return false;
  }
  return true;
}

void CommandQueue::requeue(std::vector<Slot> undelivered) {
  if (undelivered.empty()) return;
  log::warn("connection lost during dispatch; " + std::to_string(undelivered.size()) +
            " commands held until it resumes");
  for (auto& slot : undelivered) {
    if (Slot* newer = find_slot(slot.channel)) {
      newer->arrival = std::min(newer->arrival, slot.arrival);
      newer->deadline.reset();
      continue;
    }
    slot.deadline.reset();
    slots_.push_back(std::move(slot));
  }
  std::stable_sort(slots_.begin(), slots_.end(), [](const Slot& a, const Slot& b) { return a.arrival < b.arrival; });
}

size_t CommandQueue::poll() {
  if (state_ != ConnectionState::Connected || slots_.empty()) return 0;

  const auto now = clock_();
  std::vector<Slot> due;
  auto keep = std::stable_partition(slots_.begin(), slots_.end(),
                                    [now](const Slot& s) { return !(s.deadline && *s.deadline <= now); });
  std::move(keep, slots_.end(), std::back_inserter(due));
  slots_.erase(keep, slots_.end());

  size_t delivered = 0;
  for (auto it = due.begin(); it != due.end(); ++it) {
    if (state_ != ConnectionState::Connected) {
      requeue(std::vector<Slot>(std::make_move_iterator(it), std::make_move_iterator(due.end())));
      break;
    }
    const auto& slot = *it;
    if (!deliver(slot)) continue;
    ++stats_.dispatched;
    ++delivered;
    log::debug("sent " + slot.command.label + " (" + to_string(slot.command.kind) + ") on " + slot.channel);
  }
  return delivered;
}

void CommandQueue::set_connection_state(ConnectionState state) {
  if (state == state_) return;
  log::info(std::string("connection ") + to_string(state_) + " -> " + to_string(state));
  const bool was_connected = state_ == ConnectionState::Connected;
  state_ = state;

  if (state == ConnectionState::Connected) {
    std::vector<Slot> pending;
    pending.swap(slots_);
    for (auto it = pending.begin(); it != pending.end(); ++it) {
      if (state_ != ConnectionState::Connected) {
        requeue(std::vector<Slot>(std::make_move_iterator(it), std::make_move_iterator(pending.end())));
        break;
      }
      const auto& slot = *it;
      if (!deliver(slot)) continue;
      ++stats_.flushed;
      ++stats_.dispatched;
      log::info("flushed queued " + slot.command.label + " after reconnect (channel " + slot.channel + ")");
    }
    return;
  }

  if (was_connected) {
    for (auto& slot : slots_) {
      slot.deadline.reset();
    }
  }
}

void CommandQueue::clear() {
  slots_.clear();
}

} // namespace mfg
