#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace mfg {

enum class ConnectionState { Disconnected, Connecting, Connected };

enum class CommandKind {
  UpdateMorph,
  UpdateMorphs,
  ConfigureAvatar,
  UpdateHair,
  UpdateClothing,
  UpdateSkin,
  RotateCamera,
  ZoomCamera,
  MoveCamera,
  ResetAvatar,
  SaveLook
};

const char* to_string(ConnectionState state);
std::optional<ConnectionState> parse_connection_state(std::string_view name);
const char* to_string(CommandKind kind);
std::optional<CommandKind> parse_command_kind(std::string_view name);

struct QueuedCommand {
  CommandKind kind = CommandKind::UpdateMorph;
  nlohmann::json payload;
  std::string label = "update";
};

// {"type": <kind>, "data": <payload>} as the renderer expects it.
nlohmann::json to_envelope(const QueuedCommand& command);

// One channel per command kind, except morph updates which get one per morph.
std::string channel_for(CommandKind kind);
std::string morph_channel(int morph_id);

std::chrono::milliseconds steady_now();

// Per-channel last-write-wins delivery to the renderer. While connected a send
// (re)arms the channel's debounce deadline and poll() dispatches it once the
// deadline passes; while not connected the latest command per channel is held
// and flushed, in channel arrival order, when the connection comes back.
//
// Single-threaded: send, poll and set_connection_state must be called from the
// same loop.
class CommandQueue {
 public:
  using Clock = std::function<std::chrono::milliseconds()>;
  using Sink = std::function<void(const QueuedCommand&)>;

  static constexpr std::chrono::milliseconds kDefaultDebounce{50};

  struct Stats {
    uint64_t sent = 0;
    uint64_t coalesced = 0;
    uint64_t dispatched = 0;
    uint64_t flushed = 0;
    uint64_t failed = 0;
  };

  explicit CommandQueue(Sink sink, Clock clock = steady_now, std::chrono::milliseconds debounce = kDefaultDebounce);

  void send(const std::string& channel, CommandKind kind, nlohmann::json payload, std::string label = "update");
  void set_connection_state(ConnectionState state);
  size_t poll();

  ConnectionState connection_state() const { return state_; }
  std::chrono::milliseconds debounce() const { return debounce_; }
  std::optional<std::chrono::milliseconds> next_deadline() const;
  size_t pending_count() const { return slots_.size(); }
  bool has_pending(const std::string& channel) const;
  const Stats& stats() const { return stats_; }

  // Drops every pending command without delivering it.
  void clear();

 private:
  struct Slot {
    std::string channel;
    QueuedCommand command;
    std::optional<std::chrono::milliseconds> deadline;
    uint64_t arrival = 0;
  };

  Slot* find_slot(const std::string& channel);
  bool deliver(const Slot& slot);
  // Puts slots back after the connection dropped mid-dispatch. A channel that
  // was resent in the meantime keeps the newer value and the older position.
  void requeue(std::vector<Slot> undelivered);

  Sink sink_;
  Clock clock_;
  std::chrono::milliseconds debounce_;
  ConnectionState state_ = ConnectionState::Disconnected;
  std::vector<Slot> slots_;
  uint64_t next_arrival_ = 0;
  Stats stats_;
};

} // namespace mfg
