#include "mfg/avatar_commands.h"
#include "mfg/command_queue.h"
#include "mfg/log.h"
#include "mfg/morph_catalog.h"
#include "mfg/replay.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;
using std::chrono::milliseconds;

namespace {
struct Harness {
  milliseconds now{0};
  std::vector<mfg::QueuedCommand> sent;

  mfg::CommandQueue make(milliseconds debounce = mfg::CommandQueue::kDefaultDebounce) {
    return mfg::CommandQueue([this](const mfg::QueuedCommand& cmd) { sent.push_back(cmd); },
                             [this]() { return now; }, debounce);
  }
};

json morph_payload(int id, double value) {
  return json{{"morphId", id}, {"value", value}};
}
} // namespace

int main() {
  mfg::log::init();
  mfg::log::set_console_level(mfg::log::Level::Error);

  int failures = 0;

  // Test: rapid updates on one channel coalesce to the last value.
  {
    Harness h;
    auto queue = h.make();
    queue.set_connection_state(mfg::ConnectionState::Connected);
    const auto channel = mfg::morph_channel(11);
    for (int i = 1; i <= 5; ++i) {
      queue.send(channel, mfg::CommandKind::UpdateMorph, morph_payload(11, i * 0.1));
      h.now += milliseconds(10);
      queue.poll();
    }
    if (!h.sent.empty()) {
      std::cerr << "debounced command dispatched early\n";
      ++failures;
    }
    h.now += milliseconds(60);
    if (queue.poll() != 1 || h.sent.size() != 1) {
      std::cerr << "expected exactly one dispatch after the window\n";
      ++failures;
    } else if (h.sent[0].payload["value"].get<double>() != 5 * 0.1) {
      std::cerr << "dispatched value is not the most recent\n";
      ++failures;
    }
    if (queue.stats().sent != 5 || queue.stats().coalesced != 4 || queue.pending_count() != 0) {
      std::cerr << "coalescing stats wrong\n";
      ++failures;
    }
  }

  // Test: the deadline restarts on every send.
  {
    Harness h;
    auto queue = h.make(milliseconds(50));
    queue.set_connection_state(mfg::ConnectionState::Connected);
    queue.send("updateHair", mfg::CommandKind::UpdateHair, json{{"styleId", 1}});
    h.now = milliseconds(40);
    queue.send("updateHair", mfg::CommandKind::UpdateHair, json{{"styleId", 2}});
    h.now = milliseconds(60);
    queue.poll();
    if (!h.sent.empty()) {
      std::cerr << "deadline did not restart on resend\n";
      ++failures;
    }
    if (queue.next_deadline() != milliseconds(90)) {
      std::cerr << "next deadline wrong\n";
      ++failures;
    }
    h.now = milliseconds(90);
    queue.poll();
    if (h.sent.size() != 1 || h.sent[0].payload["styleId"] != 2) {
      std::cerr << "restarted deadline did not dispatch\n";
      ++failures;
    }
  }

  // Test: independent channels dispatch in arrival order.
  {
    Harness h;
    auto queue = h.make();
    queue.set_connection_state(mfg::ConnectionState::Connected);
    queue.send(mfg::morph_channel(3), mfg::CommandKind::UpdateMorph, morph_payload(3, 0.3));
    queue.send(mfg::morph_channel(1), mfg::CommandKind::UpdateMorph, morph_payload(1, 0.1));
    queue.send(mfg::channel_for(mfg::CommandKind::UpdateSkin), mfg::CommandKind::UpdateSkin, json{{"colorId", 2}});
    h.now = milliseconds(100);
    if (queue.poll() != 3 || h.sent.size() != 3) {
      std::cerr << "expected three dispatches\n";
      ++failures;
    } else if (h.sent[0].payload["morphId"] != 3 || h.sent[1].payload["morphId"] != 1 ||
               h.sent[2].kind != mfg::CommandKind::UpdateSkin) {
      std::cerr << "dispatch order does not follow channel arrival\n";
      ++failures;
    }
  }

  // Test: offline updates flush once on reconnect.
  {
    Harness h;
    auto queue = h.make();
    const auto channel = mfg::morph_channel(11);
    mfg::log::clear_recent();
    queue.send(channel, mfg::CommandKind::UpdateMorph, morph_payload(11, 0.2), "waist");
    const auto lines = mfg::log::recent(10);
    if (lines.size() != 1 || lines[0].find("queued waist until connection resumes") == std::string::npos) {
      std::cerr << "offline send should log a queued diagnostic\n";
      ++failures;
    }
    queue.set_connection_state(mfg::ConnectionState::Connecting);
    queue.send(channel, mfg::CommandKind::UpdateMorph, morph_payload(11, 0.7), "waist");
    h.now = milliseconds(500);
    queue.poll();
    if (!h.sent.empty() || !queue.has_pending(channel) || queue.next_deadline().has_value()) {
      std::cerr << "offline command should wait without a deadline\n";
      ++failures;
    }
    queue.set_connection_state(mfg::ConnectionState::Connected);
    if (h.sent.size() != 1 || h.sent[0].payload["value"].get<double>() != 0.7) {
      std::cerr << "reconnect should flush exactly the latest value\n";
      ++failures;
    }
    h.now = milliseconds(1000);
    queue.poll();
    if (h.sent.size() != 1 || queue.stats().flushed != 1) {
      std::cerr << "flushed command dispatched twice\n";
      ++failures;
    }
  }

  // Test: dropping the connection keeps pending commands for the next reconnect.
  {
    Harness h;
    auto queue = h.make();
    queue.set_connection_state(mfg::ConnectionState::Connected);
    queue.send("zoomCamera", mfg::CommandKind::ZoomCamera, json{{"delta", 1.5}});
    queue.set_connection_state(mfg::ConnectionState::Disconnected);
    h.now = milliseconds(200);
    queue.poll();
    if (!h.sent.empty() || queue.pending_count() != 1) {
      std::cerr << "pending command lost or sent while disconnected\n";
      ++failures;
    }
    queue.set_connection_state(mfg::ConnectionState::Connected);
    if (h.sent.size() != 1 || h.sent[0].kind != mfg::CommandKind::ZoomCamera) {
      std::cerr << "pending command not flushed on reconnect\n";
      ++failures;
    }
  }

  // Test: a failing sink does not wedge the queue.
  {
    milliseconds now{0};
    int calls = 0;
    mfg::CommandQueue queue(
        [&calls](const mfg::QueuedCommand&) {
          if (++calls == 1) throw std::runtime_error("socket closed");
        },
        [&now]() { return now; });
    queue.set_connection_state(mfg::ConnectionState::Connected);
    queue.send("a", mfg::CommandKind::SaveLook, json::object());
    queue.send("b", mfg::CommandKind::ResetAvatar, json::object());
    now = milliseconds(100);
    const auto delivered = queue.poll();
    if (delivered != 1 || calls != 2 || queue.stats().failed != 1 || queue.pending_count() != 0) {
      std::cerr << "sink failure handling wrong\n";
      ++failures;
    }
  }

  // Test: a sink that throws a non-standard exception is contained.
  {
    milliseconds now{0};
    std::vector<std::string> channels;
    mfg::CommandQueue queue(
        [&channels](const mfg::QueuedCommand& cmd) {
          if (cmd.kind == mfg::CommandKind::SaveLook) throw 7;
          channels.push_back(mfg::to_string(cmd.kind));
        },
        [&now]() { return now; });
    queue.set_connection_state(mfg::ConnectionState::Connected);
    queue.send("a", mfg::CommandKind::SaveLook, json::object());
    queue.send("b", mfg::CommandKind::ResetAvatar, json::object());
    now = milliseconds(100);
    if (queue.poll() != 1 || queue.stats().failed != 1 || channels.size() != 1) {
      std::cerr << "non-standard sink exception not contained\n";
      ++failures;
    }
  }

  // Test: losing the connection during a reconnect flush holds the rest.
  {
    milliseconds now{0};
    std::vector<int> delivered_ids;
    mfg::CommandQueue* target = nullptr;
    mfg::CommandQueue queue(
        [&delivered_ids, &target](const mfg::QueuedCommand& cmd) {
          delivered_ids.push_back(cmd.payload["morphId"].get<int>());
          if (delivered_ids.size() == 1) target->set_connection_state(mfg::ConnectionState::Disconnected);
        },
        [&now]() { return now; });
    target = &queue;
    queue.send(mfg::morph_channel(1), mfg::CommandKind::UpdateMorph, morph_payload(1, 0.1));
    queue.send(mfg::morph_channel(2), mfg::CommandKind::UpdateMorph, morph_payload(2, 0.2));
    queue.send(mfg::morph_channel(3), mfg::CommandKind::UpdateMorph, morph_payload(3, 0.3));
    queue.set_connection_state(mfg::ConnectionState::Connected);
    if (delivered_ids.size() != 1 || queue.pending_count() != 2 ||
        queue.connection_state() != mfg::ConnectionState::Disconnected || queue.next_deadline().has_value()) {
      std::cerr << "flush continued after the connection dropped\n";
      ++failures;
    }
    queue.send(mfg::morph_channel(3), mfg::CommandKind::UpdateMorph, morph_payload(3, 0.9));
    queue.set_connection_state(mfg::ConnectionState::Connected);
    if (delivered_ids != std::vector<int>{1, 2, 3} || queue.pending_count() != 0) {
      std::cerr << "held commands not flushed in order on the next reconnect\n";
      ++failures;
    }
  }

  // Test: losing the connection during poll holds the remaining due commands.
  {
    milliseconds now{0};
    std::vector<std::string> delivered;
    mfg::CommandQueue* target = nullptr;
    mfg::CommandQueue queue(
        [&delivered, &target](const mfg::QueuedCommand& cmd) {
          delivered.push_back(cmd.label);
          if (delivered.size() == 1) target->set_connection_state(mfg::ConnectionState::Disconnected);
        },
        [&now]() { return now; });
    target = &queue;
    queue.set_connection_state(mfg::ConnectionState::Connected);
    queue.send("a", mfg::CommandKind::UpdateHair, json::object(), "a");
    queue.send("b", mfg::CommandKind::UpdateSkin, json::object(), "b");
    queue.send("c", mfg::CommandKind::ZoomCamera, json::object(), "c");
    now = milliseconds(100);
    if (queue.poll() != 1 || queue.pending_count() != 2 || queue.next_deadline().has_value()) {
      std::cerr << "poll continued after the connection dropped\n";
      ++failures;
    }
    queue.set_connection_state(mfg::ConnectionState::Connected);
    if (delivered != std::vector<std::string>{"a", "b", "c"}) {
      std::cerr << "held due commands lost or reordered\n";
      ++failures;
    }
  }

  // Test: scripted replay skips malformed steps instead of throwing.
  {
    const auto script = json::parse(R"([
      {"at_ms": 0, "connection": "connected"},
      {"at_ms": "soon", "send": "updateHair"},
      {"at_ms": 5, "send": "updateHair", "channel": 12},
      {"at_ms": 5, "send": "updateHair", "label": {"text": "hair"}},
      {"at_ms": 5, "send": "launchRocket"},
      {"at_ms": 5, "connection": true},
      {"at_ms": 10, "send": "updateHair", "data": {"styleId": 1}, "label": "hair"},
      {"at_ms": 20, "send": "updateHair", "data": {"styleId": 2}, "label": "hair"}
    ])");
    std::vector<mfg::QueuedCommand> out;
    const auto result =
        mfg::replay::run(script, milliseconds(50), [&out](const mfg::QueuedCommand& cmd) { out.push_back(cmd); });
    if (result.skipped != 5 || result.stats.sent != 2 || result.stats.dispatched != 1 || result.pending != 0) {
      std::cerr << "replay skipped " << result.skipped << " steps, dispatched " << result.stats.dispatched << "\n";
      ++failures;
    }
    if (out.size() != 1 || out[0].payload["styleId"] != 2 || out[0].label != "hair") {
      std::cerr << "replay did not coalesce the valid steps\n";
      ++failures;
    }

    mfg::replay::ReplayStep step;
    std::string error;
    if (mfg::replay::parse_step(json{{"send", "zoomCamera"}, {"channel", 3}}, step, error) ||
        error != "channel must be a string") {
      std::cerr << "non-string channel should be rejected\n";
      ++failures;
    }
    if (!mfg::replay::parse_step(json{{"send", "zoomCamera"}}, step, error) || step.channel != "zoomCamera" ||
        step.at_ms.has_value()) {
      std::cerr << "minimal send step should default its channel\n";
      ++failures;
    }
  }

  // Test: envelopes and kind names.
  {
    const auto envelope = mfg::to_envelope({mfg::CommandKind::RotateCamera, json{{"yaw", 10}}, "camera"});
    if (envelope["type"] != "rotateCamera" || envelope["data"]["yaw"] != 10) {
      std::cerr << "envelope shape wrong\n";
      ++failures;
    }
    if (mfg::parse_command_kind("configureAvatar") != mfg::CommandKind::ConfigureAvatar ||
        mfg::parse_command_kind("launchRocket").has_value()) {
      std::cerr << "command kind parsing wrong\n";
      ++failures;
    }
    if (mfg::morph_channel(42) != "updateMorph:42") {
      std::cerr << "morph channel name wrong\n";
      ++failures;
    }
  }

  // Test: configureAvatar payload.
  {
    mfg::MorphAttribute waist;
    waist.morph_id = 11;
    waist.label_name = "Waist Width";
    waist.morph_name = "WaistWidth";
    waist.category = mfg::MorphCategory::Waist;
    waist.value = 75;
    waist.min = -1.0;
    waist.max = 1.0;

    mfg::AvatarConfiguration config;
    config.avatar_id = "avatar_1";
    config.gender = mfg::Gender::Male;
    config.morphs = {waist};
    const auto cmd = mfg::make_configure_avatar_command(config);
    if (cmd.kind != mfg::CommandKind::ConfigureAvatar || cmd.payload["avatarId"] != "avatar_1" ||
        cmd.payload["gender"] != "male") {
      std::cerr << "configureAvatar header wrong\n";
      ++failures;
    }
    if (cmd.payload["baseMorphs"]["178"] != 1 || cmd.payload["baseMorphs"]["176"] != 0) {
      std::cerr << "configureAvatar base morphs wrong\n";
      ++failures;
    }
    if (std::fabs(cmd.payload["morphValues"]["11"].get<double>() - 0.5) > 1e-9) {
      std::cerr << "slider to renderer conversion wrong\n";
      ++failures;
    }
    if (mfg::renderer_to_slider_value(0.5, waist) != 75 || mfg::renderer_to_slider_value(7.0, waist) != 100 ||
        mfg::renderer_to_slider_value(1e20, waist) != 100 || mfg::renderer_to_slider_value(-1e20, waist) != 0) {
      std::cerr << "renderer to slider conversion wrong\n";
      ++failures;
    }

    const auto report = mfg::validate_avatar_configuration(config);
    if (!report.valid || report.warnings.size() != 1) {
      std::cerr << "missing base morphs should only warn\n";
      ++failures;
    }
    mfg::AvatarConfiguration empty;
    const auto bad = mfg::validate_avatar_configuration(empty);
    if (bad.valid || bad.errors.size() != 2) {
      std::cerr << "empty configuration should fail validation\n";
      ++failures;
    }
  }

  // Test: appearance commands.
  {
    const auto hair = mfg::make_hair_command({4, "#AbC"});
    if (hair.payload["styleId"] != 4 || hair.payload["color"] != "#aabbcc") {
      std::cerr << "hair command wrong\n";
      ++failures;
    }
    const auto clothing = mfg::make_clothing_command({mfg::ClothingCategory::Bottom, 9, "", "zzz"});
    if (clothing.payload["category"] != "bottom" || clothing.payload["subCategory"] != "default" ||
        clothing.payload.contains("color")) {
      std::cerr << "clothing command wrong\n";
      ++failures;
    }
    if (mfg::normalize_color_hex("12345").has_value() || mfg::normalize_color_hex(" #00FF7f ") != "#00ff7f") {
      std::cerr << "colour normalization wrong\n";
      ++failures;
    }
    const auto stats = mfg::compute_morph_statistics({});
    if (stats.total != 0) {
      std::cerr << "empty statistics wrong\n";
      ++failures;
    }
  }

  mfg::log::shutdown();
  return failures == 0 ? 0 : 1;
}
