#include "superint/core/turn_cycle.h"

#include <algorithm>
#include <string>

#include "superint/core/enum_strings.h"

namespace superint {
namespace {

constexpr const char* kSource = "TurnCycle";
constexpr double kCompletionCompression = 0.05;
constexpr double kBreakthroughCompression = 0.1;

} // namespace

TurnCycle::TurnCycle(StateManager& state, EventBus& bus, Logger& log, const EngineConfig& cfg)
    : state_(state), bus_(bus), log_(log), cfg_(cfg) {}

TurnCycle::~TurnCycle() {
  for (auto& unsub : subscriptions_) unsub();
}

void TurnCycle::initialize() {
  if (!subscriptions_.empty()) {
    log_.warn("TurnCycle: already initialized");
    return;
  }
  subscriptions_.push_back(bus_.subscribe(
      "research:completed", [this](const BusEvent&) { adjust_time_compression(kCompletionCompression); },
      kSource));
  subscriptions_.push_back(bus_.subscribe(
      "game:event",
      [this](const BusEvent& ev) {
        const json::Value* type = ev.data.find("type");
        if (type && type->string_value() == "research_breakthrough") {
          adjust_time_compression(kBreakthroughCompression);
        }
      },
      kSource));
}

bool TurnCycle::adjust_time_compression(double amount) {
  const GameTime& t = state_.state()->meta->time;
  const double factor = std::clamp(t.compression_factor + amount, kMinTimeCompression, kMaxTimeCompression);
  const int scale = time_scale_for_compression(factor);
  if (factor == t.compression_factor && scale == t.time_scale) return false;
  state_.dispatch(UpdateTimeCompression{factor, scale});

  json::Object data;
  data["compression_factor"] = factor;
  data["time_scale"] = scale;
  bus_.emit("time:compression:changed", std::move(data), kSource);
  return true;
}

int TurnCycle::turn() const { return state_.state()->meta->turn; }

void TurnCycle::set_phase(Phase phase) {
  const Phase previous = state_.state()->meta->phase;
  if (previous == phase) return;
  state_.dispatch(SetPhase{phase});

  json::Object data;
  data["previous"] = phase_to_string(previous);
  data["phase"] = phase_to_string(phase);
  data["turn"] = turn();
  bus_.emit("phase:changed", std::move(data), kSource);
}

void TurnCycle::start_turn() {
  set_phase(Phase::Start);
  log_.info("Turn " + std::to_string(turn()) + " started");

  json::Object data;
  data["turn"] = turn();
  bus_.emit("turn:start", std::move(data), kSource);

  if (state_.state()->settings->auto_save) {
    if (!state_.save_state(cfg_.autosave_name)) log_.warn("TurnCycle: autosave failed");
  }

  set_phase(Phase::Action);
}

void TurnCycle::end_turn() {
  const int ending = turn();

  set_phase(Phase::End);
  json::Object ending_data;
  ending_data["turn"] = ending;
  bus_.emit("turn:ending", std::move(ending_data), kSource);

  set_phase(Phase::Resolution);
  {
    const auto& meta = *state_.state()->meta;
    state_.dispatch(AddTurnHistory{TurnHistoryEntry{ending, meta.time.year, meta.time.quarter, state_.now()}});
  }
  state_.dispatch(AdvanceTurn{});
  state_.dispatch(UpdateGameTime{advance_game_time(state_.state()->meta->time)});

  const GameTime& t = state_.state()->meta->time;
  json::Object ended;
  ended["turn"] = ending;
  ended["year"] = t.year;
  ended["quarter"] = t.quarter;
  ended["month"] = t.month;
  ended["day"] = t.day;
  bus_.emit("turn:ended", std::move(ended), kSource);

  start_turn();
}

} // namespace superint
