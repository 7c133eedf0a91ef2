#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "superint/util/json.h"

namespace superint {

// Engine tunables. Defaults reproduce the stock game; a JSON file can
// override any subset of them (see load_engine_config).
struct EngineConfig {
  std::string log_level{"info"};

  // Persistence.
  std::string save_key_prefix{"save_"};
  std::string save_version{"1.0.0"};
  std::string autosave_name{"autosave"};
  std::string save_dir{"saves"};

  // Event bus.
  std::size_t bus_history_limit{1000};
  std::size_t bus_max_listeners{10};
  bool bus_debug{false};

  // Research.
  std::string research_content_path{"data/research/research_tree.json"};
  // Used when a node declares no positive compute cost.
  double default_compute_cost{100.0};
  std::uint64_t risk_seed{0x5eed5eedULL};
};

// Applies the keys present in `v` (same names as the struct fields).
// Throws std::runtime_error if `v` is not an object or a value has the wrong type.
void apply_engine_config_json(EngineConfig& cfg, const json::Value& v);

// Defaults overridden by the JSON file at `path`.
EngineConfig load_engine_config(const std::string& path);

} // namespace superint
