#include "superint/core/config.h"

#include <stdexcept>

#include "superint/util/file_io.h"

namespace superint {
namespace {

const json::Value* typed(const json::Object& o, const std::string& key, bool (json::Value::*check)() const,
                         const char* type_name) {
  auto it = o.find(key);
  if (it == o.end()) return nullptr;
  if (!(it->second.*check)()) {
    throw std::runtime_error("Config key '" + key + "' must be a " + type_name);
  }
  return &it->second;
}

void read_string(const json::Object& o, const std::string& key, std::string& dst) {
  if (const auto* v = typed(o, key, &json::Value::is_string, "string")) dst = v->string_value();
}

void read_bool(const json::Object& o, const std::string& key, bool& dst) {
  if (const auto* v = typed(o, key, &json::Value::is_bool, "boolean")) dst = v->bool_value();
}

void read_count(const json::Object& o, const std::string& key, std::size_t& dst) {
  if (const auto* v = typed(o, key, &json::Value::is_number, "number")) {
    const auto n = v->int_value();
    if (n < 0) throw std::runtime_error("Config key '" + key + "' must not be negative");
    dst = static_cast<std::size_t>(n);
  }
}

} // namespace

void apply_engine_config_json(EngineConfig& cfg, const json::Value& v) {
  const json::Object& o = v.object();

  read_string(o, "log_level", cfg.log_level);
  read_string(o, "save_key_prefix", cfg.save_key_prefix);
  read_string(o, "save_version", cfg.save_version);
  read_string(o, "autosave_name", cfg.autosave_name);
  read_string(o, "save_dir", cfg.save_dir);
  read_count(o, "bus_history_limit", cfg.bus_history_limit);
  read_count(o, "bus_max_listeners", cfg.bus_max_listeners);
  read_bool(o, "bus_debug", cfg.bus_debug);
  read_string(o, "research_content_path", cfg.research_content_path);

  if (const auto* d = typed(o, "default_compute_cost", &json::Value::is_number, "number")) {
    if (!(d->number_value() > 0.0)) throw std::runtime_error("Config key 'default_compute_cost' must be positive");
    cfg.default_compute_cost = d->number_value();
  }
  if (const auto* s = typed(o, "risk_seed", &json::Value::is_number, "number")) {
    cfg.risk_seed = static_cast<std::uint64_t>(s->int_value());
  }
}

EngineConfig load_engine_config(const std::string& path) {
  EngineConfig cfg;
  try {
    apply_engine_config_json(cfg, json::parse(read_text_file(path)));
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load config '" + path + "': " + e.what());
  }
  return cfg;
}

} // namespace superint
