#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "superint/core/config.h"
#include "superint/util/file_io.h"
#include "superint/util/json.h"

#define SI_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool apply_throws(const std::string& text) {
  superint::EngineConfig cfg;
  try {
    superint::apply_engine_config_json(cfg, superint::json::parse(text));
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

} // namespace

int test_config() {
  using namespace superint;

  {
    const EngineConfig cfg;
    SI_ASSERT(cfg.save_key_prefix == "save_");
    SI_ASSERT(cfg.save_version == "1.0.0");
    SI_ASSERT(cfg.autosave_name == "autosave");
    SI_ASSERT(cfg.bus_history_limit == 1000);
    SI_ASSERT(cfg.bus_max_listeners == 10);
    SI_ASSERT(!cfg.bus_debug);
    SI_ASSERT(cfg.default_compute_cost == 100.0);
  }

  // Only the keys present are overridden.
  {
    EngineConfig cfg;
    apply_engine_config_json(cfg, json::parse(R"({
      "log_level": "debug",
      "bus_history_limit": 50,
      "bus_debug": true,
      "default_compute_cost": 40,
      "risk_seed": 7,
      "unknown_key": "ignored"
    })"));
    SI_ASSERT(cfg.log_level == "debug");
    SI_ASSERT(cfg.bus_history_limit == 50);
    SI_ASSERT(cfg.bus_debug);
    SI_ASSERT(cfg.default_compute_cost == 40.0);
    SI_ASSERT(cfg.risk_seed == 7);
    SI_ASSERT(cfg.save_key_prefix == "save_");
    SI_ASSERT(cfg.bus_max_listeners == 10);
  }

  SI_ASSERT(apply_throws("[]"));
  SI_ASSERT(apply_throws(R"({"bus_debug": "yes"})"));
  SI_ASSERT(apply_throws(R"({"save_dir": 3})"));
  SI_ASSERT(apply_throws(R"({"bus_history_limit": -1})"));
  SI_ASSERT(apply_throws(R"({"default_compute_cost": 0})"));
  SI_ASSERT(!apply_throws("{}"));

  // From a file on disk.
  {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::path dir = fs::temp_directory_path(ec);
    if (ec || dir.empty()) dir = fs::path(".");
    const auto nonce = std::chrono::steady_clock::now().time_since_epoch().count();
    dir /= "superint_test_config";
    dir /= std::to_string(static_cast<long long>(nonce));

    const std::string good = (dir / "engine.json").string();
    write_text_file(good, R"({"save_dir": "my_saves", "autosave_name": "quick"})");
    const EngineConfig cfg = load_engine_config(good);
    SI_ASSERT(cfg.save_dir == "my_saves");
    SI_ASSERT(cfg.autosave_name == "quick");

    const std::string bad = (dir / "broken.json").string();
    write_text_file(bad, "{ not json");
    bool threw = false;
    try {
      (void)load_engine_config(bad);
    } catch (const std::runtime_error& e) {
      threw = std::string(e.what()).find("broken.json") != std::string::npos;
    }
    SI_ASSERT(threw);

    threw = false;
    try {
      (void)load_engine_config((dir / "missing.json").string());
    } catch (const std::runtime_error&) {
      threw = true;
    }
    SI_ASSERT(threw);

    fs::remove_all(dir, ec);
  }

  return 0;
}
