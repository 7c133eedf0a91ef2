#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "superint/core/config.h"
#include "superint/core/enum_strings.h"
#include "superint/core/event_bus.h"
#include "superint/core/random_source.h"
#include "superint/core/research_content.h"
#include "superint/core/research_engine.h"
#include "superint/core/resource_economy.h"
#include "superint/core/save_store.h"
#include "superint/core/serialization.h"
#include "superint/core/state_manager.h"
#include "superint/core/turn_cycle.h"
#include "superint/util/file_io.h"
#include "superint/util/log.h"

namespace {

#ifndef SUPERINT_VERSION
#define SUPERINT_VERSION "unknown"
#endif

int get_int_arg(int argc, char** argv, const std::string& key, int def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return std::stoi(argv[i + 1]);
  }
  return def;
}

std::string get_str_arg(int argc, char** argv, const std::string& key, const std::string& def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return argv[i + 1];
  }
  return def;
}

bool has_flag(int argc, char** argv, const std::string& flag) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] == flag) return true;
  }
  return false;
}

std::vector<std::string> split_csv(const std::string& s) {
  std::vector<std::string> out;
  std::string cur;
  for (char ch : s) {
    if (ch == ',') {
      if (!cur.empty()) out.push_back(cur);
      cur.clear();
    } else {
      cur.push_back(ch);
    }
  }
  if (!cur.empty()) out.push_back(cur);
  return out;
}

superint::Timestamp wall_clock_ms() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

void print_usage(const char* exe) {
  std::cout << "SuperInt++ headless simulation\n\n";
  std::cout << "Usage: " << exe << " [options]\n\n";
  std::cout << "  --config PATH      Engine config JSON (optional)\n";
  std::cout << "  --content PATH     Research tree JSON (default from config)\n";
  std::cout << "  --turns N          Turns to simulate (default 8)\n";
  std::cout << "  --seed N           Seed for research risk rolls\n";
  std::cout << "  --save-dir DIR     Directory for save records (default from config)\n";
  std::cout << "  --log-level LEVEL  debug|info|warn|error|off\n";
  std::cout << "  --research A,B     Start these nodes on turn 1 instead of the cheapest available\n";
  std::cout << "  --compute N        Compute committed to each started node (default 10)\n";
  std::cout << "  --load NAME        Load a named save before simulating\n";
  std::cout << "  --save NAME        Save under NAME when done\n";
  std::cout << "  --list-saves       List saves in the save directory and exit\n";
  std::cout << "  --validate-content Validate the research tree and exit\n";
  std::cout << "  --dump             Print the final game state as JSON\n";
  std::cout << "  --quiet            Only print the final summary\n";
  std::cout << "  -h, --help         Show this help\n";
  std::cout << "  --version          Print version and exit\n";
}

void print_summary(const superint::StateManager& sm, const superint::ResearchEngine& research,
                   const superint::ResourceEconomy& economy) {
  using namespace superint;
  const auto& meta = *sm.state()->meta;
  const ResearchMetrics rm = research.calculate_research_metrics();
  const ResourceMetrics em = economy.calculate_resource_metrics();

  std::cout << "\nTurn " << meta.turn << " (" << meta.time.year << " Q" << meta.time.quarter << ", "
            << meta.time.time_scale << " days/turn)\n";
  const auto& pending = sm.state()->events->current;
  if (!pending.empty()) std::cout << "  Pending events: " << pending.size() << "\n";
  std::cout << std::fixed << std::setprecision(1);
  std::cout << "  Compute: " << em.computing_total << " total, " << em.computing_available << " available ("
            << em.computing_utilization_percent << "% used), efficiency " << em.computing_efficiency << "\n";
  std::cout << "  Funding: " << em.funding_current << " (net " << em.funding_net_flow << "/turn)\n";
  std::cout << "  Influence:";
  for (InfluenceChannel c : kInfluenceChannels) std::cout << " " << influence_channel_to_string(c) << "=" << em.influence[c];
  std::cout << "\n";
  std::cout << "  Research: " << rm.completed << "/" << rm.total_nodes << " complete (" << rm.completed_percent
            << "%), " << rm.in_progress << " in progress, " << rm.unlocked << " available\n";
  for (const auto& [id, pct] : rm.active_progress) {
    std::cout << "    " << id << ": " << pct << "%";
    auto it = rm.turns_to_completion.find(id);
    if (it != rm.turns_to_completion.end() && it->second) std::cout << " (" << *it->second << " turns left)";
    std::cout << "\n";
  }
}

// Starts the requested nodes, or the cheapest affordable one when none are named.
void start_initial_research(superint::ResearchEngine& research, const superint::StateManager& sm,
                            const std::vector<std::string>& requested, double compute) {
  using namespace superint;
  if (!requested.empty()) {
    for (const auto& id : requested) research.start_research(id, compute);
    return;
  }
  const ResearchNode* best = nullptr;
  for (const auto& [id, node] : sm.state()->research->nodes) {
    if (node.status != ResearchStatus::Unlocked || !research.can_afford_research(id)) continue;
    if (!best || node.def.compute_cost < best->def.compute_cost ||
        (node.def.compute_cost == best->def.compute_cost && node.id() < best->id())) {
      best = &node;
    }
  }
  if (best) research.start_research(best->id(), compute);
}

} // namespace

int main(int argc, char** argv) {
  superint::Logger log;
  try {
    if (has_flag(argc, argv, "--version")) {
      std::cout << SUPERINT_VERSION << "\n";
      return 0;
    }
    if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
      print_usage(argv[0]);
      return 0;
    }

    const std::string config_path = get_str_arg(argc, argv, "--config", "");
    superint::EngineConfig cfg = config_path.empty() ? superint::EngineConfig{} : superint::load_engine_config(config_path);
    cfg.research_content_path = get_str_arg(argc, argv, "--content", cfg.research_content_path);
    cfg.save_dir = get_str_arg(argc, argv, "--save-dir", cfg.save_dir);
    cfg.log_level = get_str_arg(argc, argv, "--log-level", cfg.log_level);
    if (const int seed = get_int_arg(argc, argv, "--seed", -1); seed >= 0) cfg.risk_seed = static_cast<std::uint64_t>(seed);

    const bool quiet = has_flag(argc, argv, "--quiet");
    log.set_level(superint::log::parse_level(cfg.log_level, quiet ? superint::log::Level::Warn : superint::log::Level::Info));

    superint::ResearchDB db = superint::load_research_db_from_file(cfg.research_content_path);
    if (has_flag(argc, argv, "--validate-content")) {
      const auto errors = superint::validate_research_db(db);
      if (errors.empty()) {
        std::cout << "Research content OK (" << db.nodes.size() << " nodes)\n";
        return 0;
      }
      for (const auto& e : errors) std::cerr << "  " << e << "\n";
      return 1;
    }

    superint::EventBus bus(log, cfg.bus_history_limit, cfg.bus_max_listeners);
    bus.set_debug(cfg.bus_debug);
    superint::DirectorySaveStore store(cfg.save_dir);
    superint::StateManager sm(superint::make_initial_game_state(wall_clock_ms()), bus, log, store, &wall_clock_ms, cfg);

    if (has_flag(argc, argv, "--list-saves")) {
      for (const auto& s : sm.list_saves()) {
        std::cout << s.name << "  turn " << s.turn << "  " << s.year << " Q" << s.quarter << "  v" << s.version << "\n";
      }
      return 0;
    }

    superint::HashRandomSource rng(cfg.risk_seed);
    superint::ResourceEconomy economy(sm, bus, log);
    superint::ResearchEngine research(sm, bus, log, rng, cfg);
    economy.initialize();
    research.initialize(std::move(db));

    const std::string load_name = get_str_arg(argc, argv, "--load", "");
    if (!load_name.empty() && !sm.load_state(load_name)) {
      std::cerr << "Could not load save '" << load_name << "'\n";
      return 1;
    }

    const int turns = get_int_arg(argc, argv, "--turns", 8);
    const double compute = static_cast<double>(get_int_arg(argc, argv, "--compute", 10));

    superint::TurnCycle cycle(sm, bus, log, cfg);
    cycle.initialize();
    cycle.start_turn();
    start_initial_research(research, sm, split_csv(get_str_arg(argc, argv, "--research", "")), compute);

    for (int i = 0; i < turns; ++i) {
      cycle.end_turn();
      if (!quiet) print_summary(sm, research, economy);
    }
    if (quiet) print_summary(sm, research, economy);

    const std::string save_name = get_str_arg(argc, argv, "--save", "");
    if (!save_name.empty()) {
      if (!sm.save_state(save_name)) return 1;
      if (!quiet) std::cout << "\nSaved as '" << save_name << "' in " << cfg.save_dir << "\n";
    }

    if (has_flag(argc, argv, "--dump")) {
      std::cout << "\n--- JSON ---\n" << superint::serialize_game_state(*sm.state()) << "\n";
    }
    return 0;
  } catch (const std::exception& e) {
    log.error(std::string("Fatal: ") + e.what());
    return 1;
  }
}
