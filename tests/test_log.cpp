#include <iostream>
#include <string>
#include <vector>

#include "superint/core/event_bus.h"
#include "superint/util/log.h"

#define SI_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_log() {
  using namespace superint;

  SI_ASSERT(log::parse_level("DEBUG") == log::Level::Debug);
  SI_ASSERT(log::parse_level("warning") == log::Level::Warn);
  SI_ASSERT(log::parse_level("none") == log::Level::Off);
  SI_ASSERT(log::parse_level("loud", log::Level::Error) == log::Level::Error);
  SI_ASSERT(std::string(log::level_label(log::Level::Error)) == "ERROR");

  // Level filtering happens before the sink.
  {
    Logger log(log::Level::Warn);
    std::vector<std::string> seen;
    log.set_sink([&seen](log::Level, const std::string& msg) { seen.push_back(msg); });
    log.debug("quiet");
    log.info("quiet");
    log.warn("loud");
    log.error("louder");
    SI_ASSERT(seen.size() == 2);
    SI_ASSERT(seen[0] == "loud");

    log.set_level(log::Level::Off);
    log.error("muted");
    SI_ASSERT(seen.size() == 2);
  }

  // A sink may log again.
  {
    Logger log(log::Level::Info);
    std::vector<std::string> seen;
    log.set_sink([&log, &seen](log::Level, const std::string& msg) {
      seen.push_back(msg);
      if (msg == "first") log.info("echo");
    });
    log.warn("first");
    SI_ASSERT(seen.size() == 2);
    SI_ASSERT(seen[1] == "echo");
  }

  // A sink may emit on a bus whose handlers log.
  {
    Logger log(log::Level::Info);
    EventBus bus(log);
    int handled = 0;
    auto unsub = bus.subscribe("log:line", [&log, &handled](const BusEvent&) {
      ++handled;
      log.info("handled");
    });
    std::vector<std::string> seen;
    log.set_sink([&bus, &seen](log::Level l, const std::string& msg) {
      seen.push_back(msg);
      if (l == log::Level::Warn) bus.emit("log:line");
    });
    log.warn("disk nearly full");
    unsub();
    SI_ASSERT(handled == 1);
    SI_ASSERT(seen.size() == 2);
    SI_ASSERT(seen[1] == "handled");
  }

  return 0;
}
