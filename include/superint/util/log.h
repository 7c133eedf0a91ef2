#pragma once

#include <functional>
#include <mutex>
#include <string>

namespace superint {

namespace log {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

const char* level_label(Level l);

// Parses "debug", "info", "warn", "error" or "off" (case-insensitive).
// Unknown strings return def.
Level parse_level(const std::string& s, Level def = Level::Info);

} // namespace log

// Logging sink handed to every component at construction.
//
// By default messages go to stderr as "[LEVEL] message". Installing a sink
// redirects them (tests use this to count warnings).
class Logger {
 public:
  using Sink = std::function<void(log::Level, const std::string&)>;

  explicit Logger(log::Level level = log::Level::Info) : level_(level) {}

  void set_level(log::Level lvl) { level_ = lvl; }
  log::Level level() const { return level_; }

  void set_sink(Sink sink);

  void debug(const std::string& msg) { emit(log::Level::Debug, msg); }
  void info(const std::string& msg) { emit(log::Level::Info, msg); }
  void warn(const std::string& msg) { emit(log::Level::Warn, msg); }
  void error(const std::string& msg) { emit(log::Level::Error, msg); }

  bool enabled(log::Level l) const { return level_ != log::Level::Off && l >= level_; }

 private:
  void emit(log::Level l, const std::string& msg);

  std::mutex mu_;
  log::Level level_{log::Level::Info};
  Sink sink_;
};

} // namespace superint
