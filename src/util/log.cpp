#include "superint/util/log.h"

#include <cctype>
#include <iostream>

namespace superint {

namespace log {

const char* level_label(Level l) {
  switch (l) {
    case Level::Debug: return "DEBUG";
    case Level::Info: return "INFO";
    case Level::Warn: return "WARN";
    case Level::Error: return "ERROR";
    default: return "";
  }
}

Level parse_level(const std::string& s, Level def) {
  std::string l;
  l.reserve(s.size());
  for (char c : s) l.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  if (l == "debug") return Level::Debug;
  if (l == "info") return Level::Info;
  if (l == "warn" || l == "warning") return Level::Warn;
  if (l == "error") return Level::Error;
  if (l == "off" || l == "none") return Level::Off;
  return def;
}

} // namespace log

void Logger::set_sink(Sink sink) {
  std::lock_guard<std::mutex> lock(mu_);
  sink_ = std::move(sink);
}

void Logger::emit(log::Level l, const std::string& msg) {
  if (!enabled(l)) return;
  Sink sink;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!sink_) {
      std::cerr << "[" << log::level_label(l) << "] " << msg << "\n";
      return;
    }
    sink = sink_;
  }
  // Called unlocked so a sink may log again.
  sink(l, msg);
}

} // namespace superint
