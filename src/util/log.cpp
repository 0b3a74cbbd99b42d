#include "gearopt/util/log.h"

#include <atomic>
#include <iostream>
#include <mutex>

#include "gearopt/util/strings.h"

namespace gearopt::log {
namespace {
std::mutex g_mu;
std::atomic<Level> g_level{Level::Info};

const char* label(Level l) {
  switch (l) {
    case Level::Debug: return "DEBUG";
    case Level::Info: return "INFO";
    case Level::Warn: return "WARN";
    case Level::Error: return "ERROR";
    default: return "";
  }
}

void emit(Level l, const std::string& msg) {
  if (!enabled(l)) return;
  // Search workers may log concurrently; keep lines whole.
  std::lock_guard<std::mutex> lock(g_mu);
  std::cerr << "[" << label(l) << "] " << msg << "\n";
}

} // namespace

void set_level(Level lvl) { g_level.store(lvl); }
Level level() { return g_level.load(); }

bool parse_level(const std::string& s, Level& out) {
  const std::string v = to_lower(s);
  if (v == "debug") {
    out = Level::Debug;
  } else if (v == "info") {
    out = Level::Info;
  } else if (v == "warn" || v == "warning") {
    out = Level::Warn;
  } else if (v == "error") {
    out = Level::Error;
  } else if (v == "off" || v == "none") {
    out = Level::Off;
  } else {
    return false;
  }
  return true;
}

bool enabled(Level lvl) {
  const Level cur = g_level.load();
  return cur != Level::Off && lvl >= cur;
}

void debug(const std::string& msg) { emit(Level::Debug, msg); }
void info(const std::string& msg) { emit(Level::Info, msg); }
void warn(const std::string& msg) { emit(Level::Warn, msg); }
void error(const std::string& msg) { emit(Level::Error, msg); }

} // namespace gearopt::log
