// ============================================================================
// log.cpp: implementation for v5link/log.hpp
// ============================================================================

#include "v5link/log.hpp"

#include <iostream>

namespace v5link {
namespace log {

static Level         g_level = Level::Warn;
static std::ostream* g_sink  = nullptr;   // nullptr means std::cerr

const char* to_string(Level l) {
  switch (l) {
    case Level::Debug: return "debug";
    case Level::Info:  return "info";
    case Level::Warn:  return "warn";
    case Level::Error: return "error";
    case Level::Off:   return "off";
  }
  return "unknown";
}

bool parse_level(const std::string& s, Level& out) {
  if      (s == "debug") out = Level::Debug;
  else if (s == "info")  out = Level::Info;
  else if (s == "warn")  out = Level::Warn;
  else if (s == "error") out = Level::Error;
  else if (s == "off")   out = Level::Off;
  else return false;
  return true;
}

void  set_level(Level l) { g_level = l; }
Level level()            { return g_level; }

void set_sink(std::ostream* sink) { g_sink = sink; }

bool enabled(Level l) {
  return l != Level::Off && static_cast<uint8_t>(l) >= static_cast<uint8_t>(g_level);
}

void write(Level l, const std::string& event, const std::string& fields) {
  if (!enabled(l)) return;
  std::ostream& os = g_sink ? *g_sink : std::cerr;
  os << "level=" << to_string(l) << " event=" << event;
  if (!fields.empty()) os << ' ' << fields;
  os << '\n';
}

} // namespace log
} // namespace v5link
