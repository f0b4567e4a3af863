// ============================================================================
// config.cpp: implementation for v5link/config.hpp
// ============================================================================

#include "v5link/config.hpp"
#include "v5link/log.hpp"

#include "nlohmann/json.hpp"

#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace v5link {

// Each reader leaves the target alone when the key is absent.

static bool read_string(const json& j, const char* key, std::string& out, std::string& err) {
  auto it = j.find(key);
  if (it == j.end()) return true;
  if (!it->is_string()) { err = std::string("bad_type:") + key; return false; }
  out = it->get<std::string>();
  return true;
}

static bool read_int(const json& j, const char* key, int min, int& out, std::string& err) {
  auto it = j.find(key);
  if (it == j.end()) return true;
  if (!it->is_number_integer()) { err = std::string("bad_type:") + key; return false; }
  const long long v = it->get<long long>();
  if (v < min || v > 0x7FFFFFFF) { err = std::string("bad_value:") + key; return false; }
  out = static_cast<int>(v);
  return true;
}

bool parse_config(const std::string& text, LinkConfig& cfg, std::string& err) {
  const json j = json::parse(text, nullptr, /*allow_exceptions*/false);
  if (j.is_discarded()) { err = "parse_error"; return false; }
  if (!j.is_object())   { err = "bad_type:root"; return false; }

  LinkConfig next = cfg;
  if (!read_string(j, "device",        next.device,        err)) return false;
  if (!read_string(j, "user_device",   next.user_device,   err)) return false;
  if (!read_int   (j, "baud",          1, next.baud,          err)) return false;
  if (!read_int   (j, "boot_delay_ms", 0, next.boot_delay_ms, err)) return false;
  if (!read_int   (j, "timeout_ms",    0, next.timeout_ms,    err)) return false;
  if (!read_int   (j, "retries",       0, next.retries,       err)) return false;
  if (!read_string(j, "log_level",     next.log_level,     err)) return false;

  log::Level lvl;
  if (!log::parse_level(next.log_level, lvl)) { err = "bad_value:log_level"; return false; }

  cfg = next;
  return true;
}

bool load_config(const std::string& path, LinkConfig& cfg, std::string& err) {
  std::ifstream in(path);
  if (!in) { err = "open_failed"; return false; }
  std::ostringstream ss;
  ss << in.rdbuf();
  if (!parse_config(ss.str(), cfg, err)) {
    log::warn("config_rejected", "path=" + path + " reason=" + err);
    return false;
  }
  log::debug("config_loaded", "path=" + path);
  return true;
}

} // namespace v5link
