#pragma once
/**
 * @file log.hpp
 * @brief Leveled key=value diagnostics on stderr.
 *
 * @details
 * Lines look like the rest of the tool's output so the same grep/awk
 * pipelines work on both:
 *
 *   level=warn event=handshake_retry attempt=2 of=5 reason=timeout
 *
 * The sink defaults to std::cerr. Tests point it at an ostringstream.
 * Not thread-safe; one process-wide level and sink.
 */

#include <cstdint>
#include <ostream>
#include <string>

namespace v5link {
namespace log {

enum class Level : uint8_t { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

const char* to_string(Level l);

/// "debug" | "info" | "warn" | "error" | "off". Returns false on anything else.
bool parse_level(const std::string& s, Level& out);

void  set_level(Level l);
Level level();

/// nullptr restores std::cerr.
void set_sink(std::ostream* sink);

bool enabled(Level l);

/// Emit "level=<l> event=<event> <fields>" if @p l is enabled.
void write(Level l, const std::string& event, const std::string& fields = {});

inline void debug(const std::string& event, const std::string& fields = {}) { write(Level::Debug, event, fields); }
inline void info (const std::string& event, const std::string& fields = {}) { write(Level::Info,  event, fields); }
inline void warn (const std::string& event, const std::string& fields = {}) { write(Level::Warn,  event, fields); }
inline void error(const std::string& event, const std::string& fields = {}) { write(Level::Error, event, fields); }

} // namespace log
} // namespace v5link
