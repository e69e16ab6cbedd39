#pragma once

#include <string>

namespace dlpgate {
namespace log {

enum class Level { DEBUG, INFO, WARN, ERROR };

// Enable JSON-structured output (one JSON object per line to stderr).
// Default mode is plain text: "[LEVEL] component: message".
void SetJsonMode(bool enabled);
bool IsJsonMode();

// Lines below `level` are dropped. Default is INFO.
void SetMinLevel(Level level);
Level MinLevel();

// Reads DLPGATE_LOG_FORMAT=json and DLPGATE_LOG_LEVEL=debug|info|warn|error.
// Call once from the host before the first request.
void InitFromEnv();

// Parses "debug", "info", "warn"/"warning", "error" (case-insensitive).
// Returns false and leaves *level untouched for anything else.
bool ParseLevel(const std::string &text, Level *level);

// Emit a log entry at the given level.  `component` identifies the subsystem
// (e.g. "engine", "redaction", "document", "hook").  `extra` is an optional
// key=value string appended to the JSON object or the text line.
void Log(Level level, const std::string &component, const std::string &message,
         const std::string &extra = {});

// Convenience wrappers.
inline void Debug(const std::string &component, const std::string &message,
                  const std::string &extra = {}) {
  Log(Level::DEBUG, component, message, extra);
}
inline void Info(const std::string &component, const std::string &message,
                 const std::string &extra = {}) {
  Log(Level::INFO, component, message, extra);
}
inline void Warn(const std::string &component, const std::string &message,
                 const std::string &extra = {}) {
  Log(Level::WARN, component, message, extra);
}
inline void Error(const std::string &component, const std::string &message,
                  const std::string &extra = {}) {
  Log(Level::ERROR, component, message, extra);
}

} // namespace log
} // namespace dlpgate
