#include "server/logging/logger.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <mutex>

using json = nlohmann::json;

namespace dlpgate {
namespace log {

namespace {

std::atomic<bool> g_json_mode{false};
std::atomic<int> g_min_level{static_cast<int>(Level::INFO)};
std::mutex g_mutex;

const char *LevelString(Level level) {
  switch (level) {
  case Level::DEBUG:
    return "DEBUG";
  case Level::INFO:
    return "INFO";
  case Level::WARN:
    return "WARN";
  case Level::ERROR:
    return "ERROR";
  }
  return "UNKNOWN";
}

} // namespace

void SetJsonMode(bool enabled) { g_json_mode.store(enabled); }
bool IsJsonMode() { return g_json_mode.load(); }

void SetMinLevel(Level level) { g_min_level.store(static_cast<int>(level)); }
Level MinLevel() { return static_cast<Level>(g_min_level.load()); }

bool ParseLevel(const std::string &text, Level *level) {
  std::string lowered = text;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  Level parsed;
  if (lowered == "debug") {
    parsed = Level::DEBUG;
  } else if (lowered == "info") {
    parsed = Level::INFO;
  } else if (lowered == "warn" || lowered == "warning") {
    parsed = Level::WARN;
  } else if (lowered == "error") {
    parsed = Level::ERROR;
  } else {
    return false;
  }
  if (level) {
    *level = parsed;
  }
  return true;
}

void InitFromEnv() {
  if (const char *format = std::getenv("DLPGATE_LOG_FORMAT")) {
    SetJsonMode(std::string(format) == "json");
  }
  if (const char *level_env = std::getenv("DLPGATE_LOG_LEVEL")) {
    Level level;
    if (ParseLevel(level_env, &level)) {
      SetMinLevel(level);
    }
  }
}

void Log(Level level, const std::string &component, const std::string &message,
         const std::string &extra) {
  if (static_cast<int>(level) < g_min_level.load()) {
    return;
  }
  auto now = std::chrono::system_clock::now();
  auto ts = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch())
                .count();

  std::string line;
  if (g_json_mode.load()) {
    json j;
    j["ts"] = ts;
    j["level"] = LevelString(level);
    j["component"] = component;
    j["message"] = message;
    if (!extra.empty()) {
      j["extra"] = extra;
    }
    line = j.dump(-1, ' ', false, json::error_handler_t::replace);
  } else {
    line = std::string("[") + LevelString(level) + "] " + component + ": " +
           message;
    if (!extra.empty()) {
      line += " | " + extra;
    }
  }

  std::lock_guard<std::mutex> lock(g_mutex);
  std::cerr << line << "\n";
}

} // namespace log
} // namespace dlpgate
