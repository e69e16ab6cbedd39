#include <catch2/catch_test_macros.hpp>

#include "server/logging/logger.h"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <iostream>
#include <sstream>

namespace {
// Redirects std::cerr for the lifetime of the object.
class CaptureStderr {
 public:
  CaptureStderr() : old_(std::cerr.rdbuf(buffer_.rdbuf())) {}
  ~CaptureStderr() { std::cerr.rdbuf(old_); }
  std::string str() const { return buffer_.str(); }

 private:
  std::ostringstream buffer_;
  std::streambuf* old_;
};
}  // namespace

TEST_CASE("Logger defaults to plain-text mode", "[logger]") {
  dlpgate::log::SetJsonMode(false);
  REQUIRE_FALSE(dlpgate::log::IsJsonMode());
}

TEST_CASE("Logger writes plain-text lines", "[logger]") {
  dlpgate::log::SetJsonMode(false);
  CaptureStderr capture;
  dlpgate::log::Warn("redaction", "skipping match", "category=email");
  REQUIRE(capture.str() == "[WARN] redaction: skipping match | category=email\n");
}

TEST_CASE("Logger writes JSON lines in JSON mode", "[logger]") {
  dlpgate::log::SetJsonMode(true);
  std::string out;
  {
    CaptureStderr capture;
    dlpgate::log::Error("hook", "failed", "error=boom");
    out = capture.str();
  }
  dlpgate::log::SetJsonMode(false);

  auto j = nlohmann::json::parse(out);
  REQUIRE(j["level"] == "ERROR");
  REQUIRE(j["component"] == "hook");
  REQUIRE(j["message"] == "failed");
  REQUIRE(j["extra"] == "error=boom");
  REQUIRE(j.contains("ts"));
}

TEST_CASE("Logger drops lines below the minimum level", "[logger]") {
  dlpgate::log::SetJsonMode(false);
  dlpgate::log::SetMinLevel(dlpgate::log::Level::WARN);
  std::string out;
  {
    CaptureStderr capture;
    dlpgate::log::Info("engine", "quiet");
    dlpgate::log::Debug("engine", "quieter");
    dlpgate::log::Error("engine", "loud");
    out = capture.str();
  }
  dlpgate::log::SetMinLevel(dlpgate::log::Level::INFO);
  REQUIRE(out == "[ERROR] engine: loud\n");
}

TEST_CASE("ParseLevel accepts level names", "[logger]") {
  dlpgate::log::Level level = dlpgate::log::Level::INFO;
  REQUIRE(dlpgate::log::ParseLevel("DEBUG", &level));
  REQUIRE(level == dlpgate::log::Level::DEBUG);
  REQUIRE(dlpgate::log::ParseLevel("warning", &level));
  REQUIRE(level == dlpgate::log::Level::WARN);
  REQUIRE_FALSE(dlpgate::log::ParseLevel("verbose", &level));
  REQUIRE(level == dlpgate::log::Level::WARN);
}

TEST_CASE("InitFromEnv reads format and level", "[logger]") {
  setenv("DLPGATE_LOG_FORMAT", "json", 1);
  setenv("DLPGATE_LOG_LEVEL", "error", 1);
  dlpgate::log::InitFromEnv();
  REQUIRE(dlpgate::log::IsJsonMode());
  REQUIRE(dlpgate::log::MinLevel() == dlpgate::log::Level::ERROR);

  unsetenv("DLPGATE_LOG_FORMAT");
  unsetenv("DLPGATE_LOG_LEVEL");
  dlpgate::log::SetJsonMode(false);
  dlpgate::log::SetMinLevel(dlpgate::log::Level::INFO);
}

TEST_CASE("Logger survives invalid UTF-8 in JSON mode", "[logger]") {
  dlpgate::log::SetJsonMode(true);
  {
    CaptureStderr capture;
    REQUIRE_NOTHROW(dlpgate::log::Info("detector", std::string("bad\xFF", 4)));
  }
  dlpgate::log::SetJsonMode(false);
}
