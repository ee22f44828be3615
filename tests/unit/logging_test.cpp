#include "internal/observability/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cassert>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "config/config.pb.h"

namespace {

using atelier::observability::InitializeLogging;
using atelier::runtime::config::RuntimeConfig;

RuntimeConfig WithLevel(const std::string& level) {
  RuntimeConfig config;
  config.mutable_logging()->set_level(level);
  return config;
}

void TestLoggerWritesToStderr() {
  InitializeLogging(RuntimeConfig{});

  auto logger = spdlog::get("atelier");
  assert(logger != nullptr);
  assert(spdlog::default_logger() == logger);
  assert(logger->sinks().size() == 1);
  assert(std::dynamic_pointer_cast<spdlog::sinks::stderr_color_sink_mt>(logger->sinks()[0]) != nullptr);
  assert(logger->level() == spdlog::level::info);
}

void TestConfigLevelAndReinitialization() {
  InitializeLogging(WithLevel("warn"));
  auto first = spdlog::get("atelier");
  assert(first->level() == spdlog::level::warn);

  InitializeLogging(WithLevel("debug"));
  auto second = spdlog::get("atelier");
  assert(second == first);
  assert(second->level() == spdlog::level::debug);

  ATELIER_LOG_DEBUG("logging test", {atelier::observability::StringField("k", "v"), atelier::observability::IntField("n", 1)});
}

void TestEnvironmentLevelWins() {
  setenv("ATELIER_LOG_LEVEL", "error", 1);
  InitializeLogging(WithLevel("debug"));
  assert(spdlog::get("atelier")->level() == spdlog::level::err);
  unsetenv("ATELIER_LOG_LEVEL");
}

} // namespace

int main() {
  unsetenv("ATELIER_LOG_LEVEL");
  unsetenv("ATELIER_LOG_PATTERN");

  TestLoggerWritesToStderr();
  TestConfigLevelAndReinitialization();
  TestEnvironmentLevelWins();

  std::cout << "atelier_unit_logging: pass\n";
  return 0;
}
