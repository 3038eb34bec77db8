#include "openpayments_log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>

namespace openpayments {

namespace {
constexpr const char* kLoggerName = "openpayments";
constexpr std::size_t kVisiblePrefix = 6;

std::shared_ptr<spdlog::logger> make_logger() {
  auto existing = spdlog::get(kLoggerName);
  if (existing) {
    return existing;
  }
  auto log = spdlog::stderr_color_mt(kLoggerName);
  log->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");

  spdlog::level::level_enum level = spdlog::level::info;
  if (const char* env = std::getenv("OPENPAYMENTS_LOG_LEVEL")) {
    level = spdlog::level::from_str(env);
  }
  log->set_level(level);
  return log;
}
} // namespace

std::shared_ptr<spdlog::logger> logger() {
  static std::shared_ptr<spdlog::logger> instance = make_logger();
  return instance;
}

std::string redact(const std::string& secret) {
  if (secret.empty()) {
    return "<empty>";
  }
  // No prefix for short secrets.
  if (secret.size() <= 2 * kVisiblePrefix) {
    return "***(" + std::to_string(secret.size()) + " chars)";
  }
  return secret.substr(0, kVisiblePrefix) + "...(" + std::to_string(secret.size()) + " chars)";
}

} // namespace openpayments
