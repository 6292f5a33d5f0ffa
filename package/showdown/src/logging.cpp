#include "showdown/logging.hpp"

#include <mutex>
#include <stdexcept>

#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace showdown {

namespace {
constexpr const char *kLoggerName = "showdown";
std::mutex logger_mutex;
} // namespace

std::shared_ptr<spdlog::logger> logger() {
  std::lock_guard<std::mutex> lock(logger_mutex);
  auto existing = spdlog::get(kLoggerName);
  if (existing) {
    return existing;
  }
  auto created = spdlog::stdout_color_mt(kLoggerName);
  created->set_level(spdlog::level::info);
  return created;
}

void set_log_level(const std::string &level) {
  const auto parsed = spdlog::level::from_str(level);
  // from_str falls back to "off" for unknown names
  if (parsed == spdlog::level::off && level != "off") {
    throw std::invalid_argument(fmt::format("Unknown log level '{}'", level));
  }
  logger()->set_level(parsed);
}

} // namespace showdown
