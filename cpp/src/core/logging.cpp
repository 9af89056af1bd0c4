#include "rgkb/logging.hpp"

#include "rgkb/errors.hpp"
#include "rgkb/utf8_text.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace rgkb {
namespace {

constexpr const char* kLoggerName = "rgkb";

std::mutex g_logger_mutex;

}  // namespace

std::shared_ptr<spdlog::logger> Logger() {
  std::lock_guard<std::mutex> lock(g_logger_mutex);
  if (auto existing = spdlog::get(kLoggerName); existing != nullptr) {
    return existing;
  }
  auto logger = spdlog::stdout_color_mt(kLoggerName);
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
  logger->set_level(spdlog::level::info);
  return logger;
}

void SetLogLevel(const std::string& level) {
  const auto parsed = spdlog::level::from_str(level);
  // from_str maps unknown names to "off"; only accept an explicit "off".
  if (parsed == spdlog::level::off && level != "off") {
    throw ConfigError("unknown log level: " + level);
  }
  Logger()->set_level(parsed);
}

std::string QueryPreview(std::string_view query, std::size_t max_chars) {
  if (query.size() <= max_chars) {
    return std::string(query);
  }
  return std::string(ClipUtf8(query, max_chars)) + "...";
}

}  // namespace rgkb
