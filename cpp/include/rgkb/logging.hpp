#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <string_view>

namespace rgkb {

// Process-wide "rgkb" logger, created on first use.
std::shared_ptr<spdlog::logger> Logger();

// Accepts trace|debug|info|warn|error|off; throws ConfigError otherwise.
void SetLogLevel(const std::string& level);

// Query text as it should appear in log lines, clipped to max_chars bytes on a
// character boundary.
std::string QueryPreview(std::string_view query, std::size_t max_chars = 50);

}  // namespace rgkb
