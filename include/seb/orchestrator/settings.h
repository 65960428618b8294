#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "seb/orchestrator/event_bus.h"

namespace seb::orchestrator {

inline constexpr size_t kDefaultLogMaxBytes = 10u * 1024u * 1024u;  // 10 MiB

struct Settings {
  std::optional<std::filesystem::path> log_path;  // SEB_LOG_PATH
  EventSeverity log_level{EventSeverity::kInfo};  // SEB_LOG_LEVEL
  size_t log_max_bytes{kDefaultLogMaxBytes};      // SEB_LOG_MAX_SIZE
  // Variables that were set but unusable; the default applied instead.
  std::vector<std::string> rejected;

  [[nodiscard]] LoggerOptions ToLoggerOptions() const;
};

using EnvLookup = std::function<std::optional<std::string>(const char* name)>;

// Reads the SEB_LOG_* variables through |lookup| (std::getenv when empty).
Settings LoadSettings(const EnvLookup& lookup = {});

// Installs the default logger and publishes one warning event per rejected
// variable.
void ApplyLoggingSettings(const Settings& settings);

}  // namespace seb::orchestrator
