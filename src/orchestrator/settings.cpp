#include "seb/orchestrator/settings.h"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <limits>

namespace seb::orchestrator {
namespace {

std::optional<std::string> GetEnv(const char* name) {
  const char* env = std::getenv(name);
  if (!env || *env == '\0') {
    return std::nullopt;
  }
  return std::string(env);
}

}  // namespace

LoggerOptions Settings::ToLoggerOptions() const {
  LoggerOptions options;
  options.path = log_path;
  options.min_severity = log_level;
  options.max_bytes = log_max_bytes;
  return options;
}

Settings LoadSettings(const EnvLookup& lookup) {
  const EnvLookup& get = lookup ? lookup : EnvLookup(GetEnv);
  Settings settings;

  if (auto path = get("SEB_LOG_PATH"); path && !path->empty()) {
    settings.log_path = std::filesystem::path(*path);
  }

  if (auto level = get("SEB_LOG_LEVEL"); level && !level->empty()) {
    if (auto parsed = ParseSeverity(*level)) {
      settings.log_level = *parsed;
    } else {
      settings.rejected.push_back("SEB_LOG_LEVEL");
    }
  }

  if (auto size = get("SEB_LOG_MAX_SIZE"); size && !size->empty()) {
    unsigned long long value = 0;
    const char* begin = size->data();
    const char* end = begin + size->size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end || value == 0) {
      settings.rejected.push_back("SEB_LOG_MAX_SIZE");
    } else {
      settings.log_max_bytes =
          static_cast<size_t>(std::min<unsigned long long>(value, std::numeric_limits<size_t>::max()));
    }
  }
  return settings;
}

void ApplyLoggingSettings(const Settings& settings) {
  InstallDefaultLogger(settings.ToLoggerOptions());
  for (const auto& name : settings.rejected) {
    Event event;
    event.category = EventCategory::kDiagnostics;
    event.severity = EventSeverity::kWarning;
    event.event_id = "invalid_setting";
    event.message = "Ignoring invalid environment setting; default applied";
    event.fields.emplace_back("variable", name);
    EventBus::Instance().Publish(event);
  }
}

}  // namespace seb::orchestrator
