#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace seb::orchestrator {

  // Structured logging primitives
  enum class EventSeverity { kDebug, kInfo, kWarning, kError, kCritical };

  enum class EventCategory { kTelemetry, kLifecycle, kSecurity, kDiagnostics };

  enum class FieldPrivacy { kPublic, kRedact, kHash };

  struct EventField {
    std::string key;
    std::string value;
    FieldPrivacy privacy{FieldPrivacy::kPublic};
    bool numeric{false};

    EventField(std::string k, std::string v, FieldPrivacy p = FieldPrivacy::kPublic,
               bool is_numeric = false)
        : key(std::move(k)), value(std::move(v)), privacy(p), numeric(is_numeric) {}
  };

  struct Event {
    EventCategory category{EventCategory::kDiagnostics};
    EventSeverity severity{EventSeverity::kInfo};
    std::string event_id;
    std::string message;
    std::vector<EventField> fields;
  };

  const char* SeverityToString(EventSeverity severity);
  const char* CategoryToString(EventCategory category);
  std::optional<EventSeverity> ParseSeverity(std::string_view text);

  // Lowercase SHA-256 hex of |input|; empty input stays empty.
  std::string HashForTelemetry(std::string_view input);

  // One JSON object per line. Fields are sanitized according to their privacy
  // class before serialization.
  std::string BuildEventJson(const Event& event, std::string_view timestamp);

  struct LoggerOptions {
    std::optional<std::filesystem::path> path;  // std::clog when unset
    EventSeverity min_severity{EventSeverity::kInfo};
    size_t max_bytes{10u * 1024u * 1024u};
    size_t max_files{3};
  };

  class JsonLineLogger {
  public:
    explicit JsonLineLogger(LoggerOptions options);
    void Log(const Event& event);

    [[nodiscard]] const LoggerOptions& options() const noexcept { return options_; }

  private:
    static std::string FormatTimestamp(std::chrono::system_clock::time_point tp);
    void EnsureOpen();
    void RotateIfNeeded(size_t incoming_bytes);

    LoggerOptions options_;
    std::mutex mutex_;
    std::ofstream stream_;
  };

  class EventBus {
  public:
    using Subscriber = std::function<void(const Event&)>;

    static EventBus& Instance();

    void Publish(const Event& event);
    void Subscribe(Subscriber fn);
    void ClearSubscribers();

  private:
    using SubscriberList = std::vector<Subscriber>;

    std::shared_ptr<const SubscriberList> subscribers_snapshot_;
    std::mutex subscribers_mutex_;
  };

  // Installs a JsonLineLogger built from |options| as an EventBus subscriber,
  // replacing any logger installed earlier by this function.
  void InstallDefaultLogger(LoggerOptions options);

  void ResetEventBusForTesting();

} // namespace seb::orchestrator
