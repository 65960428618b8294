#include "seb/orchestrator/event_bus.h"

#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>

#include "seb/common.h"
#include "seb/core/json_escape.h"
#include "seb/crypto/sha256.h"

namespace seb::orchestrator {
namespace {

struct PublishReentrancyGuard {
  explicit PublishReentrancyGuard(bool& flag) : flag_(flag) { flag_ = true; }
  ~PublishReentrancyGuard() { flag_ = false; }
  PublishReentrancyGuard(const PublishReentrancyGuard&) = delete;
  PublishReentrancyGuard& operator=(const PublishReentrancyGuard&) = delete;

 private:
  bool& flag_;
};

std::string HashTag(std::string_view value) {
  return std::string{"hash:"} + HashForTelemetry(value);
}

// Keys whose values must never reach a log line in the clear even when a
// caller forgets to classify them.
bool FieldKeyImpliesSensitive(std::string_view key) {
  const std::string lower = seb::AsciiLowercase(key);
  return lower.find("password") != std::string::npos || lower.find("secret") != std::string::npos ||
         lower == "key" || lower.find("_key") != std::string::npos;
}

std::mutex& DefaultLoggerMutex() {
  static std::mutex mutex;
  return mutex;
}

std::shared_ptr<JsonLineLogger>& DefaultLoggerSlot() {
  static std::shared_ptr<JsonLineLogger> logger;
  return logger;
}

} // namespace

const char* SeverityToString(EventSeverity severity) {
  switch (severity) {
  case EventSeverity::kDebug:
    return "debug";
  case EventSeverity::kInfo:
    return "info";
  case EventSeverity::kWarning:
    return "warning";
  case EventSeverity::kError:
    return "error";
  case EventSeverity::kCritical:
    return "critical";
  }
  return "info";
}

const char* CategoryToString(EventCategory category) {
  switch (category) {
  case EventCategory::kTelemetry:
    return "telemetry";
  case EventCategory::kLifecycle:
    return "lifecycle";
  case EventCategory::kSecurity:
    return "security";
  case EventCategory::kDiagnostics:
    return "diagnostics";
  }
  return "diagnostics";
}

std::optional<EventSeverity> ParseSeverity(std::string_view text) {
  const std::string lower = seb::AsciiLowercase(text);
  for (auto severity : {EventSeverity::kDebug, EventSeverity::kInfo, EventSeverity::kWarning,
                        EventSeverity::kError, EventSeverity::kCritical}) {
    if (lower == SeverityToString(severity)) {
      return severity;
    }
  }
  if (lower == "warn") {
    return EventSeverity::kWarning;
  }
  return std::nullopt;
}

std::string HashForTelemetry(std::string_view input) {
  if (input.empty()) {
    return "";
  }
  return crypto::SHA256_Hex(input);
}

std::string BuildEventJson(const Event& event, std::string_view timestamp) {
  std::string payload;
  payload.reserve(256);
  payload += "{\"ts\":\"";
  payload += core::EscapeJson(timestamp);
  payload += "\",\"severity\":\"";
  payload += SeverityToString(event.severity);
  payload += "\",\"category\":\"";
  payload += CategoryToString(event.category);
  payload += "\"";
  if (!event.event_id.empty()) {
    payload += ",\"event_id\":\"";
    payload += core::EscapeJson(event.event_id);
    payload += "\"";
  }
  if (!event.message.empty()) {
    payload += ",\"message\":\"";
    payload += core::EscapeJson(event.message);
    payload += "\"";
  }
  for (const auto& field : event.fields) {
    auto privacy = field.privacy;
    if (privacy == FieldPrivacy::kPublic && FieldKeyImpliesSensitive(field.key)) {
      privacy = FieldPrivacy::kRedact;
    }
    std::string sanitized = field.value;
    if (privacy == FieldPrivacy::kRedact) {
      sanitized = "[REDACTED]";
    } else if (privacy == FieldPrivacy::kHash) {
      sanitized = HashTag(field.value);
    }
    payload += ",\"";
    payload += core::EscapeJson(field.key);
    payload += "\":";
    if (field.numeric && privacy == FieldPrivacy::kPublic) {
      payload += sanitized;
    } else {
      payload += "\"";
      payload += core::EscapeJson(sanitized);
      payload += "\"";
    }
  }
  payload += "}";
  return payload;
}

JsonLineLogger::JsonLineLogger(LoggerOptions options) : options_(std::move(options)) {}

std::string JsonLineLogger::FormatTimestamp(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  auto fractional = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()) %
                    std::chrono::seconds(1);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setw(6) << std::setfill('0') << fractional.count() << 'Z';
  return oss.str();
}

void JsonLineLogger::EnsureOpen() {
  if (stream_.is_open() || !options_.path) {
    return;
  }
  std::error_code ec;
  const auto parent = options_.path->parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      std::clog << "{\"event\":\"logger_error\",\"message\":\"log directory unavailable\",\"error_code\":"
                << ec.value() << "}" << std::endl;
      return;
    }
  }
  stream_.open(*options_.path, std::ios::out | std::ios::app);
}

void JsonLineLogger::RotateIfNeeded(size_t incoming_bytes) {
  if (!options_.path || options_.max_bytes == 0) {
    return;
  }
  const auto& log_path = *options_.path;
  std::error_code ec;
  if (!std::filesystem::exists(log_path, ec)) {
    return;
  }
  auto current_size = std::filesystem::file_size(log_path, ec);
  if (ec) {
    std::clog << "{\"event\":\"logger_error\",\"message\":\"log size query failed\",\"error_code\":"
              << ec.value() << "}" << std::endl;
    return;
  }
  if (current_size + incoming_bytes <= options_.max_bytes) {
    return;
  }
  if (stream_.is_open()) {
    stream_.close();
  }
  for (size_t idx = options_.max_files; idx > 0; --idx) {
    std::filesystem::path src =
        idx == 1 ? log_path : std::filesystem::path(log_path.string() + "." + std::to_string(idx - 1));
    std::filesystem::path dst = std::filesystem::path(log_path.string() + "." + std::to_string(idx));
    std::error_code rotate_ec;
    if (!std::filesystem::exists(src, rotate_ec)) {
      continue;
    }
    std::filesystem::remove(dst, rotate_ec);
    std::filesystem::rename(src, dst, rotate_ec);
    if (rotate_ec) {
      std::clog << "{\"event\":\"logger_error\",\"message\":\"log rotate rename failed\",\"error_code\":"
                << rotate_ec.value() << "}" << std::endl;
    }
  }
}

void JsonLineLogger::Log(const Event& event) {
  if (event.severity < options_.min_severity) {
    return;
  }
  const auto line = BuildEventJson(event, FormatTimestamp(std::chrono::system_clock::now()));
  std::lock_guard<std::mutex> guard(mutex_);
  if (!options_.path) {
    std::clog << line << std::endl;
    return;
  }
  RotateIfNeeded(line.size() + 1);
  EnsureOpen();
  if (!stream_.is_open()) {
    std::clog << "{\"event\":\"logger_error\",\"message\":\"failed to open log file\"}" << std::endl;
    std::clog << line << std::endl;
    return;
  }
  stream_ << line << '\n';
  stream_.flush();
}

EventBus& EventBus::Instance() {
  static EventBus bus;
  return bus;
}

void EventBus::Publish(const Event& event) {
  static thread_local bool in_publish = false;
  if (in_publish) {
    std::clog << "{\"event\":\"event_bus_reentrancy\",\"message\":\"recursive publish suppressed\"}"
              << std::endl;
    return;
  }
  PublishReentrancyGuard guard(in_publish);
  std::shared_ptr<const SubscriberList> targets;
  {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    targets = subscribers_snapshot_;
  }
  if (targets) {
    for (const auto& subscriber : *targets) {
      if (subscriber) {
        subscriber(event);
      }
    }
  }
}

void EventBus::Subscribe(Subscriber fn) {
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  auto updated = subscribers_snapshot_ ? std::make_shared<SubscriberList>(*subscribers_snapshot_)
                                       : std::make_shared<SubscriberList>();
  updated->push_back(std::move(fn));
  subscribers_snapshot_ = std::move(updated);
}

void EventBus::ClearSubscribers() {
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  subscribers_snapshot_.reset();
}

void InstallDefaultLogger(LoggerOptions options) {
  auto logger = std::make_shared<JsonLineLogger>(std::move(options));
  std::lock_guard<std::mutex> guard(DefaultLoggerMutex());
  const bool first_install = !DefaultLoggerSlot();
  DefaultLoggerSlot() = logger;
  if (first_install) {
    // The subscriber reads the slot on every event so later installs swap
    // the sink without re-subscribing.
    EventBus::Instance().Subscribe([](const Event& event) {
      std::shared_ptr<JsonLineLogger> current;
      {
        std::lock_guard<std::mutex> slot_guard(DefaultLoggerMutex());
        current = DefaultLoggerSlot();
      }
      if (current) {
        current->Log(event);
      }
    });
  }
}

void ResetEventBusForTesting() {
  EventBus::Instance().ClearSubscribers();
  std::lock_guard<std::mutex> guard(DefaultLoggerMutex());
  DefaultLoggerSlot().reset();
}

} // namespace seb::orchestrator
