#include "seb/orchestrator/generator.h"

#include "seb/core/config_key.h"
#include "seb/core/container.h"
#include "seb/core/plist_writer.h"
#include "seb/orchestrator/event_bus.h"

namespace seb::orchestrator {
namespace {

void PublishGenerated(const GenerateResult& result, const std::string& config_key) {
  Event event;
  event.category = EventCategory::kLifecycle;
  event.severity = EventSeverity::kInfo;
  event.event_id = "seb_config_generated";
  event.message = "SEB configuration container generated";
  event.fields.emplace_back("container", result.encrypted ? "encrypted" : "plain");
  event.fields.emplace_back("size_bytes", std::to_string(result.size), FieldPrivacy::kPublic, true);
  event.fields.emplace_back("config_key", config_key, FieldPrivacy::kHash);
  EventBus::Instance().Publish(event);
}

}  // namespace

GenerateResult Generate(const core::Dictionary& doc, const GenerateOptions& options) {
  if (options.validate) {
    const auto validator = options.validator ? options.validator : core::DefaultValidator();
    validator->Validate(doc);
  }

  GenerateResult result;
  result.xml = core::RenderPlist(doc);

  if (options.encrypt && options.password) {
    result.data = core::EncodeEncrypted(result.xml, *options.password);
    result.encrypted = true;
  } else {
    if (options.encrypt) {
      Event event;
      event.category = EventCategory::kSecurity;
      event.severity = EventSeverity::kWarning;
      event.event_id = "seb_encrypt_without_password";
      event.message = "Encryption requested without a password; writing a plain container";
      EventBus::Instance().Publish(event);
    }
    result.data = core::EncodePlain(result.xml);
  }
  result.size = result.data.size();

  PublishGenerated(result, core::ComputeConfigKey(doc));
  return result;
}

}  // namespace seb::orchestrator
