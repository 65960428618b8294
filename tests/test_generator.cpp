#include "seb/core/config_key.h"
#include "seb/core/container.h"
#include "seb/core/validator.h"
#include "seb/error.h"
#include "seb/orchestrator/event_bus.h"
#include "seb/orchestrator/generator.h"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using seb::core::Dictionary;
using seb::orchestrator::Event;
using seb::orchestrator::EventBus;
using seb::orchestrator::Generate;
using seb::orchestrator::GenerateOptions;

namespace {

Dictionary ExampleDocument() {
  return Dictionary{
      {"startURL", "https://exam.example.com"},
      {"allowQuit", false},
      {"originatorVersion", "3.7.0"},
  };
}

class RejectEverything : public seb::core::DocumentValidator {
public:
  void Validate(const Dictionary&) const override {
    throw seb::ValidationError("rejected", {{"startURL", "not on the allow list"}});
  }
};

std::vector<Event>& Captured() {
  static std::vector<Event> events;
  return events;
}

void Capture() {
  seb::orchestrator::ResetEventBusForTesting();
  Captured().clear();
  EventBus::Instance().Subscribe([](const Event& event) { Captured().push_back(event); });
}

const Event* FindEvent(std::string_view id) {
  for (const auto& event : Captured()) {
    if (event.event_id == id) {
      return &event;
    }
  }
  return nullptr;
}

void TestPlain() {
  Capture();
  const auto result = Generate(ExampleDocument());
  assert(!result.encrypted);
  assert(result.size == result.data.size());
  assert(seb::core::Inspect(result.data) == seb::core::ContainerKind::kPlain);
  assert(seb::core::Decode(result.data) == result.xml);
  assert(result.xml.find("<key>startURL</key>") != std::string::npos);

  const auto* generated = FindEvent("seb_config_generated");
  assert(generated != nullptr);
  bool saw_key = false;
  for (const auto& field : generated->fields) {
    if (field.key == "config_key") {
      saw_key = field.privacy == seb::orchestrator::FieldPrivacy::kHash &&
                field.value == seb::core::ComputeConfigKey(ExampleDocument());
    }
  }
  assert(saw_key);
}

void TestEncrypted() {
  Capture();
  GenerateOptions options;
  options.encrypt = true;
  options.password = "pw";
  const auto result = Generate(ExampleDocument(), options);
  assert(result.encrypted);
  assert(seb::core::Decode(result.data, std::string_view("pw")) == result.xml);

  options.password = "";
  assert(Generate(ExampleDocument(), options).encrypted);
}

void TestEncryptWithoutPassword() {
  Capture();
  GenerateOptions options;
  options.encrypt = true;
  const auto result = Generate(ExampleDocument(), options);
  assert(!result.encrypted);
  assert(FindEvent("seb_encrypt_without_password") != nullptr);

  // A password alone does not turn encryption on.
  GenerateOptions password_only;
  password_only.password = "pw";
  assert(!Generate(ExampleDocument(), password_only).encrypted);
}

void TestValidation() {
  Capture();
  GenerateOptions options;
  options.validator = std::make_shared<RejectEverything>();
  bool threw = false;
  try {
    (void)Generate(ExampleDocument(), options);
  } catch (const seb::ValidationError& err) {
    threw = err.issues.size() == 1 && err.issues.front().path == "startURL";
  }
  assert(threw);
  assert(FindEvent("seb_config_generated") == nullptr);

  options.validate = false;
  (void)Generate(ExampleDocument(), options);

  Dictionary bad{{"startURL", "ftp://exam.example.com"}};
  threw = false;
  try {
    (void)Generate(bad);
  } catch (const seb::ValidationError&) {
    threw = true;
  }
  assert(threw && "built-in rules apply by default");
}

}  // namespace

int main() {
  TestPlain();
  TestEncrypted();
  TestEncryptWithoutPassword();
  TestValidation();
  seb::orchestrator::ResetEventBusForTesting();
  std::cout << "generator tests ok\n";
  return 0;
}
