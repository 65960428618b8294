#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "seb/core/validator.h"
#include "seb/core/value.h"

namespace seb::orchestrator {

struct GenerateOptions {
  bool encrypt{false};
  std::optional<std::string> password;
  bool validate{true};
  // Validator used when |validate| is set; the built-in rules when null.
  std::shared_ptr<const core::DocumentValidator> validator;
};

struct GenerateResult {
  std::vector<uint8_t> data;
  std::string xml;
  size_t size{0};
  bool encrypted{false};
};

// Validates |doc| (unless disabled), renders it to plist XML and frames the
// XML into a .seb container. Encryption needs both |encrypt| and a password;
// asking for encryption without one yields a plain container and a warning
// event. ValidationError from the validator propagates unchanged.
GenerateResult Generate(const core::Dictionary& doc, const GenerateOptions& options = {});

}  // namespace seb::orchestrator
