#pragma once

#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "seb/core/value.h"
#include "seb/error.h"

namespace seb::core {

// Collaborator that accepts or rejects a configuration document before it is
// rendered. Implementations report every violation at once through
// ValidationError::issues and never modify the document.
class DocumentValidator {
public:
  virtual ~DocumentValidator() = default;
  virtual void Validate(const Dictionary& doc) const = 0;
};

// Built-in rules for the well-known SEB keys:
//  - startURL, when present, is an http/https/seb/sebs URL with a host,
//  - well-known keys carry their documented kind, and enumerations stay in
//    their documented integer range,
//  - urlFilterRules, additionalResources, prohibitedProcesses and
//    permittedProcesses hold dictionaries with their required members.
// Unknown keys pass through untouched and no defaults are applied.
class DefaultDocumentValidator final : public DocumentValidator {
public:
  void Validate(const Dictionary& doc) const override;

  // Same rules, returning the violations instead of throwing.
  [[nodiscard]] std::vector<ValidationIssue> Collect(const Dictionary& doc) const;
};

std::shared_ptr<const DocumentValidator> DefaultValidator();

// Accepts absolute URLs with one of |schemes| and a non-empty host.
bool IsAcceptableUrl(std::string_view url, std::span<const std::string_view> schemes);

}  // namespace seb::core
