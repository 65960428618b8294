#include "seb/core/client_api.h"

#include <vector>

#include "seb/error.h"
#include "seb/errors.h"

namespace seb::core {
namespace {

std::optional<std::string> NonEmpty(const std::optional<std::string>& value) {
  if (!value || value->empty()) {
    return std::nullopt;
  }
  return value;
}

std::optional<ClientOs> ParseOs(std::string_view token) {
  if (token == "Windows") {
    return ClientOs::kWindows;
  }
  if (token == "macOS") {
    return ClientOs::kMacOS;
  }
  if (token == "iOS") {
    return ClientOs::kIOS;
  }
  return std::nullopt;
}

}  // namespace

const char* ClientOsName(ClientOs os) noexcept {
  switch (os) {
  case ClientOs::kWindows:
    return "Windows";
  case ClientOs::kMacOS:
    return "macOS";
  case ClientOs::kIOS:
    return "iOS";
  }
  return "unknown";
}

bool IsClientAvailable(const ClientCapability* client) noexcept {
  return client != nullptr;
}

ClientKeys GetClientKeys(const ClientCapability* client) {
  ClientKeys keys;
  if (!IsClientAvailable(client)) {
    return keys;
  }
  const auto info = client->SecurityInfo();
  keys.browser_exam_key = NonEmpty(info.browser_exam_key);
  keys.config_key = NonEmpty(info.config_key);
  keys.version = NonEmpty(info.version);
  keys.is_available = true;
  return keys;
}

ClientKeys RequireClientKeys(const ClientCapability* client) {
  if (!IsClientAvailable(client)) {
    throw CapabilityUnavailableError(std::string(errors::msg::kClientCapabilityMissing));
  }
  return GetClientKeys(client);
}

std::optional<ClientVersion> ParseClientVersion(std::string_view text) {
  std::vector<std::string_view> parts;
  size_t start = 0;
  while (parts.size() < 4) {
    const auto pos = text.find('_', start);
    if (pos == std::string_view::npos) {
      return std::nullopt;
    }
    parts.push_back(text.substr(start, pos - start));
    start = pos + 1;
  }
  const auto os = ParseOs(parts[1]);
  if (!os) {
    return std::nullopt;
  }
  ClientVersion version;
  version.app_name = std::string(parts[0]);
  version.os = *os;
  version.version = std::string(parts[2]);
  version.build = std::string(parts[3]);
  version.bundle_id = std::string(text.substr(start));
  return version;
}

}  // namespace seb::core
