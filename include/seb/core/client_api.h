#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace seb::core {

// What the exam client exposes about itself. Both keys are already hashed
// with the current page URL by the client.
struct ClientSecurityInfo {
  std::optional<std::string> config_key;
  std::optional<std::string> browser_exam_key;
  std::optional<std::string> version;
};

// Handle onto the in-client key exposure API. A null handle means the code is
// not running inside the client.
class ClientCapability {
public:
  virtual ~ClientCapability() = default;
  virtual ClientSecurityInfo SecurityInfo() const = 0;
};

struct ClientKeys {
  std::optional<std::string> browser_exam_key;
  std::optional<std::string> config_key;
  std::optional<std::string> version;
  bool is_available{false};
};

enum class ClientOs { kWindows, kMacOS, kIOS };

const char* ClientOsName(ClientOs os) noexcept;

struct ClientVersion {
  std::string app_name;
  ClientOs os{ClientOs::kWindows};
  std::string version;
  std::string build;
  std::string bundle_id;
};

bool IsClientAvailable(const ClientCapability* client) noexcept;

// All fields absent and is_available false for a null handle. Empty strings
// reported by the client count as absent.
ClientKeys GetClientKeys(const ClientCapability* client);

// Throws CapabilityUnavailableError for a null handle.
ClientKeys RequireClientKeys(const ClientCapability* client);

// Parses "AppName_OS_Version_Build_BundleId". The bundle id is everything
// after the fourth '_' and may contain further underscores. Returns nullopt
// for fewer than five segments or an OS other than Windows, macOS or iOS.
std::optional<ClientVersion> ParseClientVersion(std::string_view text);

}  // namespace seb::core
