#include <charconv>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "seb/common.h"
#include "seb/core/canonical_json.h"
#include "seb/core/client_api.h"
#include "seb/core/config_key.h"
#include "seb/core/container.h"
#include "seb/core/plist_writer.h"
#include "seb/core/value.h"
#include "seb/crypto/base64.h"
#include "seb/error.h"
#include "seb/orchestrator/event_bus.h"
#include "seb/orchestrator/generator.h"
#include "seb/orchestrator/io_util.h"
#include "seb/orchestrator/settings.h"
#include "seb/security/zeroizer.h"

namespace {

  constexpr int kExitOk = 0;
  constexpr int kExitMismatch = 1;
  constexpr int kExitUsage = 64;
  constexpr int kExitDataErr = 65;
  constexpr int kExitIO = 74;
  constexpr int kExitAuth = 77;

  void PrintUsage() {
    std::cerr << "Usage: seb-config [global flags] <command> [options]\n";
    std::cerr << "Commands:\n";
    std::cerr << "  config-key   --set key=value...\n";
    std::cerr << "  canonical    --set key=value...\n";
    std::cerr << "  plist        --set key=value... [--out=<file>]\n";
    std::cerr << "  generate     --set key=value... --out=<file> [--password-file=<file>] [--no-validate]\n";
    std::cerr << "  decode       --in=<file> [--password-file=<file>] [--out=<file>]\n";
    std::cerr << "  inspect      --in=<file>\n";
    std::cerr << "  request-hash --url=<url> --config-key=<key>\n";
    std::cerr << "  verify       --url=<url> --config-key=<key> --hash=<hash>\n";
    std::cerr << "  parse-version <version-string>\n";
    std::cerr << "\nDocument values:\n";
    std::cerr << "  --set key=value      true/false, integer, decimal, null, otherwise string\n";
    std::cerr << "  --set-data key=b64   data value from Base64\n";
    std::cerr << "\nGlobal flags:\n";
    std::cerr << "  --log-level=LEVEL    debug|info|warning|error|critical (SEB_LOG_LEVEL)\n";
    std::cerr << "  --log-file=PATH      JSON-lines log destination (SEB_LOG_PATH)\n";
  }

  class UsageError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  struct CommandOptions {
    seb::core::Dictionary document;
    std::optional<std::filesystem::path> in;
    std::optional<std::filesystem::path> out;
    std::optional<std::filesystem::path> password_file;
    std::optional<std::string> url;
    std::optional<std::string> config_key;
    std::optional<std::string> hash;
    std::vector<std::string> positional;
    bool validate{true};
    bool encrypt_requested{false};
  };

  std::optional<std::string_view> FlagValue(std::string_view arg, std::string_view name) {
    if (arg.rfind(name, 0) != 0 || arg.size() <= name.size() || arg[name.size()] != '=') {
      return std::nullopt;
    }
    return arg.substr(name.size() + 1);
  }

  // Interprets a --set value the way a hand-written plist would type it.
  seb::core::Value ParseTypedValue(std::string_view text) {
    if (text == "true") {
      return seb::core::Value(true);
    }
    if (text == "false") {
      return seb::core::Value(false);
    }
    if (text == "null") {
      return seb::core::Value(nullptr);
    }
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    if (!text.empty()) {
      std::int64_t integer = 0;
      auto [int_end, int_ec] = std::from_chars(begin, end, integer);
      if (int_ec == std::errc() && int_end == end) {
        return seb::core::Value(integer);
      }
      double real = 0.0;
      auto [real_end, real_ec] = std::from_chars(begin, end, real, std::chars_format::fixed);
      if (real_ec == std::errc() && real_end == end && std::isfinite(real)) {
        return seb::core::Value(real);
      }
    }
    return seb::core::Value(std::string(text));
  }

  std::pair<std::string, std::string_view> SplitAssignment(std::string_view assignment) {
    const auto eq = assignment.find('=');
    if (eq == std::string_view::npos || eq == 0) {
      throw UsageError("expected key=value, got '" + std::string(assignment) + "'");
    }
    return {std::string(assignment.substr(0, eq)), assignment.substr(eq + 1)};
  }

  CommandOptions ParseCommandOptions(int argc, char** argv, int index) {
    CommandOptions options;
    for (int i = index; i < argc; ++i) {
      std::string_view arg = argv[i];
      if (arg.rfind("--", 0) != 0) {
        options.positional.emplace_back(arg);
        continue;
      }
      if (arg == "--set" || arg == "--set-data") {
        if (i + 1 >= argc) {
          throw UsageError(std::string(arg) + " needs key=value");
        }
        auto [key, value] = SplitAssignment(argv[++i]);
        if (arg == "--set") {
          options.document.Set(std::move(key), ParseTypedValue(value));
        } else {
          options.document.Set(std::move(key), seb::core::Value(seb::crypto::Base64Decode(value)));
        }
        continue;
      }
      if (arg == "--no-validate") {
        options.validate = false;
        continue;
      }
      if (auto v = FlagValue(arg, "--in")) {
        options.in = std::filesystem::path(std::string(*v));
      } else if (auto v = FlagValue(arg, "--out")) {
        options.out = std::filesystem::path(std::string(*v));
      } else if (auto v = FlagValue(arg, "--password-file")) {
        options.password_file = std::filesystem::path(std::string(*v));
        options.encrypt_requested = true;
      } else if (auto v = FlagValue(arg, "--url")) {
        options.url = std::string(*v);
      } else if (auto v = FlagValue(arg, "--config-key")) {
        options.config_key = std::string(*v);
      } else if (auto v = FlagValue(arg, "--hash")) {
        options.hash = std::string(*v);
      } else {
        throw UsageError("unknown option " + std::string(arg));
      }
    }
    return options;
  }

  // File content minus one trailing line ending.
  std::string ReadPasswordFile(const std::filesystem::path& path) {
    auto bytes = seb::orchestrator::ReadFileBytes(path);
    seb::security::Zeroizer::ScopeWiper<uint8_t> bytes_guard(bytes.data(), bytes.size());
    std::string password(bytes.begin(), bytes.end());
    if (!password.empty() && password.back() == '\n') {
      password.pop_back();
      if (!password.empty() && password.back() == '\r') {
        password.pop_back();
      }
    }
    return password;
  }

  void WriteOutput(const std::optional<std::filesystem::path>& out, std::string_view text) {
    if (!out) {
      std::cout << text << std::endl;
      return;
    }
    seb::orchestrator::AtomicReplace(*out, seb::AsBytes(text));
  }

  std::string_view DomainPrefix(seb::ErrorDomain domain) {
    switch (domain) {
    case seb::ErrorDomain::IO:
      return "I/O error";
    case seb::ErrorDomain::Security:
      return "Security error";
    case seb::ErrorDomain::Crypto:
      return "Cryptography error";
    case seb::ErrorDomain::Validation:
      return "Validation error";
    case seb::ErrorDomain::Config:
      return "Configuration error";
    case seb::ErrorDomain::Dependency:
      return "Dependency error";
    case seb::ErrorDomain::State:
      return "State error";
    case seb::ErrorDomain::Format:
      return "Format error";
    case seb::ErrorDomain::Internal:
      return "Internal error";
    }
    return "Error";
  }

  void ReportError(const seb::Error& err) {
    std::cerr << DomainPrefix(err.domain) << ": " << err.what() << '\n';
    if (const auto* validation = dynamic_cast<const seb::ValidationError*>(&err)) {
      for (const auto& issue : validation->issues) {
        std::cerr << "  " << issue.path << ": " << issue.message << '\n';
      }
    }

    seb::orchestrator::Event event;
    event.category = seb::orchestrator::EventCategory::kDiagnostics;
    event.severity = seb::orchestrator::EventSeverity::kError;
    event.event_id = "cli_error";
    event.message = err.what();
    event.fields.emplace_back("domain", std::string(DomainPrefix(err.domain)));
    event.fields.emplace_back("code", std::to_string(err.code),
                              seb::orchestrator::FieldPrivacy::kPublic, true);
    if (err.native_code.has_value()) {
      event.fields.emplace_back("native_code", std::to_string(*err.native_code),
                                seb::orchestrator::FieldPrivacy::kPublic, true);
    }
    seb::orchestrator::EventBus::Instance().Publish(event);
  }

  int ExitCodeFor(const seb::Error& err) {
    switch (err.domain) {
    case seb::ErrorDomain::IO:
      return kExitIO;
    case seb::ErrorDomain::Security:
    case seb::ErrorDomain::Crypto:
      return kExitAuth;
    case seb::ErrorDomain::Validation:
    case seb::ErrorDomain::Format:
      return kExitDataErr;
    case seb::ErrorDomain::Config:
      return kExitUsage;
    case seb::ErrorDomain::Dependency:
    case seb::ErrorDomain::State:
    case seb::ErrorDomain::Internal:
    default:
      return kExitIO;
    }
  }

  int HandleGenerate(const CommandOptions& options) {
    if (!options.out) {
      throw UsageError("generate needs --out=<file>");
    }
    seb::orchestrator::GenerateOptions generate;
    generate.validate = options.validate;
    generate.encrypt = options.encrypt_requested;
    if (options.password_file) {
      generate.password = ReadPasswordFile(*options.password_file);
    }
    seb::security::Zeroizer::ScopeWiper<char> password_guard(
        generate.password ? generate.password->data() : nullptr,
        generate.password ? generate.password->size() : 0);
    auto result = seb::orchestrator::Generate(options.document, generate);
    seb::orchestrator::AtomicReplace(*options.out, result.data);
    std::cout << (result.encrypted ? "encrypted" : "plain") << ' ' << result.size << " bytes\n";
    std::cout << "config-key " << seb::core::ComputeConfigKey(options.document) << std::endl;
    return kExitOk;
  }

  int HandleDecode(const CommandOptions& options) {
    if (!options.in) {
      throw UsageError("decode needs --in=<file>");
    }
    const auto data = seb::orchestrator::ReadFileBytes(*options.in);
    std::optional<std::string> password;
    if (options.password_file) {
      password = ReadPasswordFile(*options.password_file);
    }
    seb::security::Zeroizer::ScopeWiper<char> password_guard(
        password ? password->data() : nullptr, password ? password->size() : 0);
    std::optional<std::string_view> password_view;
    if (password) {
      password_view = *password;
    }
    const std::string xml = seb::core::Decode(data, password_view);
    WriteOutput(options.out, xml);
    return kExitOk;
  }

  int HandleInspect(const CommandOptions& options) {
    if (!options.in) {
      throw UsageError("inspect needs --in=<file>");
    }
    const auto data = seb::orchestrator::ReadFileBytes(*options.in);
    std::cout << seb::core::ContainerKindName(seb::core::Inspect(data)) << std::endl;
    return kExitOk;
  }

  int HandleRequestHash(const CommandOptions& options) {
    if (!options.url || !options.config_key) {
      throw UsageError("request-hash needs --url and --config-key");
    }
    std::cout << seb::core::ComputeRequestHash(*options.url, *options.config_key) << std::endl;
    return kExitOk;
  }

  int HandleVerify(const CommandOptions& options) {
    if (!options.url || !options.config_key || !options.hash) {
      throw UsageError("verify needs --url, --config-key and --hash");
    }
    if (seb::core::VerifyRequestHash(*options.url, *options.config_key, *options.hash)) {
      std::cout << "match" << std::endl;
      return kExitOk;
    }
    std::cout << "mismatch" << std::endl;
    return kExitMismatch;
  }

  int HandleParseVersion(const CommandOptions& options) {
    if (options.positional.size() != 1) {
      throw UsageError("parse-version needs exactly one version string");
    }
    auto parsed = seb::core::ParseClientVersion(options.positional.front());
    if (!parsed) {
      std::cerr << "Unrecognized SEB version string" << std::endl;
      return kExitDataErr;
    }
    std::cout << "app_name=" << parsed->app_name << '\n'
              << "os=" << seb::core::ClientOsName(parsed->os) << '\n'
              << "version=" << parsed->version << '\n'
              << "build=" << parsed->build << '\n'
              << "bundle_id=" << parsed->bundle_id << std::endl;
    return kExitOk;
  }

  int Dispatch(std::string_view cmd, const CommandOptions& options) {
    if (cmd != "parse-version" && !options.positional.empty()) {
      throw UsageError("unexpected argument " + options.positional.front());
    }
    if (cmd == "config-key") {
      std::cout << seb::core::ComputeConfigKey(options.document) << std::endl;
      return kExitOk;
    }
    if (cmd == "canonical") {
      std::cout << seb::core::SerializeCanonical(options.document) << std::endl;
      return kExitOk;
    }
    if (cmd == "plist") {
      WriteOutput(options.out, seb::core::RenderPlist(options.document));
      return kExitOk;
    }
    if (cmd == "generate") {
      return HandleGenerate(options);
    }
    if (cmd == "decode") {
      return HandleDecode(options);
    }
    if (cmd == "inspect") {
      return HandleInspect(options);
    }
    if (cmd == "request-hash") {
      return HandleRequestHash(options);
    }
    if (cmd == "verify") {
      return HandleVerify(options);
    }
    if (cmd == "parse-version") {
      return HandleParseVersion(options);
    }
    throw UsageError("unknown command " + std::string(cmd));
  }

}  // namespace

int main(int argc, char** argv) {
  try {
    auto settings = seb::orchestrator::LoadSettings();
    int index = 1;
    for (; index < argc; ++index) {
      std::string_view arg = argv[index];
      if (arg.rfind("--", 0) != 0) {
        break;
      }
      if (auto level = FlagValue(arg, "--log-level")) {
        auto parsed = seb::orchestrator::ParseSeverity(*level);
        if (!parsed) {
          throw seb::Error(seb::ErrorDomain::Config, seb::errors::config::kInvalidSetting,
                           "Unknown log level '" + std::string(*level) + "'");
        }
        settings.log_level = *parsed;
      } else if (auto file = FlagValue(arg, "--log-file")) {
        settings.log_path = std::filesystem::path(std::string(*file));
      } else if (arg == "--help") {
        PrintUsage();
        return kExitOk;
      } else {
        PrintUsage();
        return kExitUsage;
      }
    }
    seb::orchestrator::ApplyLoggingSettings(settings);

    if (index >= argc) {
      PrintUsage();
      return kExitUsage;
    }
    const std::string_view cmd = argv[index];
    return Dispatch(cmd, ParseCommandOptions(argc, argv, index + 1));
  } catch (const UsageError& err) {
    std::cerr << "Usage error: " << err.what() << "\n\n";
    PrintUsage();
    return kExitUsage;
  } catch (const seb::Error& err) {
    ReportError(err);
    return ExitCodeFor(err);
  } catch (const std::exception& err) {
    std::cerr << "Error: " << err.what() << std::endl;
    return kExitIO;
  }
}
