#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace seb {
  enum class ErrorDomain : std::uint16_t {
    Security = 0x01,
    IO = 0x02,
    Crypto = 0x03,
    Validation = 0x04,
    Config = 0x05,
    Dependency = 0x06,
    State = 0x07,
    Format = 0x08,
    Internal = 0x7F
  };

  // Each domain reserves a span of codes to avoid collisions with propagated
  // platform error numbers. Codes inside the reserved range are stable across
  // releases.
  inline constexpr int kErrorDomainSpan = 0x0100;

  inline constexpr int ErrorDomainBase(ErrorDomain domain) {
    switch (domain) {
    case ErrorDomain::Security:
      return 0x0100;
    case ErrorDomain::IO:
      return 0x0200;
    case ErrorDomain::Crypto:
      return 0x0300;
    case ErrorDomain::Validation:
      return 0x0400;
    case ErrorDomain::Config:
      return 0x0500;
    case ErrorDomain::Dependency:
      return 0x0600;
    case ErrorDomain::State:
      return 0x0700;
    case ErrorDomain::Format:
      return 0x0800;
    case ErrorDomain::Internal:
      return 0x7F00;
    }
    return 0; // unreachable but placates compilers without warnings enabled
  }

  inline constexpr int ErrorDomainMax(ErrorDomain domain) {
    return ErrorDomainBase(domain) + kErrorDomainSpan - 1;
  }

  inline constexpr bool IsFrameworkErrorCode(ErrorDomain domain, int code) {
    return code >= ErrorDomainBase(domain) && code <= ErrorDomainMax(domain);
  }

  enum class Retryability : std::uint8_t {
    kFatal = 0,
    kTransient,
    kRetryable
  };

  namespace errors {
    inline constexpr int Make(ErrorDomain domain, int offset) {
      return ErrorDomainBase(domain) + offset;
    }

    namespace io {
      inline constexpr int kFileOpenFailed = Make(ErrorDomain::IO, 0x01);
      inline constexpr int kFileReadFailed = Make(ErrorDomain::IO, 0x02);
      inline constexpr int kAtomicReplaceFailed = Make(ErrorDomain::IO, 0x03);
    } // namespace io

    namespace format {
      inline constexpr int kUnknownContainerTag = Make(ErrorDomain::Format, 0x01);
      inline constexpr int kContainerTruncated = Make(ErrorDomain::Format, 0x02);
      inline constexpr int kCompressedDataCorrupt = Make(ErrorDomain::Format, 0x03);
      inline constexpr int kBase64Malformed = Make(ErrorDomain::Format, 0x04);
      inline constexpr int kDecompressedTooLarge = Make(ErrorDomain::Format, 0x05);
    } // namespace format

    namespace security {
      inline constexpr int kPasswordRequired = Make(ErrorDomain::Security, 0x01);
    } // namespace security

    namespace crypto {
      inline constexpr int kDecryptionFailed = Make(ErrorDomain::Crypto, 0x01);
      inline constexpr int kProviderFailure = Make(ErrorDomain::Crypto, 0x02);
      inline constexpr int kSelfTestFailed = Make(ErrorDomain::Crypto, 0x03);
      inline constexpr int kRandomUnavailable = Make(ErrorDomain::Crypto, 0x04);
    } // namespace crypto

    namespace validation {
      inline constexpr int kDocumentRejected = Make(ErrorDomain::Validation, 0x01);
      inline constexpr int kBadArgument = Make(ErrorDomain::Validation, 0x02);
    } // namespace validation

    namespace dependency {
      inline constexpr int kCapabilityUnavailable = Make(ErrorDomain::Dependency, 0x01);
    } // namespace dependency

    namespace state {
      inline constexpr int kValueKindMismatch = Make(ErrorDomain::State, 0x01);
    } // namespace state

    namespace config {
      inline constexpr int kInvalidSetting = Make(ErrorDomain::Config, 0x01);
    } // namespace config

    namespace internal {
      inline constexpr int kCompressorFailure = Make(ErrorDomain::Internal, 0x01);
    } // namespace internal

  } // namespace errors

  struct Error : public std::runtime_error {
    ErrorDomain domain;
    int code;
    std::optional<int> native_code;
    Retryability retryability{Retryability::kFatal};
    std::vector<std::string> context;
    explicit Error(ErrorDomain d, int c, std::string msg,
                   std::optional<int> native = std::nullopt,
                   Retryability retry = Retryability::kFatal,
                   std::vector<std::string> ctx = {})
        : std::runtime_error(std::move(msg)),
          domain(d),
          code(c),
          native_code(native),
          retryability(retry),
          context(std::move(ctx)) {}
  };

  // Container bytes are not a recognizable SEB container (unknown tag,
  // truncated framing, corrupt compressed stream).
  struct FormatError : public Error {
    explicit FormatError(std::string msg, int c = errors::format::kUnknownContainerTag,
                         std::optional<int> native = std::nullopt)
        : Error(ErrorDomain::Format, c, std::move(msg), native) {}
  };

  // An encrypted container was opened without any password. A wrong password
  // surfaces as DecryptionError instead.
  struct PasswordError : public Error {
    explicit PasswordError(std::string msg)
        : Error(ErrorDomain::Security, errors::security::kPasswordRequired, std::move(msg)) {}
  };

  struct DecryptionError : public Error {
    explicit DecryptionError(std::string msg)
        : Error(ErrorDomain::Crypto, errors::crypto::kDecryptionFailed, std::move(msg)) {}
  };

  struct ValidationIssue {
    std::string path;
    std::string message;
  };

  struct ValidationError : public Error {
    std::vector<ValidationIssue> issues;
    explicit ValidationError(std::string msg, std::vector<ValidationIssue> found = {})
        : Error(ErrorDomain::Validation, errors::validation::kDocumentRejected, std::move(msg)),
          issues(std::move(found)) {}
  };

  struct CapabilityUnavailableError : public Error {
    explicit CapabilityUnavailableError(std::string msg)
        : Error(ErrorDomain::Dependency, errors::dependency::kCapabilityUnavailable,
                std::move(msg)) {}
  };
} // namespace seb
