#include "seb/orchestrator/io_util.h"

#include "seb/common.h"
#include "seb/crypto/random.h"
#include "seb/errors.h"

#include <array>
#include <cerrno>
#include <chrono>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <type_traits>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace seb::orchestrator {
namespace {

class ErrorContext {
 public:
  void Push(std::string context) { context_stack_.push_back(std::move(context)); }
  void Pop() {
    if (!context_stack_.empty()) {
      context_stack_.pop_back();
    }
  }
  [[nodiscard]] std::vector<std::string> Stack() const { return context_stack_; }
  [[nodiscard]] std::string Format(std::string_view message) const {
    std::ostringstream oss;
    oss << message;
    for (auto it = context_stack_.rbegin(); it != context_stack_.rend(); ++it) {
      oss << "\n  while: " << *it;
    }
    return oss.str();
  }

 private:
  std::vector<std::string> context_stack_;
};

class ScopedErrorContext {
 public:
  ScopedErrorContext(ErrorContext& ctx, std::string description) : ctx_(ctx) {
    ctx_.Push(std::move(description));
  }
  ScopedErrorContext(const ScopedErrorContext&) = delete;
  ScopedErrorContext& operator=(const ScopedErrorContext&) = delete;
  ~ScopedErrorContext() { ctx_.Pop(); }

 private:
  ErrorContext& ctx_;
};

Retryability ClassifyNativeError(int native) {
  switch (native) {
    case EINTR:
    case EAGAIN:
      return Retryability::kRetryable;
    case EBUSY:
    case ETIMEDOUT:
      return Retryability::kTransient;
    default:
      break;
  }
  return Retryability::kFatal;
}

[[noreturn]] void ThrowIoError(const ErrorContext& ctx, std::string_view stage, int native) {
  std::string message(errors::msg::kAtomicReplaceFailed);
  message += ": ";
  message += stage;
  if (native != 0) {
    message += " (";
    message += std::system_category().message(native);
    message += ")";
  }
  throw Error{ErrorDomain::IO,
              errors::io::kAtomicReplaceFailed,
              ctx.Format(message),
              native == 0 ? std::nullopt : std::optional<int>(native),
              ClassifyNativeError(native),
              ctx.Stack()};
}

Error AugmentError(const Error& err, const ErrorContext& ctx) {
  auto merged = err.context;
  auto stack = ctx.Stack();
  merged.insert(merged.end(), stack.begin(), stack.end());
  return Error{err.domain, err.code, ctx.Format(err.what()), err.native_code, err.retryability,
               std::move(merged)};
}

template <typename Func>
auto WithContext(ErrorContext& ctx, std::string description, Func&& fn)
    -> std::invoke_result_t<Func&> {
  ScopedErrorContext scoped(ctx, std::move(description));
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Func&>>) {
      fn();
      return;
    } else {
      return fn();
    }
  } catch (const Error& err) {
    if (err.context.empty()) {
      throw AugmentError(err, ctx);
    }
    throw;
  } catch (const std::system_error& sys_err) {
    throw Error{ErrorDomain::IO, errors::io::kAtomicReplaceFailed, ctx.Format(sys_err.what()),
                sys_err.code().value(), ClassifyNativeError(sys_err.code().value()), ctx.Stack()};
  }
}

class FileDescriptor {
 public:
  explicit FileDescriptor(int fd) noexcept : fd_(fd) {}
  FileDescriptor(const FileDescriptor&) = delete;
  FileDescriptor& operator=(const FileDescriptor&) = delete;
  ~FileDescriptor() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  [[nodiscard]] int get() const noexcept { return fd_; }

  // Closes explicitly so the caller sees close(2) failures.
  int Close() noexcept {
    const int rc = ::close(fd_);
    fd_ = -1;
    return rc;
  }

 private:
  int fd_;
};

void SyncFileWithRetry(int fd, const ErrorContext& ctx) {
  constexpr int kMaxRetries = 4;
  std::chrono::milliseconds backoff{5};
  for (int attempt = 0;; ++attempt) {
    if (::fsync(fd) == 0) {
      return;
    }
    const int saved_errno = errno;
    if (saved_errno == EINTR) {
      continue;
    }
    if (attempt >= kMaxRetries || (saved_errno != EAGAIN && saved_errno != EBUSY)) {
      ThrowIoError(ctx, "fsync failed", saved_errno);
    }
    std::this_thread::sleep_for(backoff);
    backoff *= 2;
  }
}

void WriteAll(int fd, std::span<const uint8_t> payload, const ErrorContext& ctx) {
  size_t written = 0;
  while (written < payload.size()) {
    auto chunk = ::write(fd, payload.data() + written, payload.size() - written);
    if (chunk < 0) {
      const int saved_errno = errno;
      if (saved_errno == EINTR) {
        continue;
      }
      ThrowIoError(ctx, "write failed", saved_errno);
    }
    if (chunk == 0) {
      ThrowIoError(ctx, "short write", 0);
    }
    written += static_cast<size_t>(chunk);
  }
}

void SyncDirectory(const std::filesystem::path& dir, const ErrorContext& ctx) {
  FileDescriptor dir_fd(::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
  if (dir_fd.get() < 0) {
    ThrowIoError(ctx, "open directory failed", errno);
  }
  if (::fsync(dir_fd.get()) != 0) {
    ThrowIoError(ctx, "directory flush failed", errno);
  }
}

class TempFileGuard {
 public:
  explicit TempFileGuard(std::filesystem::path path) noexcept : path_(std::move(path)) {}
  TempFileGuard(const TempFileGuard&) = delete;
  TempFileGuard& operator=(const TempFileGuard&) = delete;
  ~TempFileGuard() noexcept {
    if (!path_.empty()) {
      std::error_code ec;
      if (!std::filesystem::remove(path_, ec) && ec) {
        std::cerr << "TempFileGuard cleanup failed for " << path_ << ": " << ec.message() << '\n';
      }
    }
  }

  void Release() noexcept { path_.clear(); }

 private:
  std::filesystem::path path_;
};

std::filesystem::path MakeTempPath(const std::filesystem::path& dir,
                                   const std::filesystem::path& base) {
  std::array<uint8_t, 16> random{};
  crypto::SystemRandomBytes(std::span<uint8_t>(random.data(), random.size()));
  std::filesystem::path temp_name = base.filename();
  temp_name += ".tmp.";
  temp_name += seb::HexEncode(std::span<const uint8_t>(random.data(), random.size()));
  return dir / temp_name;
}

}  // namespace

void AtomicReplace(const std::filesystem::path& target, std::span<const uint8_t> payload,
                   const AtomicReplaceHooks& hooks) {
  ErrorContext ctx;
  const std::string target_utf8 = target.empty() ? std::string("<empty>") : seb::PathToUtf8String(target);
  ScopedErrorContext root(ctx, "atomic replace target=" + target_utf8);

  if (target.empty()) {
    throw Error{ErrorDomain::Validation, errors::validation::kBadArgument,
                ctx.Format("Target path required"), std::nullopt, Retryability::kFatal, ctx.Stack()};
  }

  auto dir = target.parent_path();
  if (dir.empty()) {
    dir = WithContext(ctx, "resolving current working directory", [] {
      return std::filesystem::current_path();
    });
  }

  auto temp_path = MakeTempPath(dir, target);
  TempFileGuard cleanup(temp_path);

  FileDescriptor fd(::open(temp_path.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0600));
  if (fd.get() < 0) {
    ThrowIoError(ctx, "open failed", errno);
  }

  WithContext(ctx, "writing payload", [&] { WriteAll(fd.get(), payload, ctx); });
  WithContext(ctx, "syncing payload", [&] { SyncFileWithRetry(fd.get(), ctx); });
  if (fd.Close() != 0) {
    ThrowIoError(ctx, "close failed", errno);
  }

  if (hooks.before_rename) {
    WithContext(ctx, "executing before_rename hook", [&] { hooks.before_rename(temp_path, target); });
  }

  if (::rename(temp_path.c_str(), target.c_str()) != 0) {
    ThrowIoError(ctx, "rename failed", errno);
  }
  cleanup.Release();

  WithContext(ctx, "syncing directory metadata", [&] { SyncDirectory(dir, ctx); });
}

std::vector<uint8_t> ReadFileBytes(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw Error{ErrorDomain::IO, errors::io::kFileOpenFailed,
                "Failed to open " + seb::PathToUtf8String(path), errno};
  }
  std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw Error{ErrorDomain::IO, errors::io::kFileReadFailed,
                "Failed to read " + seb::PathToUtf8String(path), errno};
  }
  return data;
}

}  // namespace seb::orchestrator
