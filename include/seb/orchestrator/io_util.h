#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <span>
#include <vector>

#include "seb/error.h"

namespace seb::orchestrator {

struct AtomicReplaceHooks {
  // Runs after the payload is durable in the temporary file and before it is
  // renamed over the target. Throwing here leaves the target untouched.
  std::function<void(const std::filesystem::path&, const std::filesystem::path&)> before_rename;
};

// Performs an atomic replace of the target file by writing the payload to a
// temporary file in the same directory, syncing it to disk, then renaming it
// into place. Readers observe either the old or the new content.
void AtomicReplace(const std::filesystem::path& target, std::span<const uint8_t> payload,
                   const AtomicReplaceHooks& hooks = {});

// Reads a whole file. Throws seb::Error (IO domain) when it cannot be opened
// or read.
std::vector<uint8_t> ReadFileBytes(const std::filesystem::path& path);

}  // namespace seb::orchestrator
