#include "seb/orchestrator/io_util.h"

#include <array>
#include <cassert>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::vector<uint8_t> ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

bool HasTempLeftovers(const std::filesystem::path& target) {
  const auto prefix = target.filename().string() + ".tmp.";
  for (const auto& entry : std::filesystem::directory_iterator(target.parent_path())) {
    if (entry.path().filename().string().rfind(prefix, 0) == 0) {
      return true;
    }
  }
  return false;
}

}  // namespace

int main() {
  using seb::orchestrator::AtomicReplace;
  using seb::orchestrator::AtomicReplaceHooks;
  using seb::orchestrator::ReadFileBytes;

  auto temp_dir = std::filesystem::temp_directory_path();
  auto target = temp_dir / "seb_atomic_replace_test.seb";

  {
    std::ofstream seed(target, std::ios::binary | std::ios::trunc);
    const std::array<uint8_t, 4> baseline{0xDE, 0xAD, 0xBE, 0xEF};
    seed.write(reinterpret_cast<const char*>(baseline.data()), static_cast<std::streamsize>(baseline.size()));
  }

  AtomicReplaceHooks hooks;
  hooks.before_rename = [](const std::filesystem::path&, const std::filesystem::path&) {
    throw std::runtime_error("simulated crash");
  };

  std::array<uint8_t, 4> update{0xBA, 0xAD, 0xF0, 0x0D};
  bool threw = false;
  try {
    AtomicReplace(target, std::span<const uint8_t>(update.data(), update.size()), hooks);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw && "Expected simulated crash before rename");
  assert(!HasTempLeftovers(target));

  auto bytes = ReadFile(target);
  assert(bytes.size() == 4);
  assert(bytes[0] == 0xDE && bytes[1] == 0xAD && bytes[2] == 0xBE && bytes[3] == 0xEF);

  hooks.before_rename = nullptr;
  AtomicReplace(target, std::span<const uint8_t>(update.data(), update.size()));

  bytes = ReadFileBytes(target);
  assert(bytes.size() == 4);
  assert(bytes[0] == 0xBA && bytes[1] == 0xAD && bytes[2] == 0xF0 && bytes[3] == 0x0D);

  std::filesystem::remove(target);

  threw = false;
  try {
    (void)ReadFileBytes(target);
  } catch (const seb::Error& err) {
    threw = err.domain == seb::ErrorDomain::IO;
  }
  assert(threw && "missing file reports an I/O error");

  threw = false;
  try {
    AtomicReplace(std::filesystem::path{}, std::span<const uint8_t>(update.data(), update.size()));
  } catch (const seb::Error& err) {
    threw = err.domain == seb::ErrorDomain::Validation;
  }
  assert(threw);

  std::cout << "atomic replace tests ok\n";
  return 0;
}
