#pragma once
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace seb {

using Bytes = std::vector<std::uint8_t>;

inline std::span<const std::uint8_t> AsBytes(std::string_view text) noexcept {
  return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
}

inline std::span<std::uint8_t> AsWritableBytes(std::string& text) noexcept {
  return {reinterpret_cast<std::uint8_t*>(text.data()), text.size()};
}

inline std::string BytesToString(std::span<const std::uint8_t> bytes) {
  return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

inline Bytes StringToBytes(std::string_view text) {
  auto view = AsBytes(text);
  return Bytes(view.begin(), view.end());
}

// Lowercase base16 without separators.
inline std::string HexEncode(std::span<const std::uint8_t> bytes) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (auto byte : bytes) {
    out.push_back(kHex[(byte >> 4) & 0x0F]);
    out.push_back(kHex[byte & 0x0F]);
  }
  return out;
}

inline constexpr char AsciiToLower(char ch) noexcept {
  return (ch >= 'A' && ch <= 'Z') ? static_cast<char>(ch - 'A' + 'a') : ch;
}

inline std::string AsciiLowercase(std::string_view text) {
  std::string out(text);
  for (auto& ch : out) {
    ch = AsciiToLower(ch);
  }
  return out;
}

inline std::string PathToUtf8String(const std::filesystem::path& path) {
#if defined(_WIN32)
  const std::u8string u8 = path.u8string();
  std::string result;
  result.reserve(u8.size());
  for (auto ch : u8) {
    result.push_back(static_cast<char>(ch));
  }
  return result;
#else
  return path.string();
#endif
}

}  // namespace seb
