#pragma once

#include "vocabulary.hpp"

#include <charconv>
#include <system_error>
#include <cstdint>
#include <string>
#include <string_view>

namespace chatrelay {

// ============================================================================
// UTF-8 lossy decoding
// ============================================================================

class Utf8 {
 public:
  // U+FFFD REPLACEMENT CHARACTER
  static constexpr std::string_view kReplacement = "\xEF\xBF\xBD";

  // Decode raw bytes as UTF-8. Every maximal ill-formed subsequence is
  // replaced by a single U+FFFD, so decoding never fails.
  static std::string decode_lossy(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size());

    size_t i = 0;
    while (i < bytes.size()) {
      uint8_t lead = static_cast<uint8_t>(bytes[i]);
      if (lead < 0x80) {
        out.push_back(static_cast<char>(lead));
        ++i;
        continue;
      }

      size_t len = 0;
      uint8_t lo = 0x80;
      uint8_t hi = 0xBF;
      if (lead >= 0xC2 && lead <= 0xDF) {
        len = 2;
      } else if (lead == 0xE0) {
        len = 3;
        lo = 0xA0;
      } else if ((lead >= 0xE1 && lead <= 0xEC) || lead == 0xEE || lead == 0xEF) {
        len = 3;
      } else if (lead == 0xED) {
        len = 3;
        hi = 0x9F;  // no surrogates
      } else if (lead == 0xF0) {
        len = 4;
        lo = 0x90;
      } else if (lead >= 0xF1 && lead <= 0xF3) {
        len = 4;
      } else if (lead == 0xF4) {
        len = 4;
        hi = 0x8F;  // <= U+10FFFF
      } else {
        out.append(kReplacement);
        ++i;
        continue;
      }

      size_t valid = 1;
      while (valid < len && i + valid < bytes.size()) {
        uint8_t b = static_cast<uint8_t>(bytes[i + valid]);
        uint8_t min = (valid == 1) ? lo : 0x80;
        uint8_t max = (valid == 1) ? hi : 0xBF;
        if (b < min || b > max)
          break;
        ++valid;
      }

      if (valid == len) {
        out.append(bytes.substr(i, len));
      } else {
        out.append(kReplacement);
      }
      i += valid;
    }
    return out;
  }
};

// ============================================================================
// Text helpers
// ============================================================================

inline bool starts_with(std::string_view text, std::string_view prefix) {
  return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

// Whole-string decimal parse, rejecting signs, junk and values above max.
inline expected<uint64_t, ErrorCode> parse_unsigned(std::string_view text, uint64_t max) {
  uint64_t value = 0;
  auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (text.empty() || ec != std::errc() || end != text.data() + text.size() || value > max) {
    return expected<uint64_t, ErrorCode>::error(ErrorCode::kInvalidArgument);
  }
  return expected<uint64_t, ErrorCode>::success(value);
}

// Dotted-quad rendering of an IPv4 address given in host byte order.
inline std::string format_ipv4(uint32_t host_order_addr) {
  return std::to_string((host_order_addr >> 24) & 0xFF) + "." +
         std::to_string((host_order_addr >> 16) & 0xFF) + "." +
         std::to_string((host_order_addr >> 8) & 0xFF) + "." +
         std::to_string(host_order_addr & 0xFF);
}

}  // namespace chatrelay
