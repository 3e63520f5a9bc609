#include "util.hpp"
#include <cctype>
#include <cstdint>
#include <stdexcept>

namespace piecemeal {

static int hex_value(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

std::vector<uint8_t> hex_to_bytes(const std::string &hex) {
  std::vector<uint8_t> out;
  if (hex.empty() || (hex.size() % 2) != 0)
    return out;
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    int hi = hex_value(hex[i]);
    int lo = hex_value(hex[i + 1]);
    if (hi < 0 || lo < 0)
      return {};
    out.push_back((uint8_t)((hi << 4) | lo));
  }
  return out;
}

std::string to_hex(const uint8_t *data, size_t len) {
  static const char digits[] = "0123456789abcdef";
  std::string s;
  s.reserve(len * 2);
  for (size_t i = 0; i < len; i++) {
    s.push_back(digits[data[i] >> 4]);
    s.push_back(digits[data[i] & 0x0f]);
  }
  return s;
}

bool parse_size(const std::string &s, uint64_t &out) {
  if (s.empty() || !std::isdigit((unsigned char)s[0]))
    return false;
  size_t pos = 0;
  unsigned long long v;
  try {
    v = std::stoull(s, &pos);
  } catch (const std::exception &) {
    return false;
  }
  uint64_t mult = 1;
  if (pos < s.size()) {
    switch (std::toupper((unsigned char)s[pos])) {
    case 'K':
      mult = 1ull << 10;
      break;
    case 'M':
      mult = 1ull << 20;
      break;
    case 'G':
      mult = 1ull << 30;
      break;
    default:
      return false;
    }
    pos++;
    if (pos < s.size() && (s[pos] == 'B' || s[pos] == 'b'))
      pos++;
    if (pos != s.size())
      return false;
  }
  if ((uint64_t)v > UINT64_MAX / mult)
    return false;
  out = (uint64_t)v * mult;
  return true;
}

} // namespace piecemeal
