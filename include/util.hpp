#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace piecemeal {

// Returns an empty vector on odd length or non-hex characters.
std::vector<uint8_t> hex_to_bytes(const std::string& hex);
std::string to_hex(const uint8_t* data, size_t len);
template <typename Bytes> std::string to_hex(const Bytes& b) { return to_hex(b.data(), b.size()); }

// Accepts plain byte counts and K/M/G suffixes (powers of 1024). Values that
// do not fit in 64 bits are rejected.
bool parse_size(const std::string& s, uint64_t& out);

} // namespace piecemeal
