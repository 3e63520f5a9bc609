#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include "crypto.hpp"

namespace piecemeal {

using HostId = std::string;

// Where one host's piece of a chunk sits in the erasure-coded layout and the
// hash it is stored under.
struct PieceInfo {
    uint64_t piece_index{0};
    Hash content_hash{};
};

using PieceLookup = std::unordered_map<HostId, PieceInfo>;

} // namespace piecemeal
