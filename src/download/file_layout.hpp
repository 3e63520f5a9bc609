#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "crypto.hpp"
#include "erasure.hpp"
#include "errors.hpp"
#include "piece_map.hpp"

namespace piecemeal {

class PieceHost;

// Where the pieces of every chunk of a file live and how they were encoded.
struct FileLayout {
    std::string name;
    uint64_t size{0};
    uint64_t piece_size{0};
    std::shared_ptr<const ErasureCoder> erasure_code;
    std::shared_ptr<const PieceCipher> cipher;
    std::vector<PieceLookup> chunks;

    uint64_t chunk_size() const { return piece_size * (uint64_t)erasure_code->min_pieces(); }
};

// The part of one chunk that a download needs.
struct ChunkSlice {
    uint64_t chunk_index{0};
    uint64_t fetch_offset{0};
    uint64_t fetch_length{0};
    int64_t write_offset{0};
};

// Splits [offset, offset + length) of the file into per-chunk slices. The
// range must lie within the file and the piece size must be non-zero.
std::vector<ChunkSlice> plan_download(const FileLayout& file, uint64_t offset, uint64_t length);

// Erasure codes and encrypts `data`, storing each piece of a chunk on a
// different host. Needs at least num_pieces() hosts.
Status seal_file(const std::string& name, const std::vector<uint8_t>& data,
                 uint64_t piece_size,
                 std::shared_ptr<const ErasureCoder> erasure_code,
                 std::shared_ptr<const PieceCipher> cipher,
                 const std::vector<std::shared_ptr<PieceHost>>& hosts,
                 FileLayout& out);

} // namespace piecemeal
