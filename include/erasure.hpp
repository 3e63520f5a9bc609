#pragma once
#include <cstdint>
#include <optional>
#include <vector>
#include "errors.hpp"

namespace piecemeal {

// One slot per piece index; an empty slot means the piece is unavailable.
using PieceSet = std::vector<std::optional<std::vector<uint8_t>>>;

class ErasureCoder {
public:
    virtual ~ErasureCoder() = default;
    // Number of pieces needed to recover a chunk.
    virtual int min_pieces() const = 0;
    // Total number of pieces a chunk is encoded into.
    virtual int num_pieces() const = 0;
    // Splits data into num_pieces() equally sized pieces (zero padded).
    virtual std::vector<std::vector<uint8_t>> encode(const std::vector<uint8_t>& data) const = 0;
    // Reconstructs the first `size` bytes of the original data. Pure function
    // of its inputs; `out` is only written on success.
    virtual Status recover(const PieceSet& pieces, uint64_t size,
                           std::vector<uint8_t>& out) const = 0;
};

// Systematic Reed-Solomon over GF(2^8). Pieces [0, data) carry the data,
// pieces [data, data+parity) are Cauchy parity rows, so any `data` pieces
// recover the chunk.
class ReedSolomonCoder : public ErasureCoder {
public:
    ReedSolomonCoder(int data_pieces, int parity_pieces);
    int min_pieces() const override { return data_; }
    int num_pieces() const override { return data_ + parity_; }
    std::vector<std::vector<uint8_t>> encode(const std::vector<uint8_t>& data) const override;
    Status recover(const PieceSet& pieces, uint64_t size,
                   std::vector<uint8_t>& out) const override;
private:
    int data_;
    int parity_;
    // (data + parity) x data encoding matrix, row major.
    std::vector<uint8_t> matrix_;
};

} // namespace piecemeal
