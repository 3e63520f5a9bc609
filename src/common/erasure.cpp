#include "erasure.hpp"
#include <algorithm>
#include <array>
#include <cstring>
#include <stdexcept>
#include <string>

namespace piecemeal {

namespace {

struct GaloisTables {
  std::array<uint8_t, 512> exp{};
  std::array<uint8_t, 256> log{};
  GaloisTables() {
    unsigned x = 1;
    for (int i = 0; i < 255; i++) {
      exp[i] = (uint8_t)x;
      log[x] = (uint8_t)i;
      x <<= 1;
      if (x & 0x100)
        x ^= 0x11d;
    }
    for (int i = 255; i < 512; i++)
      exp[i] = exp[i - 255];
  }
};

const GaloisTables &gf() {
  static const GaloisTables t;
  return t;
}

inline uint8_t gf_mul(uint8_t a, uint8_t b) {
  if (a == 0 || b == 0)
    return 0;
  const auto &t = gf();
  return t.exp[t.log[a] + t.log[b]];
}

inline uint8_t gf_inv(uint8_t a) {
  const auto &t = gf();
  return t.exp[255 - t.log[a]];
}

// dst ^= coef * src
void gf_mul_add(uint8_t coef, const uint8_t *src, uint8_t *dst, size_t n) {
  if (coef == 0)
    return;
  if (coef == 1) {
    for (size_t i = 0; i < n; i++)
      dst[i] ^= src[i];
    return;
  }
  const auto &t = gf();
  unsigned lc = t.log[coef];
  for (size_t i = 0; i < n; i++) {
    if (src[i])
      dst[i] ^= t.exp[lc + t.log[src[i]]];
  }
}

// Inverts an n x n matrix in place. Returns false if it is singular.
bool gf_invert(std::vector<uint8_t> &m, int n) {
  std::vector<uint8_t> inv(n * n, 0);
  for (int i = 0; i < n; i++)
    inv[i * n + i] = 1;
  for (int col = 0; col < n; col++) {
    int pivot = col;
    while (pivot < n && m[pivot * n + col] == 0)
      pivot++;
    if (pivot == n)
      return false;
    if (pivot != col) {
      for (int j = 0; j < n; j++) {
        std::swap(m[pivot * n + j], m[col * n + j]);
        std::swap(inv[pivot * n + j], inv[col * n + j]);
      }
    }
    uint8_t scale = gf_inv(m[col * n + col]);
    for (int j = 0; j < n; j++) {
      m[col * n + j] = gf_mul(m[col * n + j], scale);
      inv[col * n + j] = gf_mul(inv[col * n + j], scale);
    }
    for (int row = 0; row < n; row++) {
      if (row == col || m[row * n + col] == 0)
        continue;
      uint8_t f = m[row * n + col];
      for (int j = 0; j < n; j++) {
        m[row * n + j] ^= gf_mul(f, m[col * n + j]);
        inv[row * n + j] ^= gf_mul(f, inv[col * n + j]);
      }
    }
  }
  m.swap(inv);
  return true;
}

} // namespace

ReedSolomonCoder::ReedSolomonCoder(int data_pieces, int parity_pieces)
    : data_(data_pieces), parity_(parity_pieces) {
  if (data_ < 1 || parity_ < 0 || data_ + parity_ > 256)
    throw std::invalid_argument("reed-solomon: need 1 <= data and data + "
                                "parity <= 256");
  const int n = data_ + parity_;
  matrix_.assign((size_t)n * data_, 0);
  for (int i = 0; i < data_; i++)
    matrix_[i * data_ + i] = 1;
  for (int r = 0; r < parity_; r++) {
    uint8_t x = (uint8_t)(data_ + r);
    for (int j = 0; j < data_; j++)
      matrix_[(data_ + r) * data_ + j] = gf_inv((uint8_t)(x ^ (uint8_t)j));
  }
}

std::vector<std::vector<uint8_t>>
ReedSolomonCoder::encode(const std::vector<uint8_t> &data) const {
  size_t piece_size = (data.size() + data_ - 1) / data_;
  std::vector<std::vector<uint8_t>> pieces(num_pieces(),
                                           std::vector<uint8_t>(piece_size, 0));
  size_t offset = 0;
  for (int i = 0; i < data_ && offset < data.size(); i++) {
    size_t n = std::min(piece_size, data.size() - offset);
    std::memcpy(pieces[i].data(), data.data() + offset, n);
    offset += n;
  }
  for (int r = 0; r < parity_; r++) {
    auto &p = pieces[data_ + r];
    for (int j = 0; j < data_; j++)
      gf_mul_add(matrix_[(data_ + r) * data_ + j], pieces[j].data(), p.data(),
                 piece_size);
  }
  return pieces;
}

Status ReedSolomonCoder::recover(const PieceSet &pieces, uint64_t size,
                                 std::vector<uint8_t> &out) const {
  if ((int)pieces.size() != num_pieces())
    return Status(Errc::recovery_failed,
                  "expected " + std::to_string(num_pieces()) +
                      " piece slots, got " + std::to_string(pieces.size()));

  std::vector<int> present;
  size_t piece_size = 0;
  for (int i = 0; i < num_pieces(); i++) {
    if (!pieces[i])
      continue;
    if (present.empty())
      piece_size = pieces[i]->size();
    else if (pieces[i]->size() != piece_size)
      return Status(Errc::recovery_failed, "inconsistent piece sizes");
    present.push_back(i);
  }
  if ((int)present.size() < data_)
    return Status(Errc::recovery_failed,
                  "only " + std::to_string(present.size()) + " of " +
                      std::to_string(data_) + " required pieces available");
  if (size > (uint64_t)piece_size * data_)
    return Status(Errc::recovery_failed,
                  "requested " + std::to_string(size) +
                      " bytes but pieces hold " +
                      std::to_string((uint64_t)piece_size * data_));

  std::vector<std::vector<uint8_t>> rebuilt(data_);
  std::vector<const uint8_t *> data_ptr(data_, nullptr);
  bool all_data = true;
  for (int j = 0; j < data_; j++) {
    if (pieces[j])
      data_ptr[j] = pieces[j]->data();
    else
      all_data = false;
  }

  if (!all_data) {
    // Present indices are ascending, so surviving data rows are used first.
    std::vector<int> rows(present.begin(), present.begin() + data_);
    std::vector<uint8_t> sub((size_t)data_ * data_);
    for (int i = 0; i < data_; i++)
      std::memcpy(&sub[(size_t)i * data_], &matrix_[(size_t)rows[i] * data_],
                  data_);
    if (!gf_invert(sub, data_))
      return Status(Errc::recovery_failed, "decode matrix is singular");
    for (int j = 0; j < data_; j++) {
      if (data_ptr[j])
        continue;
      rebuilt[j].assign(piece_size, 0);
      for (int i = 0; i < data_; i++)
        gf_mul_add(sub[(size_t)j * data_ + i], pieces[rows[i]]->data(),
                   rebuilt[j].data(), piece_size);
      data_ptr[j] = rebuilt[j].data();
    }
  }

  std::vector<uint8_t> result(size);
  uint64_t off = 0;
  for (int j = 0; j < data_ && off < size; j++) {
    size_t n = (size_t)std::min<uint64_t>(piece_size, size - off);
    std::memcpy(result.data() + off, data_ptr[j], n);
    off += n;
  }
  for (auto &r : rebuilt)
    std::fill(r.begin(), r.end(), 0);
  out.swap(result);
  return Status();
}

} // namespace piecemeal
