#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace piecemeal {

constexpr size_t kHashSize = 32;
constexpr size_t kPieceKeySize = 32;

using Hash = std::array<uint8_t, kHashSize>;
using PieceKey = std::array<uint8_t, kPieceKeySize>;

// Initializes libsodium once; returns false if the library is unusable.
bool crypto_init();

// BLAKE2b-256 of the given bytes. Pieces are addressed on hosts by this hash.
Hash hash_bytes(const uint8_t* data, size_t len);
inline Hash hash_bytes(const std::vector<uint8_t>& data) { return hash_bytes(data.data(), data.size()); }

// Deterministic per-piece key: keyed BLAKE2b over (chunk_index, piece_index)
// with the master key.
PieceKey derive_piece_key(const std::vector<uint8_t>& master_key,
                          uint64_t chunk_index, uint64_t piece_index);

void secure_wipe(std::vector<uint8_t>& buf);

enum class CipherKind : uint8_t { Plaintext = 0, XChaCha20Poly1305 = 1 };

const char* cipher_name(CipherKind kind);
bool parse_cipher_kind(const std::string& name, CipherKind& out);

class PieceCipher {
public:
    virtual ~PieceCipher() = default;
    virtual CipherKind kind() const = 0;
    virtual void set_key(const std::vector<uint8_t>& master_key) = 0;
    virtual bool encrypt(uint64_t chunk_index, uint64_t piece_index,
                         std::vector<uint8_t>& inout) const = 0;
    virtual bool decrypt(uint64_t chunk_index, uint64_t piece_index,
                         std::vector<uint8_t>& inout) const = 0;
    // Bytes a piece grows by when encrypted.
    virtual size_t overhead() const = 0;
};

class PlainPieceCipher : public PieceCipher {
public:
    CipherKind kind() const override { return CipherKind::Plaintext; }
    void set_key(const std::vector<uint8_t>&) override {}
    bool encrypt(uint64_t, uint64_t, std::vector<uint8_t>&) const override { return true; }
    bool decrypt(uint64_t, uint64_t, std::vector<uint8_t>&) const override { return true; }
    size_t overhead() const override { return 0; }
};

// XChaCha20-Poly1305 with a random nonce stored in front of the ciphertext.
class SodiumPieceCipher : public PieceCipher {
public:
    SodiumPieceCipher();
    ~SodiumPieceCipher() override;
    CipherKind kind() const override { return CipherKind::XChaCha20Poly1305; }
    void set_key(const std::vector<uint8_t>& master_key) override;
    bool encrypt(uint64_t chunk_index, uint64_t piece_index,
                 std::vector<uint8_t>& inout) const override;
    bool decrypt(uint64_t chunk_index, uint64_t piece_index,
                 std::vector<uint8_t>& inout) const override;
    size_t overhead() const override;
private:
    std::vector<uint8_t> master_key_;
};

std::unique_ptr<PieceCipher> make_piece_cipher(CipherKind kind,
                                               const std::vector<uint8_t>& master_key);

} // namespace piecemeal
