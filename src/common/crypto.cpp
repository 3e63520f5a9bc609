#include "crypto.hpp"
#include "logging.hpp"
#include <cstring>
#include <sodium.h>

namespace piecemeal {

bool crypto_init() {
  static const bool ok = sodium_init() >= 0;
  return ok;
}

Hash hash_bytes(const uint8_t *data, size_t len) {
  crypto_init();
  Hash h{};
  crypto_generichash(h.data(), h.size(), data, len, nullptr, 0);
  return h;
}

PieceKey derive_piece_key(const std::vector<uint8_t> &master_key,
                          uint64_t chunk_index, uint64_t piece_index) {
  crypto_init();
  uint8_t buf[8 + 8];
  for (int i = 0; i < 8; i++) {
    buf[i] = (uint8_t)(chunk_index >> (8 * i));
    buf[8 + i] = (uint8_t)(piece_index >> (8 * i));
  }
  // keyed BLAKE2b accepts keys of 16..64 bytes; longer or shorter master keys
  // are first compressed to 32 bytes.
  PieceKey mk{};
  const uint8_t *key = master_key.data();
  size_t keylen = master_key.size();
  if (keylen < crypto_generichash_KEYBYTES_MIN ||
      keylen > crypto_generichash_KEYBYTES_MAX) {
    crypto_generichash(mk.data(), mk.size(), master_key.data(),
                       master_key.size(), nullptr, 0);
    key = mk.data();
    keylen = mk.size();
  }
  PieceKey out{};
  crypto_generichash(out.data(), out.size(), buf, sizeof(buf), key, keylen);
  sodium_memzero(mk.data(), mk.size());
  return out;
}

void secure_wipe(std::vector<uint8_t> &buf) {
  if (!buf.empty())
    sodium_memzero(buf.data(), buf.size());
  buf.clear();
  buf.shrink_to_fit();
}

const char *cipher_name(CipherKind kind) {
  switch (kind) {
  case CipherKind::Plaintext:
    return "plaintext";
  case CipherKind::XChaCha20Poly1305:
    return "xchacha20poly1305";
  }
  return "unknown";
}

bool parse_cipher_kind(const std::string &name, CipherKind &out) {
  if (name == "plaintext" || name == "plain") {
    out = CipherKind::Plaintext;
    return true;
  }
  if (name == "xchacha20poly1305" || name == "xchacha") {
    out = CipherKind::XChaCha20Poly1305;
    return true;
  }
  return false;
}

SodiumPieceCipher::SodiumPieceCipher() {
  if (!crypto_init())
    Logger::instance().log(LogLevel::ERROR, "libsodium initialization failed");
}

SodiumPieceCipher::~SodiumPieceCipher() {
  if (!master_key_.empty())
    sodium_memzero(master_key_.data(), master_key_.size());
}

void SodiumPieceCipher::set_key(const std::vector<uint8_t> &master_key) {
  master_key_ = master_key;
}

size_t SodiumPieceCipher::overhead() const {
  return crypto_aead_xchacha20poly1305_ietf_NPUBBYTES +
         crypto_aead_xchacha20poly1305_ietf_ABYTES;
}

bool SodiumPieceCipher::encrypt(uint64_t chunk_index, uint64_t piece_index,
                                std::vector<uint8_t> &inout) const {
  PieceKey key = derive_piece_key(master_key_, chunk_index, piece_index);
  const size_t npub = crypto_aead_xchacha20poly1305_ietf_NPUBBYTES;
  std::vector<uint8_t> out(npub + inout.size() +
                           crypto_aead_xchacha20poly1305_ietf_ABYTES);
  randombytes_buf(out.data(), npub);
  unsigned long long clen = 0;
  int rc = crypto_aead_xchacha20poly1305_ietf_encrypt(
      out.data() + npub, &clen, inout.data(), inout.size(), nullptr, 0, nullptr,
      out.data(), key.data());
  sodium_memzero(key.data(), key.size());
  if (rc != 0)
    return false;
  out.resize(npub + (size_t)clen);
  secure_wipe(inout);
  inout.swap(out);
  return true;
}

bool SodiumPieceCipher::decrypt(uint64_t chunk_index, uint64_t piece_index,
                                std::vector<uint8_t> &inout) const {
  const size_t npub = crypto_aead_xchacha20poly1305_ietf_NPUBBYTES;
  if (inout.size() < overhead())
    return false;
  PieceKey key = derive_piece_key(master_key_, chunk_index, piece_index);
  std::vector<uint8_t> out(inout.size() - overhead());
  unsigned long long mlen = 0;
  int rc = crypto_aead_xchacha20poly1305_ietf_decrypt(
      out.data(), &mlen, nullptr, inout.data() + npub, inout.size() - npub,
      nullptr, 0, inout.data(), key.data());
  sodium_memzero(key.data(), key.size());
  if (rc != 0)
    return false;
  out.resize((size_t)mlen);
  inout.swap(out);
  return true;
}

std::unique_ptr<PieceCipher>
make_piece_cipher(CipherKind kind, const std::vector<uint8_t> &master_key) {
  std::unique_ptr<PieceCipher> c;
  if (kind == CipherKind::XChaCha20Poly1305)
    c = std::make_unique<SodiumPieceCipher>();
  else
    c = std::make_unique<PlainPieceCipher>();
  c->set_key(master_key);
  return c;
}

} // namespace piecemeal
