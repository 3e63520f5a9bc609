#include "file_layout.hpp"
#include "host.hpp"
#include "logging.hpp"
#include <algorithm>

namespace piecemeal {

std::vector<ChunkSlice> plan_download(const FileLayout &file, uint64_t offset,
                                      uint64_t length) {
  std::vector<ChunkSlice> slices;
  if (length == 0)
    return slices;
  const uint64_t cs = file.chunk_size();
  const uint64_t end = offset + length;
  for (uint64_t c = offset / cs; c <= (end - 1) / cs; c++) {
    const uint64_t chunk_start = c * cs;
    const uint64_t from = std::max(offset, chunk_start);
    const uint64_t to = std::min(end, chunk_start + cs);
    ChunkSlice s;
    s.chunk_index = c;
    s.fetch_offset = from - chunk_start;
    s.fetch_length = to - from;
    s.write_offset = (int64_t)(from - offset);
    slices.push_back(s);
  }
  return slices;
}

Status seal_file(const std::string &name, const std::vector<uint8_t> &data,
                 uint64_t piece_size,
                 std::shared_ptr<const ErasureCoder> erasure_code,
                 std::shared_ptr<const PieceCipher> cipher,
                 const std::vector<std::shared_ptr<PieceHost>> &hosts,
                 FileLayout &out) {
  if (!erasure_code || !cipher || piece_size == 0)
    return Status(Errc::invalid_request,
                  "sealing needs an erasure coder, a cipher and a piece size");
  const size_t n = (size_t)erasure_code->num_pieces();
  if (hosts.size() < n)
    return Status(Errc::invalid_request,
                  "need " + std::to_string(n) + " hosts, have " +
                      std::to_string(hosts.size()));

  FileLayout layout;
  layout.name = name;
  layout.size = data.size();
  layout.piece_size = piece_size;
  layout.erasure_code = erasure_code;
  layout.cipher = cipher;
  const uint64_t cs = layout.chunk_size();
  const uint64_t num_chunks = (data.size() + cs - 1) / cs;
  layout.chunks.resize(num_chunks);

  for (uint64_t c = 0; c < num_chunks; c++) {
    const uint64_t start = c * cs;
    const uint64_t len = std::min<uint64_t>(cs, data.size() - start);
    std::vector<uint8_t> chunk(cs, 0);
    std::copy(data.begin() + start, data.begin() + start + len, chunk.begin());

    auto pieces = erasure_code->encode(chunk);
    for (size_t i = 0; i < pieces.size(); i++) {
      if (!cipher->encrypt(c, i, pieces[i]))
        return Status(Errc::invalid_request,
                      "unable to encrypt piece " + std::to_string(i) +
                          " of chunk " + std::to_string(c));
      auto &host = hosts[(c + i) % hosts.size()];
      PieceInfo info;
      info.piece_index = i;
      info.content_hash = host->store(pieces[i]);
      layout.chunks[c][host->id()] = info;
    }
  }
  Logger::instance().log(LogLevel::INFO,
                         "sealed %s: %llu bytes, %llu chunks of %llu bytes, "
                         "%d+%d pieces, %s",
                         name.c_str(), (unsigned long long)layout.size,
                         (unsigned long long)num_chunks,
                         (unsigned long long)cs, erasure_code->min_pieces(),
                         erasure_code->num_pieces() - erasure_code->min_pieces(),
                         cipher_name(cipher->kind()));
  out = std::move(layout);
  return Status();
}

} // namespace piecemeal
