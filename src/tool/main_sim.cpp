#include "destination.hpp"
#include "downloader.hpp"
#include "host.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <string>
#include <sodium.h>
#include <thread>

using namespace piecemeal;

namespace {

struct SimConfig {
  std::string input;
  std::string output;
  int hosts{0};
  int data_pieces{4};
  int parity_pieces{2};
  uint64_t piece_size{64 * 1024};
  CipherKind cipher{CipherKind::XChaCha20Poly1305};
  std::vector<uint8_t> key;
  uint64_t offset{0};
  uint64_t length{0};
  bool length_set{false};
  int offline{0};
  int corrupt{0};
  int slow{0};
  int slow_ms{200};
  DownloaderConfig dl;
};

void usage() {
  std::cerr
      << "usage: piecemeal-sim --in FILE --out FILE [options]\n"
         "  --data N          data pieces per chunk (4)\n"
         "  --parity N        parity pieces per chunk (2)\n"
         "  --piece-size SZ   piece size, K/M suffixes allowed (64K)\n"
         "  --hosts N         number of hosts (data + parity)\n"
         "  --cipher NAME     xchacha20poly1305 | plaintext\n"
         "  --key HEX         master key (random if omitted)\n"
         "  --offset N        first byte to download (0)\n"
         "  --length N        bytes to download (rest of file)\n"
         "  --offline N       hosts that refuse every fetch (0)\n"
         "  --corrupt N       hosts that serve damaged pieces (0)\n"
         "  --slow N          hosts that answer after --slow-ms (0)\n"
         "  --slow-ms MS      latency of slow hosts (200)\n"
         "  --threads N       io threads\n"
         "  --memory SZ       memory budget (256M)\n"
         "  --overdrive N     extra pieces fetched per chunk (0)\n"
         "  --latency-ms MS   escalate to standby hosts after MS (0: off)\n"
         "  --log-level LVL   trace|debug|info|warn|error (info)\n";
}

bool read_file(const std::string &path, std::vector<uint8_t> &out) {
  std::ifstream in(path, std::ios::binary);
  if (!in)
    return false;
  out.assign(std::istreambuf_iterator<char>(in),
             std::istreambuf_iterator<char>());
  return !in.bad();
}

} // namespace

int main(int argc, char **argv) {
  SimConfig cfg;
  cfg.dl.threads = (int)std::max(2u, std::thread::hardware_concurrency());

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto next = [&](int &i) -> std::string {
      if (i + 1 < argc)
        return std::string(argv[++i]);
      std::cerr << "missing value for " << a << "\n";
      std::exit(1);
    };
    auto next_size = [&](int &i) -> uint64_t {
      std::string v = next(i);
      uint64_t n;
      if (!parse_size(v, n)) {
        std::cerr << "bad value for " << a << ": " << v << "\n";
        std::exit(1);
      }
      return n;
    };
    auto next_int = [&](int &i) -> int {
      uint64_t n = next_size(i);
      if (n > (uint64_t)std::numeric_limits<int>::max()) {
        std::cerr << "value for " << a << " is too large\n";
        std::exit(1);
      }
      return (int)n;
    };
    if (a == "--in")
      cfg.input = next(i);
    else if (a == "--out")
      cfg.output = next(i);
    else if (a == "--data")
      cfg.data_pieces = next_int(i);
    else if (a == "--parity")
      cfg.parity_pieces = next_int(i);
    else if (a == "--piece-size")
      cfg.piece_size = next_size(i);
    else if (a == "--hosts")
      cfg.hosts = next_int(i);
    else if (a == "--cipher") {
      std::string v = next(i);
      if (!parse_cipher_kind(v, cfg.cipher)) {
        std::cerr << "unknown cipher " << v << "\n";
        return 1;
      }
    } else if (a == "--key") {
      cfg.key = hex_to_bytes(next(i));
      if (cfg.key.empty()) {
        std::cerr << "--key must be a non-empty hex string\n";
        return 1;
      }
    } else if (a == "--offset")
      cfg.offset = next_size(i);
    else if (a == "--length") {
      cfg.length = next_size(i);
      cfg.length_set = true;
    } else if (a == "--offline")
      cfg.offline = next_int(i);
    else if (a == "--corrupt")
      cfg.corrupt = next_int(i);
    else if (a == "--slow")
      cfg.slow = next_int(i);
    else if (a == "--slow-ms")
      cfg.slow_ms = next_int(i);
    else if (a == "--threads")
      cfg.dl.threads = next_int(i);
    else if (a == "--memory")
      cfg.dl.memory_budget = next_size(i);
    else if (a == "--overdrive")
      cfg.dl.overdrive = next_int(i);
    else if (a == "--latency-ms")
      cfg.dl.latency_target = std::chrono::milliseconds(next_int(i));
    else if (a == "--log-level")
      Logger::instance().set_level(
          parse_log_level(next(i), LogLevel::INFO));
    else if (a == "-h" || a == "--help") {
      usage();
      return 0;
    } else {
      std::cerr << "unknown option " << a << "\n";
      usage();
      return 1;
    }
  }

  if (cfg.input.empty() || cfg.output.empty()) {
    usage();
    return 1;
  }
  if (!crypto_init()) {
    std::cerr << "libsodium unavailable" << std::endl;
    return 1;
  }

  std::vector<uint8_t> data;
  if (!read_file(cfg.input, data)) {
    std::cerr << "cannot read " << cfg.input << std::endl;
    return 1;
  }
  if (!cfg.length_set)
    cfg.length = cfg.offset < data.size() ? data.size() - cfg.offset : 0;

  if (cfg.key.empty()) {
    cfg.key.resize(32);
    randombytes_buf(cfg.key.data(), cfg.key.size());
  }

  std::shared_ptr<const ErasureCoder> coder;
  try {
    coder = std::make_shared<ReedSolomonCoder>(cfg.data_pieces,
                                               cfg.parity_pieces);
  } catch (const std::invalid_argument &e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }
  std::shared_ptr<const PieceCipher> cipher =
      make_piece_cipher(cfg.cipher, cfg.key);

  int host_count = std::max(cfg.hosts, coder->num_pieces());
  std::vector<std::shared_ptr<MemoryHost>> hosts;
  std::vector<std::shared_ptr<PieceHost>> piece_hosts;
  for (int i = 0; i < host_count; i++) {
    char id[32];
    std::snprintf(id, sizeof(id), "host-%02d", i);
    hosts.push_back(std::make_shared<MemoryHost>(id));
    piece_hosts.push_back(hosts.back());
  }

  FileLayout layout;
  Status st = seal_file(cfg.input, data, cfg.piece_size, coder, cipher,
                        piece_hosts, layout);
  if (!st.ok()) {
    std::cerr << "seal failed: " << st.message() << std::endl;
    return 1;
  }

  int h = 0;
  for (int i = 0; i < cfg.offline && h < host_count; i++)
    hosts[h++]->set_offline(true);
  for (int i = 0; i < cfg.corrupt && h < host_count; i++)
    hosts[h++]->set_corrupt(true);
  for (int i = 0; i < cfg.slow && h < host_count; i++)
    hosts[h++]->set_latency(std::chrono::milliseconds(cfg.slow_ms));

  std::unique_ptr<FileDestination> file_dest;
  std::error_code ec = FileDestination::open(cfg.output, file_dest);
  if (ec) {
    std::cerr << "cannot open " << cfg.output << ": " << ec.message()
              << std::endl;
    return 1;
  }

  Downloader dl(cfg.dl);
  for (auto &p : piece_hosts)
    dl.add_host(p);
  dl.start();

  DownloadRequest req;
  req.offset = cfg.offset;
  req.length = cfg.length;
  req.destination = std::shared_ptr<DownloadDestination>(std::move(file_dest));
  std::shared_ptr<Download> d;
  st = dl.download(layout, req, d);
  if (d)
    d->wait();
  dl.stop();
  if (st.ok() && d)
    st = d->error();
  if (!st.ok()) {
    std::cerr << "download failed: " << st.message() << std::endl;
    return 2;
  }

  std::vector<uint8_t> written;
  if (!read_file(cfg.output, written) || written.size() != cfg.length ||
      !std::equal(written.begin(), written.end(),
                  data.begin() + (std::ptrdiff_t)cfg.offset)) {
    std::cerr << "output does not match input range" << std::endl;
    return 3;
  }

  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                d->end_time() - d->start_time())
                .count();
  std::cout << "downloaded " << d->bytes_received() << " bytes of "
            << cfg.input << " in " << ms << " ms (" << host_count
            << " hosts, " << coder->min_pieces() << "+"
            << coder->num_pieces() - coder->min_pieces() << " pieces, "
            << cipher_name(cipher->kind()) << ")" << std::endl;
  for (auto &w : dl.workers())
    Logger::instance().log(LogLevel::DEBUG, "%s: %zu fetched, %zu failed",
                           w->host_id().c_str(), w->pieces_fetched(),
                           w->fetch_failures());
  return 0;
}
