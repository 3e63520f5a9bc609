#include "errors.hpp"

namespace piecemeal {

namespace {

class PiecemealCategory : public std::error_category {
public:
  const char *name() const noexcept override { return "piecemeal"; }

  std::string message(int ev) const override {
    switch (static_cast<Errc>(ev)) {
    case Errc::ok:
      return "success";
    case Errc::decrypt_failed:
      return "piece decryption failed";
    case Errc::recovery_failed:
      return "erasure recovery failed";
    case Errc::write_failed:
      return "destination write failed";
    case Errc::insufficient_pieces:
      return "not enough pieces available to recover chunk";
    case Errc::close_failed:
      return "destination close failed";
    case Errc::invalid_request:
      return "invalid download request";
    case Errc::insufficient_memory:
      return "request exceeds memory budget";
    }
    return "unknown error";
  }
};

} // namespace

const std::error_category &error_category() {
  static PiecemealCategory cat;
  return cat;
}

std::error_code make_error_code(Errc e) {
  return std::error_code(static_cast<int>(e), error_category());
}

Status::Status(std::error_code code, std::string message)
    : code_(code), message_(std::move(message)) {
  if (code_ && message_.empty())
    message_ = code_.message();
}

Status::Status(Errc code, std::string message)
    : Status(make_error_code(code), std::move(message)) {}

Status Status::with_context(const std::string &context) const {
  if (ok())
    return *this;
  return Status(code_, context + ": " + message_);
}

} // namespace piecemeal
