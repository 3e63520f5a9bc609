#pragma once
#include <string>
#include <system_error>

namespace piecemeal {

enum class Errc {
    ok = 0,
    decrypt_failed,
    recovery_failed,
    write_failed,
    insufficient_pieces,
    close_failed,
    invalid_request,
    insufficient_memory
};

const std::error_category& error_category();
std::error_code make_error_code(Errc e);

// An error code plus a human readable message with context prepended by
// each layer it passes through ("unable to recover chunk: ...").
class Status {
public:
    Status() = default;
    Status(std::error_code code, std::string message);
    Status(Errc code, std::string message);

    bool ok() const { return !code_; }
    const std::error_code& code() const { return code_; }
    const std::string& message() const { return message_; }

    Status with_context(const std::string& context) const;

private:
    std::error_code code_;
    std::string message_;
};

} // namespace piecemeal

namespace std {
template <> struct is_error_code_enum<piecemeal::Errc> : true_type {};
} // namespace std
