#include "destination.hpp"
#include "logging.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <unistd.h>

namespace piecemeal {

std::error_code FileDestination::open(const std::string &path,
                                      std::unique_ptr<FileDestination> &out) {
  int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0)
    return std::error_code(errno, std::system_category());
  out = std::make_unique<FileDestination>(path, fd);
  return {};
}

FileDestination::~FileDestination() {
  if (fd_ >= 0) {
    Logger::instance().log(LogLevel::WARN,
                           "file destination %s destroyed without close",
                           path_.c_str());
    ::close(fd_);
  }
}

std::error_code FileDestination::write_at(const uint8_t *data, size_t len,
                                          int64_t offset) {
  std::shared_lock<std::shared_mutex> lk(mtx_);
  if (fd_ < 0)
    return std::make_error_code(std::errc::bad_file_descriptor);
  if (offset < 0)
    return std::make_error_code(std::errc::invalid_argument);
  size_t done = 0;
  while (done < len) {
    ssize_t n = ::pwrite(fd_, data + done, len - done, (off_t)(offset + done));
    if (n < 0) {
      if (errno == EINTR)
        continue;
      return std::error_code(errno, std::system_category());
    }
    done += (size_t)n;
  }
  return {};
}

std::error_code FileDestination::close() {
  std::unique_lock<std::shared_mutex> lk(mtx_);
  if (fd_ < 0)
    return std::make_error_code(std::errc::bad_file_descriptor);
  std::error_code ec;
  if (::fsync(fd_) != 0)
    ec = std::error_code(errno, std::system_category());
  if (::close(fd_) != 0 && !ec)
    ec = std::error_code(errno, std::system_category());
  fd_ = -1;
  return ec;
}

std::error_code BufferDestination::write_at(const uint8_t *data, size_t len,
                                            int64_t offset) {
  std::lock_guard<std::mutex> lk(mtx_);
  if (closed_)
    return std::make_error_code(std::errc::bad_file_descriptor);
  if (offset < 0)
    return std::make_error_code(std::errc::invalid_argument);
  size_t end = (size_t)offset + len;
  if (buf_.size() < end)
    buf_.resize(end, 0);
  if (len)
    std::memcpy(buf_.data() + offset, data, len);
  return {};
}

std::error_code BufferDestination::close() {
  std::lock_guard<std::mutex> lk(mtx_);
  if (closed_)
    return std::make_error_code(std::errc::bad_file_descriptor);
  closed_ = true;
  return {};
}

std::vector<uint8_t> BufferDestination::bytes() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return buf_;
}

bool BufferDestination::closed() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return closed_;
}

} // namespace piecemeal
