#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <system_error>
#include <vector>

namespace piecemeal {

// Sink for recovered data. write_at must tolerate concurrent calls at
// disjoint offsets; close is called once, after the last write.
class DownloadDestination {
public:
    virtual ~DownloadDestination() = default;
    virtual std::error_code write_at(const uint8_t* data, size_t len, int64_t offset) = 0;
    virtual std::error_code close() = 0;
    virtual const char* type() const = 0;
};

class FileDestination : public DownloadDestination {
public:
    // Opens (creating or truncating) `path` for writing.
    static std::error_code open(const std::string& path, std::unique_ptr<FileDestination>& out);
    // Takes ownership of an open, writable descriptor.
    FileDestination(std::string path, int fd) : path_(std::move(path)), fd_(fd) {}
    ~FileDestination() override;
    FileDestination(const FileDestination&) = delete;
    FileDestination& operator=(const FileDestination&) = delete;

    std::error_code write_at(const uint8_t* data, size_t len, int64_t offset) override;
    std::error_code close() override;
    const char* type() const override { return "file"; }
    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::shared_mutex mtx_;
    int fd_;
};

// Collects the download in memory; grows to fit the highest write.
class BufferDestination : public DownloadDestination {
public:
    BufferDestination() = default;
    explicit BufferDestination(size_t expected_size) { buf_.reserve(expected_size); }

    std::error_code write_at(const uint8_t* data, size_t len, int64_t offset) override;
    std::error_code close() override;
    const char* type() const override { return "buffer"; }

    std::vector<uint8_t> bytes() const;
    bool closed() const;

private:
    mutable std::mutex mtx_;
    std::vector<uint8_t> buf_;
    bool closed_{false};
};

} // namespace piecemeal
