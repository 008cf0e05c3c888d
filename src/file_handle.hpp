#pragma once

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <filesystem>
#include <string>
#include <system_error>

namespace dotsync {

// Owning wrapper around a POSIX descriptor. Every failing call throws
// std::system_error carrying errno.
class FileHandle {
public:
  FileHandle() = default;

  explicit FileHandle(int fd) : fd_(fd) {
    if(fd_ == -1) {
      throw std::system_error(errno, std::system_category(), "Invalid file descriptor");
    }
  }

  FileHandle(const std::filesystem::path& path, int flags, mode_t mode = 0)
    : path_(path) {
    fd_ = open_retry(path, flags, mode);
    if(fd_ == -1) {
      throw std::system_error(errno, std::system_category(), "open " + path.string());
    }
  }

  // Non-throwing open: returns an invalid handle and sets `ec` on failure.
  static FileHandle try_open(const std::filesystem::path& path, int flags, mode_t mode,
                             std::error_code& ec) {
    FileHandle handle;
    handle.path_ = path;
    handle.fd_ = open_retry(path, flags, mode);
    if(handle.fd_ == -1) {
      ec.assign(errno, std::system_category());
    } else {
      ec.clear();
    }
    return handle;
  }

  ~FileHandle() {
    if(fd_ != -1) {
      ::close(fd_);
    }
  }

  FileHandle(const FileHandle&) = delete;
  FileHandle& operator=(const FileHandle&) = delete;

  FileHandle(FileHandle&& other) noexcept
    : fd_(other.fd_), path_(std::move(other.path_)) {
    other.fd_ = -1;
  }

  FileHandle& operator=(FileHandle&& other) noexcept {
    if(this != &other) {
      if(fd_ != -1) {
        ::close(fd_);
      }
      fd_ = other.fd_;
      path_ = std::move(other.path_);
      other.fd_ = -1;
    }
    return *this;
  }

  int fd() const { return fd_; }
  bool is_valid() const { return fd_ != -1; }
  const std::filesystem::path& path() const { return path_; }

  ssize_t read(void* buffer, size_t size) {
    for(;;) {
      ssize_t result = ::read(fd_, buffer, size);
      if(result >= 0) return result;
      if(errno == EINTR) continue;
      throw std::system_error(errno, std::system_category(), "read " + path_.string());
    }
  }

  // Reads until EOF from the current offset.
  std::string read_all() {
    std::string out;
    char buffer[64 * 1024];
    for(;;) {
      ssize_t n = read(buffer, sizeof(buffer));
      if(n == 0) break;
      out.append(buffer, static_cast<std::size_t>(n));
    }
    return out;
  }

  void write_all(const void* data, size_t size) {
    const char* cursor = static_cast<const char*>(data);
    while(size > 0) {
      ssize_t written = ::write(fd_, cursor, size);
      if(written < 0) {
        if(errno == EINTR) continue;
        throw std::system_error(errno, std::system_category(), "write " + path_.string());
      }
      cursor += written;
      size -= static_cast<size_t>(written);
    }
  }

  void write_all(const std::string& data) {
    write_all(data.data(), data.size());
  }

  off_t seek(off_t offset, int whence) {
    off_t result = ::lseek(fd_, offset, whence);
    if(result == -1) {
      throw std::system_error(errno, std::system_category(), "seek " + path_.string());
    }
    return result;
  }

  void truncate(off_t length) {
    if(::ftruncate(fd_, length) == -1) {
      throw std::system_error(errno, std::system_category(), "truncate " + path_.string());
    }
  }

  // Replaces the whole content: truncate, rewind, write.
  void rewrite(const std::string& data) {
    truncate(0);
    seek(0, SEEK_SET);
    write_all(data);
  }

  void chmod(mode_t mode) {
    if(::fchmod(fd_, mode) == -1) {
      throw std::system_error(errno, std::system_category(), "chmod " + path_.string());
    }
  }

  struct stat stat() const {
    struct stat st{};
    if(::fstat(fd_, &st) == -1) {
      throw std::system_error(errno, std::system_category(), "stat " + path_.string());
    }
    return st;
  }

  void sync() {
    if(::fsync(fd_) == -1) {
      throw std::system_error(errno, std::system_category(), "fsync " + path_.string());
    }
  }

  // Explicit close so that errors reported by close(2) are not lost. Closing
  // also releases any flock held through this descriptor.
  void close() {
    if(fd_ == -1) return;
    int fd = fd_;
    fd_ = -1;
    if(::close(fd) == -1 && errno != EINTR) {
      throw std::system_error(errno, std::system_category(), "close " + path_.string());
    }
  }

private:
  static int open_retry(const std::filesystem::path& path, int flags, mode_t mode) {
    for(;;) {
      int fd = ::open(path.c_str(), flags | O_CLOEXEC, mode);
      if(fd != -1 || errno != EINTR) return fd;
    }
  }

  int fd_ = -1;
  std::filesystem::path path_;
};

} // namespace dotsync
