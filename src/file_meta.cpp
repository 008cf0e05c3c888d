#include "file_meta.hpp"

#include <fcntl.h>

#include <cerrno>

namespace dotsync {

FileMeta FileMeta::from_stat(const struct stat& st) {
  FileMeta meta;
  meta.mtime = st.st_mtim;
  meta.size = st.st_size;
  meta.mode = st.st_mode;
  return meta;
}

bool FileMeta::same_mtime(const FileMeta& other) const {
  return mtime.tv_sec == other.mtime.tv_sec && mtime.tv_nsec == other.mtime.tv_nsec;
}

bool FileMeta::newer_than(const FileMeta& other) const {
  if(mtime.tv_sec != other.mtime.tv_sec) return mtime.tv_sec > other.mtime.tv_sec;
  return mtime.tv_nsec > other.mtime.tv_nsec;
}

std::optional<FileMeta> stat_path(const std::filesystem::path& path, bool follow_links,
                                  std::error_code& ec) {
  struct stat st{};
  int rc = follow_links ? ::stat(path.c_str(), &st) : ::lstat(path.c_str(), &st);
  if(rc == -1) {
    ec.assign(errno, std::system_category());
    return std::nullopt;
  }
  ec.clear();
  return FileMeta::from_stat(st);
}

void set_mtime(const std::filesystem::path& path, const timespec& mtime) {
  timespec times[2] = {mtime, mtime};
  if(::utimensat(AT_FDCWD, path.c_str(), times, 0) == -1) {
    throw std::system_error(errno, std::system_category(), "set mtime " + path.string());
  }
}

void touch_now(const std::filesystem::path& path) {
  if(::utimensat(AT_FDCWD, path.c_str(), nullptr, 0) == -1) {
    throw std::system_error(errno, std::system_category(), "touch " + path.string());
  }
}

} // namespace dotsync
