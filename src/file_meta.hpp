#pragma once

#include <sys/stat.h>
#include <sys/types.h>

#include <ctime>
#include <filesystem>
#include <optional>
#include <system_error>

namespace dotsync {

// Snapshot of one filesystem entry. `mode` keeps the file-type bits so the
// same record can tell directories, symlinks and regular files apart.
struct FileMeta {
  timespec mtime{};
  off_t size = 0;
  mode_t mode = 0;

  static FileMeta from_stat(const struct stat& st);

  mode_t permissions() const { return mode & 07777; }
  bool is_directory() const { return S_ISDIR(mode); }
  bool is_regular() const { return S_ISREG(mode); }
  bool is_symlink() const { return S_ISLNK(mode); }

  bool same_mtime(const FileMeta& other) const;
  bool newer_than(const FileMeta& other) const;

  bool operator==(const FileMeta& other) const {
    return same_mtime(other) && size == other.size && mode == other.mode;
  }
  bool operator!=(const FileMeta& other) const { return !(*this == other); }
};

// stat(2) or lstat(2). A missing entry yields std::nullopt with `ec` set to
// ENOENT; any other failure also sets `ec`.
std::optional<FileMeta> stat_path(const std::filesystem::path& path, bool follow_links,
                                  std::error_code& ec);

// Sets access and modification time on `path` (following links).
void set_mtime(const std::filesystem::path& path, const timespec& mtime);
void touch_now(const std::filesystem::path& path);

} // namespace dotsync
