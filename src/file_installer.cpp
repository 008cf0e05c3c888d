#include "file_installer.hpp"

#include <cstring>
#include <vector>

#include "log.hpp"
#include "sync_context.hpp"

namespace dotsync {

namespace {

constexpr std::size_t kChunkSize = 64 * 1024;

// Fills `buffer` unless EOF comes first.
std::size_t read_full(FileHandle& file, char* buffer, std::size_t size) {
  std::size_t total = 0;
  while(total < size) {
    ssize_t n = file.read(buffer + total, size - total);
    if(n == 0) break;
    total += static_cast<std::size_t>(n);
  }
  return total;
}

} // namespace

bool same_content(FileHandle& a, FileHandle& b) {
  std::vector<char> left(kChunkSize);
  std::vector<char> right(kChunkSize);
  for(;;) {
    std::size_t n1 = read_full(a, left.data(), left.size());
    std::size_t n2 = read_full(b, right.data(), right.size());
    if(n1 != n2) return false;
    if(n1 == 0) return true;
    if(std::memcmp(left.data(), right.data(), n1) != 0) return false;
  }
}

FileInstaller::FileInstaller(SyncEnvironment& env) : env_(env) {}

bool FileInstaller::install(const std::filesystem::path& source,
                            const std::filesystem::path& dest,
                            const FileMeta& source_meta,
                            mode_t perms) {
  env_.logger.debug("Installing file src={} dst={}", source.string(), dest.string());

  FileHandle src(source, O_RDONLY);
  env_.locker.lock(src.fd(), false);

  FileHandle dst(dest, O_WRONLY | O_CREAT, perms);
  env_.locker.lock(dst.fd(), true);
  dst.truncate(0);

  char buffer[kChunkSize];
  for(;;) {
    ssize_t n = src.read(buffer, sizeof(buffer));
    if(n == 0) break;
    dst.write_all(buffer, static_cast<std::size_t>(n));
  }
  dst.chmod(perms);
  dst.close();

  try {
    set_mtime(dest, source_meta.mtime);
  } catch(const std::system_error& e) {
    env_.logger.warn("Failed to set mtime path={} err={}", dest.string(), e.what());
  }

  return verify(src, dest);
}

bool FileInstaller::verify(FileHandle& source, const std::filesystem::path& dest) {
  source.seek(0, SEEK_SET);
  FileHandle dst(dest, O_RDONLY);
  env_.locker.lock(dst.fd(), false);
  if(same_content(source, dst)) {
    return true;
  }

  env_.logger.warn("Content mismatch detected. Updating mtime to force sync. path={}", dest.string());
  touch_now(dest);
  return false;
}

} // namespace dotsync
