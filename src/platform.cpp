#include "platform.hpp"

#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <system_error>

#include "log.hpp"

namespace dotsync {

namespace {

// A directory that cannot be read is reported and skipped; its siblings are
// still visited. Directory symlinks are not followed.
void add_exec_bits(const std::filesystem::path& dir, mode_t target_bits, Logger& logger) {
  namespace fs = std::filesystem;
  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if(ec) {
    logger.warn("Error scanning bindir {}: {}", dir.string(), ec.message());
    return;
  }
  for(; it != fs::directory_iterator(); it.increment(ec)) {
    if(ec) {
      logger.warn("Error scanning bindir {}: {}", dir.string(), ec.message());
      return;
    }
    const auto& path = it->path();
    struct stat st{};
    if(::lstat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode)) {
      add_exec_bits(path, target_bits, logger);
      continue;
    }
    if(::stat(path.c_str(), &st) == -1 || !S_ISREG(st.st_mode)) continue;
    if((st.st_mode & target_bits) == target_bits) continue;
    if(::chmod(path.c_str(), (st.st_mode & 07777) | target_bits) == -1) {
      logger.warn("Failed to set exec bit path={} err={}", path.string(),
                  std::error_code(errno, std::system_category()).message());
    } else {
      logger.debug("Set exec bits path={}", path.string());
    }
  }
}

} // namespace

void PosixPlatform::lock(int fd, bool exclusive) {
  const int how = exclusive ? LOCK_EX : LOCK_SH;
  while(::flock(fd, how) == -1) {
    if(errno == EINTR) continue;
    throw std::system_error(errno, std::system_category(),
                            exclusive ? "exclusive lock" : "shared lock");
  }
}

mode_t PosixPlatform::calculate_permissions(mode_t source_mode, mode_t umask, bool everyone) const {
  if(!everyone) {
    return source_mode & 0777 & ~umask;
  }
  mode_t bits = 0444;
  if(source_mode & S_IWUSR) bits |= 0222;
  if(source_mode & S_IXUSR) bits |= 0111;
  return bits & ~umask;
}

void PosixPlatform::ensure_executable_bits(const std::filesystem::path& dir, mode_t umask, Logger& logger) {
  const mode_t target_bits = 0111 & ~umask;
  if(target_bits == 0) return;

  std::error_code ec;
  if(!std::filesystem::is_directory(dir, ec)) return;
  add_exec_bits(dir, target_bits, logger);
}

void PosixPlatform::ensure_ownership(int fd, const std::filesystem::path& reference_dir, Logger& logger) {
  if(::geteuid() != 0) return;
  struct stat st{};
  if(::stat(reference_dir.c_str(), &st) == -1) return;
  if(::fchown(fd, st.st_uid, st.st_gid) == -1) {
    logger.debug("Unable to transfer ownership to {}:{} err={}", st.st_uid, st.st_gid,
                 std::error_code(errno, std::system_category()).message());
  }
}

mode_t apply_process_umask(std::optional<mode_t> mask) {
  if(mask) {
    ::umask(*mask & 0777);
    return *mask & 0777;
  }
  mode_t current = ::umask(0);
  ::umask(current);
  return current;
}

} // namespace dotsync
