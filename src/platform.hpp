#pragma once

#include <sys/types.h>

#include <filesystem>
#include <optional>

namespace dotsync {

class Logger;

// Advisory whole-file lock on an open descriptor. Blocks until granted; the
// lock is released when the descriptor is closed.
class Locker {
public:
  virtual ~Locker() = default;
  virtual void lock(int fd, bool exclusive) = 0;
};

class PermissionPolicy {
public:
  virtual ~PermissionPolicy() = default;

  virtual mode_t calculate_permissions(mode_t source_mode, mode_t umask, bool everyone) const = 0;
  // Adds the umask-allowed exec bits to every file under `dir`. Never removes bits.
  virtual void ensure_executable_bits(const std::filesystem::path& dir, mode_t umask, Logger& logger) = 0;
};

class OwnershipFixer {
public:
  virtual ~OwnershipFixer() = default;
  // Best effort: hand `fd` to the owner of `reference_dir` when privileged.
  virtual void ensure_ownership(int fd, const std::filesystem::path& reference_dir, Logger& logger) = 0;
};

class PosixPlatform : public Locker, public PermissionPolicy, public OwnershipFixer {
public:
  void lock(int fd, bool exclusive) override;
  mode_t calculate_permissions(mode_t source_mode, mode_t umask, bool everyone) const override;
  void ensure_executable_bits(const std::filesystem::path& dir, mode_t umask, Logger& logger) override;
  void ensure_ownership(int fd, const std::filesystem::path& reference_dir, Logger& logger) override;
};

// Applies `mask` as the process umask and returns it. With no mask the current
// umask is read and left unchanged.
mode_t apply_process_umask(std::optional<mode_t> mask);

} // namespace dotsync
