#pragma once

#include <filesystem>
#include <optional>

#include "file_handle.hpp"
#include "file_meta.hpp"
#include "sync_context.hpp"

namespace dotsync {

class Locker;
class Logger;

// Persistent set of synchronized relative paths. One path per line, sorted.
// The parsed set is cached and reused for as long as the file's own mtime and
// size stay the same.
class StateStore {
public:
  StateStore(Locker& locker, Logger& logger);

  // Opens (creating with 0666 before umask) and exclusively locks the state
  // file. The lock lives as long as the returned handle.
  FileHandle open_and_lock(const std::filesystem::path& path);

  // On failure the cache is dropped and the error is rethrown.
  TrackedSet load(FileHandle& file);
  void save(FileHandle& file, const TrackedSet& state);

  void invalidate() { cached_.reset(); }
  bool last_load_cached() const { return last_load_cached_; }

  static TrackedSet parse(const std::string& content);
  static std::string serialize(const TrackedSet& state);

private:
  Locker& locker_;
  Logger& logger_;
  std::optional<TrackedSet> cached_;
  FileMeta cached_meta_;
  bool last_load_cached_ = false;
};

} // namespace dotsync
