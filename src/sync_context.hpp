#pragma once

#include <cstddef>
#include <set>
#include <string>
#include <unordered_map>

#include "file_meta.hpp"
#include "platform.hpp"
#include "sync_config.hpp"

namespace dotsync {

class Logger;

using TrackedSet = std::set<std::string>;
// Keyed by absolute source path.
using MetaCache = std::unordered_map<std::string, FileMeta>;

// Collaborators shared by every component of a pass. Built once at startup.
struct SyncEnvironment {
  const SyncConfig& config;
  Locker& locker;
  PermissionPolicy& permissions;
  OwnershipFixer& ownership;
  Logger& logger;

  mode_t expected_permissions(mode_t source_mode) const {
    return permissions.calculate_permissions(source_mode, config.umask, config.everyone);
  }
};

struct SyncCounters {
  std::size_t files_copied = 0;
  std::size_t files_collected = 0;
  std::size_t sections_merged = 0;
  std::size_t entries_pruned = 0;
  std::size_t entries_failed = 0;
};

// Outcome of one reconciliation pass. The metadata cache outlives the pass and
// is owned by the engine.
struct SyncContext {
  TrackedSet old_state;
  TrackedSet new_state;
  TrackedSet processed;
  MetaCache* meta_cache = nullptr;
  // Absolute destinations whose last copy failed verification. Owned by the
  // engine; the next pass copies them again even though they look newer.
  TrackedSet* unverified = nullptr;
  bool changed = false;
  bool has_errors = false;
  SyncCounters counters;

  void track(const std::string& rel) {
    processed.insert(rel);
    new_state.insert(rel);
  }

  void fail(const std::string& abs_source) {
    has_errors = true;
    ++counters.entries_failed;
    if(meta_cache) meta_cache->erase(abs_source);
  }
};

} // namespace dotsync
