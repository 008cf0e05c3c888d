#pragma once

#include <condition_variable>
#include <mutex>

#include "state_store.hpp"
#include "sync_context.hpp"

namespace dotsync {

struct PassResult {
  bool fatal = false;
  bool changed = false;
  bool has_errors = false;
  SyncCounters counters;
};

// Runs reconciliation passes, once or as a watch loop. The loop sleeps on a
// condition variable between passes; stop() ends the sleep early but never
// interrupts a pass in progress.
class SyncEngine {
public:
  explicit SyncEngine(SyncEnvironment& env);

  // Exit code: 1 when a single-shot pass was fatal, 0 otherwise.
  int run();
  PassResult run_pass();
  void stop();
  bool stop_requested() const;

  // Counts one sleep. Drops the metadata cache every
  // `full_scan_iterations` calls and returns true when it did.
  bool advance_iteration();

  int iteration() const { return iteration_; }
  std::size_t meta_cache_size() const { return meta_cache_.size(); }
  std::size_t unverified_count() const { return unverified_.size(); }

private:
  // Returns true when stop was requested during the wait.
  bool wait_interval();

  SyncEnvironment& env_;
  StateStore state_store_;
  MetaCache meta_cache_;
  TrackedSet unverified_;
  int iteration_ = 0;

  mutable std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  bool stop_requested_ = false;
};

} // namespace dotsync
