#include "sync_engine.hpp"

#include "log.hpp"
#include "sync_pass.hpp"

namespace dotsync {

SyncEngine::SyncEngine(SyncEnvironment& env)
  : env_(env), state_store_(env.locker, env.logger) {}

int SyncEngine::run() {
  if(!env_.config.watch) {
    return run_pass().fatal ? 1 : 0;
  }

  env_.logger.info("Watching src={} dst={} interval={}ms", env_.config.source_root.string(),
                   env_.config.dest_root.string(), env_.config.interval.count());
  while(!stop_requested()) {
    run_pass();
    if(wait_interval()) break;
    advance_iteration();
  }
  env_.logger.info("Watch loop stopped");
  return 0;
}

PassResult SyncEngine::run_pass() {
  PassResult result;
  const auto& config = env_.config;
  env_.logger.debug("Starting sync iteration");

  // Held for the whole pass so that concurrent instances never interleave.
  FileHandle state_file;
  try {
    state_file = state_store_.open_and_lock(config.state_file());
  } catch(const std::exception& e) {
    env_.logger.error("Error accessing state file err={}", e.what());
    result.fatal = true;
    return result;
  }

  env_.ownership.ensure_ownership(state_file.fd(), config.source_root, env_.logger);

  TrackedSet old_state;
  try {
    old_state = state_store_.load(state_file);
  } catch(const std::exception& e) {
    env_.logger.warn("Failed to parse state file, assuming empty state err={}", e.what());
  }

  for(const auto& dir : config.bin_dirs) {
    env_.permissions.ensure_executable_bits(config.source_root / dir, config.umask, env_.logger);
  }

  SyncContext ctx;
  ctx.old_state = std::move(old_state);
  ctx.meta_cache = &meta_cache_;
  ctx.unverified = &unverified_;
  try {
    SyncPass(env_, ctx).run();
  } catch(const FatalSyncError& e) {
    env_.logger.error("Sync error err={}", e.what());
    result.fatal = true;
    return result;
  }

  // The state cache is not refreshed here; the new mtime forces a re-read.
  if(ctx.changed) {
    try {
      state_store_.save(state_file, ctx.new_state);
    } catch(const std::exception& e) {
      env_.logger.error("Error saving state err={}", e.what());
      ctx.has_errors = true;
    }
  }

  try {
    state_file.close();
  } catch(const std::system_error& e) {
    env_.logger.warn("Closing state file failed err={}", e.what());
  }

  result.changed = ctx.changed;
  result.has_errors = ctx.has_errors;
  result.counters = ctx.counters;
  env_.logger.debug("Sync pass complete changed={} errors={} copied={} collected={} sections={} pruned={} failed={}",
                    result.changed, result.has_errors, result.counters.files_copied,
                    result.counters.files_collected, result.counters.sections_merged,
                    result.counters.entries_pruned, result.counters.entries_failed);
  return result;
}

void SyncEngine::stop() {
  {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    stop_requested_ = true;
  }
  stop_cv_.notify_all();
}

bool SyncEngine::stop_requested() const {
  std::lock_guard<std::mutex> lock(stop_mutex_);
  return stop_requested_;
}

bool SyncEngine::advance_iteration() {
  ++iteration_;
  if(iteration_ < env_.config.full_scan_iterations) return false;
  env_.logger.debug("Clearing metadata cache for periodic full scan");
  meta_cache_.clear();
  iteration_ = 0;
  return true;
}

bool SyncEngine::wait_interval() {
  std::unique_lock<std::mutex> lock(stop_mutex_);
  stop_cv_.wait_for(lock, env_.config.interval, [this]{ return stop_requested_; });
  return stop_requested_;
}

} // namespace dotsync
