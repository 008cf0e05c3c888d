#include "pruner.hpp"

#include <cerrno>
#include <cstdio>
#include <system_error>

#include "log.hpp"
#include "section_merge.hpp"
#include "sync_context.hpp"

namespace dotsync {

Pruner::Pruner(SyncEnvironment& env, SectionMerger& merger)
  : env_(env), merger_(merger) {}

void Pruner::prune(SyncContext& ctx) {
  for(const auto& rel : ctx.old_state) {
    if(ctx.processed.count(rel)) continue;

    if(auto section = match_section_path(rel)) {
      prune_section(ctx, rel, section->target, section->name);
    } else {
      prune_file(ctx, rel);
    }
  }
}

void Pruner::prune_section(SyncContext& ctx, const std::string& rel, const std::string& target,
                           const std::string& name) {
  auto target_path = env_.config.dest_root / target;
  try {
    if(merger_.remove(target_path, name)) {
      env_.logger.debug("Removed orphaned section section={} target={}", name, target_path.string());
      ctx.changed = true;
      ++ctx.counters.entries_pruned;
    } else {
      // The entry still has to leave the state file, or a block written
      // later under the same name would be taken for ours.
      env_.logger.debug("Orphaned section already gone; state matches desired section={} target={}",
                        name, target_path.string());
      ctx.changed = true;
    }
  } catch(const std::exception& e) {
    env_.logger.error("Failed to remove section section={} target={} err={}", name, target_path.string(), e.what());
    ctx.has_errors = true;
    ++ctx.counters.entries_failed;
    ctx.new_state.insert(rel);
  }
}

void Pruner::prune_file(SyncContext& ctx, const std::string& rel) {
  auto target_path = env_.config.dest_root / rel;
  if(ctx.unverified) ctx.unverified->erase(target_path.string());
  // remove(3) also takes away an empty directory left where the file was.
  if(std::remove(target_path.c_str()) == 0) {
    env_.logger.debug("Removed orphaned file file={}", target_path.string());
    ctx.changed = true;
    ++ctx.counters.entries_pruned;
    return;
  }
  const int err = errno;
  if(err == ENOENT) {
    env_.logger.debug("Orphaned file already gone; state matches desired file={}", target_path.string());
    ctx.changed = true;
    return;
  }
  env_.logger.error("Failed to remove orphaned file file={} err={}", target_path.string(),
                    std::error_code(err, std::system_category()).message());
  ctx.has_errors = true;
  ++ctx.counters.entries_failed;
  ctx.new_state.insert(rel);
}

} // namespace dotsync
