#include "file_reconciler.hpp"

#include <unistd.h>

#include <cerrno>
#include <stdexcept>
#include <system_error>

#include "file_installer.hpp"
#include "log.hpp"
#include "sync_context.hpp"

namespace dotsync {

const char* to_string(ReconcileAction action) {
  switch(action) {
    case ReconcileAction::None: return "none";
    case ReconcileAction::Copy: return "copy";
    case ReconcileAction::Collect: return "collect";
    case ReconcileAction::SkipNewer: return "skip-newer";
  }
  return "unknown";
}

FileReconciler::FileReconciler(SyncEnvironment& env, FileInstaller& installer)
  : env_(env), installer_(installer) {}

ReconcilePlan FileReconciler::plan(const std::filesystem::path& source,
                                   const std::filesystem::path& dest,
                                   const FileMeta& source_meta,
                                   bool ignore_newer) {
  ReconcilePlan plan;

  // Staleness is judged on the link target, before any lock is taken.
  std::error_code ec;
  auto followed = stat_path(dest, true, ec);
  if(!ignore_newer && followed && followed->is_regular() && followed->newer_than(source_meta)) {
    if(env_.config.collect) {
      env_.logger.debug("Destination is newer, collecting src={} dst={}", source.string(), dest.string());
      plan.action = ReconcileAction::Collect;
      plan.perms = source_meta.permissions() & 0777;
      plan.dest_meta = *followed;
      return plan;
    }
    if(!env_.config.force) {
      env_.logger.warn("Destination is newer than source, skipping path={}", dest.string());
      plan.action = ReconcileAction::SkipNewer;
      return plan;
    }
  }

  plan.perms = env_.expected_permissions(source_meta.mode);
  if(needs_update(dest, source_meta, plan.perms)) {
    plan.action = ReconcileAction::Copy;
  }
  return plan;
}

bool FileReconciler::apply(const ReconcilePlan& plan,
                           const std::filesystem::path& source,
                           const std::filesystem::path& dest,
                           const FileMeta& source_meta) {
  switch(plan.action) {
    case ReconcileAction::Copy:
      return installer_.install(source, dest, source_meta, plan.perms);
    case ReconcileAction::Collect:
      env_.logger.info("Collecting file src={} dst={}", dest.string(), source.string());
      return installer_.install(dest, source, plan.dest_meta, plan.perms);
    case ReconcileAction::None:
    case ReconcileAction::SkipNewer:
      break;
  }
  return true;
}

bool FileReconciler::needs_update(const std::filesystem::path& dest, const FileMeta& source_meta, mode_t perms) {
  std::error_code ec;
  auto current = stat_path(dest, false, ec);
  if(!current) {
    if(ec == std::errc::no_such_file_or_directory) return true;
    throw std::system_error(ec, "stat " + dest.string());
  }

  // Writing through a link would modify whatever it points at.
  if(current->is_symlink()) {
    if(::unlink(dest.c_str()) == -1) {
      throw std::system_error(errno, std::system_category(), "removing destination symlink " + dest.string());
    }
    env_.logger.debug("Removed destination symlink path={}", dest.string());
    return true;
  }

  if(current->is_directory()) {
    throw std::runtime_error("conflict: src is file, dst is dir: " + dest.string());
  }

  return current->size != source_meta.size ||
         !current->same_mtime(source_meta) ||
         (current->permissions() & 0777) != perms;
}

} // namespace dotsync
