#include "sync_pass.hpp"

#include <sys/stat.h>

#include <algorithm>
#include <cerrno>
#include <system_error>
#include <vector>

#include "log.hpp"

namespace dotsync {

namespace {

constexpr const char* kVcsDirectory = ".git";

std::vector<std::string> list_directory(const std::filesystem::path& dir, std::error_code& ec) {
  namespace fs = std::filesystem;
  std::vector<std::string> names;
  fs::directory_iterator it(dir, ec);
  if(ec) return names;
  for(; it != fs::directory_iterator(); it.increment(ec)) {
    if(ec) return names;
    names.push_back(it->path().filename().string());
  }
  std::sort(names.begin(), names.end());
  return names;
}

} // namespace

void make_directories(const std::filesystem::path& path, mode_t mode) {
  struct stat st{};
  if(::stat(path.c_str(), &st) == 0) {
    if(S_ISDIR(st.st_mode)) return;
    throw std::system_error(ENOTDIR, std::system_category(), "mkdir " + path.string());
  }
  if(errno != ENOENT) {
    throw std::system_error(errno, std::system_category(), "stat " + path.string());
  }
  auto parent = path.parent_path();
  if(!parent.empty() && parent != path) {
    make_directories(parent, mode);
  }
  if(::mkdir(path.c_str(), mode) == -1 && errno != EEXIST) {
    throw std::system_error(errno, std::system_category(), "mkdir " + path.string());
  }
}

SyncPass::SyncPass(SyncEnvironment& env, SyncContext& ctx)
  : env_(env),
    ctx_(ctx),
    installer_(env),
    reconciler_(env, installer_),
    merger_(env),
    pruner_(env, merger_) {}

void SyncPass::run() {
  const auto& root = env_.config.source_root;
  std::error_code ec;
  auto root_meta = stat_path(root, true, ec);
  if(!root_meta) {
    throw FatalSyncError("accessing source root " + root.string() + ": " + ec.message());
  }
  if(!root_meta->is_directory()) {
    throw FatalSyncError("source root " + root.string() + " is not a directory");
  }

  walk_directory(root, "");
  pruner_.prune(ctx_);
}

void SyncPass::walk_directory(const std::filesystem::path& dir, const std::string& rel_dir) {
  std::error_code ec;
  auto names = list_directory(dir, ec);
  if(ec) {
    if(rel_dir.empty()) {
      throw FatalSyncError("reading source root " + dir.string() + ": " + ec.message());
    }
    env_.logger.warn("Skipping unreadable directory path={} err={}", rel_dir, ec.message());
    ctx_.has_errors = true;
    ++ctx_.counters.entries_failed;
    retain_subtree(rel_dir);
    return;
  }

  for(const auto& name : names) {
    auto path = dir / name;
    auto rel = rel_dir.empty() ? name : rel_dir + "/" + name;
    auto link_meta = stat_path(path, false, ec);
    if(!link_meta) {
      env_.logger.warn("Skipping vanished entry path={} err={}", rel, ec.message());
      ctx_.processed.insert(rel);
      continue;
    }
    visit(path, rel, *link_meta);
  }
}

bool SyncPass::should_skip(const std::string& rel, const std::string& name, const FileMeta& link_meta) const {
  if(rel == kStateFileName) return true;
  return link_meta.is_directory() && name == kVcsDirectory;
}

void SyncPass::visit(const std::filesystem::path& path, const std::string& rel, const FileMeta& link_meta) {
  if(should_skip(rel, path.filename().string(), link_meta)) return;

  // The listing does not follow links; mtime and mode come from the target.
  std::error_code ec;
  auto real = stat_path(path, true, ec);
  if(!real) {
    env_.logger.warn("Skipping unreadable file or broken link path={} err={}", rel, ec.message());
    ctx_.processed.insert(rel);
    ctx_.has_errors = true;
    ++ctx_.counters.entries_failed;
    return;
  }

  if(real->is_directory()) {
    if(!handle_directory(rel, *real)) {
      retain_subtree(rel);
      return;
    }
    // Linked directories get a destination directory but are not descended.
    if(link_meta.is_directory()) {
      walk_directory(path, rel);
    }
    return;
  }

  if(!real->is_regular()) {
    env_.logger.warn("Skipping special file path={}", rel);
    ctx_.processed.insert(rel);
    return;
  }

  handle_file(path, rel, *real);
}

bool SyncPass::handle_directory(const std::string& rel, const FileMeta& meta) {
  auto target = env_.config.dest_root / rel;
  try {
    make_directories(target, env_.expected_permissions(meta.mode));
  } catch(const std::system_error& e) {
    env_.logger.warn("Skipping source directory: failed to create path={} err={}", target.string(), e.what());
    ctx_.has_errors = true;
    ++ctx_.counters.entries_failed;
    return false;
  }
  return true;
}

void SyncPass::handle_file(const std::filesystem::path& path, const std::string& rel, const FileMeta& meta) {
  if(auto section = match_section_path(rel)) {
    process_section(path, rel, *section, meta);
  } else {
    process_regular_file(path, rel, meta);
  }
}

void SyncPass::process_section(const std::filesystem::path& path, const std::string& rel,
                               const SectionPath& section, const FileMeta& meta) {
  auto target = env_.config.dest_root / section.target;

  // The section source itself is never copied, only tracked.
  ctx_.track(rel);

  if(check_cache(path, meta)) return;

  env_.logger.debug("Processing section name={} target={}", section.name, target.string());
  try {
    if(merger_.merge(path, target, section.name, meta.mode)) {
      env_.logger.debug("Section merged and content changed target={}", target.string());
      ctx_.changed = true;
      ++ctx_.counters.sections_merged;
    }
  } catch(const std::exception& e) {
    env_.logger.error("Failed to merge section section={} target={} err={}", section.name, target.string(), e.what());
    ctx_.fail(path.string());
  }
}

void SyncPass::process_regular_file(const std::filesystem::path& path, const std::string& rel, const FileMeta& meta) {
  auto target = env_.config.dest_root / rel;
  const bool pending = ctx_.unverified && ctx_.unverified->count(target.string());

  if(check_cache(path, meta) && !pending && !env_.config.collect && ctx_.old_state.count(rel)) {
    ctx_.track(rel);
    return;
  }

  ctx_.track(rel);

  ReconcilePlan plan;
  try {
    plan = reconciler_.plan(path, target, meta, pending);
  } catch(const std::exception& e) {
    env_.logger.error("Error checking destination state path={} err={}", target.string(), e.what());
    ctx_.fail(path.string());
    return;
  }

  if(plan.action == ReconcileAction::None || plan.action == ReconcileAction::SkipNewer) {
    if(pending) ctx_.unverified->erase(target.string());
    return;
  }

  bool verified = true;
  try {
    verified = reconciler_.apply(plan, path, target, meta);
  } catch(const std::exception& e) {
    env_.logger.error("Failed to update/install path={} action={} err={}", target.string(), to_string(plan.action), e.what());
    ctx_.fail(path.string());
    return;
  }

  if(ctx_.unverified) {
    // In collect mode the bumped destination is collected next pass instead.
    if(!verified && plan.action == ReconcileAction::Copy && !env_.config.collect) {
      ctx_.unverified->insert(target.string());
    } else {
      ctx_.unverified->erase(target.string());
    }
  }
  if(!verified && ctx_.meta_cache) ctx_.meta_cache->erase(path.string());

  ctx_.changed = true;
  if(plan.action == ReconcileAction::Collect) {
    ++ctx_.counters.files_collected;
  } else {
    ++ctx_.counters.files_copied;
  }
}

bool SyncPass::check_cache(const std::filesystem::path& path, const FileMeta& meta) {
  if(!env_.config.watch || !ctx_.meta_cache) return false;
  auto& cache = *ctx_.meta_cache;
  auto key = path.string();
  auto it = cache.find(key);
  bool known = it != cache.end() && it->second == meta;
  cache[key] = meta;
  return known;
}

void SyncPass::retain_subtree(const std::string& rel_dir) {
  const std::string prefix = rel_dir + "/";
  for(auto it = ctx_.old_state.lower_bound(prefix);
      it != ctx_.old_state.end() && it->compare(0, prefix.size(), prefix) == 0; ++it) {
    ctx_.track(*it);
  }
}

} // namespace dotsync
