#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

#include "file_installer.hpp"
#include "file_meta.hpp"
#include "file_reconciler.hpp"
#include "pruner.hpp"
#include "section_merge.hpp"
#include "sync_context.hpp"

namespace dotsync {

// The pass cannot proceed at all (source root missing or unreadable).
class FatalSyncError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// One walk of the source tree followed by pruning. Per-entry failures are
// logged and recorded in the context; only FatalSyncError escapes run().
class SyncPass {
public:
  SyncPass(SyncEnvironment& env, SyncContext& ctx);

  void run();

private:
  void walk_directory(const std::filesystem::path& dir, const std::string& rel_dir);
  void visit(const std::filesystem::path& path, const std::string& rel, const FileMeta& link_meta);
  bool should_skip(const std::string& rel, const std::string& name, const FileMeta& link_meta) const;

  bool handle_directory(const std::string& rel, const FileMeta& meta);
  void handle_file(const std::filesystem::path& path, const std::string& rel, const FileMeta& meta);
  void process_section(const std::filesystem::path& path, const std::string& rel,
                       const SectionPath& section, const FileMeta& meta);
  void process_regular_file(const std::filesystem::path& path, const std::string& rel, const FileMeta& meta);

  // Watch mode only: records `meta` and reports whether it matches the last pass.
  bool check_cache(const std::filesystem::path& path, const FileMeta& meta);
  // Keeps tracked entries below a subtree that could not be walked.
  void retain_subtree(const std::string& rel_dir);

  SyncEnvironment& env_;
  SyncContext& ctx_;
  FileInstaller installer_;
  FileReconciler reconciler_;
  SectionMerger merger_;
  Pruner pruner_;
};

// mkdir -p with `mode` for every created component.
void make_directories(const std::filesystem::path& path, mode_t mode);

} // namespace dotsync
