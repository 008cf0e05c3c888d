#pragma once

#include <sys/types.h>

#include <filesystem>

#include "file_meta.hpp"

namespace dotsync {

struct SyncEnvironment;
class FileInstaller;

enum class ReconcileAction {
  None,
  Copy,       // source -> destination
  Collect,    // destination -> source, source keeps its mode
  SkipNewer,  // destination is newer, left alone
};

const char* to_string(ReconcileAction action);

struct ReconcilePlan {
  ReconcileAction action = ReconcileAction::None;
  mode_t perms = 0;
  FileMeta dest_meta;
};

class FileReconciler {
public:
  FileReconciler(SyncEnvironment& env, FileInstaller& installer);

  // May remove a destination symlink. Throws when the destination is a
  // directory or cannot be inspected. With `ignore_newer` a newer destination
  // is compared like any other.
  ReconcilePlan plan(const std::filesystem::path& source,
                     const std::filesystem::path& dest,
                     const FileMeta& source_meta,
                     bool ignore_newer = false);

  // Returns false when the written file failed verification.
  bool apply(const ReconcilePlan& plan,
             const std::filesystem::path& source,
             const std::filesystem::path& dest,
             const FileMeta& source_meta);

  // True when size, mtime or permission bits differ or the destination is
  // missing.
  bool needs_update(const std::filesystem::path& dest, const FileMeta& source_meta, mode_t perms);

private:
  SyncEnvironment& env_;
  FileInstaller& installer_;
};

} // namespace dotsync
