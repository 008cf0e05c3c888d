#pragma once

#include <sys/types.h>

#include <filesystem>

#include "file_handle.hpp"
#include "file_meta.hpp"

namespace dotsync {

struct SyncEnvironment;

// Lock-guarded in-place copy. The destination is opened without truncation,
// locked exclusively, then truncated and written; after close its mtime is
// set to the source's and the bytes are compared again under a shared lock.
// A mismatch bumps the destination mtime to now so that the next pass sees it
// as stale.
class FileInstaller {
public:
  explicit FileInstaller(SyncEnvironment& env);

  // Returns false when the verification step found foreign content.
  bool install(const std::filesystem::path& source,
               const std::filesystem::path& dest,
               const FileMeta& source_meta,
               mode_t perms);

  // Rewinds `source` and compares it with `dest`. Touches `dest` on mismatch.
  bool verify(FileHandle& source, const std::filesystem::path& dest);

private:
  SyncEnvironment& env_;
};

// Byte comparison from the current offsets of both handles.
bool same_content(FileHandle& a, FileHandle& b);

} // namespace dotsync
