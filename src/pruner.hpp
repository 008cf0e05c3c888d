#pragma once

#include <string>

namespace dotsync {

struct SyncContext;
struct SyncEnvironment;
class SectionMerger;

// Removes destination files and sections that were tracked by the previous
// pass but not reproduced by this one. Entries that fail to go away stay
// tracked so the next pass retries them.
class Pruner {
public:
  Pruner(SyncEnvironment& env, SectionMerger& merger);

  void prune(SyncContext& ctx);

private:
  void prune_section(SyncContext& ctx, const std::string& rel, const std::string& target, const std::string& name);
  void prune_file(SyncContext& ctx, const std::string& rel);

  SyncEnvironment& env_;
  SectionMerger& merger_;
};

} // namespace dotsync
