#include "file_installer.hpp"
#include "state_store.hpp"
#include "sync_engine.hpp"
#include "sync_pass.hpp"
#include "test_runner_utils.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <thread>
#include <vector>

using namespace dotsync;
using dotsync::test::SyncFixture;
using dotsync::test::TestCase;
using dotsync::test::TestContext;
using dotsync::test::file_mode;
using dotsync::test::file_mtime;
using dotsync::test::read_file;
using dotsync::test::write_file;

namespace fs = std::filesystem;

namespace {

// Overwrites `victim` the first time it is share-locked, which is when the
// installer re-reads a fresh copy for verification.
class IntrudingLocker : public Locker {
public:
  IntrudingLocker(Locker& inner, fs::path victim) : inner_(inner), victim_(std::move(victim)) {}

  void lock(int fd, bool exclusive) override {
    inner_.lock(fd, exclusive);
    if(exclusive || intruded_) return;
    struct stat held{};
    struct stat named{};
    if(::fstat(fd, &held) == -1 || ::stat(victim_.c_str(), &named) == -1) return;
    if(held.st_dev != named.st_dev || held.st_ino != named.st_ino) return;
    intruded_ = true;
    write_file(victim_, "intruder\n");
  }

private:
  Locker& inner_;
  fs::path victim_;
  bool intruded_ = false;
};

// Runs one pass on a thread while `path` is flock()ed exclusively through an
// unrelated descriptor. `while_held` is checked before the lock is released.
bool pass_waits_for_lock(SyncEngine& engine, const fs::path& path, int open_flags,
                         const std::function<bool()>& while_held) {
  int fd = ::open(path.c_str(), open_flags);
  if(fd == -1) return false;
  if(::flock(fd, LOCK_EX) == -1) {
    ::close(fd);
    return false;
  }

  std::atomic<bool> done{false};
  std::thread worker([&]{
    engine.run_pass();
    done = true;
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  bool blocked = !done && while_held();

  ::flock(fd, LOCK_UN);
  ::close(fd);
  worker.join();
  return blocked && done;
}

TrackedSet saved_state(const SyncFixture& fx) {
  return StateStore::parse(read_file(fx.config.state_file()));
}

bool test_basic_sync(TestContext& ctx) {
  SyncFixture fx("basic", ctx.logs);
  write_file(fx.ws.src / "a.txt", "hi\n", 0644);
  write_file(fx.ws.src / "nested" / "deep" / "b.conf", "x=1\n", 0600);
  dotsync::test::age_file(fx.ws.src / "a.txt", -3600);

  SyncEngine engine(fx.env);
  auto result = engine.run_pass();

  return !result.fatal && result.changed && !result.has_errors &&
         result.counters.files_copied == 2 &&
         read_file(fx.ws.dst / "a.txt") == "hi\n" &&
         file_mode(fx.ws.dst / "a.txt") == 0644 &&
         dotsync::test::same_time(file_mtime(fx.ws.dst / "a.txt"), file_mtime(fx.ws.src / "a.txt")) &&
         read_file(fx.ws.dst / "nested" / "deep" / "b.conf") == "x=1\n" &&
         file_mode(fx.ws.dst / "nested" / "deep" / "b.conf") == 0600 &&
         saved_state(fx) == TrackedSet{"a.txt", "nested/deep/b.conf"};
}

bool test_umask_masks_copies(TestContext& ctx) {
  SyncFixture fx("umask_copy", ctx.logs);
  fx.config.umask = 077;
  write_file(fx.ws.src / "shared.txt", "s\n", 0664);

  SyncEngine engine(fx.env);
  engine.run_pass();
  return file_mode(fx.ws.dst / "shared.txt") == 0600;
}

bool test_second_pass_is_idempotent(TestContext& ctx) {
  SyncFixture fx("idempotent", ctx.logs);
  write_file(fx.ws.src / "a.txt", "hi\n");
  write_file(fx.ws.src / "etc" / "hosts.local-section", "127.0.0.1 box\n");

  SyncEngine engine(fx.env);
  auto first = engine.run_pass();
  auto mtime = file_mtime(fx.ws.dst / "a.txt");
  auto state_mtime = file_mtime(fx.config.state_file());
  auto hosts = read_file(fx.ws.dst / "etc" / "hosts");
  auto second = engine.run_pass();

  return first.changed && !second.changed && !second.has_errors &&
         second.counters.files_copied == 0 && second.counters.sections_merged == 0 &&
         dotsync::test::same_time(mtime, file_mtime(fx.ws.dst / "a.txt")) &&
         dotsync::test::same_time(state_mtime, file_mtime(fx.config.state_file())) &&
         read_file(fx.ws.dst / "etc" / "hosts") == hosts;
}

bool test_prune_removed_file(TestContext& ctx) {
  SyncFixture fx("prune", ctx.logs);
  write_file(fx.ws.src / "keep.txt", "k\n");
  write_file(fx.ws.src / "gone.txt", "g\n");

  SyncEngine engine(fx.env);
  engine.run_pass();
  bool copied = fs::exists(fx.ws.dst / "gone.txt");
  fs::remove(fx.ws.src / "gone.txt");
  auto result = engine.run_pass();

  return copied && result.changed && result.counters.entries_pruned == 1 &&
         !fs::exists(fx.ws.dst / "gone.txt") &&
         fs::exists(fx.ws.dst / "keep.txt") &&
         saved_state(fx) == TrackedSet{"keep.txt"} &&
         ctx.logs.saw("Removed orphaned file");
}

bool test_prune_already_missing(TestContext& ctx) {
  SyncFixture fx("prune_missing", ctx.logs);
  write_file(fx.ws.src / "real.txt", "r\n");
  write_file(fx.config.state_file(), "ghost.txt\nreal.txt\n");

  SyncEngine engine(fx.env);
  auto result = engine.run_pass();
  return result.changed && !result.has_errors &&
         saved_state(fx) == TrackedSet{"real.txt"} &&
         ctx.logs.saw("Orphaned file already gone");
}

bool test_prune_section_already_gone(TestContext& ctx) {
  SyncFixture fx("prune_section_gone", ctx.logs);
  auto target = fx.ws.dst / "etc" / "hosts";
  write_file(fx.config.state_file(), "etc/hosts.disks-section\n");

  SyncEngine engine(fx.env);
  auto first = engine.run_pass();
  bool forgotten = saved_state(fx).empty();

  // A block the user writes afterwards is not ours to remove.
  const std::string user_block = "# BEGIN disks\nuser owned\n# END disks\n";
  write_file(target, user_block);
  auto second = engine.run_pass();

  return first.changed && !first.has_errors && forgotten &&
         ctx.logs.saw("Orphaned section already gone") &&
         !second.has_errors && second.counters.entries_pruned == 0 &&
         read_file(target) == user_block;
}

bool test_section_insertion_and_rollback(TestContext& ctx) {
  SyncFixture fx("sections", ctx.logs);
  auto target = fx.ws.dst / "etc" / "fstab";
  write_file(target, "# managed by hand\n/dev/root / ext4\n", 0644);
  write_file(fx.ws.src / "etc" / "fstab.disks-section", "/dev/sdb /data ext4\n");

  SyncEngine engine(fx.env);
  auto first = engine.run_pass();
  write_file(fx.ws.src / "etc" / "fstab.apples-section", "# apples\n");
  auto second = engine.run_pass();
  const std::string both =
    "# managed by hand\n/dev/root / ext4\n"
    "# BEGIN apples\n# apples\n# END apples\n"
    "# BEGIN disks\n/dev/sdb /data ext4\n# END disks\n";
  bool ordered = read_file(target) == both;

  fs::remove(fx.ws.src / "etc" / "fstab.apples-section");
  auto third = engine.run_pass();
  const std::string rolled_back =
    "# managed by hand\n/dev/root / ext4\n"
    "# BEGIN disks\n/dev/sdb /data ext4\n# END disks\n";

  return first.counters.sections_merged == 1 &&
         second.counters.sections_merged == 1 &&
         ordered &&
         third.changed && third.counters.entries_pruned == 1 &&
         read_file(target) == rolled_back &&
         !fs::exists(fx.ws.dst / "etc" / "fstab.disks-section") &&
         saved_state(fx) == TrackedSet{"etc/fstab.disks-section"};
}

bool test_section_validation_error(TestContext& ctx) {
  SyncFixture fx("section_invalid", ctx.logs);
  auto target = fx.ws.dst / "hosts";
  const std::string before = "# BEGIN disks\nhand edited\n";
  write_file(target, before);
  write_file(fx.ws.src / "hosts.disks-section", "new\n");

  SyncEngine engine(fx.env);
  auto result = engine.run_pass();
  return !result.fatal && result.has_errors &&
         read_file(target) == before &&
         ctx.logs.saw("Failed to merge section");
}

bool test_collect_newer_destination(TestContext& ctx) {
  SyncFixture fx("collect", ctx.logs);
  fx.config.collect = true;
  auto src = fx.ws.src / "rc";
  auto dst = fx.ws.dst / "rc";
  write_file(src, "old\n", 0640);
  dotsync::test::age_file(src, -7200);

  SyncEngine engine(fx.env);
  engine.run_pass();
  write_file(dst, "edited in place\n", 0600);
  dotsync::test::age_file(dst, -60);
  auto result = engine.run_pass();

  return result.changed && result.counters.files_collected == 1 &&
         read_file(src) == "edited in place\n" &&
         file_mode(src) == 0640 &&
         dotsync::test::same_time(file_mtime(src), file_mtime(dst));
}

bool test_newer_destination_skipped(TestContext& ctx) {
  SyncFixture fx("skip_newer", ctx.logs);
  auto src = fx.ws.src / "rc";
  auto dst = fx.ws.dst / "rc";
  write_file(src, "repo\n");
  dotsync::test::age_file(src, -7200);

  SyncEngine engine(fx.env);
  engine.run_pass();
  write_file(dst, "local change\n");
  dotsync::test::age_file(dst, -60);
  auto result = engine.run_pass();

  return !result.changed && !result.has_errors &&
         read_file(dst) == "local change\n" &&
         read_file(src) == "repo\n" &&
         ctx.logs.saw("Destination is newer than source");
}

bool test_force_overwrites_newer(TestContext& ctx) {
  SyncFixture fx("force", ctx.logs);
  fx.config.force = true;
  auto src = fx.ws.src / "rc";
  auto dst = fx.ws.dst / "rc";
  write_file(src, "repo\n");
  dotsync::test::age_file(src, -7200);
  write_file(dst, "local change\n");

  SyncEngine engine(fx.env);
  auto result = engine.run_pass();
  return result.changed && result.counters.files_copied == 1 &&
         read_file(dst) == "repo\n" &&
         dotsync::test::same_time(file_mtime(src), file_mtime(dst));
}

bool test_destination_symlink_replaced(TestContext& ctx) {
  SyncFixture fx("dst_symlink", ctx.logs);
  write_file(fx.ws.src / "a.txt", "from repo\n");
  dotsync::test::age_file(fx.ws.src / "a.txt", -7200);
  write_file(fx.ws.dst / "elsewhere.txt", "do not touch\n");
  dotsync::test::age_file(fx.ws.dst / "elsewhere.txt", -86400);
  fs::create_symlink(fx.ws.dst / "elsewhere.txt", fx.ws.dst / "a.txt");

  SyncEngine engine(fx.env);
  auto result = engine.run_pass();
  return result.changed &&
         !fs::is_symlink(fx.ws.dst / "a.txt") &&
         read_file(fx.ws.dst / "a.txt") == "from repo\n" &&
         read_file(fx.ws.dst / "elsewhere.txt") == "do not touch\n";
}

bool test_directory_conflict(TestContext& ctx) {
  SyncFixture fx("dir_conflict", ctx.logs);
  write_file(fx.ws.src / "a.txt", "file\n");
  write_file(fx.ws.src / "ok.txt", "fine\n");
  fs::create_directories(fx.ws.dst / "a.txt");

  SyncEngine engine(fx.env);
  auto result = engine.run_pass();
  return !result.fatal && result.has_errors &&
         result.counters.entries_failed == 1 &&
         fs::is_directory(fx.ws.dst / "a.txt") &&
         read_file(fx.ws.dst / "ok.txt") == "fine\n";
}

bool test_file_blocks_directory(TestContext& ctx) {
  SyncFixture fx("file_blocks_dir", ctx.logs);
  write_file(fx.ws.src / "conf" / "inner.txt", "inner\n");
  write_file(fx.ws.src / "other.txt", "other\n");
  write_file(fx.ws.dst / "conf", "a file where a directory belongs\n");
  write_file(fx.config.state_file(), "conf/inner.txt\n");

  SyncEngine engine(fx.env);
  auto result = engine.run_pass();
  return !result.fatal && result.has_errors &&
         fs::is_regular_file(fx.ws.dst / "conf") &&
         read_file(fx.ws.dst / "other.txt") == "other\n" &&
         saved_state(fx).count("conf/inner.txt") == 1 &&
         ctx.logs.saw("Skipping source directory");
}

bool test_skips_git_and_state(TestContext& ctx) {
  SyncFixture fx("skip_git", ctx.logs);
  write_file(fx.ws.src / ".git" / "config", "[core]\n");
  write_file(fx.ws.src / "sub" / ".git" / "HEAD", "ref\n");
  write_file(fx.ws.src / "sub" / ".dotsync", "nested state is content\n");
  write_file(fx.ws.src / ".gitignore", "*.o\n");

  SyncEngine engine(fx.env);
  engine.run_pass();
  return !fs::exists(fx.ws.dst / ".git") &&
         !fs::exists(fx.ws.dst / "sub" / ".git") &&
         !fs::exists(fx.ws.dst / ".dotsync") &&
         fs::exists(fx.ws.dst / "sub" / ".dotsync") &&
         fs::exists(fx.ws.dst / ".gitignore");
}

bool test_broken_source_link(TestContext& ctx) {
  SyncFixture fx("broken_link", ctx.logs);
  write_file(fx.ws.src / "real.txt", "r\n");
  fs::create_symlink(fx.ws.src / "missing-target", fx.ws.src / "dangling");
  write_file(fx.ws.dst / "dangling", "previously installed\n");
  write_file(fx.config.state_file(), "dangling\n");

  SyncEngine engine(fx.env);
  auto result = engine.run_pass();
  return !result.fatal && result.has_errors &&
         read_file(fx.ws.dst / "dangling") == "previously installed\n" &&
         saved_state(fx) == TrackedSet{"real.txt"} &&
         ctx.logs.saw("Skipping unreadable file or broken link");
}

bool test_source_symlink_followed(TestContext& ctx) {
  SyncFixture fx("src_symlink", ctx.logs);
  write_file(fx.ws.root / "outside" / "profile", "export X=1\n", 0600);
  write_file(fx.ws.root / "outside" / "dir" / "inside.txt", "i\n");
  fs::create_symlink(fx.ws.root / "outside" / "profile", fx.ws.src / "profile");
  fs::create_directory_symlink(fx.ws.root / "outside" / "dir", fx.ws.src / "linked");

  SyncEngine engine(fx.env);
  engine.run_pass();
  return read_file(fx.ws.dst / "profile") == "export X=1\n" &&
         file_mode(fx.ws.dst / "profile") == 0600 &&
         !fs::is_symlink(fx.ws.dst / "profile") &&
         fs::is_directory(fx.ws.dst / "linked") &&
         !fs::exists(fx.ws.dst / "linked" / "inside.txt");
}

bool test_everyone_permissions(TestContext& ctx) {
  SyncFixture fx("everyone", ctx.logs);
  fx.config.everyone = true;
  write_file(fx.ws.src / "script", "#!/bin/sh\n", 0700);
  write_file(fx.ws.src / "secret", "s\n", 0600);
  write_file(fx.ws.src / "readonly", "r\n", 0400);

  SyncEngine engine(fx.env);
  engine.run_pass();
  return file_mode(fx.ws.dst / "script") == 0755 &&
         file_mode(fx.ws.dst / "secret") == 0644 &&
         file_mode(fx.ws.dst / "readonly") == 0444;
}

bool test_bindir_exec_bits(TestContext& ctx) {
  SyncFixture fx("bindir", ctx.logs);
  fx.config.bin_dirs = {"bin", "missing"};
  write_file(fx.ws.src / "bin" / "tool", "#!/bin/sh\n", 0644);
  write_file(fx.ws.src / "bin" / "sub" / "helper", "#!/bin/sh\n", 0600);
  write_file(fx.ws.src / "notes.txt", "n\n", 0644);

  SyncEngine engine(fx.env);
  engine.run_pass();
  return file_mode(fx.ws.src / "bin" / "tool") == 0755 &&
         file_mode(fx.ws.src / "bin" / "sub" / "helper") == 0711 &&
         file_mode(fx.ws.dst / "bin" / "tool") == 0755 &&
         file_mode(fx.ws.src / "notes.txt") == 0644;
}

bool test_bindir_skips_unreadable_entries(TestContext& ctx) {
  SyncFixture fx("bindir_unreadable", ctx.logs);
  auto bin = fx.ws.src / "bin";
  write_file(bin / "tool", "#!/bin/sh\n", 0644);
  write_file(bin / "zz" / "helper", "#!/bin/sh\n", 0644);
  write_file(bin / "locked" / "hidden", "#!/bin/sh\n", 0644);
  ::chmod((bin / "locked").c_str(), 0);

  fx.platform.ensure_executable_bits(bin, 022, fx.logger);
  ::chmod((bin / "locked").c_str(), 0755);

  // root reads through mode bits, so nothing is unreadable there.
  bool reported = ::geteuid() == 0 || ctx.logs.saw("Error scanning bindir");
  return reported &&
         file_mode(bin / "tool") == 0755 &&
         file_mode(bin / "zz" / "helper") == 0755;
}

bool test_permission_drift_repaired(TestContext& ctx) {
  SyncFixture fx("perm_drift", ctx.logs);
  write_file(fx.ws.src / "a.txt", "a\n", 0644);

  SyncEngine engine(fx.env);
  engine.run_pass();
  ::chmod((fx.ws.dst / "a.txt").c_str(), 0666);
  auto result = engine.run_pass();
  return result.changed && file_mode(fx.ws.dst / "a.txt") == 0644;
}

bool test_watch_cache_and_full_rescan(TestContext& ctx) {
  SyncFixture fx("watch_cache", ctx.logs);
  fx.config.watch = true;
  fx.config.full_scan_iterations = 3;
  write_file(fx.ws.src / "a.txt", "a\n", 0644);

  SyncEngine engine(fx.env);
  engine.run_pass();
  bool cached = engine.meta_cache_size() == 1;

  // Drift on the destination goes unnoticed while the source is unchanged.
  ::chmod((fx.ws.dst / "a.txt").c_str(), 0600);
  auto skipped = engine.run_pass();
  bool still_drifted = file_mode(fx.ws.dst / "a.txt") == 0600;

  bool cleared_early = engine.advance_iteration() || engine.advance_iteration();
  bool cleared = engine.advance_iteration();
  auto rescanned = engine.run_pass();

  return cached && !skipped.changed && still_drifted &&
         !cleared_early && cleared && engine.iteration() == 0 &&
         rescanned.changed && file_mode(fx.ws.dst / "a.txt") == 0644 &&
         ctx.logs.saw("Clearing metadata cache for periodic full scan");
}

bool test_watch_source_change_detected(TestContext& ctx) {
  SyncFixture fx("watch_change", ctx.logs);
  fx.config.watch = true;
  auto src = fx.ws.src / "a.txt";
  write_file(src, "one\n");
  dotsync::test::age_file(src, -7200);

  SyncEngine engine(fx.env);
  engine.run_pass();
  write_file(src, "two two\n");
  dotsync::test::age_file(src, -3600);
  auto result = engine.run_pass();
  return result.changed && read_file(fx.ws.dst / "a.txt") == "two two\n";
}

bool test_failed_entry_retried_in_watch(TestContext& ctx) {
  SyncFixture fx("watch_retry", ctx.logs);
  fx.config.watch = true;
  write_file(fx.ws.src / "a.txt", "a\n");
  fs::create_directories(fx.ws.dst / "a.txt");

  SyncEngine engine(fx.env);
  auto first = engine.run_pass();
  bool evicted = engine.meta_cache_size() == 0;
  fs::remove(fx.ws.dst / "a.txt");
  auto second = engine.run_pass();
  return first.has_errors && evicted &&
         !second.has_errors && second.changed &&
         read_file(fx.ws.dst / "a.txt") == "a\n";
}

bool test_verification_mismatch_bumps_mtime(TestContext& ctx) {
  SyncFixture fx("verify", ctx.logs);
  auto src = fx.ws.src / "a.txt";
  auto dst = fx.ws.dst / "a.txt";
  write_file(src, "original\n");
  dotsync::test::age_file(src, -86400);

  FileInstaller installer(fx.env);
  std::error_code ec;
  auto meta = stat_path(src, true, ec);
  bool verified = meta && installer.install(src, dst, *meta, 0644);
  bool synced = dotsync::test::same_time(file_mtime(src), file_mtime(dst));

  // Another writer slips in between close and verification.
  write_file(dst, "intruder\n");
  set_mtime(dst, meta->mtime);
  FileHandle source(src, O_RDONLY);
  bool matched = installer.verify(source, dst);
  auto bumped = file_mtime(dst);

  return verified && synced && !matched &&
         bumped.tv_sec > meta->mtime.tv_sec &&
         ctx.logs.saw("Content mismatch detected");
}

bool test_mismatched_copy_converges_next_pass(TestContext& ctx) {
  SyncFixture fx("verify_converge", ctx.logs);
  auto src = fx.ws.src / "a.txt";
  auto dst = fx.ws.dst / "a.txt";
  write_file(src, "original\n");
  dotsync::test::age_file(src, -86400);

  IntrudingLocker locker(fx.platform, dst);
  SyncEnvironment env{fx.config, locker, fx.platform, fx.platform, fx.logger};
  SyncEngine engine(env);

  auto first = engine.run_pass();
  bool mismatched = read_file(dst) == "intruder\n" &&
                    ctx.logs.saw("Content mismatch detected") &&
                    engine.unverified_count() == 1;

  // The bumped destination looks newer than the source but is still replaced.
  auto second = engine.run_pass();
  return first.changed && mismatched &&
         second.changed && second.counters.files_copied == 1 && !second.has_errors &&
         read_file(dst) == "original\n" &&
         dotsync::test::same_time(file_mtime(src), file_mtime(dst)) &&
         engine.unverified_count() == 0;
}

bool test_pass_waits_for_state_lock(TestContext& ctx) {
  SyncFixture fx("state_lock", ctx.logs);
  write_file(fx.config.state_file(), "");
  write_file(fx.ws.src / "a.txt", "a\n");

  SyncEngine engine(fx.env);
  bool waited = pass_waits_for_lock(engine, fx.config.state_file(), O_RDWR, [&]{
    return !fs::exists(fx.ws.dst / "a.txt");
  });
  return waited && read_file(fx.ws.dst / "a.txt") == "a\n" &&
         saved_state(fx) == TrackedSet{"a.txt"};
}

bool test_copy_waits_for_destination_lock(TestContext& ctx) {
  SyncFixture fx("dest_lock", ctx.logs);
  auto dst = fx.ws.dst / "a.txt";
  write_file(dst, "stale\n");
  dotsync::test::age_file(dst, -7200);
  write_file(fx.ws.src / "a.txt", "fresh content\n");
  dotsync::test::age_file(fx.ws.src / "a.txt", -3600);

  SyncEngine engine(fx.env);
  bool waited = pass_waits_for_lock(engine, dst, O_RDONLY, [&]{
    return read_file(dst) == "stale\n";
  });
  return waited && read_file(dst) == "fresh content\n";
}

bool test_same_content_compare(TestContext& ctx) {
  SyncFixture fx("same_content", ctx.logs);
  std::string big(200 * 1024, 'x');
  write_file(fx.ws.root / "one", big);
  write_file(fx.ws.root / "two", big);
  write_file(fx.ws.root / "three", big + "y");

  FileHandle a(fx.ws.root / "one", O_RDONLY);
  FileHandle b(fx.ws.root / "two", O_RDONLY);
  FileHandle c(fx.ws.root / "one", O_RDONLY);
  FileHandle d(fx.ws.root / "three", O_RDONLY);
  return same_content(a, b) && !same_content(c, d);
}

bool test_fatal_missing_source_root(TestContext& ctx) {
  SyncFixture fx("fatal", ctx.logs);
  fx.config.source_root = fx.ws.root / "unplugged";

  SyncEngine engine(fx.env);
  auto result = engine.run_pass();
  return result.fatal && engine.run() == 1 &&
         ctx.logs.saw("Error accessing state file");
}

bool test_fatal_when_root_not_enumerable(TestContext& ctx) {
  SyncFixture fx("fatal_enum", ctx.logs);
  if(::geteuid() == 0) return true;  // root reads through mode bits
  write_file(fx.ws.src / "a.txt", "a\n");
  ::chmod(fx.ws.src.c_str(), 0300);

  SyncEngine engine(fx.env);
  auto result = engine.run_pass();
  ::chmod(fx.ws.src.c_str(), 0755);
  return result.fatal && ctx.logs.saw("Sync error");
}

bool test_watch_loop_stops(TestContext& ctx) {
  SyncFixture fx("watch_loop", ctx.logs);
  fx.config.watch = true;
  fx.config.interval = std::chrono::milliseconds(10);
  write_file(fx.ws.src / "a.txt", "a\n");

  SyncEngine engine(fx.env);
  int exit_code = -1;
  std::thread loop([&]{ exit_code = engine.run(); });

  using namespace std::chrono_literals;
  bool synced = dotsync::test::wait_for_condition([&]{
    return fs::exists(fx.ws.dst / "a.txt");
  }, 5s);
  bool looped = ctx.logs.wait_for_substring("Starting sync iteration", 5s);
  write_file(fx.ws.src / "b.txt", "b\n");
  bool picked_up = dotsync::test::wait_for_condition([&]{
    return fs::exists(fx.ws.dst / "b.txt");
  }, 5s);

  engine.stop();
  loop.join();
  return synced && looped && picked_up && exit_code == 0 && engine.stop_requested();
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"basic_sync", test_basic_sync},
    {"umask_masks_copies", test_umask_masks_copies},
    {"second_pass_is_idempotent", test_second_pass_is_idempotent},
    {"prune_removed_file", test_prune_removed_file},
    {"prune_already_missing", test_prune_already_missing},
    {"prune_section_already_gone", test_prune_section_already_gone},
    {"section_insertion_and_rollback", test_section_insertion_and_rollback},
    {"section_validation_error", test_section_validation_error},
    {"collect_newer_destination", test_collect_newer_destination},
    {"newer_destination_skipped", test_newer_destination_skipped},
    {"force_overwrites_newer", test_force_overwrites_newer},
    {"destination_symlink_replaced", test_destination_symlink_replaced},
    {"directory_conflict", test_directory_conflict},
    {"file_blocks_directory", test_file_blocks_directory},
    {"skips_git_and_state", test_skips_git_and_state},
    {"broken_source_link", test_broken_source_link},
    {"source_symlink_followed", test_source_symlink_followed},
    {"everyone_permissions", test_everyone_permissions},
    {"bindir_exec_bits", test_bindir_exec_bits},
    {"bindir_skips_unreadable_entries", test_bindir_skips_unreadable_entries},
    {"permission_drift_repaired", test_permission_drift_repaired},
    {"watch_cache_and_full_rescan", test_watch_cache_and_full_rescan},
    {"watch_source_change_detected", test_watch_source_change_detected},
    {"failed_entry_retried_in_watch", test_failed_entry_retried_in_watch},
    {"verification_mismatch_bumps_mtime", test_verification_mismatch_bumps_mtime},
    {"mismatched_copy_converges_next_pass", test_mismatched_copy_converges_next_pass},
    {"pass_waits_for_state_lock", test_pass_waits_for_state_lock},
    {"copy_waits_for_destination_lock", test_copy_waits_for_destination_lock},
    {"same_content_compare", test_same_content_compare},
    {"fatal_missing_source_root", test_fatal_missing_source_root},
    {"fatal_when_root_not_enumerable", test_fatal_when_root_not_enumerable},
    {"watch_loop_stops", test_watch_loop_stops},
  };
  return dotsync::test::run_test_cases("sync", tests, argc, argv);
}
