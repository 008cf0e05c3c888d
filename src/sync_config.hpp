#pragma once

#include <sys/types.h>

#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace dotsync {

class SettingsManager;

inline constexpr const char* kStateFileName = ".dotsync";
inline constexpr std::chrono::milliseconds kDefaultWatchInterval{4000};
inline constexpr int kDefaultFullScanIterations = 60;

class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Finished configuration record consumed by the sync core.
struct SyncConfig {
  bool watch = false;
  bool force = false;
  bool collect = false;
  bool everyone = false;
  std::filesystem::path source_root;
  std::filesystem::path dest_root;
  std::vector<std::string> bin_dirs;
  mode_t umask = 022;
  std::chrono::milliseconds interval = kDefaultWatchInterval;
  int full_scan_iterations = kDefaultFullScanIterations;

  std::filesystem::path state_file() const { return source_root / kStateFileName; }

  // Builds the record from settings. Applies the umask to the process when
  // one is configured. Throws ConfigError.
  static SyncConfig resolve(const SettingsManager& settings);
};

mode_t parse_octal_umask(const std::string& text);
std::filesystem::path default_destination();
// Throws ConfigError unless `path` exists and is a directory.
void validate_source(const std::filesystem::path& path);

} // namespace dotsync
