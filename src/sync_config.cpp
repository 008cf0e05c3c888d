#include "sync_config.hpp"

#include <pwd.h>
#include <unistd.h>

#include <cstdlib>
#include <optional>
#include <system_error>

#include "platform.hpp"
#include "settings_manager.hpp"

namespace dotsync {

namespace {

std::filesystem::path absolute_normal(const std::string& raw, const char* what) {
  std::error_code ec;
  auto abs = std::filesystem::absolute(raw.empty() ? std::filesystem::path(".") : std::filesystem::path(raw), ec);
  if(ec) {
    throw ConfigError(std::string("resolving ") + what + " path: " + ec.message());
  }
  abs = abs.lexically_normal();
  // "/a/b/" normalizes to "/a/b/"; drop the empty trailing filename.
  if(abs.has_relative_path() && abs.filename().empty()) {
    abs = abs.parent_path();
  }
  return abs;
}

} // namespace

mode_t parse_octal_umask(const std::string& text) {
  std::string clean = trim_copy(text);
  if(clean.empty() || clean.size() > 4) {
    throw ConfigError("invalid umask '" + text + "'");
  }
  mode_t value = 0;
  for(char ch : clean) {
    if(ch < '0' || ch > '7') {
      throw ConfigError("invalid umask '" + text + "': expected octal digits");
    }
    value = static_cast<mode_t>(value * 8 + (ch - '0'));
  }
  if(value > 0777) {
    throw ConfigError("invalid umask '" + text + "': out of range");
  }
  return value;
}

std::filesystem::path default_destination() {
  if(::geteuid() == 0) {
    return "/";
  }
  if(const char* home = std::getenv("HOME"); home && *home) {
    return home;
  }
  if(const passwd* pw = ::getpwuid(::geteuid()); pw && pw->pw_dir) {
    return pw->pw_dir;
  }
  throw ConfigError("unable to determine home directory for the default destination");
}

void validate_source(const std::filesystem::path& path) {
  std::error_code ec;
  auto status = std::filesystem::status(path, ec);
  if(ec) {
    throw ConfigError("accessing source directory " + path.string() + ": " + ec.message());
  }
  if(!std::filesystem::is_directory(status)) {
    throw ConfigError("source path " + path.string() + " is not a directory");
  }
}

SyncConfig SyncConfig::resolve(const SettingsManager& settings) {
  SyncConfig cfg;
  cfg.watch = settings.get<bool>("watch");
  cfg.force = settings.get<bool>("force");
  cfg.collect = settings.get<bool>("collect");
  cfg.everyone = settings.get<bool>("everyone");
  cfg.bin_dirs = settings.get<std::vector<std::string>>("bindir");

  cfg.source_root = absolute_normal(settings.get<std::string>("src"), "source");
  auto dst = settings.get<std::string>("dst");
  cfg.dest_root = dst.empty()
    ? absolute_normal(default_destination().string(), "destination")
    : absolute_normal(dst, "destination");

  if(cfg.source_root == cfg.dest_root) {
    throw ConfigError("source and destination directories are the same: " + cfg.source_root.string());
  }

  int interval_ms = settings.get<int>("interval_ms");
  if(interval_ms <= 0) {
    throw ConfigError("interval_ms must be positive");
  }
  cfg.interval = std::chrono::milliseconds(interval_ms);

  cfg.full_scan_iterations = settings.get<int>("full_scan_iterations");
  if(cfg.full_scan_iterations <= 0) {
    throw ConfigError("full_scan_iterations must be positive");
  }

  std::optional<mode_t> requested;
  auto umask_text = settings.get<std::string>("umask");
  if(!umask_text.empty()) {
    requested = parse_octal_umask(umask_text);
  }
  cfg.umask = apply_process_umask(requested);

  validate_source(cfg.source_root);
  return cfg;
}

} // namespace dotsync
