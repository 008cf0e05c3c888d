#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace dotsync {

enum class SettingKind { Flag, Integer, Text, List };

struct SettingDef {
  std::string key;
  std::vector<std::string> aliases;
  SettingKind kind;
  nlohmann::json fallback;
  std::string help;
};

// Every option dotsync understands, in usage order.
const std::vector<SettingDef>& setting_defs();

inline constexpr const char* kEnvironmentPrefix = "DOTSYNC_";

// Current values for every SettingDef, kept in a JSON object. Layers are
// applied by the caller in increasing precedence: defaults (construction),
// settings file, environment, command line.
class SettingsManager {
public:
  using EnvironmentLookup = std::function<std::optional<std::string>(const std::string&)>;

  explicit SettingsManager(const std::vector<SettingDef>& defs = setting_defs());

  template<typename T>
  T get(const std::string& key) const {
    if(!values_.contains(key)) {
      throw std::runtime_error("Unknown setting: " + key);
    }
    return values_.at(key).get<T>();
  }

  bool help_requested() const { return get<bool>("help"); }

  // Keys may be given with dashes or as an alias. Returns false and fills
  // `error` when the key is unknown or the value does not fit its kind.
  bool set_from_string(const std::string& key, const std::string& value, std::string& error);

  bool load_from_file(const std::filesystem::path& path, std::string& error);
  // Applies DOTSYNC_<KEY> variables. List values are colon separated.
  void load_from_environment(const EnvironmentLookup& lookup = process_environment);

  const SettingDef* find(const std::string& token) const;
  const std::vector<SettingDef>& defs() const { return defs_; }

  static std::optional<std::string> process_environment(const std::string& name);
  static std::optional<bool> parse_flag(const std::string& value);

private:
  bool store(const SettingDef& def, const nlohmann::json& value, std::string& error);
  nlohmann::json from_text(const SettingDef& def, const std::string& text, std::string& error) const;

  std::vector<SettingDef> defs_;
  nlohmann::json values_ = nlohmann::json::object();
};

std::string to_lower(std::string value);
std::string to_upper(std::string value);
std::string trim_copy(std::string value);

} // namespace dotsync
