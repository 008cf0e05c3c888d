#include "settings_manager.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include "log.hpp"

namespace dotsync {

const std::vector<SettingDef>& setting_defs() {
  static const std::vector<SettingDef> defs = {
    {"src", {"s", "source"}, SettingKind::Text, "",
     "Source directory (default: current working directory)"},
    {"dst", {"d", "dest"}, SettingKind::Text, "",
     "Destination directory (default: home directory, or / as root)"},
    {"watch", {"w"}, SettingKind::Flag, false, "Keep running and re-scan on an interval"},
    {"force", {"f"}, SettingKind::Flag, false, "Overwrite destination files even when they are newer"},
    {"collect", {"c"}, SettingKind::Flag, false, "Copy newer destination files back into the source"},
    {"everyone", {"e"}, SettingKind::Flag, false,
     "Mirror owner permission bits onto group and other before applying the umask"},
    {"umask", {"u"}, SettingKind::Text, "", "Process umask in octal, e.g. 077 (default: inherited)"},
    {"bindir", {"b"}, SettingKind::List, nlohmann::json::array(),
     "Source-relative directory whose files must be executable (repeatable)"},
    {"log_level", {"ll"}, SettingKind::Text, "info", "Log level: debug, info, warn, error"},
    {"log_format", {"lf"}, SettingKind::Text, "human", "Log format: human, text, json"},
    {"interval_ms", {"i", "interval"}, SettingKind::Integer, 4000, "Milliseconds to sleep between watch passes"},
    {"full_scan_iterations", {"fsi"}, SettingKind::Integer, 60,
     "Watch passes between full metadata re-validations"},
    {"config", {}, SettingKind::Text, "", "JSON settings file loaded before the command line"},
    {"help", {"h", "?"}, SettingKind::Flag, false, "Show command help and exit"},
  };
  return defs;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

std::string to_upper(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::toupper(ch)); });
  return value;
}

std::string trim_copy(std::string value) {
  auto not_space = [](unsigned char ch){ return !std::isspace(ch); };
  value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
  value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
  return value;
}

SettingsManager::SettingsManager(const std::vector<SettingDef>& defs) : defs_(defs) {
  for(const auto& def : defs_) {
    values_[def.key] = def.fallback;
  }
}

const SettingDef* SettingsManager::find(const std::string& token) const {
  auto name = to_lower(token);
  std::replace(name.begin(), name.end(), '-', '_');
  for(const auto& def : defs_) {
    if(def.key == name) return &def;
  }
  name = to_lower(token);
  for(const auto& def : defs_) {
    if(std::find(def.aliases.begin(), def.aliases.end(), name) != def.aliases.end()) return &def;
  }
  return nullptr;
}

std::optional<bool> SettingsManager::parse_flag(const std::string& value) {
  auto v = to_lower(trim_copy(value));
  if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
  if(v == "false" || v == "0" || v == "off" || v == "no") return false;
  return std::nullopt;
}

nlohmann::json SettingsManager::from_text(const SettingDef& def, const std::string& text,
                                          std::string& error) const {
  auto clean = trim_copy(text);
  switch(def.kind) {
    case SettingKind::Flag:
      if(auto flag = parse_flag(clean)) return *flag;
      error = "expected boolean (true|false|on|off)";
      return {};
    case SettingKind::Integer: {
      std::size_t consumed = 0;
      int parsed = 0;
      try {
        parsed = std::stoi(clean, &consumed);
      } catch(const std::logic_error&) {
        consumed = 0;
      }
      if(clean.empty() || consumed != clean.size()) {
        error = "expected integer";
        return {};
      }
      return parsed;
    }
    case SettingKind::Text:
    case SettingKind::List:
      return clean;
  }
  error = "unsupported setting kind";
  return {};
}

bool SettingsManager::store(const SettingDef& def, const nlohmann::json& value, std::string& error) {
  auto& slot = values_[def.key];
  switch(def.kind) {
    case SettingKind::Flag:
      if(value.is_boolean()) {
        slot = value.get<bool>();
        return true;
      }
      if(value.is_number_integer()) {
        slot = value.get<int>() != 0;
        return true;
      }
      error = "expected boolean";
      return false;
    case SettingKind::Integer:
      if(!value.is_number_integer()) {
        error = "expected integer";
        return false;
      }
      slot = value.get<int>();
      return true;
    case SettingKind::Text:
      if(!value.is_string()) {
        error = "expected string";
        return false;
      }
      slot = value;
      return true;
    case SettingKind::List:
      // An array replaces the list; a single string appends to it.
      if(value.is_string()) {
        slot.push_back(value);
        return true;
      }
      if(value.is_array() && std::all_of(value.begin(), value.end(),
                                          [](const nlohmann::json& item){ return item.is_string(); })) {
        slot = value;
        return true;
      }
      error = "expected string or array of strings";
      return false;
  }
  error = "unsupported setting kind";
  return false;
}

bool SettingsManager::set_from_string(const std::string& key, const std::string& value, std::string& error) {
  error.clear();
  const auto* def = find(key);
  if(!def) {
    error = "unknown setting";
    return false;
  }
  auto parsed = from_text(*def, value, error);
  return error.empty() && store(*def, parsed, error);
}

bool SettingsManager::load_from_file(const std::filesystem::path& path, std::string& error) {
  error.clear();
  std::ifstream in(path);
  if(!in) {
    error = "unable to open " + path.string();
    return false;
  }
  nlohmann::json doc = nlohmann::json::parse(in, nullptr, false);
  if(doc.is_discarded() || !doc.is_object()) {
    error = path.string() + " does not contain a JSON object";
    return false;
  }
  for(const auto& item : doc.items()) {
    const auto* def = find(item.key());
    std::string item_error;
    if(!def) {
      print_err("Ignoring unknown setting '{}' in {}", item.key(), path.string());
    } else if(!store(*def, item.value(), item_error)) {
      print_err("Ignoring invalid setting '{}' in {}: {}", item.key(), path.string(), item_error);
    }
  }
  return true;
}

void SettingsManager::load_from_environment(const EnvironmentLookup& lookup) {
  if(!lookup) return;
  for(const auto& def : defs_) {
    if(def.key == "help" || def.key == "config") continue;
    const auto name = kEnvironmentPrefix + to_upper(def.key);
    auto raw = lookup(name);
    if(!raw) continue;

    std::string error;
    if(def.kind == SettingKind::List) {
      auto items = nlohmann::json::array();
      std::stringstream stream(*raw);
      std::string item;
      while(std::getline(stream, item, ':')) {
        item = trim_copy(item);
        if(!item.empty()) items.push_back(item);
      }
      store(def, items, error);
    } else {
      auto parsed = from_text(def, *raw, error);
      if(error.empty()) store(def, parsed, error);
    }
    if(!error.empty()) {
      print_err("Ignoring invalid environment value for {}: {}", name, error);
    }
  }
}

std::optional<std::string> SettingsManager::process_environment(const std::string& name) {
  const char* value = std::getenv(name.c_str());
  if(!value) return std::nullopt;
  return std::string(value);
}

} // namespace dotsync
