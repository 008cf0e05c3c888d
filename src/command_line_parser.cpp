#include "command_line_parser.hpp"

#include <cctype>
#include <sstream>

#include "log.hpp"

namespace dotsync {

namespace {

const char* argument_hint(SettingKind kind) {
  switch(kind) {
    case SettingKind::Flag: return "[true|false]";
    case SettingKind::Integer: return "<int>";
    case SettingKind::Text: return "<string>";
    case SettingKind::List: return "<string>...";
  }
  return "";
}

std::string describe_default(const nlohmann::json& value) {
  if(value.is_string()) {
    auto text = value.get<std::string>();
    return text.empty() ? "none" : text;
  }
  if(value.is_array() && value.empty()) return "none";
  return value.dump();
}

} // namespace

CommandLineParser::CommandLineParser(std::string process_name, std::vector<std::string> positionals)
  : process_name_(std::move(process_name)), positionals_(std::move(positionals)) {}

bool CommandLineParser::looks_like_option(const std::string& token) {
  if(token.rfind("--", 0) == 0) return true;
  return token.size() >= 2 && token[0] == '-' &&
         (std::isalpha(static_cast<unsigned char>(token[1])) || token[1] == '?');
}

CommandLineParser::OptionResult CommandLineParser::parse_option(const std::vector<std::string>& args,
                                                                std::size_t& i,
                                                                std::string token,
                                                                bool long_form,
                                                                SettingsManager& settings,
                                                                std::string& error) const {
  std::optional<std::string> inline_value;
  auto eq = token.find('=');
  if(eq != std::string::npos) {
    inline_value = token.substr(eq + 1);
    token.resize(eq);
  }

  const auto* def = settings.find(token);
  if(!def) {
    if(!long_form) return OptionResult::NotAnOption;
    error = "Unknown option --" + token;
    return OptionResult::Failed;
  }

  std::string value;
  if(inline_value) {
    value = *inline_value;
  } else if(def->kind == SettingKind::Flag) {
    // A bare flag means true; an explicit literal may follow it.
    bool literal_follows = i + 1 < args.size() && !looks_like_option(args[i + 1]) &&
                           SettingsManager::parse_flag(args[i + 1]).has_value();
    value = literal_follows ? args[++i] : "true";
  } else if(i + 1 < args.size()) {
    value = args[++i];
  } else {
    error = "Missing value for option '" + token + "'";
    return OptionResult::Failed;
  }

  std::string set_error;
  if(!settings.set_from_string(def->key, value, set_error)) {
    error = "Invalid value for option '" + token + "': " + set_error;
    return OptionResult::Failed;
  }
  return OptionResult::Consumed;
}

bool CommandLineParser::parse(const std::vector<std::string>& args,
                              SettingsManager& settings,
                              std::string& error) const {
  error.clear();
  std::size_t next_positional = 0;

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    if(token.size() > 2 && token.rfind("--", 0) == 0) {
      if(parse_option(args, i, token.substr(2), true, settings, error) == OptionResult::Failed) return false;
      continue;
    }
    if(token.size() > 1 && token[0] == '-' && token[1] != '-') {
      auto result = parse_option(args, i, token.substr(1), false, settings, error);
      if(result == OptionResult::Failed) return false;
      if(result == OptionResult::Consumed) continue;
    }

    if(next_positional >= positionals_.size()) {
      error = "Unexpected positional argument '" + token + "'";
      return false;
    }
    const auto& key = positionals_[next_positional++];
    std::string set_error;
    if(!settings.set_from_string(key, token, set_error)) {
      error = "Invalid value for " + key + " '" + token + "': " + set_error;
      return false;
    }
  }
  return true;
}

bool CommandLineParser::parse_layered(const std::vector<std::string>& args,
                                      SettingsManager& settings,
                                      const SettingsManager::EnvironmentLookup& lookup,
                                      std::string& error) const {
  // The command line is read twice: once to find the settings file, once on
  // top of everything else.
  SettingsManager discovery(settings.defs());
  if(!parse(args, discovery, error)) return false;

  auto config_path = discovery.get<std::string>("config");
  if(config_path.empty() && lookup) {
    config_path = lookup(std::string(kEnvironmentPrefix) + "CONFIG").value_or("");
  }
  if(!config_path.empty() && !settings.load_from_file(config_path, error)) {
    return false;
  }

  settings.load_from_environment(lookup);
  return parse(args, settings, error);
}

void CommandLineParser::usage() const {
  std::string synopsis = process_name_ + " [options]";
  for(const auto& key : positionals_) {
    synopsis += " [" + key + "]";
  }
  print_out("{} - keep a destination tree convergent with a source tree", process_name_);
  print_out("Usage:");
  print_out("  {}", synopsis);
  print_out("");
  print_out("Options:");
  for(const auto& def : setting_defs()) {
    std::ostringstream aliases;
    for(std::size_t i = 0; i < def.aliases.size(); ++i) {
      aliases << (i == 0 ? " (alias: " : ", ") << "-" << def.aliases[i];
    }
    if(!def.aliases.empty()) aliases << ")";
    print_out("  --{:<22} {:<14} {}{} (default: {})",
              def.key, argument_hint(def.kind), def.help, aliases.str(), describe_default(def.fallback));
  }
  print_out("");
  print_out("Every option can also be set with a {}<KEY> environment variable.", kEnvironmentPrefix);
}

} // namespace dotsync
