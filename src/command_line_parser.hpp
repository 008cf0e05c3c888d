#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

namespace dotsync {

class CommandLineParser {
public:
  // `positionals` names the settings filled by bare arguments, in order.
  explicit CommandLineParser(std::string process_name = "dotsync",
                             std::vector<std::string> positionals = {"src", "dst"});

  // Returns false and fills `error` on the first invalid token. Settings that
  // were parsed before the failure stay applied.
  bool parse(const std::vector<std::string>& args, SettingsManager& settings, std::string& error) const;
  // Applies, lowest first: the --config file (or DOTSYNC_CONFIG), DOTSYNC_*
  // variables, then `args`.
  bool parse_layered(const std::vector<std::string>& args,
                     SettingsManager& settings,
                     const SettingsManager::EnvironmentLookup& lookup,
                     std::string& error) const;
  void usage() const;

private:
  enum class OptionResult { Consumed, NotAnOption, Failed };

  OptionResult parse_option(const std::vector<std::string>& args, std::size_t& i, std::string token,
                            bool long_form, SettingsManager& settings, std::string& error) const;
  static bool looks_like_option(const std::string& token);

  std::string process_name_;
  std::vector<std::string> positionals_;
};

} // namespace dotsync
