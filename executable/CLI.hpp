#ifndef REX_EXECUTABLE_CLI_HPP
#define REX_EXECUTABLE_CLI_HPP

#include <string>
#include <vector>

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/variables_map.hpp>

namespace rex {
class Config;

class CLI {
  public:
  explicit CLI(Config& config);
  ~CLI();

  /** @brief Parse all arguments into the config.
   *
   * A config file given with --config is read first, arguments on the command
   * line override its values.
   *
   * @return False if the program should exit, either because of an error or
   * because help was requested.
   */
  bool parseArgs(int argc, char* argv[]);

  bool helpRequested() const { return m_helpRequested; }
  const std::string& getConfigFile() const { return m_configFile; }

  private:
  boost::program_options::options_description m_globalOptions{
    "Global Options"
  };

  Config& m_config;

  std::string m_configFile;
  std::vector<std::string> m_quietChannels;

  bool m_traceMode = false;
  bool m_debugMode = false;
  bool m_infoMode = false;
  bool m_helpRequested = false;

  bool applyLogSettings();
};
}

#endif
