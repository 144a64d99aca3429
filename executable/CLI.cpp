#include "CLI.hpp"

#include <rex/common/config.hpp>
#include <rex/common/log.h>

#include <iostream>

#include <boost/program_options.hpp>

namespace po = boost::program_options;

namespace rex {
CLI::CLI(Config& config)
  : m_config(config) {
  // clang-format off
  m_globalOptions.add_options()
    ("help,h", "produce help message for all available options")
    ("config,c", po::value<std::string>(&m_configFile)->default_value("")->value_name("path"), "read options from this file (INI syntax, key = value)")
    ("trace,t", po::bool_switch(&m_traceMode)->default_value(false)->value_name("bool"), "debug mode (set severity >= TRACE)")
    ("debug,d", po::bool_switch(&m_debugMode)->default_value(false)->value_name("bool"), "debug mode (set severity >= DEBG)")
    ("info,i", po::bool_switch(&m_infoMode)->default_value(false)->value_name("bool"), "debug mode (set severity >= INFO)")
    ("quiet-channel", po::value<std::vector<std::string>>(&m_quietChannels)->value_name("channel")->multitoken(), "disable logging of a channel (general, bus, allocator, decision, reasoner, scheduler, daemon)")
    ;
  // clang-format on
}
CLI::~CLI() {}

bool
CLI::parseArgs(int argc, char* argv[]) {
  po::options_description options;
  options.add(m_globalOptions).add(m_config.options());

  po::variables_map vm;
  try {
    po::store(po::command_line_parser(argc, argv).options(options).run(), vm);
    po::notify(vm);
  } catch(const std::exception& e) {
    std::cerr << "Could not parse CLI Parameters! Error: " << e.what()
              << std::endl;
    return false;
  }

  if(vm.count("help")) {
    m_helpRequested = true;
    std::cout << m_globalOptions << m_config.options() << std::endl;
    return false;
  }

  if(!applyLogSettings())
    return false;

  if(!m_configFile.empty() && !m_config.parseConfigFile(m_configFile))
    return false;

  if(!m_config.apply(vm))
    return false;

  rex_log_set_local_name(
    std::string(m_config.getString(Config::LocalName)).c_str());
  return true;
}

bool
CLI::applyLogSettings() {
  if(m_infoMode) {
    rex_log_set_severity(REX_INFO);
  }
  if(m_debugMode) {
    rex_log_set_severity(REX_DEBUG);
  }
  if(m_traceMode) {
    rex_log_set_severity(REX_TRACE);
  }

  for(auto& name : m_quietChannels) {
    rex_log_channel channel;
    if(!rex_log_channel_from_str(name, &channel)) {
      std::cerr << "Unknown log channel \"" << name << "\"!" << std::endl;
      return false;
    }
    rex_log_set_channel_active(channel, false);
  }
  return true;
}
}
