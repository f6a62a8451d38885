#pragma once

#include <boost/program_options.hpp>
#include <string>
#include <vodlink/config.hpp>

namespace vodlink {

namespace po = boost::program_options;

/// Options shared by every vodlinkctl command. The same names are accepted
/// on the command line, in the --config INI file and as VODLINK_* variables
/// (VODLINK_REDIS_URI, VODLINK_KEY_PREFIX, ...).
po::options_description config_options();

/// Fill `config` from parsed variables; values left unset keep their
/// defaults.
void apply_config(const po::variables_map &vm, Config &config);

/// Merge the --config file (if given) and the environment into `vm`.
/// Command-line values stored earlier take precedence.
void load_config_sources(po::variables_map &vm,
						 const po::options_description &desc);

}  // namespace vodlink
