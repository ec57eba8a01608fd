#pragma once

#include <boost/program_options.hpp>

namespace relay {

namespace po = boost::program_options;

// Parses the command line merged with the environment. Every option can also be given as an
// environment variable prefixed by RELAY_, e.g.: RELAY_SLOW_LOG_MS=200 is the same as
// --slow-log-ms 200. Adds the common --help and --loglevel options; prints the help and exits on
// invalid input.
po::variables_map parse_program_options(int argc, char** argv,
                                        po::options_description const& user_options = {});

}  // namespace relay
