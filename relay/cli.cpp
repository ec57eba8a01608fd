#include "cli.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/replace.hpp>
#include <cstring>
#include <iostream>
#include "log.hpp"

namespace relay {

namespace {

constexpr char const* kEnvironmentPrefix = "RELAY_";

// RELAY_SLOW_LOG_MS -> slow-log-ms. Empty for variables without the prefix and for the ones that
// name no option, like RELAY_APP_NAME which is read by app_name().
std::string option_name(po::options_description const& description, std::string const& variable) {
  if (!boost::algorithm::starts_with(variable, kEnvironmentPrefix)) return "";
  auto name = boost::algorithm::to_lower_copy(variable.substr(std::strlen(kEnvironmentPrefix)));
  boost::algorithm::replace_all(name, "_", "-");
  return description.find_nothrow(name, false) != nullptr ? name : "";
}

[[noreturn]] void exit_with_help(po::options_description const& description,
                                 std::string const& message = "") {
  if (!message.empty()) std::cout << message << '\n';
  std::cout << description << std::endl;
  std::exit(message.empty() ? 0 : 1);
}

}  // namespace

po::variables_map parse_program_options(int argc, char** argv,
                                        po::options_description const& user_options) {
  po::options_description description("Common");
  description.add_options()("help", "show available options")(
      "loglevel", po::value<char>()->default_value('i'),
      "char indicating the desired log level: i[nfo], w[warn], e[error]");
  description.add(user_options);

  po::variables_map vm;
  try {
    // command line values take precedence, store keeps the first value given to an option
    po::store(po::parse_command_line(argc, argv, description), vm);
    po::store(po::parse_environment(description,
                                   [&description](std::string const& variable) {
                                     return option_name(description, variable);
                                   }),
              vm);
    po::notify(vm);
  } catch (po::error const& e) {
    exit_with_help(description, fmt::format("Error parsing program options: {}", e.what()));
  }

  if (vm.count("help")) exit_with_help(description);

  auto level = vm["loglevel"].as<char>();
  if (set_loglevel(level) != 0) {
    exit_with_help(description, fmt::format("Invalid log level '{}'", level));
  }

  return vm;
}

}  // namespace relay
