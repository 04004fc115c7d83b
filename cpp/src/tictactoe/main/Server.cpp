#include "tictactoe/GameService.hpp"
#include "tictactoe/SessionStore.hpp"
#include "tictactoe/ai/EasyStrategy.hpp"
#include "util/BoostUtil.hpp"
#include "util/Exceptions.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <boost/program_options.hpp>

#include <iostream>
#include <string>

// Serves GameService over stdin/stdout: one JSON request per input line, one JSON response per
// output line. Logs go to stderr.
int main(int ac, char* av[]) {
  try {
    namespace po = boost::program_options;
    namespace po2 = boost_util::program_options;

    util::Logging::Params log_params;
    util::Random::Params random_params;
    tictactoe::GameService::Params service_params;
    tictactoe::ai::EasyParams easy_params;

    po2::options_description raw_desc("General options");
    auto desc = raw_desc.template add_option<"help", 'h'>("help (most used options)")
                  .template add_option<"help-full">("help (all options)")
                  .add(service_params.make_options_description())
                  .add(easy_params.make_options_description())
                  .add(log_params.make_options_description())
                  .add(random_params.make_options_description());

    po::variables_map vm = po2::parse_args(desc, ac, av);

    bool help_full = vm.count("help-full");
    bool help = vm.count("help");
    if (help || help_full) {
      po2::Settings::help_full = help_full;
      std::cout << desc << std::endl;
      return 0;
    }

    log_params.console_to_stderr = true;
    util::Logging::init(log_params);
    util::Random::init(random_params);

    tictactoe::InMemorySessionStore store;
    tictactoe::GameService service(store, util::Random::default_prng(), service_params,
                                   easy_params);

    LOG_INFO("Ready for requests");

    std::string line;
    while (std::getline(std::cin, line)) {
      if (line.empty()) continue;
      std::cout << service.handle_line(line) << std::endl;
    }

    LOG_INFO("Input closed, exiting");
  } catch (const util::CleanException& e) {
    std::cerr << "Caught a CleanException: ";
    std::cerr << e.what() << std::endl;
    return 1;
  }

  return 0;
}
