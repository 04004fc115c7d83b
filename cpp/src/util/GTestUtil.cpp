#include "util/GTestUtil.hpp"

#include "util/BoostUtil.hpp"
#include "util/LoggingUtil.hpp"

#include <boost/program_options.hpp>

#include <iostream>
#include <string>

// In order to display help options for gtest, testing::InitGoogleTest() must see "--help" in argv,
// but it exits right after printing, before we get a chance to show our own options. On the other
// hand, parsing our own options first would reject every gtest option as unknown.
//
// So: scan for --help/--help-full by hand and print our help first, then let InitGoogleTest()
// consume (and strip) the gtest flags, then parse whatever remains as our own options.
int launch_gtest(int argc, char** argv) {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;
  util::Logging::Params log_params;

  po2::options_description raw_desc("Options");
  auto desc = raw_desc.template add_option<"help", 'h'>("help (most used options)")
                .template add_option<"help-full">("help (all options)")
                .add(log_params.make_options_description());

  bool help_full = false;
  bool help = false;
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]) == "--help-full") {
      help_full = true;
    } else if (std::string(argv[i]) == "--help") {
      help = true;
    }
  }
  if (help || help_full) {
    po2::Settings::help_full = help_full;
    std::cout << desc << std::endl;
  }
  if (help_full && !help) {
    // gtest does not know --help-full, so rewrite it to --help.
    argc = 2;
    argv[1] = const_cast<char*>("--help");
  }

  testing::InitGoogleTest(&argc, argv);

  po::variables_map vm = po2::parse_args(desc, argc, argv);
  util::Logging::init(log_params);
  return RUN_ALL_TESTS();
}
