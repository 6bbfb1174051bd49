#include "util/GTestUtil.hpp"

#include "util/BoostUtil.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"
#include "util/Rendering.hpp"

#include <algorithm>
#include <iostream>
#include <string>

/*
 * gtest exits from InitGoogleTest() when it sees --help, and our own parser rejects --gtest_*
 * arguments. So --help is detected by hand, our options are printed, and gtest then prints its
 * own and exits. Otherwise gtest strips its arguments first and we parse what is left.
 */
int launch_gtest(int argc, char** argv) {
  namespace po2 = boost_util::program_options;
  util::Logging::Params log_params;
  util::Random::Params random_params;
  util::Rendering::Params rendering_params;
  random_params.seed = 1;
  rendering_params.no_color = true;

  po2::options_description raw_desc("Test options");
  auto desc = raw_desc.template add_option<"help", 'h'>("help")
                .add(log_params.make_options_description())
                .add(random_params.make_options_description())
                .add(rendering_params.make_options_description());

  bool help = std::any_of(argv + 1, argv + argc, [](const char* arg) {
    return std::string(arg) == "--help" || std::string(arg) == "-h";
  });
  if (help) {
    std::cout << desc << std::endl;
    argc = 2;
    argv[1] = const_cast<char*>("--help");
  }

  testing::InitGoogleTest(&argc, argv);

  po2::parse_args(desc, argc, argv);
  util::Logging::init(log_params);
  util::Random::init(random_params);
  util::Rendering::init(rendering_params);
  return RUN_ALL_TESTS();
}
