#include "util/Asserts.hpp"
#include "util/BoostUtil.hpp"
#include "util/CppUtil.hpp"
#include "util/Exceptions.hpp"
#include "util/GTestUtil.hpp"
#include "util/Random.hpp"
#include "util/StringUtil.hpp"

#include <boost/program_options.hpp>
#include <gtest/gtest.h>

#include <array>
#include <cmath>
#include <map>
#include <random>
#include <sstream>
#include <string>
#include <type_traits>
#include <vector>

TEST(Random, uniform_sample) {
  std::mt19937 prng(1);

  constexpr int N = 10000;
  std::map<int, int> counts;
  for (int i = 0; i < N; ++i) {
    int x = util::Random::uniform_sample(prng, 3, 7);
    EXPECT_GE(x, 3);
    EXPECT_LT(x, 7);
    counts[x]++;
  }
  EXPECT_EQ(counts.size(), 4);
  for (const auto& [x, count] : counts) {
    double pct = count * 1.0 / N;
    EXPECT_LT(std::abs(pct - 0.25), 0.02);
  }

  EXPECT_THROW(util::Random::uniform_sample(prng, 5, 5), util::Exception);
}

TEST(Random, uniform_real) {
  std::mt19937 prng(2);
  for (int i = 0; i < 1000; ++i) {
    double x = util::Random::uniform_real(prng, 0.0, 1.0);
    EXPECT_GE(x, 0.0);
    EXPECT_LT(x, 1.0);
  }
  EXPECT_THROW(util::Random::uniform_real(prng, 1.0, 1.0), util::Exception);
}

TEST(Random, choose) {
  std::array<int, 3> a = {10, 20, 30};
  std::map<int, int> counts;

  std::mt19937 prng(3);
  for (int i = 0; i < 300; ++i) {
    counts[util::Random::choose(prng, a.begin(), a.end())]++;
  }
  EXPECT_EQ(counts.size(), 3);
  EXPECT_GT(counts[10], 50);
  EXPECT_GT(counts[20], 50);
  EXPECT_GT(counts[30], 50);
}

TEST(Random, set_seed) {
  auto sample = []() {
    std::vector<int> v;
    std::mt19937& prng = util::Random::default_prng();
    for (int i = 0; i < 10; ++i) v.push_back(util::Random::uniform_sample(prng, 0, 1000));
    return v;
  };

  util::Random::set_seed(5);
  std::vector<int> v1 = sample();
  util::Random::set_seed(5);
  std::vector<int> v2 = sample();
  EXPECT_EQ(v1, v2);
}

TEST(StringUtil, atoi_safe) {
  EXPECT_EQ(util::atoi_safe("0"), 0);
  EXPECT_EQ(util::atoi_safe("2"), 2);
  EXPECT_EQ(util::atoi_safe("-15"), -15);

  EXPECT_THROW(util::atoi_safe(""), util::CleanException);
  EXPECT_THROW(util::atoi_safe("abc"), util::CleanException);
  EXPECT_THROW(util::atoi_safe("1x"), util::CleanException);
  EXPECT_THROW(util::atoi_safe(" 1"), util::CleanException);
  EXPECT_THROW(util::atoi_safe("99999999999"), util::CleanException);
}

TEST(StringUtil, split) {
  std::vector<std::string> result1 = util::split("a,b,c", ",");
  std::vector<std::string> result2 = util::split(" a \tb   c ");

  EXPECT_EQ(result1.size(), 3);
  EXPECT_EQ(result1[0], "a");
  EXPECT_EQ(result1[1], "b");
  EXPECT_EQ(result1[2], "c");

  EXPECT_EQ(result2.size(), 3);
  EXPECT_EQ(result2[0], "a");
  EXPECT_EQ(result2[1], "b");
  EXPECT_EQ(result2[2], "c");

  // like python, an explicit separator keeps empty fields
  std::vector<std::string> result3 = util::split("a,,b,", ",");
  EXPECT_EQ(result3, (std::vector<std::string>{"a", "", "b", ""}));

  EXPECT_TRUE(util::split("  \t\n").empty());
}

TEST(StringUtil, to_lower) {
  EXPECT_EQ(util::to_lower("HaRd"), "hard");
  EXPECT_EQ(util::to_lower("x1_Y"), "x1_y");
}

TEST(Asserts, release_assert) {
  EXPECT_NO_THROW(RELEASE_ASSERT(1 + 1 == 2));
  EXPECT_THROW(RELEASE_ASSERT(1 + 1 == 3), util::ReleaseAssertionError);

  try {
    RELEASE_ASSERT(false, "bad value {}", 7);
    FAIL() << "RELEASE_ASSERT did not throw";
  } catch (const util::ReleaseAssertionError& e) {
    std::string what = e.what();
    EXPECT_NE(what.find("RELEASE_ASSERT failed: bad value 7"), std::string::npos) << what;
  }
}

TEST(Exceptions, format) {
  util::CleanException e("cell ({}, {}) is {}", 1, 2, "taken");
  EXPECT_STREQ(e.what(), "cell (1, 2) is taken");
}

TEST(CppUtil, int_sequence) {
  using S1 = util::int_sequence<1, 2, 3>;
  using S2 = util::int_sequence<4, 5>;

  static_assert(util::int_sequence_contains_v<S1, 2>);
  static_assert(!util::int_sequence_contains_v<S1, 4>);
  static_assert(std::is_same_v<util::concat_int_sequence_t<S1, S2>,
                               util::int_sequence<1, 2, 3, 4, 5>>);
  static_assert(util::no_overlap_v<S1, S2>);
  static_assert(!util::no_overlap_v<S1, util::int_sequence<3>>);
}

TEST(CppUtil, string_literal_sequence) {
  using S1 = util::StringLiteralSequence<"foo", "bar">;
  using S2 = util::StringLiteralSequence<"baz">;

  static_assert(util::string_literal_sequence_contains_v<S1, "foo">);
  static_assert(!util::string_literal_sequence_contains_v<S1, "baz">);
  static_assert(util::no_overlap_v<S1, S2>);
  static_assert(!util::no_overlap_v<S1, util::StringLiteralSequence<"bar">>);
}

TEST(BoostUtil, program_options) {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  int count = 3;
  double prob = 0.5;
  bool verbose = false;

  po2::options_description raw_desc("Test options");
  auto desc = raw_desc.template add_option<"count", 'c'>(po::value<int>(&count), "count")
                .template add_option<"prob">(po2::default_value("{:.2f}", &prob), "prob")
                .template add_flag<"verbose", "quiet">(&verbose, "be verbose", "be quiet");

  const char* argv[] = {"prog", "-c", "7", "--verbose"};
  po::variables_map vm = po2::parse_args(desc, 4, argv);
  EXPECT_EQ(count, 7);
  EXPECT_EQ(prob, 0.5);
  EXPECT_TRUE(verbose);
  EXPECT_TRUE(vm.count("count"));

  std::ostringstream ss;
  ss << desc;
  EXPECT_NE(ss.str().find("0.50"), std::string::npos) << ss.str();

  const char* bad_argv[] = {"prog", "--bogus"};
  EXPECT_THROW(po2::parse_args(desc, 2, bad_argv), util::CleanException);
}

int main(int argc, char** argv) { return launch_gtest(argc, argv); }
