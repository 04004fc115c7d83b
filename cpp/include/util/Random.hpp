#pragma once

#include <concepts>
#include <iterator>
#include <random>

/*
 * A wrapper around STL's random machinery.
 *
 * Each function takes the std::mt19937 to draw from as its first argument. Code that must be
 * reproducible in tests (for example, the AI strategies) takes the prng as a parameter, and only the
 * outermost caller decides whether to pass default_prng() or a locally seeded generator.
 *
 * To seed the default prng from the cmdline:
 *
 * util::Random::Params random_params;
 *
 * namespace po2 = boost_util::program_options;
 * po2::options_description raw_desc("General options");
 * auto desc = raw_desc.add(random_params.make_options_description());
 * po2::parse_args(desc, ac, av);
 *
 * util::Random::init(random_params);
 */
namespace util {

class Random {
 public:
  struct Params {
    auto make_options_description();

    int seed = 0;
  };

  static void init(const Params&);

  static void set_seed(int seed);

  /*
   * Uniformly randomly picks a value in the half-open range [lower, upper).
   *
   * T and U should be integral types, and lower must be less than upper.
   */
  template <std::integral T, std::integral U>
  static auto uniform_sample(std::mt19937& prng, T lower, U upper);

  /*
   * Produces a random real value in the range [left, right).
   */
  template <typename FloatType>
  static FloatType uniform_real(std::mt19937& prng, FloatType left, FloatType right);

  /*
   * Returns a uniformly random element of the non-empty random-access range [begin, end).
   */
  template <std::random_access_iterator T>
  static auto choose(std::mt19937& prng, T begin, T end);

  static std::mt19937& default_prng();
};

}  // namespace util

#include "inline/util/Random.inl"
