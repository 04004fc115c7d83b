#include "util/Random.hpp"

#include <chrono>

namespace util {

std::mt19937& Random::default_prng() {
  static std::mt19937 prng(
    static_cast<std::mt19937::result_type>(std::chrono::steady_clock::now().time_since_epoch().count()));
  return prng;
}

}  // namespace util
