#include "tictactoe/ai/EasyStrategy.hpp"

#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

namespace tictactoe {
namespace ai {

inline auto EasyParams::make_options_description() {
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Easy AI options");
  return desc.template add_option<"easy-random-prob">(
    po2::default_value("{:.2f}", &random_move_prob),
    "probability (0-1) that the easy AI plays a random move instead of blocking");
}

}  // namespace ai
}  // namespace tictactoe
