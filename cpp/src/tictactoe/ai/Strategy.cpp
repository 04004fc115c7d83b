#include "tictactoe/ai/Strategy.hpp"

#include "tictactoe/ai/MediumStrategy.hpp"
#include "tictactoe/ai/Minimax.hpp"
#include "util/Exceptions.hpp"

namespace tictactoe {
namespace ai {

Coord select_move(const GameState& state, std::mt19937& prng, const EasyParams& easy_params) {
  switch (state.difficulty) {
    case Difficulty::kEasy:
      return easy_move(state, prng, easy_params);
    case Difficulty::kMedium:
      return medium_move(state);
    case Difficulty::kHard:
      return hard_move(state);
    default:
      throw util::Exception("Unknown difficulty: {}", static_cast<int>(state.difficulty));
  }
}

}  // namespace ai
}  // namespace tictactoe
