#include "tictactoe/ai/EasyStrategy.hpp"

#include "tictactoe/Rules.hpp"
#include "util/Asserts.hpp"
#include "util/Random.hpp"

namespace tictactoe {
namespace ai {

Coord easy_move(const GameState& state, std::mt19937& prng, const EasyParams& params) {
  CoordList moves = Rules::legal_moves(state);
  RELEASE_ASSERT(!moves.empty(), "easy_move() called on a finished game");

  if (util::Random::uniform_real(prng, 0.0, 1.0) >= params.random_move_prob) {
    std::optional<Coord> block = Rules::find_completing_move(state.board, opponent(state.turn));
    if (block) return *block;
  }
  return util::Random::choose(prng, moves.begin(), moves.end());
}

}  // namespace ai
}  // namespace tictactoe
