#pragma once

#include "tictactoe/GameState.hpp"
#include "tictactoe/Types.hpp"

#include <random>

namespace tictactoe {
namespace ai {

struct EasyParams {
  /*
   * Probability of playing a uniformly random legal move. Otherwise, the strategy blocks an
   * immediate opponent win if there is one, and falls back to a random move if there isn't.
   */
  double random_move_prob = 0.8;

  auto make_options_description();
};

/*
 * Requires !state.is_terminal(). All randomness comes from prng, so a seeded prng reproduces the
 * same sequence of moves.
 */
Coord easy_move(const GameState& state, std::mt19937& prng, const EasyParams& params = {});

}  // namespace ai
}  // namespace tictactoe

#include "inline/tictactoe/ai/EasyStrategy.inl"
