#pragma once

#include "tictactoe/GameState.hpp"
#include "tictactoe/Types.hpp"
#include "tictactoe/ai/EasyStrategy.hpp"

#include <random>

namespace tictactoe {
namespace ai {

/*
 * Picks a move for state.turn using the strategy named by state.difficulty:
 *
 * kEasy   -> easy_move()
 * kMedium -> medium_move()
 * kHard   -> hard_move()
 *
 * prng is only consumed by the easy strategy. The returned coord is always one of
 * Rules::legal_moves(state). Requires !state.is_terminal().
 */
Coord select_move(const GameState& state, std::mt19937& prng, const EasyParams& easy_params = {});

}  // namespace ai
}  // namespace tictactoe
