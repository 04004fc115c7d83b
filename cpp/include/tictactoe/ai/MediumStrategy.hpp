#pragma once

#include "tictactoe/GameState.hpp"
#include "tictactoe/Types.hpp"

namespace tictactoe {
namespace ai {

/*
 * Deterministic rule-based play for state.turn. The first applicable rule wins:
 *
 * 1. complete one of our own lines
 * 2. occupy the cell where the opponent would complete a line
 * 3. take the center
 * 4. take a corner, scanning (0,0), (0,2), (2,0), (2,2)
 * 5. take the first empty cell in row-major order
 *
 * Requires !state.is_terminal().
 */
Coord medium_move(const GameState& state);

}  // namespace ai
}  // namespace tictactoe
