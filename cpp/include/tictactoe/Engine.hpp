#pragma once

#include "tictactoe/GameState.hpp"
#include "tictactoe/Types.hpp"
#include "tictactoe/ai/EasyStrategy.hpp"

#include <random>

namespace tictactoe {

/*
 * The public entry points of the game engine. Every function takes a state by const-ref and returns
 * a new state; on error, an exception from tictactoe/Errors.hpp is raised and no state changes.
 *
 * The human always plays X (kHumanMark) and moves first. The computer plays O (kComputerMark).
 */
struct Engine {
  static GameState new_game(Difficulty difficulty);

  // Human move. Raises InvalidMoveError.
  static GameState move(const GameState& state, int row, int col);

  /*
   * Computer move, chosen by the strategy named by state.difficulty.
   *
   * Raises NotAITurnError unless the game is in progress and it is the computer's turn.
   */
  static GameState ai_move(const GameState& state, std::mt19937& prng,
                           const ai::EasyParams& easy_params = {});

  // Same as above, using util::Random::default_prng().
  static GameState ai_move(const GameState& state);
};

}  // namespace tictactoe
