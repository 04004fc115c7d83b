#include "tictactoe/Engine.hpp"

#include "tictactoe/Errors.hpp"
#include "tictactoe/Rules.hpp"
#include "tictactoe/ai/Strategy.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

namespace tictactoe {

namespace {

void log_outcome(const GameState& state) {
  if (state.status == GameStatus::kWon) {
    LOG_INFO("Game over: {} wins", mark_to_str(state.winner));
  } else if (state.status == GameStatus::kDraw) {
    LOG_INFO("Game over: draw");
  }
}

}  // namespace

GameState Engine::new_game(Difficulty difficulty) {
  LOG_INFO("New game (difficulty={})", difficulty_to_str(difficulty));
  return Rules::init_state(difficulty);
}

GameState Engine::move(const GameState& state, int row, int col) {
  GameState next = Rules::apply_move(state, row, col, kHumanMark);
  LOG_INFO("{} plays ({}, {})", mark_to_str(kHumanMark), row, col);
  log_outcome(next);
  return next;
}

GameState Engine::ai_move(const GameState& state, std::mt19937& prng,
                          const ai::EasyParams& easy_params) {
  if (state.is_terminal()) {
    throw NotAITurnError("Game is over");
  }
  if (state.turn != kComputerMark) {
    throw NotAITurnError("It is not the computer's turn");
  }

  Coord coord = ai::select_move(state, prng, easy_params);
  GameState next = Rules::apply_move(state, coord, kComputerMark);
  LOG_INFO("{} plays ({}, {}) [{}]", mark_to_str(kComputerMark), coord.row, coord.col,
           difficulty_to_str(state.difficulty));
  log_outcome(next);
  return next;
}

GameState Engine::ai_move(const GameState& state) {
  return ai_move(state, util::Random::default_prng());
}

}  // namespace tictactoe
