#pragma once

#include "tictactoe/Board.hpp"
#include "tictactoe/Types.hpp"

#include <optional>
#include <ostream>

namespace tictactoe {

/*
 * A complete, self-contained game. Values of this type are passed in and returned by the engine;
 * nothing in the engine holds on to one between calls.
 *
 * Invariants (enforced by Rules::apply_move() and StateCodec::decode()):
 *
 * - count(X) - count(O) is 0 or 1, and turn is X exactly when the counts are equal.
 * - status == kWon  <=> winner != kNone and winning_line holds three of winner's marks.
 * - status == kDraw  => the board is full and no line is complete.
 * - status == kInProgress => winner == kNone and !winning_line.
 */
struct GameState {
  bool operator==(const GameState&) const = default;

  bool is_terminal() const { return status != GameStatus::kInProgress; }

  Board board;
  Mark turn = Mark::kX;
  GameStatus status = GameStatus::kInProgress;
  Mark winner = Mark::kNone;
  std::optional<Line> winning_line;
  Difficulty difficulty = Difficulty::kMedium;
};

std::ostream& operator<<(std::ostream& os, const GameState& state);

}  // namespace tictactoe

#include "inline/tictactoe/GameState.inl"
