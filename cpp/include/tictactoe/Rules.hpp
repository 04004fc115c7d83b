#pragma once

#include "tictactoe/Board.hpp"
#include "tictactoe/GameState.hpp"
#include "tictactoe/Types.hpp"

#include <optional>

namespace tictactoe {

struct Rules {
  /*
   * The 8 lines, in the order in which they are scanned: rows top to bottom, columns left to right,
   * main diagonal, anti-diagonal. When more than one line is complete, the first one in this order
   * is the one reported.
   */
  static constexpr Line kLines[kNumLines] = {
    Line{Coord{0, 0}, Coord{0, 1}, Coord{0, 2}}, Line{Coord{1, 0}, Coord{1, 1}, Coord{1, 2}},
    Line{Coord{2, 0}, Coord{2, 1}, Coord{2, 2}}, Line{Coord{0, 0}, Coord{1, 0}, Coord{2, 0}},
    Line{Coord{0, 1}, Coord{1, 1}, Coord{2, 1}}, Line{Coord{0, 2}, Coord{1, 2}, Coord{2, 2}},
    Line{Coord{0, 0}, Coord{1, 1}, Coord{2, 2}}, Line{Coord{0, 2}, Coord{1, 1}, Coord{2, 0}}};

  static constexpr mask_t kLineMasks[kNumLines] = {
    make_mask(0, 1, 2), make_mask(3, 4, 5), make_mask(6, 7, 8), make_mask(0, 3, 6),
    make_mask(1, 4, 7), make_mask(2, 5, 8), make_mask(0, 4, 8), make_mask(2, 4, 6)};

  struct Outcome {
    bool operator==(const Outcome&) const = default;

    GameStatus status = GameStatus::kInProgress;
    Mark winner = Mark::kNone;
    std::optional<Line> winning_line;
  };

  // Fresh game: empty board, X to move.
  static GameState init_state(Difficulty difficulty);

  // Win/draw detection. See kLines for the scan order.
  static Outcome evaluate(const Board& board);

  // The mark whose turn it is by parity: X if the counts are equal, O otherwise.
  static Mark parity_turn(const Board& board);

  /*
   * All empty cells in row-major order. Empty if the game is over.
   */
  static CoordList legal_moves(const GameState& state);

  /*
   * Returns a copy of state with mark placed at coord, turn flipped, and status/winner/winning_line
   * recomputed.
   *
   * Raises InvalidMoveError if the game is over, coord is off the board, the cell is occupied, or
   * mark is not state.turn. state is never modified.
   */
  static GameState apply_move(const GameState& state, const Coord& coord, Mark mark);
  static GameState apply_move(const GameState& state, int row, int col, Mark mark) {
    return apply_move(state, Coord{row, col}, mark);
  }

  /*
   * The first empty cell, in row-major order, that would complete a line of mark's. std::nullopt
   * if there is none.
   */
  static std::optional<Coord> find_completing_move(const Board& board, Mark mark);
};

}  // namespace tictactoe
