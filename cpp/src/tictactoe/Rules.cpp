#include "tictactoe/Rules.hpp"

#include "tictactoe/Errors.hpp"

namespace tictactoe {

GameState Rules::init_state(Difficulty difficulty) {
  GameState state;
  state.difficulty = difficulty;
  return state;
}

Rules::Outcome Rules::evaluate(const Board& board) {
  Outcome outcome;

  for (int i = 0; i < kNumLines; ++i) {
    mask_t line_mask = kLineMasks[i];
    for (Mark mark : {Mark::kX, Mark::kO}) {
      if ((board.mask(mark) & line_mask) == line_mask) {
        outcome.status = GameStatus::kWon;
        outcome.winner = mark;
        outcome.winning_line = kLines[i];
        return outcome;
      }
    }
  }

  if (board.is_full()) {
    outcome.status = GameStatus::kDraw;
  }
  return outcome;
}

Mark Rules::parity_turn(const Board& board) {
  return board.count(Mark::kX) == board.count(Mark::kO) ? Mark::kX : Mark::kO;
}

CoordList Rules::legal_moves(const GameState& state) {
  CoordList moves;
  if (state.is_terminal()) return moves;

  mask_t empty = state.board.empty_mask();
  for (int i = 0; i < kNumCells; ++i) {
    if (empty & (mask_t(1) << i)) {
      moves.push_back(Coord::from_index(i));
    }
  }
  return moves;
}

GameState Rules::apply_move(const GameState& state, const Coord& coord, Mark mark) {
  if (state.is_terminal()) {
    throw InvalidMoveError("Game is over ({})", status_to_str(state.status));
  }
  if (!coord.in_bounds()) {
    throw InvalidMoveError("Coordinate ({}, {}) is off the board", coord.row, coord.col);
  }
  if (state.board.get(coord) != Mark::kNone) {
    throw InvalidMoveError("Cell ({}, {}) is already taken", coord.row, coord.col);
  }
  if (mark != state.turn) {
    throw InvalidMoveError("It is {}'s turn, not {}'s", mark_to_str(state.turn),
                           mark == Mark::kNone ? "nobody" : mark_to_str(mark));
  }

  GameState next = state;
  next.board.set(coord, mark);
  next.turn = opponent(mark);

  Outcome outcome = evaluate(next.board);
  next.status = outcome.status;
  next.winner = outcome.winner;
  next.winning_line = outcome.winning_line;
  return next;
}

std::optional<Coord> Rules::find_completing_move(const Board& board, Mark mark) {
  mask_t empty = board.empty_mask();
  mask_t mine = board.mask(mark);

  for (int i = 0; i < kNumCells; ++i) {
    mask_t bit = mask_t(1) << i;
    if (!(empty & bit)) continue;

    mask_t after = mine | bit;
    for (mask_t line_mask : kLineMasks) {
      if ((line_mask & bit) && (after & line_mask) == line_mask) {
        return Coord::from_index(i);
      }
    }
  }
  return std::nullopt;
}

}  // namespace tictactoe
