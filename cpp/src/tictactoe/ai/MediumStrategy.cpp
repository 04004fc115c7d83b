#include "tictactoe/ai/MediumStrategy.hpp"

#include "tictactoe/Rules.hpp"
#include "util/Asserts.hpp"

namespace tictactoe {
namespace ai {

namespace {

constexpr Coord kCenter{1, 1};
constexpr Coord kCorners[] = {Coord{0, 0}, Coord{0, 2}, Coord{2, 0}, Coord{2, 2}};

}  // namespace

Coord medium_move(const GameState& state) {
  RELEASE_ASSERT(!state.is_terminal(), "medium_move() called on a finished game");

  const Board& board = state.board;
  Mark me = state.turn;

  if (std::optional<Coord> win = Rules::find_completing_move(board, me)) {
    return *win;
  }
  if (std::optional<Coord> block = Rules::find_completing_move(board, opponent(me))) {
    return *block;
  }
  if (board.get(kCenter) == Mark::kNone) {
    return kCenter;
  }
  for (const Coord& corner : kCorners) {
    if (board.get(corner) == Mark::kNone) return corner;
  }

  CoordList moves = Rules::legal_moves(state);
  RELEASE_ASSERT(!moves.empty());
  return moves.front();
}

}  // namespace ai
}  // namespace tictactoe
