#pragma once

#include "tictactoe/Board.hpp"
#include "tictactoe/GameState.hpp"
#include "tictactoe/Types.hpp"

#include <cstdint>

namespace tictactoe {
namespace ai {

/*
 * Exhaustive minimax search for the player to move (state.turn), who is the maximizer.
 *
 * A finished position d plies below the root scores:
 *
 *   +(kWinScore - d)  if the maximizer has won
 *   -(kWinScore - d)  if the opponent has won
 *   kDrawScore        if drawn
 *
 * so the search prefers the quickest win and the slowest loss. Children are visited in
 * Rules::legal_moves() order, and a child only displaces the current best if its score is strictly
 * better, so ties go to the first move in row-major order.
 *
 * Alpha-beta pruning can be switched off. With pruning on, the scores of non-chosen root moves may
 * be bounds rather than exact values, but the chosen move and its score are always identical to
 * the unpruned search.
 */
class Minimax {
 public:
  struct Params {
    bool alpha_beta = true;
  };

  struct Result {
    Coord move;
    int score = 0;
    int64_t nodes_visited = 0;
  };

  /*
   * Requires !state.is_terminal().
   */
  static Result search(const GameState& state, const Params& params);
  static Result search(const GameState& state) { return search(state, Params{}); }

 private:
  static constexpr int kInfinity = 1000;

  struct Context {
    Mark maximizer;
    bool alpha_beta;
    int64_t nodes_visited = 0;
  };

  static int evaluate_node(Context& context, const Board& board, Mark to_move, int depth,
                           int alpha, int beta);
};

// The hard AI's move: Minimax::search(state).move.
Coord hard_move(const GameState& state);

}  // namespace ai
}  // namespace tictactoe
