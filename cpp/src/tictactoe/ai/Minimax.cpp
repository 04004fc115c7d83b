#include "tictactoe/ai/Minimax.hpp"

#include "tictactoe/Rules.hpp"
#include "util/Asserts.hpp"
#include "util/LoggingUtil.hpp"

#include <algorithm>

namespace tictactoe {
namespace ai {

Minimax::Result Minimax::search(const GameState& state, const Params& params) {
  RELEASE_ASSERT(!state.is_terminal(), "Minimax::search() called on a finished game");

  Context context{state.turn, params.alpha_beta};
  context.nodes_visited = 1;

  Result result;
  int best = -kInfinity;
  int alpha = -kInfinity;
  int beta = kInfinity;

  for (const Coord& move : Rules::legal_moves(state)) {
    Board child = state.board;
    child.set(move, state.turn);
    int score = evaluate_node(context, child, opponent(state.turn), 1, alpha, beta);
    if (score > best) {
      best = score;
      result.move = move;
    }
    if (context.alpha_beta) {
      alpha = std::max(alpha, score);
    }
  }

  RELEASE_ASSERT(best > -kInfinity, "no legal move found");
  result.score = best;
  result.nodes_visited = context.nodes_visited;

  LOG_DEBUG("Minimax: move=({}, {}) score={} nodes={} alpha_beta={}", result.move.row,
            result.move.col, result.score, result.nodes_visited, params.alpha_beta);
  return result;
}

int Minimax::evaluate_node(Context& context, const Board& board, Mark to_move, int depth,
                           int alpha, int beta) {
  context.nodes_visited++;

  Rules::Outcome outcome = Rules::evaluate(board);
  if (outcome.status == GameStatus::kWon) {
    return outcome.winner == context.maximizer ? kWinScore - depth : -kWinScore + depth;
  }
  if (outcome.status == GameStatus::kDraw) {
    return kDrawScore;
  }

  bool maximizing = (to_move == context.maximizer);
  int best = maximizing ? -kInfinity : kInfinity;

  mask_t empty = board.empty_mask();
  for (int i = 0; i < kNumCells; ++i) {
    if (!(empty & (mask_t(1) << i))) continue;

    Board child = board;
    child.set(Coord::from_index(i), to_move);
    int score = evaluate_node(context, child, opponent(to_move), depth + 1, alpha, beta);

    if (maximizing) {
      best = std::max(best, score);
      if (context.alpha_beta) alpha = std::max(alpha, score);
    } else {
      best = std::min(best, score);
      if (context.alpha_beta) beta = std::min(beta, score);
    }
    if (context.alpha_beta && alpha >= beta) break;
  }
  return best;
}

Coord hard_move(const GameState& state) { return Minimax::search(state).move; }

}  // namespace ai
}  // namespace tictactoe
