#include "tictactoe/GameState.hpp"

namespace tictactoe {

inline std::ostream& operator<<(std::ostream& os, const GameState& state) {
  state.board.print(os);
  os << "turn=" << state.turn << " status=" << state.status << " difficulty=" << state.difficulty;
  if (state.status == GameStatus::kWon) {
    os << " winner=" << state.winner << " line=";
    for (const Coord& coord : *state.winning_line) {
      os << coord;
    }
  }
  return os;
}

}  // namespace tictactoe
