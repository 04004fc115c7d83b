#include "tictactoe/Types.hpp"

#include "util/StringUtil.hpp"

namespace tictactoe {

inline bool Coord::in_bounds() const {
  return row >= 0 && row < kBoardDimension && col >= 0 && col < kBoardDimension;
}

inline Coord Coord::from_index(int index) {
  return Coord{index / kBoardDimension, index % kBoardDimension};
}

inline const char* mark_to_str(Mark mark) {
  switch (mark) {
    case Mark::kX:
      return "X";
    case Mark::kO:
      return "O";
    default:
      return "";
  }
}

inline const char* status_to_str(GameStatus status) {
  switch (status) {
    case GameStatus::kWon:
      return "won";
    case GameStatus::kDraw:
      return "draw";
    default:
      return "playing";
  }
}

inline const char* difficulty_to_str(Difficulty difficulty) {
  switch (difficulty) {
    case Difficulty::kEasy:
      return "easy";
    case Difficulty::kHard:
      return "hard";
    default:
      return "medium";
  }
}

inline std::optional<Difficulty> parse_difficulty(const std::string& name) {
  std::string s = util::to_lower(name);
  for (Difficulty d : {Difficulty::kEasy, Difficulty::kMedium, Difficulty::kHard}) {
    if (s == difficulty_to_str(d)) return d;
  }
  return std::nullopt;
}

inline std::ostream& operator<<(std::ostream& os, const Coord& coord) {
  return os << "(" << coord.row << ", " << coord.col << ")";
}

inline std::ostream& operator<<(std::ostream& os, Mark mark) {
  return os << (mark == Mark::kNone ? "None" : mark_to_str(mark));
}

inline std::ostream& operator<<(std::ostream& os, GameStatus status) {
  return os << status_to_str(status);
}

inline std::ostream& operator<<(std::ostream& os, Difficulty difficulty) {
  return os << difficulty_to_str(difficulty);
}

}  // namespace tictactoe
