#pragma once

#include "tictactoe/Constants.hpp"

#include <array>
#include <compare>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace tictactoe {

/*
 * The content of a cell, or the winner of a game. kNone means an empty cell, or no winner.
 *
 * X is always the human and always moves first. O is always the computer.
 */
enum class Mark : int8_t { kNone, kX, kO };

enum class GameStatus : int8_t { kInProgress, kWon, kDraw };

enum class Difficulty : int8_t { kEasy, kMedium, kHard };

constexpr Mark kHumanMark = Mark::kX;
constexpr Mark kComputerMark = Mark::kO;

// X <-> O. Undefined for kNone.
constexpr Mark opponent(Mark mark) { return mark == Mark::kX ? Mark::kO : Mark::kX; }

struct Coord {
  auto operator<=>(const Coord&) const = default;

  // Index into the bit order encoding of Board.
  int index() const { return row * kBoardDimension + col; }
  bool in_bounds() const;
  static Coord from_index(int index);

  int row = 0;
  int col = 0;
};

using Line = std::array<Coord, 3>;
using CoordList = std::vector<Coord>;

const char* mark_to_str(Mark mark);  // "X", "O", or ""
const char* status_to_str(GameStatus status);  // "playing", "won", "draw"
const char* difficulty_to_str(Difficulty difficulty);  // "easy", "medium", "hard"

/*
 * Parses the names produced by difficulty_to_str(), case-insensitively. Returns std::nullopt for
 * anything else.
 */
std::optional<Difficulty> parse_difficulty(const std::string& name);

std::ostream& operator<<(std::ostream& os, const Coord& coord);
std::ostream& operator<<(std::ostream& os, Mark mark);
std::ostream& operator<<(std::ostream& os, GameStatus status);
std::ostream& operator<<(std::ostream& os, Difficulty difficulty);

}  // namespace tictactoe

#include "inline/tictactoe/Types.inl"
