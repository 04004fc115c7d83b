#pragma once

#include "tictactoe/Constants.hpp"
#include "tictactoe/Types.hpp"

#include <bit>
#include <ostream>
#include <string>

namespace tictactoe {

constexpr mask_t make_mask(int a, int b, int c) {
  return (mask_t(1) << a) + (mask_t(1) << b) + (mask_t(1) << c);
}

/*
 * Bit order encoding for the board:
 *
 * 0 1 2
 * 3 4 5
 * 6 7 8
 *
 * A cell holds at most one mark; x_mask_ and o_mask_ never overlap.
 */
class Board {
 public:
  bool operator==(const Board&) const = default;

  Mark get(const Coord& coord) const { return get(coord.index()); }
  Mark get(int row, int col) const { return get(row * kBoardDimension + col); }
  Mark get(int index) const;

  // Overwrites the cell. Callers are responsible for legality; see Rules::apply_move().
  void set(const Coord& coord, Mark mark);

  mask_t mask(Mark mark) const;
  mask_t occupied_mask() const { return x_mask_ | o_mask_; }
  mask_t empty_mask() const { return kFullBoardMask & ~occupied_mask(); }

  int count(Mark mark) const { return std::popcount(uint32_t(mask(mark))); }
  bool is_full() const { return occupied_mask() == kFullBoardMask; }

  /*
   * Three rows of three characters from "XO_", newline-terminated:
   *
   * "XX_\nOO_\n___\n"
   */
  std::string compact_repr() const;

  /*
   * Inverse of compact_repr(). Whitespace is ignored, so "XX_ OO_ ___" also parses.
   *
   * Raises util::CleanException if the input does not hold exactly 9 cells from "XO_".
   */
  static Board from_repr(const std::string& repr);

  /*
   * Prints the board with cell coordinates alongside:
   *
   *    0 1 2
   * 0 |X|X| |
   * 1 |O|O| |
   * 2 | | | |
   */
  void print(std::ostream& os) const;

 private:
  mask_t x_mask_ = 0;
  mask_t o_mask_ = 0;
};

}  // namespace tictactoe

#include "inline/tictactoe/Board.inl"
