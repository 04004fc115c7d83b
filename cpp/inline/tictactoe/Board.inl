#include "tictactoe/Board.hpp"

#include "util/Asserts.hpp"
#include "util/Exceptions.hpp"

#include <cctype>

namespace tictactoe {

inline Mark Board::get(int index) const {
  mask_t bit = mask_t(1) << index;
  if (x_mask_ & bit) return Mark::kX;
  if (o_mask_ & bit) return Mark::kO;
  return Mark::kNone;
}

inline void Board::set(const Coord& coord, Mark mark) {
  DEBUG_ASSERT(coord.in_bounds(), "bad coord ({}, {})", coord.row, coord.col);
  mask_t bit = mask_t(1) << coord.index();
  x_mask_ &= ~bit;
  o_mask_ &= ~bit;
  if (mark == Mark::kX) {
    x_mask_ |= bit;
  } else if (mark == Mark::kO) {
    o_mask_ |= bit;
  }
}

inline mask_t Board::mask(Mark mark) const {
  switch (mark) {
    case Mark::kX:
      return x_mask_;
    case Mark::kO:
      return o_mask_;
    default:
      return empty_mask();
  }
}

inline std::string Board::compact_repr() const {
  std::string s;
  s.reserve(kNumCells + kBoardDimension);
  for (int row = 0; row < kBoardDimension; ++row) {
    for (int col = 0; col < kBoardDimension; ++col) {
      Mark mark = get(row, col);
      s += (mark == Mark::kNone) ? '_' : mark_to_str(mark)[0];
    }
    s += '\n';
  }
  return s;
}

inline Board Board::from_repr(const std::string& repr) {
  Board board;
  int index = 0;
  for (char c : repr) {
    if (std::isspace(static_cast<unsigned char>(c))) continue;
    if (index >= kNumCells) {
      throw util::CleanException("Too many cells in board repr \"{}\"", repr);
    }
    Coord coord = Coord::from_index(index++);
    switch (c) {
      case 'X':
        board.set(coord, Mark::kX);
        break;
      case 'O':
        board.set(coord, Mark::kO);
        break;
      case '_':
        break;
      default:
        throw util::CleanException("Unexpected char '{}' in board repr \"{}\"", c, repr);
    }
  }
  if (index != kNumCells) {
    throw util::CleanException("Too few cells in board repr \"{}\"", repr);
  }
  return board;
}

inline void Board::print(std::ostream& os) const {
  os << "   0 1 2\n";
  for (int row = 0; row < kBoardDimension; ++row) {
    os << row << " |";
    for (int col = 0; col < kBoardDimension; ++col) {
      Mark mark = get(row, col);
      os << (mark == Mark::kNone ? " " : mark_to_str(mark)) << '|';
    }
    os << '\n';
  }
}

}  // namespace tictactoe
