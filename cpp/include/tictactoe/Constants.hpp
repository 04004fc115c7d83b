#pragma once

#include <cstdint>

namespace tictactoe {

using mask_t = uint16_t;
const int kBoardDimension = 3;
const int kNumCells = kBoardDimension * kBoardDimension;
const int kNumLines = 8;

const mask_t kFullBoardMask = (mask_t(1) << kNumCells) - 1;

// Minimax scores. A win found d plies below the search root scores kWinScore - d.
const int kWinScore = 10;
const int kDrawScore = 0;

}  // namespace tictactoe
