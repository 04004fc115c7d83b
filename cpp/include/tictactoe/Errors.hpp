#pragma once

#include "util/Exceptions.hpp"

namespace tictactoe {

/*
 * The engine's three failure kinds. All are caller errors, hence util::CleanException's. An
 * operation that throws one of these has not modified anything.
 */

// Occupied cell, out-of-range coordinate, wrong turn, or a move on a finished game.
class InvalidMoveError : public util::CleanException {
 public:
  using util::CleanException::CleanException;
};

// An AI move was requested when it is not the computer's turn, or the game is over.
class NotAITurnError : public util::CleanException {
 public:
  using util::CleanException::CleanException;
};

// A serialized state that does not describe a reachable game.
class MalformedStateError : public util::CleanException {
 public:
  using util::CleanException::CleanException;
};

}  // namespace tictactoe
