#pragma once

#include "tictactoe/GameState.hpp"

#include <boost/json.hpp>

#include <string>

namespace tictactoe {

/*
 * Converts GameState to and from the JSON form kept in the session store:
 *
 * {
 *   "board" : [["X", "", ""], ["", "O", ""], ["", "", ""]],
 *   "current_player" : "X",
 *   "game_status" : "playing",      // "playing" | "won" | "draw"
 *   "winner" : null,                // "X" | "O" | null
 *   "winning_line" : null,          // [[r, c], [r, c], [r, c]] | null
 *   "difficulty" : "medium"         // "easy" | "medium" | "hard"
 * }
 *
 * decode(encode(s)) == s for every state reachable through Rules::apply_move().
 */
struct StateCodec {
  static boost::json::object encode(const GameState& state);

  /*
   * Raises MalformedStateError if jv is not of the above shape, or if it describes a position that
   * cannot arise in a game: unbalanced mark counts, a current_player that disagrees with the mark
   * counts, or a game_status/winner/winning_line that disagrees with the board.
   */
  static GameState decode(const boost::json::value& jv);

  static std::string encode_to_string(const GameState& state);

  // Like decode(), but also raises MalformedStateError if str is not valid JSON.
  static GameState decode_from_string(const std::string& str);
};

}  // namespace tictactoe
