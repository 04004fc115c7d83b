#pragma once

#include "tictactoe/GameState.hpp"
#include "tictactoe/SessionStore.hpp"
#include "tictactoe/ai/EasyStrategy.hpp"

#include <boost/json.hpp>

#include <optional>
#include <random>
#include <string>

namespace tictactoe {

/*
 * Request/response front end for the engine. Each request is a JSON object:
 *
 * {"session": "abc", "action": "new", "difficulty": "hard"}
 * {"session": "abc", "action": "state"}
 * {"session": "abc", "action": "move", "row": 1, "col": 1}
 * {"session": "abc", "action": "ai"}
 * {"session": "abc", "action": "reset", "difficulty": "easy"}
 * {"session": "abc", "action": "quit"}
 *
 * Successful responses look like {"success": true, "game": {...}, "message": "..."}, where "game" is
 * the StateCodec encoding of the session's game. A "move" or "ai" response also carries "game_over"
 * and "ai_move" (the computer's reply as [row, col], or null if it did not move). "ai" makes the
 * computer move in a game where it is O's turn, which only happens for a game written to the store
 * by something other than "move". "quit" responses carry no "game".
 *
 * Failed requests get {"success": false, "error": "<title>", "message": "<text for the user>"}.
 * Exception text never appears in a response.
 */
class GameService {
 public:
  struct Params {
    auto make_options_description();

    int max_request_bytes = 1024;
    int max_request_depth = 10;
  };

  GameService(SessionStore& store, std::mt19937& prng, const Params& params = {},
              const ai::EasyParams& easy_params = {});

  boost::json::object handle(const boost::json::object& request);

  // Parses line as a request, dispatches it to handle(), and serializes the response.
  std::string handle_line(const std::string& line);

  // The user-facing description of state, e.g. "Your turn - click a square to play".
  static std::string status_message(const GameState& state);

 private:
  boost::json::object handle_new(const std::string& session_id, const boost::json::object& request);
  boost::json::object handle_state(const std::string& session_id);
  boost::json::object handle_move(const std::string& session_id,
                                  const boost::json::object& request);
  boost::json::object handle_ai(const std::string& session_id);
  boost::json::object handle_reset(const std::string& session_id,
                                   const boost::json::object& request);
  boost::json::object handle_quit(const std::string& session_id);

  // Fetches and decodes the session's game. On failure, *error is set to the response to send.
  std::optional<GameState> load(const std::string& session_id, boost::json::object* error);
  void save(const std::string& session_id, const GameState& state);

  // Plays the computer's reply to state, and returns it as [row, col].
  boost::json::value play_ai_move(GameState* state);
  static boost::json::object move_response(const GameState& state, boost::json::value ai_reply);

  static boost::json::object success_response(const GameState& state);
  static boost::json::object error_response(const std::string& error, const std::string& message);

  SessionStore& store_;
  std::mt19937& prng_;
  const Params params_;
  const ai::EasyParams easy_params_;
};

}  // namespace tictactoe

#include "inline/tictactoe/GameService.inl"
