#include "tictactoe/GameService.hpp"

#include "tictactoe/Engine.hpp"
#include "tictactoe/Errors.hpp"
#include "tictactoe/StateCodec.hpp"
#include "util/LoggingUtil.hpp"

#include <bit>
#include <cstdint>
#include <format>
#include <utility>

namespace tictactoe {

namespace {

// Sets *difficulty from the request's "difficulty" field, if it has one. Returns false if the field
// is present but does not name a difficulty.
bool read_difficulty(const boost::json::object& request, Difficulty* difficulty) {
  const boost::json::value* jv = request.if_contains("difficulty");
  if (!jv || jv->is_null()) return true;
  if (!jv->is_string()) return false;

  std::optional<Difficulty> parsed = parse_difficulty(jv->get_string().c_str());
  if (!parsed) return false;
  *difficulty = *parsed;
  return true;
}

bool read_coordinate(const boost::json::value& jv, int64_t* out) {
  if (jv.is_int64()) {
    *out = jv.get_int64();
    return true;
  }
  if (jv.is_uint64()) {
    // Anything that only fits in a uint64 is out of range anyway.
    *out = INT64_MAX;
    return true;
  }
  return false;
}

}  // namespace

GameService::GameService(SessionStore& store, std::mt19937& prng, const Params& params,
                         const ai::EasyParams& easy_params)
    : store_(store), prng_(prng), params_(params), easy_params_(easy_params) {}

boost::json::object GameService::handle(const boost::json::object& request) {
  const boost::json::value* session = request.if_contains("session");
  if (!session || !session->is_string() || session->get_string().empty()) {
    LOG_WARN("Rejecting request without a session id");
    return error_response("Invalid input", "Request must include a session id");
  }
  std::string session_id = session->get_string().c_str();

  const boost::json::value* action = request.if_contains("action");
  if (!action || !action->is_string()) {
    LOG_WARN("Rejecting request without an action (session={})", session_id);
    return error_response("Invalid input", "Request must include an action");
  }
  std::string action_name = action->get_string().c_str();

  LOG_INFO("Request: session={} action={}", session_id, action_name);

  if (action_name == "new") return handle_new(session_id, request);
  if (action_name == "state") return handle_state(session_id);
  if (action_name == "move") return handle_move(session_id, request);
  if (action_name == "ai") return handle_ai(session_id);
  if (action_name == "reset") return handle_reset(session_id, request);
  if (action_name == "quit") return handle_quit(session_id);

  LOG_WARN("Unknown action \"{}\" (session={})", action_name, session_id);
  return error_response("Unknown action",
                        "Action must be one of: new, state, move, ai, reset, quit");
}

std::string GameService::handle_line(const std::string& line) {
  boost::json::object response;

  if (line.size() > size_t(params_.max_request_bytes)) {
    LOG_WARN("Rejecting request of {} bytes", line.size());
    response = error_response("Invalid input", std::format("Request too large: {} bytes > {} bytes",
                                                           line.size(), params_.max_request_bytes));
    return boost::json::serialize(response);
  }

  boost::json::parse_options options;
  options.max_depth = params_.max_request_depth;

  boost::json::error_code ec;
  boost::json::value jv = boost::json::parse(line, ec, {}, options);
  if (ec == boost::json::error::too_deep) {
    LOG_WARN("Rejecting request nested more than {} levels deep", params_.max_request_depth);
    response = error_response("Invalid input", "JSON nesting too deep");
  } else if (ec || !jv.is_object()) {
    LOG_WARN("Rejecting request that is not a JSON object");
    response = error_response("Invalid JSON", "Request body must be a JSON object");
  } else {
    response = handle(jv.get_object());
  }
  return boost::json::serialize(response);
}

std::string GameService::status_message(const GameState& state) {
  switch (state.status) {
    case GameStatus::kWon:
      return state.winner == kHumanMark ? "You won! Congratulations!" : "Computer won! Try again!";
    case GameStatus::kDraw:
      return "It's a draw! Good game!";
    default:
      break;
  }
  return state.turn == kHumanMark ? "Your turn - click a square to play" : "Computer's turn...";
}

boost::json::object GameService::handle_new(const std::string& session_id,
                                            const boost::json::object& request) {
  Difficulty difficulty = Difficulty::kMedium;
  if (!read_difficulty(request, &difficulty)) {
    return error_response("Invalid difficulty level",
                          "Invalid difficulty. Must be one of: easy, medium, hard");
  }

  GameState state = Engine::new_game(difficulty);
  save(session_id, state);
  return success_response(state);
}

boost::json::object GameService::handle_state(const std::string& session_id) {
  boost::json::object error;
  std::optional<GameState> state = load(session_id, &error);
  if (!state) return error;
  return success_response(*state);
}

boost::json::object GameService::handle_move(const std::string& session_id,
                                             const boost::json::object& request) {
  const boost::json::value* row_jv = request.if_contains("row");
  const boost::json::value* col_jv = request.if_contains("col");
  if (!row_jv || !col_jv) {
    return error_response("Missing required fields", "Both row and col are required");
  }

  int64_t row;
  int64_t col;
  if (!read_coordinate(*row_jv, &row) || !read_coordinate(*col_jv, &col)) {
    return error_response("Invalid move coordinates", "Coordinates must be integers");
  }
  if (row < 0 || row >= kBoardDimension || col < 0 || col >= kBoardDimension) {
    return error_response("Invalid move coordinates", "Coordinates must be between 0 and 2");
  }

  boost::json::object error;
  std::optional<GameState> state = load(session_id, &error);
  if (!state) return error;

  if (state->is_terminal()) {
    return error_response("Game not active", std::format("Game is {}. Start a new game to continue.",
                                                         status_to_str(state->status)));
  }
  if (state->turn != kHumanMark) {
    return error_response("Not your turn", "Wait for your turn to make a move");
  }

  GameState next;
  try {
    next = Engine::move(*state, int(row), int(col));
  } catch (const InvalidMoveError& e) {
    LOG_WARN("Rejected move (session={}): {}", session_id, e.what());
    return error_response("Invalid move", "That position is already taken or move is not valid");
  }

  boost::json::value ai_reply = nullptr;
  if (!next.is_terminal()) {
    ai_reply = play_ai_move(&next);
  }

  save(session_id, next);
  return move_response(next, ai_reply);
}

boost::json::object GameService::handle_ai(const std::string& session_id) {
  boost::json::object error;
  std::optional<GameState> state = load(session_id, &error);
  if (!state) return error;

  boost::json::value ai_reply;
  try {
    ai_reply = play_ai_move(&*state);
  } catch (const NotAITurnError& e) {
    LOG_WARN("Rejected computer move (session={}): {}", session_id, e.what());
    if (state->is_terminal()) {
      return error_response("Game not active",
                            std::format("Game is {}. Start a new game to continue.",
                                        status_to_str(state->status)));
    }
    return error_response("Not computer's turn", "The computer moves after you do");
  }

  save(session_id, *state);
  return move_response(*state, ai_reply);
}

boost::json::object GameService::handle_reset(const std::string& session_id,
                                              const boost::json::object& request) {
  Difficulty difficulty = Difficulty::kMedium;

  // Keep the current game's difficulty unless the request names one. A stored game that does not
  // decode is simply replaced.
  std::optional<std::string> stored = store_.get(session_id);
  if (stored) {
    try {
      difficulty = StateCodec::decode_from_string(*stored).difficulty;
    } catch (const MalformedStateError& e) {
      LOG_WARN("Replacing corrupted game (session={}): {}", session_id, e.what());
    }
  }

  if (!read_difficulty(request, &difficulty)) {
    return error_response("Invalid difficulty level",
                          "Invalid difficulty. Must be one of: easy, medium, hard");
  }

  GameState state = Engine::new_game(difficulty);
  save(session_id, state);
  return success_response(state);
}

boost::json::object GameService::handle_quit(const std::string& session_id) {
  store_.erase(session_id);
  LOG_INFO("Game ended (session={})", session_id);

  boost::json::object response;
  response["success"] = true;
  response["message"] = "Game ended successfully";
  return response;
}

std::optional<GameState> GameService::load(const std::string& session_id,
                                           boost::json::object* error) {
  std::optional<std::string> stored = store_.get(session_id);
  if (!stored) {
    *error = error_response("No active game", "Please start a new game first");
    return std::nullopt;
  }

  try {
    return StateCodec::decode_from_string(*stored);
  } catch (const MalformedStateError& e) {
    LOG_WARN("Discarding corrupted game (session={}): {}", session_id, e.what());
    store_.erase(session_id);
    *error = error_response("Invalid game data", "Game session corrupted. Please start a new game.");
    return std::nullopt;
  }
}

void GameService::save(const std::string& session_id, const GameState& state) {
  store_.put(session_id, StateCodec::encode_to_string(state));
}

boost::json::value GameService::play_ai_move(GameState* state) {
  GameState after_ai = Engine::ai_move(*state, prng_, easy_params_);
  mask_t placed = after_ai.board.occupied_mask() ^ state->board.occupied_mask();
  Coord coord = Coord::from_index(std::countr_zero(placed));
  *state = after_ai;
  return boost::json::array{coord.row, coord.col};
}

boost::json::object GameService::move_response(const GameState& state,
                                               boost::json::value ai_reply) {
  boost::json::object response = success_response(state);
  response["game_over"] = state.is_terminal();
  response["ai_move"] = std::move(ai_reply);
  return response;
}

boost::json::object GameService::success_response(const GameState& state) {
  boost::json::object response;
  response["success"] = true;
  response["game"] = StateCodec::encode(state);
  response["message"] = status_message(state);
  return response;
}

boost::json::object GameService::error_response(const std::string& error,
                                                const std::string& message) {
  boost::json::object response;
  response["success"] = false;
  response["error"] = error;
  response["message"] = message;
  return response;
}

}  // namespace tictactoe
