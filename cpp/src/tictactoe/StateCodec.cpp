#include "tictactoe/StateCodec.hpp"

#include "tictactoe/Errors.hpp"
#include "tictactoe/Rules.hpp"

#include <cstdint>
#include <string>

namespace tictactoe {

namespace {

const boost::json::value& get_field(const boost::json::object& obj, const char* name) {
  const boost::json::value* jv = obj.if_contains(name);
  if (!jv) {
    throw MalformedStateError("Missing field '{}'", name);
  }
  return *jv;
}

// Fields that may be omitted entirely, in which case they read as null.
const boost::json::value& get_optional_field(const boost::json::object& obj, const char* name) {
  static const boost::json::value kNull;
  const boost::json::value* jv = obj.if_contains(name);
  return jv ? *jv : kNull;
}

std::string get_string(const boost::json::value& jv, const char* what) {
  if (!jv.is_string()) {
    throw MalformedStateError("Expected a string for {}", what);
  }
  return jv.get_string().c_str();
}

int get_int(const boost::json::value& jv, const char* what) {
  if (jv.is_int64()) {
    int64_t x = jv.get_int64();
    if (x >= 0 && x < kBoardDimension) return int(x);
  } else if (jv.is_uint64()) {
    uint64_t x = jv.get_uint64();
    if (x < uint64_t(kBoardDimension)) return int(x);
  }
  throw MalformedStateError("Expected an integer in [0, {}) for {}", kBoardDimension, what);
}

const boost::json::array& get_array(const boost::json::value& jv, size_t size, const char* what) {
  if (!jv.is_array() || jv.get_array().size() != size) {
    throw MalformedStateError("Expected an array of length {} for {}", size, what);
  }
  return jv.get_array();
}

Mark parse_mark(const std::string& s, bool allow_empty, const char* what) {
  if (s == "X") return Mark::kX;
  if (s == "O") return Mark::kO;
  if (allow_empty && s.empty()) return Mark::kNone;
  throw MalformedStateError("Invalid value \"{}\" for {}", s, what);
}

GameStatus parse_status(const std::string& s) {
  for (GameStatus status : {GameStatus::kInProgress, GameStatus::kWon, GameStatus::kDraw}) {
    if (s == status_to_str(status)) return status;
  }
  throw MalformedStateError("Invalid game_status \"{}\"", s);
}

Board decode_board(const boost::json::value& jv) {
  Board board;
  const boost::json::array& rows = get_array(jv, kBoardDimension, "board");
  for (int row = 0; row < kBoardDimension; ++row) {
    const boost::json::array& cells = get_array(rows[row], kBoardDimension, "board row");
    for (int col = 0; col < kBoardDimension; ++col) {
      Mark mark = parse_mark(get_string(cells[col], "board cell"), true, "board cell");
      board.set(Coord{row, col}, mark);
    }
  }
  return board;
}

std::optional<Line> decode_line(const boost::json::value& jv) {
  if (jv.is_null()) return std::nullopt;

  Line line;
  const boost::json::array& coords = get_array(jv, line.size(), "winning_line");
  for (size_t i = 0; i < line.size(); ++i) {
    const boost::json::array& pair = get_array(coords[i], 2, "winning_line entry");
    line[i] = Coord{get_int(pair[0], "winning_line row"), get_int(pair[1], "winning_line col")};
  }
  return line;
}

// Checks the decoded fields against each other. See GameState for the invariants.
void validate(const GameState& state) {
  const Board& board = state.board;
  int x_count = board.count(Mark::kX);
  int o_count = board.count(Mark::kO);
  int diff = x_count - o_count;
  if (diff != 0 && diff != 1) {
    throw MalformedStateError("Mark counts out of balance (X={}, O={})", x_count, o_count);
  }

  Mark expected_turn = Rules::parity_turn(board);
  if (state.turn != expected_turn) {
    throw MalformedStateError("current_player is {} but the board says {} is to move",
                              mark_to_str(state.turn), mark_to_str(expected_turn));
  }

  Rules::Outcome outcome = Rules::evaluate(board);
  if (state.status != outcome.status) {
    throw MalformedStateError("game_status is \"{}\" but the board says \"{}\"",
                              status_to_str(state.status), status_to_str(outcome.status));
  }
  if (state.winner != outcome.winner) {
    throw MalformedStateError("winner is \"{}\" but the board says \"{}\"",
                              mark_to_str(state.winner), mark_to_str(outcome.winner));
  }
  if (state.winning_line != outcome.winning_line) {
    throw MalformedStateError("winning_line disagrees with the board");
  }

  if (outcome.status == GameStatus::kWon) {
    // The winner moved last, so the counts must reflect that.
    int expected_diff = (outcome.winner == Mark::kX) ? 1 : 0;
    if (diff != expected_diff) {
      throw MalformedStateError("{} cannot have won with X={}, O={}", mark_to_str(outcome.winner),
                                x_count, o_count);
    }

    mask_t loser_mask = board.mask(opponent(outcome.winner));
    for (mask_t line_mask : Rules::kLineMasks) {
      if ((loser_mask & line_mask) == line_mask) {
        throw MalformedStateError("Both players have three in a row");
      }
    }
  }
}

}  // namespace

boost::json::object StateCodec::encode(const GameState& state) {
  boost::json::array rows;
  for (int row = 0; row < kBoardDimension; ++row) {
    boost::json::array cells;
    for (int col = 0; col < kBoardDimension; ++col) {
      cells.emplace_back(mark_to_str(state.board.get(row, col)));
    }
    rows.emplace_back(std::move(cells));
  }

  boost::json::object obj;
  obj["board"] = std::move(rows);
  obj["current_player"] = mark_to_str(state.turn);
  obj["game_status"] = status_to_str(state.status);
  if (state.winner == Mark::kNone) {
    obj["winner"] = nullptr;
  } else {
    obj["winner"] = mark_to_str(state.winner);
  }
  if (state.winning_line) {
    boost::json::array line;
    for (const Coord& coord : *state.winning_line) {
      line.emplace_back(boost::json::array{coord.row, coord.col});
    }
    obj["winning_line"] = std::move(line);
  } else {
    obj["winning_line"] = nullptr;
  }
  obj["difficulty"] = difficulty_to_str(state.difficulty);
  return obj;
}

GameState StateCodec::decode(const boost::json::value& jv) {
  if (!jv.is_object()) {
    throw MalformedStateError("State must be a JSON object");
  }
  const boost::json::object& obj = jv.get_object();

  GameState state;
  state.board = decode_board(get_field(obj, "board"));
  state.turn =
    parse_mark(get_string(get_field(obj, "current_player"), "current_player"), false,
               "current_player");
  state.status = parse_status(get_string(get_field(obj, "game_status"), "game_status"));

  const boost::json::value& winner = get_optional_field(obj, "winner");
  state.winner = winner.is_null() ? Mark::kNone : parse_mark(get_string(winner, "winner"), false,
                                                              "winner");
  state.winning_line = decode_line(get_optional_field(obj, "winning_line"));

  std::string difficulty = get_string(get_field(obj, "difficulty"), "difficulty");
  std::optional<Difficulty> parsed = parse_difficulty(difficulty);
  if (!parsed) {
    throw MalformedStateError("Invalid difficulty \"{}\"", difficulty);
  }
  state.difficulty = *parsed;

  validate(state);
  return state;
}

std::string StateCodec::encode_to_string(const GameState& state) {
  return boost::json::serialize(encode(state));
}

GameState StateCodec::decode_from_string(const std::string& str) {
  boost::json::error_code ec;
  boost::json::value jv = boost::json::parse(str, ec);
  if (ec) {
    throw MalformedStateError("State is not valid JSON: {}", ec.message());
  }
  return decode(jv);
}

}  // namespace tictactoe
