#include "tictactoe/Engine.hpp"
#include "tictactoe/Errors.hpp"
#include "tictactoe/GameState.hpp"
#include "tictactoe/Types.hpp"
#include "tictactoe/ai/EasyStrategy.hpp"
#include "util/BoostUtil.hpp"
#include "util/Exceptions.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"
#include "util/StringUtil.hpp"

#include <boost/program_options.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace po = boost::program_options;
namespace po2 = boost_util::program_options;

using tictactoe::Difficulty;
using tictactoe::GameState;

struct Args {
  std::string difficulty_str = "medium";

  auto make_options_description() {
    po2::options_description desc("Play options");

    return desc.template add_option<"difficulty", 'd'>(
      po::value<std::string>(&difficulty_str)->default_value(difficulty_str),
      "computer strength: easy, medium, or hard");
  }
};

namespace {

void print_state(const GameState& state) {
  std::cout << std::endl;
  state.board.print(std::cout);
  std::cout << std::endl;
}

/*
 * Prompts until the user enters a legal "row col" pair, and returns the resulting state. Returns
 * std::nullopt if stdin is closed.
 */
std::optional<GameState> prompt_for_move(const GameState& state) {
  while (true) {
    std::cout << "Enter your move as \"row col\": ";
    std::cout.flush();

    std::string input;
    if (!std::getline(std::cin, input)) {
      return std::nullopt;
    }

    std::vector<std::string> tokens = util::split(input);
    if (tokens.size() != 2) {
      std::cout << "Please enter exactly two numbers, e.g. \"1 1\"." << std::endl;
      continue;
    }

    try {
      int row = util::atoi_safe(tokens[0]);
      int col = util::atoi_safe(tokens[1]);
      return tictactoe::Engine::move(state, row, col);
    } catch (const util::CleanException& e) {
      std::cout << e.what() << std::endl;
    }
  }
}

void print_result(const GameState& state) {
  if (state.status == tictactoe::GameStatus::kDraw) {
    std::cout << "It's a draw!" << std::endl;
  } else if (state.winner == tictactoe::kHumanMark) {
    std::cout << "You won!" << std::endl;
  } else {
    std::cout << "The computer won!" << std::endl;
  }
}

}  // namespace

// Plays one game in the terminal: the user is X, the computer is O.
int main(int ac, char* av[]) {
  try {
    Args args;
    util::Logging::Params log_params;
    util::Random::Params random_params;
    tictactoe::ai::EasyParams easy_params;

    po2::options_description raw_desc("General options");
    auto desc = raw_desc.template add_option<"help", 'h'>("help (most used options)")
                  .template add_option<"help-full">("help (all options)")
                  .add(args.make_options_description())
                  .add(easy_params.make_options_description())
                  .add(log_params.make_options_description())
                  .add(random_params.make_options_description());

    po::variables_map vm = po2::parse_args(desc, ac, av);

    bool help_full = vm.count("help-full");
    bool help = vm.count("help");
    if (help || help_full) {
      po2::Settings::help_full = help_full;
      std::cout << desc << std::endl;
      return 0;
    }

    std::optional<Difficulty> difficulty = tictactoe::parse_difficulty(args.difficulty_str);
    if (!difficulty) {
      throw util::CleanException("Invalid --difficulty \"{}\" (expected easy, medium, or hard)",
                                 args.difficulty_str);
    }

    util::Logging::init(log_params);
    util::Random::init(random_params);

    GameState state = tictactoe::Engine::new_game(*difficulty);
    while (!state.is_terminal()) {
      print_state(state);
      std::optional<GameState> next = prompt_for_move(state);
      if (!next) {
        std::cout << std::endl;
        return 0;
      }
      state = *next;
      if (state.is_terminal()) break;

      state = tictactoe::Engine::ai_move(state, util::Random::default_prng(), easy_params);
    }

    print_state(state);
    print_result(state);
  } catch (const util::CleanException& e) {
    std::cerr << "Caught a CleanException: ";
    std::cerr << e.what() << std::endl;
    return 1;
  }

  return 0;
}
