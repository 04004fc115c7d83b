#include "tictactoe/GameService.hpp"

#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

namespace tictactoe {

inline auto GameService::Params::make_options_description() {
  namespace po2 = boost_util::program_options;

  po2::options_description desc("GameService options");
  return desc
    .template add_option<"max-request-bytes">(
      po2::default_value("{}", &max_request_bytes),
      "requests longer than this are rejected without being parsed")
    .template add_hidden_option<"max-request-depth">(
      po2::default_value("{}", &max_request_depth), "max nesting depth of a request");
}

}  // namespace tictactoe
