#pragma once

#include "util/CppUtil.hpp"

#include <boost/program_options.hpp>

#include <format>
#include <ostream>
#include <string>

namespace boost_util {

namespace program_options {

/*
 * po::value<float>(...)->default_value(...) prints the default value with undesirable precision.
 * This provides a cleaner way to specify the displayed string. Usage:
 *
 * boost_util::program_options::default_value("{:.2f}", &f)
 */
template <typename T>
auto default_value(std::format_string<T> fmt, T* dest, T t) {
  std::string s = std::format(fmt, std::move(t));
  return boost::program_options::value<T>(dest)->default_value(t, s);
}

template <typename T>
auto default_value(std::format_string<T> fmt, T* dest) {
  return default_value(fmt, dest, *dest);
}

struct Settings {
  static inline bool help_full = false;
};

/*
 * A thin wrapper around boost::program_options::options_description, which detects option-naming
 * clashes at compile-time rather than at runtime.
 *
 * Before:
 *
 * namespace po = boost::program_options;
 * po::options_description desc("descr");
 * desc.add_options()
 *     ("foo,f", ...)
 *     ("bar", ...)
 *     ;
 * return desc;
 *
 * After:
 *
 * namespace po2 = boost_util::program_options;
 * po2::options_description desc("descr");
 * return desc
 *     .add_option<"foo", 'f'>(...)
 *     .add_option<"bar">(...)
 *     ;
 */
template <typename StrSeq_ = util::StringLiteralSequence<>,
          util::concepts::IntSequence CharSeq_ = util::int_sequence<>>
class options_description {
 public:
  using StrSeq = StrSeq_;
  using CharSeq = CharSeq_;

  using base_t = boost::program_options::options_description;

  options_description(const char* name);

  /*
   * Similar to boost::program_options::options_description::add_options()(...), except that the
   * option name(s) is passed as a template argument.
   */
  template <util::StringLiteral StrLit, char Char = ' ', typename... Ts>
  auto add_option(Ts&&... ts);

  /*
   * Similar to add_option(), but hidden from --help. --help-full shows hidden options.
   */
  template <util::StringLiteral StrLit, typename... Ts>
  auto add_hidden_option(Ts&&... ts);

  /*
   * Adds both --foo and --no-foo options. Only the one that would change *flag is shown in --help.
   */
  template <util::StringLiteral TrueStrLit, util::StringLiteral FalseStrLit>
  auto add_flag(bool* flag, const char* true_help, const char* false_help);

  /*
   * Adds all options from desc to this.
   */
  template <typename StrSeq2, util::concepts::IntSequence CharSeq2>
  auto add(const options_description<StrSeq2, CharSeq2>& desc);

  void print(std::ostream& s) const;

  friend std::ostream& operator<<(std::ostream& s, const options_description& desc) {
    desc.print(s);
    return s;
  }

  const base_t& get() const { return *full_base_; }
  base_t& get() { return *full_base_; }

 private:
  options_description(base_t* full_base, base_t* base) : full_base_(full_base), base_(base) {}

  template <util::StringLiteral StrLit, char Char = ' '>
  auto augment() const;

  template <typename, util::concepts::IntSequence>
  friend class boost_util::program_options::options_description;

  // The underlying boost objects are shared by every options_description in an add()-chain, so
  // they are deliberately never deleted.
  base_t* full_base_;    // includes hidden options
  base_t* base_;         // excludes hidden options
  std::string tmp_str_;  // name passed from augment() to its caller
};

/*
 * Parses the cmdline arguments ts... (typically argc, argv) against desc, which may be either a
 * boost:: or a boost_util:: options_description. Parse failures are rethrown as
 * util::CleanException.
 */
template <typename T, typename... Ts>
boost::program_options::variables_map parse_args(const T& desc, Ts&&... ts);

}  // namespace program_options

}  // namespace boost_util

#include "inline/util/BoostUtil.inl"
