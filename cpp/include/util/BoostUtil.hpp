#pragma once

#include "util/CppUtil.hpp"

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

#include <memory>
#include <ostream>
#include <string>
#include <type_traits>

namespace boost_util {

// Throws util::CleanException if the file cannot be opened for writing.
void write_str_to_file(const std::string& str, const boost::filesystem::path& filename);

// Throws util::CleanException if the file does not exist or cannot be read.
std::string read_file_to_str(const boost::filesystem::path& filename);

namespace program_options {

/*
 * Wraps boost::program_options::options_description so that every option name and one-letter
 * abbreviation is part of the type. Two Params structs that both claim --size, or both claim -s,
 * then fail to compile when their descriptions are combined with add().
 *
 * Usage:
 *
 * namespace po2 = boost_util::program_options;
 * po2::options_description desc("Game options");
 * return desc
 *     .template add_option<"size", 's'>(po::value<int>(&size), "board size")
 *     .template add_flag<"color", "no-color">(&color, "colored output", "plain output");
 *
 * Each call returns a new object of a wider type. All of them share one underlying boost
 * description, so the last one in the chain is the one to keep.
 */
template <typename StrSeq_ = util::StringLiteralSequence<>,
          util::concepts::IntSequence CharSeq_ = util::int_sequence<>>
class options_description {
 public:
  using StrSeq = StrSeq_;
  using CharSeq = CharSeq_;
  using base_t = boost::program_options::options_description;

  explicit options_description(const char* name);

  // Same arguments as boost's add_options()(name, ...), minus the name.
  template <util::StringLiteral StrLit, char Char = ' ', typename... Ts>
  auto add_option(Ts&&... ts);

  /*
   * Registers --TrueStrLit and --FalseStrLit, both writing to *flag. The help line of whichever
   * one matches the current value of *flag is marked as the default.
   */
  template <util::StringLiteral TrueStrLit, util::StringLiteral FalseStrLit>
  auto add_flag(bool* flag, const char* true_help, const char* false_help);

  template <typename StrSeq2, util::concepts::IntSequence CharSeq2>
  auto add(const options_description<StrSeq2, CharSeq2>& desc);

  const base_t& get() const { return *base_; }
  base_t& get() { return *base_; }

  friend std::ostream& operator<<(std::ostream& s, const options_description& desc) {
    return s << desc.get();
  }

 private:
  template <typename, util::concepts::IntSequence>
  friend class boost_util::program_options::options_description;

  template <util::StringLiteral StrLit, char Char>
  using widened_t = options_description<
    util::concat_t<StrSeq, util::StringLiteralSequence<StrLit>>,
    std::conditional_t<Char == ' ', CharSeq, util::concat_t<CharSeq, util::int_sequence<Char>>>>;

  explicit options_description(std::shared_ptr<base_t> base) : base_(std::move(base)) {}

  template <util::StringLiteral StrLit, char Char>
  static constexpr void check_unclaimed();

  std::shared_ptr<base_t> base_;
};

namespace detail {

using positional_t = boost::program_options::positional_options_description;

template <typename T>
constexpr bool is_positional_v = std::is_same_v<std::remove_cvref_t<T>, positional_t>;

}  // namespace detail

/*
 * Runs a boost::program_options::command_line_parser built from ts (typically argc, argv) against
 * desc, which may be a boost or a boost_util options_description. Parse errors are rethrown as
 * util::CleanException.
 *
 * A positional_options_description among ts selects the overload below instead.
 */
template <typename T, typename... Ts>
requires(!detail::is_positional_v<Ts> && ...)
boost::program_options::variables_map parse_args(const T& desc, Ts&&... ts);

// Same, with trailing bare arguments bound to the options named in positional.
template <typename T>
boost::program_options::variables_map parse_args(
  const T& desc, const boost::program_options::positional_options_description& positional,
  int ac, const char* const av[]);

/*
 * Adds the "key=value" lines of filename to vm. '#' starts a comment. Options already in vm keep
 * their value, so the command line wins over the file.
 *
 * Throws util::CleanException on a missing file, an unknown key or a malformed value.
 */
template <typename T>
void parse_config_file(const T& desc, const boost::filesystem::path& filename,
                       boost::program_options::variables_map& vm);

}  // namespace program_options

}  // namespace boost_util

#include "inline/util/BoostUtil.inl"
