#include "util/BoostUtil.hpp"

#include "util/Exceptions.hpp"
#include "util/ScreenUtil.hpp"

#include <fmt/format.h>

#include <fstream>
#include <sstream>

namespace boost_util {

namespace program_options {

template <typename StrSeq, util::concepts::IntSequence CharSeq>
options_description<StrSeq, CharSeq>::options_description(const char* name)
    : base_(std::make_shared<base_t>(name, util::get_screen_width() - 1)) {}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
template <util::StringLiteral StrLit, char Char>
constexpr void options_description<StrSeq, CharSeq>::check_unclaimed() {
  static_assert(!util::has_str_v<StrSeq, StrLit>, "Option name registered twice");
  static_assert(Char == ' ' || !util::has_int_v<CharSeq, Char>,
                "Option abbreviation registered twice");
}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
template <util::StringLiteral StrLit, char Char, typename... Ts>
auto options_description<StrSeq, CharSeq>::add_option(Ts&&... ts) {
  check_unclaimed<StrLit, Char>();

  std::string name = StrLit.value;
  if (Char != ' ') name = fmt::format("{},{}", name, Char);
  base_->add_options()(name.c_str(), std::forward<Ts>(ts)...);
  return widened_t<StrLit, Char>(base_);
}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
template <util::StringLiteral TrueStrLit, util::StringLiteral FalseStrLit>
auto options_description<StrSeq, CharSeq>::add_flag(bool* flag, const char* true_help,
                                                    const char* false_help) {
  namespace po = boost::program_options;
  check_unclaimed<TrueStrLit, ' '>();

  std::string on_help = true_help;
  std::string off_help = false_help;
  (*flag ? on_help : off_help) += " (default)";

  base_->add_options()
    (TrueStrLit.value, po::value(flag)->implicit_value(true)->zero_tokens(), on_help.c_str())
    (FalseStrLit.value, po::value(flag)->implicit_value(false)->zero_tokens(), off_help.c_str());

  using with_true_t = widened_t<TrueStrLit, ' '>;
  with_true_t::template check_unclaimed<FalseStrLit, ' '>();
  using out_t = typename with_true_t::template widened_t<FalseStrLit, ' '>;
  return out_t(base_);
}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
template <typename StrSeq2, util::concepts::IntSequence CharSeq2>
auto options_description<StrSeq, CharSeq>::add(const options_description<StrSeq2, CharSeq2>& desc) {
  static_assert(util::no_overlap_v<StrSeq, StrSeq2>, "Option name registered twice");
  static_assert(util::no_overlap_v<CharSeq, CharSeq2>, "Option abbreviation registered twice");

  base_->add(*desc.base_);
  return options_description<util::concat_t<StrSeq, StrSeq2>, util::concat_t<CharSeq, CharSeq2>>(
    base_);
}

namespace detail {

inline const boost::program_options::options_description& unwrap(
  const boost::program_options::options_description& desc) {
  return desc;
}

template <typename S, util::concepts::IntSequence C>
const boost::program_options::options_description& unwrap(const options_description<S, C>& desc) {
  return desc.get();
}

template <typename Parser>
boost::program_options::variables_map run_parser(Parser&& parser) {
  namespace po = boost::program_options;
  po::variables_map vm;
  try {
    po::store(parser.run(), vm);
    po::notify(vm);
  } catch (const po::error& e) {
    throw util::CleanException("{}", e.what());
  }
  return vm;
}

}  // namespace detail

template <typename T, typename... Ts>
requires(!detail::is_positional_v<Ts> && ...)
boost::program_options::variables_map parse_args(const T& desc, Ts&&... ts) {
  namespace po = boost::program_options;
  return detail::run_parser(
    po::command_line_parser(std::forward<Ts>(ts)...).options(detail::unwrap(desc)));
}

template <typename T>
boost::program_options::variables_map parse_args(
  const T& desc, const boost::program_options::positional_options_description& positional,
  int ac, const char* const av[]) {
  namespace po = boost::program_options;
  return detail::run_parser(
    po::command_line_parser(ac, av).options(detail::unwrap(desc)).positional(positional));
}

template <typename T>
void parse_config_file(const T& desc, const boost::filesystem::path& filename,
                       boost::program_options::variables_map& vm) {
  namespace po = boost::program_options;
  std::ifstream file(filename.string());
  if (!file.is_open()) {
    throw util::CleanException("Unable to open config file: {}", filename.string());
  }
  try {
    po::store(po::parse_config_file(file, detail::unwrap(desc)), vm);
    po::notify(vm);
  } catch (const po::error& e) {
    throw util::CleanException("{}: {}", filename.string(), e.what());
  }
}

}  // namespace program_options

inline void write_str_to_file(const std::string& str, const boost::filesystem::path& filename) {
  std::ofstream file(filename.string());
  if (!file.is_open()) {
    throw util::CleanException("Unable to open file: {}", filename.string());
  }
  file << str;
  file.close();
  if (file.fail()) {
    throw util::CleanException("Failed to write file: {}", filename.string());
  }
}

inline std::string read_file_to_str(const boost::filesystem::path& filename) {
  if (!boost::filesystem::is_regular_file(filename)) {
    throw util::CleanException("No such file: {}", filename.string());
  }
  std::ifstream file(filename.string());
  if (!file.is_open()) {
    throw util::CleanException("Unable to open file: {}", filename.string());
  }
  std::ostringstream ss;
  ss << file.rdbuf();
  return ss.str();
}

}  // namespace boost_util
