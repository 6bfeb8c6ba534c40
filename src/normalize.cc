#include "namedupe/normalize.hh"

#include <regex>
#include <vector>

#include "namedupe/config.hh"

namespace namedupe {

inline namespace detail_v1 {

namespace {

const std::vector<std::regex> &copy_suffix_regex() {
  static const std::vector<std::regex> regex_list = [] {
    std::vector<std::regex> list;
    list.reserve(copy_suffix_patterns.size());
    for (const auto pattern : copy_suffix_patterns) {
      list.emplace_back(pattern.begin(), pattern.end());
    }
    return list;
  }();
  return regex_list;
}

}  // namespace

std::string normalize(std::string_view file_name) {
  // split at the last '.'
  const auto dot = file_name.rfind('.');
  const bool has_ext = dot != std::string_view::npos;
  std::string stem(has_ext ? file_name.substr(0, dot) : file_name);

  for (const auto &regex : copy_suffix_regex()) {
    std::smatch match;
    if (std::regex_search(stem, match, regex)) {
      // patterns are anchored at the end, drop everything from the match on
      stem.erase((std::string::size_type)match.position(0));
      break;
    }
  }

  if (has_ext) {
    stem += file_name.substr(dot);
  }
  return stem;
}

}  // namespace detail_v1

}  // namespace namedupe
